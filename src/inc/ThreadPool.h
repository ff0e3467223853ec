/*******************************************************************************
 *
 * Copyright (c) 2000-2003 Intel Corporation
 * All rights reserved.
 * Copyright (c) 2012 France Telecom All rights reserved.
 * Copyright (c) 2020 J.F. Dockes <jf@dockes.org>
 *
 * Redistribution and use in source and binary forms, with or without
 * modification, are permitted provided that the following conditions are met:
 *
 * - Redistributions of source code must retain the above copyright notice,
 * this list of conditions and the following disclaimer.
 * - Redistributions in binary form must reproduce the above copyright notice,
 * this list of conditions and the following disclaimer in the documentation
 * and/or other materials provided with the distribution.
 * - Neither name of Intel Corporation nor the names of its contributors
 * may be used to endorse or promote products derived from this software
 * without specific prior written permission.
 *
 * THIS SOFTWARE IS PROVIDED BY THE COPYRIGHT HOLDERS AND CONTRIBUTORS
 * "AS IS" AND ANY EXPRESS OR IMPLIED WARRANTIES, INCLUDING, BUT NOT
 * LIMITED TO, THE IMPLIED WARRANTIES OF MERCHANTABILITY AND FITNESS FOR
 * A PARTICULAR PURPOSE ARE DISCLAIMED. IN NO EVENT SHALL INTEL OR
 * CONTRIBUTORS BE LIABLE FOR ANY DIRECT, INDIRECT, INCIDENTAL, SPECIAL,
 * EXEMPLARY, OR CONSEQUENTIAL DAMAGES (INCLUDING, BUT NOT LIMITED TO,
 * PROCUREMENT OF SUBSTITUTE GOODS OR SERVICES; LOSS OF USE, DATA, OR
 * PROFITS; OR BUSINESS INTERRUPTION) HOWEVER CAUSED AND ON ANY THEORY
 * OF LIABILITY, WHETHER IN CONTRACT, STRICT LIABILITY, OR TORT (INCLUDING
 * NEGLIGENCE OR OTHERWISE) ARISING IN ANY WAY OUT OF THE USE OF THIS
 * SOFTWARE, EVEN IF ADVISED OF THE POSSIBILITY OF SUCH DAMAGE.
 *
 ******************************************************************************/
#ifndef THREADPOOL_H
#define THREADPOOL_H

#include <memory>

/* Errors */
#define EOUTOFMEM -1
#define EMAXTHREADS -2
#define NPSSDP_TP_SHUTDOWN -3

/* Attributes for thread pool. */
struct ThreadPoolAttr {
    enum TPSpecialValues{INFINITE_THREADS = -1};

    /*! ThreadPool will always maintain at least this many threads. */
    int minThreads{1};
    /*! ThreadPool will never have more than this number of threads. */
    int maxThreads{10};
    /*! This is the maximum time a thread will
     * remain idle before dying (in milliseconds). */
    int maxIdleTime{10 * 1000};
    /*! Jobs per thread to maintain. */
    int jobsPerThread{10};
    /*! Maximum number of jobs that can be queued totally. */
    int maxJobsTotal{500};
    /*! the time a low priority or med priority job waits before getting
     * bumped up a priority (in milliseconds). */
    int starvationTime{500};
};

/*! Work unit for the thread pool and the timer thread. The object is
 *  owned by the pool and deleted after work() returns. */
class JobWorker {
public:
    virtual ~JobWorker() = default;
    virtual void work() = 0;
};

/*!
 * \brief A pool of worker threads running queued jobs.
 *
 * The pool is initialized with a minimum and maximum thread number as
 * well as a max idle time and a jobs per thread ratio. If a worker thread
 * waits the whole max idle time without receiving a job and the pool
 * currently has more threads running than the minimum then the worker
 * thread will exit. If when scheduling a job the current job to thread
 * ratio becomes greater than the set ratio and the thread pool currently
 * has less than the maximum threads then a new thread will be created.
 *
 * Persistent jobs are long-running loops (e.g. a socket receive loop)
 * which occupy one thread until they return.
 */
class ThreadPool {
public:
    enum ThreadPriority {LOW_PRIORITY, MED_PRIORITY, HIGH_PRIORITY};

    ThreadPool();
    /* Calls shutdown() if this was not done */
    ~ThreadPool();
    ThreadPool(const ThreadPool&) = delete;
    ThreadPool& operator=(const ThreadPool&) = delete;

    /* Initialize things and start up returns 0 if ok */
    int start(const ThreadPoolAttr *attr = nullptr);

    /*!
     * \brief Add regular job. To be scheduled asap, we don't wait for it
     * to start.
     *
     * \return 0 on success, EOUTOFMEM if the queue is full, NPSSDP_TP_SHUTDOWN if
     *   the pool is not running. The worker is deleted on error.
     */
    int addJob(std::unique_ptr<JobWorker> worker,
               ThreadPriority priority = MED_PRIORITY);

    /*!
     * \brief Adds a persistent job to the thread pool.
     * Job will be run as soon as possible. Call will block until job
     * is scheduled.
     *
     * \return
     *    \li \c 0 on success.
     *    \li \c EMAXTHREADS not enough threads to add persistent job.
     *    \li \c NPSSDP_TP_SHUTDOWN the pool is not running.
     */
    int addPersistent(std::unique_ptr<JobWorker> worker,
                      ThreadPriority priority = HIGH_PRIORITY);

    /*!
     * \brief Shuts the thread pool down. Queued jobs are discarded, waits
     * for running jobs to return. Persistent jobs must have been told to
     * exit before.
     *
     * Must not be called from a pool thread.
     *
     * \return 0 on success, nonzero if the pool was not started.
     */
    int shutdown();

    class Internal;
private:
    std::unique_ptr<Internal> m;
};

#endif /* THREADPOOL_H */
