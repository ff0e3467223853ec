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

#include "ThreadPool.h"

#include <chrono>
#include <condition_variable>
#include <deque>
#include <mutex>
#include <system_error>
#include <thread>

#include "npssdp.h"

using namespace std::chrono;

/*! Internal ThreadPool Job. */
struct ThreadPoolJob {
    ThreadPoolJob(std::unique_ptr<JobWorker> worker, ThreadPool::ThreadPriority _prio)
        : m_worker(std::move(worker)), priority(_prio) {}
    std::unique_ptr<JobWorker> m_worker;
    ThreadPool::ThreadPriority priority;
    steady_clock::time_point requestTime;
    int jobId{0};
};

class ThreadPool::Internal {
public:
    explicit Internal(const ThreadPoolAttr *attr);
    bool ok{false};
    int createWorker(std::unique_lock<std::mutex>& lck);
    void addWorker(std::unique_lock<std::mutex>& lck);
    void bumpPriority();
    void WorkerThread();
    int shutdown();
    size_t queuedJobs() const {
        return highJobQ.size() + medJobQ.size() + lowJobQ.size();
    }

    /*! Mutex to protect job qs. */
    std::mutex mutex;
    /*! Condition variable to signal Q. */
    std::condition_variable condition;
    /*! Condition variable for start and stop. */
    std::condition_variable start_and_shutdown;

    /*! ids for jobs */
    int lastJobId{0};
    /*! whether or not we are shutting down */
    bool shuttingdown{false};
    /*! total number of threads */
    int totalThreads{0};
    /*! flag that's set when waiting for a new worker thread to start */
    bool pendingWorkerThreadStart{false};
    /*! number of threads that are currently executing jobs */
    int busyThreads{0};
    /*! number of persistent threads */
    int persistentThreads{0};
    std::deque<std::unique_ptr<ThreadPoolJob>> lowJobQ;
    std::deque<std::unique_ptr<ThreadPoolJob>> medJobQ;
    std::deque<std::unique_ptr<ThreadPoolJob>> highJobQ;
    /*! persistent job waiting to be picked up */
    std::unique_ptr<ThreadPoolJob> persistentJob;
    ThreadPoolAttr attr;
};

ThreadPool::ThreadPool() = default;

ThreadPool::~ThreadPool()
{
    shutdown();
}

int ThreadPool::start(const ThreadPoolAttr *attr)
{
    if (m) {
        return 0;
    }
    m = std::make_unique<Internal>(attr);
    if (m->ok) {
        return 0;
    }
    m.reset();
    return -1;
}

/*!
 * \brief Determines whether any jobs need to be bumped to a higher priority Q
 * and bumps them.
 *
 * mutex must be locked.
 */
void ThreadPool::Internal::bumpPriority()
{
    auto now = steady_clock::now();

    for (;;) {
        if (!medJobQ.empty()) {
            auto diffTime = duration_cast<milliseconds>(now - medJobQ.front()->requestTime).count();
            if (diffTime >= attr.starvationTime) {
                highJobQ.push_back(std::move(medJobQ.front()));
                medJobQ.pop_front();
                continue;
            }
        }
        if (!lowJobQ.empty()) {
            auto diffTime = duration_cast<milliseconds>(now - lowJobQ.front()->requestTime).count();
            if (diffTime >= attr.starvationTime) {
                medJobQ.push_back(std::move(lowJobQ.front()));
                lowJobQ.pop_front();
                continue;
            }
        }
        break;
    }
}

/*!
 * \brief Implements a thread pool worker. Worker waits for a job to become
 * available. Worker picks up persistent jobs first, high priority,
 * med priority, then low priority.
 *
 * If worker remains idle for more than specified max, the worker is released.
 */
void ThreadPool::Internal::WorkerThread()
{
    std::unique_ptr<ThreadPoolJob> job;
    bool persistent{false};
    std::unique_lock<std::mutex> lck(mutex);
    auto idlemillis = milliseconds(attr.maxIdleTime);

    totalThreads++;
    pendingWorkerThreadStart = false;
    start_and_shutdown.notify_all();

    for (;;) {
        if (job) {
            busyThreads--;
            job.reset();
            if (persistent) {
                /* Persistent thread becomes a regular thread */
                persistentThreads--;
                persistent = false;
            }
        }

        /* Check for a job or shutdown */
        std::cv_status retCode = std::cv_status::no_timeout;
        while (lowJobQ.empty() && medJobQ.empty() && highJobQ.empty() &&
               !persistentJob && !shuttingdown) {
            /* If wait timed out and we currently have more than the
             * min threads, let this thread die. */
            if (retCode == std::cv_status::timeout &&
                totalThreads > attr.minThreads) {
                goto exit_function;
            }
            retCode = condition.wait_for(lck, idlemillis);
        }

        if (shuttingdown) {
            goto exit_function;
        }
        bumpPriority();
        if (persistentJob) {
            job = std::move(persistentJob);
            persistentThreads++;
            persistent = true;
            start_and_shutdown.notify_all();
        } else if (!highJobQ.empty()) {
            job = std::move(highJobQ.front());
            highJobQ.pop_front();
        } else if (!medJobQ.empty()) {
            job = std::move(medJobQ.front());
            medJobQ.pop_front();
        } else {
            job = std::move(lowJobQ.front());
            lowJobQ.pop_front();
        }

        busyThreads++;
        lck.unlock();
        job->m_worker->work();
        lck.lock();
    }

exit_function:
    totalThreads--;
    NpssdpPrintf(NPSSDP_DEBUG, TPOOL, __FILE__, __LINE__,
                 "ThreadPool: worker exiting, %d threads left\n", totalThreads);
    start_and_shutdown.notify_all();
}

/*!
 * \brief Creates a worker thread, if the thread pool does not already have
 * max threads.
 *
 * \remark The mutex must be locked prior to calling this function.
 *
 * \return
 *    \li \c 0 on success.
 *    \li \c EMAXTHREADS if already max threads reached.
 *    \li \c EOUTOFMEM if system can not create thread.
 */
int ThreadPool::Internal::createWorker(std::unique_lock<std::mutex>& lck)
{
    /* if a new worker is the process of starting, wait until it fully starts */
    while (pendingWorkerThreadStart) {
        start_and_shutdown.wait(lck);
    }

    if (attr.maxThreads != ThreadPoolAttr::INFINITE_THREADS &&
        totalThreads + 1 > attr.maxThreads) {
        return EMAXTHREADS;
    }
    try {
        std::thread nthread([this] { WorkerThread(); });
        nthread.detach();
    } catch (const std::system_error& e) {
        NpssdpPrintf(NPSSDP_CRITICAL, TPOOL, __FILE__, __LINE__,
                     "ThreadPool: thread creation failed: %s\n", e.what());
        return EOUTOFMEM;
    }

    /* wait until the new worker thread starts. We can set the flag
       cause we have the lock */
    pendingWorkerThreadStart = true;
    while (pendingWorkerThreadStart) {
        start_and_shutdown.wait(lck);
    }
    return 0;
}

/*!
 * \brief Determines whether or not a thread should be added based on the
 * jobsPerThread ratio. Adds a thread if appropriate.
 *
 * \remark The mutex must be locked prior to calling this function.
 */
void ThreadPool::Internal::addWorker(std::unique_lock<std::mutex>& lck)
{
    long jobs = static_cast<long>(queuedJobs());
    int threads = totalThreads - persistentThreads;
    while (threads == 0 || (jobs / threads) >= attr.jobsPerThread ||
           totalThreads == busyThreads) {
        if (createWorker(lck) != 0) {
            return;
        }
        threads++;
    }
}

ThreadPool::Internal::Internal(const ThreadPoolAttr *_attr)
{
    int retCode = 0;

    std::unique_lock<std::mutex> lck(mutex);
    if (_attr) {
        attr = *_attr;
    }
    for (int i = 0; i < attr.minThreads; ++i) {
        retCode = createWorker(lck);
        if (retCode) {
            break;
        }
    }
    lck.unlock();

    if (retCode) {
        /* clean up if the min threads could not be created */
        shutdown();
    } else {
        ok = true;
    }
}

int ThreadPool::addPersistent(std::unique_ptr<JobWorker> worker, ThreadPriority priority)
{
    if (!m) {
        return NPSSDP_TP_SHUTDOWN;
    }
    std::unique_lock<std::mutex> lck(m->mutex);
    if (m->shuttingdown) {
        return NPSSDP_TP_SHUTDOWN;
    }

    /* Create A worker if less than max threads running */
    if (m->totalThreads < m->attr.maxThreads) {
        m->createWorker(lck);
    } else {
        /* if there is more than one worker thread
         * available then schedule job, otherwise fail */
        if (m->totalThreads - m->persistentThreads - 1 == 0)
            return EMAXTHREADS;
    }

    auto job = std::make_unique<ThreadPoolJob>(std::move(worker), priority);
    job->jobId = m->lastJobId++;
    job->requestTime = steady_clock::now();
    m->persistentJob = std::move(job);

    /* Notify a waiting thread */
    m->condition.notify_one();

    /* wait until long job has been picked up */
    while (m->persistentJob && !m->shuttingdown)
        m->start_and_shutdown.wait(lck);

    return 0;
}

int ThreadPool::addJob(std::unique_ptr<JobWorker> worker, ThreadPriority prio)
{
    if (!m) {
        return NPSSDP_TP_SHUTDOWN;
    }
    std::unique_lock<std::mutex> lck(m->mutex);
    if (m->shuttingdown) {
        return NPSSDP_TP_SHUTDOWN;
    }

    size_t totalJobs = m->queuedJobs();
    if (totalJobs >= static_cast<size_t>(m->attr.maxJobsTotal)) {
        NpssdpPrintf(NPSSDP_ERROR, TPOOL, __FILE__, __LINE__,
                     "ThreadPool::addJob: too many jobs: %d\n", static_cast<int>(totalJobs));
        return EOUTOFMEM;
    }

    auto job = std::make_unique<ThreadPoolJob>(std::move(worker), prio);
    job->jobId = m->lastJobId++;
    job->requestTime = steady_clock::now();
    switch (job->priority) {
    case HIGH_PRIORITY:
        m->highJobQ.push_back(std::move(job));
        break;
    case MED_PRIORITY:
        m->medJobQ.push_back(std::move(job));
        break;
    case LOW_PRIORITY:
        m->lowJobQ.push_back(std::move(job));
        break;
    }
    /* AddWorker if appropriate */
    m->addWorker(lck);
    /* Notify a waiting thread */
    m->condition.notify_one();

    return 0;
}

int ThreadPool::shutdown()
{
    if (m)
        return m->shutdown();
    return -1;
}

int ThreadPool::Internal::shutdown()
{
    std::unique_lock<std::mutex> lck(mutex);

    highJobQ.clear();
    medJobQ.clear();
    lowJobQ.clear();
    persistentJob.reset();

    /* signal shutdown */
    shuttingdown = true;
    condition.notify_all();
    start_and_shutdown.notify_all();
    /* wait for all threads to finish */
    while (totalThreads > 0) {
        start_and_shutdown.wait(lck);
    }
    return 0;
}
