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

#ifndef TIMERTHREAD_H
#define TIMERTHREAD_H

#include <chrono>
#include <memory>

#include "ThreadPool.h"

/*!
 * A timer thread that allows the scheduling of jobs to run at a
 * specified time in the future.
 * Because the timer thread uses the thread pool there is no
 * guarantee of timing, only approximate timing.
 *
 * The dispatching loop runs as a persistent job in the pool passed to the
 * constructor, so it takes one of the pool threads.
 */
class TimerThread {
public:
    explicit TimerThread(ThreadPool *tp);
    ~TimerThread();
    TimerThread(const TimerThread&) = delete;
    TimerThread& operator=(const TimerThread&) = delete;

    /*! \return 0 if the dispatching job could be started. */
    int status() const;

    /*!
     * \brief Schedules an event to run at a specified time.
     *
     * \return 0 on success, NPSSDP_TP_SHUTDOWN if the timer is not running.
     */
    int schedule(std::chrono::steady_clock::time_point when,
                 /* [out] Id of timer event. (can be null). */
                 int *id,
                 std::unique_ptr<JobWorker> worker,
                 ThreadPool::ThreadPriority priority = ThreadPool::MED_PRIORITY);

    int schedule(std::chrono::milliseconds delay,
                 /* [out] Id of timer event. (can be null). */
                 int *id,
                 std::unique_ptr<JobWorker> worker,
                 ThreadPool::ThreadPriority priority = ThreadPool::MED_PRIORITY);

    /*!
     * \brief Removes an event from the timer Q.
     *
     * Events can only be removed before they have been placed in the
     * thread pool.
     *
     * \return 0 on success, -1 on failure.
     */
    int remove(int id);

    /*!
     * \brief Shutdown the timer thread.
     *
     * Events scheduled in the future will NOT be run.
     *
     * Timer thread should be shutdown BEFORE it's associated thread pool.
     *
     * \return 0. Can be called several times.
     */
    int shutdown();

    class Internal;
private:
    std::unique_ptr<Internal> m;
};

#endif /* TIMERTHREAD_H */
