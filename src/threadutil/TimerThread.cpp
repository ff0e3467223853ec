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

#include "TimerThread.h"

#include <algorithm>
#include <condition_variable>
#include <list>
#include <mutex>
#include <utility>

#include "npssdp.h"

using namespace std::chrono;

/*! Data holder for a timer event. */
struct TimerEvent {
    TimerEvent(std::unique_ptr<JobWorker> w, ThreadPool::ThreadPriority prio,
               steady_clock::time_point et, int _id)
        : worker(std::move(w)), eventTime(et), id(_id), priority(prio) {}

    std::unique_ptr<JobWorker> worker;
    steady_clock::time_point eventTime;
    int id;
    ThreadPool::ThreadPriority priority;
};

class TimerThread::Internal {
public:
    std::mutex mutex;
    std::condition_variable condition;
    int lastEventId{0};
    std::list<TimerEvent> eventQ;
    bool inshutdown{false};
    /* Set while the dispatching job is running */
    bool running{false};
    ThreadPool *tp{nullptr};
    void dispatchLoop();
};

// Worker for the permanent timer thread, in charge of dispatching jobs at
// the appropriate times
class TimerJobWorker : public JobWorker {
public:
    explicit TimerJobWorker(TimerThread::Internal *parent)
        : m_parent(parent) {}
    void work() override {
        m_parent->dispatchLoop();
    }
    TimerThread::Internal *m_parent;
};

/*!
 * Sleeps until next event scheduled time, then dispatches it then sleeps...
 */
void TimerThread::Internal::dispatchLoop()
{
    std::unique_lock<std::mutex> lck(mutex);
    running = true;
    condition.notify_all();

    while (true) {
        /* mutex is always locked at top of loop */
        if (inshutdown) {
            running = false;
            condition.notify_all();
            return;
        }
        if (eventQ.empty()) {
            condition.wait(lck);
            continue;
        }
        TimerEvent& nextEvent(eventQ.front());
        if (steady_clock::now() >= nextEvent.eventTime) {
            int ret = tp->addJob(std::move(nextEvent.worker), nextEvent.priority);
            if (ret != 0) {
                NpssdpPrintf(NPSSDP_ERROR, TPOOL, __FILE__, __LINE__,
                             "TimerThread: could not queue event %d: %d\n",
                             nextEvent.id, ret);
            }
            eventQ.pop_front();
        } else {
            // remove() may erase the event while we wait.
            auto tm = nextEvent.eventTime;
            condition.wait_until(lck, tm);
        }
    }
}

TimerThread::TimerThread(ThreadPool *tp)
    : m(std::make_unique<Internal>())
{
    m->tp = tp;
    if (nullptr == tp) {
        return;
    }
    auto worker = std::make_unique<TimerJobWorker>(m.get());
    int ret = tp->addPersistent(std::move(worker), ThreadPool::HIGH_PRIORITY);
    if (ret != 0) {
        NpssdpPrintf(NPSSDP_CRITICAL, TPOOL, __FILE__, __LINE__,
                     "TimerThread: could not start dispatcher: %d\n", ret);
        return;
    }
    // addPersistent returns once the job is picked up, but it may not
    // have taken the lock yet.
    std::unique_lock<std::mutex> lck(m->mutex);
    m->condition.wait(lck, [this] { return m->running; });
}

TimerThread::~TimerThread()
{
    shutdown();
}

int TimerThread::status() const
{
    std::scoped_lock lck(m->mutex);
    return m->running ? 0 : NPSSDP_TP_SHUTDOWN;
}

int TimerThread::schedule(
    steady_clock::time_point when, int *id,
    std::unique_ptr<JobWorker> worker, ThreadPool::ThreadPriority priority)
{
    std::scoped_lock lck(m->mutex);
    if (!m->running || m->inshutdown) {
        return NPSSDP_TP_SHUTDOWN;
    }
    if (id) {
        *id = m->lastEventId;
    }
    /* add job to Q. Q is ordered by eventTime with the head of the Q being
     * the next event. */
    auto it = std::find_if(m->eventQ.begin(), m->eventQ.end(),
                           [=](const TimerEvent& e) { return e.eventTime > when; });
    m->eventQ.emplace(it, std::move(worker), priority, when, m->lastEventId);

    /* signal change in Q. */
    m->condition.notify_all();
    m->lastEventId++;
    return 0;
}

int TimerThread::schedule(
    milliseconds delay, int *id,
    std::unique_ptr<JobWorker> worker, ThreadPool::ThreadPriority priority)
{
    return schedule(steady_clock::now() + delay, id, std::move(worker), priority);
}

int TimerThread::remove(int id)
{
    std::scoped_lock lck(m->mutex);

    auto it = std::find_if(m->eventQ.begin(), m->eventQ.end(),
                           [id](const TimerEvent& e) { return e.id == id; });
    if (it != m->eventQ.end()) {
        m->eventQ.erase(it);
        return 0;
    }
    return -1;
}

int TimerThread::shutdown()
{
    std::unique_lock<std::mutex> lck(m->mutex);

    m->inshutdown = true;
    m->eventQ.clear();
    m->condition.notify_all();

    /* wait for the dispatching job to return. */
    while (m->running) {
        m->condition.wait(lck);
    }
    return 0;
}
