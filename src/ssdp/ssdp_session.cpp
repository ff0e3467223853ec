/* Copyright (C) 2020 J.F.Dockes
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


#include "SsdpDiscovery.h"

#include "npssdp.h"
#include "ssdpdiscoveryint.h"
#include "ThreadPool.h"
#include "TimerThread.h"

using namespace std::chrono;

// Timer job workers only hold a weak reference: the session may be gone
// when they fire.
class SsdpRetransmitJobWorker : public JobWorker {
public:
    explicit SsdpRetransmitJobWorker(std::weak_ptr<SsdpDiscoverySession> s)
        : m_session(std::move(s)) {}
    void work() override;
    std::weak_ptr<SsdpDiscoverySession> m_session;
};

class SsdpTimeoutJobWorker : public JobWorker {
public:
    explicit SsdpTimeoutJobWorker(std::weak_ptr<SsdpDiscoverySession> s)
        : m_session(std::move(s)) {}
    void work() override {
        auto session = m_session.lock();
        if (session) {
            NpssdpPrintf(NPSSDP_INFO, SSDP, __FILE__, __LINE__,
                         "Discovery session %d timed out\n", session->id());
            session->forceClose();
        }
    }
    std::weak_ptr<SsdpDiscoverySession> m_session;
};

SsdpDiscoverySession::SsdpDiscoverySession(
    int id, const SsdpMSearchRequest& request, int timeoutms,
    SsdpDiscovery::Internal *coordinator)
    : m_id(id), m_request(request), m_timeoutms(timeoutms),
      m_coordinator(coordinator)
{
}

SsdpDiscoverySession::~SsdpDiscoverySession()
{
    close();
}

SsdpDiscoverySession::Phase SsdpDiscoverySession::phase() const
{
    std::scoped_lock lck(m_mutex);
    return m_phase;
}

std::vector<SsdpMSearchResponse> SsdpDiscoverySession::responses() const
{
    std::scoped_lock lck(m_mutex);
    return std::vector<SsdpMSearchResponse>(m_seen.begin(), m_seen.end());
}

milliseconds SsdpDiscoverySession::timerCadence(milliseconds elapsed)
{
    if (elapsed < seconds(5)) {
        return seconds(1);
    } else if (elapsed < seconds(10)) {
        return seconds(3);
    } else if (elapsed < seconds(60)) {
        return seconds(10);
    }
    return seconds(60);
}

void SsdpDiscoverySession::start()
{
    SsdpDiscovery::Internal *coordinator;
    {
        std::scoped_lock lck(m_mutex);
        if (m_phase != Phase::Unknown || nullptr == m_coordinator) {
            return;
        }
        m_phase = Phase::Searching;
        m_startTime = m_lastCheck = steady_clock::now();
        coordinator = m_coordinator;
    }
    NpssdpPrintf(NPSSDP_INFO, SSDP, __FILE__, __LINE__,
                 "Discovery session %d: start searching for %s\n", m_id,
                 m_request.searchTarget().toString().c_str());

    if (m_timeoutms >= 0) {
        int timerid;
        int ret = coordinator->timer->schedule(
            milliseconds(m_timeoutms), &timerid,
            std::make_unique<SsdpTimeoutJobWorker>(shared_from_this()));
        if (ret == 0) {
            std::unique_lock<std::mutex> lck(m_mutex);
            if (m_phase == Phase::Searching) {
                m_timeoutTimerId = timerid;
            } else {
                lck.unlock();
                coordinator->timer->remove(timerid);
            }
        } else {
            NpssdpPrintf(NPSSDP_ERROR, SSDP, __FILE__, __LINE__,
                         "Discovery session %d: could not schedule timeout: %d\n",
                         m_id, ret);
        }
    }
    sendSearch();
    scheduleNext();
}

void SsdpDiscoverySession::sendSearch()
{
    SsdpDiscovery::Internal *coordinator;
    {
        std::scoped_lock lck(m_mutex);
        if (m_phase != Phase::Searching || nullptr == m_coordinator) {
            return;
        }
        coordinator = m_coordinator;
    }
    int ret = coordinator->sendSearch(m_request.message());
    if (ret != NPSSDP_E_SUCCESS) {
        NpssdpPrintf(NPSSDP_ERROR, SSDP, __FILE__, __LINE__,
                     "Discovery session %d: M-SEARCH send failed: %s\n",
                     m_id, NpssdpGetErrorMessage(ret));
    }
}

void SsdpDiscoverySession::scheduleNext()
{
    SsdpDiscovery::Internal *coordinator;
    milliseconds delay;
    {
        std::scoped_lock lck(m_mutex);
        if (m_phase != Phase::Searching || nullptr == m_coordinator) {
            return;
        }
        coordinator = m_coordinator;
        auto now = steady_clock::now();
        if (now - m_lastCheck > seconds(30)) {
            NpssdpPrintf(NPSSDP_WARNING, SSDP, __FILE__, __LINE__,
                         "Session has been running longer than 30 seconds!\n");
            m_lastCheck = now;
        }
        delay = timerCadence(duration_cast<milliseconds>(now - m_startTime));
    }

    int timerid;
    int ret = coordinator->timer->schedule(
        delay, &timerid, std::make_unique<SsdpRetransmitJobWorker>(shared_from_this()));
    if (ret != 0) {
        NpssdpPrintf(NPSSDP_ERROR, SSDP, __FILE__, __LINE__,
                     "Discovery session %d: could not schedule search: %d\n", m_id, ret);
        return;
    }
    {
        std::scoped_lock lck(m_mutex);
        if (m_phase == Phase::Searching) {
            m_retransmitTimerId = timerid;
            return;
        }
    }
    // Closed while scheduling
    coordinator->timer->remove(timerid);
}

void SsdpDiscoverySession::onRetransmitTimer()
{
    {
        std::scoped_lock lck(m_mutex);
        m_retransmitTimerId = -1;
    }
    sendSearch();
    scheduleNext();
}

void SsdpRetransmitJobWorker::work()
{
    auto session = m_session.lock();
    if (session) {
        session->onRetransmitTimer();
    }
}

void SsdpDiscoverySession::receiveResponse(
    const SsdpMSearchResponse& response, bool asDevice)
{
    if (response.searchTarget().type() == SsdpSearchTarget::Type::All) {
        NpssdpPrintf(NPSSDP_WARNING, SSDP, __FILE__, __LINE__,
                     "Discovery session %d: dropping response with ST ssdp:all "
                     "from %s\n", m_id, response.location().c_str());
        return;
    }
    {
        std::scoped_lock lck(m_mutex);
        if (m_phase != Phase::Searching) {
            return;
        }
        if (!m_seen.insert(response).second) {
            NpssdpPrintf(NPSSDP_ALL, SSDP, __FILE__, __LINE__,
                         "Discovery session %d: already seen %s at %s\n", m_id,
                         response.usn().c_str(), response.location().c_str());
            return;
        }
    }

    const auto& observer = m_request.observer();
    if (!observer) {
        return;
    }
    if (asDevice) {
        observer->discoveredDevice(response, shared_from_this());
    } else {
        observer->discoveredService(response, shared_from_this());
    }
}

// Returns true if this call performed the transition to Closed
bool SsdpDiscoverySession::doClose()
{
    SsdpDiscovery::Internal *coordinator;
    int retransmitId, timeoutId;
    {
        std::scoped_lock lck(m_mutex);
        if (m_phase == Phase::Closed) {
            return false;
        }
        m_phase = Phase::Closed;
        coordinator = m_coordinator;
        m_coordinator = nullptr;
        retransmitId = m_retransmitTimerId;
        timeoutId = m_timeoutTimerId;
        m_retransmitTimerId = m_timeoutTimerId = -1;
    }
    NpssdpPrintf(NPSSDP_INFO, SSDP, __FILE__, __LINE__,
                 "Discovery session %d: closed\n", m_id);
    if (coordinator) {
        if (retransmitId >= 0)
            coordinator->timer->remove(retransmitId);
        if (timeoutId >= 0)
            coordinator->timer->remove(timeoutId);
        coordinator->unregisterSession(m_id);
    }
    return true;
}

void SsdpDiscoverySession::close()
{
    doClose();
}

void SsdpDiscoverySession::forceClose()
{
    if (doClose()) {
        const auto& observer = m_request.observer();
        if (observer) {
            observer->closedSession(shared_from_this());
        }
    }
}
