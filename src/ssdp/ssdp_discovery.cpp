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

#include <arpa/inet.h>
#include <netinet/in.h>

#include "npssdp.h"
#include "npssdpdebug.h"
#include "ssdpdiscoveryint.h"
#include "ssdpparser.h"

SsdpDiscovery::Internal::Internal(
    const SsdpDiscoveryOptions& opts, std::unique_ptr<SsdpTransportFactory> fact)
    : options(opts), factory(std::move(fact))
{
    ThreadPoolAttr attr;
    attr.minThreads = options.minThreads;
    attr.maxThreads = options.maxThreads;
    if (pool.start(&attr) != 0) {
        NpssdpPrintf(NPSSDP_CRITICAL, API, __FILE__, __LINE__,
                     "SsdpDiscovery: could not start the thread pool\n");
        return;
    }
    timer = std::make_unique<TimerThread>(&pool);
    if (timer->status() != 0) {
        NpssdpPrintf(NPSSDP_CRITICAL, API, __FILE__, __LINE__,
                     "SsdpDiscovery: could not start the timer thread\n");
        return;
    }
    ok = true;
}

SsdpDiscovery::SsdpDiscovery(const SsdpDiscoveryOptions& options)
    : SsdpDiscovery(options, makeSsdpSocketTransportFactory())
{
}

SsdpDiscovery::SsdpDiscovery(const SsdpDiscoveryOptions& options,
                             std::unique_ptr<SsdpTransportFactory> factory)
    : m(std::make_unique<Internal>(options, std::move(factory)))
{
}

SsdpDiscovery::~SsdpDiscovery()
{
    {
        std::scoped_lock lck(m->mutex);
        m->stopping = true;
    }
    stopAllDiscovery();
    // Timer first: it dispatches to the pool
    if (m->timer) {
        m->timer->shutdown();
    }
    m->pool.shutdown();
}

bool SsdpDiscovery::ok() const
{
    return m->ok;
}

int SsdpDiscovery::startDiscovery(
    const SsdpMSearchRequest& request,
    std::shared_ptr<SsdpDiscoverySession> *session, int timeoutms)
{
    if (nullptr == session || timeoutms < NPSSDP_INFINITE) {
        return NPSSDP_E_INVALID_PARAM;
    }
    if (!m->ok || !m->factory) {
        return NPSSDP_E_INIT_FAILED;
    }

    std::shared_ptr<SsdpDiscoverySession> newsession;
    {
        std::scoped_lock lck(m->mutex);
        if (m->stopping) {
            return NPSSDP_E_FINISH;
        }
        if (!m->transport) {
            auto transport = m->factory->create(m->options, &m->pool);
            if (!transport) {
                return NPSSDP_E_OUTOF_MEMORY;
            }
            int ret = transport->open(m.get());
            if (ret != NPSSDP_E_SUCCESS) {
                NpssdpPrintf(NPSSDP_ERROR, SSDP, __FILE__, __LINE__,
                             "startDiscovery: transport open failed: %s\n",
                             NpssdpGetErrorMessage(ret));
                return ret;
            }
            NpssdpPrintf(NPSSDP_INFO, SSDP, __FILE__, __LINE__,
                         "startDiscovery: transport opened\n");
            m->transport = std::move(transport);
        }
        int id = m->nextSessionId++;
        newsession.reset(new SsdpDiscoverySession(id, request, timeoutms, m.get()));
        m->sessions[id] = newsession;
    }
    newsession->start();
    *session = newsession;
    return NPSSDP_E_SUCCESS;
}

std::vector<std::shared_ptr<SsdpDiscoverySession>>
SsdpDiscovery::Internal::liveSessions()
{
    std::vector<std::shared_ptr<SsdpDiscoverySession>> out;
    std::scoped_lock lck(mutex);
    for (auto it = sessions.begin(); it != sessions.end();) {
        auto session = it->second.lock();
        if (session) {
            out.push_back(std::move(session));
            ++it;
        } else {
            it = sessions.erase(it);
        }
    }
    return out;
}

void SsdpDiscovery::stopAllDiscovery()
{
    auto sessions = m->liveSessions();
    for (const auto& session : sessions) {
        session->forceClose();
    }
    // The closed sessions have unregistered themselves. Sessions started
    // from a closedSession() callback are kept, with the transport.
    std::unique_ptr<SsdpTransport> transport;
    {
        std::scoped_lock lck(m->mutex);
        for (auto it = m->sessions.begin(); it != m->sessions.end();) {
            if (it->second.expired()) {
                it = m->sessions.erase(it);
            } else {
                ++it;
            }
        }
        if (m->sessions.empty()) {
            transport = std::move(m->transport);
        }
    }
    m->closeTransport(std::move(transport));
}

void SsdpDiscovery::Internal::closeTransport(std::unique_ptr<SsdpTransport> old)
{
    if (old) {
        NpssdpPrintf(NPSSDP_INFO, SSDP, __FILE__, __LINE__,
                     "SsdpDiscovery: no more sessions, closing transport\n");
        old->close();
    }
}

void SsdpDiscovery::Internal::unregisterSession(int id)
{
    std::unique_ptr<SsdpTransport> old;
    {
        std::scoped_lock lck(mutex);
        auto it = sessions.find(id);
        if (it == sessions.end()) {
            return;
        }
        sessions.erase(it);
        for (auto sit = sessions.begin(); sit != sessions.end();) {
            if (sit->second.expired()) {
                sit = sessions.erase(sit);
            } else {
                ++sit;
            }
        }
        if (sessions.empty()) {
            old = std::move(transport);
        }
    }
    closeTransport(std::move(old));
}

int SsdpDiscovery::Internal::sendSearch(const std::string& message)
{
    std::scoped_lock lck(mutex);
    if (!transport) {
        return NPSSDP_E_SOCKET_WRITE;
    }
    NpssdpPrintf(NPSSDP_ALL, SSDP, __FILE__, __LINE__,
                 "Sending M-SEARCH:\n%s\n", message.c_str());
    return transport->send(message);
}

int SsdpDiscovery::activeSessionCount() const
{
    std::scoped_lock lck(m->mutex);
    int count = 0;
    for (const auto& ent : m->sessions) {
        if (!ent.second.expired())
            count++;
    }
    return count;
}

bool SsdpDiscovery::transportOpen() const
{
    std::scoped_lock lck(m->mutex);
    return m->transport != nullptr;
}

void SsdpDiscovery::onDatagramReceived(
    const std::string& data, const struct sockaddr_storage& from)
{
    m->dispatch(data, from);
}

void SsdpDiscovery::Internal::onDatagram(
    const std::string& data, const struct sockaddr_storage& from)
{
    dispatch(data, from);
}

static std::string sockaddrToString(const struct sockaddr_storage& from)
{
    char buf[INET6_ADDRSTRLEN + 1];
    buf[0] = 0;
    switch (from.ss_family) {
    case AF_INET:
        inet_ntop(AF_INET, &reinterpret_cast<const struct sockaddr_in*>(&from)->sin_addr,
                  buf, sizeof(buf));
        break;
    case AF_INET6:
        inet_ntop(AF_INET6, &reinterpret_cast<const struct sockaddr_in6*>(&from)->sin6_addr,
                  buf, sizeof(buf));
        break;
    default:
        return "(unknown)";
    }
    return buf;
}

void SsdpDiscovery::Internal::dispatch(
    const std::string& data, const struct sockaddr_storage& from)
{
    if (NpssdpDebugAtLevel(NPSSDP_ALL, SSDP)) {
        NpssdpPrintf(NPSSDP_ALL, SSDP, __FILE__, __LINE__,
                     "Received datagram from %s:\n%s\n",
                     sockaddrToString(from).c_str(), data.c_str());
    }
    SsdpMessage message;
    if (!SSDPMessageParser::parseMessage(data, &message)) {
        NpssdpPrintf(NPSSDP_DEBUG, SSDP, __FILE__, __LINE__,
                     "Dropping unsupported or invalid datagram from %s\n",
                     sockaddrToString(from).c_str());
        return;
    }

    switch (message.kind) {
    case SsdpMessage::Kind::SearchResponse:
        break;
    case SsdpMessage::Kind::SearchRequest:
    case SsdpMessage::Kind::Notify:
        return;
    }

    const SsdpMSearchResponse& response = message.response;
    const SsdpSearchTarget& target = response.searchTarget();
    bool asDevice{false};
    switch (target.type()) {
    case SsdpSearchTarget::Type::All:
        NpssdpPrintf(NPSSDP_WARNING, SSDP, __FILE__, __LINE__,
                     "Dropping response with ST ssdp:all from %s\n",
                     sockaddrToString(from).c_str());
        return;
    case SsdpSearchTarget::Type::RootDevice:
    case SsdpSearchTarget::Type::Uuid:
    case SsdpSearchTarget::Type::DeviceType:
        asDevice = true;
        break;
    case SsdpSearchTarget::Type::ServiceType:
        asDevice = false;
        break;
    }

    auto sessions = liveSessions();
    for (const auto& session : sessions) {
        const SsdpSearchTarget& wanted = session->request().searchTarget();
        if (wanted == target || wanted.type() == SsdpSearchTarget::Type::All) {
            session->receiveResponse(response, asDevice);
        }
    }
}
