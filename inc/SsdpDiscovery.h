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

#ifndef SSDPDISCOVERY_H
#define SSDPDISCOVERY_H

#include <chrono>
#include <memory>
#include <mutex>
#include <set>
#include <vector>

#include <sys/socket.h>

#include "NpssdpGlobal.h"
#include "npssdp.h"
#include "SsdpMessage.h"
#include "SsdpSearchTarget.h"

class SsdpDiscoverySession;
class SsdpRetransmitJobWorker;
class SsdpTransportFactory;

/*!
 * \brief Receives the discovery results.
 *
 * The methods are called from the coordinator's worker threads, never with
 * a library lock held, so they can call back into the library (e.g. close
 * the session). They should not block for long.
 */
class EXPORT_SPEC SsdpDiscoveryObserver {
public:
    virtual ~SsdpDiscoveryObserver() = default;
    /*! A response for a device target (root device, uuid, device type) */
    virtual void discoveredDevice(const SsdpMSearchResponse&,
                                  const std::shared_ptr<SsdpDiscoverySession>&) {}
    /*! A response for a service type target */
    virtual void discoveredService(const SsdpMSearchResponse&,
                                   const std::shared_ptr<SsdpDiscoverySession>&) {}
    /*! The session was closed by a timeout or by stopAllDiscovery() */
    virtual void closedSession(const std::shared_ptr<SsdpDiscoverySession>&) {}
};

/*!
 * \brief Discovery coordinator.
 *
 * Owns the multicast socket, shared by all its discovery sessions. The
 * socket is opened when the first session starts and closed when the
 * last one closes. Each coordinator has its own worker threads, used for
 * the periodic searches, the timeouts and the observer callbacks.
 *
 * A default coordinator is created by NpssdpInit().
 */
class EXPORT_SPEC SsdpDiscovery {
public:
    explicit SsdpDiscovery(const SsdpDiscoveryOptions& options = SsdpDiscoveryOptions());
    /*! Use a specific transport implementation (mostly for testing) */
    SsdpDiscovery(const SsdpDiscoveryOptions& options,
                  std::unique_ptr<SsdpTransportFactory> factory);
    /*! Stops all discovery (closedSession is called for each active
     *  session), then the worker threads. */
    ~SsdpDiscovery();
    SsdpDiscovery(const SsdpDiscovery&) = delete;
    SsdpDiscovery& operator=(const SsdpDiscovery&) = delete;

    /*! Check that the worker threads could be started. */
    bool ok() const;

    /*!
     * \brief Start a discovery session.
     *
     * Opens the socket if needed, sends the first M-SEARCH and then
     * repeats it at increasing intervals until the session is closed.
     *
     * \param request what to search for, and the observer to call.
     * \param[out] session the new session. The caller owns it: the session
     *   is closed if it is destroyed.
     * \param timeoutms time after which the session is force-closed, or
     *   NPSSDP_INFINITE.
     * \return NPSSDP_E_SUCCESS, NPSSDP_E_INVALID_PARAM, NPSSDP_E_INIT_FAILED
     *   or a socket setup error (NPSSDP_E_INVALID_INTERFACE,
     *   NPSSDP_E_OUTOF_SOCKET, NPSSDP_E_SOCKET_BIND, NPSSDP_E_SOCKET_ERROR...),
     *   NPSSDP_E_FINISH if the coordinator is being destroyed.
     *   No session is created in case of error.
     */
    int startDiscovery(const SsdpMSearchRequest& request,
                       std::shared_ptr<SsdpDiscoverySession> *session,
                       int timeoutms = NPSSDP_INFINITE);

    /*! Force-close all the active sessions and close the socket. The socket
     *  stays open if a session is started from a closedSession() callback. */
    void stopAllDiscovery();

    /*!
     * \brief Process a datagram received on the socket.
     *
     * Called by the transport. Invalid datagrams are logged and dropped.
     */
    void onDatagramReceived(const std::string& data,
                            const struct sockaddr_storage& from);

    /*! Number of sessions currently registered */
    int activeSessionCount() const;
    /*! True if the socket is currently open */
    bool transportOpen() const;

    class Internal;
private:
    std::unique_ptr<Internal> m;
};

/*!
 * \brief One discovery operation, for one request.
 *
 * Sessions are created by SsdpDiscovery::startDiscovery(). A session
 * searches until close() is called, its timeout expires, or the
 * coordinator stops all discovery. It never searches again after this.
 *
 * Each (USN, LOCATION) pair is reported only once per session.
 */
class EXPORT_SPEC SsdpDiscoverySession :
        public std::enable_shared_from_this<SsdpDiscoverySession> {
public:
    enum class Phase {Unknown, Searching, Closed};

    /*! Calls close() */
    ~SsdpDiscoverySession();
    SsdpDiscoverySession(const SsdpDiscoverySession&) = delete;
    SsdpDiscoverySession& operator=(const SsdpDiscoverySession&) = delete;

    const SsdpMSearchRequest& request() const {return m_request;}
    Phase phase() const;
    /*! Unique inside the coordinator */
    int id() const {return m_id;}
    /*! The distinct responses reported so far */
    std::vector<SsdpMSearchResponse> responses() const;

    /*!
     * \brief Stop searching. The observer is not called.
     *
     * Can be called any number of times, from any thread.
     */
    void close();

    /*! Close, then call the observer's closedSession() if this call did
     *  close the session. */
    void forceClose();

    /*! Begin searching. Does nothing if the session was already started
     *  or closed. Called by startDiscovery(). */
    void start();

    /*!
     * \brief Process a response routed by the coordinator.
     *
     * Dropped if the session is not searching or the response was already
     * seen, else reported to the observer as a device or service.
     */
    void receiveResponse(const SsdpMSearchResponse& response, bool asDevice);

    /*! Interval between M-SEARCH sends after elapsed time since start */
    static std::chrono::milliseconds timerCadence(std::chrono::milliseconds elapsed);

private:
    friend class SsdpDiscovery;
    friend class SsdpDiscovery::Internal;
    friend class SsdpRetransmitJobWorker;
    SsdpDiscoverySession(int id, const SsdpMSearchRequest& request, int timeoutms,
                         SsdpDiscovery::Internal *coordinator);

    bool doClose();
    void sendSearch();
    void scheduleNext();
    void onRetransmitTimer();

    const int m_id;
    const SsdpMSearchRequest m_request;
    const int m_timeoutms;

    mutable std::mutex m_mutex;
    Phase m_phase{Phase::Unknown};
    // Null after close.
    SsdpDiscovery::Internal *m_coordinator;
    std::chrono::steady_clock::time_point m_startTime;
    std::chrono::steady_clock::time_point m_lastCheck;
    std::set<SsdpMSearchResponse> m_seen;
    int m_retransmitTimerId{-1};
    int m_timeoutTimerId{-1};
};

#endif /* SSDPDISCOVERY_H */
