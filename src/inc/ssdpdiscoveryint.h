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

#ifndef _SSDPDISCOVERYINT_H_
#define _SSDPDISCOVERYINT_H_

/* Coordinator internals, shared with the session implementation */

#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include "SsdpDiscovery.h"
#include "ThreadPool.h"
#include "TimerThread.h"
#include "ssdptransport.h"

class SsdpDiscovery::Internal : public SsdpTransportListener {
public:
    Internal(const SsdpDiscoveryOptions& options,
             std::unique_ptr<SsdpTransportFactory> factory);

    // SsdpTransportListener
    void onDatagram(const std::string& data,
                    const struct sockaddr_storage& from) override;

    void dispatch(const std::string& data, const struct sockaddr_storage& from);
    int sendSearch(const std::string& message);
    void unregisterSession(int id);
    std::vector<std::shared_ptr<SsdpDiscoverySession>> liveSessions();
    void closeTransport(std::unique_ptr<SsdpTransport> transport);

    SsdpDiscoveryOptions options;
    std::unique_ptr<SsdpTransportFactory> factory;
    ThreadPool pool;
    std::unique_ptr<TimerThread> timer;
    bool ok{false};

    // Protects the following fields
    std::mutex mutex;
    std::unique_ptr<SsdpTransport> transport;
    // Does not own the sessions. Entries are removed by close().
    std::map<int, std::weak_ptr<SsdpDiscoverySession>> sessions;
    int nextSessionId{1};
    // Set by the destructor, no new sessions
    bool stopping{false};
};

#endif /* _SSDPDISCOVERYINT_H_ */
