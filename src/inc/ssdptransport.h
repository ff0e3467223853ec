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

#ifndef _SSDPTRANSPORT_H_
#define _SSDPTRANSPORT_H_

#include <memory>
#include <string>

#include <sys/socket.h>

#include "npssdp.h"

class ThreadPool;

/* Receives the datagrams from a transport. Called from a pool thread. */
class SsdpTransportListener {
public:
    virtual ~SsdpTransportListener() = default;
    virtual void onDatagram(const std::string& data,
                            const struct sockaddr_storage& from) = 0;
};

/*!
 * UDP endpoint used for the searches: sends to the SSDP multicast group
 * and delivers the unicast responses.
 */
class SsdpTransport {
public:
    virtual ~SsdpTransport() = default;
    /*! Set up the socket and start receiving.
     *  \return NPSSDP_E_SUCCESS or an NPSSDP_E_ error code. */
    virtual int open(SsdpTransportListener *listener) = 0;
    /*! Send one datagram to 239.255.255.250:1900 */
    virtual int send(const std::string& datagram) = 0;
    /*! Stop receiving and close the socket. Must not be called from the
     *  listener callback. Idempotent. */
    virtual void close() = 0;
};

class SsdpTransportFactory {
public:
    virtual ~SsdpTransportFactory() = default;
    /*! \param pool worker threads for the receive loop and the datagram
     *    jobs. */
    virtual std::unique_ptr<SsdpTransport> create(
        const SsdpDiscoveryOptions& options, ThreadPool *pool) = 0;
};

/* The real thing: IPv4 UDP sockets */
extern std::unique_ptr<SsdpTransportFactory> makeSsdpSocketTransportFactory();

#endif /* _SSDPTRANSPORT_H_ */
