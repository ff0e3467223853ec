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


/* UDP/IPv4 transport for the discovery coordinator. */

#include "ssdptransport.h"

#include <algorithm>
#include <cerrno>
#include <chrono>
#include <condition_variable>
#include <cstring>
#include <mutex>

#include <sys/select.h>

#include "NpssdpInet.h"
#include "ThreadPool.h"
#include "genut.h"
#include "netif.h"
#include "ssdplib.h"

class SsdpSocketTransport : public SsdpTransport {
public:
    SsdpSocketTransport(const SsdpDiscoveryOptions& opts, ThreadPool *tp)
        : m_options(opts), m_pool(tp) {}
    ~SsdpSocketTransport() override {
        close();
    }
    int open(SsdpTransportListener *listener) override;
    int send(const std::string& datagram) override;
    void close() override;

    void receiveLoop();

private:
    int chooseInterface(NetIF::IPAddr *hostaddr);
    int createSearchSocket(const NetIF::IPAddr& hostaddr);
    int createStopSocket();
    void readSearchSocket();
    bool readStopSocket();
    void closeSockets();

    enum class State {Idle, Running};

    SsdpDiscoveryOptions m_options;
    ThreadPool *m_pool;
    SsdpTransportListener *m_listener{nullptr};
    SOCKET m_sock{INVALID_SOCKET};
    SOCKET m_stopSock{INVALID_SOCKET};
    uint16_t m_stopPort{0};
    struct sockaddr_in m_mcastAddr{};

    std::mutex m_stateMutex;
    std::condition_variable m_stateCV;
    State m_state{State::Idle};
};

// Hands one datagram to the listener, on a pool thread
class SsdpDatagramJobWorker : public JobWorker {
public:
    SsdpDatagramJobWorker(SsdpTransportListener *listener, std::string data,
                          const struct sockaddr_storage& from)
        : m_listener(listener), m_data(std::move(data)), m_from(from) {}
    void work() override {
        m_listener->onDatagram(m_data, m_from);
    }
    SsdpTransportListener *m_listener;
    std::string m_data;
    struct sockaddr_storage m_from;
};

class SsdpReceiveJobWorker : public JobWorker {
public:
    explicit SsdpReceiveJobWorker(SsdpSocketTransport *t) : m_transport(t) {}
    void work() override {
        m_transport->receiveLoop();
    }
    SsdpSocketTransport *m_transport;
};

int SsdpSocketTransport::chooseInterface(NetIF::IPAddr *hostaddr)
{
    auto ifs = NetIF::Interfaces::theInterfaces();
    NetIF::Interface netif;
    if (!m_options.ifname.empty()) {
        if (!ifs->findByName(m_options.ifname, &netif)) {
            NpssdpPrintf(NPSSDP_CRITICAL, SSDP, __FILE__, __LINE__,
                         "No interface named [%s]\n", m_options.ifname.c_str());
            return NPSSDP_E_INVALID_INTERFACE;
        }
    } else {
        NetIF::Interfaces::Filter filt;
        filt.needs = {NetIF::Interface::Flags::HASIPV4, NetIF::Interface::Flags::UP,
                      NetIF::Interface::Flags::MULTICAST};
        filt.rejects = {NetIF::Interface::Flags::LOOPBACK};
        auto selected = ifs->select(filt);
        if (selected.empty()) {
            NpssdpPrintf(NPSSDP_CRITICAL, SSDP, __FILE__, __LINE__,
                         "No usable network interface found\n");
            return NPSSDP_E_INVALID_INTERFACE;
        }
        netif = selected[0];
    }
    auto addr = netif.firstipv4addr();
    if (nullptr == addr) {
        NpssdpPrintf(NPSSDP_CRITICAL, SSDP, __FILE__, __LINE__,
                     "Interface %s has no IPv4 address\n", netif.getname().c_str());
        return NPSSDP_E_INVALID_INTERFACE;
    }
    *hostaddr = *addr;
    NpssdpPrintf(NPSSDP_INFO, SSDP, __FILE__, __LINE__,
                 "Searching on interface %s address %s\n",
                 netif.getname().c_str(), addr->straddr().c_str());
    return NPSSDP_E_SUCCESS;
}

int SsdpSocketTransport::createSearchSocket(const NetIF::IPAddr& hostaddr)
{
    int ret = NPSSDP_E_SOCKET_ERROR;
    int onOff;
    unsigned char ttl = static_cast<unsigned char>(m_options.ttl);
    unsigned char loop = m_options.multicastLoop ? 1 : 0;
    struct sockaddr_storage hss;
    auto hostaddr4 = reinterpret_cast<struct sockaddr_in *>(&hss);
    std::string errorcause;

    hostaddr.copyToStorage(&hss);
    if (inet_pton(AF_INET, SSDP_IP, &m_mcastAddr.sin_addr) != 1) {
        errorcause = "inet_pton() error for multicast address";
        goto error_handler;
    }
    m_mcastAddr.sin_family = AF_INET;
    m_mcastAddr.sin_port = htons(SSDP_PORT);

    m_sock = socket(AF_INET, SOCK_DGRAM, 0);
    if (m_sock == INVALID_SOCKET) {
        errorcause = "socket()";
        ret = NPSSDP_E_OUTOF_SOCKET;
        goto error_handler;
    }
    if (setsockopt(m_sock, IPPROTO_IP, IP_MULTICAST_IF,
                   &hostaddr4->sin_addr, sizeof(hostaddr4->sin_addr)) < 0) {
        errorcause = "setsockopt(IP_MULTICAST_IF)";
        goto error_handler;
    }
    if (setsockopt(m_sock, IPPROTO_IP, IP_MULTICAST_TTL, &ttl, sizeof(ttl)) < 0) {
        errorcause = "setsockopt(IP_MULTICAST_TTL)";
        goto error_handler;
    }
    if (setsockopt(m_sock, IPPROTO_IP, IP_MULTICAST_LOOP, &loop, sizeof(loop)) < 0) {
        errorcause = "setsockopt(IP_MULTICAST_LOOP)";
        goto error_handler;
    }

    if (m_options.port == SSDP_PORT) {
        onOff = 1;
        if (setsockopt(m_sock, SOL_SOCKET, SO_REUSEADDR,
                       reinterpret_cast<char *>(&onOff), sizeof(onOff)) < 0) {
            errorcause = "setsockopt() SO_REUSEADDR";
            goto error_handler;
        }
    }

    if (m_options.port > 0) {
        struct sockaddr_in bindaddr = {};
        bindaddr.sin_family = AF_INET;
        bindaddr.sin_addr.s_addr = htonl(INADDR_ANY);
        bindaddr.sin_port = htons(m_options.port);
        if (bind(m_sock, reinterpret_cast<struct sockaddr *>(&bindaddr),
                 sizeof(bindaddr)) == SOCKET_ERROR) {
            errorcause = "bind(INADDR_ANY)";
            ret = NPSSDP_E_SOCKET_BIND;
            goto error_handler;
        }
    }

    if (m_options.port == SSDP_PORT) {
        struct ip_mreq mreq = {};
        mreq.imr_interface = hostaddr4->sin_addr;
        mreq.imr_multiaddr = m_mcastAddr.sin_addr;
        if (setsockopt(m_sock, IPPROTO_IP, IP_ADD_MEMBERSHIP,
                       reinterpret_cast<char *>(&mreq), sizeof(mreq)) < 0) {
            errorcause = "setsockopt() IP_ADD_MEMBERSHIP";
            goto error_handler;
        }
    }
    return NPSSDP_E_SUCCESS;

error_handler:
    char errorBuffer[ERROR_BUFFER_LEN];
    posix_strerror_r(errno, errorBuffer, ERROR_BUFFER_LEN);
    NpssdpPrintf(NPSSDP_CRITICAL, SSDP, __FILE__, __LINE__,
                 "%s: %s\n", errorcause.c_str(), errorBuffer);
    if (m_sock != INVALID_SOCKET) {
        NpssdpCloseSocket(m_sock);
        m_sock = INVALID_SOCKET;
    }
    return ret;
}

/* The stop socket is bound to the loopback. close() sends "ShutDown" to it
 * to get the receive loop out of select(). */
int SsdpSocketTransport::createStopSocket()
{
    char errorBuffer[ERROR_BUFFER_LEN];
    struct sockaddr_in stop_sockaddr = {};
    socklen_t len = sizeof(stop_sockaddr);

    m_stopSock = socket(AF_INET, SOCK_DGRAM, 0);
    if (m_stopSock == INVALID_SOCKET) {
        posix_strerror_r(errno, errorBuffer, ERROR_BUFFER_LEN);
        NpssdpPrintf(NPSSDP_CRITICAL, SSDP, __FILE__, __LINE__,
                     "stopsock: socket(): %s\n", errorBuffer);
        return NPSSDP_E_OUTOF_SOCKET;
    }
    stop_sockaddr.sin_family = static_cast<sa_family_t>(AF_INET);
    stop_sockaddr.sin_addr.s_addr = inet_addr("127.0.0.1");
    if (bind(m_stopSock, reinterpret_cast<struct sockaddr *>(&stop_sockaddr),
             sizeof(stop_sockaddr)) == SOCKET_ERROR) {
        NpssdpPrintf(NPSSDP_CRITICAL, SSDP, __FILE__, __LINE__,
                     "Error in binding localhost!!!\n");
        return NPSSDP_E_SOCKET_BIND;
    }
    if (getsockname(m_stopSock, reinterpret_cast<struct sockaddr *>(&stop_sockaddr),
                    &len) == SOCKET_ERROR) {
        NpssdpPrintf(NPSSDP_CRITICAL, SSDP, __FILE__, __LINE__,
                     "getsockname failed for stop socket\n");
        return NPSSDP_E_INTERNAL_ERROR;
    }
    m_stopPort = ntohs(stop_sockaddr.sin_port);
    return NPSSDP_E_SUCCESS;
}

void SsdpSocketTransport::closeSockets()
{
    if (m_sock != INVALID_SOCKET) {
        NpssdpCloseSocket(m_sock);
        m_sock = INVALID_SOCKET;
    }
    if (m_stopSock != INVALID_SOCKET) {
        NpssdpCloseSocket(m_stopSock);
        m_stopSock = INVALID_SOCKET;
    }
}

int SsdpSocketTransport::open(SsdpTransportListener *listener)
{
    if (nullptr == listener || nullptr == m_pool) {
        return NPSSDP_E_INVALID_PARAM;
    }
    {
        std::unique_lock<std::mutex> lck(m_stateMutex);
        if (m_state != State::Idle) {
            return NPSSDP_E_SUCCESS;
        }
    }
    m_listener = listener;

    NetIF::IPAddr hostaddr;
    int ret = chooseInterface(&hostaddr);
    if (ret != NPSSDP_E_SUCCESS) {
        return ret;
    }
    if ((ret = createSearchSocket(hostaddr)) != NPSSDP_E_SUCCESS ||
        (ret = createStopSocket()) != NPSSDP_E_SUCCESS) {
        closeSockets();
        return ret;
    }

    ret = m_pool->addPersistent(std::make_unique<SsdpReceiveJobWorker>(this));
    if (ret != 0) {
        NpssdpPrintf(NPSSDP_CRITICAL, SSDP, __FILE__, __LINE__,
                     "Could not start the receive loop: %d\n", ret);
        closeSockets();
        return NPSSDP_E_OUTOF_MEMORY;
    }
    std::unique_lock<std::mutex> lck(m_stateMutex);
    m_stateCV.wait(lck, [this] { return m_state == State::Running; });
    return NPSSDP_E_SUCCESS;
}

int SsdpSocketTransport::send(const std::string& datagram)
{
    if (m_sock == INVALID_SOCKET) {
        return NPSSDP_E_SOCKET_WRITE;
    }
    ssize_t cnt = sendto(m_sock, datagram.c_str(), datagram.size(), 0,
                         reinterpret_cast<struct sockaddr *>(&m_mcastAddr),
                         sizeof(m_mcastAddr));
    if (cnt < 0 || static_cast<size_t>(cnt) != datagram.size()) {
        char errorBuffer[ERROR_BUFFER_LEN];
        posix_strerror_r(errno, errorBuffer, ERROR_BUFFER_LEN);
        NpssdpPrintf(NPSSDP_ERROR, SSDP, __FILE__, __LINE__,
                     "sendto(): %s\n", errorBuffer);
        return NPSSDP_E_SOCKET_WRITE;
    }
    return NPSSDP_E_SUCCESS;
}

void SsdpSocketTransport::readSearchSocket()
{
    char buf[SSDP_BUFSIZE];
    struct sockaddr_storage from = {};
    socklen_t socklen = sizeof(from);
    ssize_t cnt = recvfrom(m_sock, buf, sizeof(buf) - 1, 0,
                           reinterpret_cast<struct sockaddr *>(&from), &socklen);
    if (cnt <= 0) {
        return;
    }
    auto worker = std::make_unique<SsdpDatagramJobWorker>(
        m_listener, std::string(buf, cnt), from);
    int ret = m_pool->addJob(std::move(worker));
    if (ret != 0) {
        NpssdpPrintf(NPSSDP_ERROR, SSDP, __FILE__, __LINE__,
                     "Could not queue datagram job: %d\n", ret);
    }
}

bool SsdpSocketTransport::readStopSocket()
{
    char requestBuf[100];
    struct sockaddr_storage ss = {};
    socklen_t len = sizeof(ss);
    ssize_t byteReceived = recvfrom(m_stopSock, requestBuf, 25, 0,
                                    reinterpret_cast<struct sockaddr *>(&ss), &len);
    if (byteReceived > 0) {
        requestBuf[byteReceived] = '\0';
        if (nullptr != strstr(requestBuf, "ShutDown")) {
            return true;
        }
    }
    return false;
}

/*!
 * Waits for responses on the search socket and queues a job for each of
 * them, until something is received on the stop socket.
 */
void SsdpSocketTransport::receiveLoop()
{
    char errorBuffer[ERROR_BUFFER_LEN];
    fd_set rdSet;
    int maxSock = std::max(m_sock, m_stopSock) + 1;
    bool stop{false};

    {
        std::unique_lock<std::mutex> lck(m_stateMutex);
        m_state = State::Running;
        m_stateCV.notify_all();
    }
    while (!stop) {
        FD_ZERO(&rdSet);
        FD_SET(m_sock, &rdSet);
        FD_SET(m_stopSock, &rdSet);
        int ret = select(maxSock, &rdSet, nullptr, nullptr, nullptr);
        if (ret == SOCKET_ERROR && errno == EINTR) {
            continue;
        }
        if (ret == SOCKET_ERROR) {
            posix_strerror_r(errno, errorBuffer, ERROR_BUFFER_LEN);
            NpssdpPrintf(NPSSDP_CRITICAL, SSDP, __FILE__, __LINE__,
                         "receive loop: select(): %s\n", errorBuffer);
            continue;
        }
        if (FD_ISSET(m_sock, &rdSet)) {
            readSearchSocket();
        }
        if (FD_ISSET(m_stopSock, &rdSet)) {
            stop = readStopSocket();
        }
    }

    std::unique_lock<std::mutex> lck(m_stateMutex);
    m_state = State::Idle;
    m_stateCV.notify_all();
}

void SsdpSocketTransport::close()
{
    char errorBuffer[ERROR_BUFFER_LEN];
    const char *buf = "ShutDown";

    std::unique_lock<std::mutex> lck(m_stateMutex);
    if (m_state == State::Running) {
        SOCKET sock = socket(AF_INET, SOCK_DGRAM, 0);
        if (sock == INVALID_SOCKET) {
            posix_strerror_r(errno, errorBuffer, ERROR_BUFFER_LEN);
            NpssdpPrintf(NPSSDP_ERROR, SSDP, __FILE__, __LINE__,
                         "SsdpSocketTransport::close: socket(): %s\n", errorBuffer);
            return;
        }
        struct sockaddr_in stopaddr = {};
        stopaddr.sin_family = static_cast<sa_family_t>(AF_INET);
        stopaddr.sin_addr.s_addr = inet_addr("127.0.0.1");
        stopaddr.sin_port = htons(m_stopPort);
        while (m_state != State::Idle) {
            sendto(sock, buf, strlen(buf), 0,
                   reinterpret_cast<struct sockaddr *>(&stopaddr), sizeof(stopaddr));
            m_stateCV.wait_for(lck, std::chrono::seconds(1));
        }
        NpssdpCloseSocket(sock);
    }
    closeSockets();
}

class SsdpSocketTransportFactory : public SsdpTransportFactory {
public:
    std::unique_ptr<SsdpTransport> create(
        const SsdpDiscoveryOptions& options, ThreadPool *pool) override {
        return std::make_unique<SsdpSocketTransport>(options, pool);
    }
};

std::unique_ptr<SsdpTransportFactory> makeSsdpSocketTransportFactory()
{
    return std::make_unique<SsdpSocketTransportFactory>();
}
