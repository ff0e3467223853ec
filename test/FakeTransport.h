/* Copyright (C) 2016 J.F.Dockes
 *   This program is free software; you can redistribute it and/or modify
 *   it under the terms of the GNU Lesser General Public License as published by
 *   the Free Software Foundation; either version 2.1 of the License, or
 *   (at your option) any later version.
 *
 *   This program is distributed in the hope that it will be useful,
 *   but WITHOUT ANY WARRANTY; without even the implied warranty of
 *   MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
 *   GNU Lesser General Public License for more details.
 *
 *   You should have received a copy of the GNU Lesser General Public License
 *   along with this program; if not, write to the
 *   Free Software Foundation, Inc.,
 *   51 Franklin Street, Fifth Floor, Boston, MA 02110-1301 USA.
 */
#ifndef _FAKETRANSPORT_H_
#define _FAKETRANSPORT_H_

/* In-memory transport and observer used by the discovery tests */

#include <chrono>
#include <cstring>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

#include <arpa/inet.h>
#include <netinet/in.h>

#include "SsdpDiscovery.h"
#include "ssdptransport.h"

// State shared by the test and the transports created by the factory
struct FakeNet {
    std::mutex mutex;
    std::vector<std::string> sent;
    int openCount{0};
    int closeCount{0};
    // Returned by the next open() if not success
    int openError{NPSSDP_E_SUCCESS};
    bool isOpen{false};

    size_t sentCount() {
        std::scoped_lock lck(mutex);
        return sent.size();
    }
    std::string sentAt(size_t i) {
        std::scoped_lock lck(mutex);
        return i < sent.size() ? sent[i] : std::string();
    }
};

class FakeTransport : public SsdpTransport {
public:
    explicit FakeTransport(std::shared_ptr<FakeNet> net) : m_net(std::move(net)) {}
    int open(SsdpTransportListener *) override {
        std::scoped_lock lck(m_net->mutex);
        if (m_net->openError != NPSSDP_E_SUCCESS) {
            return m_net->openError;
        }
        m_net->openCount++;
        m_net->isOpen = true;
        m_opened = true;
        return NPSSDP_E_SUCCESS;
    }
    int send(const std::string& datagram) override {
        std::scoped_lock lck(m_net->mutex);
        if (!m_opened) {
            return NPSSDP_E_SOCKET_WRITE;
        }
        m_net->sent.push_back(datagram);
        return NPSSDP_E_SUCCESS;
    }
    void close() override {
        std::scoped_lock lck(m_net->mutex);
        if (m_opened) {
            m_opened = false;
            m_net->isOpen = false;
            m_net->closeCount++;
        }
    }
private:
    std::shared_ptr<FakeNet> m_net;
    bool m_opened{false};
};

class FakeTransportFactory : public SsdpTransportFactory {
public:
    explicit FakeTransportFactory(std::shared_ptr<FakeNet> net) : m_net(std::move(net)) {}
    std::unique_ptr<SsdpTransport> create(const SsdpDiscoveryOptions&, ThreadPool *) override {
        return std::make_unique<FakeTransport>(m_net);
    }
private:
    std::shared_ptr<FakeNet> m_net;
};

class RecordingObserver : public SsdpDiscoveryObserver {
public:
    void discoveredDevice(const SsdpMSearchResponse& r,
                          const std::shared_ptr<SsdpDiscoverySession>&) override {
        std::scoped_lock lck(mutex);
        devices.push_back(r);
    }
    void discoveredService(const SsdpMSearchResponse& r,
                           const std::shared_ptr<SsdpDiscoverySession>&) override {
        std::scoped_lock lck(mutex);
        services.push_back(r);
    }
    void closedSession(const std::shared_ptr<SsdpDiscoverySession>& s) override {
        std::scoped_lock lck(mutex);
        closed.push_back(s->id());
    }
    size_t deviceCount() {
        std::scoped_lock lck(mutex);
        return devices.size();
    }
    size_t serviceCount() {
        std::scoped_lock lck(mutex);
        return services.size();
    }
    size_t closedCount() {
        std::scoped_lock lck(mutex);
        return closed.size();
    }

    std::mutex mutex;
    std::vector<SsdpMSearchResponse> devices;
    std::vector<SsdpMSearchResponse> services;
    std::vector<int> closed;
};

inline struct sockaddr_storage fakeSender()
{
    struct sockaddr_storage ss;
    memset(&ss, 0, sizeof(ss));
    auto sa4 = reinterpret_cast<struct sockaddr_in *>(&ss);
    sa4->sin_family = AF_INET;
    sa4->sin_port = htons(1900);
    sa4->sin_addr.s_addr = htonl(0xc0a80114);
    return ss;
}

// Response datagram text for a target and location
inline std::string responseDatagram(const std::string& st, const std::string& uuid,
                                    const std::string& location)
{
    return std::string("HTTP/1.1 200 OK\r\n"
                       "CACHE-CONTROL: max-age=1800\r\n"
                       "EXT:\r\n"
                       "LOCATION: ") + location + "\r\n"
        "SERVER: Linux/6.1 UPnP/1.0 fake/1.0\r\n"
        "ST: " + st + "\r\n"
        "USN: uuid:" + uuid + "::" + st + "\r\n"
        "\r\n";
}

inline void sleepms(int ms)
{
    std::this_thread::sleep_for(std::chrono::milliseconds(ms));
}

#endif /* _FAKETRANSPORT_H_ */
