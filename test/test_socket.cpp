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

/* Discovery through the UDP transport, on the loopback interface. The
 * responses are sent as unicast datagrams to the search socket port. */

#include "FakeTransport.h"
#include "SsdpDiscovery.h"
#include "NpssdpInet.h"

#include <iostream>
#include <memory>
#include <string>

using namespace std;

static int failures;

#define CHECK(X) do {                                                   \
        if (!(X)) {                                                     \
            cerr << __FILE__ << ":" << __LINE__ << ": check failed: " #X "\n"; \
            failures++;                                                 \
        }                                                               \
    } while (0)

// Find a currently unused UDP port on the loopback
static unsigned short freeport()
{
    SOCKET sock = socket(AF_INET, SOCK_DGRAM, 0);
    if (sock == INVALID_SOCKET) {
        return 0;
    }
    struct sockaddr_in addr = {};
    addr.sin_family = AF_INET;
    addr.sin_addr.s_addr = htonl(INADDR_LOOPBACK);
    socklen_t len = sizeof(addr);
    unsigned short port = 0;
    if (bind(sock, reinterpret_cast<struct sockaddr *>(&addr), sizeof(addr)) == 0 &&
        getsockname(sock, reinterpret_cast<struct sockaddr *>(&addr), &len) == 0) {
        port = ntohs(addr.sin_port);
    }
    NpssdpCloseSocket(sock);
    return port;
}

// Unicast a datagram to the search socket, as a device would
static bool sendto_local(unsigned short port, const string& data)
{
    SOCKET sock = socket(AF_INET, SOCK_DGRAM, 0);
    if (sock == INVALID_SOCKET) {
        return false;
    }
    struct sockaddr_in addr = {};
    addr.sin_family = AF_INET;
    addr.sin_addr.s_addr = htonl(INADDR_LOOPBACK);
    addr.sin_port = htons(port);
    ssize_t cnt = sendto(sock, data.c_str(), data.size(), 0,
                         reinterpret_cast<struct sockaddr *>(&addr), sizeof(addr));
    NpssdpCloseSocket(sock);
    return cnt == static_cast<ssize_t>(data.size());
}

template <class F> static bool waitfor(F cond, int ms = 2000)
{
    for (int i = 0; i < ms / 20; i++) {
        if (cond()) {
            return true;
        }
        sleepms(20);
    }
    return cond();
}

static SsdpDiscoveryOptions loopbackOptions(unsigned short port)
{
    SsdpDiscoveryOptions options;
    options.ifname = "lo";
    options.port = port;
    options.ttl = 1;
    return options;
}

static const string rootdev("upnp:rootdevice");

// Open, receive, close, then open again on the same port
static void testOpenReceiveReopen()
{
    unsigned short port = freeport();
    CHECK(port != 0);
    SsdpDiscovery disco(loopbackOptions(port));
    CHECK(disco.ok());
    auto observer = make_shared<RecordingObserver>();
    SsdpMSearchRequest req(observer, SsdpSearchTarget::rootDevice());

    shared_ptr<SsdpDiscoverySession> session;
    CHECK(disco.startDiscovery(req, &session) == NPSSDP_E_SUCCESS);
    if (!session) {
        return;
    }
    CHECK(disco.transportOpen());

    const string loc1("http://127.0.0.1:49152/desc1.xml");
    CHECK(sendto_local(port, responseDatagram(rootdev, "1111", loc1)));
    CHECK(sendto_local(port, responseDatagram(rootdev, "1111", loc1)));
    // Garbage is dropped by the parser
    CHECK(sendto_local(port, "NOTIFY * HTTP/1.1\r\n\r\n"));
    CHECK(waitfor([&] { return observer->deviceCount() == 1; }));
    sleepms(200);
    CHECK(observer->deviceCount() == 1);
    CHECK(session->responses().size() == 1);

    session->close();
    CHECK(!disco.transportOpen());
    CHECK(disco.activeSessionCount() == 0);

    // Not received any more
    const string loc2("http://127.0.0.1:49152/desc2.xml");
    CHECK(sendto_local(port, responseDatagram(rootdev, "2222", loc2)));
    sleepms(200);
    CHECK(observer->deviceCount() == 1);

    shared_ptr<SsdpDiscoverySession> session2;
    CHECK(disco.startDiscovery(req, &session2) == NPSSDP_E_SUCCESS);
    if (!session2) {
        return;
    }
    CHECK(disco.transportOpen());
    CHECK(sendto_local(port, responseDatagram(rootdev, "1111", loc1)));
    CHECK(waitfor([&] { return observer->deviceCount() == 2; }));
    CHECK(session2->responses().size() == 1);
    session2->close();
    CHECK(!disco.transportOpen());
}

// Sessions closed before their timers fire, then a timeout which does fire
static void testCloseBeforeTimers()
{
    unsigned short port = freeport();
    SsdpDiscovery disco(loopbackOptions(port));
    auto observer = make_shared<RecordingObserver>();
    SsdpMSearchRequest req(observer, SsdpSearchTarget::rootDevice());

    // The timeout fires after a few retransmissions have been scheduled
    shared_ptr<SsdpDiscoverySession> s1;
    CHECK(disco.startDiscovery(req, &s1, 1200) == NPSSDP_E_SUCCESS);
    CHECK(waitfor([&] { return observer->closedCount() == 1; }));
    CHECK(s1 && s1->phase() == SsdpDiscoverySession::Phase::Closed);
    CHECK(!disco.transportOpen());

    // Closed while both its timers are pending
    shared_ptr<SsdpDiscoverySession> s2;
    CHECK(disco.startDiscovery(req, &s2, 5000) == NPSSDP_E_SUCCESS);
    sleepms(100);
    if (s2) {
        s2->close();
    }
    CHECK(observer->closedCount() == 1);

    // The timer keeps working
    shared_ptr<SsdpDiscoverySession> s3;
    CHECK(disco.startDiscovery(req, &s3, 300) == NPSSDP_E_SUCCESS);
    CHECK(waitfor([&] { return observer->closedCount() == 2; }));
    CHECK(!disco.transportOpen());
}

static void testBadInterface()
{
    SsdpDiscoveryOptions options;
    options.ifname = "nosuchif0";
    SsdpDiscovery disco(options);
    auto observer = make_shared<RecordingObserver>();
    shared_ptr<SsdpDiscoverySession> session;
    CHECK(disco.startDiscovery(SsdpMSearchRequest(observer, SsdpSearchTarget::rootDevice()),
                               &session) == NPSSDP_E_INVALID_INTERFACE);
    CHECK(session == nullptr);
    CHECK(!disco.transportOpen());
}

int main(int, char **)
{
    testOpenReceiveReopen();
    testCloseBeforeTimers();
    testBadInterface();
    if (failures) {
        cerr << failures << " failure(s)\n";
        return 1;
    }
    cout << "test_socket: ok\n";
    return 0;
}
