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
/* Command line driver: search the local network and print the responses */

#include <stdio.h>
#include <stdlib.h>
#include <getopt.h>

#include <chrono>
#include <iostream>
#include <memory>
#include <mutex>
#include <string>
#include <thread>

#include "npssdp.h"
#include "SsdpDiscovery.h"

using namespace std;

static int       op_flags;
#define OPT_i    0x1
#define OPT_l    0x2

static struct option long_options[] = {
    {"interface", required_argument, 0, 'i'},
    {"port", required_argument, 0, 'p'},
    {"target", required_argument, 0, 't'},
    {"wait", required_argument, 0, 'w'},
    {"mx", required_argument, 0, 'm'},
    {"ttl", required_argument, 0, 'T'},
    {"loop", no_argument, 0, 'l'},
    {"debug", required_argument, 0, 'd'},
    {0, 0, 0, 0}
};

static char *thisprog;
static char usage [] =
    "[options]\n"
    "  -i <ifname>  : interface to use. Default: first usable one.\n"
    "  -p <port>    : local port. Default: ephemeral.\n"
    "  -t <target>  : search target, e.g. upnp:rootdevice or\n"
    "                 urn:schemas-upnp-org:service:ContentDirectory:1.\n"
    "                 Default: ssdp:all\n"
    "  -w <secs>    : time to search for. Default 5.\n"
    "  -m <secs>    : MX value. Default 1.\n"
    "  -T <ttl>     : multicast TTL. Default 2.\n"
    "  -l           : loop the multicast back to the local host.\n"
    "  -d <level>   : log level, 0 (critical) to 5 (all).\n"
    ;

static void
Usage(void)
{
    fprintf(stderr, "%s: usage: %s %s", thisprog, thisprog, usage);
    exit(1);
}

class PrintingObserver : public SsdpDiscoveryObserver {
public:
    void discoveredDevice(const SsdpMSearchResponse& r,
                          const std::shared_ptr<SsdpDiscoverySession>&) override {
        std::scoped_lock lck(m_mutex);
        cout << "Device:  " << r << endl;
    }
    void discoveredService(const SsdpMSearchResponse& r,
                           const std::shared_ptr<SsdpDiscoverySession>&) override {
        std::scoped_lock lck(m_mutex);
        cout << "Service: " << r << endl;
    }
    void closedSession(const std::shared_ptr<SsdpDiscoverySession>& s) override {
        std::scoped_lock lck(m_mutex);
        cout << "Session " << s->id() << " closed" << endl;
    }
private:
    std::mutex m_mutex;
};

int main(int argc, char *argv[])
{
    thisprog = argv[0];
    std::string ifname;
    std::string target("ssdp:all");
    int port = 0;
    int waitsecs = 5;
    int mx = 1;
    int ttl = 2;
    int ret;

    while ((ret = getopt_long(argc, argv, "i:p:t:w:m:T:ld:",
                              long_options, NULL)) != -1) {
        switch (ret) {
        case 'i': ifname = optarg; op_flags |= OPT_i; break;
        case 'p': port = atoi(optarg); break;
        case 't': target = optarg; break;
        case 'w': waitsecs = atoi(optarg); break;
        case 'm': mx = atoi(optarg); break;
        case 'T': ttl = atoi(optarg); break;
        case 'l': op_flags |= OPT_l; break;
        case 'd': NpssdpSetLogLevel(static_cast<Npssdp_LogLevel>(atoi(optarg))); break;
        default: Usage();
        }
    }
    if (optind != argc || port < 0 || port > 65535 || waitsecs <= 0 || mx < 1)
        Usage();

    SsdpSearchTarget st;
    if (!SsdpSearchTarget::parse(target, &st)) {
        cerr << "Bad search target: " << target << "\n";
        return 1;
    }

    unsigned int flags = (op_flags & OPT_l) ? NPSSDP_FLAG_MULTICAST_LOOP : NPSSDP_FLAG_NONE;
    ret = NpssdpInitWithOptions(ifname.c_str(), static_cast<unsigned short>(port), flags,
                                NPSSDP_OPTION_TTL, ttl, NPSSDP_OPTION_END);
    if (ret != NPSSDP_E_SUCCESS) {
        cerr << "NpssdpInit failed: " << NpssdpGetErrorMessage(ret) << "\n";
        return 1;
    }

    SsdpMSearchRequest request(std::make_shared<PrintingObserver>(), st, mx,
                               {{"USER-AGENT", "Linux UPnP/1.1 ssdpsearch/1.0"}});
    std::shared_ptr<SsdpDiscoverySession> session;
    ret = NpssdpGetDefaultDiscovery()->startDiscovery(request, &session, waitsecs * 1000);
    if (ret != NPSSDP_E_SUCCESS) {
        cerr << "startDiscovery failed: " << NpssdpGetErrorMessage(ret) << "\n";
        NpssdpFinish();
        return 1;
    }
    while (session->phase() != SsdpDiscoverySession::Phase::Closed) {
        std::this_thread::sleep_for(std::chrono::milliseconds(200));
    }
    cout << session->responses().size() << " distinct responses\n";
    session.reset();
    NpssdpFinish();
    return 0;
}
