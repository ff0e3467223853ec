/*******************************************************************************
 *
 * Copyright (c) 2020 Jean-Francois Dockes
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
#include "netif.h"

#include <algorithm>
#include <cstring>
#include <mutex>
#include <numeric>

#include <sys/types.h>
#include <arpa/inet.h>
#include <net/if.h>
#include <ifaddrs.h>
#ifdef __linux__
#include <netpacket/packet.h>
#else
#include <net/if_dl.h>
#endif

#include "npssdp.h"

namespace NetIF {

/* Protects the Interfaces singleton creation */
static std::mutex theInterfacesMutex;

class IPAddr::Internal {
public:
    bool ok{false};
    struct sockaddr_storage address{};
    struct sockaddr *saddr() {
        return reinterpret_cast<struct sockaddr*>(&address);
    }
};

IPAddr::IPAddr()
    : m(std::make_unique<Internal>())
{
}

IPAddr::IPAddr(const IPAddr& o)
    : m(std::make_unique<Internal>(*o.m))
{
}

IPAddr& IPAddr::operator=(const IPAddr& o)
{
    if (&o != this) {
        *m = *(o.m);
    }
    return *this;
}

IPAddr::IPAddr(const struct sockaddr *sa)
    : IPAddr()
{
    if (nullptr == sa) {
        return;
    }
    switch (sa->sa_family) {
    case AF_INET:
        memcpy(m->saddr(), sa, sizeof(struct sockaddr_in));
        m->ok = true;
        break;
    case AF_INET6:
        memcpy(m->saddr(), sa, sizeof(struct sockaddr_in6));
        m->ok = true;
        break;
    default:
        break;
    }
}

IPAddr::~IPAddr() = default;

bool IPAddr::ok() const
{
    return m->ok;
}

bool IPAddr::copyToStorage(struct sockaddr_storage *dest) const
{
    if (!m->ok) {
        *dest = {};
        return false;
    }
    memcpy(dest, &m->address, sizeof(struct sockaddr_storage));
    return true;
}

IPAddr::Family IPAddr::family() const
{
    if (m->ok) {
        return static_cast<IPAddr::Family>(m->address.ss_family);
    }
    return Family::Invalid;
}

std::string IPAddr::straddr() const
{
    if (!ok())
        return {};

    char buf[INET6_ADDRSTRLEN + 1];
    buf[0] = 0;
    switch (m->address.ss_family) {
    case AF_INET:
        inet_ntop(AF_INET,
                  &reinterpret_cast<struct sockaddr_in*>(m->saddr())->sin_addr,
                  buf, sizeof(buf));
        break;
    case AF_INET6:
        inet_ntop(AF_INET6,
                  &reinterpret_cast<struct sockaddr_in6*>(m->saddr())->sin6_addr,
                  buf, sizeof(buf));
        break;
    default:
        break;
    }
    return buf;
}

class Interface::Internal {
public:
    unsigned int flags{0};
    std::string name;
    std::string hwaddr;
    std::vector<IPAddr> addresses;
    void setflag(Interface::Flags f) {
        flags |= static_cast<unsigned int>(f);
    }
    void sethwaddr(const char *addr, int len) {
        bool isnull{true};
        for (int i = 0; i < len; i++) {
            if (addr[i] != 0) {
                isnull = false;
                break;
            }
        }
        if (isnull)
            return;
        hwaddr.assign(addr, len);
        setflag(Interface::Flags::HASHWADDR);
    }
};

Interface::Interface()
    : m(std::make_unique<Internal>())
{
}

Interface::Interface(const Interface& o)
    : m(std::make_unique<Internal>(*o.m))
{
}

Interface& Interface::operator=(const Interface& o)
{
    if (&o != this) {
        *m = *(o.m);
    }
    return *this;
}

Interface::Interface(const std::string& nm)
    : Interface()
{
    m->name = nm;
}

Interface::~Interface() = default;

bool Interface::hasflag(Flags f) const
{
    return (m->flags & static_cast<unsigned int>(f)) != 0;
}

std::string Interface::gethexhwaddr() const
{
    if (m->hwaddr.size() < 6) {
        return {};
    }
    char buf[20];
    snprintf(buf, sizeof(buf), "%02x:%02x:%02x:%02x:%02x:%02x",
             m->hwaddr[0]&0xFF, m->hwaddr[1]&0xFF, m->hwaddr[2]&0xFF,
             m->hwaddr[3]&0xFF, m->hwaddr[4]&0xFF, m->hwaddr[5]&0xFF);
    return buf;
}

const std::string& Interface::getname() const
{
    return m->name;
}

const std::vector<IPAddr>& Interface::getaddresses() const
{
    return m->addresses;
}

const IPAddr *Interface::firstipv4addr() const
{
    if (!hasflag(Flags::HASIPV4)) {
        return nullptr;
    }
    for (const auto& entry: m->addresses) {
        if (entry.family() == IPAddr::Family::IPV4) {
            return &entry;
        }
    }
    return nullptr;
}

std::ostream& Interface::print(std::ostream& out) const
{
    static const std::vector<std::pair<Flags, const char *>> flagnames{
        {Flags::HASIPV4, "HASIPV4"}, {Flags::HASIPV6, "HASIPV6"},
        {Flags::LOOPBACK, "LOOPBACK"}, {Flags::UP, "UP"},
        {Flags::MULTICAST, "MULTICAST"}, {Flags::HASHWADDR, "HASHWADDR"}};
    out << m->name << ": <";
    bool first{true};
    for (const auto& ent : flagnames) {
        if (hasflag(ent.first)) {
            if (!first)
                out << "|";
            out << ent.second;
            first = false;
        }
    }
    out << ">\n";
    if (!m->hwaddr.empty()) {
        out << "hwaddr " << gethexhwaddr() << "\n";
    }
    for (const auto& addr : m->addresses) {
        out << addr.straddr() << "\n";
    }
    return out;
}

class Interfaces::Internal {
public:
    Internal();
    std::vector<Interface> interfaces;
};

Interfaces::Internal::Internal()
{
    struct ifaddrs *ifap, *ifa;

    /* Get system interface addresses. */
    if (getifaddrs(&ifap) != 0) {
        NpssdpPrintf(NPSSDP_ERROR, NETIF, __FILE__, __LINE__,
                     "NetIF::Interfaces: getifaddrs failed\n");
        return;
    }
    std::vector<Interface> vifs;
    for (ifa = ifap; ifa != nullptr; ifa = ifa->ifa_next) {
        // Skip interfaces which are address-less.
        if (nullptr == ifa->ifa_addr) {
            NpssdpPrintf(NPSSDP_DEBUG, NETIF, __FILE__, __LINE__,
                         "NetIF::Interfaces: skipping %s: no address\n", ifa->ifa_name);
            continue;
        }
        auto ifit = std::find_if(vifs.begin(), vifs.end(),
                                 [ifa] (const Interface& ifr) {
                                     return ifr.m->name == ifa->ifa_name;});
        if (ifit == vifs.end()) {
            vifs.emplace_back(ifa->ifa_name);
            ifit = --vifs.end();
        }
        if (ifa->ifa_flags & IFF_LOOPBACK) {
            ifit->m->setflag(Interface::Flags::LOOPBACK);
        }
        if (ifa->ifa_flags & IFF_UP) {
            ifit->m->setflag(Interface::Flags::UP);
        }
        if (ifa->ifa_flags & IFF_MULTICAST) {
            ifit->m->setflag(Interface::Flags::MULTICAST);
        }
        switch (ifa->ifa_addr->sa_family) {
        case AF_INET:
            ifit->m->addresses.emplace_back(ifa->ifa_addr);
            ifit->m->setflag(Interface::Flags::HASIPV4);
            break;
        case AF_INET6:
            ifit->m->addresses.emplace_back(ifa->ifa_addr);
            ifit->m->setflag(Interface::Flags::HASIPV6);
            break;
#ifdef __linux__
        case AF_PACKET:
        {
            auto sll = reinterpret_cast<struct sockaddr_ll*>(ifa->ifa_addr);
            ifit->m->sethwaddr(reinterpret_cast<const char*>(sll->sll_addr), sll->sll_halen);
        }
        break;
#else
        case AF_LINK:
        {
            auto sdl = reinterpret_cast<struct sockaddr_dl*>(ifa->ifa_addr);
            ifit->m->sethwaddr(reinterpret_cast<const char*>(LLADDR(sdl)), sdl->sdl_alen);
        }
        break;
#endif
        default:
            break;
        }
    }
    interfaces.swap(vifs);
    freeifaddrs(ifap);
    NpssdpPrintf(NPSSDP_DEBUG, NETIF, __FILE__, __LINE__,
                 "NetIF::Interfaces: found %d interfaces\n",
                 static_cast<int>(interfaces.size()));
}

Interfaces::Interfaces()
    : m(std::make_unique<Internal>())
{
}

Interfaces::~Interfaces() = default;

Interfaces *Interfaces::theInterfaces()
{
    static Interfaces *theInterfacesP;
    std::scoped_lock lck(theInterfacesMutex);
    if (nullptr == theInterfacesP) {
        theInterfacesP = new Interfaces();
    }
    return theInterfacesP;
}

std::ostream& Interfaces::print(std::ostream& out)
{
    std::scoped_lock lck(theInterfacesMutex);
    for (const auto& entry : m->interfaces) {
        entry.print(out);
        out << "\n";
    }
    return out;
}

std::vector<Interface> Interfaces::select(const Filter& filt) const
{
    uint32_t yesflags = std::accumulate(
        filt.needs.begin(), filt.needs.end(), 0U,
        [](uint32_t yes, const Interface::Flags &f) {
            return yes | static_cast<unsigned int>(f); });
    uint32_t noflags = std::accumulate(
        filt.rejects.begin(), filt.rejects.end(), 0U,
        [](uint32_t no, const Interface::Flags &f) {
            return no | static_cast<unsigned int>(f); });

    std::vector<Interface> out;
    std::scoped_lock lck(theInterfacesMutex);
    std::copy_if(m->interfaces.begin(), m->interfaces.end(), std::back_inserter(out),
                 [=](const Interface &entry) {
                     return (entry.m->flags & yesflags) == yesflags &&
                         (entry.m->flags & noflags) == 0;});
    return out;
}

bool Interfaces::findByName(const std::string& nm, Interface *out) const
{
    std::scoped_lock lck(theInterfacesMutex);
    for (const auto& ifr : m->interfaces) {
        if (nm == ifr.m->name) {
            *out = ifr;
            return true;
        }
    }
    return false;
}

} /* namespace NetIF */
