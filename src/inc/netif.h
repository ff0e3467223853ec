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
#ifndef _NETIF_H_INCLUDED_
#define _NETIF_H_INCLUDED_

/* Network interface enumeration, used to choose the interface the
 * searches are multicast on. */

#include <memory>
#include <ostream>
#include <string>
#include <vector>

#include <sys/socket.h>
#include <netinet/in.h>

namespace NetIF {

/** Network address (IPv4 or IPv6). */
class IPAddr {
public:
    enum class Family {Invalid = -1, IPV4 = AF_INET, IPV6 = AF_INET6};
    IPAddr();
    /** Build from binary address in network byte order */
    explicit IPAddr(const struct sockaddr *sa);
    IPAddr(const IPAddr&);
    IPAddr& operator=(const IPAddr&);
    ~IPAddr();

    /** Check constructor success */
    bool ok() const;
    Family family() const;
    /** Zeroes out up to sizeof(sockaddr_storage) and copies */
    bool copyToStorage(struct sockaddr_storage *dest) const;

    /** Convert to textual representation */
    std::string straddr() const;

    class Internal;
private:
    std::unique_ptr<Internal> m;
};

/** Network interface. */
class Interface {
public:
    enum class Flags {NONE = 0, HASIPV4 = 1, HASIPV6 = 2, LOOPBACK=4,
                      UP=8, MULTICAST=16, HASHWADDR=32};
    Interface();
    explicit Interface(const std::string &nm);
    ~Interface();
    Interface(const Interface&);
    Interface& operator=(const Interface&);

    const std::string& getname() const;
    /** Return hardware address in traditional colon-separated hex */
    std::string gethexhwaddr() const;
    bool hasflag(Flags f) const;
    /** Return the first ipv4 address if any, or nullptr */
    const IPAddr *firstipv4addr() const;
    /** Return the interface addresses */
    const std::vector<IPAddr>& getaddresses() const;

    /** Print out, a bit like "ip addr" output */
    std::ostream& print(std::ostream&) const;

    class Internal;
    friend class Interfaces;
private:
    std::unique_ptr<Internal> m;
};

/** Represents the system's network interfaces. */
class Interfaces {
public:
    /** Return the Interfaces singleton after possibly building it by
     *  querying the system */
    static Interfaces *theInterfaces();

    /** Find interface by name. Returns a copy, check the name for
     *  success. */
    bool findByName(const std::string& nm, Interface *out) const;

    /** Argument to the select() method: flags which we want or don't */
    struct Filter {
        std::vector<Interface::Flags> needs;
        std::vector<Interface::Flags> rejects;
    };
    /** Return Interface objects satisfying the criteria in f. */
    std::vector<Interface> select(const Filter& f) const;

    /** Print out, a bit like "ip addr" output */
    std::ostream& print(std::ostream&);

    ~Interfaces();
    Interfaces(const Interfaces &) = delete;
    Interfaces& operator=(const Interfaces &) = delete;
    class Internal;
private:
    Interfaces();
    std::unique_ptr<Internal> m;
};

} /* namespace NetIF */

#endif /* _NETIF_H_INCLUDED_ */
