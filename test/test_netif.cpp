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
#include "netif.h"

#include <stdio.h>
#include <stdlib.h>
#include <getopt.h>

#include <string>
#include <iostream>

using namespace std;

static int       op_flags;
#define OPT_i    0x1
#define OPT_s    0x2
static struct option long_options[] = {
    {"interface", required_argument, 0, 'i'},
    {"select", no_argument, 0, 's'},
    {0, 0, 0, 0}
};

static char *thisprog;
static char usage [] =
    " Default: dump interface configuration\n"
    "-i <ifname>  : show the named interface and its first IPv4 address.\n"
    "-s           : list the interfaces usable for multicast searches.\n"
    ;

static void
Usage(void)
{
    fprintf(stderr, "%s: usage:\n%s", thisprog, usage);
    exit(1);
}

int main(int argc, char *argv[])
{
    thisprog = argv[0];
    int ret;
    std::string ifname;
    while ((ret = getopt_long(argc, argv, "i:s",
                              long_options, NULL)) != -1) {
        switch (ret) {
        case 'i': ifname = optarg; op_flags |= OPT_i; break;
        case 's': op_flags |= OPT_s; break;
        default:
            Usage();
        }
    }
    NetIF::Interfaces *ifs = NetIF::Interfaces::theInterfaces();
    if (op_flags == 0) {
        ifs->print(std::cout);
        // Any system has at least a loopback with an address
        NetIF::Interfaces::Filter filt;
        if (ifs->select(filt).empty()) {
            std::cerr << "No interfaces found\n";
            return 1;
        }
    } else if (op_flags & OPT_i) {
        NetIF::Interface netif;
        if (!ifs->findByName(ifname, &netif)) {
            std::cerr << "No interface named [" << ifname << "]\n";
            return 1;
        }
        netif.print(std::cout);
        auto addr = netif.firstipv4addr();
        std::cout << "\nfirst IPv4 address: " << (addr ? addr->straddr() : "none") << "\n";
    } else if (op_flags & OPT_s) {
        NetIF::Interfaces::Filter filt;
        filt.needs = {NetIF::Interface::Flags::HASIPV4, NetIF::Interface::Flags::UP,
                      NetIF::Interface::Flags::MULTICAST};
        filt.rejects = {NetIF::Interface::Flags::LOOPBACK};
        std::vector<NetIF::Interface> myifs = ifs->select(filt);
        cout << "Selected:\n";
        for (const auto& entry : myifs)
            entry.print(std::cout);
    } else {
        Usage();
    }
    return 0;
}
