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
#include "uri.h"
#include "npssdp.h"

#include <arpa/inet.h>
#include <netinet/in.h>

#include <iostream>
#include <string>

using namespace std;

static int failures;

#define CHECK(X) do {                                                   \
        if (!(X)) {                                                     \
            cerr << __FILE__ << ":" << __LINE__ << ": check failed: " #X "\n"; \
            failures++;                                                 \
        }                                                               \
    } while (0)

static void testHostPort()
{
    hostport_type hp;
    int ret = parse_hostport("192.168.4.1:49152/desc.xml", &hp);
    CHECK(ret == 17);
    CHECK(hp.text == "192.168.4.1:49152");
    CHECK(hp.strhost == "192.168.4.1");
    CHECK(hp.strport == "49152");
    CHECK(!hp.hostisname);
    CHECK(hp.IPaddress.ss_family == AF_INET);
    auto sa4 = reinterpret_cast<struct sockaddr_in *>(&hp.IPaddress);
    CHECK(ntohs(sa4->sin_port) == 49152);

    ret = parse_hostport("[fe80::224:1dff:fede:6868]:8080", &hp);
    CHECK(ret > 0);
    CHECK(hp.strhost == "fe80::224:1dff:fede:6868");
    CHECK(hp.IPaddress.ss_family == AF_INET6);

    ret = parse_hostport("media.example.org", &hp);
    CHECK(ret > 0);
    CHECK(hp.hostisname);
    CHECK(hp.strport.empty());
    CHECK(hp.IPaddress.ss_family == AF_UNSPEC);

    CHECK(parse_hostport("", &hp) == NPSSDP_E_INVALID_URL);
    CHECK(parse_hostport("10.0.0.1:99999", &hp) == NPSSDP_E_INVALID_URL);
    CHECK(parse_hostport("[fe80::1", &hp) == NPSSDP_E_INVALID_URL);
}

static void testUri()
{
    uri_type uri;
    CHECK(parse_uri("http://10.0.0.2:1400/xml/device_description.xml?a=b#frag",
                    &uri) == NPSSDP_E_SUCCESS);
    CHECK(uri.type == URITP_ABSOLUTE);
    CHECK(uri.scheme == "http");
    CHECK(uri.hostport.text == "10.0.0.2:1400");
    CHECK(uri.path == "/xml/device_description.xml");
    CHECK(uri.path_type == ABS_PATH);
    CHECK(uri.query == "a=b");
    CHECK(uri.fragment == "frag");

    CHECK(parse_uri("/desc.xml", &uri) == NPSSDP_E_SUCCESS);
    CHECK(uri.type == URITP_RELATIVE);
    CHECK(uri.hostport.strhost.empty());

    CHECK(parse_uri("http://", &uri) == NPSSDP_E_INVALID_URL);
}

static void testAbsoluteUrl()
{
    CHECK(is_absolute_url("http://192.168.1.5:49152/description.xml"));
    CHECK(is_absolute_url("http://[fe80::1]:80/d.xml"));
    CHECK(is_absolute_url("http://nas.local/d.xml"));
    // Host names are not looked up
    CHECK(is_absolute_url("http://no-such-host.invalid:8200/rootDesc.xml"));
    CHECK(!is_absolute_url(""));
    CHECK(!is_absolute_url("/description.xml"));
    CHECK(!is_absolute_url("http:/description.xml"));
    CHECK(!is_absolute_url("http://"));
    CHECK(!is_absolute_url("1http://host/"));
}

int main(int, char **)
{
    testHostPort();
    testUri();
    testAbsoluteUrl();
    if (failures) {
        cerr << failures << " failure(s)\n";
        return 1;
    }
    cout << "test_uri: ok\n";
    return 0;
}
