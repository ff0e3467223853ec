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
#include "SsdpMessage.h"
#include "SsdpDiscovery.h"

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

static void testBasicMessage()
{
    SsdpMSearchRequest req(nullptr, SsdpSearchTarget::serviceContentDirectory());
    CHECK(req.maxWait() == 1);
    CHECK(req.message() ==
          "M-SEARCH * HTTP/1.1\r\n"
          "HOST: 239.255.255.250:1900\r\n"
          "MAN: ssdp:discover\r\n"
          "MX: 1\r\n"
          "ST: urn:schemas-upnp-org:service:ContentDirectory:1\r\n");
}

static void testExtraHeaders()
{
    SsdpMSearchRequest::HeaderList extra{
        {"USER-AGENT", "Linux/5 UPnP/2.0 npssdp/1.0"},
        {"host", "10.0.0.1:1900"},
        {"Mx", "5"},
        {"CPFN.UPNP.ORG", "first"},
        {"cpfn.upnp.org", "second"},
        {"St", "ssdp:all"},
        {"MAN", "\"ssdp:other\""},
    };
    SsdpMSearchRequest req(make_shared<SsdpDiscoveryObserver>(),
                           SsdpSearchTarget::rootDevice(), 3, extra);
    CHECK(req.extraHeaders().size() == 2);
    CHECK(req.observer() != nullptr);
    CHECK(req.message() ==
          "M-SEARCH * HTTP/1.1\r\n"
          "HOST: 239.255.255.250:1900\r\n"
          "MAN: ssdp:discover\r\n"
          "MX: 3\r\n"
          "ST: upnp:rootdevice\r\n"
          "USER-AGENT: Linux/5 UPnP/2.0 npssdp/1.0\r\n"
          "CPFN.UPNP.ORG: first\r\n");
}

static void testAnnouncementValues()
{
    CHECK(string(SsdpAnnouncementValue(SsdpAnnouncement::Discover)) == "ssdp:discover");
    CHECK(string(SsdpAnnouncementValue(SsdpAnnouncement::Alive)) == "ssdp:alive");
    CHECK(string(SsdpAnnouncementValue(SsdpAnnouncement::ByeBye)) == "ssdp:byebye");
}

static SsdpHeaders responseHeaders()
{
    SsdpHeaders h;
    h["CACHE-CONTROL"] = "max-age=1800";
    h["DATE"] = "Sun, 06 Nov 1994 08:49:37 GMT";
    h["EXT"] = "";
    h["LOCATION"] = "http://192.168.1.5:49152/description.xml";
    h["SERVER"] = "Linux/5.10 UPnP/1.0 MediaServer/1.0";
    h["ST"] = "upnp:rootdevice";
    h["USN"] = "uuid:1234::upnp:rootdevice";
    h["X-User-Agent"] = "redsonic";
    return h;
}

static void testResponse()
{
    auto now = chrono::system_clock::now();
    SsdpMSearchResponse resp;
    CHECK(SsdpMSearchResponse::fromHeaders(responseHeaders(), &resp, now));
    CHECK(resp.hasCacheControl());
    CHECK(resp.maxAge() == 1800);
    CHECK(resp.expiry() == now + chrono::seconds(1800));
    CHECK(resp.hasDate());
    CHECK(resp.date() == 784111777);
    CHECK(resp.ext());
    CHECK(resp.location() == "http://192.168.1.5:49152/description.xml");
    CHECK(resp.hasServer());
    CHECK(resp.searchTarget() == SsdpSearchTarget::rootDevice());
    CHECK(resp.usn() == "uuid:1234::upnp:rootdevice");
    CHECK(resp.otherHeaders().size() == 1);
    CHECK(resp.otherHeaders().find("x-user-agent") != resp.otherHeaders().end());
}

static void testResponseOptionalFields()
{
    SsdpHeaders h = responseHeaders();
    h["CACHE-CONTROL"] = "no-cache=\"Ext\", Max-Age = 60";
    h.erase("SERVER");
    h["DATE"] = "yesterday";
    SsdpMSearchResponse resp;
    CHECK(SsdpMSearchResponse::fromHeaders(h, &resp));
    CHECK(resp.hasCacheControl());
    CHECK(resp.maxAge() == 60);
    CHECK(!resp.hasServer());
    // Unparseable date stays with the other headers
    CHECK(!resp.hasDate());
    CHECK(resp.otherHeaders().find("DATE") != resp.otherHeaders().end());

    h.erase("CACHE-CONTROL");
    CHECK(SsdpMSearchResponse::fromHeaders(h, &resp));
    CHECK(!resp.hasCacheControl());
}

static void testResponseRequiredFields()
{
    const char *required[] = {"EXT", "LOCATION", "ST", "USN"};
    for (const auto key : required) {
        SsdpHeaders h = responseHeaders();
        h.erase(key);
        SsdpMSearchResponse resp;
        if (SsdpMSearchResponse::fromHeaders(h, &resp)) {
            cerr << "response accepted without " << key << "\n";
            failures++;
        }
        CHECK(resp.usn().empty());
    }

    const char *badlocations[] = {"", "/description.xml", "description.xml",
                                  "http://", "not a url"};
    for (const auto loc : badlocations) {
        SsdpHeaders h = responseHeaders();
        h["LOCATION"] = loc;
        SsdpMSearchResponse resp;
        if (SsdpMSearchResponse::fromHeaders(h, &resp)) {
            cerr << "response accepted with LOCATION [" << loc << "]\n";
            failures++;
        }
    }

    SsdpHeaders h = responseHeaders();
    h["ST"] = "urn:schemas-upnp-org:device:Bad";
    SsdpMSearchResponse resp;
    CHECK(!SsdpMSearchResponse::fromHeaders(h, &resp));
    CHECK(!SsdpMSearchResponse::fromHeaders(responseHeaders(), nullptr));
}

static void testResponseIdentity()
{
    SsdpMSearchResponse a, b, c;
    SsdpHeaders h = responseHeaders();
    CHECK(SsdpMSearchResponse::fromHeaders(h, &a));
    h["SERVER"] = "Other/2.0";
    h["CACHE-CONTROL"] = "max-age=10";
    CHECK(SsdpMSearchResponse::fromHeaders(h, &b));
    CHECK(a == b);
    CHECK(!(a < b) && !(b < a));
    h["LOCATION"] = "http://192.168.1.6:49152/description.xml";
    CHECK(SsdpMSearchResponse::fromHeaders(h, &c));
    CHECK(a != c);
    CHECK(a < c || c < a);
}

int main(int, char **)
{
    testBasicMessage();
    testExtraHeaders();
    testAnnouncementValues();
    testResponse();
    testResponseOptionalFields();
    testResponseRequiredFields();
    testResponseIdentity();
    if (failures) {
        cerr << failures << " failure(s)\n";
        return 1;
    }
    cout << "test_msearch: ok\n";
    return 0;
}
