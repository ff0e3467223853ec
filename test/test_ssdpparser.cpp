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
#include "ssdpparser.h"

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

static const string okresponse(
    "HTTP/1.1 200 OK\r\n"
    "CACHE-CONTROL: max-age=100\r\n"
    "DATE: Tue, 20 Oct 2026 10:00:00 GMT\r\n"
    "EXT:\r\n"
    "LOCATION: http://192.168.1.20:8200/rootDesc.xml\r\n"
    "SERVER: Debian/12 DLNADOC/1.50 UPnP/1.0 MiniDLNA/1.3.0\r\n"
    "ST: urn:schemas-upnp-org:service:ContentDirectory:1\r\n"
    "USN: uuid:4d696e69-444c-164e-9d41-b827eb54e939::"
    "urn:schemas-upnp-org:service:ContentDirectory:1\r\n"
    "Content-Length: 0\r\n"
    "\r\n");

static void testTokenize()
{
    SSDPMessageParser parser(okresponse);
    CHECK(parser.parse());
    CHECK(parser.firstToken == "HTTP/1.1");
    CHECK(parser.headers.size() == 8);
    CHECK(parser.headers["ext"] == "");
    CHECK(parser.headers["Location"] == "http://192.168.1.20:8200/rootDesc.xml");
    CHECK(parser.headers["content-length"] == "0");

    string empty(" \r\n\t \r\n");
    SSDPMessageParser p2(empty);
    CHECK(!p2.parse());
}

static void testLineHandling()
{
    // Bare LF line ends, tab separators, garbage lines, repeated keys
    string packet(
        "\r\n  M-SEARCH * HTTP/1.1\n"
        "HOST:\t239.255.255.250:1900\n"
        "nocolonhere\n"
        ": no key\n"
        "MX:   2   \n"
        "mx: 3\n"
        "ST ssdp:all\n");
    SSDPMessageParser parser(packet);
    CHECK(parser.parse());
    CHECK(parser.firstToken == "M-SEARCH");
    CHECK(parser.headers.size() == 3);
    CHECK(parser.headers["HOST"] == "239.255.255.250:1900");
    CHECK(parser.headers["MX"] == "3");
    // Last spelling wins too
    CHECK(parser.headers.find("mx")->first == "mx");
    CHECK(parser.headers["ST"] == "ssdp:all");
    CHECK(parser.headers.find("nocolonhere") == parser.headers.end());
}

static void testResponseMessage()
{
    SsdpMessage msg;
    CHECK(SSDPMessageParser::parseMessage(okresponse, &msg));
    CHECK(msg.kind == SsdpMessage::Kind::SearchResponse);
    const SsdpMSearchResponse& resp = msg.response;
    CHECK(resp.searchTarget() == SsdpSearchTarget::serviceContentDirectory());
    CHECK(resp.location() == "http://192.168.1.20:8200/rootDesc.xml");
    CHECK(resp.maxAge() == 100);
    CHECK(resp.hasDate());
    CHECK(resp.server() == "Debian/12 DLNADOC/1.50 UPnP/1.0 MiniDLNA/1.3.0");
    CHECK(resp.usn().find("uuid:4d696e69") == 0);
    CHECK(resp.otherHeaders().size() == 1);
}

static void testRejected()
{
    SsdpMessage msg;
    CHECK(!SSDPMessageParser::parseMessage("", &msg));
    CHECK(!SSDPMessageParser::parseMessage("\r\n\r\n", &msg));
    CHECK(!SSDPMessageParser::parseMessage(okresponse, nullptr));

    // Requests and announcements are not turned into messages
    CHECK(!SSDPMessageParser::parseMessage(
              "M-SEARCH * HTTP/1.1\r\nHOST: 239.255.255.250:1900\r\n"
              "MAN: \"ssdp:discover\"\r\nMX: 1\r\nST: ssdp:all\r\n\r\n", &msg));
    CHECK(!SSDPMessageParser::parseMessage(
              "NOTIFY * HTTP/1.1\r\nHOST: 239.255.255.250:1900\r\n"
              "NT: upnp:rootdevice\r\nNTS: ssdp:alive\r\n"
              "LOCATION: http://10.0.0.3/d.xml\r\nUSN: uuid:x::upnp:rootdevice\r\n"
              "\r\n", &msg));
    CHECK(!SSDPMessageParser::parseMessage("HTTP/1.0 200 OK\r\n" +
                                           okresponse.substr(17), &msg));

    const char *required[] = {"EXT:", "LOCATION:", "ST:", "USN:"};
    for (const auto key : required) {
        string packet = okresponse;
        auto pos = packet.find(string("\r\n") + key);
        auto end = packet.find("\r\n", pos + 2);
        packet.erase(pos, end - pos);
        if (SSDPMessageParser::parseMessage(packet, &msg)) {
            cerr << "accepted response without " << key << "\n";
            failures++;
        }
    }
}

static void testDuplicateLastWins()
{
    string packet(okresponse);
    packet.insert(packet.find("Content-Length"),
                  "LOCATION: http://192.168.1.21:8200/rootDesc.xml\r\n");
    SsdpMessage msg;
    CHECK(SSDPMessageParser::parseMessage(packet, &msg));
    CHECK(msg.response.location() == "http://192.168.1.21:8200/rootDesc.xml");
}

int main(int, char **)
{
    testTokenize();
    testLineHandling();
    testResponseMessage();
    testRejected();
    testDuplicateLastWins();
    if (failures) {
        cerr << failures << " failure(s)\n";
        return 1;
    }
    cout << "test_ssdpparser: ok\n";
    return 0;
}
