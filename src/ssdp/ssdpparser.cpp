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


#include "ssdpparser.h"

#include <cstring>

#include "npssdp.h"
#include "smallut.h"

static const char *tokensep = " \t\r\n";
static const char *headersep = ": \t";
static const char *response_token = "HTTP/1.1";

bool SSDPMessageParser::parse()
{
    firstToken.clear();
    headers.clear();

    std::string::size_type pos = m_packet.find_first_not_of(tokensep);
    if (pos == std::string::npos) {
        return false;
    }
    std::string::size_type end = m_packet.find_first_of(tokensep, pos);
    firstToken = m_packet.substr(pos, end == std::string::npos ? end : end - pos);

    // Skip the rest of the first line
    pos = m_packet.find('\n', pos);
    while (pos != std::string::npos) {
        pos++;
        end = m_packet.find('\n', pos);
        std::string line = m_packet.substr(
            pos, end == std::string::npos ? std::string::npos : end - pos);
        pos = end;
        if (!line.empty() && line.back() == '\r') {
            line.pop_back();
        }
        std::string::size_type sep = line.find_first_of(headersep);
        if (sep == std::string::npos || sep == 0) {
            if (!line.empty()) {
                NpssdpPrintf(NPSSDP_ALL, SSDP, __FILE__, __LINE__,
                             "SSDP parser: skipping line [%s]\n", line.c_str());
            }
            continue;
        }
        std::string key = line.substr(0, sep);
        std::string value;
        std::string::size_type vstart = line.find_first_not_of(headersep, sep);
        if (vstart != std::string::npos) {
            value = line.substr(vstart);
            trimstring(value);
        }
        // map::operator[] would keep the first spelling of the key
        headers.erase(key);
        headers.emplace(key, value);
    }
    return true;
}

bool SSDPMessageParser::message(
    SsdpMessage *out, std::chrono::system_clock::time_point now) const
{
    if (firstToken != response_token) {
        NpssdpPrintf(NPSSDP_DEBUG, SSDP, __FILE__, __LINE__,
                     "SSDP parser: unsupported message type [%s]\n", firstToken.c_str());
        return false;
    }
    SsdpMSearchResponse response;
    if (!SsdpMSearchResponse::fromHeaders(headers, &response, now)) {
        return false;
    }
    out->kind = SsdpMessage::Kind::SearchResponse;
    out->response = std::move(response);
    return true;
}

bool SSDPMessageParser::parseMessage(const std::string& packet, SsdpMessage *out)
{
    if (nullptr == out || packet.empty()) {
        return false;
    }
    SSDPMessageParser parser(packet);
    if (!parser.parse()) {
        NpssdpPrintf(NPSSDP_DEBUG, SSDP, __FILE__, __LINE__,
                     "SSDP parser: no first token\n");
        return false;
    }
    return parser.message(out);
}

void SSDPMessageParser::dump(std::ostream& os) const
{
    os << "first token [" << firstToken << "]\n";
    for (const auto& ent : headers) {
        os << "  [" << ent.first << "] -> [" << ent.second << "]\n";
    }
}
