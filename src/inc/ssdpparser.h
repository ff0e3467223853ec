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

#ifndef _SSDPPARSER_H_
#define _SSDPPARSER_H_

#include <chrono>
#include <ostream>
#include <string>

#include "SsdpMessage.h"

/*!
 * Parser for a received SSDP datagram.
 *
 * The first whitespace-delimited token (status line or method) is
 * extracted, then the header lines. A header line is a key, a separator
 * made of one or more ':', space or tab characters, and a value, which
 * can be empty. Lines without a separator are ignored, and a repeated key
 * keeps the last value.
 *
 * Only responses ("HTTP/1.1" first token) are turned into messages.
 */
class SSDPMessageParser {
public:
    explicit SSDPMessageParser(const std::string& packet) : m_packet(packet) {}
    SSDPMessageParser(const SSDPMessageParser&) = delete;
    SSDPMessageParser& operator=(const SSDPMessageParser&) = delete;

    /*! Tokenize the packet. Returns false if there is no first token. */
    bool parse();

    /*! Build the typed message after a successful parse(). Returns false
     *  for unsupported kinds and invalid responses. */
    bool message(SsdpMessage *out,
                 std::chrono::system_clock::time_point now =
                 std::chrono::system_clock::now()) const;

    /*! parse() + message() */
    static bool parseMessage(const std::string& packet, SsdpMessage *out);

    void dump(std::ostream& os) const;

    // Results, set by parse()
    std::string firstToken;
    SsdpHeaders headers;

private:
    const std::string& m_packet;
};

#endif /* _SSDPPARSER_H_ */
