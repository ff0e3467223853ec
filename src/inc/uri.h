/*******************************************************************************
 *
 * Copyright (c) 2000-2003 Intel Corporation 
 * All rights reserved. 
 * Copyright (c) 2012 France Telecom All rights reserved. 
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

#ifndef NPSSDP_URI_H
#define NPSSDP_URI_H

/*!
 * \file
 *
 * \brief URL parsing, used to validate the LOCATION of discovery
 * responses.
 */

#include <string>

#include <sys/types.h>
#include <sys/socket.h>

#include "npssdp.h"

/*!
 * \brief Represents a host port: e.g. "127.127.0.1:80", "www.recoll.org"
 */
struct hostport_type {
    hostport_type() {
        IPaddress = {};
    }
    /*! Full "host:port" or "host" text. */
    std::string text;
    /*! Separate host copy. IPv6 brackets are removed. */
    std::string strhost;
    /*! Set to true by parse_hostport if strhost is a host name instead
     *  of an IP address */
    bool hostisname{false};
    /*! Possibly empty separated port string */
    std::string strport;
    /*! Address as computed by inet_pton() from a numeric address.
     * ss_family is AF_UNSPEC for a host name, which is not resolved. */
    struct sockaddr_storage IPaddress;
};

/*!
 * \brief Parses a string representing a host and port (e.g. "127.127.0.1:80"
 * or "localhost") and fills out a hostport_type struct.
 *
 * The host portion can be an IPv4 address, an IPv6 address within
 * brackets, or a host name. The port defaults to 80.
 *
 * \return The number of characters used to parse the host and port (> 0),
 *   or NPSSDP_E_INVALID_URL.
 */
int parse_hostport(
    /*! [in] e.g. 192.168.4.1:49152, [fe80::224:1dff:fede:6868]:49152,
      www.recoll.org */
    const char *in,
    /*! [out] Parsed output. */
    hostport_type *out
    );

enum uriType  {
    URITP_ABSOLUTE,
    URITP_RELATIVE
};

enum pathType {
    ABS_PATH,
    REL_PATH,
    OPAQUE_PART
};

/*! Parsed URI. */
struct uri_type {
    enum uriType type;
    std::string scheme;
    enum pathType path_type;
    std::string path;
    std::string query;
    std::string fragment;
    hostport_type hostport;
};

/*!
 * \brief Parses an URI (RFC 2396).
 *
 * \return NPSSDP_E_SUCCESS or NPSSDP_E_INVALID_URL if the host part could
 *   not be parsed.
 */
int parse_uri(const std::string& in, uri_type *out);

/*!
 * \brief Check that a string is an absolute URL with a scheme and a
 * host part, like the LOCATION of a discovery response.
 */
bool is_absolute_url(const std::string& in);

#endif /* NPSSDP_URI_H */
