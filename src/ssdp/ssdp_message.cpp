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


#include "SsdpMessage.h"

#include <cstdlib>
#include <cstring>
#include <ctime>
#include <ostream>
#include <sstream>

#include "npssdp.h"
#include "smallut.h"
#include "ssdplib.h"
#include "uri.h"

bool SsdpHeaderLess::operator()(const std::string& a, const std::string& b) const
{
    return stringicmp(a, b) < 0;
}

namespace SsdpHeaderKeys {
const char *cacheControl = "CACHE-CONTROL";
const char *date = "DATE";
const char *ext = "EXT";
const char *host = "HOST";
const char *location = "LOCATION";
const char *man = "MAN";
const char *mx = "MX";
const char *nt = "NT";
const char *nts = "NTS";
const char *st = "ST";
const char *server = "SERVER";
const char *usn = "USN";
}

const char *SsdpAnnouncementValue(SsdpAnnouncement a)
{
    switch (a) {
    case SsdpAnnouncement::Discover: return "ssdp:discover";
    case SsdpAnnouncement::Alive: return "ssdp:alive";
    case SsdpAnnouncement::ByeBye: return "ssdp:byebye";
    }
    return "";
}

SsdpMSearchRequest::SsdpMSearchRequest(
    std::shared_ptr<SsdpDiscoveryObserver> observer,
    const SsdpSearchTarget& target, int maxWait, const HeaderList& extraHeaders)
    : m_observer(std::move(observer)), m_target(target), m_maxWait(maxWait)
{
    static const char *reserved[] = {
        SsdpHeaderKeys::host, SsdpHeaderKeys::man, SsdpHeaderKeys::mx,
        SsdpHeaderKeys::st};
    SsdpHeaders seen;
    for (const auto& hdr : extraHeaders) {
        bool skip{false};
        for (const auto key : reserved) {
            if (stringicmp(hdr.first, key) == 0) {
                skip = true;
                break;
            }
        }
        // First occurrence wins
        if (skip || seen.find(hdr.first) != seen.end()) {
            continue;
        }
        seen[hdr.first] = hdr.second;
        m_extraHeaders.push_back(hdr);
    }
}

std::string SsdpMSearchRequest::message() const
{
    std::ostringstream str;

    str << "M-SEARCH * HTTP/1.1\r\n";
    str << SsdpHeaderKeys::host << ": " << SSDP_HOSTPORT << "\r\n";
    str << SsdpHeaderKeys::man << ": " <<
        SsdpAnnouncementValue(SsdpAnnouncement::Discover) << "\r\n";
    str << SsdpHeaderKeys::mx << ": " << m_maxWait << "\r\n";
    str << SsdpHeaderKeys::st << ": " << m_target.toString() << "\r\n";
    for (const auto& hdr : m_extraHeaders) {
        str << hdr.first << ": " << hdr.second << "\r\n";
    }
    return str.str();
}

// Extract the max-age value from a CACHE-CONTROL header. Other directives
// may be present.
static bool parseMaxAge(const std::string& value, int *maxage)
{
    SimpleRegexp re("max-age[ \t]*=[ \t]*([0-9]+)", SimpleRegexp::SRE_ICASE, 1);
    if (!re.ok() || !re.simpleMatch(value)) {
        return false;
    }
    std::string digits = re.getMatch(value, 1);
    if (digits.empty() || digits.size() > 9) {
        return false;
    }
    *maxage = atoi(digits.c_str());
    return true;
}

// RFC 1123 date, e.g.: Sun, 06 Nov 1994 08:49:37 GMT
static bool parseHttpDate(const std::string& value, time_t *out)
{
    struct tm tm;
    memset(&tm, 0, sizeof(tm));
    const char *cp = strptime(value.c_str(), "%a, %d %b %Y %H:%M:%S GMT", &tm);
    if (nullptr == cp || *cp != 0) {
        return false;
    }
    *out = portable_timegm(&tm);
    return *out != static_cast<time_t>(-1);
}

// Remove the entry and return its value
static bool takeHeader(SsdpHeaders& headers, const char *key, std::string *value)
{
    auto it = headers.find(key);
    if (it == headers.end()) {
        return false;
    }
    *value = it->second;
    headers.erase(it);
    return true;
}

bool SsdpMSearchResponse::fromHeaders(
    SsdpHeaders headers, SsdpMSearchResponse *out,
    std::chrono::system_clock::time_point now)
{
    if (nullptr == out) {
        return false;
    }
    SsdpMSearchResponse resp;
    std::string value;

    auto it = headers.find(SsdpHeaderKeys::cacheControl);
    if (it != headers.end() && parseMaxAge(it->second, &resp.m_maxAge)) {
        resp.m_hasCacheControl = true;
        resp.m_expiry = now + std::chrono::seconds(resp.m_maxAge);
        headers.erase(it);
    }

    it = headers.find(SsdpHeaderKeys::date);
    if (it != headers.end() && parseHttpDate(it->second, &resp.m_date)) {
        resp.m_hasDate = true;
        headers.erase(it);
    }

    if (!takeHeader(headers, SsdpHeaderKeys::ext, &value)) {
        NpssdpPrintf(NPSSDP_DEBUG, SSDP, __FILE__, __LINE__,
                     "M-SEARCH response: no EXT header\n");
        return false;
    }
    resp.m_ext = true;

    if (!takeHeader(headers, SsdpHeaderKeys::location, &resp.m_location)) {
        NpssdpPrintf(NPSSDP_DEBUG, SSDP, __FILE__, __LINE__,
                     "M-SEARCH response: no LOCATION header\n");
        return false;
    }
    if (!is_absolute_url(resp.m_location)) {
        NpssdpPrintf(NPSSDP_DEBUG, SSDP, __FILE__, __LINE__,
                     "M-SEARCH response: bad LOCATION [%s]\n", resp.m_location.c_str());
        return false;
    }

    resp.m_hasServer = takeHeader(headers, SsdpHeaderKeys::server, &resp.m_server);

    if (!takeHeader(headers, SsdpHeaderKeys::st, &value)) {
        NpssdpPrintf(NPSSDP_DEBUG, SSDP, __FILE__, __LINE__,
                     "M-SEARCH response: no ST header\n");
        return false;
    }
    if (!SsdpSearchTarget::parse(value, &resp.m_target)) {
        NpssdpPrintf(NPSSDP_DEBUG, SSDP, __FILE__, __LINE__,
                     "M-SEARCH response: bad ST [%s]\n", value.c_str());
        return false;
    }

    if (!takeHeader(headers, SsdpHeaderKeys::usn, &resp.m_usn)) {
        NpssdpPrintf(NPSSDP_DEBUG, SSDP, __FILE__, __LINE__,
                     "M-SEARCH response: no USN header\n");
        return false;
    }

    resp.m_otherHeaders = std::move(headers);
    *out = std::move(resp);
    return true;
}

std::ostream& operator<<(std::ostream& os, const SsdpMSearchResponse& r)
{
    os << "ST: " << r.searchTarget() << " USN: " << r.usn() <<
        " LOCATION: " << r.location();
    if (r.hasServer()) {
        os << " SERVER: " << r.server();
    }
    if (r.hasCacheControl()) {
        os << " max-age: " << r.maxAge();
    }
    return os;
}
