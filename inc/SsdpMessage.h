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

#ifndef SSDPMESSAGE_H
#define SSDPMESSAGE_H

#include <chrono>
#include <ctime>
#include <map>
#include <memory>
#include <string>
#include <utility>
#include <vector>

#include "NpssdpGlobal.h"
#include "SsdpSearchTarget.h"

class SsdpDiscoveryObserver;

/*! Header names compare case-insensitively */
struct EXPORT_SPEC SsdpHeaderLess {
    bool operator()(const std::string& a, const std::string& b) const;
};

/*! SSDP/HTTP header set. Keys are stored as received. */
typedef std::map<std::string, std::string, SsdpHeaderLess> SsdpHeaders;

/*! SSDP header names */
namespace SsdpHeaderKeys {
extern EXPORT_SPEC const char *cacheControl;
extern EXPORT_SPEC const char *date;
extern EXPORT_SPEC const char *ext;
extern EXPORT_SPEC const char *host;
extern EXPORT_SPEC const char *location;
extern EXPORT_SPEC const char *man;
extern EXPORT_SPEC const char *mx;
extern EXPORT_SPEC const char *nt;
extern EXPORT_SPEC const char *nts;
extern EXPORT_SPEC const char *st;
extern EXPORT_SPEC const char *server;
extern EXPORT_SPEC const char *usn;
}

/*! Values of the MAN (M-SEARCH) and NTS (NOTIFY) headers */
enum class SsdpAnnouncement {Discover, Alive, ByeBye};
EXPORT_SPEC const char *SsdpAnnouncementValue(SsdpAnnouncement a);

/*!
 * \brief An M-SEARCH request: what to search for and who to tell about it.
 *
 * The observer is shared with all the sessions using the request. It must
 * be able to take callbacks until they are closed.
 */
class EXPORT_SPEC SsdpMSearchRequest {
public:
    typedef std::vector<std::pair<std::string, std::string>> HeaderList;

    SsdpMSearchRequest(std::shared_ptr<SsdpDiscoveryObserver> observer,
                       const SsdpSearchTarget& target, int maxWait = 1,
                       const HeaderList& extraHeaders = HeaderList());

    const std::shared_ptr<SsdpDiscoveryObserver>& observer() const {
        return m_observer;
    }
    const SsdpSearchTarget& searchTarget() const {return m_target;}
    /*! MX value, in seconds */
    int maxWait() const {return m_maxWait;}
    /*! Extra headers, after removal of the duplicates and of the keys
     *  colliding with the standard ones. */
    const HeaderList& extraHeaders() const {return m_extraHeaders;}

    /*!
     * \brief Build the datagram payload.
     *
     * Request line, HOST, MAN, MX and ST in this order, then the extra
     * headers. Every line ends with CRLF, there is no empty line at the end.
     */
    std::string message() const;

private:
    std::shared_ptr<SsdpDiscoveryObserver> m_observer;
    SsdpSearchTarget m_target;
    int m_maxWait;
    HeaderList m_extraHeaders;
};

/*!
 * \brief A validated unicast response to an M-SEARCH request.
 *
 * Two responses are the same discovery if they have the same USN and
 * LOCATION values, whatever the other headers say.
 */
class EXPORT_SPEC SsdpMSearchResponse {
public:
    SsdpMSearchResponse() = default;

    /*!
     * \brief Build a response from a header set.
     *
     * EXT, LOCATION (absolute URL), ST (valid search target) and USN are
     * required. CACHE-CONTROL and DATE are used if they can be parsed, else
     * they are left in the other headers.
     *
     * \param headers received headers. The recognized ones are removed,
     *   the rest goes to otherHeaders().
     * \param out result. Not modified if false is returned.
     * \param now reception time, base for the expiry time.
     * \return false if a required field is missing or invalid.
     */
    static bool fromHeaders(
        SsdpHeaders headers, SsdpMSearchResponse *out,
        std::chrono::system_clock::time_point now = std::chrono::system_clock::now());

    /*! CACHE-CONTROL max-age, seconds. Valid if hasCacheControl() */
    bool hasCacheControl() const {return m_hasCacheControl;}
    int maxAge() const {return m_maxAge;}
    std::chrono::system_clock::time_point expiry() const {return m_expiry;}
    /*! DATE value as a time_t. Valid if hasDate() */
    bool hasDate() const {return m_hasDate;}
    time_t date() const {return m_date;}
    /*! Always true for a successfully built response */
    bool ext() const {return m_ext;}
    const std::string& location() const {return m_location;}
    bool hasServer() const {return m_hasServer;}
    const std::string& server() const {return m_server;}
    const SsdpSearchTarget& searchTarget() const {return m_target;}
    const std::string& usn() const {return m_usn;}
    const SsdpHeaders& otherHeaders() const {return m_otherHeaders;}

    bool operator==(const SsdpMSearchResponse& o) const {
        return m_usn == o.m_usn && m_location == o.m_location;
    }
    bool operator!=(const SsdpMSearchResponse& o) const {
        return !(*this == o);
    }
    /*! Ordering on (usn, location), for use as a set key */
    bool operator<(const SsdpMSearchResponse& o) const {
        if (m_usn != o.m_usn)
            return m_usn < o.m_usn;
        return m_location < o.m_location;
    }

private:
    bool m_hasCacheControl{false};
    int m_maxAge{0};
    std::chrono::system_clock::time_point m_expiry;
    bool m_hasDate{false};
    time_t m_date{0};
    bool m_ext{false};
    std::string m_location;
    bool m_hasServer{false};
    std::string m_server;
    SsdpSearchTarget m_target;
    std::string m_usn;
    SsdpHeaders m_otherHeaders;
};

/*!
 * \brief A parsed SSDP datagram.
 *
 * Only SearchResponse messages are produced by the parser at the moment,
 * the other kinds exist so that callers can switch on the complete set.
 */
struct EXPORT_SPEC SsdpMessage {
    enum class Kind {SearchRequest, SearchResponse, Notify};
    Kind kind{Kind::SearchRequest};
    /*! Valid if kind is SearchResponse */
    SsdpMSearchResponse response;
};

EXPORT_SPEC std::ostream& operator<<(std::ostream& os, const SsdpMSearchResponse& r);

#endif /* SSDPMESSAGE_H */
