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

#ifndef SSDPSEARCHTARGET_H
#define SSDPSEARCHTARGET_H

#include <string>
#include <ostream>

#include "NpssdpGlobal.h"

/*!
 * \brief Search target, as used in the ST header of M-SEARCH requests and
 * responses, and in the NT header of NOTIFY announcements.
 *
 * The canonical string forms are:
 *  - ssdp:all
 *  - upnp:rootdevice
 *  - uuid:<device-uuid>
 *  - urn:<schema>:device:<deviceType>:<version>
 *  - urn:<schema>:service:<serviceType>:<version>
 *
 * Period characters in a domain name schema must be replaced by hyphens
 * by the caller (RFC 2141), no escaping is performed here.
 */
class EXPORT_SPEC SsdpSearchTarget {
public:
    enum class Type {All, RootDevice, Uuid, DeviceType, ServiceType};

    /*! Schema for the UPnP forum standard devices and services. */
    static const char *upnpOrgSchema;

    /*! Default is ssdp:all */
    SsdpSearchTarget() = default;

    static SsdpSearchTarget all();
    static SsdpSearchTarget rootDevice();
    static SsdpSearchTarget uuid(const std::string& id);
    static SsdpSearchTarget deviceType(
        const std::string& schema, const std::string& devtype, int version);
    static SsdpSearchTarget serviceType(
        const std::string& schema, const std::string& servtype, int version);

    /*!
     * \brief Parse a canonical string.
     *
     * \return false, leaving *out unchanged, if the input does not have
     *   one of the five recognized shapes.
     */
    static bool parse(const std::string& raw, SsdpSearchTarget *out);

    /*! Canonical string form. parse(toString()) gives back *this */
    std::string toString() const;

    Type type() const {return m_type;}
    /*! Uuid only */
    const std::string& id() const {return m_id;}
    /*! DeviceType and ServiceType only */
    const std::string& schema() const {return m_schema;}
    const std::string& typeName() const {return m_typename;}
    int version() const {return m_version;}

    /*! True for the targets answered by devices: RootDevice, Uuid,
     *  DeviceType. */
    bool isDevice() const;

    bool operator==(const SsdpSearchTarget& other) const;
    bool operator!=(const SsdpSearchTarget& other) const {
        return !(*this == other);
    }

    /* Standard device targets. */
    static SsdpSearchTarget deviceMediaServer();
    static SsdpSearchTarget deviceMediaRenderer();
    static SsdpSearchTarget deviceInternetGateway();
    static SsdpSearchTarget deviceWANConnection();
    static SsdpSearchTarget deviceWAN();
    /* Standard service targets. */
    static SsdpSearchTarget serviceAVTransport();
    static SsdpSearchTarget serviceConnectionManager();
    static SsdpSearchTarget serviceContentDirectory();
    static SsdpSearchTarget serviceRenderingControl();
    static SsdpSearchTarget serviceLayer3Forwarding();
    static SsdpSearchTarget serviceWANCommonInterfaceConfig();
    static SsdpSearchTarget serviceWANIPConnection();

private:
    Type m_type{Type::All};
    std::string m_id;
    std::string m_schema;
    std::string m_typename;
    int m_version{0};
};

inline std::ostream& operator<<(std::ostream& os, const SsdpSearchTarget& st)
{
    return os << st.toString();
}

#endif /* SSDPSEARCHTARGET_H */
