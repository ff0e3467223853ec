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

#include "SsdpSearchTarget.h"

#include <cstdlib>
#include <cctype>
#include <climits>
#include <cerrno>
#include <vector>

#include "smallut.h"

const char *SsdpSearchTarget::upnpOrgSchema = "schemas-upnp-org";

SsdpSearchTarget SsdpSearchTarget::all()
{
    return SsdpSearchTarget();
}

SsdpSearchTarget SsdpSearchTarget::rootDevice()
{
    SsdpSearchTarget st;
    st.m_type = Type::RootDevice;
    return st;
}

SsdpSearchTarget SsdpSearchTarget::uuid(const std::string& id)
{
    SsdpSearchTarget st;
    st.m_type = Type::Uuid;
    st.m_id = id;
    return st;
}

SsdpSearchTarget SsdpSearchTarget::deviceType(
    const std::string& schema, const std::string& devtype, int version)
{
    SsdpSearchTarget st;
    st.m_type = Type::DeviceType;
    st.m_schema = schema;
    st.m_typename = devtype;
    st.m_version = version;
    return st;
}

SsdpSearchTarget SsdpSearchTarget::serviceType(
    const std::string& schema, const std::string& servtype, int version)
{
    SsdpSearchTarget st;
    st.m_type = Type::ServiceType;
    st.m_schema = schema;
    st.m_typename = servtype;
    st.m_version = version;
    return st;
}

// Whole string must be an optionally negative decimal integer
static bool versionFromString(const std::string& s, int *out)
{
    if (s.empty()) {
        return false;
    }
    const char *cp = s.c_str();
    if (*cp != '-' && !isdigit(static_cast<unsigned char>(*cp))) {
        return false;
    }
    char *ep;
    errno = 0;
    long l = strtol(cp, &ep, 10);
    if (*ep != 0 || ep == cp || errno == ERANGE || l > INT_MAX || l < INT_MIN) {
        return false;
    }
    *out = static_cast<int>(l);
    return true;
}

bool SsdpSearchTarget::parse(const std::string& raw, SsdpSearchTarget *out)
{
    if (nullptr == out) {
        return false;
    }
    std::vector<std::string> parts;
    stringSplitString(raw, parts, ":");
    // A trailing colon produces an empty last part
    if (!raw.empty() && raw.back() == ':') {
        parts.emplace_back();
    }

    switch (parts.size()) {
    case 2:
        if (parts[0] == "ssdp") {
            if (parts[1] == "all") {
                *out = all();
                return true;
            }
        } else if (parts[0] == "upnp") {
            if (parts[1] == "rootdevice") {
                *out = rootDevice();
                return true;
            }
        } else if (parts[0] == "uuid") {
            *out = uuid(parts[1]);
            return true;
        }
        break;
    case 5:
    {
        int version;
        if (parts[0] != "urn" || !versionFromString(parts[4], &version)) {
            break;
        }
        if (parts[2] == "device") {
            *out = deviceType(parts[1], parts[3], version);
            return true;
        } else if (parts[2] == "service") {
            *out = serviceType(parts[1], parts[3], version);
            return true;
        }
    }
    break;
    default:
        break;
    }
    return false;
}

std::string SsdpSearchTarget::toString() const
{
    switch (m_type) {
    case Type::All:
        return "ssdp:all";
    case Type::RootDevice:
        return "upnp:rootdevice";
    case Type::Uuid:
        return std::string("uuid:") + m_id;
    case Type::DeviceType:
        return std::string("urn:") + m_schema + ":device:" + m_typename + ":" +
            std::to_string(m_version);
    case Type::ServiceType:
        return std::string("urn:") + m_schema + ":service:" + m_typename + ":" +
            std::to_string(m_version);
    }
    return std::string();
}

bool SsdpSearchTarget::isDevice() const
{
    switch (m_type) {
    case Type::RootDevice:
    case Type::Uuid:
    case Type::DeviceType:
        return true;
    case Type::All:
    case Type::ServiceType:
        return false;
    }
    return false;
}

bool SsdpSearchTarget::operator==(const SsdpSearchTarget& other) const
{
    if (m_type != other.m_type) {
        return false;
    }
    switch (m_type) {
    case Type::All:
    case Type::RootDevice:
        return true;
    case Type::Uuid:
        return m_id == other.m_id;
    case Type::DeviceType:
    case Type::ServiceType:
        return m_schema == other.m_schema && m_typename == other.m_typename &&
            m_version == other.m_version;
    }
    return false;
}

SsdpSearchTarget SsdpSearchTarget::deviceMediaServer()
{
    return deviceType(upnpOrgSchema, "MediaServer", 1);
}
SsdpSearchTarget SsdpSearchTarget::deviceMediaRenderer()
{
    return deviceType(upnpOrgSchema, "MediaRenderer", 1);
}
SsdpSearchTarget SsdpSearchTarget::deviceInternetGateway()
{
    return deviceType(upnpOrgSchema, "InternetGatewayDevice", 1);
}
SsdpSearchTarget SsdpSearchTarget::deviceWANConnection()
{
    return deviceType(upnpOrgSchema, "WANConnectionDevice", 1);
}
SsdpSearchTarget SsdpSearchTarget::deviceWAN()
{
    return deviceType(upnpOrgSchema, "WANDevice", 1);
}

SsdpSearchTarget SsdpSearchTarget::serviceAVTransport()
{
    return serviceType(upnpOrgSchema, "AVTransport", 1);
}
SsdpSearchTarget SsdpSearchTarget::serviceConnectionManager()
{
    return serviceType(upnpOrgSchema, "ConnectionManager", 1);
}
SsdpSearchTarget SsdpSearchTarget::serviceContentDirectory()
{
    return serviceType(upnpOrgSchema, "ContentDirectory", 1);
}
SsdpSearchTarget SsdpSearchTarget::serviceRenderingControl()
{
    return serviceType(upnpOrgSchema, "RenderingControl", 1);
}
SsdpSearchTarget SsdpSearchTarget::serviceLayer3Forwarding()
{
    return serviceType(upnpOrgSchema, "Layer3Forwarding", 1);
}
SsdpSearchTarget SsdpSearchTarget::serviceWANCommonInterfaceConfig()
{
    return serviceType(upnpOrgSchema, "WANCommonInterfaceConfig", 1);
}
SsdpSearchTarget SsdpSearchTarget::serviceWANIPConnection()
{
    return serviceType(upnpOrgSchema, "WANIPConnection", 1);
}
