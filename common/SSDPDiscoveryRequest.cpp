// Copyright (c) 2015-2026 Josh Blum
// SPDX-License-Identifier: BSL-1.0

#include "SSDPDiscoveryRequest.hpp"
#include "SSDPHTTPUtils.hpp"
#include "SSDPProbeDefs.hpp"
#include <stdexcept>

static bool isTokenChar(const char ch)
{
    if (ch >= 'a' and ch <= 'z') return true;
    if (ch >= 'A' and ch <= 'Z') return true;
    if (ch >= '0' and ch <= '9') return true;
    return ch == '.' or ch == '-' or ch == '_';
}

SSDPDiscoveryRequest::SSDPDiscoveryRequest(const std::string &searchTarget, const int mx):
    _searchTarget(searchTarget),
    _mx(mx)
{
    if (not isValidSearchTarget(searchTarget))
    {
        throw std::invalid_argument("SSDPDiscoveryRequest() -- invalid search target '"+searchTarget+"'");
    }
    if (mx < 1)
    {
        throw std::invalid_argument("SSDPDiscoveryRequest() -- MX must be positive, got "+std::to_string(mx));
    }
}

bool SSDPDiscoveryRequest::isValidSearchTarget(const std::string &searchTarget)
{
    //prefix:rest where the prefix has no colons, ex: urn:schemas-upnp-org:device:Basic:1
    const auto colon = searchTarget.find(':');
    if (colon == std::string::npos or colon == 0) return false;
    if (colon+1 == searchTarget.size()) return false;

    for (size_t i = 0; i < searchTarget.size(); i++)
    {
        const char ch = searchTarget[i];
        if (isTokenChar(ch)) continue;
        if (ch == ':' and i > colon) continue;
        if (i == colon) continue;
        return false;
    }
    return true;
}

std::string SSDPDiscoveryRequest::getHost(void) const
{
    return SSDP_MSEARCH_HOST;
}

std::string SSDPDiscoveryRequest::getMan(void) const
{
    return SSDP_MSEARCH_MAN;
}

std::string SSDPDiscoveryRequest::getSearchTarget(void) const
{
    return _searchTarget;
}

int SSDPDiscoveryRequest::getMX(void) const
{
    return _mx;
}

std::string SSDPDiscoveryRequest::toString(void) const
{
    SSDPHTTPHeader header("M-SEARCH * HTTP/1.1");
    header.addField("HOST", this->getHost());
    header.addField("MAN", "\"" + this->getMan() + "\"");
    header.addField("ST", _searchTarget);
    header.addField("MX", std::to_string(_mx));
    header.finalize();
    return header.toString();
}
