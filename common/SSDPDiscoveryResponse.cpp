// Copyright (c) 2015-2026 Josh Blum
// SPDX-License-Identifier: BSL-1.0

#include "SSDPDiscoveryResponse.hpp"
#include "SSDPHTTPUtils.hpp"
#include "SSDPURLUtils.hpp"
#include <cstdlib> //atoi

SSDPDiscoveryResponse::SSDPDiscoveryResponse(void):
    _sourcePort(0),
    _wellFormed(false)
{
    return;
}

SSDPDiscoveryResponse::SSDPDiscoveryResponse(const std::string &sourceURL, const std::string &payload):
    _sourcePort(0),
    _payload(payload),
    _wellFormed(false)
{
    const SSDPURL url(sourceURL);
    _sourceHost = url.getNode();
    _sourcePort = std::atoi(url.getService().c_str());

    const SSDPHTTPHeader header(payload.data(), payload.size());
    _wellFormed = header.getLine0().compare(0, 7, "HTTP/1.") == 0 and header.isTerminated();
}

std::string SSDPDiscoveryResponse::getSourceURL(void) const
{
    return SSDPURL("", _sourceHost, std::to_string(_sourcePort)).toString();
}

std::string SSDPDiscoveryResponse::getSourceHost(void) const
{
    return _sourceHost;
}

int SSDPDiscoveryResponse::getSourcePort(void) const
{
    return _sourcePort;
}

const std::string &SSDPDiscoveryResponse::getPayload(void) const
{
    return _payload;
}

bool SSDPDiscoveryResponse::isWellFormed(void) const
{
    return _wellFormed;
}
