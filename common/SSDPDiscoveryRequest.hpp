// Copyright (c) 2015-2026 Josh Blum
// SPDX-License-Identifier: BSL-1.0

#pragma once
#include "SSDPProbeConfig.hpp"
#include <string>

/*!
 * An outbound M-SEARCH query.
 * The value is fixed at construction and formats
 * to the exact bytes that go out on the wire.
 */
class SSDP_PROBE_API SSDPDiscoveryRequest
{
public:

    /*!
     * Create a discovery request.
     * \throws std::invalid_argument for a malformed ST or mx < 1
     * \param searchTarget the ST header value, ex: upnp:rootdevice
     * \param mx the maximum reply delay in seconds advertised to responders
     */
    SSDPDiscoveryRequest(const std::string &searchTarget, const int mx);

    //! Check the syntax of an ST header value
    static bool isValidSearchTarget(const std::string &searchTarget);

    //! The HOST header, always the SSDP multicast group
    std::string getHost(void) const;

    //! The MAN header without quotes
    std::string getMan(void) const;

    std::string getSearchTarget(void) const;

    int getMX(void) const;

    /*!
     * Format the request:
     * HOST, MAN, ST, MX in that order with CRLF line endings
     * and a trailing blank line.
     */
    std::string toString(void) const;

private:
    std::string _searchTarget;
    int _mx;
};
