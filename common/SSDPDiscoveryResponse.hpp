// Copyright (c) 2015-2026 Josh Blum
// SPDX-License-Identifier: BSL-1.0

#pragma once
#include "SSDPProbeConfig.hpp"
#include <string>

/*!
 * One datagram received in reply to a discovery request.
 * The payload is kept byte for byte as received;
 * parsing it is left to the caller (see SSDPHTTPHeader).
 */
class SSDP_PROBE_API SSDPDiscoveryResponse
{
public:

    //! Create an empty response (no sender, no payload)
    SSDPDiscoveryResponse(void);

    /*!
     * Create a response from a received datagram.
     * \param sourceURL the sender as node:service, ex: 192.168.1.5:49152
     * \param payload the raw datagram bytes
     */
    SSDPDiscoveryResponse(const std::string &sourceURL, const std::string &payload);

    //! The sender address as node:service
    std::string getSourceURL(void) const;

    //! The sender host (IP address)
    std::string getSourceHost(void) const;

    //! The sender UDP port
    int getSourcePort(void) const;

    //! The raw payload bytes
    const std::string &getPayload(void) const;

    /*!
     * Does the payload look like an HTTP response header?
     * True for an HTTP/1.x status line and a complete header block.
     * This is informational only.
     */
    bool isWellFormed(void) const;

private:
    std::string _sourceHost;
    int _sourcePort;
    std::string _payload;
    bool _wellFormed;
};
