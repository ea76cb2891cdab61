// Copyright (c) 2015-2026 Josh Blum
// SPDX-License-Identifier: BSL-1.0

#pragma once
#include "SSDPProbeConfig.hpp"
#include "SSDPProbeOutcome.hpp"
#include <SoapySDR/Types.hpp>
#include <string>

/*!
 * Perform one-shot SSDP M-SEARCH exchanges:
 * send one request to the discovery group,
 * then wait a bounded time for a single reply.
 *
 * The probe only holds settings. Every call to probe()
 * creates, uses, and releases its own socket,
 * so calls are independent and may run concurrently.
 */
class SSDP_PROBE_API SSDPDiscoveryProbe
{
public:

    /*!
     * Create a probe with optional settings.
     * Keys: group, bind, ttl, loop (see SSDPProbeDefs.hpp).
     * \throws std::invalid_argument for malformed settings or an unbracketed IPv6 group
     */
    SSDPDiscoveryProbe(const SoapySDR::Kwargs &args = SoapySDR::Kwargs());

    /*!
     * Send one M-SEARCH and wait for one reply.
     * \throws std::invalid_argument for a malformed ST, mx < 1, or a timeoutUs outside [0, SSDP_PROBE_MAX_TIMEOUT_US]
     * \param searchTarget the ST header value, ex: ssdp:all
     * \param mx the MX header value in seconds
     * \param timeoutUs the maximum time to wait for a reply
     * \return replied, timed out, or transport error
     */
    SSDPProbeOutcome probe(const std::string &searchTarget, const int mx, const long timeoutUs) const;

    //! The destination URL for requests
    std::string getGroupURL(void) const;

    //! The local bind URL for requests (ephemeral port)
    std::string getBindURL(void) const;

private:
    std::string _groupURL;
    std::string _bindNode;
    int _ttl;
    bool _loop;
};
