// Copyright (c) 2015-2026 Josh Blum
// SPDX-License-Identifier: BSL-1.0

#pragma once
#include "SSDPProbeConfig.hpp"
#include "SSDPDiscoveryResponse.hpp"
#include <string>

/*!
 * The result of one discovery probe.
 * Exactly one of: a reply, a timeout, or a transport error.
 * A timeout is an ordinary outcome, not an error.
 */
class SSDP_PROBE_API SSDPProbeOutcome
{
public:
    enum Status
    {
        REPLIED,
        TIMED_OUT,
        TRANSPORT_ERROR,
    };

    //! A datagram arrived before the deadline
    static SSDPProbeOutcome replied(const SSDPDiscoveryResponse &response);

    //! Nothing arrived before the deadline
    static SSDPProbeOutcome timedOut(void);

    /*!
     * A socket operation failed.
     * \param reason the failed operation and the system error text
     * \param errorCode the system error code or 0 when unknown
     */
    static SSDPProbeOutcome transportError(const std::string &reason, const int errorCode);

    Status getStatus(void) const;

    bool isReplied(void) const;

    bool isTimedOut(void) const;

    bool isTransportError(void) const;

    /*!
     * Get the received reply.
     * \throws std::logic_error when the status is not REPLIED
     */
    const SSDPDiscoveryResponse &getResponse(void) const;

    //! The transport error reason (empty unless TRANSPORT_ERROR)
    const std::string &getErrorMessage(void) const;

    //! The transport error system code (0 unless TRANSPORT_ERROR)
    int getErrorCode(void) const;

    //! Short name of the status, ex: "TIMED_OUT"
    std::string getStatusName(void) const;

private:
    SSDPProbeOutcome(const Status status);

    Status _status;
    SSDPDiscoveryResponse _response;
    std::string _errorMsg;
    int _errorCode;
};
