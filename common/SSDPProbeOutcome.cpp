// Copyright (c) 2015-2026 Josh Blum
// SPDX-License-Identifier: BSL-1.0

#include "SSDPProbeOutcome.hpp"
#include <stdexcept>

SSDPProbeOutcome::SSDPProbeOutcome(const Status status):
    _status(status),
    _errorCode(0)
{
    return;
}

SSDPProbeOutcome SSDPProbeOutcome::replied(const SSDPDiscoveryResponse &response)
{
    SSDPProbeOutcome outcome(REPLIED);
    outcome._response = response;
    return outcome;
}

SSDPProbeOutcome SSDPProbeOutcome::timedOut(void)
{
    return SSDPProbeOutcome(TIMED_OUT);
}

SSDPProbeOutcome SSDPProbeOutcome::transportError(const std::string &reason, const int errorCode)
{
    SSDPProbeOutcome outcome(TRANSPORT_ERROR);
    outcome._errorMsg = reason;
    outcome._errorCode = errorCode;
    return outcome;
}

SSDPProbeOutcome::Status SSDPProbeOutcome::getStatus(void) const
{
    return _status;
}

bool SSDPProbeOutcome::isReplied(void) const
{
    return _status == REPLIED;
}

bool SSDPProbeOutcome::isTimedOut(void) const
{
    return _status == TIMED_OUT;
}

bool SSDPProbeOutcome::isTransportError(void) const
{
    return _status == TRANSPORT_ERROR;
}

const SSDPDiscoveryResponse &SSDPProbeOutcome::getResponse(void) const
{
    if (_status != REPLIED)
    {
        throw std::logic_error("SSDPProbeOutcome::getResponse() -- no response for status "+this->getStatusName());
    }
    return _response;
}

const std::string &SSDPProbeOutcome::getErrorMessage(void) const
{
    return _errorMsg;
}

int SSDPProbeOutcome::getErrorCode(void) const
{
    return _errorCode;
}

std::string SSDPProbeOutcome::getStatusName(void) const
{
    switch (_status)
    {
    case REPLIED: return "REPLIED";
    case TIMED_OUT: return "TIMED_OUT";
    case TRANSPORT_ERROR: return "TRANSPORT_ERROR";
    }
    return "UNKNOWN";
}
