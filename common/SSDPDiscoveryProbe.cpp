// Copyright (c) 2015-2026 Josh Blum
// SPDX-License-Identifier: BSL-1.0

/*
 * Docs and examples:
 * https://stackoverflow.com/questions/13382469/ssdp-protocol-implementation
 * http://upnp.org/specs/arch/UPnP-arch-DeviceArchitecture-v1.1.pdf
 */

#include <SoapySDR/Logger.hpp>
#include "SSDPDiscoveryProbe.hpp"
#include "SSDPDiscoveryRequest.hpp"
#include "SSDPProbeDefs.hpp"
#include "SSDPSettingsUtils.hpp"
#include "SSDPURLUtils.hpp"
#include "SSDPSocket.hpp"
#include <stdexcept>
#include <vector>

/***********************************************************************
 * Settings helpers
 **********************************************************************/
static int parseIntSetting(const SoapySDR::Kwargs &args, const std::string &key, const int defaultValue)
{
    const auto it = args.find(key);
    if (it == args.end()) return defaultValue;
    return SSDPSettings::parseInt(it->second, key);
}

static bool parseBoolSetting(const SoapySDR::Kwargs &args, const std::string &key, const bool defaultValue)
{
    const auto it = args.find(key);
    if (it == args.end()) return defaultValue;
    return SSDPSettings::parseBool(it->second, key);
}

static bool isWildcardNode(const std::string &node)
{
    return node.empty() or node == "0.0.0.0" or node == "::";
}

/***********************************************************************
 * SSDPDiscoveryProbe implementation
 **********************************************************************/
SSDPDiscoveryProbe::SSDPDiscoveryProbe(const SoapySDR::Kwargs &args):
    _groupURL(SSDP_PROBE_DEFAULT_GROUP),
    _ttl(SSDP_PROBE_DEFAULT_TTL),
    _loop(SSDP_PROBE_DEFAULT_LOOP)
{
    const auto groupIt = args.find(SSDP_PROBE_KWARG_GROUP);
    if (groupIt != args.end()) _groupURL = groupIt->second;

    //the group is always a datagram destination
    SSDPURL groupURL(_groupURL);
    if (groupURL.getScheme().empty()) groupURL.setScheme("udp");
    if (groupURL.getScheme() != "udp")
    {
        throw std::invalid_argument("SSDPDiscoveryProbe() -- group must be a udp URL: '"+_groupURL+"'");
    }

    //an IPv6 literal without brackets leaves colons in the service
    if (groupURL.getService().find(':') != std::string::npos)
    {
        throw std::invalid_argument("SSDPDiscoveryProbe() -- IPv6 group needs brackets, ex: udp://[ff02::c]:1900: '"+_groupURL+"'");
    }
    _groupURL = groupURL.toString();

    //bind to the wildcard address of the group's family unless specified
    const auto bindIt = args.find(SSDP_PROBE_KWARG_BIND);
    if (bindIt != args.end()) _bindNode = bindIt->second;
    if (_bindNode.empty())
    {
        const bool isIPv6Group = groupURL.getNode().find(':') != std::string::npos;
        _bindNode = isIPv6Group?"::":"0.0.0.0";
    }

    _ttl = parseIntSetting(args, SSDP_PROBE_KWARG_TTL, _ttl);
    if (_ttl < 0 or _ttl > 255)
    {
        throw std::invalid_argument("SSDPDiscoveryProbe() -- ttl out of range: "+std::to_string(_ttl));
    }
    _loop = parseBoolSetting(args, SSDP_PROBE_KWARG_LOOP, _loop);

    SoapySDR::logf(SOAPY_SDR_TRACE, "SSDPDiscoveryProbe(group=%s, bind=%s, ttl=%d, loop=%d)",
        _groupURL.c_str(), this->getBindURL().c_str(), _ttl, _loop?1:0);
}

std::string SSDPDiscoveryProbe::getGroupURL(void) const
{
    return _groupURL;
}

std::string SSDPDiscoveryProbe::getBindURL(void) const
{
    return SSDPURL("udp", _bindNode, "0").toString();
}

SSDPProbeOutcome SSDPDiscoveryProbe::probe(const std::string &searchTarget, const int mx, const long timeoutUs) const
{
    //validate everything before a socket exists
    const SSDPDiscoveryRequest request(searchTarget, mx);
    if (timeoutUs < 0 or timeoutUs > SSDP_PROBE_MAX_TIMEOUT_US)
    {
        throw std::invalid_argument("SSDPDiscoveryProbe::probe() -- timeout out of range "+std::to_string(timeoutUs)+" us");
    }

    SSDPSocketSession sess;
    SSDPSocket sock;

    //bind to an ephemeral port, replies come back unicast to it
    const auto bindURL = this->getBindURL();
    if (sock.bind(bindURL) != 0)
    {
        SoapySDR::logf(SOAPY_SDR_ERROR, "SSDPDiscoveryProbe::bind(%s) failed\n  %s", bindURL.c_str(), sock.lastErrorMsg());
        return SSDPProbeOutcome::transportError(sock.lastErrorMsg(), sock.lastErrorCode());
    }

    const std::string sendAddr(isWildcardNode(_bindNode)?"":_bindNode);
    if (sock.multicastSetup(sendAddr, _loop, _ttl) != 0)
    {
        SoapySDR::logf(SOAPY_SDR_ERROR, "SSDPDiscoveryProbe::multicastSetup(%s) failed\n  %s", _groupURL.c_str(), sock.lastErrorMsg());
        return SSDPProbeOutcome::transportError(sock.lastErrorMsg(), sock.lastErrorCode());
    }

    //exactly one request datagram
    const auto payload = request.toString();
    int ret = sock.sendto(payload.data(), payload.size(), _groupURL);
    if (ret != int(payload.size()))
    {
        if (ret >= 0)
        {
            SoapySDR::logf(SOAPY_SDR_ERROR, "SSDPDiscoveryProbe::sendto(%s) = %d, short write", _groupURL.c_str(), ret);
            return SSDPProbeOutcome::transportError("sendto("+_groupURL+") short write of "+std::to_string(ret)+" bytes", 0);
        }
        SoapySDR::logf(SOAPY_SDR_ERROR, "SSDPDiscoveryProbe::sendto(%s) = %d\n  %s", _groupURL.c_str(), ret, sock.lastErrorMsg());
        return SSDPProbeOutcome::transportError(sock.lastErrorMsg(), sock.lastErrorCode());
    }
    SoapySDR::logf(SOAPY_SDR_DEBUG, "SSDP M-SEARCH ST=%s MX=%d sent to %s from %s",
        searchTarget.c_str(), mx, _groupURL.c_str(), sock.getsockname().c_str());

    //exactly one bounded wait
    ret = sock.selectRecv(timeoutUs);
    if (ret == 0)
    {
        SoapySDR::logf(SOAPY_SDR_DEBUG, "SSDP M-SEARCH ST=%s no reply within %ld us", searchTarget.c_str(), timeoutUs);
        return SSDPProbeOutcome::timedOut();
    }
    if (ret < 0)
    {
        SoapySDR::logf(SOAPY_SDR_ERROR, "SSDPDiscoveryProbe::selectRecv() = %d\n  %s", ret, sock.lastErrorMsg());
        return SSDPProbeOutcome::transportError(sock.lastErrorMsg(), sock.lastErrorCode());
    }

    //exactly one receive, any bytes count as a reply
    std::vector<char> recvBuff(SSDP_PROBE_RECV_BUFFMAX);
    std::string recvAddr;
    ret = sock.recvfrom(recvBuff.data(), recvBuff.size(), recvAddr);
    if (ret < 0)
    {
        SoapySDR::logf(SOAPY_SDR_ERROR, "SSDPDiscoveryProbe::recvfrom() = %d\n  %s", ret, sock.lastErrorMsg());
        return SSDPProbeOutcome::transportError(sock.lastErrorMsg(), sock.lastErrorCode());
    }

    SoapySDR::logf(SOAPY_SDR_DEBUG, "SSDP reply of %d bytes from %s", ret, recvAddr.c_str());
    return SSDPProbeOutcome::replied(SSDPDiscoveryResponse(recvAddr, std::string(recvBuff.data(), size_t(ret))));
}
