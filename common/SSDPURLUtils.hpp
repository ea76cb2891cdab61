// Copyright (c) 2015-2026 Josh Blum
// SPDX-License-Identifier: BSL-1.0

#pragma once
#include "SSDPProbeConfig.hpp"
#include <cstddef>
#include <string>
#include <vector>

struct sockaddr;

//! Resolved socket address bytes as returned by getaddrinfo()
class SSDP_PROBE_API SockAddrData
{
public:
    SockAddrData(void);

    SockAddrData(const struct sockaddr *addr, const int addrlen);

    const struct sockaddr *addr(void) const;

    size_t addrlen(void) const;

    //! AF_INET, AF_INET6, or AF_UNSPEC when nothing was resolved
    int family(void) const;

private:
    std::vector<char> _storage;
};

/*!
 * Datagram endpoint markup: [scheme://]node[:service]
 * IPv6 nodes are written inside brackets.
 * Examples:
 * udp://239.255.255.250:1900
 * udp://[ff02::c]:1900
 * 192.168.1.10:49152
 */
class SSDP_PROBE_API SSDPURL
{
public:
    SSDPURL(const std::string &scheme, const std::string &node, const std::string &service);

    //! Split markup into scheme, node and service (no lookup)
    SSDPURL(const std::string &url);

    //! Numeric host and port of an IPv4 or IPv6 address
    SSDPURL(const struct sockaddr *addr);

    /*!
     * Resolve node and service into a datagram socket address.
     * Return an empty string on success or the lookup error.
     */
    std::string toSockAddr(SockAddrData &addr) const;

    std::string toString(void) const;

    std::string getScheme(void) const;

    std::string getNode(void) const;

    std::string getService(void) const;

    void setScheme(const std::string &scheme);

private:
    std::string _scheme;
    std::string _node;
    std::string _service;
};
