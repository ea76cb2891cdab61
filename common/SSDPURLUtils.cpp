// Copyright (c) 2015-2026 Josh Blum
// SPDX-License-Identifier: BSL-1.0

#include "SSDPSocketDefs.hpp"
#include "SSDPURLUtils.hpp"
#include <cstring> //memcpy, memset

/***********************************************************************
 * Resolved address storage
 **********************************************************************/
SockAddrData::SockAddrData(void)
{
    return;
}

SockAddrData::SockAddrData(const struct sockaddr *addr, const int addrlen):
    _storage((const char *)addr, (const char *)addr + addrlen)
{
    return;
}

const struct sockaddr *SockAddrData::addr(void) const
{
    return (const struct sockaddr *)_storage.data();
}

size_t SockAddrData::addrlen(void) const
{
    return _storage.size();
}

int SockAddrData::family(void) const
{
    if (_storage.size() < sizeof(struct sockaddr)) return AF_UNSPEC;
    return this->addr()->sa_family;
}

/***********************************************************************
 * Endpoint markup
 **********************************************************************/
SSDPURL::SSDPURL(const std::string &scheme, const std::string &node, const std::string &service):
    _scheme(scheme),
    _node(node),
    _service(service)
{
    return;
}

SSDPURL::SSDPURL(const std::string &url)
{
    std::string hostPort(url);
    const size_t schemeEnd = url.find("://");
    if (schemeEnd != std::string::npos)
    {
        _scheme = url.substr(0, schemeEnd);
        hostPort = url.substr(schemeEnd+3);
    }

    size_t portSep = std::string::npos;
    if (not hostPort.empty() and hostPort[0] == '[')
    {
        const size_t closing = hostPort.find(']');
        if (closing == std::string::npos) _node = hostPort.substr(1);
        else
        {
            _node = hostPort.substr(1, closing-1);
            portSep = hostPort.find(':', closing);
        }
    }
    else
    {
        //the first colon ends the node, later colons belong to the service
        portSep = hostPort.find(':');
        _node = hostPort.substr(0, portSep);
    }

    if (portSep != std::string::npos) _service = hostPort.substr(portSep+1);
}

SSDPURL::SSDPURL(const struct sockaddr *addr)
{
    if (addr == NULL) return;

    socklen_t addrlen = 0;
    if (addr->sa_family == AF_INET) addrlen = sizeof(struct sockaddr_in);
    else if (addr->sa_family == AF_INET6) addrlen = sizeof(struct sockaddr_in6);
    else return;

    char host[NI_MAXHOST];
    char port[NI_MAXSERV];
    const int ret = ::getnameinfo(addr, addrlen,
        host, sizeof(host), port, sizeof(port),
        NI_NUMERICHOST | NI_NUMERICSERV);
    if (ret != 0) return;

    _node = host;
    _service = port;
}

std::string SSDPURL::toSockAddr(SockAddrData &addr) const
{
    if (_service.empty()) return "service not specified";

    struct addrinfo hints;
    std::memset(&hints, 0, sizeof(hints));
    hints.ai_family = AF_UNSPEC;
    hints.ai_socktype = SOCK_DGRAM;

    struct addrinfo *results = NULL;
    const int ret = ::getaddrinfo(_node.c_str(), _service.c_str(), &hints, &results);
    if (ret != 0) return gai_strerror(ret);

    //take the first internet address
    bool found = false;
    for (const struct addrinfo *p = results; p != NULL and not found; p = p->ai_next)
    {
        if (p->ai_family != AF_INET and p->ai_family != AF_INET6) continue;
        addr = SockAddrData(p->ai_addr, int(p->ai_addrlen));
        found = true;
    }
    ::freeaddrinfo(results);

    return found?"":"no lookup results";
}

std::string SSDPURL::toString(void) const
{
    const bool bracketed = _node.find(':') != std::string::npos;
    std::string out;
    if (not _scheme.empty()) out = _scheme + "://";
    out += bracketed?("[" + _node + "]"):_node;
    if (not _service.empty()) out += ":" + _service;
    return out;
}

std::string SSDPURL::getScheme(void) const
{
    return _scheme;
}

std::string SSDPURL::getNode(void) const
{
    return _node;
}

std::string SSDPURL::getService(void) const
{
    return _service;
}

void SSDPURL::setScheme(const std::string &scheme)
{
    _scheme = scheme;
}
