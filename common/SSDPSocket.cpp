// Copyright (c) 2015-2026 Josh Blum
// SPDX-License-Identifier: BSL-1.0

#include "SSDPSocketDefs.hpp"
#include "SSDPSocket.hpp"
#include "SSDPURLUtils.hpp"
#include "SSDPProbeDefs.hpp"
#include <SoapySDR/Logger.hpp>
#include <cstring> //strerror
#include <chrono>
#include <mutex>

static std::mutex sessionMutex;
static size_t sessionCount = 0;

SSDPSocketSession::SSDPSocketSession(void)
{
    std::lock_guard<std::mutex> lock(sessionMutex);
    sessionCount++;
    if (sessionCount > 1) return;

    #ifdef _MSC_VER
    WORD wVersionRequested;
    WSADATA wsaData;
    wVersionRequested = MAKEWORD(2, 2);
    int ret = WSAStartup(wVersionRequested, &wsaData);
    if (ret != 0)
    {
        SoapySDR::logf(SOAPY_SDR_ERROR, "SSDPSocketSession::WSAStartup: %d", ret);
    }
    #endif
}

SSDPSocketSession::~SSDPSocketSession(void)
{
    std::lock_guard<std::mutex> lock(sessionMutex);
    sessionCount--;
    if (sessionCount > 0) return;

    #ifdef _MSC_VER
    WSACleanup();
    #endif
}

SSDPSocket::SSDPSocket(void):
    _sock(INVALID_SOCKET),
    _family(AF_UNSPEC),
    _lastErrorCode(0)
{
    return;
}

SSDPSocket::~SSDPSocket(void)
{
    if (this->close() != 0)
    {
        SoapySDR::logf(SOAPY_SDR_ERROR, "SSDPSocket::~SSDPSocket: %s", this->lastErrorMsg());
    }
}

bool SSDPSocket::null(void) const
{
    return _sock == INVALID_SOCKET;
}

int SSDPSocket::close(void)
{
    if (this->null()) return 0;
    int ret = ::closesocket(_sock);
    _sock = INVALID_SOCKET;
    _family = AF_UNSPEC;
    if (ret != 0) this->reportError("closesocket()");
    return ret;
}

int SSDPSocket::bind(const std::string &url)
{
    SSDPURL urlObj(url);
    SockAddrData addr;
    const auto errorMsg = urlObj.toSockAddr(addr);
    if (not errorMsg.empty())
    {
        this->reportError("getaddrinfo("+url+")", errorMsg);
        return -1;
    }

    if (this->null())
    {
        _sock = ::socket(addr.family(), SOCK_DGRAM, 0);
        _family = addr.family();
    }
    if (this->null())
    {
        this->reportError("socket("+url+")");
        return -1;
    }

    //setup reuse address
    int one = 1;
    int ret = ::setsockopt(_sock, SOL_SOCKET, SO_REUSEADDR, (const char *)&one, sizeof(one));
    if (ret != 0)
    {
        this->reportError("setsockopt(SO_REUSEADDR)");
        return -1;
    }

    ret = ::bind(_sock, addr.addr(), socklen_t(addr.addrlen()));
    if (ret == -1) this->reportError("bind("+url+")");
    else SoapySDR::logf(SOAPY_SDR_TRACE, "SSDPSocket::bind(%s) -> %s", url.c_str(), this->getsockname().c_str());
    return ret;
}

int SSDPSocket::multicastSetup(const std::string &sendAddr, const bool loop, const int ttl)
{
    /*
     * Multicast sender docs:
     * http://www.tldp.org/HOWTO/Multicast-HOWTO-6.html
     */
    if (this->null())
    {
        this->reportError("multicastSetup() on null socket", "bind first");
        return -1;
    }

    int ret = 0;
    int loopInt = loop?1:0;

    switch(_family)
    {
    case AF_INET: {

        //setup IP_MULTICAST_LOOP
        ret = ::setsockopt(_sock, IPPROTO_IP, IP_MULTICAST_LOOP, (const char *)&loopInt, sizeof(loopInt));
        if (ret != 0)
        {
            this->reportError("setsockopt(IP_MULTICAST_LOOP)");
            return -1;
        }

        //setup IP_MULTICAST_TTL
        ret = ::setsockopt(_sock, IPPROTO_IP, IP_MULTICAST_TTL, (const char *)&ttl, sizeof(ttl));
        if (ret != 0)
        {
            this->reportError("setsockopt(IP_MULTICAST_TTL)");
            return -1;
        }

        //setup IP_MULTICAST_IF, otherwise the routing table decides
        if (sendAddr.empty()) break;
        SockAddrData sendAddrData;
        const auto errorMsg = SSDPURL("udp", sendAddr, "0").toSockAddr(sendAddrData);
        if (not errorMsg.empty())
        {
            this->reportError("getaddrinfo("+sendAddr+")", errorMsg);
            return -1;
        }
        auto *send_addr_in = (const struct sockaddr_in *)sendAddrData.addr();
        ret = ::setsockopt(_sock, IPPROTO_IP, IP_MULTICAST_IF, (const char *)&send_addr_in->sin_addr, sizeof(send_addr_in->sin_addr));
        if (ret != 0)
        {
            this->reportError("setsockopt(IP_MULTICAST_IF, "+sendAddr+")");
            return -1;
        }
        break;
    }
    case AF_INET6: {

        //setup IPV6_MULTICAST_LOOP
        ret = ::setsockopt(_sock, IPPROTO_IPV6, IPV6_MULTICAST_LOOP, (const char *)&loopInt, sizeof(loopInt));
        if (ret != 0)
        {
            this->reportError("setsockopt(IPV6_MULTICAST_LOOP)");
            return -1;
        }

        //setup IPV6_MULTICAST_HOPS
        ret = ::setsockopt(_sock, IPPROTO_IPV6, IPV6_MULTICAST_HOPS, (const char *)&ttl, sizeof(ttl));
        if (ret != 0)
        {
            this->reportError("setsockopt(IPV6_MULTICAST_HOPS)");
            return -1;
        }
        break;
    }
    default:
        break;
    }

    return 0;
}

int SSDPSocket::sendto(const void *buf, size_t len, const std::string &url, int flags)
{
    SockAddrData addr;
    const auto errorMsg = SSDPURL(url).toSockAddr(addr);
    if (not errorMsg.empty())
    {
        this->reportError("getaddrinfo("+url+")", errorMsg);
        return -1;
    }

    int ret = ::sendto(_sock, (const char *)buf, int(len), flags, addr.addr(), socklen_t(addr.addrlen()));
    if (ret == -1) this->reportError("sendto("+url+")");
    return ret;
}

int SSDPSocket::recvfrom(void *buf, size_t len, std::string &url, int flags)
{
    struct sockaddr_storage addr;
    socklen_t addrlen = sizeof(addr);
    int ret = ::recvfrom(_sock, (char *)buf, int(len), flags, (struct sockaddr*)&addr, &addrlen);
    if (ret == -1) this->reportError("recvfrom()");
    else url = SSDPURL((struct sockaddr *)&addr).toString();
    return ret;
}

int SSDPSocket::multicastJoin(const std::string &group, const std::string &recvAddr)
{
    if (this->null())
    {
        this->reportError("multicastJoin() on null socket", "bind first");
        return -1;
    }

    SockAddrData groupAddr;
    auto errorMsg = SSDPURL(group).toSockAddr(groupAddr);
    if (not errorMsg.empty())
    {
        this->reportError("getaddrinfo("+group+")", errorMsg);
        return -1;
    }

    int ret = 0;
    switch(groupAddr.family())
    {
    case AF_INET: {
        struct ip_mreq mreq;
        std::memset(&mreq, 0, sizeof(mreq));
        mreq.imr_multiaddr = ((const struct sockaddr_in *)groupAddr.addr())->sin_addr;
        mreq.imr_interface.s_addr = htonl(INADDR_ANY);
        if (not recvAddr.empty())
        {
            SockAddrData recvAddrData;
            errorMsg = SSDPURL("udp", recvAddr, "0").toSockAddr(recvAddrData);
            if (not errorMsg.empty())
            {
                this->reportError("getaddrinfo("+recvAddr+")", errorMsg);
                return -1;
            }
            mreq.imr_interface = ((const struct sockaddr_in *)recvAddrData.addr())->sin_addr;
        }
        ret = ::setsockopt(_sock, IPPROTO_IP, IP_ADD_MEMBERSHIP, (const char *)&mreq, sizeof(mreq));
        if (ret != 0) this->reportError("setsockopt(IP_ADD_MEMBERSHIP, "+group+")");
        break;
    }
    case AF_INET6: {
        //IPv6 joins on the default interface
        struct ipv6_mreq mreq6;
        std::memset(&mreq6, 0, sizeof(mreq6));
        mreq6.ipv6mr_multiaddr = ((const struct sockaddr_in6 *)groupAddr.addr())->sin6_addr;
        ret = ::setsockopt(_sock, IPPROTO_IPV6, IPV6_JOIN_GROUP, (const char *)&mreq6, sizeof(mreq6));
        if (ret != 0) this->reportError("setsockopt(IPV6_JOIN_GROUP, "+group+")");
        break;
    }
    default:
        this->reportError("multicastJoin("+group+")", "unsupported address family");
        return -1;
    }
    return (ret == 0)?0:-1;
}

int SSDPSocket::selectRecv(const long timeoutUs)
{
    //clamped so the deadline arithmetic cannot overflow
    long waitUs = timeoutUs;
    if (waitUs < 0) waitUs = 0;
    if (waitUs > SSDP_PROBE_MAX_TIMEOUT_US) waitUs = SSDP_PROBE_MAX_TIMEOUT_US;
    const auto exitTime = std::chrono::steady_clock::now() + std::chrono::microseconds(waitUs);

    while (true)
    {
        //recompute the remaining time, interrupted waits must not extend the deadline
        auto remainingUs = std::chrono::duration_cast<std::chrono::microseconds>(exitTime - std::chrono::steady_clock::now()).count();
        if (remainingUs < 0) remainingUs = 0;

        //poll has no descriptor ceiling unlike an fd_set
        struct pollfd pfd;
        pfd.fd = _sock;
        pfd.events = POLLIN;
        pfd.revents = 0;

        int ret = ::poll(&pfd, 1, int((remainingUs + 999)/1000));
        if (ret == -1 and SOCKET_ERRNO == SOCKET_EINTR) continue;
        if (ret == -1) this->reportError("poll()");
        return (ret > 0)?1:ret;
    }
}

static std::string errToString(const int err)
{
    char buff[1024];
    #ifdef _MSC_VER
    FormatMessage(FORMAT_MESSAGE_FROM_SYSTEM | FORMAT_MESSAGE_IGNORE_INSERTS, NULL, err, MAKELANGID(LANG_NEUTRAL, SUBLANG_DEFAULT), (LPTSTR)&buff, sizeof(buff), NULL);
    return buff;
    #else
    //http://linux.die.net/man/3/strerror_r
    #ifdef STRERROR_R_XSI
    if (strerror_r(err, buff, sizeof(buff)) != 0) return "unknown error";
    #else
    //this version may decide to use its own internal string
    return strerror_r(err, buff, sizeof(buff));
    #endif
    return buff;
    #endif
}

void SSDPSocket::reportError(const std::string &what)
{
    this->reportError(what, SOCKET_ERRNO);
}

void SSDPSocket::reportError(const std::string &what, const int err)
{
    _lastErrorCode = err;
    if (err == 0) _lastErrorMsg = what;
    else _lastErrorMsg = what + " [" + std::to_string(err) + ": " + errToString(err) + "]";
}

void SSDPSocket::reportError(const std::string &what, const std::string &errorMsg)
{
    _lastErrorCode = 0;
    _lastErrorMsg = what + " [" + errorMsg + "]";
}

std::string SSDPSocket::getsockname(void)
{
    struct sockaddr_storage addr;
    socklen_t addrlen = sizeof(addr);
    int ret = ::getsockname(_sock, (struct sockaddr *)&addr, &addrlen);
    if (ret == -1) this->reportError("getsockname()");
    if (ret != 0) return "";
    return SSDPURL((struct sockaddr *)&addr).toString();
}
