// Copyright (c) 2015-2026 Josh Blum
// SPDX-License-Identifier: BSL-1.0

#pragma once
#include "SSDPProbeConfig.hpp"
#include <cstddef>
#include <string>

/*!
 * Create one instance of the session per process to use sockets.
 */
class SSDP_PROBE_API SSDPSocketSession
{
public:
    SSDPSocketSession(void);
    ~SSDPSocketSession(void);
};

/*!
 * A simple datagram socket wrapper for discovery traffic.
 * The socket is closed by the destructor on every path,
 * so a stack instance bounds the lifetime of the descriptor.
 */
class SSDP_PROBE_API SSDPSocket
{
public:
    SSDPSocket(void);

    ~SSDPSocket(void);

    /*!
     * Is the socket null?
     * The default constructor makes a null socket.
     * The socket is non null after bind.
     */
    bool null(void) const;

    /*!
     * Explicit close the socket, also done by destructor.
     */
    int close(void);

    /*!
     * Bind to a local address.
     * URL examples:
     * udp://0.0.0.0:0
     * udp://[::]:0
     */
    int bind(const std::string &url);

    /*!
     * Configure options for sending to a multi-cast group.
     * The socket must already exist (after bind).
     * \param sendAddr the local interface address or empty for automatic
     * \param loop specify to receive local loopback
     * \param ttl specify time to live for send packets
     */
    int multicastSetup(const std::string &sendAddr, const bool loop = true, const int ttl = 1);

    /*!
     * Join a multi-cast group to receive its traffic.
     * The socket must already be bound to the group port.
     * \param group the group url, example udp://239.255.255.250:1900
     * \param recvAddr the local interface address or empty for any
     */
    int multicastJoin(const std::string &group, const std::string &recvAddr = "");

    /*!
     * Send to a specific destination.
     */
    int sendto(const void *buf, size_t len, const std::string &url, int flags = 0);

    /*!
     * Receive from an unconnected socket.
     */
    int recvfrom(void *buf, size_t len, std::string &url, int flags = 0);

    /*!
     * Wait for recv to become ready with timeout.
     * The wait resumes after interrupts until the deadline.
     * Waits longer than SSDP_PROBE_MAX_TIMEOUT_US are clamped.
     * Return 1 for ready, 0 for timeout, -1 for error.
     */
    int selectRecv(const long timeoutUs);

    /*!
     * Query the last error message as a string.
     */
    const char *lastErrorMsg(void) const
    {
        return _lastErrorMsg.c_str();
    }

    //! The system error code behind the last error (0 when unknown)
    int lastErrorCode(void) const
    {
        return _lastErrorCode;
    }

    /*!
     * Get the URL of the local socket.
     * Return an empty string on error.
     */
    std::string getsockname(void);

private:
    //non-copyable, the descriptor has a single owner
    SSDPSocket(const SSDPSocket &);
    SSDPSocket &operator=(const SSDPSocket &);

    int _sock;
    int _family;
    std::string _lastErrorMsg;
    int _lastErrorCode;

    void reportError(const std::string &what, const std::string &errorMsg);
    void reportError(const std::string &what, const int err);
    void reportError(const std::string &what);
};
