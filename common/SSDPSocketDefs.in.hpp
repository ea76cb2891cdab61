// Copyright (c) 2015-2026 Josh Blum
// SPDX-License-Identifier: BSL-1.0

// Platform socket API for the discovery sockets.
// Include before any other header that may pull in windows.h.

#pragma once

/***********************************************************************
 * Winsock
 **********************************************************************/
#cmakedefine HAS_WINSOCK2_H
#cmakedefine HAS_WS2TCPIP_H
#ifdef HAS_WINSOCK2_H
#include <winsock2.h> //WSAPoll
#endif
#ifdef HAS_WS2TCPIP_H
#include <ws2tcpip.h> //getaddrinfo, ip_mreq
typedef int socklen_t;
#endif

/***********************************************************************
 * BSD sockets
 **********************************************************************/
#cmakedefine HAS_UNISTD_H
#cmakedefine HAS_NETDB_H
#cmakedefine HAS_NETINET_IN_H
#cmakedefine HAS_SYS_TYPES_H
#cmakedefine HAS_SYS_SOCKET_H
#cmakedefine HAS_POLL_H
#cmakedefine HAS_ARPA_INET_H
#ifdef HAS_UNISTD_H
#include <unistd.h>
#define closesocket close
#endif
#ifdef HAS_SYS_TYPES_H
#include <sys/types.h>
#endif
#ifdef HAS_SYS_SOCKET_H
#include <sys/socket.h>
#endif
#ifdef HAS_NETINET_IN_H
#include <netinet/in.h> //IP_MULTICAST_*
#endif
#ifdef HAS_NETDB_H
#include <netdb.h> //getaddrinfo, getnameinfo
#endif
#ifdef HAS_ARPA_INET_H
#include <arpa/inet.h> //htonl
#endif
#ifdef HAS_POLL_H
#include <poll.h>
#endif

#ifndef INVALID_SOCKET
#define INVALID_SOCKET -1
#endif

/***********************************************************************
 * Portable error and wait calls
 **********************************************************************/
#ifdef _MSC_VER
#define poll WSAPoll
#define SOCKET_ERRNO WSAGetLastError()
#define SOCKET_EINTR WSAEINTR
#else
#include <cerrno>
#define SOCKET_ERRNO errno
#define SOCKET_EINTR EINTR
#endif
