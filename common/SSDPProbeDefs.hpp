// Copyright (c) 2015-2026 Josh Blum
// SPDX-License-Identifier: BSL-1.0

#pragma once
#include "SSDPProbeConfig.hpp"

/***********************************************************************
 * SSDP protocol constants
 **********************************************************************/
//! IPv4 multi-cast address for SSDP communications
#define SSDP_MULTICAST_ADDR_IPV4 "239.255.255.250"

//! UDP service port number for SSDP communications
#define SSDP_UDP_PORT_NUMBER "1900"

//! The HOST header value for every M-SEARCH request
#define SSDP_MSEARCH_HOST SSDP_MULTICAST_ADDR_IPV4 ":" SSDP_UDP_PORT_NUMBER

//! The MAN header value (without quotes) for discovery requests
#define SSDP_MSEARCH_MAN "ssdp:discover"

/***********************************************************************
 * Key-words and their defaults
 **********************************************************************/
//! Probe args key for the destination URL of the M-SEARCH datagram
#define SSDP_PROBE_KWARG_GROUP "group"

//! Default destination is the SSDP multicast rendezvous point
#define SSDP_PROBE_DEFAULT_GROUP "udp://" SSDP_MSEARCH_HOST

//! Probe args key for the local node to bind (the port is always ephemeral)
#define SSDP_PROBE_KWARG_BIND "bind"

//! Probe args key for the multicast time to live
#define SSDP_PROBE_KWARG_TTL "ttl"

//! UPnP 1.1 recommends a TTL of 2 for multicast discovery
#define SSDP_PROBE_DEFAULT_TTL 2

//! Probe args key to enable or disable multicast loopback
#define SSDP_PROBE_KWARG_LOOP "loop"

//! Loopback lets a responder on this host see the query
#define SSDP_PROBE_DEFAULT_LOOP true

/***********************************************************************
 * Probe defaults for callers
 **********************************************************************/
//! Search target used when the caller does not pick one
#define SSDP_PROBE_DEFAULT_ST "upnp:rootdevice"

//! MX advertised when the caller does not pick one
#define SSDP_PROBE_DEFAULT_MX 3

//! Receive window when the caller does not pick one
#define SSDP_PROBE_DEFAULT_TIMEOUT_US (5*1000*1000) //5 s

//! Longest receive window accepted, fits a 32-bit long
#define SSDP_PROBE_MAX_TIMEOUT_US (30L*60*1000*1000) //30 min

/***********************************************************************
 * Socket defaults
 **********************************************************************/
/*!
 * Receive buffer size in bytes.
 * This is the largest payload a UDP datagram can carry,
 * so a reply is never truncated by the receive call.
 */
#define SSDP_PROBE_RECV_BUFFMAX 65536
