// Copyright (c) 2015-2026 Josh Blum
// SPDX-License-Identifier: BSL-1.0

#pragma once
#include "SSDPProbeConfig.hpp"
#include <string>

/*!
 * HTTP-like header block used by SSDP over UDP.
 * Build a header with line0 + addField + finalize,
 * or wrap a received datagram to read its fields.
 */
class SSDP_PROBE_API SSDPHTTPHeader
{
public:

    //! Create an HTTP header given request/response line
    SSDPHTTPHeader(const std::string &line0);

    //! Add a key/value field to the header
    void addField(const std::string &key, const std::string &value);

    //! Done adding fields to the header
    void finalize(void);

    //! Create an HTTP from a received datagram
    SSDPHTTPHeader(const void *buff, const size_t length);

    //! Get the request/response line
    std::string getLine0(void) const;

    /*!
     * Read a field from the HTTP header.
     * Keys match without regard to case.
     * \return the value or empty when missing or truncated
     */
    std::string getField(const std::string &key) const;

    //! True when the block ends with the blank line terminator
    bool isTerminated(void) const;

    const void *data(void) const
    {
        return _storage.data();
    }

    size_t size(void) const
    {
        return _storage.size();
    }

    const std::string &toString(void) const
    {
        return _storage;
    }

private:
    std::string _storage;
};
