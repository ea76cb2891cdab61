// Copyright (c) 2015-2026 Josh Blum
// SPDX-License-Identifier: BSL-1.0

#pragma once
#include "SSDPProbeConfig.hpp"
#include <string>

/*!
 * Strict conversions for settings given as text.
 * The whole string must be consumed, otherwise
 * std::invalid_argument names the setting and the bad value.
 */
namespace SSDPSettings
{
    //! Decimal integer within the range of int
    SSDP_PROBE_API int parseInt(const std::string &value, const std::string &name);

    //! true/1/yes or false/0/no
    SSDP_PROBE_API bool parseBool(const std::string &value, const std::string &name);

    /*!
     * Seconds as a decimal number, converted to microseconds.
     * The value must be finite, non-negative,
     * and no larger than SSDP_PROBE_MAX_TIMEOUT_US.
     */
    SSDP_PROBE_API long parseTimeoutUs(const std::string &seconds, const std::string &name);
}
