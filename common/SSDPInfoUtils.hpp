// Copyright (c) 2015-2026 Josh Blum
// SPDX-License-Identifier: BSL-1.0

#pragma once
#include "SSDPProbeConfig.hpp"
#include <string>

namespace SSDPInfo
{
    //! Get the hostname
    SSDP_PROBE_API std::string getHostName(void);

    /*!
     * Get the probe version string for this build.
     */
    SSDP_PROBE_API std::string getProbeVersion(void);

    /*!
     * Describe the build: system name and SoapySDR version.
     */
    SSDP_PROBE_API std::string getBuildInfo(void);
};
