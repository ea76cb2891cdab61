// Copyright (c) 2015-2026 Josh Blum
// SPDX-License-Identifier: BSL-1.0

#include "SSDPSocketDefs.hpp"
#include "SSDPInfoUtils.hpp"

std::string SSDPInfo::getHostName(void)
{
    std::string hostname;
    char hostnameBuff[128];
    int ret = gethostname(hostnameBuff, sizeof(hostnameBuff));
    if (ret == 0) hostname = std::string(hostnameBuff);
    else hostname = "unknown";
    return hostname;
}

SSDP_PROBE_API std::string SSDPInfo::getProbeVersion(void)
{
    return "@SSDP_PROBE_VERSION@";
}

SSDP_PROBE_API std::string SSDPInfo::getBuildInfo(void)
{
    return "@CMAKE_SYSTEM_NAME@ SoapySDR/@SoapySDR_VERSION@";
}
