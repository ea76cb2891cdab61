// Copyright (c) 2015-2026 Josh Blum
// SPDX-License-Identifier: BSL-1.0

#include "SSDPSettingsUtils.hpp"
#include "SSDPProbeDefs.hpp"
#include <cmath> //isfinite
#include <stdexcept>

static std::invalid_argument badSetting(const std::string &what, const std::string &name, const std::string &value)
{
    return std::invalid_argument("bad "+what+" for "+name+": '"+value+"'");
}

int SSDPSettings::parseInt(const std::string &value, const std::string &name)
{
    size_t pos = 0;
    int result = 0;
    try
    {
        result = std::stoi(value, &pos);
    }
    catch (const std::logic_error &)
    {
        throw badSetting("integer", name, value);
    }
    if (pos != value.size()) throw badSetting("integer", name, value);
    return result;
}

bool SSDPSettings::parseBool(const std::string &value, const std::string &name)
{
    if (value == "true" or value == "1" or value == "yes") return true;
    if (value == "false" or value == "0" or value == "no") return false;
    throw badSetting("boolean", name, value);
}

long SSDPSettings::parseTimeoutUs(const std::string &seconds, const std::string &name)
{
    size_t pos = 0;
    double value = 0.0;
    try
    {
        value = std::stod(seconds, &pos);
    }
    catch (const std::logic_error &)
    {
        throw badSetting("number", name, seconds);
    }
    if (pos != seconds.size()) throw badSetting("number", name, seconds);

    //range check in floating point, the cast below is only defined in range
    const double us = value*1e6;
    if (not std::isfinite(us) or us < 0.0 or us > double(SSDP_PROBE_MAX_TIMEOUT_US))
    {
        throw std::invalid_argument(name+" out of range [0, "+std::to_string(SSDP_PROBE_MAX_TIMEOUT_US/1000000)+"] seconds: '"+seconds+"'");
    }
    return long(us);
}
