// Copyright (c) 2015-2026 Josh Blum
// SPDX-License-Identifier: BSL-1.0

#pragma once
#include <SoapySDR/Logger.hpp>

/*!
 * Route log events from the SoapySDR logger to the console
 * with a short severity box in front of every message.
 * The default handler is restored on destruction.
 */
class SSDPConsoleLogger
{
public:
    SSDPConsoleLogger(const bool useColor);
    ~SSDPConsoleLogger(void);

    //! The box printed in front of messages at this level, ex: "[!] "
    static const char *levelBox(const SoapySDRLogLevel logLevel, const bool useColor);
};
