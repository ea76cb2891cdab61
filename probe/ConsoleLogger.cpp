// Copyright (c) 2015-2026 Josh Blum
// SPDX-License-Identifier: BSL-1.0

#include "ConsoleLogger.hpp"
#include <cstdio>
#include <mutex>

#define COLOR_RESET "\033[0m"
#define COLOR_RED "\033[91m"
#define COLOR_GREEN "\033[92m"
#define COLOR_YELLOW "\033[93m"
#define COLOR_BLUE "\033[94m"

/***********************************************************************
 * custom log handling
 **********************************************************************/
static std::mutex consoleMutex;

static bool consoleColor = false;

static void handleLogMessage(const SoapySDRLogLevel logLevel, const char *message)
{
    std::lock_guard<std::mutex> lock(consoleMutex);
    std::fprintf(stderr, "%s%s\n", SSDPConsoleLogger::levelBox(logLevel, consoleColor), message);
    std::fflush(stderr);
}

const char *SSDPConsoleLogger::levelBox(const SoapySDRLogLevel logLevel, const bool useColor)
{
    switch (logLevel)
    {
    case SOAPY_SDR_FATAL:
    case SOAPY_SDR_CRITICAL:
    case SOAPY_SDR_ERROR: return useColor?(COLOR_RED "[!] " COLOR_RESET):"[!] ";
    case SOAPY_SDR_WARNING: return useColor?(COLOR_YELLOW "[!] " COLOR_RESET):"[!] ";
    case SOAPY_SDR_NOTICE: return useColor?(COLOR_GREEN "[+] " COLOR_RESET):"[+] ";
    case SOAPY_SDR_INFO: return useColor?(COLOR_BLUE "[*] " COLOR_RESET):"[*] ";
    default: return "[~] "; //debug, trace, ssi
    }
}

/***********************************************************************
 * handler registration
 **********************************************************************/
SSDPConsoleLogger::SSDPConsoleLogger(const bool useColor)
{
    std::lock_guard<std::mutex> lock(consoleMutex);
    consoleColor = useColor;
    SoapySDR::registerLogHandler(&handleLogMessage);
}

SSDPConsoleLogger::~SSDPConsoleLogger(void)
{
    //null restores the default handler
    SoapySDR::registerLogHandler(nullptr);
}
