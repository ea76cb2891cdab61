// Copyright (c) 2015-2026 Josh Blum
// SPDX-License-Identifier: BSL-1.0

#include "ConsoleLogger.hpp"
#include "SSDPDiscoveryProbe.hpp"
#include "SSDPHTTPUtils.hpp"
#include "SSDPInfoUtils.hpp"
#include "SSDPProbeDefs.hpp"
#include "SSDPSettingsUtils.hpp"
#include <SoapySDR/Logger.hpp>
#include <SoapySDR/Types.hpp>
#include <cstdlib>
#include <cstddef>
#include <iostream>
#include <stdexcept>
#include <string>
#include <getopt.h>
#include <unistd.h> //isatty

//! Exit status when the probe timed out without a reply
#define EXIT_TIMED_OUT 2

/***********************************************************************
 * Print help message
 **********************************************************************/
static int printHelp(void)
{
    std::cout << "Usage SSDPProbeUtil [options]" << std::endl;
    std::cout << "  Options summary:" << std::endl;
    std::cout << "    --help \t\t\t\t Print this help message" << std::endl;
    std::cout << "    --version \t\t\t\t Print the probe version" << std::endl;
    std::cout << "    --st=<target> \t\t\t Search target (default " SSDP_PROBE_DEFAULT_ST ")" << std::endl;
    std::cout << "    --mx=<seconds> \t\t\t Advertised max reply delay (default " << SSDP_PROBE_DEFAULT_MX << ")" << std::endl;
    std::cout << "    --timeout=<seconds> \t\t Receive window (default " << SSDP_PROBE_DEFAULT_TIMEOUT_US/1e6 << ")" << std::endl;
    std::cout << "    --args=<key=value,...> \t\t Probe settings: group, bind, ttl, loop" << std::endl;
    std::cout << "    --verbose \t\t\t\t Print debug messages" << std::endl;
    std::cout << std::endl;
    std::cout << "  Exit status: 0 replied, " << EXIT_TIMED_OUT << " timed out, 1 error" << std::endl;
    return EXIT_SUCCESS;
}

static int printVersion(void)
{
    std::cout << "SSDPProbe " << SSDPInfo::getProbeVersion() << " (" << SSDPInfo::getBuildInfo() << ")" << std::endl;
    return EXIT_SUCCESS;
}

/***********************************************************************
 * Print the outcome
 **********************************************************************/
static void printResponse(const SSDPDiscoveryResponse &response)
{
    std::cout << "Received " << response.getPayload().size() << " bytes from " << response.getSourceURL() << ":" << std::endl;
    std::cout << response.getPayload() << std::endl;

    if (not response.isWellFormed())
    {
        std::cout << "Reply is not a complete HTTP header" << std::endl;
        return;
    }

    const SSDPHTTPHeader header(response.getPayload().data(), response.getPayload().size());
    std::cout << "Status: " << header.getLine0() << std::endl;
    for (const auto &key : {"LOCATION", "ST", "USN", "SERVER", "CACHE-CONTROL"})
    {
        const auto value = header.getField(key);
        if (not value.empty()) std::cout << "  " << key << ": " << value << std::endl;
    }
}

/***********************************************************************
 * Launch the probe
 **********************************************************************/
static int runProbe(const std::string &st, const int mx, const long timeoutUs, const SoapySDR::Kwargs &args)
{
    const SSDPDiscoveryProbe probe(args);
    SoapySDR::logf(SOAPY_SDR_INFO, "Probing %s from %s (ST=%s, MX=%d, timeout=%g s)",
        probe.getGroupURL().c_str(), SSDPInfo::getHostName().c_str(), st.c_str(), mx, timeoutUs/1e6);

    const auto outcome = probe.probe(st, mx, timeoutUs);
    switch (outcome.getStatus())
    {
    case SSDPProbeOutcome::REPLIED:
        printResponse(outcome.getResponse());
        return EXIT_SUCCESS;

    case SSDPProbeOutcome::TIMED_OUT:
        std::cout << "No response received within " << timeoutUs/1e6 << " seconds" << std::endl;
        return EXIT_TIMED_OUT;

    case SSDPProbeOutcome::TRANSPORT_ERROR:
        std::cerr << "Probe transport error: " << outcome.getErrorMessage() << std::endl;
        return EXIT_FAILURE;
    }
    return EXIT_FAILURE;
}

/***********************************************************************
 * Parse and dispatch options
 **********************************************************************/
int main(int argc, char *argv[])
{
    SSDPConsoleLogger logger(isatty(STDERR_FILENO) != 0);
    SoapySDR::setLogLevel(SOAPY_SDR_INFO);

    std::string st(SSDP_PROBE_DEFAULT_ST);
    std::string mxStr(std::to_string(SSDP_PROBE_DEFAULT_MX));
    std::string timeoutStr;
    std::string argsStr;

    /*******************************************************************
     * parse command line options
     ******************************************************************/
    static struct option long_options[] = {
        {"help", no_argument, 0, 'h'},
        {"version", no_argument, 0, 'V'},
        {"st", required_argument, 0, 's'},
        {"mx", required_argument, 0, 'm'},
        {"timeout", required_argument, 0, 't'},
        {"args", required_argument, 0, 'a'},
        {"verbose", no_argument, 0, 'v'},
        {0, 0, 0,  0}
    };
    int long_index = 0;
    int option = 0;
    while ((option = getopt_long_only(argc, argv, "", long_options, &long_index)) != -1)
    {
        switch (option)
        {
        case 'h': return printHelp();
        case 'V': return printVersion();
        case 's': st = optarg; break;
        case 'm': mxStr = optarg; break;
        case 't': timeoutStr = optarg; break;
        case 'a': argsStr = optarg; break;
        case 'v': SoapySDR::setLogLevel(SOAPY_SDR_DEBUG); break;
        default: printHelp(); return EXIT_FAILURE;
        }
    }

    try
    {
        const int mx = SSDPSettings::parseInt(mxStr, "--mx");
        const long timeoutUs = timeoutStr.empty()?
            long(SSDP_PROBE_DEFAULT_TIMEOUT_US) : SSDPSettings::parseTimeoutUs(timeoutStr, "--timeout");
        if (timeoutUs <= long(mx)*1000000)
        {
            SoapySDR::logf(SOAPY_SDR_WARNING, "Timeout does not exceed MX=%d, slow responders may be missed", mx);
        }
        return runProbe(st, mx, timeoutUs, SoapySDR::KwargsFromString(argsStr));
    }
    catch (const std::invalid_argument &ex)
    {
        std::cerr << "Invalid argument: " << ex.what() << std::endl;
    }
    return EXIT_FAILURE;
}
