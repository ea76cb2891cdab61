// Copyright (c) 2015-2026 Josh Blum
// SPDX-License-Identifier: BSL-1.0

#pragma once
#include <SoapySDR/Config.hpp>

/***********************************************************************
 * API export defines
 **********************************************************************/
#ifdef SSDP_PROBE_DLL // defined if the probe is compiled as a DLL
  #ifdef SSDP_PROBE_DLL_EXPORTS // defined if we are building the DLL (instead of using it)
    #define SSDP_PROBE_API SOAPY_SDR_HELPER_DLL_EXPORT
  #else
    #define SSDP_PROBE_API SOAPY_SDR_HELPER_DLL_IMPORT
  #endif // SSDP_PROBE_DLL_EXPORTS
  #define SSDP_PROBE_LOCAL SOAPY_SDR_HELPER_DLL_LOCAL
#else // SSDP_PROBE_DLL is not defined: this means the probe is a static lib.
  #define SSDP_PROBE_API SOAPY_SDR_HELPER_DLL_EXPORT
#endif // SSDP_PROBE_DLL
