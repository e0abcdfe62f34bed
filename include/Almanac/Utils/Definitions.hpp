#pragma once

// Fixes conflict in Windows with <windows.h>
#ifdef _WIN32
  #undef ERROR
#endif

#ifndef ALMANAC_VERSION
  #define ALMANAC_VERSION "0.1.0"
#endif

/// Number of concurrent archive requests allowed per fetch.
#define ALMANAC_MAX_CONCURRENT_FETCHES 5

/// Largest number of past years one fetch may ask for.
#define ALMANAC_MAX_YEARS_BACK 100

/// Macro alias for trailing return type functions.
#define fn auto
