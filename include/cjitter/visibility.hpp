#pragma once

/**
 * Symbol visibility for the cjitter library.
 *
 * When the library is built shared (CJITTER_BUILDING_DLL defined by the
 * build), public entry points are exported and everything else stays
 * hidden. Static builds expand both macros to nothing useful.
 */
#if defined(_WIN32) || defined(__CYGWIN__)
  #ifdef CJITTER_BUILDING_DLL
    #define CJITTER_API __declspec(dllexport)
  #else
    #define CJITTER_API
  #endif
  #define CJITTER_LOCAL
#else
  #if __GNUC__ >= 4
    #ifdef CJITTER_BUILDING_DLL
      #define CJITTER_API   __attribute__((visibility("default")))
    #else
      #define CJITTER_API
    #endif
    #define CJITTER_LOCAL __attribute__((visibility("hidden")))
  #else
    #define CJITTER_API
    #define CJITTER_LOCAL
  #endif
#endif
