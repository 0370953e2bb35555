#pragma once

/// @file export.hpp
/// Cross-platform shared-library symbol visibility macro.
///
/// Build-system defines (set automatically by CMake):
///   SVCDI_BUILDING : defined when compiling the svcdi library itself
///   SVCDI_STATIC   : define when building/linking svcdi as a static lib

#if defined(SVCDI_STATIC)
  #define SVCDI_EXPORT
#elif defined(_WIN32) || defined(__CYGWIN__)
  #ifdef SVCDI_BUILDING
    #define SVCDI_EXPORT __declspec(dllexport)
  #else
    #define SVCDI_EXPORT __declspec(dllimport)
  #endif
#elif defined(__GNUC__) || defined(__clang__)
  #define SVCDI_EXPORT __attribute__((visibility("default")))
#else
  #define SVCDI_EXPORT
#endif
