#pragma once

/// @file export.hpp
/// Cross-platform shared-library symbol visibility macro.
///
/// Build-system defines (set automatically by CMake):
///   SVCREG_BUILDING  defined when compiling the svcreg library itself
///   SVCREG_STATIC    define when building/linking svcreg as a static lib

#if defined(SVCREG_STATIC)
  #define SVCREG_EXPORT
#elif defined(_WIN32) || defined(__CYGWIN__)
  #ifdef SVCREG_BUILDING
    #define SVCREG_EXPORT __declspec(dllexport)
  #else
    #define SVCREG_EXPORT __declspec(dllimport)
  #endif
#elif defined(__GNUC__) || defined(__clang__)
  #define SVCREG_EXPORT __attribute__((visibility("default")))
#else
  #define SVCREG_EXPORT
#endif
