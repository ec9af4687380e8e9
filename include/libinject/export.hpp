#pragma once

/// @file export.hpp
/// Cross-platform shared-library symbol visibility macro.
///
/// Build-system defines (set automatically by CMake):
///   LIBINJECT_BUILDING : defined when compiling the libinject library itself
///   LIBINJECT_STATIC   : define when building/linking libinject as a static lib

#if defined(LIBINJECT_STATIC)
  #define LIBINJECT_EXPORT
#elif defined(_WIN32) || defined(__CYGWIN__)
  #ifdef LIBINJECT_BUILDING
    #define LIBINJECT_EXPORT __declspec(dllexport)
  #else
    #define LIBINJECT_EXPORT __declspec(dllimport)
  #endif
#elif defined(__GNUC__) || defined(__clang__)
  #define LIBINJECT_EXPORT __attribute__((visibility("default")))
#else
  #define LIBINJECT_EXPORT
#endif
