#pragma once

/**
 * @file Export.h
 * @brief Export/import macros for shared library support
 *
 * Build system should define one of:
 *   - MIPROBE_BUILD_SHARED: when building MiProbe as shared library
 *   - MIPROBE_USE_SHARED: when using MiProbe as shared library
 *   - MIPROBE_STATIC: when building/using as static library (default)
 */

#if defined(_WIN32) || defined(_WIN64)
    #if defined(MIPROBE_BUILD_SHARED)
        #define MIPROBE_API __declspec(dllexport)
    #elif defined(MIPROBE_USE_SHARED)
        #define MIPROBE_API __declspec(dllimport)
    #else
        #define MIPROBE_API
    #endif
#else
    #if defined(MIPROBE_BUILD_SHARED)
        #define MIPROBE_API __attribute__((visibility("default")))
    #else
        #define MIPROBE_API
    #endif
#endif
