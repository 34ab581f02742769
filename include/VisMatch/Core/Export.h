#pragma once

/**
 * @file Export.h
 * @brief Export/import macros for shared library support
 *
 * Build system should define one of:
 *   - VISMATCH_BUILD_SHARED: when building VisMatch as shared library
 *   - VISMATCH_USE_SHARED: when using VisMatch as shared library
 *   - VISMATCH_STATIC: when building/using as static library (default)
 */

#if defined(_WIN32) || defined(_WIN64)
    #if defined(VISMATCH_BUILD_SHARED)
        #define VISMATCH_API __declspec(dllexport)
    #elif defined(VISMATCH_USE_SHARED)
        #define VISMATCH_API __declspec(dllimport)
    #else
        #define VISMATCH_API
    #endif
#else
    #if defined(VISMATCH_BUILD_SHARED)
        #define VISMATCH_API __attribute__((visibility("default")))
    #else
        #define VISMATCH_API
    #endif
#endif
