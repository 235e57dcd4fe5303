#pragma once

/**
 * @file Export.h
 * @brief Export/import macros for shared library support
 *
 * Build system should define one of:
 *   - CHTVISION_BUILD_SHARED: when building ChtVision as shared library
 *   - CHTVISION_USE_SHARED: when using ChtVision as shared library
 *   - nothing: static library (default)
 */

#if defined(_WIN32) || defined(_WIN64)
    #if defined(CHTVISION_BUILD_SHARED)
        #define CHTVISION_API __declspec(dllexport)
    #elif defined(CHTVISION_USE_SHARED)
        #define CHTVISION_API __declspec(dllimport)
    #else
        #define CHTVISION_API
    #endif
#else
    #if defined(CHTVISION_BUILD_SHARED)
        #define CHTVISION_API __attribute__((visibility("default")))
    #else
        #define CHTVISION_API
    #endif
#endif
