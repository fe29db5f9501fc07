#pragma once

/**
 * @file Export.h
 * @brief Export/import macros for shared library support
 *
 * Build system should define one of:
 *   - QIGEOM_BUILD_SHARED: when building QiGeom as shared library
 *   - QIGEOM_USE_SHARED: when using QiGeom as shared library
 *   - QIGEOM_STATIC: when building/using as static library (default)
 */

#if defined(_WIN32) || defined(_WIN64)
    #if defined(QIGEOM_BUILD_SHARED)
        #define QIGEOM_API __declspec(dllexport)
    #elif defined(QIGEOM_USE_SHARED)
        #define QIGEOM_API __declspec(dllimport)
    #else
        #define QIGEOM_API
    #endif
#else
    #if defined(QIGEOM_BUILD_SHARED)
        #define QIGEOM_API __attribute__((visibility("default")))
    #else
        #define QIGEOM_API
    #endif
#endif
