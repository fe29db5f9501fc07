#pragma once

/**
 * @file QiGeom.h
 * @brief Main header file for QiGeom library
 *
 * QiGeom provides axis-aligned rectangle algebra over float, unsigned and
 * signed integer coordinates, shared by layout, rendering and spatial
 * indexing code.
 *
 * @author QiGeom Team
 * @version 0.1.0
 */

// Configuration and export macros
#include <QiGeom/QiGeomConfig.h>
#include <QiGeom/Core/Export.h>

// Core types and utilities
#include <QiGeom/Core/Types.h>
#include <QiGeom/Core/Exception.h>
#include <QiGeom/Core/Rect.h>
#include <QiGeom/Core/Validate.h>

namespace Qi::Geom {

/**
 * @brief Get library version string
 * @return Version string in format "major.minor.patch"
 */
inline const char* GetVersion() {
    return QIGEOM_VERSION_STRING;
}

/**
 * @brief Get library version as integers
 */
inline void GetVersion(int& major, int& minor, int& patch) {
    major = QIGEOM_VERSION_MAJOR;
    minor = QIGEOM_VERSION_MINOR;
    patch = QIGEOM_VERSION_PATCH;
}

/**
 * @brief True if unsigned underflow checks are compiled in
 */
inline bool DebugChecksEnabled() {
    return QIGEOM_DEBUG_CHECKS != 0;
}

} // namespace Qi::Geom
