#pragma once

/**
 * @file Validate.h
 * @brief Validation utilities for QiGeom rectangles
 *
 * The rectangle types never validate on their own; callers that accept
 * untrusted geometry use these helpers at their API boundary.
 *
 * Design principles:
 * - Checks are opt-in, the value types stay zero-overhead
 * - Failures throw InvalidArgumentException
 * - Consistent error message format: "<funcName>: <reason> <rect>"
 */

#include <QiGeom/Core/Export.h>
#include <QiGeom/Core/Exception.h>
#include <QiGeom/Core/Rect.h>

#include <cmath>
#include <cstdio>
#include <string>

namespace Qi::Geom::Validate {

// =============================================================================
// Internal Formatting
// =============================================================================

namespace Detail {

// Format double with limited precision (avoid long tails)
inline std::string FormatValue(double val) {
    char buf[32];
    std::snprintf(buf, sizeof(buf), "%.6g", val);
    return buf;
}

inline std::string FormatValue(float val) {
    char buf[32];
    std::snprintf(buf, sizeof(buf), "%.6g", static_cast<double>(val));
    return buf;
}

inline std::string FormatValue(int32_t val) {
    return std::to_string(val);
}

inline std::string FormatValue(uint32_t val) {
    return std::to_string(val);
}

} // namespace Detail

// =============================================================================
// Rectangle Validation
// =============================================================================

/**
 * @brief Check corners are not inverted (topLeft <= bottomRight per axis)
 *
 * Zero-area rectangles pass.
 *
 * @param rect Input rectangle
 * @param funcName Function name for error messages
 * @throws InvalidArgumentException if the corners are inverted
 */
template<typename T>
void RequireWellFormed(const TRect<T>& rect, const char* funcName) {
    if (!rect.IsWellFormed()) {
        throw InvalidArgumentException(
            std::string(funcName) + ": inverted corners " + rect.ToString());
    }
}

/**
 * @brief Check rectangle has strictly positive extent on both axes
 *
 * @param rect Input rectangle
 * @param funcName Function name for error messages
 * @throws InvalidArgumentException if width or height is not positive
 */
template<typename T>
void RequirePositiveArea(const TRect<T>& rect, const char* funcName) {
    if (!rect.IsPositiveArea()) {
        throw InvalidArgumentException(
            std::string(funcName) + ": rectangle has no positive area " + rect.ToString());
    }
}

/**
 * @brief Check all coordinates are finite
 *
 * Integer domains always pass.
 *
 * @throws InvalidArgumentException on NaN or infinite coordinates
 */
template<typename T>
void RequireFinite(const TRect<T>& rect, const char* funcName) {
    if constexpr (ScalarTraits<T>::IsFloating) {
        bool finite = std::isfinite(rect.topLeft.x) && std::isfinite(rect.topLeft.y) &&
                      std::isfinite(rect.bottomRight.x) && std::isfinite(rect.bottomRight.y);
        if (!finite) {
            throw InvalidArgumentException(
                std::string(funcName) + ": non-finite coordinates " + rect.ToString());
        }
    } else {
        (void)rect;
        (void)funcName;
    }
}

} // namespace Qi::Geom::Validate
