#pragma once

#include <QiGeom/Core/Export.h>

/**
 * @file Exception.h
 * @brief Exception classes for QiGeom
 */

#include <stdexcept>
#include <string>

namespace Qi::Geom {

/**
 * @brief Base exception class for QiGeom
 */
class QIGEOM_API Exception : public std::runtime_error {
public:
    explicit Exception(const std::string& message)
        : std::runtime_error(message) {}

    explicit Exception(const char* message)
        : std::runtime_error(message) {}
};

/**
 * @brief Invalid argument exception (e.g., inverted rectangle corners)
 */
class QIGEOM_API InvalidArgumentException : public Exception {
public:
    explicit InvalidArgumentException(const std::string& message)
        : Exception("Invalid argument: " + message) {}
};

/**
 * @brief Out of range exception (e.g., unsigned coordinate underflow)
 */
class QIGEOM_API OutOfRangeException : public Exception {
public:
    explicit OutOfRangeException(const std::string& message)
        : Exception("Out of range: " + message) {}
};

} // namespace Qi::Geom
