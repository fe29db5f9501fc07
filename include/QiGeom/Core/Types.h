#pragma once

/**
 * @file Types.h
 * @brief Core type definitions for QiGeom
 *
 * Provides the scalar domain contract and the 2D vector type shared by
 * all rectangle instantiations.
 */

#include <QiGeom/Core/Export.h>
#include <QiGeom/QiGeomConfig.h>

#include <cmath>
#include <cstdint>
#include <ostream>
#include <string>
#include <type_traits>

namespace Qi::Geom {

// =============================================================================
// Scalar Domains
// =============================================================================

/**
 * @brief Capability set of a numeric domain usable by TVec2 / TRect
 *
 * A domain must be an ordered arithmetic scalar supporting +, -, min, max
 * and a zero value. Unsigned domains have no negation.
 */
template<typename T>
struct ScalarTraits {
    static_assert(std::is_arithmetic_v<T> && !std::is_same_v<T, bool>,
                  "QiGeom scalar domain must be an arithmetic type");

    static constexpr bool IsUnsigned = std::is_unsigned_v<T>;
    static constexpr bool IsFloating = std::is_floating_point_v<T>;
    static constexpr bool HasNegation = std::is_signed_v<T>;

    static constexpr T Zero() { return T(0); }
};

// =============================================================================
// Scalar Arithmetic
// =============================================================================

namespace Detail {

/// Throws OutOfRangeException "<funcName>: integer overflow <lhs> <op> <rhs>"
[[noreturn]] QIGEOM_API void ThrowIntegerOverflow(const char* funcName, int64_t lhs,
                                                  char op, int64_t rhs);

/**
 * @brief a + b in domain T
 *
 * Integer domains wrap modulo 2^N. With QIGEOM_DEBUG_CHECKS, overflow throws
 * OutOfRangeException instead.
 */
template<typename T>
constexpr T AddScalar(T a, T b, const char* funcName) {
    if constexpr (ScalarTraits<T>::IsFloating) {
        (void)funcName;
        return a + b;
    } else {
        using U = std::make_unsigned_t<T>;
        T r = static_cast<T>(static_cast<U>(static_cast<U>(a) + static_cast<U>(b)));
#if QIGEOM_DEBUG_CHECKS
        bool overflow = (ScalarTraits<T>::IsUnsigned || b >= T(0)) ? (r < a) : (r > a);
        if (overflow) {
            ThrowIntegerOverflow(funcName, static_cast<int64_t>(a), '+', static_cast<int64_t>(b));
        }
#else
        (void)funcName;
#endif
        return r;
    }
}

/**
 * @brief a - b in domain T
 *
 * Same overflow rules as AddScalar.
 */
template<typename T>
constexpr T SubScalar(T a, T b, const char* funcName) {
    if constexpr (ScalarTraits<T>::IsFloating) {
        (void)funcName;
        return a - b;
    } else {
        using U = std::make_unsigned_t<T>;
        T r = static_cast<T>(static_cast<U>(static_cast<U>(a) - static_cast<U>(b)));
#if QIGEOM_DEBUG_CHECKS
        bool overflow = (ScalarTraits<T>::IsUnsigned || b >= T(0)) ? (r > a) : (r < a);
        if (overflow) {
            ThrowIntegerOverflow(funcName, static_cast<int64_t>(a), '-', static_cast<int64_t>(b));
        }
#else
        (void)funcName;
#endif
        return r;
    }
}

/// Smaller of a and b; for float a NaN operand is ignored
template<typename T>
T MinScalar(T a, T b) {
    if constexpr (ScalarTraits<T>::IsFloating) {
        return std::fmin(a, b);
    } else {
        return b < a ? b : a;
    }
}

/// Larger of a and b; for float a NaN operand is ignored
template<typename T>
T MaxScalar(T a, T b) {
    if constexpr (ScalarTraits<T>::IsFloating) {
        return std::fmax(a, b);
    } else {
        return a < b ? b : a;
    }
}

} // namespace Detail

// =============================================================================
// 2D Vector Type
// =============================================================================

/**
 * @brief 2D vector / point with component type T
 * @note Standard layout: x then y, no padding
 */
template<typename T>
struct TVec2 {
    using ValueType = T;

    T x = ScalarTraits<T>::Zero();
    T y = ScalarTraits<T>::Zero();

    constexpr TVec2() = default;
    constexpr TVec2(T x_, T y_) : x(x_), y(y_) {}

    /// Both components at zero
    static const TVec2 ZERO;

    /// Vector with both components at zero
    static constexpr TVec2 Zero() { return TVec2(); }

    /// Vector addition
    constexpr TVec2 operator+(const TVec2& other) const {
        return {Detail::AddScalar(x, other.x, "TVec2::operator+"),
                Detail::AddScalar(y, other.y, "TVec2::operator+")};
    }

    /// Vector subtraction
    constexpr TVec2 operator-(const TVec2& other) const {
        return {Detail::SubScalar(x, other.x, "TVec2::operator-"),
                Detail::SubScalar(y, other.y, "TVec2::operator-")};
    }

    TVec2& operator+=(const TVec2& other) {
        *this = *this + other;
        return *this;
    }

    TVec2& operator-=(const TVec2& other) {
        *this = *this - other;
        return *this;
    }

    /// Negation (signed domains only)
    template<typename U = T, typename = std::enable_if_t<ScalarTraits<U>::HasNegation>>
    constexpr TVec2 operator-() const {
        return {Detail::SubScalar(T(0), x, "TVec2::operator-"),
                Detail::SubScalar(T(0), y, "TVec2::operator-")};
    }

    constexpr bool operator==(const TVec2& other) const {
        return x == other.x && y == other.y;
    }

    constexpr bool operator!=(const TVec2& other) const {
        return !(*this == other);
    }
};

template<typename T>
const TVec2<T> TVec2<T>::ZERO{};

/// Component-wise minimum (commutative, NaN components ignored)
template<typename T>
TVec2<T> Min(const TVec2<T>& a, const TVec2<T>& b) {
    return {Detail::MinScalar(a.x, b.x), Detail::MinScalar(a.y, b.y)};
}

/// Component-wise maximum (commutative, NaN components ignored)
template<typename T>
TVec2<T> Max(const TVec2<T>& a, const TVec2<T>& b) {
    return {Detail::MaxScalar(a.x, b.x), Detail::MaxScalar(a.y, b.y)};
}

/**
 * @brief Format vector as "(x, y)"
 * @note Instantiated for float, uint32_t and int32_t
 */
template<typename T>
QIGEOM_API std::string ToString(const TVec2<T>& v);

template<typename T>
std::ostream& operator<<(std::ostream& os, const TVec2<T>& v) {
    return os << ToString(v);
}

// =============================================================================
// Domain Aliases
// =============================================================================

using Vec2  = TVec2<float>;      ///< Floating-point vector
using UVec2 = TVec2<uint32_t>;   ///< Unsigned integer vector
using IVec2 = TVec2<int32_t>;    ///< Signed integer vector

static_assert(std::is_standard_layout_v<Vec2> && sizeof(Vec2) == 2 * sizeof(float),
              "Vec2 must be two packed floats");
static_assert(std::is_standard_layout_v<UVec2> && sizeof(UVec2) == 2 * sizeof(uint32_t),
              "UVec2 must be two packed uint32_t");
static_assert(std::is_standard_layout_v<IVec2> && sizeof(IVec2) == 2 * sizeof(int32_t),
              "IVec2 must be two packed int32_t");

} // namespace Qi::Geom
