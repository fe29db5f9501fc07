#pragma once

/**
 * @file Rect.h
 * @brief Axis-aligned rectangle defined by two corner points
 *
 * Coordinate convention: y grows downward, so the top-left corner holds the
 * minimum coordinates and the bottom-right corner the maximum coordinates.
 *
 * Design principles:
 * - Plain value type, no validation at construction (caller guarantees
 *   topLeft <= bottomRight on both axes)
 * - Containment is half-open: [left, right) x [top, bottom)
 * - Intersection returns std::nullopt unless the overlap has positive area
 * - One generic definition, instantiated for float, uint32_t and int32_t
 */

#include <QiGeom/Core/Export.h>
#include <QiGeom/Core/Types.h>

#include <array>
#include <optional>
#include <ostream>
#include <string>
#include <type_traits>

namespace Qi::Geom {

/**
 * @brief Axis-aligned rectangle with component type T
 *
 * Inverted corners are a caller error: Width()/Height() then return
 * negative values (signed domains) or wrap (unsigned domain, see
 * QIGEOM_DEBUG_CHECKS).
 */
template<typename T>
struct TRect {
    using ValueType = T;
    using VecType = TVec2<T>;

    VecType topLeft;
    VecType bottomRight;

    constexpr TRect() = default;

    /// Construct from two corners (stored verbatim)
    constexpr TRect(const VecType& topLeft_, const VecType& bottomRight_)
        : topLeft(topLeft_), bottomRight(bottomRight_) {}

    /// Construct from corner coordinates (x1, y1) top-left, (x2, y2) bottom-right
    constexpr TRect(T x1, T y1, T x2, T y2)
        : topLeft(x1, y1), bottomRight(x2, y2) {}

    /// Both corners at the origin
    static const TRect ZERO;

    /// Rectangle with both corners at the origin
    static constexpr TRect Zero() { return TRect(); }

    /// Same as the four-scalar constructor
    static constexpr TRect FromCoords(T x1, T y1, T x2, T y2) {
        return TRect(x1, y1, x2, y2);
    }

    /// Rectangle spanning [position, position + size)
    static constexpr TRect FromPositionSize(const VecType& position, const VecType& size) {
        return TRect(position, position + size);
    }

    /**
     * @brief Validating constructor
     * @return std::nullopt if the corners are inverted on either axis
     */
    static std::optional<TRect> TryFromCorners(const VecType& topLeft_,
                                               const VecType& bottomRight_);

    // =========================================================================
    // Corners
    // =========================================================================

    constexpr VecType TopRight() const { return {bottomRight.x, topLeft.y}; }
    constexpr VecType BottomLeft() const { return {topLeft.x, bottomRight.y}; }

    /// Corners clockwise from top-left: TL, TR, BR, BL
    constexpr std::array<VecType, 4> Corners() const {
        return {topLeft, TopRight(), bottomRight, BottomLeft()};
    }

    // =========================================================================
    // Dimensions
    // =========================================================================

    /**
     * @brief bottomRight.x - topLeft.x
     *
     * Integer domains wrap on overflow (inverted URect, or an IRect wider
     * than INT32_MAX). With QIGEOM_DEBUG_CHECKS they throw
     * OutOfRangeException instead.
     */
    T Width() const;

    /// bottomRight.y - topLeft.y
    T Height() const;

    VecType Size() const { return {Width(), Height()}; }

    /// True if collapsed on at least one axis
    constexpr bool IsZeroArea() const {
        return topLeft.x == bottomRight.x || topLeft.y == bottomRight.y;
    }

    /**
     * @brief True if strictly positive extent on both axes
     * @note Not the complement of IsZeroArea(): an inverted rectangle is
     *       neither zero-area nor positive-area.
     */
    constexpr bool IsPositiveArea() const {
        return topLeft.x < bottomRight.x && topLeft.y < bottomRight.y;
    }

    /// True if topLeft <= bottomRight on both axes
    constexpr bool IsWellFormed() const {
        return topLeft.x <= bottomRight.x && topLeft.y <= bottomRight.y;
    }

    // =========================================================================
    // Operations
    // =========================================================================

    /// Half-open containment: inclusive top/left, exclusive bottom/right
    bool Contains(const VecType& point) const;

    /**
     * @brief Overlapping region of two rectangles
     * @return std::nullopt if the overlap has no positive area
     *         (disjoint or only touching along an edge)
     */
    std::optional<TRect> Intersect(const TRect& other) const;

    /// Both corners translated by +offset
    TRect WithOffset(const VecType& offset) const;

    /// Both corners translated by -offset (no negation required)
    TRect WithNegativeOffset(const VecType& offset) const;

    /// Format as "[(x1, y1), (x2, y2)]"
    std::string ToString() const;

    constexpr bool operator==(const TRect& other) const {
        return topLeft == other.topLeft && bottomRight == other.bottomRight;
    }

    constexpr bool operator!=(const TRect& other) const {
        return !(*this == other);
    }
};

template<typename T>
std::ostream& operator<<(std::ostream& os, const TRect<T>& rect) {
    return os << rect.ToString();
}

// =============================================================================
// Domain Aliases
// =============================================================================

using Rect  = TRect<float>;      ///< Floating-point rectangle
using URect = TRect<uint32_t>;   ///< Unsigned integer rectangle
using IRect = TRect<int32_t>;    ///< Signed integer rectangle

extern template struct QIGEOM_API TRect<float>;
extern template struct QIGEOM_API TRect<uint32_t>;
extern template struct QIGEOM_API TRect<int32_t>;

static_assert(std::is_standard_layout_v<Rect> && sizeof(Rect) == 4 * sizeof(float),
              "Rect must be four packed floats");
static_assert(std::is_standard_layout_v<URect> && sizeof(URect) == 4 * sizeof(uint32_t),
              "URect must be four packed uint32_t");
static_assert(std::is_standard_layout_v<IRect> && sizeof(IRect) == 4 * sizeof(int32_t),
              "IRect must be four packed int32_t");

} // namespace Qi::Geom
