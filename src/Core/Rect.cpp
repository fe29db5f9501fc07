#include <QiGeom/Core/Rect.h>

namespace Qi::Geom {

// =============================================================================
// Constants
// =============================================================================

template<typename T>
const TRect<T> TRect<T>::ZERO{};

// =============================================================================
// Construction
// =============================================================================

template<typename T>
std::optional<TRect<T>> TRect<T>::TryFromCorners(const VecType& topLeft_,
                                                 const VecType& bottomRight_) {
    TRect rect(topLeft_, bottomRight_);
    if (!rect.IsWellFormed()) {
        return std::nullopt;
    }
    return rect;
}

// =============================================================================
// Dimensions
// =============================================================================

template<typename T>
T TRect<T>::Width() const {
    return Detail::SubScalar(bottomRight.x, topLeft.x, "TRect::Width");
}

template<typename T>
T TRect<T>::Height() const {
    return Detail::SubScalar(bottomRight.y, topLeft.y, "TRect::Height");
}

// =============================================================================
// Operations
// =============================================================================

template<typename T>
bool TRect<T>::Contains(const VecType& point) const {
    return point.x >= topLeft.x && point.y >= topLeft.y &&
           point.x < bottomRight.x && point.y < bottomRight.y;
}

template<typename T>
std::optional<TRect<T>> TRect<T>::Intersect(const TRect& other) const {
    TRect result(Max(topLeft, other.topLeft), Min(bottomRight, other.bottomRight));

    // Touching edges leave a zero-area candidate, which is not an intersection
    if (!result.IsPositiveArea()) {
        return std::nullopt;
    }
    return result;
}

template<typename T>
TRect<T> TRect<T>::WithOffset(const VecType& offset) const {
    return TRect(topLeft + offset, bottomRight + offset);
}

template<typename T>
TRect<T> TRect<T>::WithNegativeOffset(const VecType& offset) const {
    return TRect(topLeft - offset, bottomRight - offset);
}

template<typename T>
std::string TRect<T>::ToString() const {
    return "[" + Geom::ToString(topLeft) + ", " + Geom::ToString(bottomRight) + "]";
}

// =============================================================================
// Explicit Instantiations
// =============================================================================

template struct QIGEOM_API TRect<float>;
template struct QIGEOM_API TRect<uint32_t>;
template struct QIGEOM_API TRect<int32_t>;

} // namespace Qi::Geom
