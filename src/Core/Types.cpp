#include <QiGeom/Core/Types.h>
#include <QiGeom/Core/Exception.h>
#include <QiGeom/Core/Validate.h>

namespace Qi::Geom {

// =============================================================================
// Scalar Arithmetic
// =============================================================================

namespace Detail {

void ThrowIntegerOverflow(const char* funcName, int64_t lhs, char op, int64_t rhs) {
    throw OutOfRangeException(std::string(funcName) + ": integer overflow " +
                              std::to_string(lhs) + " " + op + " " + std::to_string(rhs));
}

} // namespace Detail

// =============================================================================
// TVec2 Formatting
// =============================================================================

template<typename T>
std::string ToString(const TVec2<T>& v) {
    return "(" + Validate::Detail::FormatValue(v.x) + ", " +
           Validate::Detail::FormatValue(v.y) + ")";
}

template QIGEOM_API std::string ToString(const TVec2<float>& v);
template QIGEOM_API std::string ToString(const TVec2<uint32_t>& v);
template QIGEOM_API std::string ToString(const TVec2<int32_t>& v);

} // namespace Qi::Geom
