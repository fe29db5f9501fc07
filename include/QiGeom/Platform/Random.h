#pragma once

/**
 * @file Random.h
 * @brief Random number generation utilities
 *
 * Provides thread-safe random generation for:
 * - Randomized geometry tests (points, well-formed rectangles)
 * - Sample and benchmark inputs
 */

#include <QiGeom/Core/Export.h>
#include <QiGeom/Core/Rect.h>
#include <QiGeom/Core/Types.h>

#include <cstdint>
#include <cstddef>
#include <random>
#include <type_traits>
#include <utility>

namespace Qi::Geom::Platform {

/**
 * @brief Thread-safe random number generator
 *
 * Uses MT19937-64. Each thread has its own generator instance.
 */
class QIGEOM_API Random {
public:
    /**
     * @brief Get thread-local random instance
     * @return Reference to thread-local Random instance
     */
    static Random& Instance();

    /**
     * @brief Reseed the current thread's generator
     * @param seed Seed value
     */
    void SetSeed(uint64_t seed);

    /**
     * @brief Get current seed (for reproducing a failing run)
     */
    uint64_t GetSeed() const { return seed_; }

    // =========================================================================
    // Scalar Generation
    // =========================================================================

    /**
     * @brief Generate random 32-bit unsigned integer
     */
    uint32_t Uint32();

    /**
     * @brief Generate random 32-bit unsigned integer in [min, max] (inclusive)
     */
    uint32_t Uint32(uint32_t min, uint32_t max);

    /**
     * @brief Generate random integer in range [min, max] (inclusive)
     */
    int32_t Int(int32_t min, int32_t max);

    /**
     * @brief Generate random float in [min, max)
     */
    float Float(float min, float max);

    /**
     * @brief Generate random boolean with 50% probability
     */
    bool Bool();

    /**
     * @brief Random scalar of domain T
     *
     * Integer domains draw from [min, max] inclusive, float from [min, max).
     */
    template<typename T>
    T Scalar(T min, T max);

    // =========================================================================
    // Geometry Generation
    // =========================================================================

    /**
     * @brief Random point inside bounds (half-open, same as TRect::Contains)
     * @note bounds must have positive area
     */
    template<typename T>
    TVec2<T> Point(const TRect<T>& bounds);

    /**
     * @brief Random well-formed rectangle with both corners inside bounds
     *
     * The result may have zero area on either axis.
     */
    template<typename T>
    TRect<T> WellFormedRect(const TRect<T>& bounds);

private:
    Random();
    Random(const Random&) = delete;
    Random& operator=(const Random&) = delete;

    std::mt19937_64 gen_;
    uint64_t seed_;
};

// =========================================================================
// Template Implementations
// =========================================================================

template<typename T>
T Random::Scalar(T min, T max) {
    if (min > max) {
        std::swap(min, max);
    }
    if constexpr (std::is_floating_point_v<T>) {
        if (min == max) {
            return min;
        }
        std::uniform_real_distribution<T> dist(min, max);
        T v = dist(gen_);
        // float rounding can produce max itself
        return v < max ? v : min;
    } else {
        std::uniform_int_distribution<T> dist(min, max);
        return dist(gen_);
    }
}

template<typename T>
TVec2<T> Random::Point(const TRect<T>& bounds) {
    if constexpr (std::is_floating_point_v<T>) {
        return {Scalar(bounds.topLeft.x, bounds.bottomRight.x),
                Scalar(bounds.topLeft.y, bounds.bottomRight.y)};
    } else {
        // Integer upper bound is exclusive
        return {Scalar<T>(bounds.topLeft.x, static_cast<T>(bounds.bottomRight.x - 1)),
                Scalar<T>(bounds.topLeft.y, static_cast<T>(bounds.bottomRight.y - 1))};
    }
}

template<typename T>
TRect<T> Random::WellFormedRect(const TRect<T>& bounds) {
    TVec2<T> a = Point(bounds);
    TVec2<T> b = Point(bounds);
    return TRect<T>(Min(a, b), Max(a, b));
}

// =========================================================================
// Convenience Free Functions
// =========================================================================

/**
 * @brief Generate random integer in [min, max]
 */
inline int32_t RandomInt(int32_t min, int32_t max) {
    return Random::Instance().Int(min, max);
}

/**
 * @brief Set random seed for reproducibility
 */
inline void SetRandomSeed(uint64_t seed) {
    Random::Instance().SetSeed(seed);
}

} // namespace Qi::Geom::Platform
