/**
 * @file test_rect_properties.cpp
 * @brief Randomized property tests for TRect intersection, containment and offset
 */

#include <gtest/gtest.h>
#include <QiGeom/Core/Rect.h>
#include <QiGeom/Platform/Random.h>

using namespace Qi::Geom;
using namespace Qi::Geom::Platform;

namespace {

constexpr int kIterations = 2000;

// Coordinates stay small and integral so float sums are exact and signed
// arithmetic cannot overflow.
template<typename R>
R Bounds() {
    using T = typename R::ValueType;
    return R(T(0), T(0), T(1000), T(1000));
}

template<typename T>
TVec2<T> RandomIntegralVec(Random& rng, int32_t maxCoord) {
    return TVec2<T>(static_cast<T>(rng.Int(0, maxCoord)),
                    static_cast<T>(rng.Int(0, maxCoord)));
}

} // anonymous namespace

template<typename R>
class RectPropertyTest : public ::testing::Test {
protected:
    using T = typename R::ValueType;

    void SetUp() override {
        Random::Instance().SetSeed(20240611);
    }

    R RandomRect() {
        Random& rng = Random::Instance();
        TVec2<T> a = RandomIntegralVec<T>(rng, 1000);
        TVec2<T> b = RandomIntegralVec<T>(rng, 1000);
        return R(Min(a, b), Max(a, b));
    }
};

using PropertyDomains = ::testing::Types<Rect, URect, IRect>;
TYPED_TEST_SUITE(RectPropertyTest, PropertyDomains);

TYPED_TEST(RectPropertyTest, SelfIntersectionIdentity) {
    for (int i = 0; i < kIterations; ++i) {
        TypeParam r = this->RandomRect();
        if (r.IsPositiveArea()) {
            EXPECT_EQ(r.Intersect(r), r) << r;
        } else {
            EXPECT_FALSE(r.Intersect(r).has_value()) << r;
        }
    }
}

TYPED_TEST(RectPropertyTest, IntersectionIsSymmetric) {
    for (int i = 0; i < kIterations; ++i) {
        TypeParam a = this->RandomRect();
        TypeParam b = this->RandomRect();
        EXPECT_EQ(a.Intersect(b), b.Intersect(a)) << a << " / " << b;
    }
}

TYPED_TEST(RectPropertyTest, IntersectionLiesInBothInputs) {
    for (int i = 0; i < kIterations; ++i) {
        TypeParam a = this->RandomRect();
        TypeParam b = this->RandomRect();
        auto result = a.Intersect(b);
        if (!result) {
            continue;
        }
        EXPECT_TRUE(result->IsPositiveArea());
        EXPECT_EQ(a.Intersect(*result), result);
        EXPECT_EQ(b.Intersect(*result), result);
        EXPECT_TRUE(a.Contains(result->topLeft));
        EXPECT_TRUE(b.Contains(result->topLeft));
    }
}

TYPED_TEST(RectPropertyTest, IntersectionMatchesContainment) {
    Random& rng = Random::Instance();
    TypeParam bounds = Bounds<TypeParam>();
    for (int i = 0; i < kIterations; ++i) {
        TypeParam a = this->RandomRect();
        TypeParam b = this->RandomRect();
        auto p = rng.Point(bounds);
        auto result = a.Intersect(b);
        bool inBoth = a.Contains(p) && b.Contains(p);
        bool inResult = result.has_value() && result->Contains(p);
        EXPECT_EQ(inBoth, inResult) << a << " / " << b << " at " << p;
    }
}

TYPED_TEST(RectPropertyTest, OffsetRoundTrip) {
    Random& rng = Random::Instance();
    for (int i = 0; i < kIterations; ++i) {
        TypeParam r = this->RandomRect();
        auto v = RandomIntegralVec<typename TypeParam::ValueType>(rng, 5000);
        EXPECT_EQ(r.WithOffset(v).WithNegativeOffset(v), r) << r << " by " << v;
    }
}

TYPED_TEST(RectPropertyTest, OffsetPreservesContainment) {
    using T = typename TypeParam::ValueType;
    Random& rng = Random::Instance();
    for (int i = 0; i < kIterations; ++i) {
        TypeParam r = this->RandomRect();
        auto p = RandomIntegralVec<T>(rng, 1000);
        auto v = RandomIntegralVec<T>(rng, 500);
        EXPECT_EQ(r.Contains(p), r.WithOffset(v).Contains(p + v));
    }
}

TYPED_TEST(RectPropertyTest, WellFormedRectsAreClassified) {
    Random& rng = Random::Instance();
    TypeParam bounds = Bounds<TypeParam>();
    for (int i = 0; i < kIterations; ++i) {
        TypeParam r = rng.WellFormedRect(bounds);
        ASSERT_TRUE(r.IsWellFormed()) << r;
        // For well-formed input the two predicates are complements
        EXPECT_NE(r.IsZeroArea(), r.IsPositiveArea()) << r;
    }
}
