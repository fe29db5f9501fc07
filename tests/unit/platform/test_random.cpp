/**
 * @file test_random.cpp
 * @brief Unit tests for Platform/Random.h
 */

#include <QiGeom/Platform/Random.h>
#include <gtest/gtest.h>

#include <vector>

using namespace Qi::Geom;
using namespace Qi::Geom::Platform;

class RandomTest : public ::testing::Test {
protected:
    void SetUp() override {
        // Set seed for reproducible tests
        Random::Instance().SetSeed(12345);
    }
};

// ============================================================================
// Scalar Tests
// ============================================================================

TEST_F(RandomTest, IntInRange) {
    for (int i = 0; i < 1000; ++i) {
        int32_t v = Random::Instance().Int(-20, 20);
        EXPECT_GE(v, -20);
        EXPECT_LE(v, 20);
    }
}

TEST_F(RandomTest, IntSwapsMinMax) {
    for (int i = 0; i < 100; ++i) {
        int32_t v = Random::Instance().Int(20, 10);
        EXPECT_GE(v, 10);
        EXPECT_LE(v, 20);
    }
}

TEST_F(RandomTest, IntSingleValue) {
    for (int i = 0; i < 100; ++i) {
        EXPECT_EQ(Random::Instance().Int(42, 42), 42);
    }
}

TEST_F(RandomTest, Uint32InRange) {
    for (int i = 0; i < 1000; ++i) {
        uint32_t v = Random::Instance().Uint32(0xFFFFFF00u, 0xFFFFFFFFu);
        EXPECT_GE(v, 0xFFFFFF00u);
    }
}

TEST_F(RandomTest, FloatHalfOpen) {
    for (int i = 0; i < 1000; ++i) {
        float v = Random::Instance().Float(1.0f, 2.0f);
        EXPECT_GE(v, 1.0f);
        EXPECT_LT(v, 2.0f);
    }
}

TEST_F(RandomTest, FloatEmptyRange) {
    EXPECT_FLOAT_EQ(Random::Instance().Float(3.0f, 3.0f), 3.0f);
}

TEST_F(RandomTest, SeedReproducible) {
    Random::Instance().SetSeed(777);
    std::vector<uint32_t> first;
    for (int i = 0; i < 10; ++i) {
        first.push_back(Random::Instance().Uint32());
    }

    Random::Instance().SetSeed(777);
    for (int i = 0; i < 10; ++i) {
        EXPECT_EQ(Random::Instance().Uint32(), first[i]);
    }
    EXPECT_EQ(Random::Instance().GetSeed(), 777u);
}

TEST_F(RandomTest, BoolProducesBoth) {
    bool seenTrue = false;
    bool seenFalse = false;
    for (int i = 0; i < 200; ++i) {
        if (Random::Instance().Bool()) {
            seenTrue = true;
        } else {
            seenFalse = true;
        }
    }
    EXPECT_TRUE(seenTrue);
    EXPECT_TRUE(seenFalse);
}

// ============================================================================
// Geometry Tests
// ============================================================================

TEST_F(RandomTest, PointInsideBounds) {
    Rect fb(-5.0f, -5.0f, 5.0f, 5.0f);
    URect ub(10, 20, 30, 40);
    IRect ib(-10, -10, -5, -5);
    for (int i = 0; i < 1000; ++i) {
        EXPECT_TRUE(fb.Contains(Random::Instance().Point(fb)));
        EXPECT_TRUE(ub.Contains(Random::Instance().Point(ub)));
        EXPECT_TRUE(ib.Contains(Random::Instance().Point(ib)));
    }
}

TEST_F(RandomTest, PointInUnitBounds) {
    // Only one integer point exists in a 1x1 bounds
    IRect single(3, 4, 4, 5);
    for (int i = 0; i < 10; ++i) {
        EXPECT_EQ(Random::Instance().Point(single), IVec2(3, 4));
    }
}

TEST_F(RandomTest, WellFormedRectInsideBounds) {
    IRect bounds(0, 0, 100, 100);
    for (int i = 0; i < 1000; ++i) {
        IRect r = Random::Instance().WellFormedRect(bounds);
        EXPECT_TRUE(r.IsWellFormed()) << r;
        EXPECT_TRUE(bounds.Contains(r.topLeft)) << r;
        EXPECT_TRUE(bounds.Contains(r.bottomRight)) << r;
    }
}

TEST_F(RandomTest, FreeFunctions) {
    SetRandomSeed(99);
    int32_t a = RandomInt(0, 1000000);
    SetRandomSeed(99);
    EXPECT_EQ(RandomInt(0, 1000000), a);
}
