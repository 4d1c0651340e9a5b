#include <gtest/gtest.h>
#include "core/random.hpp"
#include <cmath>

using sphaera::Rng;
using sphaera::Vec3;

TEST(Rng, FloatsStayInUnitRange)
{
    Rng rng(42);
    for (int i = 0; i < 100000; ++i) {
        float x = rng.random_float();
        ASSERT_GE(x, 0.0f);
        ASSERT_LT(x, 1.0f);
    }
}

TEST(Rng, BoundedFloatsStayInRange)
{
    Rng rng(7);
    for (int i = 0; i < 10000; ++i) {
        float x = rng.random_float(-0.5f, 0.5f);
        ASSERT_GE(x, -0.5f);
        ASSERT_LT(x, 0.5f);
    }
}

TEST(Rng, SameSeedSameSequence)
{
    Rng a(1234);
    Rng b(1234);
    for (int i = 0; i < 100; ++i) {
        ASSERT_EQ(a.random_float(), b.random_float());
    }
}

TEST(Rng, ZeroSeedStillProducesValues)
{
    Rng rng(0);
    EXPECT_NE(rng.get_state(), 0u);
    float first = rng.random_float();
    float second = rng.random_float();
    EXPECT_NE(first, second);
}

TEST(Rng, NeighbouringPixelsGetDifferentSeeds)
{
    EXPECT_NE(Rng::hash_pixel(0, 0, 1), Rng::hash_pixel(1, 0, 1));
    EXPECT_NE(Rng::hash_pixel(0, 0, 1), Rng::hash_pixel(0, 1, 1));
    EXPECT_NE(Rng::hash_pixel(3, 4, 1), Rng::hash_pixel(3, 4, 2));
    EXPECT_EQ(Rng::hash_pixel(3, 4, 9), Rng::hash_pixel(3, 4, 9));
}

TEST(Sampling, UnitVectorsHaveUnitLength)
{
    Rng rng(99);
    for (int i = 0; i < 1000; ++i) {
        Vec3 v = sphaera::random_unit_vector(rng);
        ASSERT_NEAR(v.length(), 1.0f, 1e-5f);
    }
}

TEST(Sampling, DiskPointsLieInsideUnitDisk)
{
    Rng rng(5);
    for (int i = 0; i < 1000; ++i) {
        Vec3 p = sphaera::random_in_unit_disk(rng);
        ASSERT_EQ(p.z, 0.0f);
        ASSERT_LT(p.length_squared(), 1.0f);
    }
}
