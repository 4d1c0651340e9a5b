#include <gtest/gtest.h>
#include "core/interval.hpp"
#include <cmath>

using sphaera::Interval;

TEST(Interval, SizeIsMaxMinusMin)
{
    EXPECT_FLOAT_EQ(Interval(-1.0f, 3.0f).size(), 4.0f);
    EXPECT_FLOAT_EQ(Interval(2.0f, 2.0f).size(), 0.0f);
}

TEST(Interval, ContainsIncludesEndpoints)
{
    Interval range(0.0f, 1.0f);
    EXPECT_TRUE(range.contains(0.0f));
    EXPECT_TRUE(range.contains(1.0f));
    EXPECT_TRUE(range.contains(0.5f));
    EXPECT_FALSE(range.contains(-0.001f));
    EXPECT_FALSE(range.contains(1.001f));
}

TEST(Interval, SurroundsExcludesEndpoints)
{
    Interval range(0.0f, 1.0f);
    EXPECT_FALSE(range.surrounds(0.0f));
    EXPECT_FALSE(range.surrounds(1.0f));
    EXPECT_TRUE(range.surrounds(0.5f));
}

TEST(Interval, ClampStaysInRangeAndIsIdempotent)
{
    Interval range(-2.0f, 5.0f);
    const float inputs[] = { -100.0f, -2.0f, 0.0f, 4.99f, 5.0f, 1e9f };
    for (float x : inputs) {
        float once = range.clamp(x);
        EXPECT_TRUE(range.contains(once)) << x;
        EXPECT_EQ(range.clamp(once), once) << x;
    }
    EXPECT_EQ(range.clamp(-100.0f), -2.0f);
    EXPECT_EQ(range.clamp(1e9f), 5.0f);
    EXPECT_EQ(range.clamp(1.5f), 1.5f);
}

TEST(Interval, DefaultIsUniverse)
{
    Interval range;
    EXPECT_TRUE(std::isinf(range.min) && range.min < 0);
    EXPECT_TRUE(std::isinf(range.max) && range.max > 0);
    EXPECT_TRUE(range.surrounds(0.0f));
    EXPECT_TRUE(Interval::universe().contains(-1e30f));
}

TEST(Interval, EmptyContainsNothing)
{
    Interval range = Interval::empty();
    EXPECT_FALSE(range.contains(0.0f));
    EXPECT_FALSE(range.surrounds(0.0f));
    EXPECT_LT(range.size(), 0.0f);
}
