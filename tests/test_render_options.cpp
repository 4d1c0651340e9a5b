#include <gtest/gtest.h>
#include "core/render_options.hpp"

using namespace sphaera;

TEST(RenderOptions, PositiveIntIsStored)
{
    int target = 7;
    EXPECT_TRUE(parse_positive_int("--width", "640", target));
    EXPECT_EQ(target, 640);
}

TEST(RenderOptions, NonPositiveIntLeavesTargetAlone)
{
    int target = 7;
    EXPECT_FALSE(parse_positive_int("--samples", "0", target));
    EXPECT_FALSE(parse_positive_int("--samples", "-3", target));
    EXPECT_FALSE(parse_positive_int("--samples", "lots", target));
    EXPECT_FALSE(parse_positive_int("--samples", "", target));
    EXPECT_EQ(target, 7);
}

TEST(RenderOptions, SeedAcceptsFullUnsignedRange)
{
    uint64_t seed = 1;
    EXPECT_TRUE(parse_seed("0", seed));
    EXPECT_EQ(seed, 0u);
    EXPECT_TRUE(parse_seed("18446744073709551615", seed));
    EXPECT_EQ(seed, 18446744073709551615ULL);
}

TEST(RenderOptions, BadSeedIsRejected)
{
    uint64_t seed = 42;
    EXPECT_FALSE(parse_seed("abc", seed));
    EXPECT_FALSE(parse_seed("-1", seed));
    EXPECT_FALSE(parse_seed("", seed));
    EXPECT_EQ(seed, 42u);
}

TEST(RenderOptions, DefaultCameraConfigIsRenderable)
{
    EXPECT_TRUE(check_camera_config(CameraConfig()));
}

TEST(RenderOptions, EachNonPositiveSizeFailsTheCheck)
{
    CameraConfig width;
    width.image_width = -5;
    EXPECT_FALSE(check_camera_config(width));

    CameraConfig samples;
    samples.samples_per_pixel = 0;
    EXPECT_FALSE(check_camera_config(samples));

    CameraConfig depth;
    depth.max_depth = 0;
    EXPECT_FALSE(check_camera_config(depth));
}
