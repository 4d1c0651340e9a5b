#include <gtest/gtest.h>
#include "tracer/ray.hpp"

using sphaera::Point3;
using sphaera::Vec3;
using sphaera::tracer::Intersection;
using sphaera::tracer::Ray;

TEST(Ray, AtZeroIsOrigin)
{
    Ray ray(Point3(1, 2, 3), Vec3(4, 5, 6));
    Point3 p = ray.at(0.0f);
    EXPECT_FLOAT_EQ(p.x, 1.0f);
    EXPECT_FLOAT_EQ(p.y, 2.0f);
    EXPECT_FLOAT_EQ(p.z, 3.0f);
}

TEST(Ray, AtFollowsDirection)
{
    Ray ray(Point3(1, 0, -1), Vec3(0, 2, 0.5f));
    const float ts[] = { -1.5f, 0.25f, 3.0f };
    for (float t : ts) {
        Point3 p = ray.at(t);
        EXPECT_FLOAT_EQ(p.x, 1.0f);
        EXPECT_FLOAT_EQ(p.y, 2.0f * t);
        EXPECT_FLOAT_EQ(p.z, -1.0f + 0.5f * t);
    }
}

TEST(Intersection, FaceNormalOpposesRay)
{
    Ray ray(Point3(0, 0, 0), Vec3(0, 0, -1));
    Intersection rec;

    rec.set_face_normal(ray, Vec3(0, 0, 1));
    EXPECT_TRUE(rec.front_face);
    EXPECT_FLOAT_EQ(rec.normal.z, 1.0f);

    // outward normal along the ray means we're leaving the surface from inside
    rec.set_face_normal(ray, Vec3(0, 0, -1));
    EXPECT_FALSE(rec.front_face);
    EXPECT_FLOAT_EQ(rec.normal.z, 1.0f);
}
