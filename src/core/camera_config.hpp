#pragma once

#include "vec3.hpp"
#include <cstdint>

namespace sphaera {

// everything a render needs to know about the view.  plain data, the tracer's Camera
// derives its basis from this once and never looks back
struct CameraConfig {
    float aspect_ratio;     // width over height
    int image_width;
    int samples_per_pixel;
    int max_depth;          // bounce limit per path
    float vfov;             // vertical, degrees
    Point3 lookfrom;
    Point3 lookat;
    Vec3 vup;
    float defocus_angle;    // cone angle through each pixel, degrees.  0 = pinhole
    float focus_dist;       // lookfrom to plane of perfect focus
    uint64_t seed;

    CameraConfig()
        : aspect_ratio(1.0f)
        , image_width(100)
        , samples_per_pixel(10)
        , max_depth(10)
        , vfov(90.0f)
        , lookfrom(0, 0, 0)
        , lookat(0, 0, -1)
        , vup(0, 1, 0)
        , defocus_angle(0.0f)
        , focus_dist(10.0f)
        , seed(1)
    {}
};

} // namespace sphaera
