#pragma once

#include "colour.hpp"
#include "vec3.hpp"

namespace sphaera {

// simple two colour gradient sky, what a ray sees when it escapes the scene
struct Sky {
    Colour colour_bottom;
    Colour colour_top;

    Sky()
        : colour_bottom(1.0f, 1.0f, 1.0f)  // white
        , colour_top(0.5f, 0.7f, 1.0f)     // light blue
    {}

    Sky(const Colour& bottom, const Colour& top)
        : colour_bottom(bottom)
        , colour_top(top)
    {}

    // sample sky colour given a direction vector, need not be normalised
    Colour sample(const Vec3& direction) const {
        Vec3 unit_dir = direction.normalised();
        //remap t from [-1,1] to [0,1]
        float t = 0.5f * (unit_dir.y + 1.0f);
        return Colour::lerp(colour_bottom, colour_top, t);
    }
};

} // namespace sphaera
