#pragma once

#include "hittable_list.hpp"
#include "core/camera_config.hpp"
#include <string>
#include <vector>

namespace sphaera {
namespace tracer {

// a world plus the view it was composed for
struct ScenePreset {
    HittableList world;
    CameraConfig camera;
};

class ScenePresets {
public:
    static std::vector<std::string> names();

    // false for an unknown name, preset untouched
    static bool build(const std::string& name, uint64_t seed, ScenePreset& preset);

    // blue and red lambertian spheres touching at the view axis
    static ScenePreset two_spheres();

    // ground, diffuse centre, hollow glass, fuzzy metal
    static ScenePreset materials();

    // random field of small spheres around three large ones.  layout depends on seed
    static ScenePreset final_scene(uint64_t seed);
};

} // namespace tracer
} // namespace sphaera
