#pragma once

#include "ray.hpp"
#include "core/interval.hpp"

namespace sphaera {
namespace tracer {

// anything a ray can be tested against
class Hittable {
public:
    virtual ~Hittable() = default;

    // true and rec filled in if ray hits strictly inside ray_t
    virtual bool hit(const Ray& ray, const Interval& ray_t, Intersection& rec) const = 0;
};

} // namespace tracer
} // namespace sphaera
