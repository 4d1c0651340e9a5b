#pragma once

#include "hittable.hpp"
#include "material.hpp"
#include <memory>

namespace sphaera {
namespace tracer {

class Sphere : public Hittable {
public:
    Sphere(const Point3& centre, float radius, std::shared_ptr<const Material> material);

    bool hit(const Ray& ray, const Interval& ray_t, Intersection& rec) const override;

    const Point3& get_centre() const { return centre; }
    float get_radius() const { return radius; }
    const std::shared_ptr<const Material>& get_material() const { return material; }

private:
    Point3 centre;
    float radius;
    std::shared_ptr<const Material> material;
};

} // namespace tracer
} // namespace sphaera
