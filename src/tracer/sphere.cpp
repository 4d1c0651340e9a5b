#include "sphere.hpp"
#include <cmath>
#include <utility>

namespace sphaera {
namespace tracer {

Sphere::Sphere(const Point3& _centre, float _radius, std::shared_ptr<const Material> _material)
    : centre(_centre)
    , radius(_radius)
    , material(std::move(_material))
{}

bool Sphere::hit(const Ray& ray, const Interval& ray_t, Intersection& rec) const
{
    // half-b form of |O + tD - C|^2 = r^2
    Vec3 oc = centre - ray.origin;
    float a = ray.direction.length_squared();
    float h = Vec3::dot(ray.direction, oc);
    float c = oc.length_squared() - radius * radius;
    float discriminant = h * h - a * c;

    if (discriminant < 0.0f) return false;

    float sqrtd = std::sqrt(discriminant);

    // nearest root first, far root only if the near one is out of range
    float root = (h - sqrtd) / a;
    if (!ray_t.surrounds(root)) {
        root = (h + sqrtd) / a;
        if (!ray_t.surrounds(root)) {
            return false;
        }
    }

    rec.t = root;
    rec.point = ray.at(rec.t);
    Vec3 outward_normal = (rec.point - centre) / radius;
    rec.set_face_normal(ray, outward_normal);
    rec.material = material;

    return true;
}

} // namespace tracer
} // namespace sphaera
