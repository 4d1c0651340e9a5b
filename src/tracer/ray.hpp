#pragma once

#include "core/vec3.hpp"
#include <memory>

namespace sphaera {
namespace tracer {

struct Material;

struct Ray {
    Point3 origin;
    Vec3 direction; // not necessarily unit length

    Ray() : origin(0, 0, 0), direction(0, 0, -1) {}
    Ray(const Point3& o, const Vec3& d) : origin(o), direction(d) {}

    Point3 at(float t) const {
        return origin + direction * t;
    }
};

struct Intersection { // bit better naming than HitRecord I think
    Point3 point;
    Vec3 normal; // unit length, always faces the incoming ray
    float t; //distance, as in t used in lerps. convention in pbrt/shirley
    bool front_face;

    std::shared_ptr<const Material> material;

    Intersection() : t(0), front_face(true) {}

    // sets normal to always point against ray
    void set_face_normal(const Ray& ray, const Vec3& outward_normal) {
        front_face = Vec3::dot(ray.direction, outward_normal) < 0;
        normal = front_face ? outward_normal : -outward_normal;
    }
};

} // namespace tracer
} // namespace sphaera
