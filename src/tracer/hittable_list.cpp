#include "hittable_list.hpp"

namespace sphaera {
namespace tracer {

bool HittableList::hit(const Ray& ray, const Interval& ray_t, Intersection& rec) const
{
    Intersection temp_rec;
    bool hit_anything = false;
    float closest_so_far = ray_t.max;

    for (const auto& object : objects) {
        // only accept hits strictly closer than the best so far
        if (object->hit(ray, Interval(ray_t.min, closest_so_far), temp_rec)) {
            hit_anything = true;
            closest_so_far = temp_rec.t;
            rec = temp_rec;
        }
    }

    return hit_anything;
}

} // namespace tracer
} // namespace sphaera
