#pragma once

#include "hittable.hpp"
#include <memory>
#include <utility>
#include <vector>

namespace sphaera {
namespace tracer {

// flat scene, linear in primitive count.  order doesn't change which hit is returned
class HittableList : public Hittable {
public:
    HittableList() = default;
    explicit HittableList(std::shared_ptr<Hittable> object) { add(std::move(object)); }

    void add(std::shared_ptr<Hittable> object) { objects.push_back(std::move(object)); }
    void clear() { objects.clear(); }

    size_t size() const { return objects.size(); }
    bool empty() const { return objects.empty(); }

    const std::vector<std::shared_ptr<Hittable>>& get_objects() const { return objects; }

    bool hit(const Ray& ray, const Interval& ray_t, Intersection& rec) const override;

private:
    std::vector<std::shared_ptr<Hittable>> objects;
};

} // namespace tracer
} // namespace sphaera
