#pragma once

#include "ray.hpp"
#include "hittable.hpp"
#include "core/camera_config.hpp"
#include "core/colour.hpp"
#include "core/random.hpp"
#include "core/sky.hpp"
#include <ostream>
#include <vector>

namespace sphaera {
namespace tracer {

// turns a CameraConfig into pixels.  all derived state is computed in the constructor
// (or set_config) and is read-only while rendering
class Camera {
public:
    Camera();
    explicit Camera(const CameraConfig& config);

    // reruns the full derivation
    void set_config(const CameraConfig& new_config);
    const CameraConfig& get_config() const { return config; }

    int get_image_width() const { return config.image_width; }
    int get_image_height() const { return image_height; }

    const Point3& get_centre() const { return centre; }
    const Point3& get_pixel00_loc() const { return pixel00_loc; }
    const Vec3& get_pixel_delta_u() const { return pixel_delta_u; }
    const Vec3& get_pixel_delta_v() const { return pixel_delta_v; }
    float get_pixel_sample_scale() const { return pixel_sample_scale; }

    const Sky& get_sky() const { return sky; }
    void set_sky(const Sky& new_sky) { sky = new_sky; }

    // writes the whole image as P3 to image_out, one progress line per scanline to progress_out.
    // false as soon as image_out stops accepting writes
    bool render(const Hittable& world, std::ostream& image_out, std::ostream& progress_out) const;

    // averaged linear colour for one row, for progressive displays
    void render_scanline(int j, const Hittable& world, std::vector<Colour>& row) const;

    // averaged linear colour of pixel (i, j), rng seeded from (i, j, seed)
    Colour render_pixel(int i, int j, const Hittable& world) const;

    // jittered ray through pixel (i, j), from the defocus disk if the lens has an aperture
    Ray get_ray(int i, int j, Rng& rng) const;

    Colour ray_colour(const Ray& ray, int depth, const Hittable& world, Rng& rng) const;

private:
    void initialise();

    Vec3 sample_square(Rng& rng) const;
    Point3 defocus_disk_sample(Rng& rng) const;

    CameraConfig config;
    Sky sky;

    int image_height;
    float pixel_sample_scale;   // 1 / samples_per_pixel
    Point3 centre;
    Point3 pixel00_loc;         // centre of pixel (0, 0), top left
    Vec3 pixel_delta_u;         // one pixel right
    Vec3 pixel_delta_v;         // one pixel down
    Vec3 u, v, w;               // camera frame
    Vec3 defocus_disk_u;
    Vec3 defocus_disk_v;
};

} // namespace tracer
} // namespace sphaera
