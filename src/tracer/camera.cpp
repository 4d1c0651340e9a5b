#include "camera.hpp"
#include "material.hpp"
#include "ppm_writer.hpp"
#include "core/constants.hpp"
#include <cmath>
#include <iostream>
#include <limits>

namespace sphaera {
namespace tracer {

Camera::Camera()
{
    initialise();
}

Camera::Camera(const CameraConfig& new_config)
    : config(new_config)
{
    initialise();
}

void Camera::set_config(const CameraConfig& new_config)
{
    config = new_config;
    initialise();
}

void Camera::initialise()
{
    image_height = int(std::floor(float(config.image_width) / config.aspect_ratio));
    if (image_height < 1) image_height = 1;

    // not validated, zero samples gives inf here and black pixels later
    pixel_sample_scale = 1.0f / float(config.samples_per_pixel);

    centre = config.lookfrom;

    // viewport sits on the focus plane
    float theta = config.vfov * DEG_TO_RAD;
    float h = std::tan(theta * 0.5f);
    float viewport_height = 2.0f * h * config.focus_dist;
    float viewport_width = viewport_height * (float(config.image_width) / float(image_height));

    w = (config.lookfrom - config.lookat).normalised();
    u = Vec3::cross(config.vup, w).normalised();
    v = Vec3::cross(w, u);

    Vec3 viewport_u = u * viewport_width;    // across the top edge
    Vec3 viewport_v = -v * viewport_height;  // down the left edge

    pixel_delta_u = viewport_u / float(config.image_width);
    pixel_delta_v = viewport_v / float(image_height);

    Point3 viewport_upper_left = centre - w * config.focus_dist - viewport_u * 0.5f - viewport_v * 0.5f;
    pixel00_loc = viewport_upper_left + (pixel_delta_u + pixel_delta_v) * 0.5f;

    float defocus_radius = config.focus_dist * std::tan(config.defocus_angle * 0.5f * DEG_TO_RAD);
    defocus_disk_u = u * defocus_radius;
    defocus_disk_v = v * defocus_radius;
}

bool Camera::render(const Hittable& world, std::ostream& image_out, std::ostream& progress_out) const
{
    PpmWriter writer(image_out);

    if (!writer.write_header(config.image_width, image_height)) {
        std::cerr << "failed to write image header\n";
        return false;
    }

    std::vector<Colour> row;

    for (int j = 0; j < image_height; ++j) {
        progress_out << "Scanlines remaining: " << (image_height - j) << '\n' << std::flush;

        render_scanline(j, world, row);

        for (const Colour& pixel_colour : row) {
            if (!writer.write_pixel(pixel_colour)) {
                std::cerr << "failed to write pixel on scanline " << j << "\n";
                return false;
            }
        }
    }

    if (!writer.finish()) {
        std::cerr << "failed to flush image\n";
        return false;
    }

    progress_out << "Done.\n" << std::flush;
    return true;
}

void Camera::render_scanline(int j, const Hittable& world, std::vector<Colour>& row) const
{
    row.resize(config.image_width > 0 ? size_t(config.image_width) : 0);

    for (int i = 0; i < config.image_width; ++i) {
        row[i] = render_pixel(i, j, world);
    }
}

Colour Camera::render_pixel(int i, int j, const Hittable& world) const
{
    // seed rng deterministically per pixel
    Rng pixel_rng(Rng::hash_pixel(i, j, config.seed));

    Colour pixel_colour(0, 0, 0);
    for (int sample = 0; sample < config.samples_per_pixel; ++sample) {
        Ray ray = get_ray(i, j, pixel_rng);
        pixel_colour += ray_colour(ray, config.max_depth, world, pixel_rng);
    }

    return pixel_colour * pixel_sample_scale;
}

Ray Camera::get_ray(int i, int j, Rng& rng) const
{
    Vec3 offset = sample_square(rng);
    Point3 pixel_sample = pixel00_loc
        + pixel_delta_u * (float(i) + offset.x)
        + pixel_delta_v * (float(j) + offset.y);

    Point3 ray_origin = (config.defocus_angle <= 0.0f) ? centre : defocus_disk_sample(rng);
    return Ray(ray_origin, pixel_sample - ray_origin);
}

Vec3 Camera::sample_square(Rng& rng) const
{
    // box filter over [-.5,-.5]-[+.5,+.5]
    return Vec3(rng.random_float() - 0.5f, rng.random_float() - 0.5f, 0.0f);
}

Point3 Camera::defocus_disk_sample(Rng& rng) const
{
    Vec3 p = random_in_unit_disk(rng);
    return centre + defocus_disk_u * p.x + defocus_disk_v * p.y;
}

// recursive, depth bounds the stack
Colour Camera::ray_colour(const Ray& ray, int depth, const Hittable& world, Rng& rng) const
{
    // out of bounces, treat as fully absorbed
    if (depth <= 0) return Colour(0, 0, 0);

    Intersection rec;
    if (world.hit(ray, Interval(SHADOW_ACNE_EPSILON, std::numeric_limits<float>::infinity()), rec)) {
        if (!rec.material) return Colour(0, 0, 0);

        Ray scattered;
        Colour attenuation;

        if (rec.material->scatter(ray, rec, attenuation, scattered, rng)) {
            return attenuation * ray_colour(scattered, depth - 1, world, rng);
        }

        return Colour(0, 0, 0);
    }

    return sky.sample(ray.direction);
}

} // namespace tracer
} // namespace sphaera
