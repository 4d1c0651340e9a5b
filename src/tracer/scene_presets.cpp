#include "scene_presets.hpp"
#include "material.hpp"
#include "sphere.hpp"
#include "core/constants.hpp"
#include "core/random.hpp"
#include <cmath>
#include <memory>

namespace sphaera {
namespace tracer {

namespace {

std::shared_ptr<const Material> make_material(const Material& mat)
{
    return std::make_shared<const Material>(mat);
}

// shared view for the small showcase scenes
CameraConfig showcase_camera()
{
    CameraConfig config;
    config.aspect_ratio = 16.0f / 9.0f;
    config.image_width = 400;
    config.samples_per_pixel = 100;
    config.max_depth = 50;
    config.vfov = 20.0f;
    config.lookfrom = Point3(-2, 2, 1);
    config.lookat = Point3(0, 0, -1);
    config.vup = Vec3(0, 1, 0);
    config.defocus_angle = 10.0f;
    config.focus_dist = 3.4f;
    return config;
}

} // namespace

std::vector<std::string> ScenePresets::names()
{
    return { "two_spheres", "materials", "final" };
}

bool ScenePresets::build(const std::string& name, uint64_t seed, ScenePreset& preset)
{
    if (name == "two_spheres") {
        preset = two_spheres();
    }
    else if (name == "materials") {
        preset = materials();
    }
    else if (name == "final") {
        preset = final_scene(seed);
    }
    else {
        return false;
    }

    preset.camera.seed = seed;
    return true;
}

ScenePreset ScenePresets::two_spheres()
{
    ScenePreset preset;

    float r = std::cos(PI / 4.0f);

    auto material_left = make_material(Material::lambertian(Colour(0, 0, 1)));
    auto material_right = make_material(Material::lambertian(Colour(1, 0, 0)));

    preset.world.add(std::make_shared<Sphere>(Point3(-r, 0, -1), r, material_left));
    preset.world.add(std::make_shared<Sphere>(Point3(r, 0, -1), r, material_right));

    preset.camera = showcase_camera();
    preset.camera.samples_per_pixel = 10;
    return preset;
}

ScenePreset ScenePresets::materials()
{
    ScenePreset preset;

    auto material_ground = make_material(Material::lambertian(Colour(0.8f, 0.8f, 0.0f)));
    auto material_centre = make_material(Material::lambertian(Colour(0.1f, 0.2f, 0.5f)));
    auto material_left = make_material(Material::dielectric(1.5f));
    auto material_bubble = make_material(Material::dielectric(1.0f / 1.5f));
    auto material_right = make_material(Material::metal(Colour(0.8f, 0.6f, 0.2f), 1.0f));

    preset.world.add(std::make_shared<Sphere>(Point3(0.0f, -100.5f, -1.0f), 100.0f, material_ground));
    preset.world.add(std::make_shared<Sphere>(Point3(0.0f, 0.0f, -1.2f), 0.5f, material_centre));
    preset.world.add(std::make_shared<Sphere>(Point3(-1.0f, 0.0f, -1.0f), 0.5f, material_left));
    preset.world.add(std::make_shared<Sphere>(Point3(-1.0f, 0.0f, -1.0f), 0.4f, material_bubble));
    preset.world.add(std::make_shared<Sphere>(Point3(1.0f, 0.0f, -1.0f), 0.5f, material_right));

    preset.camera = showcase_camera();
    return preset;
}

ScenePreset ScenePresets::final_scene(uint64_t seed)
{
    ScenePreset preset;
    Rng rng(Rng::hash_pixel(-1, -1, seed));

    auto ground_material = make_material(Material::lambertian(Colour(0.5f, 0.5f, 0.5f)));
    preset.world.add(std::make_shared<Sphere>(Point3(0, -1000, 0), 1000.0f, ground_material));

    for (int a = -11; a < 11; a++) {
        for (int b = -11; b < 11; b++) {
            float choose_mat = rng.random_float();
            Point3 centre(float(a) + 0.9f * rng.random_float(), 0.2f, float(b) + 0.9f * rng.random_float());

            // keep clear of the big metal sphere
            if ((centre - Point3(4.0f, 0.2f, 0.0f)).length() <= 0.9f) continue;

            std::shared_ptr<const Material> sphere_material;
            if (choose_mat < 0.8f) {
                // diffuse
                Vec3 albedo = random_vec3(rng, 0.0f, 1.0f) * random_vec3(rng, 0.0f, 1.0f);
                sphere_material = make_material(Material::lambertian(Colour(albedo.x, albedo.y, albedo.z)));
            }
            else if (choose_mat < 0.95f) {
                Vec3 albedo = random_vec3(rng, 0.5f, 1.0f);
                float fuzz = rng.random_float(0.0f, 0.5f);
                sphere_material = make_material(Material::metal(Colour(albedo.x, albedo.y, albedo.z), fuzz));
            }
            else {
                // glass
                sphere_material = make_material(Material::dielectric(1.5f));
            }
            preset.world.add(std::make_shared<Sphere>(centre, 0.2f, sphere_material));
        }
    }

    preset.world.add(std::make_shared<Sphere>(Point3(0, 1, 0), 1.0f, make_material(Material::dielectric(1.5f))));
    preset.world.add(std::make_shared<Sphere>(Point3(-4, 1, 0), 1.0f, make_material(Material::lambertian(Colour(0.4f, 0.2f, 0.1f)))));
    preset.world.add(std::make_shared<Sphere>(Point3(4, 1, 0), 1.0f, make_material(Material::metal(Colour(0.7f, 0.6f, 0.5f), 0.0f))));

    CameraConfig& config = preset.camera;
    config.aspect_ratio = 16.0f / 9.0f;
    config.image_width = 1200;
    config.samples_per_pixel = 500;
    config.max_depth = 50;
    config.vfov = 20.0f;
    config.lookfrom = Point3(13, 2, 3);
    config.lookat = Point3(0, 0, 0);
    config.vup = Vec3(0, 1, 0);
    config.defocus_angle = 0.6f;
    config.focus_dist = 10.0f;

    return preset;
}

} // namespace tracer
} // namespace sphaera
