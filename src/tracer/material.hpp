#pragma once

#include "ray.hpp"
#include "core/colour.hpp"
#include "core/random.hpp"

namespace sphaera {
namespace tracer {

enum class MaterialType {
    Lambertian,
    Metal,
    Dielectric,
    MaterialTypeCount
};

// one flat struct for every kind, switch-dispatched in scatter().  shared between
// spheres as shared_ptr<const Material>, never mutated once built
struct Material {
    MaterialType type;

    Colour albedo;
    float fuzz;             // metal only, [0,1]
    float refraction_index; // dielectric only, relative to the enclosing medium

    Material()
        : type(MaterialType::Lambertian)
        , albedo(0.7f, 0.7f, 0.7f)
        , fuzz(0.0f)
        , refraction_index(1.5f)
    {}

    // factory methods
    static Material lambertian(const Colour& albedo);
    static Material metal(const Colour& albedo, float fuzz = 0.0f);
    static Material dielectric(float refraction_index);

    // false means the ray was absorbed
    bool scatter(const Ray& ray_in, const Intersection& rec, Colour& attenuation, Ray& scattered, Rng& rng) const;

private:
    // mat scattering funcs
    bool scatter_lambertian(const Ray& ray_in, const Intersection& rec, Colour& attenuation, Ray& scattered, Rng& rng) const;
    bool scatter_metal(const Ray& ray_in, const Intersection& rec, Colour& attenuation, Ray& scattered, Rng& rng) const;
    bool scatter_dielectric(const Ray& ray_in, const Intersection& rec, Colour& attenuation, Ray& scattered, Rng& rng) const;
};

Vec3 reflect(const Vec3& v, const Vec3& n);

// uv must be unit length
Vec3 refract(const Vec3& uv, const Vec3& n, float etai_over_etat);

// Schlick's approximation for fresnel reflectance
float reflectance(float cosine, float ior_ratio);

} // namespace tracer
} // namespace sphaera
