#include "material.hpp"
#include "core/constants.hpp"
#include <algorithm>
#include <cmath>

namespace sphaera {
namespace tracer {

Material Material::lambertian(const Colour& albedo)
{
    Material mat;
    mat.type = MaterialType::Lambertian;
    mat.albedo = albedo;
    return mat;
}

Material Material::metal(const Colour& albedo, float fuzz)
{
    Material mat;
    mat.type = MaterialType::Metal;
    mat.albedo = albedo;
    mat.fuzz = std::clamp(fuzz, 0.0f, 1.0f);
    return mat;
}

Material Material::dielectric(float refraction_index)
{
    Material mat;
    mat.type = MaterialType::Dielectric;
    mat.albedo = Colour(1, 1, 1);
    mat.refraction_index = refraction_index;
    return mat;
}

bool Material::scatter(const Ray& ray_in, const Intersection& rec, Colour& attenuation, Ray& scattered, Rng& rng) const
{
    switch (type)
    {
        case MaterialType::Lambertian:
            return scatter_lambertian(ray_in, rec, attenuation, scattered, rng);
        case MaterialType::Metal:
            return scatter_metal(ray_in, rec, attenuation, scattered, rng);
        case MaterialType::Dielectric:
            return scatter_dielectric(ray_in, rec, attenuation, scattered, rng);
        default:
            return false;
    }
}

bool Material::scatter_lambertian(const Ray& /*ray_in*/, const Intersection& rec, Colour& attenuation, Ray& scattered, Rng& rng) const
{
    Vec3 scatter_dir = rec.normal + random_unit_vector(rng);

    // catch degenerate scatter direction
    if (scatter_dir.near_zero(ALMOST_ZERO)) {
        scatter_dir = rec.normal;
    }

    scattered = Ray(rec.point, scatter_dir);
    attenuation = albedo;

    return true;
}

bool Material::scatter_metal(const Ray& ray_in, const Intersection& rec, Colour& attenuation, Ray& scattered, Rng& rng) const
{
    Vec3 reflected = reflect(ray_in.direction, rec.normal).normalised();

    // fuzz can push the ray under the surface, those are kept rather than absorbed
    scattered = Ray(rec.point, reflected + random_unit_vector(rng) * fuzz);
    attenuation = albedo;

    return true;
}

bool Material::scatter_dielectric(const Ray& ray_in, const Intersection& rec, Colour& attenuation, Ray& scattered, Rng& rng) const
{
    attenuation = Colour(1, 1, 1);
    float refraction_ratio = rec.front_face ? (1.0f / refraction_index) : refraction_index;

    Vec3 unit_dir = ray_in.direction.normalised();
    float cos_theta = std::min(Vec3::dot(-unit_dir, rec.normal), 1.0f);
    float sin_theta = std::sqrt(1.0f - cos_theta * cos_theta);

    bool cannot_refract = refraction_ratio * sin_theta > 1.0f;
    Vec3 direction;

    if (cannot_refract || reflectance(cos_theta, refraction_ratio) > rng.random_float()) {
        direction = reflect(unit_dir, rec.normal);
    }
    else {
        direction = refract(unit_dir, rec.normal, refraction_ratio);
    }

    scattered = Ray(rec.point, direction);
    return true;
}

Vec3 reflect(const Vec3& v, const Vec3& n)
{
    return v - n * (Vec3::dot(v, n) * 2.0f);
}

Vec3 refract(const Vec3& uv, const Vec3& n, float etai_over_etat)
{
    // snell's law.  shirley's implementation/naming
    float cos_theta = std::min(Vec3::dot(-uv, n), 1.0f);
    Vec3 r_out_perp = (uv + n * cos_theta) * etai_over_etat;
    Vec3 r_out_parallel = n * (-std::sqrt(std::abs(1.0f - r_out_perp.length_squared())));
    return r_out_perp + r_out_parallel;
}

float reflectance(float cosine, float ior_ratio)
{
    // ior_ratio = n1/n2 (eg air/glass = 1.0/1.5)
    float r0 = (1.0f - ior_ratio) / (1.0f + ior_ratio);
    r0 = r0 * r0;
    return r0 + (1.0f - r0) * std::pow((1.0f - cosine), 5.0f);
}

} // namespace tracer
} // namespace sphaera
