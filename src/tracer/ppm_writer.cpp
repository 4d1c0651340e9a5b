#include "ppm_writer.hpp"
#include "core/interval.hpp"
#include <cmath>

namespace sphaera {
namespace tracer {

float linear_to_gamma(float linear_component)
{
    if (linear_component > 0.0f) {
        return std::sqrt(linear_component);
    }
    return 0.0f;
}

Rgb8 quantise(const Colour& linear)
{
    static const Interval intensity(0.000f, 0.999f);

    Rgb8 out;
    out.r = uint8_t(256.0f * intensity.clamp(linear_to_gamma(linear.r)));
    out.g = uint8_t(256.0f * intensity.clamp(linear_to_gamma(linear.g)));
    out.b = uint8_t(256.0f * intensity.clamp(linear_to_gamma(linear.b)));
    return out;
}

std::string format_colour(const Colour& linear)
{
    Rgb8 rgb = quantise(linear);
    return std::to_string(rgb.r) + ' ' + std::to_string(rgb.g) + ' ' + std::to_string(rgb.b);
}

PpmWriter::PpmWriter(std::ostream& _out)
    : out(_out)
{}

bool PpmWriter::write_header(int width, int height)
{
    out << "P3\n" << width << ' ' << height << "\n255\n";
    return out.good();
}

bool PpmWriter::write_pixel(const Colour& linear)
{
    out << format_colour(linear) << '\n';
    return out.good();
}

bool PpmWriter::finish()
{
    out.flush();
    return out.good();
}

} // namespace tracer
} // namespace sphaera
