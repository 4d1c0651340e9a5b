#pragma once

#include "core/colour.hpp"
#include <cstdint>
#include <ostream>
#include <string>

namespace sphaera {
namespace tracer {

struct Rgb8 {
    uint8_t r, g, b;
};

// gamma 2 approximation
float linear_to_gamma(float linear_component);

// gamma correct, clamp to [0,0.999] and scale to a byte.  same method as Shirley's PPM
Rgb8 quantise(const Colour& linear);

// "r g b", no trailing newline
std::string format_colour(const Colour& linear);

// plain text P3 image.  every write reports whether the stream is still good,
// the first false means the sink is gone and the image is unusable
class PpmWriter {
public:
    explicit PpmWriter(std::ostream& out);

    bool write_header(int width, int height);
    bool write_pixel(const Colour& linear);
    // flush the sink, a buffered write can still fail here
    bool finish();

    bool good() const { return out.good(); }

private:
    std::ostream& out;
};

} // namespace tracer
} // namespace sphaera
