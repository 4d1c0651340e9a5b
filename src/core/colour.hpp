#pragma once

namespace sphaera {

// linear rgb.  channels may go above 1 before gamma mapping
struct Colour {
    float r,g,b;

    Colour() : r(0), g(0), b(0) {}
    Colour(float _r, float _g, float _b) : r(_r), g(_g), b(_b) {}
    Colour(float v) : r(v), g(v), b(v) {}

    Colour operator+(const Colour& other) const {
        return Colour(r + other.r, g + other.g, b + other.b);
    }

    Colour operator-(const Colour& other) const {
        return Colour(r - other.r, g - other.g, b - other.b);
    }

    Colour operator*(const Colour& other) const {
        return Colour(r * other.r, g * other.g, b * other.b);
    }

    Colour operator*(float scalar) const {
        return Colour(r * scalar, g * scalar, b * scalar);
    }

    Colour& operator+=(const Colour& other) {
        r += other.r; g += other.g; b += other.b;
        return *this;
    }

    static Colour lerp(const Colour& a, const Colour& b, float t) {
        return a * (1.0f - t) + b * t;
    }
};

} // namespace sphaera
