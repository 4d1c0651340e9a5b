#pragma once

#include <limits>

namespace sphaera {

// closed range of t values along a ray.  shirley-style, min > max means empty
struct Interval {
    float min;
    float max;

    Interval()
        : min(-std::numeric_limits<float>::infinity())
        , max(std::numeric_limits<float>::infinity())
    {}
    Interval(float _min, float _max) : min(_min), max(_max) {}

    float size() const { return max - min; }

    bool contains(float x) const { return min <= x && x <= max; }

    // strict, grazing hits at either end are rejected
    bool surrounds(float x) const { return min < x && x < max; }

    float clamp(float x) const {
        if (x < min) return min;
        if (x > max) return max;
        return x;
    }

    static Interval empty() {
        return Interval(std::numeric_limits<float>::infinity(), -std::numeric_limits<float>::infinity());
    }

    static Interval universe() {
        return Interval();
    }
};

} // namespace sphaera
