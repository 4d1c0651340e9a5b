#pragma once

#include "core/vec3.hpp"
#include <cstdint>

namespace sphaera {

// xorshift64* generator.  passed by reference everywhere so each pixel owns its own state
class Rng {
public:
    explicit Rng(uint64_t seed)
        : state(seed != 0 ? seed : 0x9e3779b97f4a7c15ULL) // xorshift never leaves zero
    {}

    // uniform in [0,1)
    float random_float() {
        // from https://en.wikipedia.org/wiki/Xorshift
        state ^= state >> 12;
        state ^= state << 25;
        state ^= state >> 27;
        // top 24 bits fill the float mantissa exactly, so 1.0 is never returned
        return float((state * 0x2545F4914F6CDD1DULL) >> 40) / float(1ULL << 24);
    }

    // uniform in [min,max)
    float random_float(float min, float max) {
        return min + (max - min) * random_float();
    }

    uint64_t get_state() const { return state; }

    // Murmurhash based, decorrelates neighbouring pixels
    static uint64_t hash_pixel(int x, int y, uint64_t seed) {
        uint64_t h = seed;
        h ^= uint64_t(x) + 0x9e3779b9 + (h << 6) + (h >> 2);
        h ^= uint64_t(y) + 0x9e3779b9 + (h << 6) + (h >> 2);
        h ^= h >> 33;
        h *= 0xff51afd7ed558ccdULL;
        h ^= h >> 33;
        h *= 0xc4ceb9fe1a85ec53ULL;
        h ^= h >> 33;
        return h;
    }

private:
    uint64_t state;
};

inline Vec3 random_vec3(Rng& rng, float min, float max) {
    return Vec3(rng.random_float(min, max), rng.random_float(min, max), rng.random_float(min, max));
}

// rejection sampled from the enclosing cube, then projected onto the sphere
inline Vec3 random_unit_vector(Rng& rng) {
    while (true) {
        Vec3 p = random_vec3(rng, -1.0f, 1.0f);
        float len_sq = p.length_squared();
        // tiny vectors blow up when normalised
        if (1e-30f < len_sq && len_sq <= 1.0f) {
            return p / std::sqrt(len_sq);
        }
    }
}

// z is always 0
inline Vec3 random_in_unit_disk(Rng& rng) {
    while (true) {
        Vec3 p(rng.random_float(-1.0f, 1.0f), rng.random_float(-1.0f, 1.0f), 0.0f);
        if (p.length_squared() < 1.0f) {
            return p;
        }
    }
}

} // namespace sphaera
