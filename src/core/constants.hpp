#pragma once

namespace sphaera {

// coordinate system: Y-up, right-handed, default camera looks down -Z

constexpr float ALMOST_ZERO = 1e-8f;
constexpr float PI = 3.14159265359f;
constexpr float DEG_TO_RAD = PI / 180.0f;

// lower bound of every scene query, keeps bounced rays off the surface they left
constexpr float SHADOW_ACNE_EPSILON = 0.001f;

} // namespace sphaera
