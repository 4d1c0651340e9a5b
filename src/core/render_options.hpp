#pragma once

#include "camera_config.hpp"
#include <QString>
#include <cstdint>

namespace sphaera {

// option values for the command line renderer.  on bad input these log a warning
// naming the option and leave the target untouched

bool parse_positive_int(const QString& name, const QString& text, int& target);
bool parse_seed(const QString& text, uint64_t& seed);

// width, samples and depth must be positive before a Camera is built from config.
// warns once per offending field
bool check_camera_config(const CameraConfig& config);

} // namespace sphaera
