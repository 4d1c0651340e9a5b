#include "render_options.hpp"
#include <QDebug>

namespace sphaera {

bool parse_positive_int(const QString& name, const QString& text, int& target)
{
    bool ok = false;
    int value = text.toInt(&ok);
    if (!ok || value <= 0) {
        qWarning().noquote() << name << "expects a positive integer, got" << text;
        return false;
    }
    target = value;
    return true;
}

bool parse_seed(const QString& text, uint64_t& seed)
{
    // toULongLong would wrap a leading minus
    bool ok = !text.trimmed().startsWith('-');
    qulonglong value = ok ? text.toULongLong(&ok) : 0;
    if (!ok) {
        qWarning().noquote() << "seed expects an unsigned integer, got" << text;
        return false;
    }
    seed = uint64_t(value);
    return true;
}

bool check_camera_config(const CameraConfig& config)
{
    bool valid = true;
    if (config.image_width <= 0) {
        qWarning() << "image_width must be positive, got" << config.image_width;
        valid = false;
    }
    if (config.samples_per_pixel <= 0) {
        qWarning() << "samples_per_pixel must be positive, got" << config.samples_per_pixel;
        valid = false;
    }
    if (config.max_depth <= 0) {
        qWarning() << "max_depth must be positive, got" << config.max_depth;
        valid = false;
    }
    return valid;
}

} // namespace sphaera
