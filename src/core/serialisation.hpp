#pragma once

#include "camera_config.hpp"
#include <QJsonObject>
#include <QJsonArray>
#include <QString>

namespace sphaera {

// camera config <-> json on disk.  scenes are built in code, only the view is persisted
class CameraConfigSerialiser {
public:
    static bool save_camera(const CameraConfig& config, const QString& filepath);

    // keys missing from the file leave the matching field of config untouched.
    // non-positive width, samples or depth fail the load and config is not modified
    static bool load_camera(CameraConfig& config, const QString& filepath);

    static QJsonObject serialise_camera(const CameraConfig& config);
    static void deserialise_camera(CameraConfig& config, const QJsonObject& obj);

    static QJsonArray vec3_to_json(const Vec3& v);
    static Vec3 json_to_vec3(const QJsonArray& arr);

    static constexpr int FILE_VERSION = 1;
};

} // namespace sphaera
