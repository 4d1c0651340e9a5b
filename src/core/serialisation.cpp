#include "serialisation.hpp"
#include "render_options.hpp"
#include <QDebug>
#include <QFile>
#include <QJsonDocument>

namespace sphaera {

// == main methods ==

bool CameraConfigSerialiser::save_camera(const CameraConfig& config, const QString& filepath)
{
    QJsonObject root_obj;
    root_obj["version"] = FILE_VERSION;
    root_obj["camera"] = serialise_camera(config);

    QJsonDocument doc(root_obj);

    QFile file(filepath);
    if (!file.open(QIODevice::WriteOnly)) {
        qWarning() << "Failed to open file for writing: " << filepath;
        return false;
    }

    QByteArray data = doc.toJson(QJsonDocument::Indented);
    if (file.write(data) != data.size()) {
        qWarning() << "Failed to write camera to " << filepath;
        return false;
    }
    file.close();

    qDebug() << "Camera saved to " << filepath;

    return true;
}

bool CameraConfigSerialiser::load_camera(CameraConfig& config, const QString& filepath)
{
    QFile file(filepath);
    if (!file.open(QIODevice::ReadOnly)) {
        qWarning() << "Failed to open file for reading: " << filepath;
        return false;
    }

    QByteArray data = file.readAll();
    file.close();

    QJsonParseError parse_error;
    QJsonDocument doc = QJsonDocument::fromJson(data, &parse_error);
    if (doc.isNull() || !doc.isObject()) {
        qWarning() << "Invalid JSON in file: " << filepath << parse_error.errorString();
        return false;
    }

    QJsonObject root_obj = doc.object();
    int version = root_obj["version"].toInt();

    if (version != FILE_VERSION) {
        qWarning() << "Unsupported camera version: " << version;
        return false;
    }

    if (!root_obj["camera"].isObject()) {
        qWarning() << "No camera object in file: " << filepath;
        return false;
    }

    // a file that would leave the camera unrenderable is rejected whole
    CameraConfig loaded = config;
    deserialise_camera(loaded, root_obj["camera"].toObject());
    if (!check_camera_config(loaded)) {
        qWarning() << "Invalid camera settings in file: " << filepath;
        return false;
    }
    config = loaded;

    qDebug() << "Camera loaded from " << filepath;
    return true;
}

// == camera ==

QJsonObject CameraConfigSerialiser::serialise_camera(const CameraConfig& config)
{
    QJsonObject obj;
    obj["aspect_ratio"] = double(config.aspect_ratio);
    obj["image_width"] = config.image_width;
    obj["samples_per_pixel"] = config.samples_per_pixel;
    obj["max_depth"] = config.max_depth;
    obj["vfov"] = double(config.vfov);
    obj["lookfrom"] = vec3_to_json(config.lookfrom);
    obj["lookat"] = vec3_to_json(config.lookat);
    obj["vup"] = vec3_to_json(config.vup);
    obj["defocus_angle"] = double(config.defocus_angle);
    obj["focus_dist"] = double(config.focus_dist);
    obj["seed"] = qint64(config.seed);
    return obj;
}

void CameraConfigSerialiser::deserialise_camera(CameraConfig& config, const QJsonObject& obj)
{
    if (obj.contains("aspect_ratio")) config.aspect_ratio = float(obj["aspect_ratio"].toDouble());
    if (obj.contains("image_width")) config.image_width = obj["image_width"].toInt();
    if (obj.contains("samples_per_pixel")) config.samples_per_pixel = obj["samples_per_pixel"].toInt();
    if (obj.contains("max_depth")) config.max_depth = obj["max_depth"].toInt();
    if (obj.contains("vfov")) config.vfov = float(obj["vfov"].toDouble());
    if (obj.contains("lookfrom")) config.lookfrom = json_to_vec3(obj["lookfrom"].toArray());
    if (obj.contains("lookat")) config.lookat = json_to_vec3(obj["lookat"].toArray());
    if (obj.contains("vup")) config.vup = json_to_vec3(obj["vup"].toArray());
    if (obj.contains("defocus_angle")) config.defocus_angle = float(obj["defocus_angle"].toDouble());
    if (obj.contains("focus_dist")) config.focus_dist = float(obj["focus_dist"].toDouble());
    if (obj.contains("seed")) config.seed = uint64_t(obj["seed"].toInteger());
}

// == helpers ==

QJsonArray CameraConfigSerialiser::vec3_to_json(const Vec3& v)
{
    return QJsonArray{ double(v.x), double(v.y), double(v.z) };
}

Vec3 CameraConfigSerialiser::json_to_vec3(const QJsonArray& arr)
{
    if (arr.size() != 3) return Vec3(0, 0, 0);
    return Vec3(
        float(arr[0].toDouble()),
        float(arr[1].toDouble()),
        float(arr[2].toDouble())
    );
}

} // namespace sphaera
