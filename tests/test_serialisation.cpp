#include <gtest/gtest.h>
#include "core/serialisation.hpp"
#include <QFile>
#include <QJsonDocument>
#include <QTemporaryDir>

using namespace sphaera;

namespace {

bool write_text(const QString& path, const QByteArray& text)
{
    QFile file(path);
    if (!file.open(QIODevice::WriteOnly)) return false;
    return file.write(text) == text.size();
}

} // namespace

TEST(CameraConfigSerialiser, SavedCameraLoadsBack)
{
    QTemporaryDir dir;
    ASSERT_TRUE(dir.isValid());
    QString path = dir.filePath("camera.json");

    CameraConfig config;
    config.aspect_ratio = 16.0f / 9.0f;
    config.image_width = 640;
    config.samples_per_pixel = 32;
    config.max_depth = 12;
    config.vfov = 35.0f;
    config.lookfrom = Point3(13, 2, 3);
    config.lookat = Point3(0, 0, 0);
    config.defocus_angle = 0.6f;
    config.focus_dist = 10.0f;
    config.seed = 987654321ULL;

    ASSERT_TRUE(CameraConfigSerialiser::save_camera(config, path));

    CameraConfig loaded;
    ASSERT_TRUE(CameraConfigSerialiser::load_camera(loaded, path));
    EXPECT_FLOAT_EQ(loaded.aspect_ratio, config.aspect_ratio);
    EXPECT_EQ(loaded.image_width, 640);
    EXPECT_EQ(loaded.samples_per_pixel, 32);
    EXPECT_EQ(loaded.max_depth, 12);
    EXPECT_FLOAT_EQ(loaded.vfov, 35.0f);
    EXPECT_FLOAT_EQ(loaded.lookfrom.x, 13.0f);
    EXPECT_FLOAT_EQ(loaded.lookfrom.y, 2.0f);
    EXPECT_FLOAT_EQ(loaded.lookat.z, 0.0f);
    EXPECT_FLOAT_EQ(loaded.vup.y, 1.0f);
    EXPECT_FLOAT_EQ(loaded.defocus_angle, 0.6f);
    EXPECT_EQ(loaded.seed, 987654321ULL);
}

TEST(CameraConfigSerialiser, MissingKeysKeepCurrentValues)
{
    QTemporaryDir dir;
    ASSERT_TRUE(dir.isValid());
    QString path = dir.filePath("partial.json");
    ASSERT_TRUE(write_text(path, R"({ "version": 1, "camera": { "image_width": 320, "lookat": [1, 2, 3] } })"));

    CameraConfig config;
    config.samples_per_pixel = 77;
    ASSERT_TRUE(CameraConfigSerialiser::load_camera(config, path));

    EXPECT_EQ(config.image_width, 320);
    EXPECT_FLOAT_EQ(config.lookat.x, 1.0f);
    EXPECT_FLOAT_EQ(config.lookat.z, 3.0f);
    EXPECT_EQ(config.samples_per_pixel, 77);
    EXPECT_FLOAT_EQ(config.vfov, 90.0f);
}

TEST(CameraConfigSerialiser, RejectsUnsupportedVersion)
{
    QTemporaryDir dir;
    ASSERT_TRUE(dir.isValid());
    QString path = dir.filePath("future.json");
    ASSERT_TRUE(write_text(path, R"({ "version": 2, "camera": { "image_width": 320 } })"));

    CameraConfig config;
    EXPECT_FALSE(CameraConfigSerialiser::load_camera(config, path));
    EXPECT_EQ(config.image_width, 100);
}

TEST(CameraConfigSerialiser, RejectsNonPositiveSizes)
{
    QTemporaryDir dir;
    ASSERT_TRUE(dir.isValid());
    QString path = dir.filePath("negative.json");
    ASSERT_TRUE(write_text(path, R"({ "version": 1, "camera": { "image_width": -5, "vfov": 40 } })"));

    CameraConfig config;
    EXPECT_FALSE(CameraConfigSerialiser::load_camera(config, path));
    EXPECT_EQ(config.image_width, 100);
    EXPECT_FLOAT_EQ(config.vfov, 90.0f);

    ASSERT_TRUE(write_text(path, R"({ "version": 1, "camera": { "samples_per_pixel": 0 } })"));
    EXPECT_FALSE(CameraConfigSerialiser::load_camera(config, path));

    ASSERT_TRUE(write_text(path, R"({ "version": 1, "camera": { "max_depth": -1 } })"));
    EXPECT_FALSE(CameraConfigSerialiser::load_camera(config, path));
    EXPECT_EQ(config.max_depth, 10);
}

TEST(CameraConfigSerialiser, RejectsMalformedJson)
{
    QTemporaryDir dir;
    ASSERT_TRUE(dir.isValid());
    QString path = dir.filePath("broken.json");
    ASSERT_TRUE(write_text(path, "{ \"version\": 1, \"camera\": "));

    CameraConfig config;
    EXPECT_FALSE(CameraConfigSerialiser::load_camera(config, path));
}

TEST(CameraConfigSerialiser, RejectsMissingFile)
{
    QTemporaryDir dir;
    ASSERT_TRUE(dir.isValid());

    CameraConfig config;
    EXPECT_FALSE(CameraConfigSerialiser::load_camera(config, dir.filePath("nope.json")));
}

TEST(CameraConfigSerialiser, ShortVectorFallsBackToZero)
{
    Vec3 v = CameraConfigSerialiser::json_to_vec3(QJsonArray{ 1.0, 2.0 });
    EXPECT_FLOAT_EQ(v.x, 0.0f);
    EXPECT_FLOAT_EQ(v.y, 0.0f);
    EXPECT_FLOAT_EQ(v.z, 0.0f);
}
