// render_main.cpp - command line renderer, writes a P3 image
#include <QCommandLineParser>
#include <QCoreApplication>
#include <QDebug>
#include <QElapsedTimer>
#include <QStringList>
#include <fstream>
#include <iostream>
#include "core/render_options.hpp"
#include "core/serialisation.hpp"
#include "tracer/camera.hpp"
#include "tracer/scene_presets.hpp"

namespace {

// leaves target alone if the option wasn't given
bool read_positive_option(const QCommandLineParser& parser, const QCommandLineOption& option, int& target)
{
    if (!parser.isSet(option)) return true;
    return sphaera::parse_positive_int("--" + option.names().last(), parser.value(option), target);
}

} // namespace

int main(int argc, char* argv[]) {
    QCoreApplication app(argc, argv);
    QCoreApplication::setApplicationName("sphaera_render");
    QCoreApplication::setApplicationVersion("1.0");

    QString scene_list = QString::fromStdString(
        [] {
            std::string joined;
            for (const std::string& name : sphaera::tracer::ScenePresets::names()) {
                if (!joined.empty()) joined += ", ";
                joined += name;
            }
            return joined;
        }());

    QCommandLineParser parser;
    parser.setApplicationDescription("Monte Carlo sphere ray tracer");
    parser.addHelpOption();
    parser.addVersionOption();

    QCommandLineOption scene_option("scene", "Scene preset: " + scene_list + ".", "name", "two_spheres");
    QCommandLineOption width_option("width", "Image width in pixels.", "px");
    QCommandLineOption samples_option("samples", "Samples per pixel.", "n");
    QCommandLineOption depth_option("depth", "Maximum bounces per path.", "n");
    QCommandLineOption seed_option("seed", "Random seed.", "n", "1");
    QCommandLineOption camera_option("camera", "Load camera settings from a JSON file.", "file");
    QCommandLineOption save_camera_option("save-camera", "Write the final camera settings to a JSON file.", "file");
    QCommandLineOption output_option(QStringList() << "o" << "output", "Output PPM file, stdout if omitted.", "file");
    QCommandLineOption quiet_option(QStringList() << "q" << "quiet", "No scanline progress on stderr.");

    parser.addOption(scene_option);
    parser.addOption(width_option);
    parser.addOption(samples_option);
    parser.addOption(depth_option);
    parser.addOption(seed_option);
    parser.addOption(camera_option);
    parser.addOption(save_camera_option);
    parser.addOption(output_option);
    parser.addOption(quiet_option);

    parser.process(app);

    uint64_t seed = 0;
    if (!sphaera::parse_seed(parser.value(seed_option), seed)) return 1;

    sphaera::tracer::ScenePreset preset;
    std::string scene_name = parser.value(scene_option).toStdString();
    if (!sphaera::tracer::ScenePresets::build(scene_name, seed, preset)) {
        qWarning().noquote() << "Unknown scene" << parser.value(scene_option) << "- expected one of:" << scene_list;
        return 1;
    }

    sphaera::CameraConfig config = preset.camera;

    if (parser.isSet(camera_option)) {
        if (!sphaera::CameraConfigSerialiser::load_camera(config, parser.value(camera_option))) {
            return 1;
        }
        // an explicit --seed wins over the file
        if (parser.isSet(seed_option)) config.seed = seed;
    }

    if (!read_positive_option(parser, width_option, config.image_width)) return 1;
    if (!read_positive_option(parser, samples_option, config.samples_per_pixel)) return 1;
    if (!read_positive_option(parser, depth_option, config.max_depth)) return 1;
    if (!sphaera::check_camera_config(config)) return 1;

    if (parser.isSet(save_camera_option)) {
        if (!sphaera::CameraConfigSerialiser::save_camera(config, parser.value(save_camera_option))) {
            return 1;
        }
    }

    sphaera::tracer::Camera camera(config);

    std::ofstream file_out;
    if (parser.isSet(output_option)) {
        file_out.open(parser.value(output_option).toStdString());
        if (!file_out.is_open()) {
            qWarning() << "Failed to open output file:" << parser.value(output_option);
            return 1;
        }
    }
    std::ostream& image_out = file_out.is_open() ? static_cast<std::ostream&>(file_out) : std::cout;

    std::ostream null_out(nullptr);
    std::ostream& progress_out = parser.isSet(quiet_option) ? null_out : std::clog;

    qInfo().noquote() << "Rendering" << parser.value(scene_option)
                      << QString("%1x%2").arg(camera.get_image_width()).arg(camera.get_image_height())
                      << config.samples_per_pixel << "spp, depth" << config.max_depth
                      << "," << preset.world.size() << "spheres";

    QElapsedTimer render_timer;
    render_timer.start();

    if (!camera.render(preset.world, image_out, progress_out)) {
        qWarning() << "Render failed, output is incomplete";
        return 1;
    }

    float elapsed_sec = render_timer.elapsed() / 1000.0f;
    qInfo().noquote() << QString("Time: %1s").arg(elapsed_sec, 0, 'f', 2);

    return 0;
}
