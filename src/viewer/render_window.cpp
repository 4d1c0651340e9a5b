#include "render_window.hpp"
#include "tracer/ppm_writer.hpp"
#include <QVBoxLayout>
#include <QHBoxLayout>
#include <QGroupBox>
#include <QLabel>
#include <QScrollArea>
#include <QColorSpace>
#include <QFileDialog>
#include <QMessageBox>
#include <QDebug>
#include <algorithm>
#include <fstream>

namespace sphaera {

namespace {
// enough scanlines per tick to make progress without freezing the ui
constexpr int SCANLINES_PER_TICK = 4;
}

RenderWindow::RenderWindow(QWidget* parent)
    : QMainWindow(parent)
    , next_scanline(0)
    , rendering(false)
{
    setWindowTitle("sphaera - Raytracer");

    setup_ui();

    //timer for progressive updates
    update_timer = new QTimer(this);
    connect(update_timer, &QTimer::timeout, this, &RenderWindow::update_render);
}

RenderWindow::~RenderWindow() {
    update_timer->stop();
}

void RenderWindow::setup_ui() {
    QWidget* central = new QWidget(this);
    QVBoxLayout* main_layout = new QVBoxLayout(central);

    // render settings control panel
    QGroupBox* controls_group = new QGroupBox("Render Settings");
    QHBoxLayout* controls_layout = new QHBoxLayout(controls_group);

    scene_combo = new QComboBox();
    for (const std::string& name : tracer::ScenePresets::names()) {
        scene_combo->addItem(QString::fromStdString(name));
    }
    controls_layout->addWidget(new QLabel("Scene:"));
    controls_layout->addWidget(scene_combo);

    width_spinbox = new QSpinBox();
    width_spinbox->setRange(16, 4096);
    width_spinbox->setValue(400);
    width_spinbox->setSuffix(" px");
    controls_layout->addWidget(new QLabel("Width:"));
    controls_layout->addWidget(width_spinbox);

    samples_spinbox = new QSpinBox();
    samples_spinbox->setRange(1, 10000);
    samples_spinbox->setValue(10);
    controls_layout->addWidget(new QLabel("Samples:"));
    controls_layout->addWidget(samples_spinbox);

    depth_spinbox = new QSpinBox();
    depth_spinbox->setRange(1, 500);
    depth_spinbox->setValue(50);
    controls_layout->addWidget(new QLabel("Max Depth:"));
    controls_layout->addWidget(depth_spinbox);

    seed_spinbox = new QSpinBox();
    seed_spinbox->setRange(0, 1000000);
    seed_spinbox->setValue(1);
    controls_layout->addWidget(new QLabel("Seed:"));
    controls_layout->addWidget(seed_spinbox);

    controls_layout->addStretch();

    render_button = new QPushButton("Render");
    stop_button = new QPushButton("Stop");
    save_button = new QPushButton("Save PPM...");
    stop_button->setEnabled(false);
    save_button->setEnabled(false);

    connect(render_button, &QPushButton::clicked, this, &RenderWindow::on_render_clicked);
    connect(stop_button, &QPushButton::clicked, this, &RenderWindow::on_stop_clicked);
    connect(save_button, &QPushButton::clicked, this, &RenderWindow::on_save_clicked);

    controls_layout->addWidget(render_button);
    controls_layout->addWidget(stop_button);
    controls_layout->addWidget(save_button);

    progress_label = new QLabel("Ready");
    controls_layout->addWidget(progress_label);

    time_label = new QLabel("Time: 0.0s");
    controls_layout->addWidget(time_label);

    main_layout->addWidget(controls_group);

    // image display
    QScrollArea* scroll_area = new QScrollArea();
    scroll_area->setWidgetResizable(false);
    scroll_area->setAlignment(Qt::AlignCenter);

    image_label = new QLabel();
    image_label->setScaledContents(false);
    image_label->setAlignment(Qt::AlignCenter);

    scroll_area->setWidget(image_label);
    main_layout->addWidget(scroll_area, 1);

    setCentralWidget(central);
}

void RenderWindow::set_controls_enabled(bool enabled) {
    render_button->setEnabled(enabled);
    stop_button->setEnabled(!enabled);
    scene_combo->setEnabled(enabled);
    width_spinbox->setEnabled(enabled);
    samples_spinbox->setEnabled(enabled);
    depth_spinbox->setEnabled(enabled);
    seed_spinbox->setEnabled(enabled);
}

void RenderWindow::on_render_clicked() {
    start_render();
}

void RenderWindow::on_stop_clicked() {
    stop_render();
}

void RenderWindow::start_render() {
    uint64_t seed = uint64_t(seed_spinbox->value());
    std::string scene_name = scene_combo->currentText().toStdString();

    if (!tracer::ScenePresets::build(scene_name, seed, preset)) {
        progress_label->setText("Error: unknown scene");
        return;
    }

    // read config from ui, the rest comes from the preset
    CameraConfig config = preset.camera;
    config.image_width = width_spinbox->value();
    config.samples_per_pixel = samples_spinbox->value();
    config.max_depth = depth_spinbox->value();

    camera = std::make_unique<tracer::Camera>(config);

    int width = camera->get_image_width();
    int height = camera->get_image_height();

    pixels.assign(size_t(width) * size_t(height), Colour(0, 0, 0));
    next_scanline = 0;

    // prepare display image
    display_image = QImage(width, height, QImage::Format_RGB32);
    display_image.setColorSpace(QColorSpace::SRgb);
    display_image.fill(Qt::black);

    qDebug() << "Rendering" << scene_combo->currentText() << width << "x" << height
             << config.samples_per_pixel << "spp";

    rendering = true;
    set_controls_enabled(false);
    save_button->setEnabled(false);

    render_timer.start();

    update_timer->start(0);
}

void RenderWindow::stop_render() {
    rendering = false;
    update_timer->stop();

    set_controls_enabled(true);

    if (!render_timer.isValid()) return;

    float elapsed_sec = render_timer.elapsed() / 1000.0f;
    progress_label->setText("Stopped");
    time_label->setText(QString("Time: %1s (stopped)").arg(elapsed_sec, 0, 'f', 2));
}

void RenderWindow::update_render() {
    if (!rendering || !camera) return;

    int height = camera->get_image_height();
    int width = camera->get_image_width();

    int end_scanline = std::min(next_scanline + SCANLINES_PER_TICK, height);
    for (int j = next_scanline; j < end_scanline; ++j) {
        camera->render_scanline(j, preset.world, row_buffer);
        std::copy(row_buffer.begin(), row_buffer.end(), pixels.begin() + size_t(j) * size_t(width));

        for (int i = 0; i < width; ++i) {
            tracer::Rgb8 rgb = tracer::quantise(row_buffer[i]);
            display_image.setPixel(i, j, qRgb(rgb.r, rgb.g, rgb.b));
        }
    }
    next_scanline = end_scanline;

    update_display();

    float elapsed_sec = render_timer.elapsed() / 1000.0f;

    if (next_scanline >= height) {
        rendering = false;
        update_timer->stop();
        set_controls_enabled(true);
        save_button->setEnabled(true);

        progress_label->setText(QString("Complete! (%1 samples)").arg(camera->get_config().samples_per_pixel));
        time_label->setText(QString("Time: %1s").arg(elapsed_sec, 0, 'f', 2));
        return;
    }

    int progress = (next_scanline * 100) / height;
    progress_label->setText(QString("Rendering... %1%").arg(progress));
    time_label->setText(QString("Time: %1s").arg(elapsed_sec, 0, 'f', 1));
}

void RenderWindow::update_display() {
    image_label->setPixmap(QPixmap::fromImage(display_image));
    image_label->adjustSize();
}

void RenderWindow::on_save_clicked() {
    if (!camera || pixels.empty()) return;

    QString filepath = QFileDialog::getSaveFileName(this, "Save Render", "render.ppm", "PPM Images (*.ppm)");
    if (filepath.isEmpty()) return;

    std::ofstream file(filepath.toStdString());
    if (!file.is_open()) {
        qWarning() << "Failed to open file for writing: " << filepath;
        QMessageBox::warning(this, "Save Failed", "Could not open " + filepath);
        return;
    }

    tracer::PpmWriter writer(file);
    bool ok = writer.write_header(camera->get_image_width(), camera->get_image_height());
    for (size_t i = 0; ok && i < pixels.size(); ++i) {
        ok = writer.write_pixel(pixels[i]);
    }
    ok = ok && writer.finish();

    if (!ok) {
        qWarning() << "Failed to write render to " << filepath;
        QMessageBox::warning(this, "Save Failed", "Could not write " + filepath);
        return;
    }

    qDebug() << "Render saved to " << filepath;
}

} // namespace sphaera
