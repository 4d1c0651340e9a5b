#pragma once

#include <QMainWindow>
#include <QLabel>
#include <QPushButton>
#include <QSpinBox>
#include <QTimer>
#include <QElapsedTimer>
#include <QImage>
#include <QComboBox>
#include <memory>
#include <vector>
#include "tracer/camera.hpp"
#include "tracer/scene_presets.hpp"

namespace sphaera {

// progressive preview.  renders a few scanlines per timer tick on the gui thread
class RenderWindow : public QMainWindow {
    Q_OBJECT

public:
    explicit RenderWindow(QWidget* parent = nullptr);
    ~RenderWindow() override;

    void start_render();
    void stop_render();

private slots:
    void on_render_clicked();
    void on_stop_clicked();
    void on_save_clicked();
    void update_render();

private:
    void setup_ui();
    void set_controls_enabled(bool enabled);
    void update_display();

    tracer::ScenePreset preset;
    std::unique_ptr<tracer::Camera> camera;

    int next_scanline;
    bool rendering;
    std::vector<Colour> pixels;   // linear, filled as scanlines complete
    std::vector<Colour> row_buffer;

    QLabel* image_label;
    QImage display_image;

    QComboBox* scene_combo;
    QPushButton* render_button;
    QPushButton* stop_button;
    QPushButton* save_button;
    QSpinBox* width_spinbox;
    QSpinBox* samples_spinbox;
    QSpinBox* depth_spinbox;
    QSpinBox* seed_spinbox;
    QLabel* progress_label;

    QTimer* update_timer;

    QElapsedTimer render_timer;
    QLabel* time_label;
};

} // namespace sphaera
