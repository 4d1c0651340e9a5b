// main.cpp - viewer entry point
#include <QApplication>
#include "viewer/render_window.hpp"

int main(int argc, char* argv[]) {
    QApplication app(argc, argv);

    sphaera::RenderWindow window;
    window.show();

    return app.exec();
}
