#pragma once

#include "rendering/cairo_canvas.hpp"

#include <gtk/gtk.h>
#include <functional>
#include <string>

namespace geoplot::ui {

// Runs `paint` and reports any exception on stderr instead of letting it
// leave. Returns false when `paint` threw.
bool paint_guarded(const std::function<void()>& paint);

// Window showing a canvas at the size of the window. Display only: the
// canvas is repainted as is, with no pan/zoom controllers.
class Viewer {
public:
    explicit Viewer(const rendering::CairoCanvas& canvas, std::string title = "GeoPlot");
    ~Viewer();

    Viewer(const Viewer&) = delete;
    Viewer& operator=(const Viewer&) = delete;

    // Blocks until the window is closed. Returns the GApplication status.
    int run();

private:
    const rendering::CairoCanvas& canvas_;
    std::string title_;
    GtkApplication* app_ = nullptr;
    GtkWidget* window_ = nullptr;
    GtkWidget* drawing_area_ = nullptr;

    // GTK4 callbacks
    static void on_activate(GtkApplication* app, gpointer user_data);
    static void draw_callback(GtkDrawingArea* area, cairo_t* cr, int width, int height, gpointer user_data);

    void create_window();
};

} // namespace geoplot::ui
