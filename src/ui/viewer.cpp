#include "viewer.hpp"

#include "core/errors.hpp"

#include <exception>
#include <iostream>
#include <utility>

namespace geoplot::ui {

bool paint_guarded(const std::function<void()>& paint) {
    try {
        paint();
        return true;
    } catch (const std::exception& ex) {
        std::cerr << "[Viewer ERROR] " << ex.what() << std::endl;
        return false;
    }
}

Viewer::Viewer(const rendering::CairoCanvas& canvas, std::string title)
    : canvas_(canvas), title_(std::move(title)) {
    app_ = gtk_application_new("org.geoplot.viewer", G_APPLICATION_NON_UNIQUE);
    if (!app_) {
        throw core::BackendFailure("Failed to create GTK application");
    }
    g_signal_connect(app_, "activate", G_CALLBACK(on_activate), this);
}

Viewer::~Viewer() {
    if (app_) {
        g_object_unref(app_);
    }
}

int Viewer::run() {
    // No command line is forwarded: GTK would try to open the inputs as files
    return g_application_run(G_APPLICATION(app_), 0, nullptr);
}

void Viewer::create_window() {
    window_ = gtk_application_window_new(app_);
    gtk_window_set_title(GTK_WINDOW(window_), title_.c_str());

    const auto& options = canvas_.options();
    gtk_window_set_default_size(GTK_WINDOW(window_),
                                static_cast<int>(options.width_in * options.dpi),
                                static_cast<int>(options.height_in * options.dpi));

    drawing_area_ = gtk_drawing_area_new();
    gtk_widget_set_hexpand(drawing_area_, TRUE);
    gtk_widget_set_vexpand(drawing_area_, TRUE);
    gtk_drawing_area_set_draw_func(GTK_DRAWING_AREA(drawing_area_), draw_callback, this, nullptr);

    gtk_window_set_child(GTK_WINDOW(window_), drawing_area_);
    gtk_window_present(GTK_WINDOW(window_));
}

// Static callback implementations
void Viewer::on_activate([[maybe_unused]] GtkApplication* app, gpointer user_data) {
    auto* self = static_cast<Viewer*>(user_data);
    self->create_window();
}

void Viewer::draw_callback([[maybe_unused]] GtkDrawingArea* area, cairo_t* cr, int width, int height,
                           gpointer user_data) {
    auto* self = static_cast<Viewer*>(user_data);
    // Exceptions must not unwind through GTK's C frames
    const bool painted = paint_guarded(
        [&] { self->canvas_.render(cr, width, height, self->canvas_.options().dpi / 72.0); });
    if (!painted) {
        g_application_quit(G_APPLICATION(self->app_));
    }
}

} // namespace geoplot::ui
