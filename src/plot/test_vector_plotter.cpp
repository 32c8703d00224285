#include "test_recording_backend.hpp"
#include "vector_plotter.hpp"

#include "core/errors.hpp"
#include "core/ring_orientation.hpp"

#include <iostream>
#include <stdexcept>
#include <utility>

namespace geoplot::plot {

namespace vector_plotter_tests {

using core::Point2D;

PlotterConfig quiet_config() {
    PlotterConfig config;
    config.log_callback = testing::silent_log;
    return config;
}

core::Polygon polygon_at(double offset) {
    core::Polygon polygon;
    polygon.rings.push_back({{offset, 0}, {offset + 1, 0}, {offset + 1, 1}, {offset, 1}});
    return polygon;
}

const core::Style& first_style(const VectorPlotter& plotter, const std::string& layer) {
    return plotter.layers().primitives(layer).front()->style();
}

bool test_view_config_applied() {
    testing::RecordingBackend backend;
    PlotterConfig config = quiet_config();
    config.limits = core::Bounds2D{-1, 1, -2, 2};
    config.axis_visible = false;
    VectorPlotter plotter(backend, config);

    if (!backend.explicit_bounds || backend.explicit_bounds->y_max != 2 || backend.axis_visible || !backend.equal_aspect) {
        std::cerr << "Constructor should push the view configuration to the backend" << std::endl;
        return false;
    }
    plotter.set_limits(0, 10, 0, 5);
    plotter.clear();
    return backend.explicit_bounds && backend.explicit_bounds->x_max == 1;
}

bool test_triangle_scenario() {
    testing::RecordingBackend backend;
    VectorPlotter plotter(backend, quiet_config());
    const auto& tab10 = core::PaletteCursor::default_colors();

    core::Polygon triangle;
    triangle.rings.push_back({{0, 0}, {4, 0}, {0, 4}});
    const std::string first = plotter.plot(triangle);

    const auto& primitives = plotter.layers().primitives(first);
    if (primitives.size() != 1 || !primitives[0]->style().filled) {
        std::cerr << "Triangle should give one filled primitive" << std::endl;
        return false;
    }
    const auto& vertices = primitives[0]->vertices();
    if (core::signed_area(core::Ring(vertices.begin(), vertices.end())) <= 0.0) {
        std::cerr << "Triangle should be drawn clockwise" << std::endl;
        return false;
    }
    if (primitives[0]->style().face_color != tab10[0]) {
        return false;
    }

    const std::string second = plotter.plot(polygon_at(10));
    if (first_style(plotter, second).face_color != tab10[1]) {
        std::cerr << "Second polygon should use the second palette entry" << std::endl;
        return false;
    }

    for (int i = 2; i < 10; ++i) {
        plotter.plot(polygon_at(10.0 * i));
    }
    const std::string wrapped = plotter.plot(polygon_at(200));
    return first_style(plotter, wrapped).face_color == tab10[0] && plotter.layer_names().size() == 11;
}

bool test_style_continuity_across_plots() {
    testing::RecordingBackend backend;
    VectorPlotter plotter(backend, quiet_config());

    core::StyleOverrides explicit_style;
    explicit_style.color = core::parse_color("r");
    explicit_style.line_width = 3.0;

    const core::LineString road{{{0, 0}, {1, 1}, {2, 1}}};
    plotter.plot(road, explicit_style, "roads");
    const core::Style original = first_style(plotter, "roads");

    plotter.plot(core::LineString{{{5, 5}, {6, 5}, {7, 6}}}, {}, "roads");
    const core::Style& restyled = first_style(plotter, "roads");
    return restyled == original && restyled.line_width == 3.0 && backend.attached.size() == 1;
}

bool test_symbol_plot() {
    testing::RecordingBackend backend;
    VectorPlotter plotter(backend, quiet_config());

    core::MultiPoint cities;
    cities.points = {{0, 0}, {1, 1}, {2, 2}};
    plotter.plot_symbol(cities, "ro", "cities");

    const auto& style = first_style(plotter, "cities");
    return style.color == *core::parse_color("r") && style.marker == core::MarkerShape::Circle &&
           plotter.layers().primitives("cities").size() == 3 && plotter.palette().position() == 0;
}

bool test_record_plot() {
    testing::RecordingBackend backend;
    VectorPlotter plotter(backend, quiet_config());

    core::GeometryRecord point(core::wkb::kPoint, {{3, 4}});
    const std::string name = plotter.plot(point);
    if (plotter.layers().primitives(name).size() != 1) {
        return false;
    }

    try {
        plotter.plot(core::GeometryRecord(42, {{0, 0}}), {}, "bad");
    } catch (const core::UnsupportedGeometryKind&) {
        return !plotter.layers().contains("bad") && plotter.layers().size() == 1;
    }
    return false;
}

bool test_source_shares_one_color() {
    testing::RecordingBackend backend;
    VectorPlotter plotter(backend, quiet_config());

    core::VectorSource source;
    for (int i = 0; i < 4; ++i) {
        core::GeometryRecord polygon(core::wkb::kPolygon);
        polygon.add_part(core::GeometryRecord(core::wkb::kLineString,
                                              {{i * 2.0, 0}, {i * 2.0 + 1, 0}, {i * 2.0 + 1, 1}, {i * 2.0, 1}}));
        source.add(std::move(polygon));
    }

    const std::string name = plotter.plot(source, {}, "parcels");
    const auto& primitives = plotter.layers().primitives(name);
    if (primitives.size() != 4) {
        std::cerr << "Every source geometry should land in the layer" << std::endl;
        return false;
    }
    for (const auto& primitive : primitives) {
        if (primitive->style().face_color != core::PaletteCursor::default_colors()[0]) {
            std::cerr << "Source geometries should share one color" << std::endl;
            return false;
        }
    }

    // The source is rewound for the next reader
    core::GeometryRecord record;
    return plotter.palette().position() == 1 && source.next(record);
}

bool test_failed_plot_keeps_layers() {
    testing::RecordingBackend backend;
    VectorPlotter plotter(backend, quiet_config());
    plotter.plot(polygon_at(0), {}, "parcels");
    const auto* before = plotter.layers().primitives("parcels").front().get();

    core::MultiPoint points;
    points.points = {{0, 0}, {1, 1}};
    backend.draws_before_failure = 1;
    try {
        plotter.plot(points, {}, "parcels");
    } catch (const core::BackendFailure&) {
        return plotter.layers().primitives("parcels").front().get() == before &&
               plotter.layers().is_visible("parcels") && backend.attached.size() == 1;
    }
    return false;
}

bool test_hide_show_remove() {
    testing::RecordingBackend backend;
    VectorPlotter plotter(backend, quiet_config());
    plotter.plot(polygon_at(0), {}, "a");
    plotter.plot(polygon_at(5), {}, "b");

    plotter.hide("a");
    plotter.hide("missing");
    if (backend.attached.size() != 1) {
        return false;
    }
    plotter.show("a");
    plotter.remove("b");
    plotter.remove("missing");
    return backend.attached.size() == 1 && plotter.layer_names() == std::vector<std::string>{"a"};
}

bool test_zoom() {
    testing::RecordingBackend backend;
    VectorPlotter plotter(backend, quiet_config());
    plotter.set_limits(0, 100, 0, 50);

    plotter.zoom(10);
    const auto in = backend.bounds();
    if (in.x_min != 10 || in.x_max != 90 || in.y_min != 5 || in.y_max != 45) {
        std::cerr << "Zooming in by 10% should shrink each side" << std::endl;
        return false;
    }

    plotter.set_limits(0, 100, 0, 50);
    plotter.zoom(-10);
    const auto out = backend.bounds();
    if (out.x_min != -10 || out.x_max != 110) {
        return false;
    }

    try {
        plotter.zoom(50);
    } catch (const std::invalid_argument&) {
        return true;
    }
    return false;
}

bool test_axis_and_save() {
    testing::RecordingBackend backend;
    PlotterConfig config = quiet_config();
    config.dpi = 150;
    VectorPlotter plotter(backend, config);

    plotter.axis_on(false);
    if (backend.axis_visible) {
        return false;
    }
    plotter.save("figure.png");
    if (backend.saved_path != "figure.png" || backend.saved_dpi != 150) {
        return false;
    }
    plotter.save("figure.pdf", 300);
    return backend.saved_dpi == 300;
}

bool test_log_callback_receives_messages() {
    testing::RecordingBackend backend;
    std::vector<std::string> messages;
    PlotterConfig config;
    config.log_callback = [&messages](const std::string& message, bool) { messages.push_back(message); };
    {
        VectorPlotter plotter(backend, config);
        plotter.plot(polygon_at(0), {}, "parcels");
    }
    return !messages.empty() && messages.front().find("parcels") != std::string::npos;
}

bool run_all_tests() {
    const std::pair<const char*, bool (*)()> tests[] = {
        {"view_config_applied", &test_view_config_applied},
        {"triangle_scenario", &test_triangle_scenario},
        {"style_continuity_across_plots", &test_style_continuity_across_plots},
        {"symbol_plot", &test_symbol_plot},
        {"record_plot", &test_record_plot},
        {"source_shares_one_color", &test_source_shares_one_color},
        {"failed_plot_keeps_layers", &test_failed_plot_keeps_layers},
        {"hide_show_remove", &test_hide_show_remove},
        {"zoom", &test_zoom},
        {"axis_and_save", &test_axis_and_save},
        {"log_callback_receives_messages", &test_log_callback_receives_messages},
    };

    bool all_passed = true;

    for (const auto& [name, fn] : tests) {
        if (!fn()) {
            std::cerr << "❌ " << name << std::endl;
            all_passed = false;
        } else {
            std::cout << "✅ " << name << std::endl;
        }
    }

    return all_passed;
}

} // namespace vector_plotter_tests

} // namespace geoplot::plot

int main() {
    if (geoplot::plot::vector_plotter_tests::run_all_tests()) {
        std::cout << "All plotting session tests passed" << std::endl;
        return 0;
    }

    std::cerr << "Plotting session tests failed" << std::endl;
    return 1;
}
