#include "dispatcher.hpp"

#include "core/overloaded.hpp"
#include "core/path_builder.hpp"

namespace geoplot::plot {

GeometryDispatcher::GeometryDispatcher(rendering::RenderBackend& backend, const PlotterConfig& config)
    : backend_(backend), config_(config) {}

PrimitiveList GeometryDispatcher::plot(const core::Geometry& geometry, const core::StyleOverrides& overrides,
                                       core::PaletteCursor& palette) {
    PrimitiveList primitives;
    plot_into(primitives, geometry, overrides, palette);
    return primitives;
}

core::Style GeometryDispatcher::resolve_style(core::GeometryKind kind, const core::StyleOverrides& overrides,
                                              core::PaletteCursor& palette) const {
    const auto defaults = scaled_defaults(config_);

    core::Style style;
    style.line_width = defaults.line_width;
    style.marker_size = defaults.marker_size;

    if (core::is_polygon_kind(kind)) {
        style.filled = true;
        style.line_style = core::LineStyle::Solid;
        style.face_color = overrides.face_color ? *overrides.face_color
                         : overrides.color      ? *overrides.color
                                                : palette.next();
        style.color = overrides.edge_color ? *overrides.edge_color
                    : overrides.color      ? *overrides.color
                                           : config_.edge_color;
        if (overrides.filled) style.filled = *overrides.filled;
        if (overrides.line_width) style.line_width = *overrides.line_width;
        if (overrides.line_style) style.line_style = *overrides.line_style;
        if (overrides.alpha) style.alpha = *overrides.alpha;
        return style;
    }

    if (core::is_point_kind(kind)) {
        style.marker = core::MarkerShape::Circle;
        style.line_style = core::LineStyle::None;
    } else {
        style.marker = core::MarkerShape::None;
        style.line_style = core::LineStyle::Solid;
    }

    if (!overrides.color && !overrides.edge_color) {
        style.color = palette.next();
    }
    overrides.apply_to(style);
    if (core::is_point_kind(kind) && style.marker == core::MarkerShape::None) {
        style.marker = core::MarkerShape::Circle;
    }
    if (!overrides.face_color) {
        style.face_color = style.color;
    }
    return style;
}

void GeometryDispatcher::plot_into(PrimitiveList& out, const core::Geometry& geometry,
                                   const core::StyleOverrides& inherited, core::PaletteCursor& palette) {
    const core::StyleOverrides overrides = geometry.style().merged_over(inherited);
    const core::GeometryKind kind = geometry.kind();

    std::visit(core::overloaded{
        [&](const core::Point& point) {
            const auto style = resolve_style(kind, overrides, palette);
            out.push_back(backend_.draw_marker(point.position, style));
        },
        [&](const core::MultiPoint& multi) {
            const auto style = resolve_style(kind, overrides, palette);
            for (const auto& point : multi.points) {
                out.push_back(backend_.draw_marker(point, style));
            }
        },
        [&](const core::LineString& line) {
            const auto style = resolve_style(kind, overrides, palette);
            out.push_back(backend_.draw_path(line.points, style));
        },
        [&](const core::MultiLineString& multi) {
            const auto style = resolve_style(kind, overrides, palette);
            for (const auto& line : multi.lines) {
                out.push_back(backend_.draw_path(line, style));
            }
        },
        [&](const core::Polygon& polygon) {
            const auto path = core::build_path(polygon);
            const auto style = resolve_style(kind, overrides, palette);
            out.push_back(backend_.draw_compound_path(path, style));
        },
        [&](const core::MultiPolygon& multi) {
            const auto style = resolve_style(kind, overrides, palette);
            for (const auto& polygon : multi.polygons) {
                out.push_back(backend_.draw_compound_path(core::build_path(polygon), style));
            }
        },
        [&](const core::GeometryCollection& collection) {
            for (const auto& member : collection.members) {
                plot_into(out, member, overrides, palette);
            }
        },
    }, geometry.value());
}

} // namespace geoplot::plot
