#pragma once

#include "plotter_config.hpp"

#include "core/geometry.hpp"
#include "core/palette.hpp"
#include "core/style.hpp"
#include "rendering/render_backend.hpp"

#include <memory>
#include <vector>

namespace geoplot::plot {

using PrimitiveList = std::vector<std::unique_ptr<rendering::Primitive>>;

// Turns geometries into backend primitives: markers for point kinds, stroked
// paths for line kinds and one compound path per polygon.
class GeometryDispatcher {
public:
    GeometryDispatcher(rendering::RenderBackend& backend, const PlotterConfig& config);

    // Colors missing from `overrides` (and from the geometry's own style) are
    // taken from `palette`, one per point/line/polygon geometry. Collection
    // members inherit the collection's overrides field by field.
    PrimitiveList plot(const core::Geometry& geometry, const core::StyleOverrides& overrides,
                       core::PaletteCursor& palette);

    // Style a geometry of `kind` would be drawn with, consuming a palette
    // color when none is given.
    core::Style resolve_style(core::GeometryKind kind, const core::StyleOverrides& overrides,
                              core::PaletteCursor& palette) const;

private:
    rendering::RenderBackend& backend_;
    const PlotterConfig& config_;

    void plot_into(PrimitiveList& out, const core::Geometry& geometry,
                   const core::StyleOverrides& inherited, core::PaletteCursor& palette);
};

} // namespace geoplot::plot
