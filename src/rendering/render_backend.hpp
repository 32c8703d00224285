#pragma once

#include "primitive.hpp"

#include "core/path_builder.hpp"
#include "core/style.hpp"
#include "core/types.hpp"

#include <memory>
#include <string>
#include <vector>

namespace geoplot::rendering {

// Surface that creates drawable primitives and shows the attached ones.
// Attached primitives are referenced, not owned: callers keep them alive until
// they are detached. Failures are reported as core::BackendFailure.
class RenderBackend {
public:
    virtual ~RenderBackend() = default;

    virtual std::unique_ptr<Primitive> draw_marker(const core::Point2D& point, const core::Style& style) = 0;
    virtual std::unique_ptr<Primitive> draw_path(const std::vector<core::Point2D>& vertices,
                                                 const core::Style& style, bool closed = false) = 0;
    virtual std::unique_ptr<Primitive> draw_compound_path(const core::PathSpec& path, const core::Style& style) = 0;

    virtual void attach(Primitive& primitive) = 0;
    virtual void detach(Primitive& primitive) = 0;
    virtual void detach_all() = 0;

    // Explicit view limits; without them the view fits the attached data.
    virtual void set_bounds(const core::Bounds2D& bounds) = 0;
    virtual void clear_bounds() = 0;
    [[nodiscard]] virtual core::Bounds2D bounds() const = 0;
    virtual void set_equal_aspect(bool equal) = 0;
    virtual void set_axis_visible(bool visible) = 0;

    virtual void rasterize_to_file(const std::string& path, double dpi) = 0;
};

} // namespace geoplot::rendering
