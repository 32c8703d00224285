#pragma once

#include "core/path_builder.hpp"
#include "core/style.hpp"
#include "core/types.hpp"

#include <cstddef>
#include <vector>

namespace geoplot::rendering {

enum class PrimitiveKind {
    Marker,        // glyph at a single point
    StrokedPath,   // open or closed polyline
    CompoundPath   // filled/outlined multi-contour path
};

// Drawable object created by a RenderBackend. Carries its geometry in data
// coordinates and the style it is drawn with.
class Primitive {
public:
    Primitive(PrimitiveKind kind, std::vector<core::Point2D> vertices,
              std::vector<core::PathInstruction> instructions,
              const core::Style& style, bool closed = false);

    [[nodiscard]] PrimitiveKind kind() const { return kind_; }
    [[nodiscard]] const std::vector<core::Point2D>& vertices() const { return vertices_; }
    [[nodiscard]] const std::vector<core::PathInstruction>& instructions() const { return instructions_; }
    [[nodiscard]] std::size_t point_count() const { return vertices_.size(); }
    [[nodiscard]] bool closed() const { return closed_; }

    [[nodiscard]] const core::Style& style() const { return style_; }
    void set_style(const core::Style& style) { style_ = style; }

    [[nodiscard]] core::Bounds2D bounds() const;

private:
    PrimitiveKind kind_;
    std::vector<core::Point2D> vertices_;
    std::vector<core::PathInstruction> instructions_;
    core::Style style_;
    bool closed_;
};

// Whether `replacement` can take over the look of `previous`: same class, and
// for markers and stroked paths equal point counts or both counts above one.
[[nodiscard]] bool same_drawable_kind(const Primitive& previous, const Primitive& replacement);

const char* primitive_kind_name(PrimitiveKind kind);

} // namespace geoplot::rendering
