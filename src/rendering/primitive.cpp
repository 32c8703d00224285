#include "primitive.hpp"

#include <utility>

namespace geoplot::rendering {

Primitive::Primitive(PrimitiveKind kind, std::vector<core::Point2D> vertices,
                     std::vector<core::PathInstruction> instructions,
                     const core::Style& style, bool closed)
    : kind_(kind)
    , vertices_(std::move(vertices))
    , instructions_(std::move(instructions))
    , style_(style)
    , closed_(closed) {}

core::Bounds2D Primitive::bounds() const {
    if (vertices_.empty()) {
        return core::Bounds2D{0.0, -1.0, 0.0, -1.0};
    }
    auto bounds = core::Bounds2D::around(vertices_.front());
    for (const auto& vertex : vertices_) {
        bounds.expand(vertex);
    }
    return bounds;
}

bool same_drawable_kind(const Primitive& previous, const Primitive& replacement) {
    if (previous.kind() != replacement.kind()) {
        return false;
    }
    if (previous.kind() == PrimitiveKind::CompoundPath) {
        return true;
    }
    if (previous.point_count() == replacement.point_count()) {
        return true;
    }
    return previous.point_count() > 1 && replacement.point_count() > 1;
}

const char* primitive_kind_name(PrimitiveKind kind) {
    switch (kind) {
    case PrimitiveKind::Marker: return "marker";
    case PrimitiveKind::StrokedPath: return "stroked path";
    case PrimitiveKind::CompoundPath: return "compound path";
    }
    return "unknown";
}

} // namespace geoplot::rendering
