#pragma once

#include <cstdint>
#include <stdexcept>
#include <string>

namespace geoplot::core {

class GeoPlotError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// Geometry tag outside the point/line/polygon/collection family.
class UnsupportedGeometryKind : public GeoPlotError {
public:
    explicit UnsupportedGeometryKind(std::uint32_t tag)
        : GeoPlotError("Unsupported geometry kind: " + std::to_string(tag)), tag_(tag) {}

    UnsupportedGeometryKind(std::uint32_t tag, const std::string& detail)
        : GeoPlotError("Unsupported geometry kind " + std::to_string(tag) + ": " + detail), tag_(tag) {}

    [[nodiscard]] std::uint32_t tag() const { return tag_; }

private:
    std::uint32_t tag_;
};

// Ring (or polygon) without enough points to determine a winding.
class DegenerateRing : public GeoPlotError {
public:
    using GeoPlotError::GeoPlotError;
};

// Raised by a rendering backend when drawing, attaching or writing fails.
class BackendFailure : public GeoPlotError {
public:
    using GeoPlotError::GeoPlotError;
};

} // namespace geoplot::core
