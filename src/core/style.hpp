#pragma once

#include <optional>
#include <string>
#include <string_view>

namespace geoplot::core {

struct Color {
    double r = 0.0;
    double g = 0.0;
    double b = 0.0;
    double a = 1.0;

    bool operator==(const Color& other) const {
        return r == other.r && g == other.g && b == other.b && a == other.a;
    }
    bool operator!=(const Color& other) const { return !(*this == other); }
};

enum class LineStyle {
    Solid,
    Dashed,
    Dotted,
    DashDot,
    None
};

enum class MarkerShape {
    None,
    Circle,
    Point,
    Square,
    TriangleUp,
    TriangleDown,
    Diamond,
    Plus,
    Cross
};

// Full set of drawing parameters carried by a primitive.
// `color` strokes lines, outlines and markers; `face_color` fills polygons.
struct Style {
    Color color = {0.0, 0.0, 0.0, 1.0};
    Color face_color = {0.0, 0.0, 0.0, 1.0};
    bool filled = false;
    double line_width = 1.0;
    LineStyle line_style = LineStyle::Solid;
    MarkerShape marker = MarkerShape::None;
    double marker_size = 6.0;
    double alpha = 1.0;

    bool operator==(const Style& other) const;
    bool operator!=(const Style& other) const { return !(*this == other); }
};

// Caller-supplied subset of a Style. Unset fields are resolved by the
// dispatcher (palette, configured defaults).
struct StyleOverrides {
    std::optional<Color> color;
    std::optional<Color> edge_color;
    std::optional<Color> face_color;
    std::optional<bool> filled;
    std::optional<double> line_width;
    std::optional<LineStyle> line_style;
    std::optional<MarkerShape> marker;
    std::optional<double> marker_size;
    std::optional<double> alpha;

    [[nodiscard]] bool empty() const;

    // Fields set here win; the rest come from `base`.
    [[nodiscard]] StyleOverrides merged_over(const StyleOverrides& base) const;

    // Writes every set field into `style`. edge_color takes precedence over
    // color for the stroke.
    void apply_to(Style& style) const;
};

// Accepts single-letter codes ("r"), cycle references ("C3"), "tab:" names,
// a few CSS names and "#rrggbb" / "#rrggbbaa".
std::optional<Color> parse_color(std::string_view text);

// Parses a format string such as "ro", "b--", "k^-" or "C1:" into overrides.
// Throws std::invalid_argument on an unrecognised character.
StyleOverrides parse_symbol(std::string_view symbol);

std::string to_hex(const Color& color);

} // namespace geoplot::core
