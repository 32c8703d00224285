#include "style.hpp"

#include "palette.hpp"

#include <algorithm>
#include <array>
#include <cctype>
#include <cstdio>
#include <stdexcept>
#include <utility>

namespace geoplot::core {

namespace {

struct NamedColor {
    std::string_view name;
    Color color;
};

// Single-letter codes use the classic plotting shades
constexpr std::array<NamedColor, 8> kLetterColors{{
    {"b", {0.0, 0.0, 1.0, 1.0}},
    {"g", {0.0, 0.5, 0.0, 1.0}},
    {"r", {1.0, 0.0, 0.0, 1.0}},
    {"c", {0.0, 0.75, 0.75, 1.0}},
    {"m", {0.75, 0.0, 0.75, 1.0}},
    {"y", {0.75, 0.75, 0.0, 1.0}},
    {"k", {0.0, 0.0, 0.0, 1.0}},
    {"w", {1.0, 1.0, 1.0, 1.0}},
}};

constexpr std::array<std::string_view, 10> kTabNames{
    "blue", "orange", "green", "red", "purple",
    "brown", "pink", "gray", "olive", "cyan"};

constexpr std::array<NamedColor, 14> kCssColors{{
    {"black", {0.0, 0.0, 0.0, 1.0}},
    {"white", {1.0, 1.0, 1.0, 1.0}},
    {"red", {1.0, 0.0, 0.0, 1.0}},
    {"green", {0.0, 0.5019607843137255, 0.0, 1.0}},
    {"blue", {0.0, 0.0, 1.0, 1.0}},
    {"yellow", {1.0, 1.0, 0.0, 1.0}},
    {"cyan", {0.0, 1.0, 1.0, 1.0}},
    {"magenta", {1.0, 0.0, 1.0, 1.0}},
    {"orange", {1.0, 0.6470588235294118, 0.0, 1.0}},
    {"purple", {0.5019607843137255, 0.0, 0.5019607843137255, 1.0}},
    {"brown", {0.6470588235294118, 0.16470588235294117, 0.16470588235294117, 1.0}},
    {"pink", {1.0, 0.7529411764705882, 0.796078431372549, 1.0}},
    {"gray", {0.5019607843137255, 0.5019607843137255, 0.5019607843137255, 1.0}},
    {"grey", {0.5019607843137255, 0.5019607843137255, 0.5019607843137255, 1.0}},
}};

int hex_digit(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

std::optional<Color> parse_hex(std::string_view text) {
    if (text.size() != 7 && text.size() != 9) {
        return std::nullopt;
    }
    std::array<double, 4> channels{0.0, 0.0, 0.0, 1.0};
    const std::size_t count = (text.size() - 1) / 2;
    for (std::size_t i = 0; i < count; ++i) {
        const int hi = hex_digit(text[1 + i * 2]);
        const int lo = hex_digit(text[2 + i * 2]);
        if (hi < 0 || lo < 0) {
            return std::nullopt;
        }
        channels[i] = static_cast<double>(hi * 16 + lo) / 255.0;
    }
    return Color{channels[0], channels[1], channels[2], channels[3]};
}

std::optional<Color> letter_color(char c) {
    for (const auto& entry : kLetterColors) {
        if (entry.name.front() == c) {
            return entry.color;
        }
    }
    return std::nullopt;
}

} // namespace

bool Style::operator==(const Style& other) const {
    return color == other.color && face_color == other.face_color &&
           filled == other.filled && line_width == other.line_width &&
           line_style == other.line_style && marker == other.marker &&
           marker_size == other.marker_size && alpha == other.alpha;
}

bool StyleOverrides::empty() const {
    return !color && !edge_color && !face_color && !filled && !line_width &&
           !line_style && !marker && !marker_size && !alpha;
}

StyleOverrides StyleOverrides::merged_over(const StyleOverrides& base) const {
    StyleOverrides merged = base;
    if (color) merged.color = color;
    if (edge_color) merged.edge_color = edge_color;
    if (face_color) merged.face_color = face_color;
    if (filled) merged.filled = filled;
    if (line_width) merged.line_width = line_width;
    if (line_style) merged.line_style = line_style;
    if (marker) merged.marker = marker;
    if (marker_size) merged.marker_size = marker_size;
    if (alpha) merged.alpha = alpha;
    return merged;
}

void StyleOverrides::apply_to(Style& style) const {
    if (color) style.color = *color;
    if (edge_color) style.color = *edge_color;
    if (face_color) style.face_color = *face_color;
    if (filled) style.filled = *filled;
    if (line_width) style.line_width = *line_width;
    if (line_style) style.line_style = *line_style;
    if (marker) style.marker = *marker;
    if (marker_size) style.marker_size = *marker_size;
    if (alpha) style.alpha = *alpha;
}

std::optional<Color> parse_color(std::string_view text) {
    if (text.empty()) {
        return std::nullopt;
    }
    if (text.size() == 1) {
        return letter_color(text.front());
    }
    if (text.front() == '#') {
        return parse_hex(text);
    }
    if (text.size() == 2 && text[0] == 'C' && std::isdigit(static_cast<unsigned char>(text[1]))) {
        return PaletteCursor::default_colors().at(static_cast<std::size_t>(text[1] - '0'));
    }
    if (text.substr(0, 4) == "tab:") {
        const auto name = text.substr(4);
        for (std::size_t i = 0; i < kTabNames.size(); ++i) {
            if (kTabNames[i] == name) {
                return PaletteCursor::default_colors().at(i);
            }
        }
        return std::nullopt;
    }
    for (const auto& entry : kCssColors) {
        if (entry.name == text) {
            return entry.color;
        }
    }
    return std::nullopt;
}

StyleOverrides parse_symbol(std::string_view symbol) {
    StyleOverrides overrides;
    std::size_t i = 0;
    while (i < symbol.size()) {
        const char c = symbol[i];
        const std::string_view rest = symbol.substr(i);

        if (rest.substr(0, 2) == "--") {
            overrides.line_style = LineStyle::Dashed;
            i += 2;
            continue;
        }
        if (rest.substr(0, 2) == "-.") {
            overrides.line_style = LineStyle::DashDot;
            i += 2;
            continue;
        }
        if (c == 'C' && rest.size() > 1 && std::isdigit(static_cast<unsigned char>(rest[1]))) {
            overrides.color = parse_color(rest.substr(0, 2));
            i += 2;
            continue;
        }

        switch (c) {
        case '-': overrides.line_style = LineStyle::Solid; break;
        case ':': overrides.line_style = LineStyle::Dotted; break;
        case 'o': overrides.marker = MarkerShape::Circle; break;
        case '.': overrides.marker = MarkerShape::Point; break;
        case 's': overrides.marker = MarkerShape::Square; break;
        case '^': overrides.marker = MarkerShape::TriangleUp; break;
        case 'v': overrides.marker = MarkerShape::TriangleDown; break;
        case 'D':
        case 'd': overrides.marker = MarkerShape::Diamond; break;
        case '+': overrides.marker = MarkerShape::Plus; break;
        case 'x': overrides.marker = MarkerShape::Cross; break;
        default: {
            auto color = letter_color(c);
            if (!color) {
                throw std::invalid_argument("Unrecognized character '" + std::string(1, c) +
                                            "' in format string \"" + std::string(symbol) + "\"");
            }
            overrides.color = color;
            break;
        }
        }
        ++i;
    }

    // A marker without a line style draws markers only
    if (overrides.marker && !overrides.line_style) {
        overrides.line_style = LineStyle::None;
    }
    return overrides;
}

std::string to_hex(const Color& color) {
    auto channel = [](double value) {
        return static_cast<unsigned>(std::clamp(value, 0.0, 1.0) * 255.0 + 0.5);
    };
    char buffer[10];
    std::snprintf(buffer, sizeof(buffer), "#%02x%02x%02x", channel(color.r), channel(color.g), channel(color.b));
    return buffer;
}

} // namespace geoplot::core
