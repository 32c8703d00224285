#include "palette.hpp"

#include <stdexcept>
#include <utility>

namespace geoplot::core {

namespace {

constexpr Color rgb(int r, int g, int b) {
    return Color{r / 255.0, g / 255.0, b / 255.0, 1.0};
}

} // namespace

const std::vector<Color>& PaletteCursor::default_colors() {
    static const std::vector<Color> colors{
        rgb(0x1f, 0x77, 0xb4),  // blue
        rgb(0xff, 0x7f, 0x0e),  // orange
        rgb(0x2c, 0xa0, 0x2c),  // green
        rgb(0xd6, 0x27, 0x28),  // red
        rgb(0x94, 0x67, 0xbd),  // purple
        rgb(0x8c, 0x56, 0x4b),  // brown
        rgb(0xe3, 0x77, 0xc2),  // pink
        rgb(0x7f, 0x7f, 0x7f),  // gray
        rgb(0xbc, 0xbd, 0x22),  // olive
        rgb(0x17, 0xbe, 0xcf),  // cyan
    };
    return colors;
}

PaletteCursor::PaletteCursor() : colors_(default_colors()) {}

PaletteCursor::PaletteCursor(std::vector<Color> colors) : colors_(std::move(colors)) {
    if (colors_.empty()) {
        throw std::invalid_argument("PaletteCursor: palette must contain at least one color");
    }
}

Color PaletteCursor::next() {
    const Color color = colors_[position_];
    position_ = (position_ + 1) % colors_.size();
    return color;
}

void PaletteCursor::reset() {
    position_ = 0;
}

} // namespace geoplot::core
