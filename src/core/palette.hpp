#pragma once

#include "style.hpp"

#include <cstddef>
#include <vector>

namespace geoplot::core {

// Rotating pointer into a fixed color sequence. Owned by a plotting session
// and advanced every time a geometry needs an implicit color.
class PaletteCursor {
public:
    PaletteCursor();
    explicit PaletteCursor(std::vector<Color> colors);

    // Returns the color at the cursor and advances, wrapping at the end.
    Color next();
    void reset();

    [[nodiscard]] std::size_t position() const { return position_; }
    [[nodiscard]] std::size_t size() const { return colors_.size(); }
    [[nodiscard]] const std::vector<Color>& colors() const { return colors_; }

    // The ten-color "tab10" cycle.
    static const std::vector<Color>& default_colors();

private:
    std::vector<Color> colors_;
    std::size_t position_ = 0;
};

} // namespace geoplot::core
