#pragma once

#include "draw/Color.hpp"
#include <optional>
#include <string>

namespace lazybar::draw {

// Text attributes. Unset fields fall back to the bar's defaults.
struct Attrs {
    std::optional<std::string> font;
    std::optional<Color> fg;
    std::optional<Color> bg;

    // Fields set here win over those in defaults.
    Attrs merged_with(const Attrs& defaults) const {
        Attrs result = defaults;
        if (font) result.font = font;
        if (fg) result.fg = fg;
        if (bg) result.bg = bg;
        return result;
    }
};

}  // namespace lazybar::draw
