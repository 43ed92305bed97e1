#pragma once

#include "bar/Event.hpp"
#include "bar/Panel.hpp"
#include "config/ConfigLoader.hpp"
#include "draw/Attrs.hpp"
#include "draw/Surface.hpp"
#include "panels/Ramp.hpp"
#include <optional>
#include <string>

namespace lazybar::panels {

// Action names bound to mouse buttons.
struct Actions {
    std::string left;
    std::string middle;
    std::string right;
    std::string up;
    std::string down;

    bool empty() const {
        return left.empty() && middle.empty() && right.empty() && up.empty() && down.empty();
    }
};

// Options every panel kind accepts.
struct PanelCommon {
    std::string name;
    bar::Dependence dependence = bar::Dependence::None;
    Actions actions;
    bool visible = true;
    draw::Attrs attrs;
    Ramp ramp;
    // Truncate text to this many characters; 0 disables
    size_t max_width = 0;

    // Throws config::ConfigError.
    static PanelCommon parse(const std::string& name, const config::Table& table, const config::Config& global);

    // format, or format_<suffix> when suffix is non-empty
    static std::string parse_format(const config::Table& table, const std::string& suffix,
                                    const std::string& fallback);

    std::optional<std::string> action_for(bar::MouseButton button) const;

    // Measures text and builds a descriptor that paints it vertically
    // centered on the bar, over attrs.bg when set. Throws draw::DrawError.
    bar::PanelDrawInfo draw_text(draw::Surface& surface, const std::string& text,
                                 const draw::Attrs& resolved, int height) const;
};

}  // namespace lazybar::panels
