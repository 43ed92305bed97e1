#include "panels/PanelCommon.hpp"
#include "util/Logger.hpp"
#include "util/UnicodeUtils.hpp"

namespace lazybar::panels {

using util::Logger;

PanelCommon PanelCommon::parse(const std::string& name, const config::Table& table,
                               const config::Config& global) {
    PanelCommon common;
    common.name = name;

    auto dependence = util::fold_case(table.get_string_or("dependence", "none"));
    if (dependence == "none") {
        common.dependence = bar::Dependence::None;
    } else if (dependence == "left") {
        common.dependence = bar::Dependence::Left;
    } else if (dependence == "right") {
        common.dependence = bar::Dependence::Right;
    } else if (dependence == "both") {
        common.dependence = bar::Dependence::Both;
    } else {
        throw config::ConfigError("[panels." + name + "] dependence: expected none, left, right or both");
    }

    common.actions.left = table.get_string_or("click_left", "");
    common.actions.middle = table.get_string_or("click_middle", "");
    common.actions.right = table.get_string_or("click_right", "");
    common.actions.up = table.get_string_or("scroll_up", "");
    common.actions.down = table.get_string_or("scroll_down", "");

    common.visible = table.get_bool("visible").value_or(true);

    if (auto attrs = table.get_string("attrs")) {
        common.attrs = config::ConfigLoader::parse_attrs(global, *attrs);
    }
    if (auto ramp = table.get_string("ramp")) {
        common.ramp = Ramp::parse(global, *ramp);
    }

    auto max_width = table.get_int("max_width").value_or(0);
    if (max_width < 0) {
        throw config::ConfigError("[panels." + name + "] max_width must not be negative");
    }
    common.max_width = static_cast<size_t>(max_width);

    Logger::debug("PanelCommon: Parsed common options for " + name);
    return common;
}

std::string PanelCommon::parse_format(const config::Table& table, const std::string& suffix,
                                      const std::string& fallback) {
    std::string key = suffix.empty() ? "format" : "format_" + suffix;
    return table.get_string_or(key, fallback);
}

std::optional<std::string> PanelCommon::action_for(bar::MouseButton button) const {
    const std::string* action = nullptr;
    switch (button) {
        case bar::MouseButton::Left: action = &actions.left; break;
        case bar::MouseButton::Middle: action = &actions.middle; break;
        case bar::MouseButton::Right: action = &actions.right; break;
        case bar::MouseButton::ScrollUp: action = &actions.up; break;
        case bar::MouseButton::ScrollDown: action = &actions.down; break;
    }
    if (!action || action->empty()) return std::nullopt;
    return *action;
}

bar::PanelDrawInfo PanelCommon::draw_text(draw::Surface& surface, const std::string& text,
                                          const draw::Attrs& resolved, int height) const {
    std::string shown = max_width > 0 ? util::truncate_graphemes(text, max_width) : text;
    std::string font = resolved.font.value_or("monospace");
    draw::Color fg = resolved.fg.value_or(draw::Color{255, 255, 255, 255});
    std::optional<draw::Color> bg = resolved.bg;

    bar::PanelDrawInfo info;
    info.dependence = dependence;
    info.height = height;
    if (shown.empty()) {
        info.width = 0;
        return info;
    }

    auto size = surface.text_size(shown, font);
    info.width = size.width;
    int text_y = (height - size.height) / 2;
    int width = size.width;

    info.draw_fn = [shown, font, fg, bg, width, height, text_y](draw::Surface& target) {
        if (bg) {
            target.fill_rect(0, 0, width, height, *bg);
        }
        target.draw_text(0, text_y, shown, font, fg);
    };

    std::string panel_name = name;
    info.show_fn = [panel_name]() { Logger::debug("Panel " + panel_name + " shown"); };
    info.hide_fn = [panel_name]() { Logger::debug("Panel " + panel_name + " hidden"); };
    return info;
}

}  // namespace lazybar::panels
