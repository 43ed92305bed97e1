#pragma once

#include "bar/Event.hpp"
#include "draw/Surface.hpp"
#include <functional>
#include <optional>
#include <string>

namespace lazybar::bar {

enum class Alignment { Left, Center, Right };

const char* alignment_name(Alignment alignment);

// Hide a panel unless its neighbor(s) on the given side are shown.
enum class Dependence { None, Left, Right, Both };

/**
 * Size and paint callback for one panel update. The draw callback paints
 * with the surface origin already translated to the panel's top-left corner.
 */
struct PanelDrawInfo {
    using DrawFn = std::function<void(draw::Surface&)>;
    using Hook = std::function<void()>;

    int width = 0;
    int height = 0;
    Dependence dependence = Dependence::None;
    DrawFn draw_fn;
    // Fired when layout starts or stops showing the panel
    Hook show_fn;
    Hook hide_fn;
    // Fired once while the bar shuts down
    Hook shutdown_fn;
};

// One item of a panel's update stream.
struct PanelUpdate {
    std::optional<PanelDrawInfo> info;
    bool is_valid = false;
    std::string error_message;

    static PanelUpdate ok(PanelDrawInfo info) {
        PanelUpdate update;
        update.info = std::move(info);
        update.is_valid = true;
        return update;
    }

    static PanelUpdate error(std::string message) {
        PanelUpdate update;
        update.error_message = std::move(message);
        return update;
    }
};

enum class PanelStatus { Shown, ZeroWidth, Dependent };

struct Panel {
    std::string name;
    std::optional<PanelDrawInfo> draw_info;
    double x = 0.0;
    double y = 0.0;
    EventChannel events;
    bool visible = true;
    // Outcome of the most recent layout pass
    PanelStatus last_status = PanelStatus::ZeroWidth;

    Panel() = default;
    Panel(std::string name, bool visible, EventChannel events = nullptr)
        : name(std::move(name)), events(std::move(events)), visible(visible) {}

    int width() const { return draw_info ? draw_info->width : 0; }
};

}  // namespace lazybar::bar
