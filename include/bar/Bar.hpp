#pragma once

#include "bar/Dependence.hpp"
#include "bar/Extents.hpp"
#include "bar/Panel.hpp"
#include "draw/Color.hpp"
#include "draw/Surface.hpp"
#include <string>
#include <vector>

namespace lazybar::bar {

// Window operations the bar needs for the show/hide/toggle messages.
class WindowControl {
public:
    virtual ~WindowControl() = default;
    virtual void map() = 0;
    virtual void unmap() = 0;
    virtual bool is_mapped() const = 0;
};

struct BarSettings {
    std::string name;
    int width = 0;
    int height = 24;
    Margins margins;
    draw::Color background{0, 0, 0, 255};
    bool reverse_scroll = false;
};

/**
 * Owns the three panel groups and the layout state, and repaints the
 * smallest region that keeps the bar consistent with a full relayout.
 * Only ever touched from the event loop thread.
 */
class Bar {
public:
    // What the last update_panel() call repainted.
    enum class UpdateScope { None, Single, Left, CenterRight, Right, Full };

    Bar(BarSettings settings, draw::Surface& surface, WindowControl* window = nullptr);

    const std::string& name() const { return settings_.name; }
    int width() const { return settings_.width; }
    int height() const { return settings_.height; }
    const Margins& margins() const { return settings_.margins; }
    bool reverse_scroll() const { return settings_.reverse_scroll; }
    const Extents& extents() const { return extents_; }
    CenterState center_state() const { return center_state_; }
    UpdateScope last_update_scope() const { return last_scope_; }

    std::vector<Panel>& panels(Alignment alignment);
    const std::vector<Panel>& panels(Alignment alignment) const;
    void set_panels(Alignment alignment, std::vector<Panel> panels);

    // Replaces a panel's draw descriptor and repaints. Throws draw::DrawError.
    void update_panel(Alignment alignment, size_t idx, PanelDrawInfo info);

    // Clears everything and lays out all three groups. Throws draw::DrawError.
    void redraw_bar();

    // Returns false if idx is out of range.
    bool set_panel_visible(Alignment alignment, size_t idx, bool visible);

    // Return false when there is no window to act on.
    bool show();
    bool hide();
    bool toggle();

    void shutdown_panels();

private:
    static constexpr double EPSILON = 1e-6;

    void redraw_background(const Region& region);
    void redraw_one(Alignment alignment, size_t idx);
    void redraw_left(bool standalone);
    void redraw_center_right(bool standalone);
    void redraw_right(bool standalone);
    void draw_panel(Panel& panel, double x);
    std::vector<PanelStatus> refresh_statuses(std::vector<Panel>& group);

    BarSettings settings_;
    draw::Surface& surface_;
    WindowControl* window_;

    std::vector<Panel> left_;
    std::vector<Panel> center_;
    std::vector<Panel> right_;

    Extents extents_;
    CenterState center_state_ = CenterState::Center;
    double right_total_ = 0.0;
    bool laid_out_ = false;
    UpdateScope last_scope_ = UpdateScope::None;
};

}  // namespace lazybar::bar
