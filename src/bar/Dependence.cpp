#include "bar/Dependence.hpp"

namespace lazybar::bar {

PanelStatus own_status(const Panel& panel) {
    if (!panel.visible || !panel.draw_info) {
        return PanelStatus::ZeroWidth;
    }
    if (panel.draw_info->dependence == Dependence::None) {
        return panel.draw_info->width > 0 ? PanelStatus::Shown : PanelStatus::ZeroWidth;
    }
    return PanelStatus::Dependent;
}

PanelStatus own_status_at(const std::vector<Panel>& panels, long idx) {
    if (idx < 0 || idx >= static_cast<long>(panels.size())) {
        return PanelStatus::ZeroWidth;
    }
    return own_status(panels[static_cast<size_t>(idx)]);
}

std::vector<PanelStatus> resolve_statuses(const std::vector<Panel>& panels) {
    std::vector<PanelStatus> statuses;
    statuses.reserve(panels.size());

    for (size_t i = 0; i < panels.size(); ++i) {
        auto status = own_status(panels[i]);
        if (status != PanelStatus::Dependent) {
            statuses.push_back(status);
            continue;
        }

        long idx = static_cast<long>(i);
        bool left_shown = own_status_at(panels, idx - 1) == PanelStatus::Shown;
        bool right_shown = own_status_at(panels, idx + 1) == PanelStatus::Shown;

        bool shown = false;
        switch (panels[i].draw_info->dependence) {
            case Dependence::Left: shown = left_shown; break;
            case Dependence::Right: shown = right_shown; break;
            case Dependence::Both: shown = left_shown && right_shown; break;
            case Dependence::None: break;
        }
        statuses.push_back(shown ? PanelStatus::Shown : PanelStatus::ZeroWidth);
    }

    return statuses;
}

double visible_width(const std::vector<Panel>& panels, const std::vector<PanelStatus>& statuses) {
    double total = 0.0;
    for (size_t i = 0; i < panels.size() && i < statuses.size(); ++i) {
        if (statuses[i] == PanelStatus::Shown) {
            total += panels[i].width();
        }
    }
    return total;
}

}  // namespace lazybar::bar
