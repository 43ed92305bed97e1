#pragma once

#include "bar/Panel.hpp"
#include <vector>

namespace lazybar::bar {

// A panel's own status: hidden or undrawn panels are ZeroWidth, a
// non-None dependence is Dependent, otherwise Shown iff width > 0.
PanelStatus own_status(const Panel& panel);

// own_status of panels[idx], or ZeroWidth when idx is out of range.
PanelStatus own_status_at(const std::vector<Panel>& panels, long idx);

/**
 * Resolves every panel of one alignment group to Shown or ZeroWidth.
 *
 * A Dependent panel is Shown only if each neighbor it depends on is Shown
 * by its own status. A neighbor that is itself Dependent therefore hides
 * the panel; no chain is followed past the immediate neighbor.
 */
std::vector<PanelStatus> resolve_statuses(const std::vector<Panel>& panels);

// Sum of widths of the panels resolve_statuses() marks Shown.
double visible_width(const std::vector<Panel>& panels, const std::vector<PanelStatus>& statuses);

}  // namespace lazybar::bar
