#include "bar/Extents.hpp"
#include <algorithm>
#include <cmath>

namespace lazybar::bar {

const char* center_state_name(CenterState state) {
    switch (state) {
        case CenterState::Center: return "center";
        case CenterState::Left: return "left";
        case CenterState::Right: return "right";
        case CenterState::Unknown: return "unknown";
    }
    return "unknown";
}

std::pair<double, double> Region::span(const Extents& extents, const Margins& margins,
                                       double bar_width) const {
    switch (kind) {
        case Kind::Left:
            return {0.0, extents.left + margins.internal};
        case Kind::CenterRight:
            return {extents.center.first - margins.internal, bar_width};
        case Kind::Right:
            // The gap before an overflowing right group can be narrower than internal
            return {std::max(extents.right - margins.internal, extents.center.second), bar_width};
        case Kind::All:
            return {0.0, bar_width};
        case Kind::Custom:
            return {start, end};
    }
    return {0.0, bar_width};
}

double provisional_right_start(double bar_width, const Margins& margins, double right_total) {
    return bar_width - right_total - margins.right - margins.internal;
}

CenterPlacement place_center(double bar_width, const Margins& margins, double left_extent,
                             double right_total, double center_total) {
    const double internal = margins.internal;
    const double right_start = provisional_right_start(bar_width, margins, right_total);
    const double mid = std::floor(bar_width / 2.0);

    if (center_total > (right_start - left_extent) - 2.0 * internal) {
        return {left_extent + internal, CenterState::Unknown};
    }
    if (center_total / 2.0 > right_start - mid - internal) {
        return {right_start - center_total - internal, CenterState::Left};
    }
    if (center_total / 2.0 > mid - left_extent - internal) {
        return {left_extent + internal, CenterState::Right};
    }
    return {mid - center_total / 2.0, CenterState::Center};
}

double place_right(double bar_width, const Margins& margins, double center_end, double right_total) {
    double total = right_total + margins.right;
    if (total > bar_width - center_end) {
        return center_end + margins.internal;
    }
    return bar_width - total;
}

}  // namespace lazybar::bar
