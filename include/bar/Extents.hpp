#pragma once

#include <utility>

namespace lazybar::bar {

// Minimum gaps: before the left group, between groups, after the right group.
struct Margins {
    double left = 0.0;
    double internal = 0.0;
    double right = 0.0;
};

struct Extents {
    // End of the left group
    double left = 0.0;
    // Start of the center group and the cursor after its last panel
    std::pair<double, double> center{0.0, 0.0};
    // Start of the right group
    double right = 0.0;
};

// Which rule positioned the center group on the last pass.
enum class CenterState {
    Center,   // on the bar midpoint
    Left,     // pushed left against the right group
    Right,    // pushed right against the left group
    Unknown,  // did not fit between the groups
};

const char* center_state_name(CenterState state);

// Horizontal span cleared to the background before a repaint.
struct Region {
    enum class Kind { Left, CenterRight, Right, All, Custom };

    Kind kind = Kind::All;
    double start = 0.0;
    double end = 0.0;

    static Region left() { return {Kind::Left, 0.0, 0.0}; }
    static Region center_right() { return {Kind::CenterRight, 0.0, 0.0}; }
    static Region right() { return {Kind::Right, 0.0, 0.0}; }
    static Region all() { return {Kind::All, 0.0, 0.0}; }
    static Region custom(double start, double end) { return {Kind::Custom, start, end}; }

    // [start, end) in bar coordinates for the current extents
    std::pair<double, double> span(const Extents& extents, const Margins& margins, double bar_width) const;
};

struct CenterPlacement {
    double start = 0.0;
    CenterState state = CenterState::Center;
};

// Start of the right group before its own overflow clamp.
double provisional_right_start(double bar_width, const Margins& margins, double right_total);

/**
 * Places the center group between the left extent and the right group.
 * Pure: identical inputs always give the same placement.
 */
CenterPlacement place_center(double bar_width, const Margins& margins, double left_extent,
                             double right_total, double center_total);

// Final start of the right group, never before center_end + internal.
double place_right(double bar_width, const Margins& margins, double center_end, double right_total);

}  // namespace lazybar::bar
