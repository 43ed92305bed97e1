#include "../framework/RecordingSurface.hpp"
#include "../framework/SimpleTest.hpp"
#include "bar/Bar.hpp"
#include "bar/Dependence.hpp"
#include "bar/Extents.hpp"
#include <cstdint>
#include <vector>

using namespace lazybar;
using namespace lazybar::bar;
using lazybar::test::RecordingSurface;

namespace {

constexpr int BAR_WIDTH = 1000;
constexpr int BAR_HEIGHT = 20;

draw::Color color_for(int seed) {
    return draw::Color{static_cast<uint8_t>(40 + seed * 13), static_cast<uint8_t>(200 - seed * 7),
                       static_cast<uint8_t>(seed * 29), 255};
}

PanelDrawInfo solid(int width, Dependence dependence = Dependence::None, int seed = 1) {
    PanelDrawInfo info;
    info.width = width;
    info.height = BAR_HEIGHT;
    info.dependence = dependence;
    auto color = color_for(seed);
    info.draw_fn = [width, color](draw::Surface& surface) { surface.fill_rect(0, 0, width, BAR_HEIGHT, color); };
    return info;
}

Panel drawn(const std::string& name, int width, Dependence dependence = Dependence::None, int seed = 1) {
    Panel panel(name, true);
    panel.draw_info = solid(width, dependence, seed);
    return panel;
}

BarSettings settings_with(Margins margins) {
    BarSettings settings;
    settings.name = "test";
    settings.width = BAR_WIDTH;
    settings.height = BAR_HEIGHT;
    settings.margins = margins;
    return settings;
}

}  // namespace

TEST_CASE(test_none_dependence_shown_iff_width) {
    std::vector<Panel> panels = {drawn("a", 0), drawn("b", 10), drawn("c", 0)};
    auto statuses = resolve_statuses(panels);
    ASSERT_TRUE(statuses[0] == PanelStatus::ZeroWidth);
    ASSERT_TRUE(statuses[1] == PanelStatus::Shown);
    ASSERT_TRUE(statuses[2] == PanelStatus::ZeroWidth);
}

TEST_CASE(test_both_dependence_needs_both_neighbors) {
    std::vector<Panel> panels = {drawn("a", 0), drawn("b", 10, Dependence::Both), drawn("c", 0)};
    ASSERT_TRUE(resolve_statuses(panels)[1] == PanelStatus::ZeroWidth);

    panels[0].draw_info = solid(5);
    ASSERT_TRUE(resolve_statuses(panels)[1] == PanelStatus::ZeroWidth);

    panels[2].draw_info = solid(5);
    ASSERT_TRUE(resolve_statuses(panels)[1] == PanelStatus::Shown);
}

TEST_CASE(test_left_dependence_at_group_edge_is_hidden) {
    std::vector<Panel> panels = {drawn("sep", 10, Dependence::Left), drawn("b", 10)};
    auto statuses = resolve_statuses(panels);
    ASSERT_TRUE(statuses[0] == PanelStatus::ZeroWidth);
    ASSERT_TRUE(statuses[1] == PanelStatus::Shown);

    std::vector<Panel> trailing = {drawn("a", 10), drawn("sep", 10, Dependence::Right)};
    ASSERT_TRUE(resolve_statuses(trailing)[1] == PanelStatus::ZeroWidth);
}

TEST_CASE(test_dependent_neighbor_counts_as_hidden) {
    std::vector<Panel> panels = {drawn("a", 10), drawn("b", 10, Dependence::Left), drawn("c", 10, Dependence::Left)};
    auto statuses = resolve_statuses(panels);
    ASSERT_TRUE(statuses[1] == PanelStatus::Shown);
    ASSERT_TRUE(statuses[2] == PanelStatus::ZeroWidth);
}

TEST_CASE(test_hidden_or_undrawn_panels_are_zero_width) {
    std::vector<Panel> panels = {drawn("a", 10), Panel("pending", true), drawn("c", 10)};
    panels[0].visible = false;
    auto statuses = resolve_statuses(panels);
    ASSERT_TRUE(statuses[0] == PanelStatus::ZeroWidth);
    ASSERT_TRUE(statuses[1] == PanelStatus::ZeroWidth);
    ASSERT_TRUE(statuses[2] == PanelStatus::Shown);
    ASSERT_NEAR(visible_width(panels, statuses), 10.0, 1e-9);

    ASSERT_TRUE(own_status_at(panels, -1) == PanelStatus::ZeroWidth);
    ASSERT_TRUE(own_status_at(panels, 3) == PanelStatus::ZeroWidth);
}

TEST_CASE(test_center_fits_on_midpoint) {
    Margins margins{10, 5, 10};
    ASSERT_NEAR(provisional_right_start(1000, margins, 50), 935.0, 1e-9);

    auto placement = place_center(1000, margins, 110, 50, 200);
    ASSERT_TRUE(placement.state == CenterState::Center);
    ASSERT_NEAR(placement.start, 400.0, 1e-9);
}

TEST_CASE(test_center_overflow_falls_back_after_left) {
    Margins margins{10, 5, 10};
    auto placement = place_center(1000, margins, 110, 50, 900);
    ASSERT_TRUE(placement.state == CenterState::Unknown);
    ASSERT_NEAR(placement.start, 115.0, 1e-9);
}

TEST_CASE(test_center_biased_left_against_wide_right_group) {
    Margins margins{0, 0, 0};
    auto placement = place_center(1000, margins, 0, 400, 300);
    ASSERT_TRUE(placement.state == CenterState::Left);
    ASSERT_NEAR(placement.start, 300.0, 1e-9);
}

TEST_CASE(test_center_biased_right_against_wide_left_group) {
    Margins margins{0, 0, 0};
    auto placement = place_center(1000, margins, 400, 0, 300);
    ASSERT_TRUE(placement.state == CenterState::Right);
    ASSERT_NEAR(placement.start, 400.0, 1e-9);
}

TEST_CASE(test_center_placement_is_idempotent) {
    Margins margins{3, 7, 11};
    for (double center : {0.0, 50.0, 333.0, 640.0, 990.0}) {
        auto first = place_center(1000, margins, 123, 77, center);
        auto second = place_center(1000, margins, 123, 77, center);
        ASSERT_NEAR(first.start, second.start, 1e-12);
        ASSERT_TRUE(first.state == second.state);
    }
}

TEST_CASE(test_right_group_never_starts_inside_center) {
    Margins margins{0, 5, 10};
    ASSERT_NEAR(place_right(1000, margins, 600, 50), 940.0, 1e-9);
    ASSERT_NEAR(place_right(1000, margins, 980, 50), 985.0, 1e-9);
}

TEST_CASE(test_full_layout_positions_every_group) {
    RecordingSurface surface(BAR_WIDTH, BAR_HEIGHT);
    Bar bar(settings_with({10, 5, 10}), surface);
    bar.set_panels(Alignment::Left, {drawn("l0", 60), drawn("l1", 40)});
    bar.set_panels(Alignment::Center, {drawn("c0", 200)});
    bar.set_panels(Alignment::Right, {drawn("r0", 50)});
    bar.redraw_bar();

    ASSERT_NEAR(bar.extents().left, 110.0, 1e-9);
    ASSERT_TRUE(bar.center_state() == CenterState::Center);
    ASSERT_NEAR(bar.extents().center.first, 400.0, 1e-9);
    ASSERT_NEAR(bar.extents().center.second, 600.0, 1e-9);
    ASSERT_NEAR(bar.panels(Alignment::Left)[0].x, 10.0, 1e-9);
    ASSERT_NEAR(bar.panels(Alignment::Left)[1].x, 70.0, 1e-9);
    ASSERT_NEAR(bar.panels(Alignment::Center)[0].x, 400.0, 1e-9);
    ASSERT_NEAR(bar.panels(Alignment::Right)[0].x, 940.0, 1e-9);
    ASSERT_TRUE(bar.last_update_scope() == Bar::UpdateScope::Full);
}

TEST_CASE(test_overflowing_center_starts_after_left_group) {
    RecordingSurface surface(BAR_WIDTH, BAR_HEIGHT);
    Bar bar(settings_with({10, 5, 10}), surface);
    bar.set_panels(Alignment::Left, {drawn("l0", 100)});
    bar.set_panels(Alignment::Center, {drawn("c0", 900)});
    bar.set_panels(Alignment::Right, {drawn("r0", 50)});
    bar.redraw_bar();

    ASSERT_TRUE(bar.center_state() == CenterState::Unknown);
    ASSERT_NEAR(bar.panels(Alignment::Center)[0].x, 115.0, 1e-9);
}

TEST_CASE(test_same_width_update_repaints_only_that_panel) {
    RecordingSurface surface(BAR_WIDTH, BAR_HEIGHT);
    Bar bar(settings_with({10, 5, 10}), surface);
    bar.set_panels(Alignment::Left, {drawn("l0", 60), drawn("l1", 40)});
    bar.set_panels(Alignment::Center, {drawn("c0", 200)});
    bar.set_panels(Alignment::Right, {drawn("r0", 50), drawn("r1", 30)});
    bar.redraw_bar();

    std::vector<double> before;
    for (auto alignment : {Alignment::Left, Alignment::Center, Alignment::Right}) {
        for (const auto& panel : bar.panels(alignment)) before.push_back(panel.x);
    }

    bar.update_panel(Alignment::Left, 1, solid(40, Dependence::None, 9));
    ASSERT_TRUE(bar.last_update_scope() == Bar::UpdateScope::Single);
    ASSERT_EQ(surface.pixel(75, 5), color_for(9).packed());

    std::vector<double> after;
    for (auto alignment : {Alignment::Left, Alignment::Center, Alignment::Right}) {
        for (const auto& panel : bar.panels(alignment)) after.push_back(panel.x);
    }
    ASSERT_TRUE(before == after);
}

TEST_CASE(test_update_to_hidden_panel_with_same_width_skips_redraw) {
    RecordingSurface surface(BAR_WIDTH, BAR_HEIGHT);
    Bar bar(settings_with({0, 0, 0}), surface);
    bar.set_panels(Alignment::Left, {drawn("sep", 10, Dependence::Left), drawn("a", 30)});
    bar.redraw_bar();

    bar.update_panel(Alignment::Left, 0, solid(10, Dependence::Left, 4));
    ASSERT_TRUE(bar.last_update_scope() == Bar::UpdateScope::None);
}

TEST_CASE(test_left_growth_with_room_repaints_left_only) {
    RecordingSurface surface(BAR_WIDTH, BAR_HEIGHT);
    Bar bar(settings_with({10, 5, 10}), surface);
    bar.set_panels(Alignment::Left, {drawn("l0", 60)});
    bar.set_panels(Alignment::Center, {drawn("c0", 200)});
    bar.set_panels(Alignment::Right, {drawn("r0", 50)});
    bar.redraw_bar();

    bar.update_panel(Alignment::Left, 0, solid(120));
    ASSERT_TRUE(bar.last_update_scope() == Bar::UpdateScope::Left);
    ASSERT_NEAR(bar.extents().left, 130.0, 1e-9);
    ASSERT_NEAR(bar.extents().center.first, 400.0, 1e-9);
}

TEST_CASE(test_right_change_without_center_move_repaints_right_only) {
    RecordingSurface surface(BAR_WIDTH, BAR_HEIGHT);
    Bar bar(settings_with({10, 5, 10}), surface);
    bar.set_panels(Alignment::Left, {drawn("l0", 60)});
    bar.set_panels(Alignment::Center, {drawn("c0", 200)});
    bar.set_panels(Alignment::Right, {drawn("r0", 50)});
    bar.redraw_bar();

    bar.update_panel(Alignment::Right, 0, solid(80));
    ASSERT_TRUE(bar.last_update_scope() == Bar::UpdateScope::Right);
    ASSERT_NEAR(bar.panels(Alignment::Right)[0].x, 910.0, 1e-9);
}

TEST_CASE(test_show_and_hide_hooks_follow_status) {
    RecordingSurface surface(BAR_WIDTH, BAR_HEIGHT);
    Bar bar(settings_with({0, 0, 0}), surface);

    int shown = 0;
    int hidden = 0;
    auto info = solid(30);
    info.show_fn = [&shown]() { shown++; };
    info.hide_fn = [&hidden]() { hidden++; };

    Panel panel("a", true);
    panel.draw_info = info;
    bar.set_panels(Alignment::Left, {panel});
    bar.redraw_bar();
    ASSERT_EQ(shown, 1);

    ASSERT_TRUE(bar.set_panel_visible(Alignment::Left, 0, false));
    ASSERT_EQ(hidden, 1);
    ASSERT_TRUE(bar.set_panel_visible(Alignment::Left, 0, true));
    ASSERT_EQ(shown, 2);
    ASSERT_FALSE(bar.set_panel_visible(Alignment::Left, 4, true));
}

TEST_CASE(test_incremental_updates_match_full_relayout) {
    const Margins margins{10, 5, 10};
    RecordingSurface surface(BAR_WIDTH, BAR_HEIGHT);
    Bar bar(settings_with(margins), surface);

    bar.set_panels(Alignment::Left, {drawn("l0", 80, Dependence::None, 1), drawn("l1", 10, Dependence::Left, 2),
                                     drawn("l2", 60, Dependence::None, 3)});
    bar.set_panels(Alignment::Center, {drawn("c0", 120, Dependence::None, 4), drawn("c1", 40, Dependence::None, 5)});
    bar.set_panels(Alignment::Right, {drawn("r0", 50, Dependence::None, 6), drawn("r1", 10, Dependence::Both, 7),
                                      drawn("r2", 70, Dependence::None, 8)});
    bar.redraw_bar();

    const int widths[] = {0, 15, 35, 60, 90, 150, 240, 420};
    const Alignment alignments[] = {Alignment::Left, Alignment::Center, Alignment::Right};
    uint32_t state = 12345;
    auto next = [&state]() {
        state = state * 1103515245u + 12345u;
        return (state >> 16) & 0x7fff;
    };

    for (int step = 0; step < 300; ++step) {
        auto alignment = alignments[next() % 3];
        auto& group = bar.panels(alignment);
        size_t idx = next() % group.size();
        int width = widths[next() % 8];
        auto dependence = group[idx].draw_info->dependence;
        int seed = static_cast<int>(idx) + 1 + static_cast<int>(next() % 5);

        bar.update_panel(alignment, idx, solid(width, dependence, seed));

        RecordingSurface reference_surface(BAR_WIDTH, BAR_HEIGHT);
        Bar reference(settings_with(margins), reference_surface);
        for (auto a : alignments) reference.set_panels(a, bar.panels(a));
        reference.redraw_bar();

        ASSERT_TRUE(surface.pixels() == reference_surface.pixels());
        ASSERT_TRUE(bar.center_state() == reference.center_state());
        ASSERT_NEAR(bar.extents().left, reference.extents().left, 1e-9);
        ASSERT_NEAR(bar.extents().center.first, reference.extents().center.first, 1e-9);
        ASSERT_NEAR(bar.extents().right, reference.extents().right, 1e-9);
        for (auto a : alignments) {
            const auto& ours = bar.panels(a);
            const auto& theirs = reference.panels(a);
            for (size_t i = 0; i < ours.size(); ++i) {
                ASSERT_TRUE(ours[i].last_status == theirs[i].last_status);
                if (theirs[i].last_status == PanelStatus::Shown) {
                    ASSERT_NEAR(ours[i].x, theirs[i].x, 1e-9);
                }
            }
        }
    }
}

int main() {
    return lazybar::test::TestRunner::instance().run_all();
}
