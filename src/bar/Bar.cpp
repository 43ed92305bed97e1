#include "bar/Bar.hpp"
#include "util/Logger.hpp"
#include <cmath>
#include <format>

namespace lazybar::bar {

using util::Logger;

Bar::Bar(BarSettings settings, draw::Surface& surface, WindowControl* window)
    : settings_(std::move(settings)), surface_(surface), window_(window) {
    extents_.left = settings_.margins.left;
    extents_.right = settings_.width - settings_.margins.right;
}

std::vector<Panel>& Bar::panels(Alignment alignment) {
    switch (alignment) {
        case Alignment::Left: return left_;
        case Alignment::Center: return center_;
        case Alignment::Right: return right_;
    }
    return left_;
}

const std::vector<Panel>& Bar::panels(Alignment alignment) const {
    switch (alignment) {
        case Alignment::Left: return left_;
        case Alignment::Center: return center_;
        case Alignment::Right: return right_;
    }
    return left_;
}

void Bar::set_panels(Alignment alignment, std::vector<Panel> panels) {
    this->panels(alignment) = std::move(panels);
    laid_out_ = false;
}

void Bar::update_panel(Alignment alignment, size_t idx, PanelDrawInfo info) {
    auto& group = panels(alignment);
    if (idx >= group.size()) {
        Logger::warn(std::format("Bar: Update for {} panel at index {} is out of range",
                                 alignment_name(alignment), idx));
        return;
    }

    auto& panel = group[idx];
    bool same = panel.draw_info &&
                std::abs(static_cast<double>(info.width - panel.draw_info->width)) < EPSILON &&
                info.dependence == panel.draw_info->dependence;
    panel.draw_info = std::move(info);

    if (!laid_out_) {
        redraw_bar();
    } else if (same) {
        if (panel.last_status == PanelStatus::Shown) {
            redraw_one(alignment, idx);
            last_scope_ = UpdateScope::Single;
        } else {
            // Still hidden and nothing else can have changed
            last_scope_ = UpdateScope::None;
        }
    } else {
        const double internal = settings_.margins.internal;
        switch (alignment) {
            case Alignment::Left: {
                double new_left = settings_.margins.left + visible_width(left_, resolve_statuses(left_));
                if (new_left + internal < extents_.center.first &&
                    (center_state_ == CenterState::Center || center_state_ == CenterState::Left)) {
                    redraw_left(true);
                    last_scope_ = UpdateScope::Left;
                } else {
                    redraw_bar();
                }
                break;
            }
            case Alignment::Center:
                redraw_bar();
                break;
            case Alignment::Right: {
                double new_total = visible_width(right_, resolve_statuses(right_));
                double center_total = extents_.center.second - extents_.center.first;
                auto placement = place_center(settings_.width, settings_.margins, extents_.left,
                                              new_total, center_total);

                if (std::abs(placement.start - extents_.center.first) < EPSILON &&
                    placement.state == center_state_) {
                    redraw_right(true);
                    last_scope_ = UpdateScope::Right;
                } else {
                    double delta = new_total - right_total_;
                    double slack = (extents_.right - extents_.center.second - internal) +
                                   (extents_.center.first - extents_.left - internal);
                    if (slack > delta) {
                        redraw_center_right(true);
                        last_scope_ = UpdateScope::CenterRight;
                    } else {
                        redraw_bar();
                    }
                }
                break;
            }
        }
    }

    surface_.flush();
}

void Bar::redraw_bar() {
    redraw_background(Region::all());
    redraw_left(false);
    redraw_center_right(false);
    laid_out_ = true;
    last_scope_ = UpdateScope::Full;
    Logger::debug(std::format("Bar: Full relayout, left={} center=({}, {}) right={} state={}",
                              extents_.left, extents_.center.first, extents_.center.second,
                              extents_.right, center_state_name(center_state_)));
}

bool Bar::set_panel_visible(Alignment alignment, size_t idx, bool visible) {
    auto& group = panels(alignment);
    if (idx >= group.size()) return false;

    group[idx].visible = visible;
    redraw_bar();
    surface_.flush();
    return true;
}

bool Bar::show() {
    if (!window_) return false;
    window_->map();
    return true;
}

bool Bar::hide() {
    if (!window_) return false;
    window_->unmap();
    return true;
}

bool Bar::toggle() {
    if (!window_) return false;
    if (window_->is_mapped()) {
        window_->unmap();
    } else {
        window_->map();
    }
    return true;
}

void Bar::shutdown_panels() {
    for (auto* group : {&left_, &center_, &right_}) {
        for (auto& panel : *group) {
            if (!panel.draw_info || !panel.draw_info->shutdown_fn) continue;
            try {
                panel.draw_info->shutdown_fn();
            } catch (const std::exception& e) {
                Logger::error("Bar: Shutdown hook of panel " + panel.name + " failed: " + e.what());
            }
        }
    }
}

void Bar::redraw_background(const Region& region) {
    auto [start, end] = region.span(extents_, settings_.margins, settings_.width);
    if (end <= start) return;

    draw::SavedState saved(surface_);
    surface_.fill_rect(start, 0, end - start, settings_.height, settings_.background);
}

void Bar::redraw_one(Alignment alignment, size_t idx) {
    auto& panel = panels(alignment)[idx];
    if (!panel.draw_info) return;

    redraw_background(Region::custom(panel.x, panel.x + panel.draw_info->width));
    draw_panel(panel, panel.x);
}

void Bar::redraw_left(bool standalone) {
    if (standalone) {
        redraw_background(Region::left());
    }

    auto statuses = refresh_statuses(left_);
    extents_.left = settings_.margins.left;

    for (size_t i = 0; i < left_.size(); ++i) {
        if (statuses[i] != PanelStatus::Shown) continue;
        draw_panel(left_[i], extents_.left);
        extents_.left += left_[i].width();
    }
}

void Bar::redraw_center_right(bool standalone) {
    if (standalone) {
        redraw_background(Region::center_right());
    }

    auto center_statuses = refresh_statuses(center_);
    double center_total = visible_width(center_, center_statuses);
    double right_total = visible_width(right_, resolve_statuses(right_));

    auto placement = place_center(settings_.width, settings_.margins, extents_.left,
                                  right_total, center_total);
    extents_.center = {placement.start, placement.start};
    center_state_ = placement.state;

    for (size_t i = 0; i < center_.size(); ++i) {
        if (center_statuses[i] != PanelStatus::Shown) continue;
        draw_panel(center_[i], extents_.center.second);
        extents_.center.second += center_[i].width();
    }

    redraw_right(false);
}

void Bar::redraw_right(bool standalone) {
    if (standalone) {
        redraw_background(Region::right());
    }

    auto statuses = refresh_statuses(right_);
    right_total_ = visible_width(right_, statuses);
    extents_.right = place_right(settings_.width, settings_.margins, extents_.center.second, right_total_);

    double cursor = extents_.right;
    for (size_t i = 0; i < right_.size(); ++i) {
        if (statuses[i] != PanelStatus::Shown) continue;
        draw_panel(right_[i], cursor);
        cursor += right_[i].width();
    }
}

void Bar::draw_panel(Panel& panel, double x) {
    const auto& info = *panel.draw_info;
    panel.x = x;
    panel.y = (settings_.height - info.height) / 2;

    if (!info.draw_fn) return;

    draw::SavedState saved(surface_);
    surface_.translate(panel.x, panel.y);
    info.draw_fn(surface_);
}

std::vector<PanelStatus> Bar::refresh_statuses(std::vector<Panel>& group) {
    auto statuses = resolve_statuses(group);

    for (size_t i = 0; i < group.size(); ++i) {
        auto& panel = group[i];
        if (panel.last_status == statuses[i]) continue;
        panel.last_status = statuses[i];

        if (!panel.draw_info) continue;
        const auto& hook = statuses[i] == PanelStatus::Shown ? panel.draw_info->show_fn
                                                             : panel.draw_info->hide_fn;
        if (!hook) continue;
        try {
            hook();
        } catch (const std::exception& e) {
            Logger::error("Bar: Show/hide hook of panel " + panel.name + " failed: " + e.what());
        }
    }

    return statuses;
}

}  // namespace lazybar::bar
