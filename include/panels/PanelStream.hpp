#pragma once

#include "bar/Event.hpp"
#include "bar/Panel.hpp"
#include "panels/PanelCommon.hpp"
#include "runtime/Stream.hpp"
#include <string>

namespace lazybar::panels {

/**
 * Shared state machine behind every built-in panel.
 *
 * Each poll first drains the panel's event channel, dispatching mouse
 * buttons through the configured actions, then polls the kind-specific
 * source. A Ready(true) from either side renders a new update.
 */
class PanelStream : public runtime::Stream<bar::PanelUpdate> {
public:
    PanelStream(PanelCommon common, draw::Surface& surface, const draw::Attrs& default_attrs, int height,
                bar::EventChannel events = nullptr);

    runtime::Poll<bar::PanelUpdate> poll_next(const runtime::Waker& waker) final;

protected:
    // Ready(true) when the panel should be rendered again, Ready(false) to be
    // polled again immediately, Done when the source is exhausted.
    virtual runtime::Poll<bool> poll_source(const runtime::Waker& waker) = 0;

    virtual bar::PanelUpdate render() = 0;

    // Default rejects every action.
    virtual bar::EventResponse handle_action(const std::string& action, bool& redraw);

    // Renders text with the panel's attributes; drawing errors become error updates.
    bar::PanelUpdate draw_text(const std::string& text);

    const PanelCommon& common() const { return common_; }
    int height() const { return height_; }

private:
    bool dispatch(const bar::Event& event);

    PanelCommon common_;
    draw::Surface& surface_;
    draw::Attrs attrs_;
    int height_;
    bar::EventChannel events_;
    bool source_done_ = false;
};

}  // namespace lazybar::panels
