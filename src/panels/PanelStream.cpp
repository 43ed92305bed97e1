#include "panels/PanelStream.hpp"
#include "util/Logger.hpp"

namespace lazybar::panels {

using util::Logger;

PanelStream::PanelStream(PanelCommon common, draw::Surface& surface, const draw::Attrs& default_attrs,
                         int height, bar::EventChannel events)
    : common_(std::move(common)),
      surface_(surface),
      attrs_(common_.attrs.merged_with(default_attrs)),
      height_(height),
      events_(std::move(events)) {}

runtime::Poll<bar::PanelUpdate> PanelStream::poll_next(const runtime::Waker& waker) {
    if (events_) {
        bool redraw = false;
        while (true) {
            auto poll = events_->poll_next(waker);
            if (!poll.is_ready()) break;
            redraw = dispatch(poll.value()) || redraw;
        }
        if (redraw) {
            return runtime::Poll<bar::PanelUpdate>::ready(render());
        }
    }

    while (!source_done_) {
        auto poll = poll_source(waker);
        if (poll.is_pending()) {
            return runtime::Poll<bar::PanelUpdate>::pending();
        }
        if (poll.is_done()) {
            source_done_ = true;
            break;
        }
        if (poll.value()) {
            return runtime::Poll<bar::PanelUpdate>::ready(render());
        }
    }

    // Interactive panels outlive their source
    if (events_ && !events_->is_closed()) {
        return runtime::Poll<bar::PanelUpdate>::pending();
    }
    return runtime::Poll<bar::PanelUpdate>::done();
}

bar::EventResponse PanelStream::handle_action(const std::string& action, bool& redraw) {
    redraw = false;
    return bar::EventResponse::failure("Unknown event " + action);
}

bar::PanelUpdate PanelStream::draw_text(const std::string& text) {
    try {
        return bar::PanelUpdate::ok(common_.draw_text(surface_, text, attrs_, height_));
    } catch (const draw::DrawError& e) {
        return bar::PanelUpdate::error(e.what());
    }
}

bool PanelStream::dispatch(const bar::Event& event) {
    std::string action;
    if (event.type == bar::Event::Type::Mouse) {
        auto bound = common_.action_for(event.mouse.button);
        if (!bound) return false;
        action = *bound;
    } else {
        action = event.action;
    }

    bool redraw = false;
    auto response = handle_action(action, redraw);
    if (!response.ok) {
        Logger::warn("Panel " + common_.name + ": " + response.reason);
    }
    event.respond(std::move(response));
    return redraw;
}

}  // namespace lazybar::panels
