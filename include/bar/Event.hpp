#pragma once

#include "runtime/Channel.hpp"
#include <future>
#include <memory>
#include <string>

namespace lazybar::bar {

enum class MouseButton { Left, Middle, Right, ScrollUp, ScrollDown };

struct MouseEvent {
    MouseButton button = MouseButton::Left;
    // Relative to the panel's left edge
    int x = 0;
    // Relative to the top of the bar
    int y = 0;
};

struct EventResponse {
    bool ok = true;
    std::string reason;

    static EventResponse success() { return {true, {}}; }
    static EventResponse failure(std::string reason) { return {false, std::move(reason)}; }

    // {"success":"true"} or {"success":"false","reason":"..."}
    std::string to_json() const;
};

/**
 * Message delivered to a panel. Actions sent over IPC carry a reply slot
 * the panel must fill; mouse events and mouse-triggered actions do not.
 */
struct Event {
    enum class Type { Mouse, Action };

    Type type = Type::Action;
    MouseEvent mouse;
    std::string action;
    std::shared_ptr<std::promise<EventResponse>> reply;

    static Event make_mouse(MouseEvent mouse) {
        Event event;
        event.type = Type::Mouse;
        event.mouse = mouse;
        return event;
    }

    static Event make_action(std::string action) {
        Event event;
        event.type = Type::Action;
        event.action = std::move(action);
        return event;
    }

    bool expects_reply() const { return reply != nullptr; }

    // No-op when nobody is waiting.
    void respond(EventResponse response) const;
};

using EventChannel = std::shared_ptr<runtime::Channel<Event>>;

}  // namespace lazybar::bar
