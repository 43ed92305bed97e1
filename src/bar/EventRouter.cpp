#include "bar/EventRouter.hpp"
#include "util/Logger.hpp"
#include <charconv>
#include <format>

namespace lazybar::bar {

using util::Logger;

static MessageOutcome immediate(EventResponse response) {
    MessageOutcome outcome;
    outcome.kind = MessageOutcome::Kind::Immediate;
    outcome.response = std::move(response);
    return outcome;
}

std::optional<MouseButton> EventRouter::translate_button(int code, bool reverse_scroll) {
    switch (code) {
        case 1: return MouseButton::Left;
        case 2: return MouseButton::Middle;
        case 3: return MouseButton::Right;
        case 4: return reverse_scroll ? MouseButton::ScrollUp : MouseButton::ScrollDown;
        case 5: return reverse_scroll ? MouseButton::ScrollDown : MouseButton::ScrollUp;
        default: return std::nullopt;
    }
}

std::optional<EventRouter::Hit> EventRouter::hit_test(int x) const {
    for (auto alignment : {Alignment::Left, Alignment::Center, Alignment::Right}) {
        const auto& group = bar_.panels(alignment);
        for (size_t i = 0; i < group.size(); ++i) {
            const auto& panel = group[i];
            if (!panel.draw_info || panel.last_status != PanelStatus::Shown) continue;
            if (panel.x <= x && x < panel.x + panel.draw_info->width) {
                return Hit{alignment, i, static_cast<int>(x - panel.x)};
            }
        }
    }
    return std::nullopt;
}

bool EventRouter::route_button(const PointerPress& press) {
    int x = press.same_screen ? press.event_x : press.root_x;
    int y = press.same_screen ? press.event_y : press.root_y;

    auto button = translate_button(press.button, bar_.reverse_scroll());
    if (!button) {
        Logger::debug("EventRouter: Ignoring button " + std::to_string(press.button));
        return false;
    }

    auto hit = hit_test(x);
    if (!hit) return false;

    const auto& panel = bar_.panels(hit->alignment)[hit->index];
    if (!panel.events) return false;

    if (!panel.events->send(Event::make_mouse(MouseEvent{*button, hit->relative_x, y}))) {
        Logger::warn("EventRouter: Event channel of panel " + panel.name + " is closed");
        return false;
    }
    return true;
}

MessageOutcome EventRouter::route_message(const std::string& raw_message) {
    std::string message = raw_message;
    while (!message.empty() && (message.back() == '\n' || message.back() == '\r' || message.back() == ' ')) {
        message.pop_back();
    }

    if (message == "quit") {
        MessageOutcome outcome;
        outcome.kind = MessageOutcome::Kind::Quit;
        return outcome;
    }

    if (!message.empty() && message[0] == '#') {
        return route_panel_toggle(message.substr(1));
    }

    auto dot = message.find('.');
    if (dot == std::string::npos) {
        return route_bar_message(message);
    }

    std::string name = message.substr(0, dot);
    std::string payload = message.substr(dot + 1);

    const Panel* target = nullptr;
    size_t matches = 0;
    for (auto alignment : {Alignment::Left, Alignment::Center, Alignment::Right}) {
        for (const auto& panel : bar_.panels(alignment)) {
            if (panel.name == name) {
                target = &panel;
                ++matches;
            }
        }
    }

    if (matches == 0) {
        return immediate(EventResponse::failure(std::format("No panel with name {} was found", name)));
    }
    if (matches > 1) {
        return immediate(EventResponse::failure(
            std::format("Panel name {} is ambiguous, cannot message a duplicated name", name)));
    }
    if (!target->events) {
        return immediate(EventResponse::failure(
            std::format("Panel {} has no event channel and is not messageable", name)));
    }

    auto event = Event::make_action(payload);
    event.reply = std::make_shared<std::promise<EventResponse>>();

    MessageOutcome outcome;
    outcome.kind = MessageOutcome::Kind::Pending;
    outcome.panel_name = name;
    outcome.reply = event.reply->get_future();

    if (!target->events->send(std::move(event))) {
        return immediate(EventResponse::failure(std::format("Panel {} is no longer running", name)));
    }
    Logger::debug("EventRouter: Sent action " + payload + " to panel " + name);
    return outcome;
}

MessageOutcome EventRouter::route_panel_toggle(const std::string& message) {
    // <l|c|r><index>.<show|hide|toggle>
    auto dot = message.find('.');
    if (message.size() < 2 || dot == std::string::npos || dot < 2) {
        return immediate(EventResponse::failure("Invalid panel reference #" + message));
    }

    Alignment alignment;
    switch (message[0]) {
        case 'l': alignment = Alignment::Left; break;
        case 'c': alignment = Alignment::Center; break;
        case 'r': alignment = Alignment::Right; break;
        default:
            return immediate(EventResponse::failure("Invalid panel reference #" + message));
    }

    size_t idx = 0;
    auto [ptr, ec] = std::from_chars(message.data() + 1, message.data() + dot, idx);
    if (ec != std::errc() || ptr != message.data() + dot) {
        return immediate(EventResponse::failure("Invalid panel reference #" + message));
    }

    auto& group = bar_.panels(alignment);
    if (idx >= group.size()) {
        return immediate(EventResponse::failure(
            std::format("No {} panel at index {}", alignment_name(alignment), idx)));
    }

    std::string command = message.substr(dot + 1);
    bool visible;
    if (command == "show") {
        visible = true;
    } else if (command == "hide") {
        visible = false;
    } else if (command == "toggle") {
        visible = !group[idx].visible;
    } else {
        return immediate(EventResponse::failure("Unknown message " + command));
    }

    try {
        if (!bar_.set_panel_visible(alignment, idx, visible)) {
            return immediate(EventResponse::failure(
                std::format("No {} panel at index {}", alignment_name(alignment), idx)));
        }
    } catch (const draw::DrawError& e) {
        Logger::error(std::string("EventRouter: Redraw failed: ") + e.what());
        return immediate(EventResponse::failure(std::string("Redraw failed: ") + e.what()));
    }
    return immediate(EventResponse::success());
}

MessageOutcome EventRouter::route_bar_message(const std::string& message) {
    bool handled;
    if (message == "show") {
        handled = bar_.show();
    } else if (message == "hide") {
        handled = bar_.hide();
    } else if (message == "toggle") {
        handled = bar_.toggle();
    } else {
        return immediate(EventResponse::failure("Invalid message: " + message));
    }

    if (!handled) {
        return immediate(EventResponse::failure("Bar " + bar_.name() + " has no window"));
    }
    return immediate(EventResponse::success());
}

}  // namespace lazybar::bar
