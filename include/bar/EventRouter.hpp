#pragma once

#include "bar/Bar.hpp"
#include "bar/Event.hpp"
#include <future>
#include <optional>
#include <string>

namespace lazybar::bar {

// Raw button press as reported by the windowing layer.
struct PointerPress {
    int button = 0;
    int event_x = 0;
    int event_y = 0;
    int root_x = 0;
    int root_y = 0;
    bool same_screen = true;
};

// Result of routing one IPC message.
struct MessageOutcome {
    enum class Kind {
        Quit,       // caller removes the socket and shuts down
        Immediate,  // response is already known
        Pending,    // wait on reply for the panel's answer
    };

    Kind kind = Kind::Immediate;
    EventResponse response;
    std::string panel_name;
    std::future<EventResponse> reply;
};

class EventRouter {
public:
    explicit EventRouter(Bar& bar) : bar_(bar) {}

    struct Hit {
        Alignment alignment;
        size_t index;
        int relative_x;
    };

    // 1/2/3 map to Left/Middle/Right, 4 and 5 to the scroll directions
    // (swapped when reverse_scroll is set). Other codes map to nothing.
    static std::optional<MouseButton> translate_button(int code, bool reverse_scroll);

    // First shown panel, left then center then right, whose [x, x + width) contains x.
    std::optional<Hit> hit_test(int x) const;

    // Returns true if a mouse event was delivered to a panel.
    bool route_button(const PointerPress& press);

    MessageOutcome route_message(const std::string& raw_message);

private:
    MessageOutcome route_panel_toggle(const std::string& message);
    MessageOutcome route_bar_message(const std::string& message);

    Bar& bar_;
};

}  // namespace lazybar::bar
