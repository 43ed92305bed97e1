#include "x11/XEventSource.hpp"
#include "util/Logger.hpp"

namespace lazybar::x11 {

using util::Logger;

std::vector<InputEvent> XEventSource::drain() {
    std::vector<InputEvent> events;
    bool exposed = false;

    while (XPending(display_) > 0) {
        XEvent event;
        XNextEvent(display_, &event);
        if (event.xany.window != window_) continue;

        switch (event.type) {
            case Expose:
                // Only the last of a series carries count 0
                if (event.xexpose.count == 0) exposed = true;
                break;
            case ButtonPress: {
                InputEvent input;
                input.type = InputEvent::Type::Button;
                input.press.button = static_cast<int>(event.xbutton.button);
                input.press.event_x = event.xbutton.x;
                input.press.event_y = event.xbutton.y;
                input.press.root_x = event.xbutton.x_root;
                input.press.root_y = event.xbutton.y_root;
                input.press.same_screen = event.xbutton.same_screen;
                events.push_back(input);
                break;
            }
            case MapNotify:
                exposed = true;
                break;
            case UnmapNotify:
            case ConfigureNotify:
                break;
            default:
                Logger::debug("XEventSource: Ignoring event type " + std::to_string(event.type));
                break;
        }
    }

    // One full redraw covers any number of exposures
    if (exposed) {
        events.insert(events.begin(), InputEvent{InputEvent::Type::Redraw, {}});
    }
    return events;
}

}  // namespace lazybar::x11
