#pragma once

#include "bar/EventRouter.hpp"
#include <X11/Xlib.h>
#include <vector>

namespace lazybar::x11 {

struct InputEvent {
    enum class Type { Redraw, Button };

    Type type = Type::Redraw;
    bar::PointerPress press;
};

// Drains the X event queue without blocking.
class XEventSource {
public:
    XEventSource(Display* display, ::Window window) : display_(display), window_(window) {}

    std::vector<InputEvent> drain();

private:
    Display* display_;
    ::Window window_;
};

}  // namespace lazybar::x11
