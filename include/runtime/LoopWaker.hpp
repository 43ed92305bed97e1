#pragma once

#include "runtime/EventFd.hpp"
#include "runtime/Stream.hpp"

namespace lazybar::runtime {

// Wakes the main loop's poll() from any thread.
class LoopWaker {
public:
    int fd() const { return event_.fd(); }
    void wake() const { event_.signal(); }
    bool drain() const { return event_.drain(); }

    Waker waker() const {
        return [this]() { wake(); };
    }

private:
    EventFd event_;
};

}  // namespace lazybar::runtime
