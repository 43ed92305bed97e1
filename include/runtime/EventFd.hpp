#pragma once

namespace lazybar::runtime {

// Non-blocking eventfd counter. Throws std::system_error if the kernel refuses one.
class EventFd {
public:
    EventFd();
    ~EventFd();
    EventFd(const EventFd&) = delete;
    EventFd& operator=(const EventFd&) = delete;

    int fd() const { return fd_; }

    // Async-signal-safe.
    void signal() const;
    // Resets the counter; returns true if it had been signalled.
    bool drain() const;

private:
    int fd_ = -1;
};

}  // namespace lazybar::runtime
