#include "runtime/EventFd.hpp"
#include <sys/eventfd.h>
#include <unistd.h>
#include <cerrno>
#include <cstdint>
#include <system_error>

namespace lazybar::runtime {

EventFd::EventFd() {
    fd_ = eventfd(0, EFD_NONBLOCK | EFD_CLOEXEC);
    if (fd_ < 0) {
        throw std::system_error(errno, std::generic_category(), "eventfd");
    }
}

EventFd::~EventFd() {
    if (fd_ >= 0) {
        close(fd_);
    }
}

void EventFd::signal() const {
    uint64_t one = 1;
    // EAGAIN means the counter is already saturated, which still wakes poll()
    while (write(fd_, &one, sizeof(one)) < 0 && errno == EINTR) {
    }
}

bool EventFd::drain() const {
    uint64_t value = 0;
    ssize_t n;
    do {
        n = read(fd_, &value, sizeof(value));
    } while (n < 0 && errno == EINTR);
    return n == static_cast<ssize_t>(sizeof(value)) && value > 0;
}

}  // namespace lazybar::runtime
