#pragma once

#include "runtime/Stream.hpp"
#include <chrono>
#include <map>
#include <mutex>
#include <optional>

namespace lazybar::runtime {

/**
 * Deadline registry for timer-driven streams. The event loop sleeps no
 * longer than time_until_next() and calls process() after every wake-up,
 * which fires every waker whose deadline has passed.
 */
class Scheduler {
public:
    using Clock = std::chrono::steady_clock;

    void wake_at(Clock::time_point deadline, Waker waker);
    // Returns the number of wakers fired.
    size_t process();
    std::optional<std::chrono::milliseconds> time_until_next() const;
    size_t pending() const;

private:
    mutable std::mutex mutex_;
    std::multimap<Clock::time_point, Waker> timers_;
};

// Ticks immediately, then once every period. Missed ticks are not replayed.
class IntervalStream : public Stream<Scheduler::Clock::time_point> {
public:
    IntervalStream(Scheduler& scheduler, std::chrono::milliseconds period);

    Poll<Scheduler::Clock::time_point> poll_next(const Waker& waker) override;
    void reset();

private:
    Scheduler& scheduler_;
    std::chrono::milliseconds period_;
    Scheduler::Clock::time_point next_;
    bool armed_ = false;
};

}  // namespace lazybar::runtime
