#include "runtime/Scheduler.hpp"
#include <vector>

namespace lazybar::runtime {

void Scheduler::wake_at(Clock::time_point deadline, Waker waker) {
    std::lock_guard<std::mutex> lock(mutex_);
    timers_.emplace(deadline, std::move(waker));
}

size_t Scheduler::process() {
    std::vector<Waker> due;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto now = Clock::now();
        auto end = timers_.upper_bound(now);
        for (auto it = timers_.begin(); it != end; ++it) {
            due.push_back(std::move(it->second));
        }
        timers_.erase(timers_.begin(), end);
    }

    // Fire outside the lock, a waker may re-arm
    for (auto& waker : due) {
        if (waker) waker();
    }
    return due.size();
}

std::optional<std::chrono::milliseconds> Scheduler::time_until_next() const {
    std::lock_guard<std::mutex> lock(mutex_);
    if (timers_.empty()) return std::nullopt;

    auto now = Clock::now();
    auto next = timers_.begin()->first;
    if (next <= now) return std::chrono::milliseconds(0);
    // Round up so poll() does not wake a millisecond early and spin
    return std::chrono::ceil<std::chrono::milliseconds>(next - now);
}

size_t Scheduler::pending() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return timers_.size();
}

IntervalStream::IntervalStream(Scheduler& scheduler, std::chrono::milliseconds period)
    : scheduler_(scheduler), period_(period), next_(Scheduler::Clock::now()) {}

Poll<Scheduler::Clock::time_point> IntervalStream::poll_next(const Waker& waker) {
    auto now = Scheduler::Clock::now();
    if (now >= next_) {
        auto tick = next_;
        next_ += period_;
        if (next_ <= now) {
            next_ = now + period_;
        }
        armed_ = false;
        return Poll<Scheduler::Clock::time_point>::ready(tick);
    }

    if (!armed_) {
        scheduler_.wake_at(next_, waker);
        armed_ = true;
    }
    return Poll<Scheduler::Clock::time_point>::pending();
}

void IntervalStream::reset() {
    next_ = Scheduler::Clock::now();
    armed_ = false;
}

}  // namespace lazybar::runtime
