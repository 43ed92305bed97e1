#pragma once

#include <functional>
#include <memory>
#include <optional>
#include <utility>

namespace lazybar::runtime {

// Called by a source that returned Pending once it can make progress.
using Waker = std::function<void()>;

template <typename T>
class Poll {
public:
    enum class State { Ready, Pending, Done };

    static Poll ready(T value) { return Poll(State::Ready, std::move(value)); }
    static Poll pending() { return Poll(State::Pending, std::nullopt); }
    static Poll done() { return Poll(State::Done, std::nullopt); }

    State state() const { return state_; }
    bool is_ready() const { return state_ == State::Ready; }
    bool is_pending() const { return state_ == State::Pending; }
    bool is_done() const { return state_ == State::Done; }

    T& value() { return *value_; }
    T take() { return std::move(*value_); }

private:
    Poll(State state, std::optional<T> value) : state_(state), value_(std::move(value)) {}

    State state_;
    std::optional<T> value_;
};

/**
 * A pollable asynchronous sequence.
 *
 * poll_next must never block. When it returns Pending the implementation is
 * responsible for arranging that the waker gets called once another call
 * could return something other than Pending. After Done it is never polled again.
 */
template <typename T>
class Stream {
public:
    virtual ~Stream() = default;
    virtual Poll<T> poll_next(const Waker& waker) = 0;
};

template <typename T>
using StreamPtr = std::unique_ptr<Stream<T>>;

}  // namespace lazybar::runtime
