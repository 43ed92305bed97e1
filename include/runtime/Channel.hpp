#pragma once

#include "runtime/Stream.hpp"
#include <chrono>
#include <condition_variable>
#include <deque>
#include <memory>
#include <mutex>
#include <optional>

namespace lazybar::runtime {

/**
 * Unbounded multi-producer queue shared through shared_ptr.
 * Producers may live on any thread; the consumer either polls it as a
 * Stream from the event loop or blocks in receive() from a worker.
 */
template <typename T>
class Channel {
public:
    static std::shared_ptr<Channel> create() { return std::make_shared<Channel>(); }

    // Returns false once the channel has been closed.
    bool send(T value) {
        Waker waker;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (closed_) return false;
            queue_.push_back(std::move(value));
            waker = std::move(waker_);
            waker_ = nullptr;
        }
        cv_.notify_one();
        if (waker) waker();
        return true;
    }

    void close() {
        Waker waker;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            closed_ = true;
            waker = std::move(waker_);
            waker_ = nullptr;
        }
        cv_.notify_all();
        if (waker) waker();
    }

    bool is_closed() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return closed_;
    }

    std::optional<T> try_receive() {
        std::lock_guard<std::mutex> lock(mutex_);
        return pop_locked();
    }

    // Blocks until a value arrives, the channel closes or the timeout expires.
    std::optional<T> receive(std::chrono::milliseconds timeout) {
        std::unique_lock<std::mutex> lock(mutex_);
        cv_.wait_for(lock, timeout, [this]() { return closed_ || !queue_.empty(); });
        return pop_locked();
    }

    std::optional<T> receive() {
        std::unique_lock<std::mutex> lock(mutex_);
        cv_.wait(lock, [this]() { return closed_ || !queue_.empty(); });
        return pop_locked();
    }

    Poll<T> poll_next(const Waker& waker) {
        std::lock_guard<std::mutex> lock(mutex_);
        if (auto value = pop_locked()) {
            return Poll<T>::ready(std::move(*value));
        }
        if (closed_) {
            return Poll<T>::done();
        }
        waker_ = waker;
        return Poll<T>::pending();
    }

    size_t size() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return queue_.size();
    }

private:
    std::optional<T> pop_locked() {
        if (queue_.empty()) return std::nullopt;
        T value = std::move(queue_.front());
        queue_.pop_front();
        return value;
    }

    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::deque<T> queue_;
    Waker waker_;
    bool closed_ = false;
};

// Stream view over the receiving end of a channel.
template <typename T>
class ChannelStream : public Stream<T> {
public:
    explicit ChannelStream(std::shared_ptr<Channel<T>> channel) : channel_(std::move(channel)) {}

    Poll<T> poll_next(const Waker& waker) override { return channel_->poll_next(waker); }

private:
    std::shared_ptr<Channel<T>> channel_;
};

}  // namespace lazybar::runtime
