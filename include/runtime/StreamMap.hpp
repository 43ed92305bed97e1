#pragma once

#include "runtime/Stream.hpp"
#include <utility>
#include <vector>

namespace lazybar::runtime {

/**
 * A set of keyed streams polled as one.
 *
 * Each poll starts after the stream that produced the previous item, so a
 * chatty source cannot starve the others. Finished streams are dropped; the
 * map itself is Done once it holds no streams.
 */
template <typename K, typename T>
class StreamMap : public Stream<std::pair<K, T>> {
public:
    void insert(K key, StreamPtr<T> stream) {
        entries_.emplace_back(std::move(key), std::move(stream));
    }

    size_t size() const { return entries_.size(); }
    bool empty() const { return entries_.empty(); }

    bool contains(const K& key) const {
        for (const auto& entry : entries_) {
            if (entry.first == key) return true;
        }
        return false;
    }

    Poll<std::pair<K, T>> poll_next(const Waker& waker) override {
        size_t remaining = entries_.size();
        if (next_ >= entries_.size()) next_ = 0;

        while (remaining > 0) {
            auto& entry = entries_[next_];
            auto poll = entry.second->poll_next(waker);

            if (poll.is_ready()) {
                K key = entry.first;
                next_ = (next_ + 1) % entries_.size();
                return Poll<std::pair<K, T>>::ready({std::move(key), poll.take()});
            }

            if (poll.is_done()) {
                entries_.erase(entries_.begin() + static_cast<std::ptrdiff_t>(next_));
                if (next_ >= entries_.size()) next_ = 0;
            } else {
                next_ = (next_ + 1) % entries_.size();
            }
            --remaining;
        }

        if (entries_.empty()) {
            return Poll<std::pair<K, T>>::done();
        }
        return Poll<std::pair<K, T>>::pending();
    }

private:
    std::vector<std::pair<K, StreamPtr<T>>> entries_;
    size_t next_ = 0;
};

}  // namespace lazybar::runtime
