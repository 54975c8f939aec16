#pragma once

#ifdef __cplusplus

#include <chrono>
#include <condition_variable>
#include <deque>
#include <mutex>
#include <optional>
#include <vector>

namespace cohere {

// ============================================================================
// channel - Unbounded multi-producer queue with close semantics
// ============================================================================
//
// Producers send() until the channel is closed; consumers receive() until it
// is closed *and* drained. Batch progress and change-feed messages travel
// through channels instead of callbacks.

template<typename T>
class channel {
public:
    channel() = default;
    channel(const channel&) = delete;
    channel& operator=(const channel&) = delete;

    /// Returns false when the channel is already closed.
    bool send(T value) {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (closed_) return false;
            items_.push_back(std::move(value));
        }
        cv_.notify_one();
        return true;
    }

    /// Blocks until a value arrives or the channel is closed and empty.
    std::optional<T> receive() {
        std::unique_lock<std::mutex> lock(mutex_);
        cv_.wait(lock, [this] { return !items_.empty() || closed_; });
        return pop_locked();
    }

    /// Waits at most `timeout`; nullopt on timeout or closed-and-empty.
    template<typename Rep, typename Period>
    std::optional<T> receive_for(std::chrono::duration<Rep, Period> timeout) {
        std::unique_lock<std::mutex> lock(mutex_);
        cv_.wait_for(lock, timeout, [this] { return !items_.empty() || closed_; });
        return pop_locked();
    }

    std::optional<T> try_receive() {
        std::lock_guard<std::mutex> lock(mutex_);
        return pop_locked();
    }

    /// Everything currently queued, in send order.
    std::vector<T> drain() {
        std::lock_guard<std::mutex> lock(mutex_);
        std::vector<T> out(std::make_move_iterator(items_.begin()),
                           std::make_move_iterator(items_.end()));
        items_.clear();
        return out;
    }

    void close() {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            closed_ = true;
        }
        cv_.notify_all();
    }

    [[nodiscard]] bool is_closed() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return closed_;
    }

    [[nodiscard]] size_t size() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return items_.size();
    }

private:
    std::optional<T> pop_locked() {
        if (items_.empty()) return std::nullopt;
        T value = std::move(items_.front());
        items_.pop_front();
        return value;
    }

    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::deque<T> items_;
    bool closed_ = false;
};

} // namespace cohere

#endif // __cplusplus
