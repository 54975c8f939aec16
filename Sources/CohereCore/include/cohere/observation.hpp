#pragma once

#ifdef __cplusplus

#include "scheduler.hpp"
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <vector>

namespace cohere {

// ============================================================================
// notification_token - Keeps an observer registered until destroyed
// ============================================================================

class notification_token {
public:
    notification_token() = default;

    explicit notification_token(std::function<void()> unregister_fn)
        : unregister_(std::move(unregister_fn)) {}

    ~notification_token() {
        unregister();
    }

    notification_token(const notification_token&) = delete;
    notification_token& operator=(const notification_token&) = delete;

    notification_token(notification_token&& other) noexcept
        : unregister_(std::move(other.unregister_)) {
        other.unregister_ = nullptr;
    }

    notification_token& operator=(notification_token&& other) noexcept {
        if (this != &other) {
            unregister();
            unregister_ = std::move(other.unregister_);
            other.unregister_ = nullptr;
        }
        return *this;
    }

    void unregister() {
        if (unregister_) {
            unregister_();
            unregister_ = nullptr;
        }
    }

    [[nodiscard]] bool is_valid() const noexcept {
        return unregister_ != nullptr;
    }

    explicit operator bool() const noexcept {
        return is_valid();
    }

private:
    std::function<void()> unregister_;
};

// ============================================================================
// observer_set - Registry of handlers notified through a scheduler
// ============================================================================
//
// Tokens hold only a weak reference, so a token may outlive the set.

template<typename T>
class observer_set {
public:
    using handler = std::function<void(const T&)>;

    explicit observer_set(shared_scheduler dispatch = std::make_shared<immediate_scheduler>())
        : state_(std::make_shared<state>()), dispatch_(std::move(dispatch)) {}

    [[nodiscard]] notification_token add(handler fn) {
        uint64_t id;
        {
            std::lock_guard<std::mutex> lock(state_->mutex);
            id = state_->next_id++;
            state_->handlers.emplace(id, std::move(fn));
        }
        std::weak_ptr<state> weak = state_;
        return notification_token([weak, id] {
            if (auto s = weak.lock()) {
                std::lock_guard<std::mutex> lock(s->mutex);
                s->handlers.erase(id);
            }
        });
    }

    void notify(const T& value) const {
        std::vector<handler> snapshot;
        {
            std::lock_guard<std::mutex> lock(state_->mutex);
            snapshot.reserve(state_->handlers.size());
            for (const auto& [_, fn] : state_->handlers) {
                snapshot.push_back(fn);
            }
        }
        if (snapshot.empty()) return;
        dispatch_->invoke([snapshot = std::move(snapshot), value] {
            for (const auto& fn : snapshot) {
                if (fn) fn(value);
            }
        });
    }

    [[nodiscard]] size_t size() const {
        std::lock_guard<std::mutex> lock(state_->mutex);
        return state_->handlers.size();
    }

private:
    struct state {
        std::mutex mutex;
        uint64_t next_id = 1;
        std::map<uint64_t, handler> handlers;
    };

    std::shared_ptr<state> state_;
    shared_scheduler dispatch_;
};

} // namespace cohere

#endif // __cplusplus
