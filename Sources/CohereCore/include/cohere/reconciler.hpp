#pragma once

#ifdef __cplusplus

#include "entity_cache.hpp"
#include "remote.hpp"
#include "conflict.hpp"
#include "config.hpp"
#include "observation.hpp"
#include <atomic>
#include <condition_variable>
#include <mutex>
#include <thread>

namespace cohere {

// ============================================================================
// Feed connection state
// ============================================================================

enum class connection_state {
    disconnected,
    connecting,
    connected,
    /// Reconnect attempts exhausted; only retry() leaves this state
    permanently_disconnected
};

enum class disconnect_reason {
    none,
    error,
    timeout,
    closed,
    manual
};

inline const char* to_string(connection_state s) {
    switch (s) {
        case connection_state::disconnected: return "disconnected";
        case connection_state::connecting: return "connecting";
        case connection_state::connected: return "connected";
        case connection_state::permanently_disconnected: return "permanently_disconnected";
    }
    return "unknown";
}

inline const char* to_string(disconnect_reason r) {
    switch (r) {
        case disconnect_reason::none: return "none";
        case disconnect_reason::error: return "error";
        case disconnect_reason::timeout: return "timeout";
        case disconnect_reason::closed: return "closed";
        case disconnect_reason::manual: return "manual";
    }
    return "unknown";
}

struct sync_status {
    std::string table;
    connection_state state = connection_state::disconnected;
    disconnect_reason reason = disconnect_reason::none;
    size_t attempts = 0;
    std::optional<timestamp_t> next_retry_at;
    std::optional<timestamp_t> last_event_at;
    /// Local receive time minus the remote commit time of the last event
    std::optional<std::chrono::milliseconds> last_event_latency;
    uint64_t applied = 0;
    uint64_t discarded = 0;
    uint64_t conflicts = 0;
    size_t pending_conflicts = 0;
    std::string last_error;
};

enum class apply_outcome {
    applied,
    removed,
    /// Older than what the cache holds
    discarded,
    /// Our own in-flight write coming back through the feed
    echo,
    conflict
};

inline const char* to_string(apply_outcome o) {
    switch (o) {
        case apply_outcome::applied: return "applied";
        case apply_outcome::removed: return "removed";
        case apply_outcome::discarded: return "discarded";
        case apply_outcome::echo: return "echo";
        case apply_outcome::conflict: return "conflict";
    }
    return "unknown";
}

// ============================================================================
// change_reconciler - Applies one table's change feed to the cache
// ============================================================================
//
// The feed is consumed either by driving step() or on a dedicated thread via
// start()/stop(). Connection failures schedule a reconnect after
// min(base_delay * 2^attempt, max_delay); after max_attempts consecutive
// failures the state becomes permanently_disconnected. A delivered event
// resets the attempt counter.

class change_reconciler {
public:
    using status_handler = std::function<void(const sync_status&)>;

    change_reconciler(cache_handle cache, std::shared_ptr<remote_store> remote,
                      std::shared_ptr<conflict_store> conflicts, std::string table,
                      feed_config config = {},
                      shared_scheduler dispatch = std::make_shared<immediate_scheduler>());
    ~change_reconciler();

    change_reconciler(const change_reconciler&) = delete;
    change_reconciler& operator=(const change_reconciler&) = delete;

    /// Applies one event to the cache.
    apply_outcome apply(const change_event& event);

    /// Subscribes now. Returns true when connected; on failure schedules the
    /// next attempt.
    bool connect();

    /// Closes the subscription; no reconnect is scheduled.
    void disconnect();

    /// Resets the attempt counter and connects, also from the permanent state.
    bool retry();

    /// One iteration: reconnects when a retry is due, otherwise waits at
    /// most `wait` for a message. Returns true when an event was applied.
    bool step(std::chrono::milliseconds wait);

    /// Runs step() on a dedicated thread until stop().
    void start();
    void stop();
    [[nodiscard]] bool running() const noexcept { return running_.load(); }

    [[nodiscard]] sync_status status() const;
    [[nodiscard]] notification_token observe_status(status_handler handler);

    [[nodiscard]] std::chrono::milliseconds backoff_delay(size_t attempt) const;

    [[nodiscard]] const std::string& table() const { return table_; }

private:
    // Callers hold feed_mutex_.
    bool connect_locked();
    bool step_locked(std::chrono::milliseconds wait);
    void handle_failure(disconnect_reason reason, const std::string& message);

    void set_state(connection_state state);
    // Status snapshots are queued under the feed lock and handed to observers
    // only after it is released.
    void queue_status();
    void flush_status();

    cache_handle cache_;
    std::shared_ptr<remote_store> remote_;
    std::shared_ptr<conflict_store> conflicts_;
    std::string table_;
    feed_config config_;

    // Serializes connect/step/disconnect against each other.
    std::recursive_mutex feed_mutex_;
    std::unique_ptr<change_subscription> subscription_;

    mutable std::mutex status_mutex_;
    sync_status status_;
    std::vector<sync_status> pending_status_;
    observer_set<sync_status> observers_;

    std::atomic<bool> running_{false};
    std::jthread loop_;
    std::mutex wake_mutex_;
    std::condition_variable_any wake_;
};

} // namespace cohere

#endif // __cplusplus
