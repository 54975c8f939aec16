#include "cohere/reconciler.hpp"
#include "cohere/version.hpp"
#include "cohere/error.hpp"
#include "cohere/log.hpp"
#include <algorithm>
#include <cmath>

namespace cohere {

change_reconciler::change_reconciler(cache_handle cache, std::shared_ptr<remote_store> remote,
                                     std::shared_ptr<conflict_store> conflicts, std::string table,
                                     feed_config config, shared_scheduler dispatch)
    : cache_(std::move(cache)), remote_(std::move(remote)), conflicts_(std::move(conflicts)),
      table_(std::move(table)), config_(config),
      observers_(dispatch ? std::move(dispatch) : std::make_shared<immediate_scheduler>()) {
    if (!remote_ || !conflicts_) {
        throw engine_error(error_code::invalid_argument, "change_reconciler requires a remote and a conflict store");
    }
    status_.table = table_;
}

change_reconciler::~change_reconciler() {
    stop();
    std::lock_guard<std::recursive_mutex> feed(feed_mutex_);
    if (subscription_) {
        subscription_->close();
        subscription_.reset();
    }
}

std::chrono::milliseconds change_reconciler::backoff_delay(size_t attempt) const {
    double delay = std::pow(2.0, static_cast<double>(attempt)) * static_cast<double>(config_.base_delay.count());
    double cap = static_cast<double>(config_.max_delay.count());
    return std::chrono::milliseconds(static_cast<int64_t>(std::min(delay, cap)));
}

// ============================================================================
// Event application
// ============================================================================

apply_outcome change_reconciler::apply(const change_event& event) {
    auto& cache = cache_.cache();
    const auto& incoming = event.value;
    auto now = cache.time_source()->now();
    apply_outcome outcome = apply_outcome::applied;

    if (event.type == change_type::remove) {
        auto current = cache.entry(incoming.id);
        if (current && current->state != entry_state::optimistic &&
            is_stale(incoming.version, current->value.version)) {
            LOG_DEBUG("reconciler", "Ignoring delete of %s v%lld: cached v%lld is newer", incoming.id.c_str(),
                      (long long)incoming.version, (long long)current->value.version);
            outcome = apply_outcome::discarded;
        } else {
            if (current && current->state == entry_state::optimistic) {
                conflicts_->add_resolved(current->value, std::nullopt, "remote_delete");
            }
            cache.remove(incoming.id, event.previous ? event.previous : std::optional<entity>(incoming));
            outcome = apply_outcome::removed;
        }
    } else {
        auto result = cache.put(incoming, entry_state::confirmed, event.previous);
        switch (result) {
            case put_result::applied:
                outcome = apply_outcome::applied;
                break;
            case put_result::stale:
            case put_result::cancelled:
                LOG_DEBUG("reconciler", "Discarding %s v%lld", incoming.id.c_str(), (long long)incoming.version);
                outcome = apply_outcome::discarded;
                break;
            case put_result::conflict: {
                auto current = cache.entry(incoming.id);
                if (current && current->state == entry_state::optimistic) {
                    if (current->value.fields == incoming.fields) {
                        outcome = apply_outcome::echo;
                    } else {
                        conflicts_->add(current->value, incoming);
                        outcome = apply_outcome::conflict;
                    }
                } else {
                    // The local write settled in between; order against its result.
                    outcome = cache.put(incoming, entry_state::confirmed, event.previous) == put_result::applied
                                  ? apply_outcome::applied
                                  : apply_outcome::discarded;
                }
                break;
            }
        }
    }

    {
        std::lock_guard<std::mutex> lock(status_mutex_);
        status_.attempts = 0;
        status_.last_event_at = now;
        if (event.committed_at != timestamp_t{}) {
            status_.last_event_latency =
                std::chrono::duration_cast<std::chrono::milliseconds>(now - event.committed_at);
        }
        switch (outcome) {
            case apply_outcome::applied:
            case apply_outcome::removed:
                ++status_.applied;
                break;
            case apply_outcome::discarded:
                ++status_.discarded;
                break;
            case apply_outcome::conflict:
                ++status_.conflicts;
                break;
            case apply_outcome::echo:
                break;
        }
    }
    LOG_DEBUG("reconciler", "%s %s v%lld: %s", to_string(event.type), incoming.id.c_str(),
              (long long)incoming.version, to_string(outcome));
    return outcome;
}

// ============================================================================
// Connection lifecycle
// ============================================================================

void change_reconciler::set_state(connection_state state) {
    std::lock_guard<std::mutex> lock(status_mutex_);
    status_.state = state;
    if (state != connection_state::disconnected) {
        status_.next_retry_at.reset();
    }
}

void change_reconciler::queue_status() {
    auto snapshot = status();
    std::lock_guard<std::mutex> lock(status_mutex_);
    pending_status_.push_back(std::move(snapshot));
}

void change_reconciler::flush_status() {
    std::vector<sync_status> ready;
    {
        std::lock_guard<std::mutex> lock(status_mutex_);
        ready.swap(pending_status_);
    }
    for (const auto& snapshot : ready) {
        observers_.notify(snapshot);
    }
}

bool change_reconciler::connect() {
    bool connected;
    {
        std::lock_guard<std::recursive_mutex> feed(feed_mutex_);
        connected = connect_locked();
    }
    flush_status();
    return connected;
}

bool change_reconciler::connect_locked() {
    if (subscription_) return true;

    set_state(connection_state::connecting);
    queue_status();

    std::unique_ptr<change_subscription> subscription;
    try {
        subscription = remote_->subscribe_changes(table_);
    } catch (const engine_error& e) {
        handle_failure(disconnect_reason::error, e.what());
        return false;
    }

    subscription_ = std::move(subscription);
    {
        std::lock_guard<std::mutex> lock(status_mutex_);
        status_.state = connection_state::connected;
        status_.reason = disconnect_reason::none;
        status_.next_retry_at.reset();
    }
    LOG_INFO("reconciler", "Connected to %s change feed", table_.c_str());
    queue_status();
    return true;
}

void change_reconciler::handle_failure(disconnect_reason reason, const std::string& message) {
    if (subscription_) {
        subscription_->close();
        subscription_.reset();
    }

    auto now = cache_.time_source()->now();
    {
        std::lock_guard<std::mutex> lock(status_mutex_);
        status_.reason = reason;
        status_.last_error = message;
        if (status_.attempts >= config_.max_attempts) {
            status_.state = connection_state::permanently_disconnected;
            status_.next_retry_at.reset();
            LOG_ERROR("reconciler", "%s feed gave up after %zu attempt(s): %s", table_.c_str(), status_.attempts,
                      message.c_str());
        } else {
            auto delay = backoff_delay(status_.attempts);
            ++status_.attempts;
            status_.state = connection_state::disconnected;
            status_.next_retry_at = now + delay;
            LOG_WARN("reconciler", "%s feed lost (%s): %s; retry %zu in %lldms", table_.c_str(), to_string(reason),
                     message.c_str(), status_.attempts, (long long)delay.count());
        }
    }
    queue_status();
}

void change_reconciler::disconnect() {
    {
        std::lock_guard<std::recursive_mutex> feed(feed_mutex_);
        if (subscription_) {
            subscription_->close();
            subscription_.reset();
        }
        std::lock_guard<std::mutex> lock(status_mutex_);
        status_.state = connection_state::disconnected;
        status_.reason = disconnect_reason::manual;
        status_.next_retry_at.reset();
    }
    LOG_INFO("reconciler", "Disconnected from %s change feed", table_.c_str());
    queue_status();
    flush_status();
}

bool change_reconciler::retry() {
    bool connected;
    {
        std::lock_guard<std::recursive_mutex> feed(feed_mutex_);
        if (subscription_) {
            subscription_->close();
            subscription_.reset();
        }
        {
            std::lock_guard<std::mutex> lock(status_mutex_);
            status_.attempts = 0;
            status_.next_retry_at.reset();
        }
        connected = connect_locked();
    }
    flush_status();
    return connected;
}

bool change_reconciler::step(std::chrono::milliseconds wait) {
    bool applied;
    {
        std::lock_guard<std::recursive_mutex> feed(feed_mutex_);
        applied = step_locked(wait);
    }
    flush_status();
    return applied;
}

bool change_reconciler::step_locked(std::chrono::milliseconds wait) {
    if (!subscription_) {
        std::optional<timestamp_t> due;
        connection_state state;
        {
            std::lock_guard<std::mutex> lock(status_mutex_);
            due = status_.next_retry_at;
            state = status_.state;
        }
        if (state != connection_state::disconnected || !due) return false;
        if (cache_.time_source()->now() < *due) return false;
        connect_locked();
        return false;
    }

    auto message = subscription_->next(wait);
    if (!message) return false;

    switch (message->type) {
        case feed_message::kind::event:
            if (!message->event) return false;
            apply(*message->event);
            return true;
        case feed_message::kind::error:
            handle_failure(disconnect_reason::error, message->reason);
            return false;
        case feed_message::kind::timed_out:
            handle_failure(disconnect_reason::timeout, message->reason);
            return false;
        case feed_message::kind::closed:
            handle_failure(disconnect_reason::closed, message->reason);
            return false;
    }
    return false;
}

void change_reconciler::start() {
    if (running_.exchange(true)) return;
    connect();
    loop_ = std::jthread([this](std::stop_token stop) {
        LOG_DEBUG("reconciler", "Feed loop for %s started", table_.c_str());
        while (!stop.stop_requested()) {
            bool progressed = false;
            try {
                progressed = step(config_.poll_interval);
            } catch (const engine_error& e) {
                LOG_ERROR("reconciler", "Feed loop for %s: %s", table_.c_str(), e.what());
                std::lock_guard<std::mutex> lock(status_mutex_);
                status_.last_error = e.what();
            }
            if (progressed) continue;
            if (status().state == connection_state::connected) continue;
            std::unique_lock<std::mutex> lock(wake_mutex_);
            wake_.wait_for(lock, stop, config_.poll_interval, [] { return false; });
        }
        LOG_DEBUG("reconciler", "Feed loop for %s stopped", table_.c_str());
    });
}

void change_reconciler::stop() {
    if (!running_.exchange(false)) return;
    loop_.request_stop();
    wake_.notify_all();
    // From the loop thread itself (a status observer), the loop exits on its
    // own once the current step returns and is joined later.
    if (loop_.joinable() && loop_.get_id() != std::this_thread::get_id()) loop_.join();
    disconnect();
}

// ============================================================================
// Status
// ============================================================================

sync_status change_reconciler::status() const {
    sync_status copy;
    {
        std::lock_guard<std::mutex> lock(status_mutex_);
        copy = status_;
    }
    copy.pending_conflicts = conflicts_->pending_count();
    return copy;
}

notification_token change_reconciler::observe_status(status_handler handler) {
    return observers_.add(std::move(handler));
}

} // namespace cohere
