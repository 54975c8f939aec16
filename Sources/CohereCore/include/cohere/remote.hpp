#pragma once

#ifdef __cplusplus

#include "error.hpp"
#include "types.hpp"
#include "view.hpp"
#include "channel.hpp"
#include <chrono>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace cohere {

// ============================================================================
// collection_query - Arguments of remote_store::fetch_collection
// ============================================================================

struct collection_query {
    std::string table;
    collection_filter filter;
    std::optional<sort_order> order;
    std::optional<size_t> limit;
    size_t offset = 0;
};

/// Filters, orders and pages `entities` the way remote stores answer a
/// collection_query.
std::vector<entity> apply_query(std::vector<entity> entities, const collection_query& query);

// ============================================================================
// change_event - One remote insert/update/delete
// ============================================================================

struct change_event {
    change_type type = change_type::update;
    entity value;                     // for deletes: at least id, table, version
    std::optional<entity> previous;   // remote copy before the change, when known
    timestamp_t committed_at{};       // remote commit time

    nlohmann::json to_json() const;
    static std::optional<change_event> from_json(const nlohmann::json& j);
};

// ============================================================================
// feed_message - What a change subscription hands to its consumer
// ============================================================================

struct feed_message {
    enum class kind {
        event,
        error,      // connection failed; reconnect with backoff
        timed_out,  // remote gave up on the channel
        closed      // subscription closed for good
    };

    kind type = kind::event;
    std::optional<change_event> event;
    std::string reason;

    static feed_message of(change_event e) {
        feed_message m;
        m.type = kind::event;
        m.event = std::move(e);
        return m;
    }

    static feed_message failure(kind k, std::string why) {
        feed_message m;
        m.type = k;
        m.reason = std::move(why);
        return m;
    }
};

class change_subscription {
public:
    virtual ~change_subscription() = default;

    /// Waits at most `timeout` for the next message; nullopt when idle.
    virtual std::optional<feed_message> next(std::chrono::milliseconds timeout) = 0;

    /// Ends the subscription. Safe to call from another thread while a
    /// consumer is blocked in next().
    virtual void close() = 0;
};

/// Subscription fed by pushing messages into a channel.
class channel_subscription : public change_subscription {
public:
    channel_subscription() : messages_(std::make_shared<channel<feed_message>>()) {}

    std::optional<feed_message> next(std::chrono::milliseconds timeout) override {
        if (messages_->is_closed() && messages_->size() == 0) {
            return feed_message::failure(feed_message::kind::closed, "subscription closed");
        }
        return messages_->receive_for(timeout);
    }

    void close() override { messages_->close(); }

    /// Producer side; outlives the subscription object if held elsewhere.
    [[nodiscard]] std::shared_ptr<channel<feed_message>> sink() const { return messages_; }

private:
    std::shared_ptr<channel<feed_message>> messages_;
};

// ============================================================================
// remote_store - Authoritative persistence service
// ============================================================================
//
// Every operation may block on the network. Failures are thrown as
// engine_error with not_found, validation, conflict, timeout or network.

class remote_store {
public:
    virtual ~remote_store() = default;

    virtual entity fetch_one(const std::string& table, const entity_id& id) = 0;

    virtual std::vector<entity> fetch_collection(const collection_query& query) = 0;

    /// `id` requests a specific identity (used to restore deleted records);
    /// otherwise the store assigns one.
    virtual entity create(const std::string& table, const nlohmann::json& payload,
                          const std::optional<entity_id>& id = std::nullopt) = 0;

    /// Applies `patch` as a JSON merge patch. A mismatching
    /// `expected_version` fails with conflict.
    virtual entity update(const std::string& table, const entity_id& id, const nlohmann::json& patch,
                          std::optional<version_t> expected_version = std::nullopt) = 0;

    virtual void remove(const std::string& table, const entity_id& id) = 0;

    virtual std::unique_ptr<change_subscription> subscribe_changes(const std::string& table) = 0;
};

} // namespace cohere

#endif // __cplusplus
