#pragma once

#ifdef __cplusplus

#include "remote.hpp"
#include "clock.hpp"
#include "error.hpp"
#include <map>
#include <mutex>
#include <unordered_map>

namespace cohere {

// ============================================================================
// mock_remote_store - In-memory remote for tests and offline prototyping
// ============================================================================
//
// Behaves like a real store (versions, merge-patch updates, not_found,
// validation) and adds knobs for injecting failures, latency and feed
// disruptions.

class mock_remote_store : public remote_store {
public:
    explicit mock_remote_store(shared_clock clk = make_system_clock());

    entity fetch_one(const std::string& table, const entity_id& id) override;
    std::vector<entity> fetch_collection(const collection_query& query) override;
    entity create(const std::string& table, const nlohmann::json& payload,
                  const std::optional<entity_id>& id = std::nullopt) override;
    entity update(const std::string& table, const entity_id& id, const nlohmann::json& patch,
                  std::optional<version_t> expected_version = std::nullopt) override;
    void remove(const std::string& table, const entity_id& id) override;
    std::unique_ptr<change_subscription> subscribe_changes(const std::string& table) override;

    // Test helpers

    /// Stores `e` as-is (no change event). The version sequence moves past it.
    void seed(const entity& e);
    [[nodiscard]] std::optional<entity> stored(const entity_id& id) const;

    /// Every operation touching `id` fails with `code` until cleared.
    void fail_on(const entity_id& id, error_code code, std::string message);
    void clear_failure(const entity_id& id);

    /// The next `count` operations of any kind fail.
    void fail_next(error_code code, std::string message, size_t count = 1);

    /// The next `count` subscribe_changes() calls throw.
    void fail_subscriptions(size_t count, error_code code = error_code::network);

    void set_latency(std::chrono::milliseconds latency);

    /// When enabled, successful writes are pushed to subscribers.
    void set_emit_changes(bool emit);

    /// Delivers `e` to every open subscription on its table.
    void push(const change_event& e);

    /// Sends a failure message to every open subscription.
    void drop_connections(const std::string& reason,
                          feed_message::kind kind = feed_message::kind::error);

    [[nodiscard]] size_t calls(const std::string& operation) const;
    [[nodiscard]] size_t subscriber_count(const std::string& table) const;

private:
    struct failure {
        error_code code;
        std::string message;
    };

    void before_call(const std::string& operation, const entity_id& id);
    void emit_locked(change_type type, const entity& value, const std::optional<entity>& previous);

    shared_clock clock_;
    mutable std::mutex mutex_;
    std::map<entity_id, entity> entities_;
    std::unordered_map<entity_id, failure> id_failures_;
    std::optional<failure> next_failure_;
    size_t next_failure_count_ = 0;
    size_t subscribe_failures_ = 0;
    error_code subscribe_failure_code_ = error_code::network;
    std::chrono::milliseconds latency_{0};
    bool emit_changes_ = false;
    version_t last_version_ = 0;
    uint64_t next_id_ = 1;
    std::map<std::string, size_t> calls_;
    std::vector<std::pair<std::string, std::weak_ptr<channel<feed_message>>>> subscribers_;
};

} // namespace cohere

#endif // __cplusplus
