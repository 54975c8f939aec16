#pragma once

#ifdef __cplusplus

#include "remote.hpp"
#include "db.hpp"
#include "clock.hpp"
#include <functional>
#include <mutex>

namespace cohere {

// ============================================================================
// sqlite_remote_store - Remote store backed by a SQLite database
// ============================================================================
//
// Entities live in one table keyed by (tableName, id) with the payload as
// JSON text. Versions come from a single sequence, so they are monotonic
// across the whole store. Each write appends to ChangeLog in the same
// transaction; subscriptions tail ChangeLog from the position it had when
// they were opened.

class sqlite_remote_store : public remote_store {
public:
    /// Returns an error message to reject a payload, nullopt to accept it.
    using validator = std::function<std::optional<std::string>(const std::string& table,
                                                               const nlohmann::json& fields)>;

    explicit sqlite_remote_store(const std::string& path = ":memory:", shared_clock clk = make_system_clock());

    entity fetch_one(const std::string& table, const entity_id& id) override;
    std::vector<entity> fetch_collection(const collection_query& query) override;
    entity create(const std::string& table, const nlohmann::json& payload,
                  const std::optional<entity_id>& id = std::nullopt) override;
    entity update(const std::string& table, const entity_id& id, const nlohmann::json& patch,
                  std::optional<version_t> expected_version = std::nullopt) override;
    void remove(const std::string& table, const entity_id& id) override;
    std::unique_ptr<change_subscription> subscribe_changes(const std::string& table) override;

    void set_validator(validator v);

    /// ChangeLog entries for `table` after `cursor`, oldest first.
    std::vector<std::pair<int64_t, change_event>> changes_after(const std::string& table, int64_t cursor,
                                                                size_t limit = 100);

    /// Highest ChangeLog sequence number (0 when empty).
    int64_t latest_change();

private:
    void ensure_schema();
    std::optional<entity> load_locked(const std::string& table, const entity_id& id);
    version_t next_version_locked();
    void log_change_locked(change_type type, const entity& value, const std::optional<entity>& previous);
    void validate(const std::string& table, const nlohmann::json& fields) const;

    shared_clock clock_;
    std::mutex mutex_;
    database db_;
    validator validator_;
};

} // namespace cohere

#endif // __cplusplus
