#pragma once

#ifdef __cplusplus

#include "entity_cache.hpp"
#include "observation.hpp"
#include "clock.hpp"
#include <functional>
#include <map>
#include <mutex>
#include <set>

namespace cohere {

class optimistic_coordinator;

// ============================================================================
// conflict_record - A local and a remote copy of one entity that diverged
// ============================================================================

enum class resolution_strategy {
    local,
    remote,
    merge
};

enum class auto_strategy {
    newest_wins,
    local_wins,
    remote_wins
};

inline const char* to_string(resolution_strategy s) {
    switch (s) {
        case resolution_strategy::local: return "local";
        case resolution_strategy::remote: return "remote";
        case resolution_strategy::merge: return "merge";
    }
    return "unknown";
}

inline const char* to_string(auto_strategy s) {
    switch (s) {
        case auto_strategy::newest_wins: return "newest_wins";
        case auto_strategy::local_wins: return "local_wins";
        case auto_strategy::remote_wins: return "remote_wins";
    }
    return "unknown";
}

struct conflict_record {
    std::string id;
    entity_id target;
    std::string table;
    /// Unconfirmed local copy
    entity local;
    /// nullopt when the remote side deleted the entity
    std::optional<entity> remote;
    timestamp_t detected_at{};

    bool resolved = false;
    bool automatic = false;
    /// How it was settled ("local", "remote", "merge", "remote_delete")
    std::string resolution;
    std::optional<entity> outcome;
    std::optional<timestamp_t> resolved_at;
};

// ============================================================================
// conflict_store - Pending conflicts plus the history of settled ones
// ============================================================================
//
// At most one pending record per entity: a newer remote copy for an entity
// that already has one replaces its remote side. Observers hear about every
// record that is added or settled.

class conflict_store {
public:
    explicit conflict_store(shared_clock clk = make_system_clock(),
                            shared_scheduler dispatch = std::make_shared<immediate_scheduler>());

    /// Opens (or refreshes) the pending record for local.id.
    conflict_record add(const entity& local, const entity& remote);

    /// Files a record that was settled on detection, e.g. a remote delete
    /// that overrode a local edit.
    conflict_record add_resolved(const entity& local, const std::optional<entity>& remote,
                                 std::string resolution);

    [[nodiscard]] std::optional<conflict_record> get(const std::string& conflict_id) const;
    [[nodiscard]] std::optional<conflict_record> pending_for(const entity_id& target) const;
    [[nodiscard]] std::vector<conflict_record> pending() const;
    [[nodiscard]] size_t pending_count() const;
    [[nodiscard]] std::vector<conflict_record> history() const;
    [[nodiscard]] bool has_pending(const entity_id& target) const;

    /// Claims a pending record for resolution. Throws
    /// engine_error(already_resolved) when it was settled or is being settled,
    /// engine_error(not_found) when the id was never issued.
    conflict_record claim(const std::string& conflict_id);

    /// Moves a claimed record to the history.
    void settle(const std::string& conflict_id, std::string resolution, bool automatic,
                const std::optional<entity>& outcome);

    /// Returns a claimed record to the pending set.
    void release(const std::string& conflict_id);

    [[nodiscard]] notification_token observe(std::function<void(const conflict_record&)> handler);

private:
    shared_clock clock_;
    mutable std::mutex mutex_;
    std::map<std::string, conflict_record> pending_;
    std::set<std::string> claimed_;
    std::vector<conflict_record> history_;
    observer_set<conflict_record> observers_;
};

struct resolution {
    resolution_strategy strategy = resolution_strategy::remote;
    /// For merge without a merge function: fields taken from the local copy
    std::vector<std::string> fields;

    static resolution local() { return {resolution_strategy::local, {}}; }
    static resolution remote() { return {resolution_strategy::remote, {}}; }
    static resolution merge(std::vector<std::string> local_fields = {}) {
        return {resolution_strategy::merge, std::move(local_fields)};
    }
};

// ============================================================================
// conflict_resolver - Settles conflict records
// ============================================================================
//
// local:  re-pushes the local copy so the server converges to it
// remote: drops the local copy in favour of the remote one
// merge:  pushes merge_fn(local, remote); cached directly without a coordinator

class conflict_resolver {
public:
    using merge_fn = std::function<entity(const entity& local, const entity& remote)>;

    conflict_resolver(cache_handle cache, std::shared_ptr<conflict_store> store,
                      optimistic_coordinator* coordinator);

    entity resolve(const std::string& conflict_id, const resolution& how, const merge_fn& merge = nullptr);

    entity auto_resolve(const std::string& conflict_id, auto_strategy strategy);

    /// Resolves every pending record; returns how many were settled.
    size_t auto_resolve(auto_strategy strategy);

    /// Fields listed in `fields` come from `local`, the rest from `remote`.
    static entity merge_fields(const entity& local, const entity& remote, const std::vector<std::string>& fields);

private:
    entity apply(const conflict_record& record, const resolution& how, const merge_fn& merge);
    entity take_remote(const conflict_record& record);
    /// Pushes `desired` through the coordinator. A failed push leaves the
    /// cache as it was, or on the remote copy if a write was in flight.
    entity push(const conflict_record& record, const entity& desired);

    cache_handle cache_;
    std::shared_ptr<conflict_store> store_;
    optimistic_coordinator* coordinator_;
};

} // namespace cohere

#endif // __cplusplus
