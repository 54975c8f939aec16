#pragma once

#ifdef __cplusplus

#include "error.hpp"
#include "types.hpp"
#include "view.hpp"
#include "clock.hpp"
#include <condition_variable>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <shared_mutex>
#include <unordered_map>
#include <unordered_set>

namespace cohere {

// ============================================================================
// cache_entry - One cached entity plus its bookkeeping
// ============================================================================

struct cache_entry {
    entity value;
    timestamp_t fetched_at{};
    entry_state state = entry_state::confirmed;
    /// In-flight optimistic write, 0 when none
    mutation_token token = 0;
    /// Version the optimistic write was based on (0 when the id was absent)
    version_t base_version = 0;

    bool operator==(const cache_entry& o) const {
        return value == o.value && fetched_at == o.fetched_at && state == o.state &&
               token == o.token && base_version == o.base_version;
    }
    bool operator!=(const cache_entry& o) const { return !(*this == o); }
};

enum class put_result {
    applied,
    stale,      // older than what the cache already holds; discarded
    conflict,   // would discard an unconfirmed local write; not applied
    cancelled   // the write it confirms was cancelled by a remote delete
};

inline const char* to_string(put_result r) {
    switch (r) {
        case put_result::applied: return "applied";
        case put_result::stale: return "stale";
        case put_result::conflict: return "conflict";
        case put_result::cancelled: return "cancelled";
    }
    return "unknown";
}

struct view_info {
    view_key key;
    timestamp_t captured_at{};
    uint64_t update_count = 0;
    bool valid = false;
};

// ============================================================================
// entity_cache - Keyed entity store plus captured collection views
// ============================================================================
//
// Readers share the lock; every write takes it exclusively. Nothing in here
// blocks on remote work, so the write lock is only ever held briefly.
//
// Transition rules for a confirmed write over an existing entry:
//   confirmed/stale entry  -> applied unless older (stale)
//   optimistic entry       -> stale when not newer than the write's base
//                             version, otherwise conflict (left untouched)
// Only commit() with the matching token replaces an optimistic entry.

class entity_cache {
public:
    explicit entity_cache(shared_clock clk = make_system_clock());

    entity_cache(const entity_cache&) = delete;
    entity_cache& operator=(const entity_cache&) = delete;

    // ------------------------------------------------------------------
    // Reads
    // ------------------------------------------------------------------

    [[nodiscard]] std::optional<entity> get(const entity_id& id) const;
    [[nodiscard]] std::optional<cache_entry> entry(const entity_id& id) const;
    [[nodiscard]] std::vector<cache_entry> entries_for_table(const std::string& table) const;
    [[nodiscard]] bool contains(const entity_id& id) const;
    [[nodiscard]] size_t size() const;

    /// True while an optimistic write on `id` is unsettled.
    [[nodiscard]] bool is_in_flight(const entity_id& id) const;

    // ------------------------------------------------------------------
    // Entity writes
    // ------------------------------------------------------------------

    /// Stores a confirmed or stale copy under the transition rules.
    /// `previous` is the remote's prior copy when known and sharpens which
    /// views get invalidated.
    put_result put(const entity& e, entry_state state = entry_state::confirmed,
                   const std::optional<entity>& previous = std::nullopt);

    /// Replaces whatever is cached for e.id with a confirmed copy. Any
    /// unsettled optimistic write on the id is detached: its later commit
    /// falls back to put() ordering and its rollback becomes a no-op.
    void force_put(const entity& e);

    /// Removes the entry. An in-flight optimistic write on it is cancelled.
    bool remove(const entity_id& id, const std::optional<entity>& previous = std::nullopt);

    /// Drops the entry without treating it as a data change. Refused for
    /// entries with an unsettled optimistic write.
    bool evict(const entity_id& id);

    bool mark_stale(const entity_id& id);

    // ------------------------------------------------------------------
    // Optimistic lifecycle
    // ------------------------------------------------------------------

    /// Stores `speculative` as optimistic and remembers the prior entry.
    /// Throws engine_error(conflict) if the id already has one in flight.
    mutation_token begin_optimistic(const entity& speculative);

    /// Settles the write identified by `token` with the server's copy.
    put_result commit(const entity& confirmed, mutation_token token);

    /// Restores the entry that existed before the write (or removes the id
    /// if there was none). Returns false when the token is no longer live.
    bool rollback(mutation_token token);

    // ------------------------------------------------------------------
    // Collection views
    // ------------------------------------------------------------------

    void register_view(const view_key& key, const std::vector<view_key>& also_invalidates = {});

    /// nullopt when absent, invalidated, or when a member is cached at a
    /// version above the view's token.
    [[nodiscard]] std::optional<collection_view> get_view(const view_key& key) const;
    void put_view(const view_key& key, collection_view view);
    bool invalidate_view(const view_key& key);
    size_t invalidate_views_matching(const std::function<bool(const view_key&)>& predicate);
    bool evict_view(const view_key& key);
    [[nodiscard]] std::vector<view_info> views() const;
    [[nodiscard]] std::optional<view_info> view_status(const view_key& key) const;

    /// Drops every entry and view; cancels in-flight tokens.
    void clear();

    [[nodiscard]] const shared_clock& time_source() const { return clock_; }

private:
    struct slot {
        cache_entry current;
        /// Entry before the in-flight optimistic write; nullopt = id was absent
        std::optional<cache_entry> before;
    };

    struct view_slot {
        collection_view view;
        bool valid = true;
    };

    put_result put_locked(const entity& e, entry_state state, const std::optional<entity>& previous);
    void store_confirmed_locked(const entity& e, entry_state state, const std::optional<entity>& previous,
                                const std::optional<entity>& cached);
    void apply_change_locked(const change_scope& change);
    bool view_valid_locked(const view_slot& slot) const;
    void erase_token_locked(mutation_token token);

    shared_clock clock_;
    mutable std::shared_mutex mutex_;
    std::unordered_map<entity_id, slot> entries_;
    std::unordered_map<mutation_token, entity_id> tokens_;
    std::unordered_set<mutation_token> cancelled_;
    std::map<view_key, view_slot> views_;
    view_registry registry_;
    mutation_token next_token_ = 1;
};

// ============================================================================
// cache_handle - Explicit owner of the process-wide cache lifecycle
// ============================================================================
//
// Copies share one cache. init() opens it; shutdown() refuses new mutations,
// waits for in-flight ones to settle and then clears the cache.

class cache_handle {
    struct state;

public:
    class mutation_guard {
    public:
        mutation_guard() = default;
        ~mutation_guard();
        mutation_guard(mutation_guard&& other) noexcept;
        mutation_guard& operator=(mutation_guard&& other) noexcept;
        mutation_guard(const mutation_guard&) = delete;
        mutation_guard& operator=(const mutation_guard&) = delete;

    private:
        friend class cache_handle;
        explicit mutation_guard(std::shared_ptr<state> s);
        void release();
        std::shared_ptr<state> state_;
    };

    static cache_handle init(shared_clock clk = make_system_clock());

    [[nodiscard]] entity_cache& cache() const;
    entity_cache* operator->() const { return &cache(); }

    /// Registers one in-flight mutation. Throws engine_error(shut_down)
    /// once shutdown() began.
    [[nodiscard]] mutation_guard begin_mutation() const;

    void shutdown() const;

    [[nodiscard]] bool is_open() const;
    [[nodiscard]] size_t in_flight() const;
    [[nodiscard]] const shared_clock& time_source() const;
    [[nodiscard]] bool valid() const { return state_ != nullptr; }

private:
    explicit cache_handle(std::shared_ptr<state> s) : state_(std::move(s)) {}

    std::shared_ptr<state> state_;
};

} // namespace cohere

#endif // __cplusplus
