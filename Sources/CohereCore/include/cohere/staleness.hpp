#pragma once

#ifdef __cplusplus

#include "entity_cache.hpp"
#include "conflict.hpp"
#include "config.hpp"
#include <map>
#include <mutex>

namespace cohere {

// ============================================================================
// Context transitions and the commands they produce
// ============================================================================

enum class context_kind {
    navigation,
    visibility_regained,
    network_regained,
    network_lost,
    manual_refresh,
    periodic_tick
};

inline const char* to_string(context_kind k) {
    switch (k) {
        case context_kind::navigation: return "navigation";
        case context_kind::visibility_regained: return "visibility_regained";
        case context_kind::network_regained: return "network_regained";
        case context_kind::network_lost: return "network_lost";
        case context_kind::manual_refresh: return "manual_refresh";
        case context_kind::periodic_tick: return "periodic_tick";
    }
    return "unknown";
}

enum class network_quality {
    offline,
    slow,
    moderate,
    fast
};

enum class sync_strategy {
    off,
    conservative,
    balanced,
    aggressive
};

inline const char* to_string(sync_strategy s) {
    switch (s) {
        case sync_strategy::off: return "off";
        case sync_strategy::conservative: return "conservative";
        case sync_strategy::balanced: return "balanced";
        case sync_strategy::aggressive: return "aggressive";
    }
    return "unknown";
}

inline sync_strategy strategy_for(network_quality quality) {
    switch (quality) {
        case network_quality::offline: return sync_strategy::off;
        case network_quality::slow: return sync_strategy::conservative;
        case network_quality::moderate: return sync_strategy::balanced;
        case network_quality::fast: return sync_strategy::aggressive;
    }
    return sync_strategy::off;
}

struct context_transition {
    context_kind kind = context_kind::navigation;
    /// Destination of a navigation; manual refreshes default to the current scope
    std::string scope;
    /// Quality reported with network_regained
    std::optional<network_quality> quality;

    static context_transition navigate(std::string to) { return {context_kind::navigation, std::move(to), {}}; }
    static context_transition of(context_kind kind) { return {kind, {}, {}}; }
};

enum class command_kind {
    refetch_view,
    refresh_entity,
    evict_view,
    evict_entity,
    reconnect_feed
};

inline const char* to_string(command_kind k) {
    switch (k) {
        case command_kind::refetch_view: return "refetch_view";
        case command_kind::refresh_entity: return "refresh_entity";
        case command_kind::evict_view: return "evict_view";
        case command_kind::evict_entity: return "evict_entity";
        case command_kind::reconnect_feed: return "reconnect_feed";
    }
    return "unknown";
}

struct cache_command {
    command_kind kind = command_kind::refetch_view;
    std::optional<view_key> view;
    std::string table;
    entity_id id;

    static cache_command refetch(view_key key) {
        return {command_kind::refetch_view, std::move(key), {}, {}};
    }
    static cache_command evict(view_key key) {
        return {command_kind::evict_view, std::move(key), {}, {}};
    }
    static cache_command evict_entity(std::string table, entity_id id) {
        return {command_kind::evict_entity, std::nullopt, std::move(table), std::move(id)};
    }
    static cache_command refresh_entity(std::string table, entity_id id) {
        return {command_kind::refresh_entity, std::nullopt, std::move(table), std::move(id)};
    }
    static cache_command reconnect() {
        return {command_kind::reconnect_feed, std::nullopt, {}, {}};
    }
};

/// Views a named screen owns and how old they may get.
struct scope_declaration {
    std::string name;
    std::vector<view_key> views;
    /// Zero uses staleness_config::default_max_age
    std::chrono::milliseconds max_age{0};
    /// Tables whose detail entries belong to this scope
    std::vector<std::string> detail_tables;
};

// ============================================================================
// staleness_policy - Turns context changes into refresh and evict commands
// ============================================================================
//
// Pure decision logic over the cache's bookkeeping; executing the commands
// is up to the caller (see query_service::execute).

class staleness_policy {
public:
    staleness_policy(cache_handle cache, std::shared_ptr<conflict_store> conflicts, staleness_config config = {});

    void declare_scope(scope_declaration scope);

    std::vector<cache_command> on_context_transition(const context_transition& transition);

    [[nodiscard]] std::optional<std::string> current_scope() const;

    void set_network_quality(network_quality quality);
    [[nodiscard]] network_quality quality() const;
    [[nodiscard]] sync_strategy strategy() const;

    /// Background sync period for the current strategy; zero when off.
    [[nodiscard]] std::chrono::milliseconds sync_interval() const;

    [[nodiscard]] std::optional<timestamp_t> last_refresh(const std::string& scope) const;

private:
    enum class refetch_rule {
        always,
        stale_time,
        max_age
    };

    void refetch_owned_locked(const scope_declaration& scope, refetch_rule rule, timestamp_t now,
                              std::vector<cache_command>& out);
    void leave_scope_locked(const scope_declaration& left, const std::optional<std::string>& next,
                            timestamp_t now, std::vector<cache_command>& out);
    bool pinned(const cache_entry& entry) const;

    cache_handle cache_;
    std::shared_ptr<conflict_store> conflicts_;
    staleness_config config_;

    mutable std::mutex mutex_;
    std::map<std::string, scope_declaration> scopes_;
    std::map<std::string, timestamp_t> last_refresh_;
    std::optional<std::string> current_;
    network_quality quality_ = network_quality::fast;
};

} // namespace cohere

#endif // __cplusplus
