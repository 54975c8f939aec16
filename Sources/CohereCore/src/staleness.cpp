#include "cohere/staleness.hpp"
#include "cohere/log.hpp"
#include <algorithm>

namespace cohere {

staleness_policy::staleness_policy(cache_handle cache, std::shared_ptr<conflict_store> conflicts,
                                   staleness_config config)
    : cache_(std::move(cache)), conflicts_(std::move(conflicts)), config_(config) {}

void staleness_policy::declare_scope(scope_declaration scope) {
    std::lock_guard<std::mutex> lock(mutex_);
    for (const auto& key : scope.views) {
        cache_->register_view(key);
    }
    auto name = scope.name;
    scopes_[name] = std::move(scope);
}

std::optional<std::string> staleness_policy::current_scope() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return current_;
}

void staleness_policy::set_network_quality(network_quality quality) {
    std::lock_guard<std::mutex> lock(mutex_);
    quality_ = quality;
}

network_quality staleness_policy::quality() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return quality_;
}

sync_strategy staleness_policy::strategy() const {
    return strategy_for(quality());
}

std::chrono::milliseconds staleness_policy::sync_interval() const {
    switch (strategy()) {
        case sync_strategy::off: return std::chrono::milliseconds(0);
        case sync_strategy::conservative: return config_.sync_interval * 2;
        case sync_strategy::balanced: return config_.sync_interval;
        case sync_strategy::aggressive: return config_.sync_interval / 2;
    }
    return config_.sync_interval;
}

std::optional<timestamp_t> staleness_policy::last_refresh(const std::string& scope) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = last_refresh_.find(scope);
    if (it == last_refresh_.end()) return std::nullopt;
    return it->second;
}

bool staleness_policy::pinned(const cache_entry& entry) const {
    if (entry.token != 0 || entry.state == entry_state::optimistic) return true;
    return conflicts_ && conflicts_->has_pending(entry.value.id);
}

void staleness_policy::refetch_owned_locked(const scope_declaration& scope, refetch_rule rule, timestamp_t now,
                                            std::vector<cache_command>& out) {
    auto max_age = scope.max_age.count() > 0 ? scope.max_age : config_.default_max_age;
    size_t issued = 0;
    for (const auto& key : scope.views) {
        auto status = cache_->view_status(key);
        bool due = true;
        if (status && status->valid) {
            auto age = now - status->captured_at;
            switch (rule) {
                case refetch_rule::always: due = true; break;
                case refetch_rule::stale_time: due = age >= config_.stale_time; break;
                case refetch_rule::max_age: due = age > max_age; break;
            }
        }
        if (due) {
            out.push_back(cache_command::refetch(key));
            ++issued;
        }
    }
    if (issued > 0) {
        last_refresh_[scope.name] = now;
    }
}

void staleness_policy::leave_scope_locked(const scope_declaration& left, const std::optional<std::string>& next,
                                          timestamp_t now, std::vector<cache_command>& out) {
    const scope_declaration* entering = nullptr;
    if (next) {
        auto it = scopes_.find(*next);
        if (it != scopes_.end()) entering = &it->second;
    }

    for (const auto& key : left.views) {
        if (entering && std::find(entering->views.begin(), entering->views.end(), key) != entering->views.end()) {
            continue;
        }
        auto status = cache_->view_status(key);
        if (status && status->update_count == 0) {
            out.push_back(cache_command::evict(key));
        }
    }

    for (const auto& table : left.detail_tables) {
        if (entering && std::find(entering->detail_tables.begin(), entering->detail_tables.end(), table) !=
                            entering->detail_tables.end()) {
            continue;
        }
        for (const auto& entry : cache_->entries_for_table(table)) {
            if (pinned(entry)) continue;
            if (now - entry.fetched_at > config_.detail_retention) {
                out.push_back(cache_command::evict_entity(table, entry.value.id));
            }
        }
    }
}

std::vector<cache_command> staleness_policy::on_context_transition(const context_transition& transition) {
    auto now = cache_.time_source()->now();
    std::vector<cache_command> out;
    std::lock_guard<std::mutex> lock(mutex_);
    bool online = quality_ != network_quality::offline;

    auto current_decl = [&]() -> const scope_declaration* {
        if (!current_) return nullptr;
        auto it = scopes_.find(*current_);
        return it == scopes_.end() ? nullptr : &it->second;
    };

    switch (transition.kind) {
        case context_kind::navigation: {
            if (current_ && *current_ != transition.scope) {
                if (auto* left = current_decl()) {
                    leave_scope_locked(*left, transition.scope, now, out);
                }
                LOG_INFO("staleness", "Scope %s -> %s", current_->c_str(), transition.scope.c_str());
            }
            current_ = transition.scope;
            if (auto* entering = current_decl(); entering && online) {
                refetch_owned_locked(*entering, refetch_rule::max_age, now, out);
            }
            break;
        }

        case context_kind::visibility_regained: {
            auto* scope = current_decl();
            if (!scope || !online) break;
            auto last = last_refresh_.find(scope->name);
            if (last != last_refresh_.end() && now - last->second < config_.focus_throttle) {
                LOG_DEBUG("staleness", "Focus refresh of %s throttled", scope->name.c_str());
                break;
            }
            refetch_owned_locked(*scope, refetch_rule::stale_time, now, out);
            break;
        }

        case context_kind::network_regained: {
            if (transition.quality && *transition.quality != network_quality::offline) {
                quality_ = *transition.quality;
            } else if (quality_ == network_quality::offline) {
                quality_ = network_quality::moderate;
            }
            LOG_INFO("staleness", "Network back (%s sync)", to_string(strategy_for(quality_)));
            out.push_back(cache_command::reconnect());
            if (auto* scope = current_decl()) {
                refetch_owned_locked(*scope, refetch_rule::stale_time, now, out);
            }
            break;
        }

        case context_kind::network_lost:
            quality_ = network_quality::offline;
            LOG_INFO("staleness", "Network lost; refetches suppressed");
            break;

        case context_kind::manual_refresh: {
            if (!online) break;
            const scope_declaration* scope = nullptr;
            if (!transition.scope.empty()) {
                auto it = scopes_.find(transition.scope);
                if (it != scopes_.end()) scope = &it->second;
            } else {
                scope = current_decl();
            }
            if (!scope) break;
            refetch_owned_locked(*scope, refetch_rule::always, now, out);
            for (const auto& table : scope->detail_tables) {
                for (const auto& entry : cache_->entries_for_table(table)) {
                    if (!pinned(entry)) out.push_back(cache_command::refresh_entity(table, entry.value.id));
                }
            }
            last_refresh_[scope->name] = now;
            break;
        }

        case context_kind::periodic_tick: {
            if (!online) break;
            if (auto* scope = current_decl()) {
                refetch_owned_locked(*scope, refetch_rule::stale_time, now, out);
            }
            break;
        }
    }

    LOG_DEBUG("staleness", "%s produced %zu command(s)", to_string(transition.kind), out.size());
    return out;
}

} // namespace cohere
