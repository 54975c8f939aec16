#include "cohere/conflict.hpp"
#include "cohere/optimistic.hpp"
#include "cohere/version.hpp"
#include "cohere/error.hpp"
#include "cohere/log.hpp"
#include <algorithm>

namespace cohere {

// ============================================================================
// conflict_store
// ============================================================================

conflict_store::conflict_store(shared_clock clk, shared_scheduler dispatch)
    : clock_(clk ? std::move(clk) : make_system_clock()),
      observers_(dispatch ? std::move(dispatch) : std::make_shared<immediate_scheduler>()) {}

conflict_record conflict_store::add(const entity& local, const entity& remote) {
    conflict_record snapshot;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto existing = std::find_if(pending_.begin(), pending_.end(),
                                     [&](const auto& kv) { return kv.second.target == local.id; });
        if (existing != pending_.end()) {
            auto& record = existing->second;
            record.local = local;
            if (!record.remote || remote_prevails(*record.remote, remote)) {
                record.remote = remote;
            }
            snapshot = record;
            LOG_DEBUG("conflict", "Refreshed conflict %s on %s", record.id.c_str(), local.id.c_str());
        } else {
            conflict_record record;
            record.id = uuid_t::generate().to_string();
            record.target = local.id;
            record.table = local.table.empty() ? remote.table : local.table;
            record.local = local;
            record.remote = remote;
            record.detected_at = clock_->now();
            pending_.emplace(record.id, record);
            snapshot = record;
            LOG_INFO("conflict", "Conflict %s on %s: local v%lld vs remote v%lld", record.id.c_str(),
                     local.id.c_str(), (long long)local.version, (long long)remote.version);
        }
    }
    observers_.notify(snapshot);
    return snapshot;
}

conflict_record conflict_store::add_resolved(const entity& local, const std::optional<entity>& remote,
                                             std::string resolution) {
    conflict_record record;
    record.id = uuid_t::generate().to_string();
    record.target = local.id;
    record.table = local.table;
    record.local = local;
    record.remote = remote;
    record.detected_at = clock_->now();
    record.resolved = true;
    record.automatic = true;
    record.resolution = std::move(resolution);
    record.outcome = remote;
    record.resolved_at = record.detected_at;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        history_.push_back(record);
    }
    LOG_INFO("conflict", "Conflict on %s settled on arrival (%s)", local.id.c_str(), record.resolution.c_str());
    observers_.notify(record);
    return record;
}

std::optional<conflict_record> conflict_store::get(const std::string& conflict_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = pending_.find(conflict_id);
    if (it != pending_.end()) return it->second;
    for (const auto& record : history_) {
        if (record.id == conflict_id) return record;
    }
    return std::nullopt;
}

std::optional<conflict_record> conflict_store::pending_for(const entity_id& target) const {
    std::lock_guard<std::mutex> lock(mutex_);
    for (const auto& [id, record] : pending_) {
        if (record.target == target && !claimed_.count(id)) return record;
    }
    return std::nullopt;
}

std::vector<conflict_record> conflict_store::pending() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<conflict_record> result;
    for (const auto& [id, record] : pending_) {
        if (!claimed_.count(id)) result.push_back(record);
    }
    std::sort(result.begin(), result.end(),
              [](const conflict_record& a, const conflict_record& b) { return a.detected_at < b.detected_at; });
    return result;
}

size_t conflict_store::pending_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return pending_.size() - claimed_.size();
}

std::vector<conflict_record> conflict_store::history() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return history_;
}

bool conflict_store::has_pending(const entity_id& target) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return std::any_of(pending_.begin(), pending_.end(),
                       [&](const auto& kv) { return kv.second.target == target; });
}

conflict_record conflict_store::claim(const std::string& conflict_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = pending_.find(conflict_id);
    if (it == pending_.end()) {
        bool settled = std::any_of(history_.begin(), history_.end(),
                                   [&](const conflict_record& r) { return r.id == conflict_id; });
        if (settled) {
            throw engine_error(error_code::already_resolved, "conflict " + conflict_id + " is already resolved");
        }
        throw engine_error(error_code::not_found, "no conflict " + conflict_id);
    }
    if (!claimed_.insert(conflict_id).second) {
        throw engine_error(error_code::already_resolved, "conflict " + conflict_id + " is being resolved");
    }
    return it->second;
}

void conflict_store::settle(const std::string& conflict_id, std::string resolution, bool automatic,
                            const std::optional<entity>& outcome) {
    conflict_record record;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = pending_.find(conflict_id);
        if (it == pending_.end()) return;
        record = std::move(it->second);
        pending_.erase(it);
        claimed_.erase(conflict_id);
        record.resolved = true;
        record.automatic = automatic;
        record.resolution = std::move(resolution);
        record.outcome = outcome;
        record.resolved_at = clock_->now();
        history_.push_back(record);
    }
    LOG_INFO("conflict", "Resolved %s on %s (%s%s)", record.id.c_str(), record.target.c_str(),
             record.resolution.c_str(), automatic ? ", automatic" : "");
    observers_.notify(record);
}

void conflict_store::release(const std::string& conflict_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    claimed_.erase(conflict_id);
}

notification_token conflict_store::observe(std::function<void(const conflict_record&)> handler) {
    return observers_.add(std::move(handler));
}

// ============================================================================
// conflict_resolver
// ============================================================================

conflict_resolver::conflict_resolver(cache_handle cache, std::shared_ptr<conflict_store> store,
                                     optimistic_coordinator* coordinator)
    : cache_(std::move(cache)), store_(std::move(store)), coordinator_(coordinator) {
    if (!store_) {
        throw engine_error(error_code::invalid_argument, "conflict_resolver requires a conflict store");
    }
}

entity conflict_resolver::merge_fields(const entity& local, const entity& remote,
                                       const std::vector<std::string>& fields) {
    entity merged = remote;
    for (const auto& name : fields) {
        if (local.fields.contains(name)) {
            merged.fields[name] = local.fields[name];
        } else {
            merged.fields.erase(name);
        }
    }
    merged.version = std::max(local.version, remote.version);
    return merged;
}

entity conflict_resolver::take_remote(const conflict_record& record) {
    const entity& remote = *record.remote;
    auto current = cache_->entry(record.target);
    if (current && current->state == entry_state::optimistic) {
        cache_->force_put(remote);
        return remote;
    }
    if (cache_->put(remote) == put_result::stale) {
        // The cache already holds a newer confirmed copy.
        return cache_->get(record.target).value_or(remote);
    }
    return remote;
}

entity conflict_resolver::push(const conflict_record& record, const entity& desired) {
    // An unsettled optimistic write would refuse the push. Falling back to the
    // remote copy first means a failed push rolls back to server state.
    auto current = cache_->entry(record.target);
    if (current && current->state == entry_state::optimistic) {
        cache_->force_put(*record.remote);
    }
    return coordinator_->push(desired);
}

entity conflict_resolver::apply(const conflict_record& record, const resolution& how, const merge_fn& merge) {
    switch (how.strategy) {
        case resolution_strategy::remote:
            return take_remote(record);

        case resolution_strategy::local:
            if (!coordinator_) {
                throw engine_error(error_code::invalid_argument, "local resolution requires a coordinator");
            }
            return push(record, record.local);

        case resolution_strategy::merge: {
            entity merged = merge ? merge(record.local, *record.remote)
                                  : merge_fields(record.local, *record.remote, how.fields);
            merged.id = record.target;
            merged.table = record.table;
            merged.version = std::max(record.local.version, record.remote->version);
            if (!coordinator_) {
                cache_->force_put(merged);
                return merged;
            }
            return push(record, merged);
        }
    }
    throw engine_error(error_code::invalid_argument, "unknown resolution strategy");
}

entity conflict_resolver::resolve(const std::string& conflict_id, const resolution& how, const merge_fn& merge) {
    auto record = store_->claim(conflict_id);
    try {
        auto outcome = apply(record, how, merge);
        store_->settle(conflict_id, to_string(how.strategy), false, outcome);
        return outcome;
    } catch (const std::exception& e) {
        LOG_WARN("conflict", "Resolving %s failed: %s", conflict_id.c_str(), e.what());
        store_->release(conflict_id);
        throw;
    }
}

entity conflict_resolver::auto_resolve(const std::string& conflict_id, auto_strategy strategy) {
    auto record = store_->claim(conflict_id);
    resolution how = resolution::remote();
    switch (strategy) {
        case auto_strategy::newest_wins:
            how = remote_prevails(record.local, *record.remote) ? resolution::remote() : resolution::local();
            break;
        case auto_strategy::local_wins:
            how = resolution::local();
            break;
        case auto_strategy::remote_wins:
            how = resolution::remote();
            break;
    }
    try {
        auto outcome = apply(record, how, nullptr);
        store_->settle(conflict_id, to_string(how.strategy), true, outcome);
        return outcome;
    } catch (const std::exception& e) {
        LOG_WARN("conflict", "Auto-resolving %s (%s) failed: %s", conflict_id.c_str(), to_string(strategy),
                 e.what());
        store_->release(conflict_id);
        throw;
    }
}

size_t conflict_resolver::auto_resolve(auto_strategy strategy) {
    size_t settled = 0;
    for (const auto& record : store_->pending()) {
        try {
            auto_resolve(record.id, strategy);
            ++settled;
        } catch (const engine_error& e) {
            if (e.code() == error_code::already_resolved) continue;
            LOG_WARN("conflict", "Leaving %s pending: %s", record.id.c_str(), e.what());
        }
    }
    return settled;
}

} // namespace cohere
