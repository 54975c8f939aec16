#include "cohere/entity_cache.hpp"
#include "cohere/error.hpp"
#include "cohere/log.hpp"
#include "cohere/version.hpp"

namespace cohere {

entity_cache::entity_cache(shared_clock clk)
    : clock_(clk ? std::move(clk) : make_system_clock()) {}

// ============================================================================
// Reads
// ============================================================================

std::optional<entity> entity_cache::get(const entity_id& id) const {
    std::shared_lock lock(mutex_);
    auto it = entries_.find(id);
    if (it == entries_.end()) return std::nullopt;
    return it->second.current.value;
}

std::optional<cache_entry> entity_cache::entry(const entity_id& id) const {
    std::shared_lock lock(mutex_);
    auto it = entries_.find(id);
    if (it == entries_.end()) return std::nullopt;
    return it->second.current;
}

std::vector<cache_entry> entity_cache::entries_for_table(const std::string& table) const {
    std::shared_lock lock(mutex_);
    std::vector<cache_entry> result;
    for (const auto& [_, s] : entries_) {
        if (s.current.value.table == table) {
            result.push_back(s.current);
        }
    }
    return result;
}

bool entity_cache::contains(const entity_id& id) const {
    std::shared_lock lock(mutex_);
    return entries_.count(id) != 0;
}

size_t entity_cache::size() const {
    std::shared_lock lock(mutex_);
    return entries_.size();
}

bool entity_cache::is_in_flight(const entity_id& id) const {
    std::shared_lock lock(mutex_);
    auto it = entries_.find(id);
    return it != entries_.end() && it->second.current.token != 0;
}

// ============================================================================
// Entity writes
// ============================================================================

put_result entity_cache::put(const entity& e, entry_state state, const std::optional<entity>& previous) {
    if (state == entry_state::optimistic || state == entry_state::evicted) {
        throw engine_error(error_code::invalid_argument,
                           std::string("put() does not accept state ") + to_string(state));
    }
    std::unique_lock lock(mutex_);
    return put_locked(e, state, previous);
}

put_result entity_cache::put_locked(const entity& e, entry_state state, const std::optional<entity>& previous) {
    auto it = entries_.find(e.id);
    if (it == entries_.end()) {
        store_confirmed_locked(e, state, previous, std::nullopt);
        return put_result::applied;
    }

    const auto& current = it->second.current;
    if (current.state == entry_state::optimistic) {
        if (compare_versions(e.version, current.base_version) != version_order::newer) {
            LOG_DEBUG("cache", "Discarding v%lld for %s: not newer than optimistic base v%lld",
                      (long long)e.version, e.id.c_str(), (long long)current.base_version);
            return put_result::stale;
        }
        LOG_DEBUG("cache", "v%lld for %s collides with unconfirmed local write",
                  (long long)e.version, e.id.c_str());
        return put_result::conflict;
    }

    if (is_stale(e.version, current.value.version)) {
        LOG_DEBUG("cache", "Discarding stale v%lld for %s (cached v%lld)",
                  (long long)e.version, e.id.c_str(), (long long)current.value.version);
        return put_result::stale;
    }

    auto cached = current.value;
    store_confirmed_locked(e, state, previous, cached);
    return put_result::applied;
}

void entity_cache::store_confirmed_locked(const entity& e, entry_state state,
                                          const std::optional<entity>& previous,
                                          const std::optional<entity>& cached) {
    auto& s = entries_[e.id];
    s.current = cache_entry{e, clock_->now(), state, 0, 0};
    s.before.reset();

    change_scope change;
    change.table = e.table;
    change.id = e.id;
    change.after = e;
    if (!cached && !previous) {
        change.type = change_type::insert;
    } else {
        change.type = change_type::update;
        change.before = cached ? cached : previous;
        std::set<std::string> touched;
        if (cached) {
            for (auto& name : changed_fields(cached->fields, e.fields)) touched.insert(std::move(name));
        }
        if (previous) {
            for (auto& name : changed_fields(previous->fields, e.fields)) touched.insert(std::move(name));
        }
        change.fields = std::move(touched);
    }
    apply_change_locked(change);
}

void entity_cache::apply_change_locked(const change_scope& change) {
    auto affected = registry_.affected_by(change);
    for (const auto& key : affected) {
        auto it = views_.find(key);
        if (it != views_.end() && it->second.valid) {
            it->second.valid = false;
            LOG_DEBUG("cache", "Invalidated %s after %s of %s",
                      describe(key).c_str(), to_string(change.type), change.id.c_str());
        }
    }

    // Views the change provably leaves alone absorb the member's new version.
    if (change.type != change_type::update || !change.after) return;
    for (auto& [key, vs] : views_) {
        if (!vs.valid || affected.count(key)) continue;
        if (vs.view.contains(change.id) && change.after->version > vs.view.version_token) {
            vs.view.version_token = change.after->version;
            ++vs.view.update_count;
        }
    }
}

void entity_cache::force_put(const entity& e) {
    std::unique_lock lock(mutex_);
    std::optional<entity> cached;
    auto it = entries_.find(e.id);
    if (it != entries_.end()) {
        cached = it->second.current.value;
        if (it->second.current.token != 0) {
            erase_token_locked(it->second.current.token);
            // The optimistic write no longer describes the cache; diff against what it replaced.
            if (it->second.before) {
                cached = it->second.before->value;
            }
        }
    }
    store_confirmed_locked(e, entry_state::confirmed, std::nullopt, cached);
}

bool entity_cache::remove(const entity_id& id, const std::optional<entity>& previous) {
    std::unique_lock lock(mutex_);
    change_scope change;
    change.type = change_type::remove;
    change.id = id;

    auto it = entries_.find(id);
    if (it == entries_.end()) {
        if (previous) {
            change.table = previous->table;
            change.before = previous;
            apply_change_locked(change);
        }
        return false;
    }

    const auto& current = it->second.current;
    if (current.token != 0) {
        LOG_INFO("cache", "Cancelling in-flight write on %s: entity removed", id.c_str());
        cancelled_.insert(current.token);
        tokens_.erase(current.token);
    }
    change.table = current.value.table;
    change.before = (current.state == entry_state::optimistic && it->second.before)
                        ? std::optional<entity>(it->second.before->value)
                        : std::optional<entity>(current.value);
    entries_.erase(it);
    apply_change_locked(change);
    return true;
}

bool entity_cache::evict(const entity_id& id) {
    std::unique_lock lock(mutex_);
    auto it = entries_.find(id);
    if (it == entries_.end()) return false;
    if (it->second.current.token != 0) {
        LOG_DEBUG("cache", "Refusing to evict %s: write in flight", id.c_str());
        return false;
    }
    entries_.erase(it);
    return true;
}

bool entity_cache::mark_stale(const entity_id& id) {
    std::unique_lock lock(mutex_);
    auto it = entries_.find(id);
    if (it == entries_.end() || it->second.current.state != entry_state::confirmed) return false;
    it->second.current.state = entry_state::stale;
    return true;
}

// ============================================================================
// Optimistic lifecycle
// ============================================================================

mutation_token entity_cache::begin_optimistic(const entity& speculative) {
    std::unique_lock lock(mutex_);
    auto it = entries_.find(speculative.id);
    if (it != entries_.end() && it->second.current.token != 0) {
        throw engine_error(error_code::conflict,
                           "Optimistic write already in flight for " + speculative.id);
    }

    mutation_token token = next_token_++;
    slot s;
    if (it != entries_.end()) {
        s.before = it->second.current;
    }
    s.current = cache_entry{speculative, clock_->now(), entry_state::optimistic, token,
                            s.before ? s.before->value.version : 0};
    entries_[speculative.id] = std::move(s);
    tokens_[token] = speculative.id;
    LOG_DEBUG("cache", "Optimistic write #%llu on %s", (unsigned long long)token, speculative.id.c_str());
    return token;
}

put_result entity_cache::commit(const entity& confirmed, mutation_token token) {
    std::unique_lock lock(mutex_);
    if (cancelled_.erase(token)) {
        return put_result::cancelled;
    }

    auto tit = tokens_.find(token);
    if (tit == tokens_.end()) {
        // Detached by force_put(); order against whatever is cached now.
        return put_locked(confirmed, entry_state::confirmed, std::nullopt);
    }

    entity_id local_id = tit->second;
    tokens_.erase(tit);
    auto it = entries_.find(local_id);
    std::optional<entity> before;
    if (it != entries_.end() && it->second.before) {
        before = it->second.before->value;
    }

    if (local_id != confirmed.id) {
        // Provisional id replaced by the one the remote assigned
        if (it != entries_.end()) entries_.erase(it);
        if (entries_.count(confirmed.id)) {
            return put_locked(confirmed, entry_state::confirmed, std::nullopt);
        }
        store_confirmed_locked(confirmed, entry_state::confirmed, std::nullopt, std::nullopt);
        return put_result::applied;
    }

    store_confirmed_locked(confirmed, entry_state::confirmed, std::nullopt, before);
    return put_result::applied;
}

bool entity_cache::rollback(mutation_token token) {
    std::unique_lock lock(mutex_);
    if (cancelled_.erase(token)) return false;

    auto tit = tokens_.find(token);
    if (tit == tokens_.end()) return false;
    entity_id id = tit->second;
    tokens_.erase(tit);

    auto it = entries_.find(id);
    if (it == entries_.end()) return false;
    if (it->second.before) {
        it->second.current = *it->second.before;
        it->second.before.reset();
    } else {
        entries_.erase(it);
    }
    LOG_DEBUG("cache", "Rolled back write #%llu on %s", (unsigned long long)token, id.c_str());
    return true;
}

void entity_cache::erase_token_locked(mutation_token token) {
    tokens_.erase(token);
}

// ============================================================================
// Collection views
// ============================================================================

void entity_cache::register_view(const view_key& key, const std::vector<view_key>& also_invalidates) {
    std::unique_lock lock(mutex_);
    registry_.register_view(key, also_invalidates);
}

bool entity_cache::view_valid_locked(const view_slot& vs) const {
    if (!vs.valid) return false;
    for (const auto& id : vs.view.ids) {
        auto it = entries_.find(id);
        if (it != entries_.end() && it->second.current.value.version > vs.view.version_token) {
            return false;
        }
    }
    return true;
}

std::optional<collection_view> entity_cache::get_view(const view_key& key) const {
    std::shared_lock lock(mutex_);
    auto it = views_.find(key);
    if (it == views_.end() || !view_valid_locked(it->second)) return std::nullopt;
    return it->second.view;
}

void entity_cache::put_view(const view_key& key, collection_view view) {
    std::unique_lock lock(mutex_);
    registry_.register_view(key);
    auto it = views_.find(key);
    view.update_count = (it != views_.end()) ? it->second.view.update_count + 1 : 0;
    if (view.captured_at == timestamp_t{}) {
        view.captured_at = clock_->now();
    }
    views_[key] = view_slot{std::move(view), true};
}

bool entity_cache::invalidate_view(const view_key& key) {
    std::unique_lock lock(mutex_);
    bool any = false;
    for (const auto& k : registry_.closure(key)) {
        auto it = views_.find(k);
        if (it != views_.end() && it->second.valid) {
            it->second.valid = false;
            any = true;
        }
    }
    return any;
}

size_t entity_cache::invalidate_views_matching(const std::function<bool(const view_key&)>& predicate) {
    std::unique_lock lock(mutex_);
    std::set<view_key> targets;
    for (const auto& [key, _] : views_) {
        if (predicate(key)) {
            auto reach = registry_.closure(key);
            targets.insert(reach.begin(), reach.end());
        }
    }
    size_t count = 0;
    for (const auto& key : targets) {
        auto it = views_.find(key);
        if (it != views_.end() && it->second.valid) {
            it->second.valid = false;
            ++count;
        }
    }
    return count;
}

bool entity_cache::evict_view(const view_key& key) {
    std::unique_lock lock(mutex_);
    return views_.erase(key) != 0;
}

std::vector<view_info> entity_cache::views() const {
    std::shared_lock lock(mutex_);
    std::vector<view_info> result;
    result.reserve(views_.size());
    for (const auto& [key, vs] : views_) {
        result.push_back(view_info{key, vs.view.captured_at, vs.view.update_count, view_valid_locked(vs)});
    }
    return result;
}

std::optional<view_info> entity_cache::view_status(const view_key& key) const {
    std::shared_lock lock(mutex_);
    auto it = views_.find(key);
    if (it == views_.end()) return std::nullopt;
    return view_info{key, it->second.view.captured_at, it->second.view.update_count,
                     view_valid_locked(it->second)};
}

void entity_cache::clear() {
    std::unique_lock lock(mutex_);
    for (const auto& [token, _] : tokens_) {
        cancelled_.insert(token);
    }
    tokens_.clear();
    entries_.clear();
    views_.clear();
}

// ============================================================================
// cache_handle
// ============================================================================

struct cache_handle::state {
    explicit state(shared_clock c) : clock(std::move(c)), cache(clock) {}

    shared_clock clock;
    entity_cache cache;
    std::mutex mutex;
    std::condition_variable cv;
    size_t in_flight = 0;
    bool open = true;
};

cache_handle::mutation_guard::mutation_guard(std::shared_ptr<state> s) : state_(std::move(s)) {}

cache_handle::mutation_guard::~mutation_guard() {
    release();
}

cache_handle::mutation_guard::mutation_guard(mutation_guard&& other) noexcept
    : state_(std::move(other.state_)) {}

cache_handle::mutation_guard& cache_handle::mutation_guard::operator=(mutation_guard&& other) noexcept {
    if (this != &other) {
        release();
        state_ = std::move(other.state_);
    }
    return *this;
}

void cache_handle::mutation_guard::release() {
    if (!state_) return;
    {
        std::lock_guard<std::mutex> lock(state_->mutex);
        --state_->in_flight;
    }
    state_->cv.notify_all();
    state_.reset();
}

cache_handle cache_handle::init(shared_clock clk) {
    auto s = std::make_shared<state>(clk ? std::move(clk) : make_system_clock());
    LOG_INFO("cache", "Cache handle initialized");
    return cache_handle(std::move(s));
}

entity_cache& cache_handle::cache() const {
    if (!state_) {
        throw engine_error(error_code::invalid_argument, "cache handle used before init()");
    }
    return state_->cache;
}

cache_handle::mutation_guard cache_handle::begin_mutation() const {
    if (!state_) {
        throw engine_error(error_code::invalid_argument, "cache handle used before init()");
    }
    std::lock_guard<std::mutex> lock(state_->mutex);
    if (!state_->open) {
        throw engine_error(error_code::shut_down, "cache handle is shut down");
    }
    ++state_->in_flight;
    return mutation_guard(state_);
}

void cache_handle::shutdown() const {
    if (!state_) return;
    {
        std::unique_lock<std::mutex> lock(state_->mutex);
        if (!state_->open) return;
        state_->open = false;
        if (state_->in_flight > 0) {
            LOG_INFO("cache", "Draining %zu in-flight mutation(s)", state_->in_flight);
        }
        state_->cv.wait(lock, [this] { return state_->in_flight == 0; });
    }
    state_->cache.clear();
    LOG_INFO("cache", "Cache handle shut down");
}

bool cache_handle::is_open() const {
    if (!state_) return false;
    std::lock_guard<std::mutex> lock(state_->mutex);
    return state_->open;
}

size_t cache_handle::in_flight() const {
    if (!state_) return 0;
    std::lock_guard<std::mutex> lock(state_->mutex);
    return state_->in_flight;
}

const shared_clock& cache_handle::time_source() const {
    if (!state_) {
        throw engine_error(error_code::invalid_argument, "cache handle used before init()");
    }
    return state_->clock;
}

} // namespace cohere
