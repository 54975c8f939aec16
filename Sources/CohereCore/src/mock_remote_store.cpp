#include "cohere/mock_remote_store.hpp"
#include "cohere/log.hpp"
#include <thread>

namespace cohere {

mock_remote_store::mock_remote_store(shared_clock clk)
    : clock_(clk ? std::move(clk) : make_system_clock()) {}

void mock_remote_store::before_call(const std::string& operation, const entity_id& id) {
    std::chrono::milliseconds latency;
    std::optional<failure> fail;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        ++calls_[operation];
        latency = latency_;
        if (next_failure_count_ > 0 && next_failure_) {
            fail = next_failure_;
            if (--next_failure_count_ == 0) next_failure_.reset();
        } else if (!id.empty()) {
            auto it = id_failures_.find(id);
            if (it != id_failures_.end()) fail = it->second;
        }
    }
    if (latency.count() > 0) {
        std::this_thread::sleep_for(latency);
    }
    if (fail) {
        throw engine_error(fail->code, fail->message);
    }
}

entity mock_remote_store::fetch_one(const std::string& table, const entity_id& id) {
    before_call("fetch_one", id);
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = entities_.find(id);
    if (it == entities_.end() || it->second.table != table) {
        throw engine_error(error_code::not_found, id + " not found");
    }
    return it->second;
}

std::vector<entity> mock_remote_store::fetch_collection(const collection_query& query) {
    before_call("fetch_collection", "");
    std::vector<entity> all;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        all.reserve(entities_.size());
        for (const auto& [_, e] : entities_) all.push_back(e);
    }
    return apply_query(std::move(all), query);
}

entity mock_remote_store::create(const std::string& table, const nlohmann::json& payload,
                                 const std::optional<entity_id>& id) {
    before_call("create", id.value_or(""));
    if (!payload.is_object()) {
        throw engine_error(error_code::validation, "payload must be an object");
    }
    std::lock_guard<std::mutex> lock(mutex_);
    entity e;
    e.id = id ? *id : "mock-" + std::to_string(next_id_++);
    if (entities_.count(e.id)) {
        throw engine_error(error_code::conflict, e.id + " already exists");
    }
    e.table = table;
    e.version = ++last_version_;
    e.fields = payload;
    entities_[e.id] = e;
    emit_locked(change_type::insert, e, std::nullopt);
    return e;
}

entity mock_remote_store::update(const std::string& table, const entity_id& id, const nlohmann::json& patch,
                                 std::optional<version_t> expected_version) {
    before_call("update", id);
    if (!patch.is_object()) {
        throw engine_error(error_code::validation, "patch must be an object");
    }
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = entities_.find(id);
    if (it == entities_.end() || it->second.table != table) {
        throw engine_error(error_code::not_found, id + " not found");
    }
    if (expected_version && *expected_version != it->second.version) {
        throw engine_error(error_code::conflict,
                           "version mismatch for " + id + ": expected " + std::to_string(*expected_version) +
                           ", found " + std::to_string(it->second.version));
    }
    entity previous = it->second;
    it->second.fields.merge_patch(patch);
    it->second.version = ++last_version_;
    emit_locked(change_type::update, it->second, previous);
    return it->second;
}

void mock_remote_store::remove(const std::string& table, const entity_id& id) {
    before_call("remove", id);
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = entities_.find(id);
    if (it == entities_.end() || it->second.table != table) {
        throw engine_error(error_code::not_found, id + " not found");
    }
    entity removed = it->second;
    entities_.erase(it);
    removed.version = ++last_version_;
    emit_locked(change_type::remove, removed, std::nullopt);
}

std::unique_ptr<change_subscription> mock_remote_store::subscribe_changes(const std::string& table) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        ++calls_["subscribe"];
        if (subscribe_failures_ > 0) {
            --subscribe_failures_;
            throw engine_error(subscribe_failure_code_, "subscribe to " + table + " failed");
        }
    }
    auto sub = std::make_unique<channel_subscription>();
    std::lock_guard<std::mutex> lock(mutex_);
    subscribers_.emplace_back(table, sub->sink());
    return sub;
}

void mock_remote_store::emit_locked(change_type type, const entity& value, const std::optional<entity>& previous) {
    if (!emit_changes_) return;
    change_event e;
    e.type = type;
    e.value = value;
    e.previous = previous;
    e.committed_at = clock_->now();
    for (const auto& [table, weak] : subscribers_) {
        if (table != value.table) continue;
        if (auto sink = weak.lock()) sink->send(feed_message::of(e));
    }
}

void mock_remote_store::seed(const entity& e) {
    std::lock_guard<std::mutex> lock(mutex_);
    entities_[e.id] = e;
    if (e.version > last_version_) last_version_ = e.version;
}

std::optional<entity> mock_remote_store::stored(const entity_id& id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = entities_.find(id);
    if (it == entities_.end()) return std::nullopt;
    return it->second;
}

void mock_remote_store::fail_on(const entity_id& id, error_code code, std::string message) {
    std::lock_guard<std::mutex> lock(mutex_);
    id_failures_[id] = failure{code, std::move(message)};
}

void mock_remote_store::clear_failure(const entity_id& id) {
    std::lock_guard<std::mutex> lock(mutex_);
    id_failures_.erase(id);
}

void mock_remote_store::fail_next(error_code code, std::string message, size_t count) {
    std::lock_guard<std::mutex> lock(mutex_);
    next_failure_ = failure{code, std::move(message)};
    next_failure_count_ = count;
}

void mock_remote_store::fail_subscriptions(size_t count, error_code code) {
    std::lock_guard<std::mutex> lock(mutex_);
    subscribe_failures_ = count;
    subscribe_failure_code_ = code;
}

void mock_remote_store::set_latency(std::chrono::milliseconds latency) {
    std::lock_guard<std::mutex> lock(mutex_);
    latency_ = latency;
}

void mock_remote_store::set_emit_changes(bool emit) {
    std::lock_guard<std::mutex> lock(mutex_);
    emit_changes_ = emit;
}

void mock_remote_store::push(const change_event& e) {
    std::lock_guard<std::mutex> lock(mutex_);
    for (const auto& [table, weak] : subscribers_) {
        if (table != e.value.table) continue;
        if (auto sink = weak.lock()) sink->send(feed_message::of(e));
    }
}

void mock_remote_store::drop_connections(const std::string& reason, feed_message::kind kind) {
    std::lock_guard<std::mutex> lock(mutex_);
    LOG_DEBUG("store", "Dropping %zu subscription(s): %s", subscribers_.size(), reason.c_str());
    for (const auto& [_, weak] : subscribers_) {
        if (auto sink = weak.lock()) sink->send(feed_message::failure(kind, reason));
    }
}

size_t mock_remote_store::calls(const std::string& operation) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = calls_.find(operation);
    return it == calls_.end() ? 0 : it->second;
}

size_t mock_remote_store::subscriber_count(const std::string& table) const {
    std::lock_guard<std::mutex> lock(mutex_);
    size_t count = 0;
    for (const auto& [t, weak] : subscribers_) {
        auto sink = weak.lock();
        if (t == table && sink && !sink->is_closed()) ++count;
    }
    return count;
}

} // namespace cohere
