#include "cohere/query.hpp"
#include "cohere/error.hpp"
#include "cohere/log.hpp"
#include <algorithm>

namespace cohere {

query_service::query_service(cache_handle cache, std::shared_ptr<remote_store> remote)
    : cache_(std::move(cache)), remote_(std::move(remote)) {
    if (!remote_) {
        throw engine_error(error_code::invalid_argument, "query_service requires a remote store");
    }
}

void query_service::register_view(const view_key& key, const std::vector<view_key>& also_invalidates) {
    cache_->register_view(key, also_invalidates);
}

collection_view query_service::read(const view_key& key) {
    if (auto cached = cache_->get_view(key)) {
        return *cached;
    }
    return refetch(key);
}

std::vector<entity> query_service::read_entities(const view_key& key) {
    auto view = read(key);
    std::vector<entity> members;
    members.reserve(view.ids.size());
    for (const auto& id : view.ids) {
        if (auto e = cache_->get(id)) members.push_back(std::move(*e));
    }
    return members;
}

collection_view query_service::refetch(const view_key& key) {
    collection_query query;
    query.table = table_of(key);
    std::visit([&](const auto& v) {
        using T = std::decay_t<decltype(v)>;
        if constexpr (std::is_same_v<T, list_view>) {
            query.filter = v.filter;
            query.order = v.order;
            query.limit = v.limit;
            query.offset = v.offset;
        } else if constexpr (std::is_same_v<T, count_view>) {
            query.filter = v.filter;
        }
    }, key);

    auto fetched = remote_->fetch_collection(query);
    ++fetches_;

    collection_view view;
    nlohmann::json groups = nlohmann::json::object();
    const auto* count = std::get_if<count_view>(&key);
    size_t total = 0;

    for (const auto& e : fetched) {
        if (!view_matches(key, e)) continue;
        cache_->put(e);
        view.ids.push_back(e.id);
        // A member cached at a newer version must not invalidate the view at once.
        version_t seen = e.version;
        if (auto cached = cache_->entry(e.id); cached && cached->value.version > seen) {
            seen = cached->value.version;
        }
        view.version_token = std::max(view.version_token, seen);
        ++total;
        if (count && count->group_by) {
            auto name = e.fields.contains(*count->group_by) ? field_text(e.fields[*count->group_by]) : "null";
            groups[name] = groups.value(name, 0) + 1;
        }
    }

    if (count) {
        view.aggregate = nlohmann::json{{"total", total}};
        if (count->group_by) view.aggregate["groups"] = groups;
    }

    LOG_DEBUG("query", "Fetched %s: %zu member(s)", describe(key).c_str(), view.ids.size());
    cache_->put_view(key, view);
    return cache_->get_view(key).value_or(view);
}

std::optional<entity> query_service::read_entity(const std::string& table, const entity_id& id) {
    if (auto cached = cache_->entry(id); cached && cached->state != entry_state::stale) {
        return cached->value;
    }
    return refresh_entity(table, id);
}

std::optional<entity> query_service::refresh_entity(const std::string& table, const entity_id& id) {
    try {
        auto fetched = remote_->fetch_one(table, id);
        cache_->put(fetched);
        return cache_->get(id);
    } catch (const engine_error& e) {
        if (e.code() != error_code::not_found) throw;
        if (!cache_->is_in_flight(id)) {
            cache_->remove(id);
        }
        LOG_DEBUG("query", "%s/%s no longer exists", table.c_str(), id.c_str());
        return std::nullopt;
    }
}

size_t query_service::execute(const std::vector<cache_command>& commands) {
    size_t ran = 0;
    for (const auto& command : commands) {
        try {
            switch (command.kind) {
                case command_kind::refetch_view:
                    if (!command.view) continue;
                    refetch(*command.view);
                    break;
                case command_kind::refresh_entity:
                    refresh_entity(command.table, command.id);
                    break;
                case command_kind::evict_view:
                    if (!command.view) continue;
                    cache_->evict_view(*command.view);
                    break;
                case command_kind::evict_entity:
                    cache_->evict(command.id);
                    break;
                case command_kind::reconnect_feed:
                    continue;
            }
            ++ran;
        } catch (const engine_error& e) {
            LOG_WARN("query", "%s failed: %s", to_string(command.kind), e.what());
        }
    }
    return ran;
}

} // namespace cohere
