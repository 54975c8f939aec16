#include "cohere/remote.hpp"
#include <algorithm>

namespace cohere {

std::vector<entity> apply_query(std::vector<entity> entities, const collection_query& query) {
    std::vector<entity> selected;
    selected.reserve(entities.size());
    for (auto& e : entities) {
        if (e.table == query.table && query.filter.matches(e)) {
            selected.push_back(std::move(e));
        }
    }

    if (query.order) {
        const auto& field = query.order->field;
        bool descending = query.order->descending;
        std::stable_sort(selected.begin(), selected.end(), [&](const entity& a, const entity& b) {
            static const nlohmann::json missing;
            const auto& va = a.fields.contains(field) ? a.fields[field] : missing;
            const auto& vb = b.fields.contains(field) ? b.fields[field] : missing;
            return descending ? vb < va : va < vb;
        });
    }

    if (query.offset >= selected.size()) return {};
    auto first = selected.begin() + static_cast<std::ptrdiff_t>(query.offset);
    auto last = selected.end();
    if (query.limit && *query.limit < static_cast<size_t>(last - first)) {
        last = first + static_cast<std::ptrdiff_t>(*query.limit);
    }
    return {std::make_move_iterator(first), std::make_move_iterator(last)};
}

nlohmann::json change_event::to_json() const {
    nlohmann::json j{
        {"type", to_string(type)},
        {"entity", value.to_json()},
        {"committed_at", to_millis(committed_at)}
    };
    if (previous) {
        j["previous"] = previous->to_json();
    }
    return j;
}

std::optional<change_event> change_event::from_json(const nlohmann::json& j) {
    if (!j.is_object() || !j.contains("type") || !j["type"].is_string()) return std::nullopt;
    auto type = parse_change_type(j["type"].get<std::string>());
    if (!type || !j.contains("entity")) return std::nullopt;
    auto value = entity::from_json(j["entity"]);
    if (!value) return std::nullopt;

    change_event e;
    e.type = *type;
    e.value = std::move(*value);
    if (j.contains("previous") && !j["previous"].is_null()) {
        auto previous = entity::from_json(j["previous"]);
        if (!previous) return std::nullopt;
        e.previous = std::move(*previous);
    }
    if (j.contains("committed_at") && j["committed_at"].is_number_integer()) {
        e.committed_at = from_millis(j["committed_at"].get<int64_t>());
    }
    return e;
}

} // namespace cohere
