#include "cohere/view.hpp"
#include <algorithm>
#include <cctype>
#include <deque>
#include <sstream>

namespace cohere {

namespace {

std::string lowercase(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });
    return s;
}

bool search_matches(const search_view& view, const entity& e) {
    if (view.text.empty()) return true;
    auto needle = lowercase(view.text);
    auto contains_needle = [&](const nlohmann::json& value) {
        return value.is_string() && lowercase(value.get<std::string>()).find(needle) != std::string::npos;
    };
    if (view.fields.empty()) {
        for (auto it = e.fields.begin(); it != e.fields.end(); ++it) {
            if (contains_needle(it.value())) return true;
        }
        return false;
    }
    for (const auto& field : view.fields) {
        if (e.fields.contains(field) && contains_needle(e.fields[field])) return true;
    }
    return false;
}

void describe_filter(std::ostringstream& out, const collection_filter& filter) {
    for (const auto& [field, value] : filter.equals) {
        out << ", " << field << "=" << value;
    }
}

bool intersects(const std::set<std::string>& a, const std::set<std::string>& b) {
    for (const auto& name : a) {
        if (b.count(name)) return true;
    }
    return false;
}

} // namespace

bool collection_filter::matches(const entity& e) const {
    for (const auto& [field, expected] : equals) {
        if (!e.fields.contains(field)) return false;
        if (field_text(e.fields[field]) != expected) return false;
    }
    return true;
}

std::set<std::string> collection_filter::fields() const {
    std::set<std::string> names;
    for (const auto& [field, _] : equals) {
        names.insert(field);
    }
    return names;
}

bool collection_view::contains(const entity_id& id) const {
    return std::find(ids.begin(), ids.end(), id) != ids.end();
}

const std::string& table_of(const view_key& key) {
    return std::visit([](const auto& v) -> const std::string& { return v.table; }, key);
}

std::string describe(const view_key& key) {
    std::ostringstream out;
    std::visit([&](const auto& v) {
        using T = std::decay_t<decltype(v)>;
        if constexpr (std::is_same_v<T, list_view>) {
            out << "list(" << v.table;
            describe_filter(out, v.filter);
            if (v.order) out << ", order=" << v.order->field << (v.order->descending ? " desc" : " asc");
            if (v.limit) out << ", limit=" << *v.limit;
            if (v.offset) out << ", offset=" << v.offset;
            out << ")";
        } else if constexpr (std::is_same_v<T, count_view>) {
            out << "count(" << v.table;
            describe_filter(out, v.filter);
            if (v.group_by) out << ", by=" << *v.group_by;
            out << ")";
        } else {
            out << "search(" << v.table << ", \"" << v.text << "\")";
        }
    }, key);
    return out.str();
}

bool view_matches(const view_key& key, const entity& e) {
    return std::visit([&](const auto& v) -> bool {
        using T = std::decay_t<decltype(v)>;
        if (v.table != e.table) return false;
        if constexpr (std::is_same_v<T, search_view>) {
            return search_matches(v, e);
        } else {
            return v.filter.matches(e);
        }
    }, key);
}

bool view_affected(const view_key& key, const change_scope& change) {
    if (table_of(key) != change.table) return false;

    switch (change.type) {
        case change_type::insert:
            return change.after ? view_matches(key, *change.after) : true;
        case change_type::remove:
            return change.before ? view_matches(key, *change.before) : true;
        case change_type::update:
            break;
    }

    if (!change.fields) return true;
    if (change.fields->empty()) return false;

    return std::visit([&](const auto& v) -> bool {
        using T = std::decay_t<decltype(v)>;
        if constexpr (std::is_same_v<T, list_view>) {
            auto sensitive = v.filter.fields();
            if (v.order) sensitive.insert(v.order->field);
            return intersects(*change.fields, sensitive);
        } else if constexpr (std::is_same_v<T, count_view>) {
            auto sensitive = v.filter.fields();
            if (v.group_by) sensitive.insert(*v.group_by);
            return intersects(*change.fields, sensitive);
        } else {
            if (v.fields.empty()) return true;
            return intersects(*change.fields, std::set<std::string>(v.fields.begin(), v.fields.end()));
        }
    }, key);
}

void view_registry::register_view(const view_key& key, const std::vector<view_key>& also_invalidates) {
    auto& targets = relation_[key];
    for (const auto& other : also_invalidates) {
        if (other == key) continue;
        targets.insert(other);
        relation_.try_emplace(other);
    }
}

bool view_registry::is_registered(const view_key& key) const {
    return relation_.count(key) != 0;
}

std::set<view_key> view_registry::closure(const view_key& key) const {
    std::set<view_key> seen{key};
    std::deque<view_key> pending{key};
    while (!pending.empty()) {
        auto current = std::move(pending.front());
        pending.pop_front();
        auto it = relation_.find(current);
        if (it == relation_.end()) continue;
        for (const auto& next : it->second) {
            if (seen.insert(next).second) {
                pending.push_back(next);
            }
        }
    }
    return seen;
}

std::set<view_key> view_registry::affected_by(const change_scope& change) const {
    std::set<view_key> result;
    for (const auto& [key, _] : relation_) {
        if (result.count(key)) continue;
        if (view_affected(key, change)) {
            auto reach = closure(key);
            result.insert(reach.begin(), reach.end());
        }
    }
    return result;
}

std::vector<view_key> view_registry::views_for_table(const std::string& table) const {
    std::vector<view_key> keys;
    for (const auto& [key, _] : relation_) {
        if (table_of(key) == table) keys.push_back(key);
    }
    return keys;
}

} // namespace cohere
