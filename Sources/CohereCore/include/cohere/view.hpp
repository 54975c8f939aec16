#pragma once

#ifdef __cplusplus

#include "types.hpp"
#include <map>
#include <set>
#include <string>
#include <tuple>
#include <variant>
#include <vector>

namespace cohere {

// ============================================================================
// collection_filter - Field equality predicates of a collection query
// ============================================================================

struct collection_filter {
    /// field name -> expected value, compared through field_text()
    std::map<std::string, std::string> equals;

    collection_filter() = default;
    collection_filter(std::initializer_list<std::pair<const std::string, std::string>> init)
        : equals(init) {}

    [[nodiscard]] bool matches(const entity& e) const;
    [[nodiscard]] std::set<std::string> fields() const;
    [[nodiscard]] bool empty() const { return equals.empty(); }

    bool operator==(const collection_filter& o) const { return equals == o.equals; }
    bool operator<(const collection_filter& o) const { return equals < o.equals; }
};

struct sort_order {
    std::string field;
    bool descending = false;

    bool operator==(const sort_order& o) const {
        return field == o.field && descending == o.descending;
    }
    bool operator<(const sort_order& o) const {
        return std::tie(field, descending) < std::tie(o.field, o.descending);
    }
};

// ============================================================================
// view_key - Typed identity of a cached collection query
// ============================================================================

/// Ordered, optionally paged list of entities matching a filter.
struct list_view {
    std::string table;
    collection_filter filter;
    std::optional<sort_order> order;
    std::optional<size_t> limit;
    size_t offset = 0;

    bool operator==(const list_view& o) const {
        return table == o.table && filter == o.filter && order == o.order &&
               limit == o.limit && offset == o.offset;
    }
    bool operator<(const list_view& o) const {
        return std::tie(table, filter, order, limit, offset) <
               std::tie(o.table, o.filter, o.order, o.limit, o.offset);
    }
};

/// Number of matching entities, optionally grouped by one field.
struct count_view {
    std::string table;
    collection_filter filter;
    std::optional<std::string> group_by;

    bool operator==(const count_view& o) const {
        return table == o.table && filter == o.filter && group_by == o.group_by;
    }
    bool operator<(const count_view& o) const {
        return std::tie(table, filter, group_by) < std::tie(o.table, o.filter, o.group_by);
    }
};

/// Free-text search; an empty field list searches every string field.
struct search_view {
    std::string table;
    std::string text;
    std::vector<std::string> fields;

    bool operator==(const search_view& o) const {
        return table == o.table && text == o.text && fields == o.fields;
    }
    bool operator<(const search_view& o) const {
        return std::tie(table, text, fields) < std::tie(o.table, o.text, o.fields);
    }
};

using view_key = std::variant<list_view, count_view, search_view>;

const std::string& table_of(const view_key& key);

/// Short human-readable form for logs.
std::string describe(const view_key& key);

/// True when `e` belongs to the member set `key` selects.
bool view_matches(const view_key& key, const entity& e);

// ============================================================================
// collection_view - Captured result of a view_key
// ============================================================================

struct collection_view {
    std::vector<entity_id> ids;
    /// Highest member version when captured. A member cached at a higher
    /// version makes the view invalid.
    version_t version_token = 0;
    /// Aggregates of count views: {"total": n, "groups": {value: n}}
    nlohmann::json aggregate = nlohmann::json::object();
    timestamp_t captured_at{};
    /// Refreshes delivered after the first capture.
    uint64_t update_count = 0;

    [[nodiscard]] bool contains(const entity_id& id) const;
};

// ============================================================================
// change_scope - What one entity write touched
// ============================================================================

struct change_scope {
    change_type type = change_type::update;
    std::string table;
    entity_id id;
    std::optional<entity> before;
    std::optional<entity> after;
    /// nullopt when the changed fields are unknown (treated as "all fields")
    std::optional<std::set<std::string>> fields;
};

/// Whether a change could alter the member set, ordering or aggregate of `key`.
bool view_affected(const view_key& key, const change_scope& change);

// ============================================================================
// view_registry - Known views and the Invalidates relation between them
// ============================================================================

class view_registry {
public:
    /// Registers `key`. Invalidating `key` also invalidates every view in
    /// `also_invalidates`, transitively through their own registrations.
    void register_view(const view_key& key, const std::vector<view_key>& also_invalidates = {});

    [[nodiscard]] bool is_registered(const view_key& key) const;

    /// `key` plus its transitive Invalidates closure.
    [[nodiscard]] std::set<view_key> closure(const view_key& key) const;

    /// Every registered view `change` could affect, closure included.
    [[nodiscard]] std::set<view_key> affected_by(const change_scope& change) const;

    [[nodiscard]] std::vector<view_key> views_for_table(const std::string& table) const;

    [[nodiscard]] size_t size() const { return relation_.size(); }

    void clear() { relation_.clear(); }

private:
    std::map<view_key, std::set<view_key>> relation_;
};

} // namespace cohere

#endif // __cplusplus
