#pragma once

#ifdef __cplusplus

#include "entity_cache.hpp"
#include "remote.hpp"
#include "staleness.hpp"
#include <atomic>

namespace cohere {

// ============================================================================
// query_service - Read path: serves views and details from the cache
// ============================================================================
//
// Reads answer from the cache while it is valid and refetch otherwise.
// Fetched entities go through the cache's normal transition rules, so a
// refetch never overwrites an unconfirmed local write.

class query_service {
public:
    query_service(cache_handle cache, std::shared_ptr<remote_store> remote);

    void register_view(const view_key& key, const std::vector<view_key>& also_invalidates = {});

    collection_view read(const view_key& key);

    /// Members of `key` in view order, as currently cached.
    std::vector<entity> read_entities(const view_key& key);

    /// Fetches `key` from the remote regardless of the cached copy.
    collection_view refetch(const view_key& key);

    /// Cached copy unless missing or stale; nullopt when the remote has none.
    std::optional<entity> read_entity(const std::string& table, const entity_id& id);

    std::optional<entity> refresh_entity(const std::string& table, const entity_id& id);

    /// Runs view and entity commands; reconnect_feed is left to the caller.
    /// Returns how many commands ran. A failing refetch is logged and skipped.
    size_t execute(const std::vector<cache_command>& commands);

    /// Remote collection fetches issued so far.
    [[nodiscard]] size_t fetch_count() const noexcept { return fetches_.load(); }

private:
    cache_handle cache_;
    std::shared_ptr<remote_store> remote_;
    std::atomic<size_t> fetches_{0};
};

} // namespace cohere

#endif // __cplusplus
