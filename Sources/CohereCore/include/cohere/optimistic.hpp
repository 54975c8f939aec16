#pragma once

#ifdef __cplusplus

#include "entity_cache.hpp"
#include "remote.hpp"
#include "scheduler.hpp"
#include "config.hpp"
#include <atomic>
#include <functional>
#include <memory>
#include <mutex>
#include <stop_token>
#include <unordered_map>

namespace cohere {

struct mutation_options {
    /// Overrides mutation_config::timeout when non-zero
    std::chrono::milliseconds timeout{0};
    /// A stop request makes mutate() report cancelled once the write settled.
    /// It never interrupts the commit or rollback.
    std::stop_token stop;
};

// ============================================================================
// optimistic_coordinator - Speculative writes with commit or rollback
// ============================================================================
//
// mutate() publishes the speculative entity to the cache before the remote
// call starts and holds no cache lock while the call runs. Mutations on the
// same id run one after another; different ids proceed independently.
//
// Errors surface after the cache has been restored: the remote call's own
// engine_error, engine_error(timeout) when the timeout elapsed, or
// engine_error(conflict) when a remote delete cancelled the write.

class optimistic_coordinator {
public:
    /// Builds the speculative entity from the cached one (nullopt if absent).
    using transform_fn = std::function<entity(const std::optional<entity>&)>;
    /// Performs the remote write and returns the server's copy.
    using remote_fn = std::function<entity()>;

    optimistic_coordinator(cache_handle cache, std::shared_ptr<remote_store> remote,
                           mutation_config config = {}, shared_scheduler remote_workers = nullptr);

    optimistic_coordinator(const optimistic_coordinator&) = delete;
    optimistic_coordinator& operator=(const optimistic_coordinator&) = delete;

    entity mutate(const entity_id& id, const transform_fn& transform, const remote_fn& remote_call,
                  const mutation_options& options = {});

    /// Merge-patches the cached copy, then remote_store::update.
    entity update(const std::string& table, const entity_id& id, const nlohmann::json& patch,
                  const mutation_options& options = {});

    /// Publishes under a provisional "local-" id until the remote assigns one.
    entity create(const std::string& table, const nlohmann::json& payload, const mutation_options& options = {});

    /// Re-creates a deleted entity under its original id.
    entity restore(const entity& snapshot, const mutation_options& options = {});

    /// Pushes `desired` as the new state of an existing entity.
    entity push(const entity& desired, const mutation_options& options = {});

    [[nodiscard]] size_t in_flight() const noexcept { return in_flight_.load(); }

    [[nodiscard]] const cache_handle& handle() const { return cache_; }

private:
    struct id_lock {
        std::mutex mutex;
        size_t users = 0;
    };

    std::shared_ptr<id_lock> acquire(const entity_id& id);
    void release(const entity_id& id, const std::shared_ptr<id_lock>& lock);

    entity call_remote(const remote_fn& remote_call, std::chrono::milliseconds timeout);

    cache_handle cache_;
    std::shared_ptr<remote_store> remote_;
    mutation_config config_;
    shared_scheduler remote_workers_;

    std::mutex locks_mutex_;
    std::unordered_map<entity_id, std::shared_ptr<id_lock>> locks_;
    std::atomic<size_t> in_flight_{0};
};

} // namespace cohere

#endif // __cplusplus
