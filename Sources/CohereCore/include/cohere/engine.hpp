#pragma once

#ifdef __cplusplus

#include "config.hpp"
#include "entity_cache.hpp"
#include "remote.hpp"
#include "optimistic.hpp"
#include "batch.hpp"
#include "conflict.hpp"
#include "reconciler.hpp"
#include "staleness.hpp"
#include "query.hpp"
#include "undo.hpp"
#include <map>
#include <memory>
#include <mutex>

namespace cohere {

// ============================================================================
// engine - Wires every component around one cache handle
// ============================================================================

class engine {
public:
    /// `dispatch` delivers observer notifications; immediate when null.
    explicit engine(std::shared_ptr<remote_store> remote, engine_config config = {},
                    shared_clock clk = make_system_clock(), shared_scheduler dispatch = nullptr);
    ~engine();

    engine(const engine&) = delete;
    engine& operator=(const engine&) = delete;

    [[nodiscard]] const cache_handle& handle() const { return cache_; }
    [[nodiscard]] entity_cache& cache() const { return cache_.cache(); }
    [[nodiscard]] optimistic_coordinator& coordinator() { return *coordinator_; }
    [[nodiscard]] batch_executor& batches() { return *batches_; }
    [[nodiscard]] conflict_store& conflicts() { return *conflicts_; }
    [[nodiscard]] conflict_resolver& resolver() { return *resolver_; }
    [[nodiscard]] query_service& queries() { return *queries_; }
    [[nodiscard]] staleness_policy& staleness() { return *staleness_; }
    [[nodiscard]] undo_journal& undo() { return *undo_; }
    [[nodiscard]] const engine_config& config() const { return config_; }

    /// Creates (or returns) the reconciler for `table` and connects it.
    /// With `run_loop` the feed is consumed on its own thread.
    change_reconciler& watch(const std::string& table, bool run_loop = true);

    [[nodiscard]] change_reconciler* reconciler(const std::string& table);

    /// Asks the staleness policy what to do and does it. Returns the number
    /// of commands carried out.
    size_t on_context_transition(const context_transition& transition);

    /// Stops every feed loop, then drains in-flight mutations and clears the
    /// cache. Idempotent.
    void shutdown();

private:
    engine_config config_;
    shared_clock clock_;
    shared_scheduler dispatch_;
    std::shared_ptr<remote_store> remote_;
    cache_handle cache_;
    std::shared_ptr<conflict_store> conflicts_;
    std::unique_ptr<undo_journal> undo_;
    std::unique_ptr<optimistic_coordinator> coordinator_;
    std::unique_ptr<batch_executor> batches_;
    std::unique_ptr<conflict_resolver> resolver_;
    std::unique_ptr<query_service> queries_;
    std::unique_ptr<staleness_policy> staleness_;

    std::mutex reconcilers_mutex_;
    std::map<std::string, std::unique_ptr<change_reconciler>> reconcilers_;
    bool shut_down_ = false;
};

} // namespace cohere

#endif // __cplusplus
