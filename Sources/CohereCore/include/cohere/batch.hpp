#pragma once

#ifdef __cplusplus

#include "entity_cache.hpp"
#include "remote.hpp"
#include "scheduler.hpp"
#include "channel.hpp"
#include "config.hpp"
#include "error.hpp"
#include <functional>
#include <memory>
#include <stop_token>

namespace cohere {

class optimistic_coordinator;
class undo_journal;

// ============================================================================
// Batch job types
// ============================================================================

enum class mutation_kind {
    create,
    update,
    remove
};

inline const char* to_string(mutation_kind kind) {
    switch (kind) {
        case mutation_kind::create: return "create";
        case mutation_kind::update: return "update";
        case mutation_kind::remove: return "remove";
    }
    return "unknown";
}

struct mutation_request {
    mutation_kind kind = mutation_kind::update;
    std::string table;
    /// Target id; for creates only a label reported on failure
    entity_id id;
    nlohmann::json payload = nlohmann::json::object();
    std::optional<version_t> expected_version;
};

struct batch_progress {
    size_t current = 0;
    size_t total = 0;
    double percentage = 0;
    size_t current_batch = 0;
    size_t total_batches = 0;
    /// Omitted until at least one item was processed
    std::optional<std::chrono::milliseconds> estimated_time_remaining;
    /// Items per second so far
    double processing_rate = 0;
};

struct failed_item {
    entity_id id;
    std::string error;
    std::optional<error_code> code;
};

struct batch_result {
    std::vector<entity_id> successful;
    std::vector<failed_item> failed;
    size_t total_processed = 0;
    size_t total_successful = 0;
    size_t total_failed = 0;
    /// A stop was requested and the remaining chunks were skipped
    bool cancelled = false;
    /// Set by hard bulk deletes
    std::optional<std::string> undo_id;
};

using progress_channel = channel<batch_progress>;

struct batch_options {
    /// Zero uses batch_config::batch_size
    size_t batch_size = 0;
    /// Receives one snapshot per finished chunk; closed when the run ends
    progress_channel* progress = nullptr;
    /// Checked between chunks; dispatched items always finish
    std::stop_token stop;
    std::optional<std::chrono::milliseconds> inter_batch_delay;
    /// Route creates and updates through the optimistic coordinator
    bool optimistic = false;
};

enum class delete_mode {
    hard,
    soft
};

struct fetch_result {
    /// In request order; ids that failed are absent
    std::vector<entity> entities;
    batch_result summary;
};

// ============================================================================
// batch_executor - Chunked bulk mutations with progress and partial failure
// ============================================================================
//
// Chunks run one after another; the items of a chunk run concurrently on the
// worker scheduler. One item's failure is recorded and never stops the rest.
// Only structural misuse (batch size zero) throws.

class batch_executor {
public:
    batch_executor(cache_handle cache, std::shared_ptr<remote_store> remote,
                   optimistic_coordinator* coordinator = nullptr, undo_journal* undo = nullptr,
                   batch_config config = {}, shared_scheduler workers = nullptr);

    batch_executor(const batch_executor&) = delete;
    batch_executor& operator=(const batch_executor&) = delete;

    batch_result run(const std::vector<mutation_request>& items, const batch_options& options);

    batch_result run(const std::vector<mutation_request>& items, size_t batch_size,
                     progress_channel* progress = nullptr);

    batch_result bulk_update(const std::string& table,
                             const std::vector<std::pair<entity_id, nlohmann::json>>& patches,
                             const batch_options& options = {});

    /// Sets one field to the same value on every id (e.g. a status change).
    batch_result bulk_set_field(const std::string& table, const std::vector<entity_id>& ids,
                                const std::string& field, const nlohmann::json& value,
                                const batch_options& options = {});

    /// Soft deletes apply batch_config::soft_delete_patch. Hard deletes record
    /// one undo entry covering every deleted entity.
    batch_result bulk_delete(const std::string& table, const std::vector<entity_id>& ids, delete_mode mode,
                             const batch_options& options = {});

    /// Batched reads, chunked by batch_config::fetch_batch_size unless the
    /// options name a size.
    fetch_result bulk_fetch(const std::string& table, const std::vector<entity_id>& ids,
                            const batch_options& options = {});

private:
    using item_fn = std::function<entity_id(size_t index)>;

    batch_result execute(const std::vector<entity_id>& labels, const item_fn& perform,
                         const batch_options& options, size_t default_batch_size);

    entity_id apply(const mutation_request& request, bool optimistic);

    cache_handle cache_;
    std::shared_ptr<remote_store> remote_;
    optimistic_coordinator* coordinator_;
    undo_journal* undo_;
    batch_config config_;
    shared_scheduler workers_;
};

} // namespace cohere

#endif // __cplusplus
