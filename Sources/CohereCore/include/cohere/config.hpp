#pragma once

#ifdef __cplusplus

#include "log.hpp"
#include <nlohmann/json.hpp>
#include <chrono>
#include <cstddef>
#include <optional>
#include <string>

namespace cohere {

// ============================================================================
// Component configuration
// ============================================================================

struct batch_config {
    size_t batch_size = 50;
    /// Pause between chunks, to ease load on the remote
    std::chrono::milliseconds inter_batch_delay{0};
    /// Threads running the items of one chunk concurrently
    size_t workers = 8;
    size_t fetch_batch_size = 100;
    /// Patch applied by soft deletes
    nlohmann::json soft_delete_patch = {{"status", "inactive"}};
};

struct mutation_config {
    /// Remote call timeout; zero waits indefinitely
    std::chrono::milliseconds timeout{0};
    /// Threads running remote calls that carry a timeout
    size_t remote_workers = 4;
};

struct feed_config {
    std::chrono::milliseconds base_delay{1000};
    std::chrono::milliseconds max_delay{30000};
    size_t max_attempts = 5;
    /// How long one loop iteration waits for the next message
    std::chrono::milliseconds poll_interval{100};
};

struct staleness_config {
    /// Minimum gap between two focus-triggered refreshes of one scope
    std::chrono::milliseconds focus_throttle{std::chrono::minutes(5)};
    /// Detail entries older than this are evicted when their scope is left
    std::chrono::milliseconds detail_retention{std::chrono::minutes(5)};
    std::chrono::milliseconds stale_time{std::chrono::seconds(60)};
    std::chrono::milliseconds sync_interval{std::chrono::seconds(30)};
    std::chrono::milliseconds default_max_age{std::chrono::minutes(5)};
    std::chrono::milliseconds detail_max_age{std::chrono::minutes(10)};
};

struct undo_config {
    std::chrono::milliseconds ttl{std::chrono::minutes(5)};
};

// ============================================================================
// engine_config - Everything the engine reads at construction
// ============================================================================
//
// JSON form uses the member names as keys with durations as "<name>_ms"
// integers, e.g. {"feed": {"base_delay_ms": 500}, "log_level": "info"}.
// Absent keys keep their defaults.

struct engine_config {
    batch_config batch;
    mutation_config mutation;
    feed_config feed;
    staleness_config staleness;
    undo_config undo;
    log_level level = log_level::warn;

    nlohmann::json to_json() const;

    /// nullopt when the document is not JSON or a key has the wrong type.
    static std::optional<engine_config> from_json(const std::string& text);
    static std::optional<engine_config> from_document(const nlohmann::json& j);
};

} // namespace cohere

#endif // __cplusplus
