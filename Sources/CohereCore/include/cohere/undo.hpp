#pragma once

#ifdef __cplusplus

#include "types.hpp"
#include "clock.hpp"
#include "config.hpp"
#include <functional>
#include <map>
#include <mutex>

namespace cohere {

// ============================================================================
// undo_journal - Time-boxed recovery for destructive operations
// ============================================================================

struct undo_record {
    std::string id;
    std::string action;
    /// Entities as they were before the operation
    std::vector<entity> snapshots;
    timestamp_t created_at{};
    timestamp_t expires_at{};
};

class undo_journal {
public:
    using reverse_fn = std::function<void(const std::vector<entity>&)>;

    explicit undo_journal(shared_clock clk = make_system_clock(), undo_config config = {});

    /// Returns the undo id. `ttl` overrides undo_config::ttl.
    std::string record(std::string action, std::vector<entity> snapshots, reverse_fn reverse,
                       std::optional<std::chrono::milliseconds> ttl = std::nullopt);

    /// Runs the reverse action and consumes the record. Throws
    /// engine_error(not_found) for unknown ids and engine_error(expired) once
    /// the window passed. A failing reverse action leaves the record in place.
    void execute(const std::string& undo_id);

    bool discard(const std::string& undo_id);

    size_t purge_expired();

    [[nodiscard]] std::vector<undo_record> active() const;

private:
    struct slot {
        undo_record record;
        reverse_fn reverse;
    };

    shared_clock clock_;
    undo_config config_;
    mutable std::mutex mutex_;
    std::map<std::string, slot> records_;
};

} // namespace cohere

#endif // __cplusplus
