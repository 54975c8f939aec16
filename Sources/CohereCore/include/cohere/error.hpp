#pragma once

#ifdef __cplusplus

#include <stdexcept>
#include <string>

namespace cohere {

// ============================================================================
// error_code - Failure taxonomy shared by the remote interface and the engine
// ============================================================================

enum class error_code : int {
    not_found = 1,
    validation = 2,        // remote rejected the payload
    timeout = 3,
    network = 4,           // transient, retryable
    conflict = 5,          // version mismatch
    expired = 6,           // undo window passed
    already_resolved = 7,
    cancelled = 8,
    invalid_argument = 9,
    shut_down = 10,
    storage = 11
};

inline const char* to_string(error_code code) {
    switch (code) {
        case error_code::not_found: return "not_found";
        case error_code::validation: return "validation";
        case error_code::timeout: return "timeout";
        case error_code::network: return "network";
        case error_code::conflict: return "conflict";
        case error_code::expired: return "expired";
        case error_code::already_resolved: return "already_resolved";
        case error_code::cancelled: return "cancelled";
        case error_code::invalid_argument: return "invalid_argument";
        case error_code::shut_down: return "shut_down";
        case error_code::storage: return "storage";
    }
    return "unknown";
}

class engine_error : public std::runtime_error {
public:
    engine_error(error_code code, const std::string& message)
        : std::runtime_error(message), code_(code) {}

    [[nodiscard]] error_code code() const noexcept { return code_; }

    /// Transient failures worth retrying.
    [[nodiscard]] bool retryable() const noexcept {
        return code_ == error_code::network || code_ == error_code::timeout;
    }

private:
    error_code code_;
};

/// Raised by the SQLite layer.
class db_error : public engine_error {
public:
    explicit db_error(const std::string& message)
        : engine_error(error_code::storage, message) {}
};

} // namespace cohere

#endif // __cplusplus
