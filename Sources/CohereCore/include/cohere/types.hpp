#pragma once

#ifdef __cplusplus

#include <nlohmann/json.hpp>
#include <cstdint>
#include <string>
#include <optional>
#include <vector>
#include <chrono>
#include <array>
#include <random>
#include <sstream>
#include <iomanip>

namespace cohere {

// Wall-clock time of cache fills, conflict detection and undo expiry
using timestamp_t = std::chrono::system_clock::time_point;

using entity_id = std::string;

// Monotonic per-store version (sequence number or last-write timestamp)
using version_t = int64_t;

// Identifies one in-flight optimistic write. Zero means "none".
using mutation_token = uint64_t;

// Random v4 UUID, used for conflict, undo and provisional entity ids
struct uuid_t {
    std::array<uint8_t, 16> bytes{};

    // Lowercase hyphenated form (e.g., "550e8400-e29b-41d4-a716-446655440000")
    std::string to_string() const {
        std::stringstream ss;
        ss << std::hex << std::setfill('0');
        for (size_t i = 0; i < 16; ++i) {
            if (i == 4 || i == 6 || i == 8 || i == 10) ss << '-';
            ss << std::setw(2) << static_cast<int>(bytes[i]);
        }
        return ss.str();
    }

    static uuid_t generate() {
        static thread_local std::random_device rd;
        static thread_local std::mt19937_64 gen(rd());
        static thread_local std::uniform_int_distribution<uint64_t> dis;

        uuid_t result;
        uint64_t a = dis(gen);
        uint64_t b = dis(gen);
        for (int i = 0; i < 8; ++i) {
            result.bytes[i] = static_cast<uint8_t>((a >> (56 - i * 8)) & 0xFF);
            result.bytes[8 + i] = static_cast<uint8_t>((b >> (56 - i * 8)) & 0xFF);
        }
        result.bytes[6] = (result.bytes[6] & 0x0F) | 0x40;  // Version 4
        result.bytes[8] = (result.bytes[8] & 0x3F) | 0x80;  // Variant 1
        return result;
    }
};

// ============================================================================
// entity - Opaque versioned record identified by id
// ============================================================================

struct entity {
    entity_id id;
    std::string table;
    version_t version = 0;
    nlohmann::json fields = nlohmann::json::object();

    bool operator==(const entity& other) const {
        return id == other.id && table == other.table &&
               version == other.version && fields == other.fields;
    }
    bool operator!=(const entity& other) const { return !(*this == other); }

    nlohmann::json to_json() const;
    static std::optional<entity> from_json(const nlohmann::json& j);
};

// ============================================================================
// entry_state - Lifecycle of a cache entry
// ============================================================================

enum class entry_state {
    confirmed,   // matches the remote store as of fetched_at
    optimistic,  // speculative local write awaiting confirmation
    stale,       // known to need a refetch before being trusted
    evicted      // reported for entries dropped by eviction
};

inline const char* to_string(entry_state state) {
    switch (state) {
        case entry_state::confirmed: return "confirmed";
        case entry_state::optimistic: return "optimistic";
        case entry_state::stale: return "stale";
        case entry_state::evicted: return "evicted";
    }
    return "unknown";
}

enum class change_type {
    insert,
    update,
    remove
};

inline const char* to_string(change_type type) {
    switch (type) {
        case change_type::insert: return "INSERT";
        case change_type::update: return "UPDATE";
        case change_type::remove: return "DELETE";
    }
    return "UNKNOWN";
}

std::optional<change_type> parse_change_type(const std::string& name);

/// Top-level field names whose values differ between two payloads.
std::vector<std::string> changed_fields(const nlohmann::json& before, const nlohmann::json& after);

/// Renders a field value the way collection filters compare it:
/// strings as-is, everything else as compact JSON.
std::string field_text(const nlohmann::json& value);

/// Milliseconds since the Unix epoch, the wire form of timestamp_t.
inline int64_t to_millis(timestamp_t t) {
    return std::chrono::duration_cast<std::chrono::milliseconds>(t.time_since_epoch()).count();
}

inline timestamp_t from_millis(int64_t ms) {
    return timestamp_t(std::chrono::milliseconds(ms));
}

} // namespace cohere

#endif // __cplusplus
