#pragma once

#ifdef __cplusplus

#include "types.hpp"

namespace cohere {

// ============================================================================
// Version ordering
// ============================================================================
//
// The one place where two versions of the same entity are compared. The
// cache, the reconciler and the conflict resolver all go through here.
// Equal versions arriving from the local and the remote side are settled
// in favour of the remote copy.

enum class version_order {
    older,
    same,
    newer
};

/// Orders `incoming` relative to `current`.
constexpr version_order compare_versions(version_t incoming, version_t current) noexcept {
    if (incoming < current) return version_order::older;
    if (incoming > current) return version_order::newer;
    return version_order::same;
}

/// True when `incoming` must not replace a confirmed copy at `current`.
constexpr bool is_stale(version_t incoming, version_t current) noexcept {
    return compare_versions(incoming, current) == version_order::older;
}

/// True when the remote copy should win over the local one.
inline bool remote_prevails(const entity& local, const entity& remote) noexcept {
    return compare_versions(remote.version, local.version) != version_order::older;
}

} // namespace cohere

#endif // __cplusplus
