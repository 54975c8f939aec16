#pragma once

#ifdef __cplusplus

#include "types.hpp"
#include <memory>
#include <mutex>

namespace cohere {

// ============================================================================
// clock_source - Source of wall-clock time for ages, expiry and backoff deadlines
// ============================================================================

struct clock_source {
    virtual ~clock_source() = default;
    [[nodiscard]] virtual timestamp_t now() const = 0;
};

class system_clock_source : public clock_source {
public:
    [[nodiscard]] timestamp_t now() const override {
        return std::chrono::system_clock::now();
    }
};

// Time only moves when told to. Used by tests to step through expiry,
// throttling and reconnect schedules.
class manual_clock : public clock_source {
public:
    explicit manual_clock(timestamp_t start = from_millis(1'700'000'000'000)) : now_(start) {}

    [[nodiscard]] timestamp_t now() const override {
        std::lock_guard<std::mutex> lock(mutex_);
        return now_;
    }

    template<typename Rep, typename Period>
    void advance(std::chrono::duration<Rep, Period> by) {
        std::lock_guard<std::mutex> lock(mutex_);
        now_ += std::chrono::duration_cast<timestamp_t::duration>(by);
    }

    void set(timestamp_t t) {
        std::lock_guard<std::mutex> lock(mutex_);
        now_ = t;
    }

private:
    mutable std::mutex mutex_;
    timestamp_t now_;
};

using shared_clock = std::shared_ptr<clock_source>;

inline shared_clock make_system_clock() {
    return std::make_shared<system_clock_source>();
}

} // namespace cohere

#endif // __cplusplus
