#pragma once

#ifdef __cplusplus

#include <functional>
#include <memory>
#include <thread>
#include <mutex>
#include <queue>
#include <vector>
#include <condition_variable>
#include <atomic>

namespace cohere {

// ============================================================================
// Scheduler interface - where remote calls, chunk items and observer
// notifications run
// ============================================================================

struct scheduler {
    virtual ~scheduler() = default;

    // Run `fn` on this scheduler's execution context. Callable from any thread.
    virtual void invoke(std::function<void()>&& fn) = 0;

    // True when the caller already runs on this scheduler's context.
    [[nodiscard]] virtual bool is_on_thread() const noexcept = 0;

    // False once the scheduler stopped accepting work.
    [[nodiscard]] virtual bool can_invoke() const noexcept = 0;

    // Upper bound on work items running at the same time.
    [[nodiscard]] virtual size_t concurrency() const noexcept = 0;
};

using shared_scheduler = std::shared_ptr<scheduler>;

// ============================================================================
// Thread pool scheduler - fixed set of worker threads sharing one queue
// ============================================================================
//
// Destruction stops accepting work, lets queued work finish and joins.

class thread_pool_scheduler : public scheduler {
public:
    explicit thread_pool_scheduler(size_t workers);
    ~thread_pool_scheduler() override;

    thread_pool_scheduler(const thread_pool_scheduler&) = delete;
    thread_pool_scheduler& operator=(const thread_pool_scheduler&) = delete;

    void invoke(std::function<void()>&& fn) override;

    [[nodiscard]] bool is_on_thread() const noexcept override;

    [[nodiscard]] bool can_invoke() const noexcept override {
        return running_;
    }

    [[nodiscard]] size_t concurrency() const noexcept override {
        return workers_.size();
    }

    /// Stop accepting work and join the workers after the queue drains.
    void shutdown();

private:
    void run_loop();

    std::vector<std::thread> workers_;
    std::mutex mutex_;
    std::condition_variable cv_;
    std::queue<std::function<void()>> queue_;
    std::atomic<bool> running_;
};

// ============================================================================
// Immediate scheduler - runs work synchronously on the calling thread
// ============================================================================
//
// Deterministic ordering for tests and single-threaded hosts.

class immediate_scheduler : public scheduler {
public:
    void invoke(std::function<void()>&& fn) override {
        if (fn) fn();
    }

    [[nodiscard]] bool is_on_thread() const noexcept override {
        return true;
    }

    [[nodiscard]] bool can_invoke() const noexcept override {
        return true;
    }

    [[nodiscard]] size_t concurrency() const noexcept override {
        return 1;
    }
};

// ============================================================================
// Queued scheduler - work waits until the owning thread drains it
// ============================================================================
//
// For hosts with a UI/event loop: observers are notified from
// process_pending(), never from the engine's worker threads.

class queued_scheduler : public scheduler {
public:
    queued_scheduler() : owner_(std::this_thread::get_id()) {}

    void invoke(std::function<void()>&& fn) override {
        std::lock_guard<std::mutex> lock(mutex_);
        queue_.push(std::move(fn));
    }

    // Runs everything queued so far; returns how many items ran.
    size_t process_pending() {
        std::vector<std::function<void()>> pending;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            while (!queue_.empty()) {
                pending.push_back(std::move(queue_.front()));
                queue_.pop();
            }
        }
        for (auto& fn : pending) {
            if (fn) fn();
        }
        return pending.size();
    }

    [[nodiscard]] bool is_on_thread() const noexcept override {
        return std::this_thread::get_id() == owner_;
    }

    [[nodiscard]] bool can_invoke() const noexcept override {
        return true;
    }

    [[nodiscard]] size_t concurrency() const noexcept override {
        return 1;
    }

private:
    std::thread::id owner_;
    std::mutex mutex_;
    std::queue<std::function<void()>> queue_;
};

} // namespace cohere

#endif // __cplusplus
