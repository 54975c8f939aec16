#include "cohere/scheduler.hpp"
#include "cohere/log.hpp"
#include <algorithm>
#include <exception>

namespace cohere {

thread_pool_scheduler::thread_pool_scheduler(size_t workers) : running_(true) {
    size_t count = std::max<size_t>(workers, 1);
    workers_.reserve(count);
    for (size_t i = 0; i < count; ++i) {
        workers_.emplace_back([this] { run_loop(); });
    }
}

thread_pool_scheduler::~thread_pool_scheduler() {
    shutdown();
}

void thread_pool_scheduler::shutdown() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        running_ = false;
    }
    cv_.notify_all();
    for (auto& worker : workers_) {
        if (worker.joinable() && worker.get_id() != std::this_thread::get_id()) {
            worker.join();
        }
    }
}

void thread_pool_scheduler::invoke(std::function<void()>&& fn) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!running_) {
            LOG_WARN("scheduler", "Dropping work submitted after shutdown");
            return;
        }
        queue_.push(std::move(fn));
    }
    cv_.notify_one();
}

bool thread_pool_scheduler::is_on_thread() const noexcept {
    auto self = std::this_thread::get_id();
    for (const auto& worker : workers_) {
        if (worker.get_id() == self) return true;
    }
    return false;
}

void thread_pool_scheduler::run_loop() {
    while (true) {
        std::function<void()> fn;
        {
            std::unique_lock<std::mutex> lock(mutex_);
            cv_.wait(lock, [this] { return !queue_.empty() || !running_; });

            if (!running_ && queue_.empty()) {
                return;
            }

            fn = std::move(queue_.front());
            queue_.pop();
        }

        if (fn) {
            try {
                fn();
            } catch (const std::exception& e) {
                LOG_ERROR("scheduler", "Work item threw: %s", e.what());
            }
        }
    }
}

} // namespace cohere
