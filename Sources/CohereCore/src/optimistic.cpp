#include "cohere/optimistic.hpp"
#include "cohere/error.hpp"
#include "cohere/log.hpp"
#include <algorithm>
#include <future>

namespace cohere {

optimistic_coordinator::optimistic_coordinator(cache_handle cache, std::shared_ptr<remote_store> remote,
                                               mutation_config config, shared_scheduler remote_workers)
    : cache_(std::move(cache)), remote_(std::move(remote)), config_(config),
      remote_workers_(std::move(remote_workers)) {
    if (!remote_) {
        throw engine_error(error_code::invalid_argument, "optimistic_coordinator requires a remote store");
    }
    if (!remote_workers_) {
        remote_workers_ = std::make_shared<thread_pool_scheduler>(std::max<size_t>(1, config_.remote_workers));
    }
}

std::shared_ptr<optimistic_coordinator::id_lock> optimistic_coordinator::acquire(const entity_id& id) {
    std::shared_ptr<id_lock> lock;
    {
        std::lock_guard<std::mutex> guard(locks_mutex_);
        auto& slot = locks_[id];
        if (!slot) slot = std::make_shared<id_lock>();
        ++slot->users;
        lock = slot;
    }
    lock->mutex.lock();
    return lock;
}

void optimistic_coordinator::release(const entity_id& id, const std::shared_ptr<id_lock>& lock) {
    lock->mutex.unlock();
    std::lock_guard<std::mutex> guard(locks_mutex_);
    if (--lock->users == 0) {
        locks_.erase(id);
    }
}

entity optimistic_coordinator::call_remote(const remote_fn& remote_call, std::chrono::milliseconds timeout) {
    if (timeout.count() <= 0) {
        return remote_call();
    }

    // The pool task owns its promise, so a call that outlives the timeout
    // completes harmlessly into an abandoned future.
    auto promise = std::make_shared<std::promise<entity>>();
    auto result = promise->get_future();
    remote_workers_->invoke([promise, remote_call] {
        try {
            promise->set_value(remote_call());
        } catch (...) {
            promise->set_exception(std::current_exception());
        }
    });

    if (result.wait_for(timeout) != std::future_status::ready) {
        throw engine_error(error_code::timeout,
                           "remote call timed out after " + std::to_string(timeout.count()) + "ms");
    }
    return result.get();
}

entity optimistic_coordinator::mutate(const entity_id& id, const transform_fn& transform,
                                      const remote_fn& remote_call, const mutation_options& options) {
    auto guard = cache_.begin_mutation();
    auto lock = acquire(id);
    ++in_flight_;

    struct lease {
        optimistic_coordinator& self;
        const entity_id& id;
        std::shared_ptr<id_lock> lock;
        ~lease() {
            --self.in_flight_;
            self.release(id, lock);
        }
    } held{*this, id, lock};

    auto& cache = cache_.cache();
    auto snapshot = cache.get(id);
    entity speculative = transform(snapshot);
    speculative.id = id;
    auto token = cache.begin_optimistic(speculative);

    auto timeout = options.timeout.count() > 0 ? options.timeout : config_.timeout;
    entity confirmed;
    try {
        confirmed = call_remote(remote_call, timeout);
    } catch (const std::exception& e) {
        if (cache.rollback(token)) {
            LOG_WARN("optimistic", "Rolled back %s: %s", id.c_str(), e.what());
        } else {
            LOG_WARN("optimistic", "Write on %s failed after it was superseded: %s", id.c_str(), e.what());
        }
        throw;
    }

    auto outcome = cache.commit(confirmed, token);
    switch (outcome) {
        case put_result::applied:
            LOG_DEBUG("optimistic", "Committed %s at v%lld", confirmed.id.c_str(), (long long)confirmed.version);
            break;
        case put_result::stale:
        case put_result::conflict:
            LOG_DEBUG("optimistic", "Confirmation of %s superseded (%s)", confirmed.id.c_str(), to_string(outcome));
            break;
        case put_result::cancelled:
            LOG_WARN("optimistic", "Write on %s cancelled by a remote delete", id.c_str());
            throw engine_error(error_code::conflict, id + " was deleted remotely while the write was in flight");
    }

    if (options.stop.stop_requested()) {
        throw engine_error(error_code::cancelled, "mutation of " + id + " settled after the caller stopped waiting");
    }
    return confirmed;
}

entity optimistic_coordinator::update(const std::string& table, const entity_id& id, const nlohmann::json& patch,
                                      const mutation_options& options) {
    auto remote = remote_;
    return mutate(
        id,
        [&](const std::optional<entity>& current) {
            entity next = current.value_or(entity{id, table, 0, nlohmann::json::object()});
            next.fields.merge_patch(patch);
            return next;
        },
        [remote, table, id, patch] { return remote->update(table, id, patch); },
        options);
}

entity optimistic_coordinator::create(const std::string& table, const nlohmann::json& payload,
                                      const mutation_options& options) {
    auto provisional = "local-" + uuid_t::generate().to_string();
    auto remote = remote_;
    return mutate(
        provisional,
        [&](const std::optional<entity>&) { return entity{provisional, table, 0, payload}; },
        [remote, table, payload] { return remote->create(table, payload); },
        options);
}

entity optimistic_coordinator::restore(const entity& snapshot, const mutation_options& options) {
    auto remote = remote_;
    return mutate(
        snapshot.id,
        [&](const std::optional<entity>&) { return snapshot; },
        [remote, snapshot] { return remote->create(snapshot.table, snapshot.fields, snapshot.id); },
        options);
}

entity optimistic_coordinator::push(const entity& desired, const mutation_options& options) {
    auto remote = remote_;
    return mutate(
        desired.id,
        [&](const std::optional<entity>& current) {
            entity next = desired;
            if (current) next.version = current->version;
            return next;
        },
        [remote, desired] {
            // Fields the desired state dropped are removed through null patch members.
            nlohmann::json patch = desired.fields;
            auto current = remote->fetch_one(desired.table, desired.id);
            for (auto it = current.fields.begin(); it != current.fields.end(); ++it) {
                if (!desired.fields.contains(it.key())) patch[it.key()] = nullptr;
            }
            return remote->update(desired.table, desired.id, patch);
        },
        options);
}

} // namespace cohere
