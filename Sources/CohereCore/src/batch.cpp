#include "cohere/batch.hpp"
#include "cohere/optimistic.hpp"
#include "cohere/undo.hpp"
#include "cohere/error.hpp"
#include "cohere/log.hpp"
#include <algorithm>
#include <atomic>
#include <latch>
#include <memory>
#include <set>
#include <thread>

namespace cohere {

batch_executor::batch_executor(cache_handle cache, std::shared_ptr<remote_store> remote,
                               optimistic_coordinator* coordinator, undo_journal* undo,
                               batch_config config, shared_scheduler workers)
    : cache_(std::move(cache)), remote_(std::move(remote)), coordinator_(coordinator), undo_(undo),
      config_(std::move(config)), workers_(std::move(workers)) {
    if (!remote_) {
        throw engine_error(error_code::invalid_argument, "batch_executor requires a remote store");
    }
    if (!workers_) {
        workers_ = std::make_shared<thread_pool_scheduler>(std::max<size_t>(1, config_.workers));
    }
}

batch_result batch_executor::run(const std::vector<mutation_request>& items, size_t batch_size,
                                 progress_channel* progress) {
    if (batch_size == 0) {
        throw engine_error(error_code::invalid_argument, "batch_size must be at least 1");
    }
    batch_options options;
    options.batch_size = batch_size;
    options.progress = progress;
    return run(items, options);
}

batch_result batch_executor::run(const std::vector<mutation_request>& items, const batch_options& options) {
    if (options.optimistic && !coordinator_) {
        throw engine_error(error_code::invalid_argument, "optimistic batch requires a coordinator");
    }
    std::vector<entity_id> labels;
    labels.reserve(items.size());
    for (const auto& item : items) labels.push_back(item.id);

    bool optimistic = options.optimistic;
    auto result = execute(labels, [&](size_t i) { return apply(items[i], optimistic); },
                          options, config_.batch_size);

    if (result.total_successful > 0) {
        std::set<std::string> tables;
        for (const auto& item : items) tables.insert(item.table);
        auto dropped = cache_->invalidate_views_matching(
            [&](const view_key& key) { return tables.count(table_of(key)) != 0; });
        LOG_DEBUG("batch", "Invalidated %zu view(s) after batch", dropped);
    }
    return result;
}

entity_id batch_executor::apply(const mutation_request& request, bool optimistic) {
    switch (request.kind) {
        case mutation_kind::create: {
            if (optimistic) {
                return coordinator_->create(request.table, request.payload).id;
            }
            auto created = remote_->create(request.table, request.payload);
            cache_->put(created);
            return created.id;
        }
        case mutation_kind::update: {
            if (optimistic && !request.expected_version) {
                return coordinator_->update(request.table, request.id, request.payload).id;
            }
            auto updated = remote_->update(request.table, request.id, request.payload, request.expected_version);
            auto outcome = cache_->put(updated);
            if (outcome != put_result::applied) {
                LOG_DEBUG("batch", "Result for %s not cached (%s)", request.id.c_str(), to_string(outcome));
            }
            return updated.id;
        }
        case mutation_kind::remove:
            remote_->remove(request.table, request.id);
            cache_->remove(request.id);
            return request.id;
    }
    throw engine_error(error_code::invalid_argument, "unknown mutation kind");
}

batch_result batch_executor::execute(const std::vector<entity_id>& labels, const item_fn& perform,
                                     const batch_options& options, size_t default_batch_size) {
    size_t batch_size = options.batch_size != 0 ? options.batch_size : default_batch_size;
    if (batch_size == 0) {
        throw engine_error(error_code::invalid_argument, "batch_size must be at least 1");
    }

    // Counted as one in-flight mutation so shutdown() waits for the run.
    cache_handle::mutation_guard guard;
    try {
        guard = cache_.begin_mutation();
    } catch (const engine_error&) {
        if (options.progress) options.progress->close();
        throw;
    }

    batch_result result;
    const size_t total = labels.size();
    if (total == 0) {
        if (options.progress) options.progress->close();
        return result;
    }

    const size_t total_batches = (total + batch_size - 1) / batch_size;
    const auto delay = options.inter_batch_delay.value_or(config_.inter_batch_delay);
    const auto started = std::chrono::steady_clock::now();
    LOG_INFO("batch", "Running %zu item(s) in %zu chunk(s) of %zu", total, total_batches, batch_size);

    for (size_t batch = 0; batch < total_batches; ++batch) {
        if (options.stop.stop_requested()) {
            result.cancelled = true;
            LOG_INFO("batch", "Stopped before chunk %zu/%zu", batch + 1, total_batches);
            break;
        }
        if (!cache_.is_open()) {
            result.cancelled = true;
            LOG_WARN("batch", "Cache shutting down; skipping chunk %zu/%zu", batch + 1, total_batches);
            break;
        }
        if (batch > 0 && delay.count() > 0) {
            std::this_thread::sleep_for(delay);
        }
        if (!workers_->can_invoke()) {
            if (options.progress) options.progress->close();
            throw engine_error(error_code::shut_down, "batch worker pool is shut down");
        }

        const size_t begin = batch * batch_size;
        const size_t count = std::min(batch_size, total - begin);
        std::vector<std::optional<entity_id>> succeeded(count);
        std::vector<std::optional<failed_item>> failures(count);
        // Whoever claims an item runs it and counts it down, exactly once. The
        // flags are shared so a task the caller already ran can still check
        // them after this chunk is gone.
        auto claimed = std::make_shared<std::vector<std::atomic<bool>>>(count);
        std::latch done(static_cast<std::ptrdiff_t>(count));

        auto run_item = [&](size_t i) {
            struct count_down_on_exit {
                std::latch& latch;
                ~count_down_on_exit() { latch.count_down(); }
            } release{done};

            const auto& label = labels[begin + i];
            try {
                succeeded[i] = perform(begin + i);
            } catch (const engine_error& e) {
                failures[i] = failed_item{label, e.what(), e.code()};
            } catch (const std::exception& e) {
                failures[i] = failed_item{label, e.what(), std::nullopt};
            } catch (...) {
                failures[i] = failed_item{label, "unknown error", std::nullopt};
            }
        };

        for (size_t i = 0; i < count; ++i) {
            workers_->invoke([claimed, &run_item, i] {
                if (!(*claimed)[i].exchange(true)) run_item(i);
            });
        }
        // A pool that stopped meanwhile drops submissions; run those here.
        if (!workers_->can_invoke()) {
            for (size_t i = 0; i < count; ++i) {
                if (!(*claimed)[i].exchange(true)) run_item(i);
            }
        }
        done.wait();

        for (size_t i = 0; i < count; ++i) {
            if (succeeded[i]) {
                result.successful.push_back(*succeeded[i]);
            } else if (failures[i]) {
                LOG_WARN("batch", "Item %s failed: %s", failures[i]->id.c_str(), failures[i]->error.c_str());
                result.failed.push_back(std::move(*failures[i]));
            }
        }
        result.total_processed += count;

        if (options.progress) {
            auto elapsed = std::chrono::duration<double>(std::chrono::steady_clock::now() - started).count();
            elapsed = std::max(elapsed, 1e-6);
            batch_progress p;
            p.current = result.total_processed;
            p.total = total;
            p.percentage = 100.0 * static_cast<double>(p.current) / static_cast<double>(total);
            p.current_batch = batch + 1;
            p.total_batches = total_batches;
            p.processing_rate = static_cast<double>(p.current) / elapsed;
            p.estimated_time_remaining = std::chrono::milliseconds(
                static_cast<int64_t>(static_cast<double>(total - p.current) / p.processing_rate * 1000.0));
            options.progress->send(p);
        }
    }

    result.total_successful = result.successful.size();
    result.total_failed = result.failed.size();
    if (options.progress) options.progress->close();
    LOG_INFO("batch", "Batch finished: %zu ok, %zu failed%s", result.total_successful, result.total_failed,
             result.cancelled ? " (stopped)" : "");
    return result;
}

batch_result batch_executor::bulk_update(const std::string& table,
                                         const std::vector<std::pair<entity_id, nlohmann::json>>& patches,
                                         const batch_options& options) {
    std::vector<mutation_request> items;
    items.reserve(patches.size());
    for (const auto& [id, patch] : patches) {
        items.push_back(mutation_request{mutation_kind::update, table, id, patch, std::nullopt});
    }
    return run(items, options);
}

batch_result batch_executor::bulk_set_field(const std::string& table, const std::vector<entity_id>& ids,
                                            const std::string& field, const nlohmann::json& value,
                                            const batch_options& options) {
    nlohmann::json patch = nlohmann::json::object();
    patch[field] = value;
    std::vector<mutation_request> items;
    items.reserve(ids.size());
    for (const auto& id : ids) {
        items.push_back(mutation_request{mutation_kind::update, table, id, patch, std::nullopt});
    }
    return run(items, options);
}

batch_result batch_executor::bulk_delete(const std::string& table, const std::vector<entity_id>& ids,
                                         delete_mode mode, const batch_options& options) {
    if (mode == delete_mode::soft) {
        std::vector<mutation_request> items;
        items.reserve(ids.size());
        for (const auto& id : ids) {
            items.push_back(mutation_request{mutation_kind::update, table, id, config_.soft_delete_patch,
                                             std::nullopt});
        }
        return run(items, options);
    }

    std::vector<std::optional<entity>> snapshots(ids.size());
    auto result = execute(
        ids,
        [&](size_t i) {
            const auto& id = ids[i];
            auto cached = cache_->entry(id);
            entity before = (cached && cached->state != entry_state::optimistic && cached->value.table == table)
                                ? cached->value
                                : remote_->fetch_one(table, id);
            remote_->remove(table, id);
            cache_->remove(id, before);
            snapshots[i] = std::move(before);
            return id;
        },
        options, config_.batch_size);

    if (result.total_successful > 0) {
        cache_->invalidate_views_matching([&](const view_key& key) { return table_of(key) == table; });
    }

    std::vector<entity> deleted;
    for (auto& snapshot : snapshots) {
        if (snapshot) deleted.push_back(std::move(*snapshot));
    }
    if (undo_ && !deleted.empty()) {
        result.undo_id = undo_->record("delete " + std::to_string(deleted.size()) + " from " + table,
                                       std::move(deleted),
                                       [this](const std::vector<entity>& restore) {
                                           auto guard = cache_.begin_mutation();
                                           for (const auto& e : restore) {
                                               try {
                                                   if (coordinator_) {
                                                       coordinator_->restore(e);
                                                   } else {
                                                       cache_->put(remote_->create(e.table, e.fields, e.id));
                                                   }
                                               } catch (const engine_error& err) {
                                                   if (err.code() != error_code::conflict) throw;
                                                   LOG_INFO("batch", "%s already restored", e.id.c_str());
                                               }
                                           }
                                       });
    }
    return result;
}

fetch_result batch_executor::bulk_fetch(const std::string& table, const std::vector<entity_id>& ids,
                                        const batch_options& options) {
    std::vector<std::optional<entity>> fetched(ids.size());
    fetch_result out;
    out.summary = execute(
        ids,
        [&](size_t i) {
            auto e = remote_->fetch_one(table, ids[i]);
            cache_->put(e);
            fetched[i] = e;
            return e.id;
        },
        options, config_.fetch_batch_size);

    for (auto& e : fetched) {
        if (e) out.entities.push_back(std::move(*e));
    }
    return out;
}

} // namespace cohere
