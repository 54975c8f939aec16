#pragma once

#include "TestSupport.hpp"
#include <atomic>
#include <stop_token>

namespace batch_tests {

using namespace cohere;
using test_support::make_entity;
using test_support::error_of;

struct fixture {
    std::shared_ptr<manual_clock> clock = test_support::make_clock();
    cache_handle handle = cache_handle::init(clock);
    std::shared_ptr<mock_remote_store> store = std::make_shared<mock_remote_store>(clock);
    shared_scheduler workers = std::make_shared<thread_pool_scheduler>(4);

    void seed(size_t count) {
        for (size_t i = 1; i <= count; ++i) {
            store->seed(make_entity("item-" + std::to_string(i), static_cast<version_t>(i),
                                    {{"status", "active"}, {"n", i}}));
        }
    }

    std::vector<mutation_request> updates(size_t count, nlohmann::json patch) {
        std::vector<mutation_request> items;
        for (size_t i = 1; i <= count; ++i) {
            items.push_back(mutation_request{mutation_kind::update, "members", "item-" + std::to_string(i), patch,
                                             std::nullopt});
        }
        return items;
    }
};

// Store that requests a stop while serving one particular update
class stopping_store : public mock_remote_store {
public:
    stopping_store(shared_clock clk, std::stop_source source, entity_id trigger)
        : mock_remote_store(std::move(clk)), source_(std::move(source)), trigger_(std::move(trigger)) {}

    entity update(const std::string& table, const entity_id& id, const nlohmann::json& patch,
                  std::optional<version_t> expected_version) override {
        if (id == trigger_) source_.request_stop();
        return mock_remote_store::update(table, id, patch, expected_version);
    }

private:
    std::stop_source source_;
    entity_id trigger_;
};

// Store whose update throws a non-standard exception for one id
class throwing_store : public mock_remote_store {
public:
    throwing_store(shared_clock clk, entity_id trigger)
        : mock_remote_store(std::move(clk)), trigger_(std::move(trigger)) {}

    entity update(const std::string& table, const entity_id& id, const nlohmann::json& patch,
                  std::optional<version_t> expected_version) override {
        if (id == trigger_) throw 42;
        return mock_remote_store::update(table, id, patch, expected_version);
    }

private:
    entity_id trigger_;
};

// Runs the first submission inline, then stops accepting work and drops
// everything submitted afterwards.
class closing_scheduler : public scheduler {
public:
    void invoke(std::function<void()>&& fn) override {
        if (closed_) {
            ++dropped_;
            return;
        }
        closed_ = true;
        fn();
    }

    [[nodiscard]] bool is_on_thread() const noexcept override { return true; }
    [[nodiscard]] bool can_invoke() const noexcept override { return !closed_; }
    [[nodiscard]] size_t concurrency() const noexcept override { return 1; }

    [[nodiscard]] size_t dropped() const { return dropped_; }

private:
    std::atomic<bool> closed_{false};
    std::atomic<size_t> dropped_{0};
};

void test_partial_failure_with_progress() {
    std::cout << "  test_partial_failure_with_progress..." << std::flush;

    fixture f;
    f.seed(10);
    f.store->fail_on("item-5", error_code::validation, "bad field");
    batch_executor executor(f.handle, f.store, nullptr, nullptr, batch_config{}, f.workers);

    progress_channel progress;
    auto result = executor.run(f.updates(10, {{"status", "suspended"}}), 3, &progress);

    assert(result.total_processed == 10);
    assert(result.total_successful == 9);
    assert(result.total_failed == 1);
    assert(result.failed.size() == 1);
    assert(result.failed[0].id == "item-5");
    assert(result.failed[0].error == "bad field");
    assert(result.failed[0].code == error_code::validation);
    assert(result.successful.size() == 9);
    assert(result.successful.front() == "item-1");
    assert(!result.cancelled);

    auto events = progress.drain();
    assert(events.size() == 4);
    assert(progress.is_closed());
    assert(events[0].current == 3);
    assert(events[0].current_batch == 1);
    assert(events[0].total_batches == 4);
    assert(events[0].estimated_time_remaining.has_value());
    assert(events[3].current == 10);
    assert(events[3].current_batch == 4);
    assert(events[3].percentage == 100.0);
    assert(events[3].estimated_time_remaining->count() == 0);
    assert(events[3].processing_rate > 0);

    assert(f.store->stored("item-1")->fields["status"] == "suspended");
    assert(f.store->stored("item-5")->fields["status"] == "active");
    assert(f.handle->get("item-2")->fields["status"] == "suspended");

    std::cout << " OK" << std::endl;
}

void test_empty_batch() {
    std::cout << "  test_empty_batch..." << std::flush;

    fixture f;
    batch_executor executor(f.handle, f.store, nullptr, nullptr, batch_config{}, f.workers);
    progress_channel progress;
    auto result = executor.run({}, 10, &progress);

    assert(result.total_processed == 0);
    assert(result.total_successful == 0);
    assert(result.total_failed == 0);
    assert(result.successful.empty());
    assert(result.failed.empty());
    assert(progress.size() == 0);
    assert(f.store->calls("update") == 0);
    assert(f.store->calls("create") == 0);

    std::cout << " OK" << std::endl;
}

void test_zero_batch_size_rejected() {
    std::cout << "  test_zero_batch_size_rejected..." << std::flush;

    fixture f;
    f.seed(2);
    batch_executor executor(f.handle, f.store, nullptr, nullptr, batch_config{}, f.workers);
    assert(error_of([&] { executor.run(f.updates(2, {{"x", 1}}), 0); }) == error_code::invalid_argument);
    assert(f.store->calls("update") == 0);

    std::cout << " OK" << std::endl;
}

void test_batch_completeness() {
    std::cout << "  test_batch_completeness..." << std::flush;

    for (size_t n : {0, 1, 4, 7, 20}) {
        fixture f;
        f.seed(n);
        for (size_t i = 3; i <= n; i += 3) {
            f.store->fail_on("item-" + std::to_string(i), error_code::network, "unreachable");
        }
        batch_executor executor(f.handle, f.store, nullptr, nullptr, batch_config{}, f.workers);
        auto result = executor.run(f.updates(n, {{"touched", true}}), 4);
        assert(result.total_processed == n);
        assert(result.successful.size() + result.failed.size() == n);
        assert(result.total_failed == n / 3);
    }

    std::cout << " OK" << std::endl;
}

void test_stop_between_chunks() {
    std::cout << "  test_stop_between_chunks..." << std::flush;

    auto clock = test_support::make_clock();
    auto handle = cache_handle::init(clock);
    std::stop_source source;
    auto store = std::make_shared<stopping_store>(clock, source, "item-2");
    for (int i = 1; i <= 6; ++i) {
        store->seed(make_entity("item-" + std::to_string(i), i, {{"status", "active"}}));
    }

    batch_executor executor(handle, store, nullptr, nullptr, batch_config{},
                            std::make_shared<immediate_scheduler>());
    std::vector<mutation_request> items;
    for (int i = 1; i <= 6; ++i) {
        items.push_back(mutation_request{mutation_kind::update, "members", "item-" + std::to_string(i),
                                         {{"status", "x"}}, std::nullopt});
    }

    progress_channel progress;
    batch_options options;
    options.batch_size = 2;
    options.progress = &progress;
    options.stop = source.get_token();
    auto result = executor.run(items, options);

    // The chunk that saw the stop finished; nothing after it ran
    assert(result.cancelled);
    assert(result.total_processed == 2);
    assert(result.total_successful == 2);
    assert(store->calls("update") == 2);
    assert(progress.drain().size() == 1);
    assert(progress.is_closed());

    std::cout << " OK" << std::endl;
}

void test_success_invalidates_table_views() {
    std::cout << "  test_success_invalidates_table_views..." << std::flush;

    fixture f;
    f.seed(3);
    view_key all = list_view{"members", {}, std::nullopt, std::nullopt, 0};
    view_key plans = list_view{"plans", {}, std::nullopt, std::nullopt, 0};
    f.handle->put_view(all, {});
    f.handle->put_view(plans, {});

    batch_executor executor(f.handle, f.store, nullptr, nullptr, batch_config{}, f.workers);
    executor.run(f.updates(3, {{"touched", true}}), 2);
    assert(!f.handle->get_view(all));
    assert(f.handle->get_view(plans));

    std::cout << " OK" << std::endl;
}

void test_bulk_set_field_and_soft_delete() {
    std::cout << "  test_bulk_set_field_and_soft_delete..." << std::flush;

    fixture f;
    f.seed(4);
    batch_executor executor(f.handle, f.store, nullptr, nullptr, batch_config{}, f.workers);

    auto result = executor.bulk_set_field("members", {"item-1", "item-2"}, "status", "suspended");
    assert(result.total_successful == 2);
    assert(f.store->stored("item-1")->fields["status"] == "suspended");
    assert(f.store->stored("item-3")->fields["status"] == "active");

    auto soft = executor.bulk_delete("members", {"item-3", "item-4", "ghost"}, delete_mode::soft);
    assert(soft.total_processed == 3);
    assert(soft.total_successful == 2);
    assert(soft.failed[0].id == "ghost");
    assert(soft.failed[0].code == error_code::not_found);
    assert(f.store->stored("item-3")->fields["status"] == "inactive");
    assert(!soft.undo_id);

    std::vector<std::pair<entity_id, nlohmann::json>> patches = {
        {"item-1", {{"note", "a"}}},
        {"item-2", {{"note", "b"}}}
    };
    auto updated = executor.bulk_update("members", patches);
    assert(updated.total_successful == 2);
    assert(f.store->stored("item-2")->fields["note"] == "b");

    std::cout << " OK" << std::endl;
}

void test_hard_delete_records_undo() {
    std::cout << "  test_hard_delete_records_undo..." << std::flush;

    fixture f;
    f.seed(3);
    undo_journal journal(f.clock);
    optimistic_coordinator coordinator(f.handle, f.store);
    batch_executor executor(f.handle, f.store, &coordinator, &journal, batch_config{}, f.workers);

    f.handle->put(*f.store->stored("item-1"));
    auto result = executor.bulk_delete("members", {"item-1", "item-2", "item-3"}, delete_mode::hard);
    assert(result.total_successful == 3);
    assert(result.undo_id);
    assert(!f.store->stored("item-2"));
    assert(!f.handle->contains("item-1"));
    assert(journal.active().size() == 1);
    assert(journal.active()[0].snapshots.size() == 3);

    journal.execute(*result.undo_id);
    for (const char* id : {"item-1", "item-2", "item-3"}) {
        assert(f.store->stored(id));
        assert(f.handle->contains(id));
    }
    assert(f.store->stored("item-2")->fields["n"] == 2);
    assert(journal.active().empty());

    std::cout << " OK" << std::endl;
}

void test_bulk_fetch() {
    std::cout << "  test_bulk_fetch..." << std::flush;

    fixture f;
    f.seed(5);
    batch_executor executor(f.handle, f.store, nullptr, nullptr, batch_config{}, f.workers);
    auto fetched = executor.bulk_fetch("members", {"item-1", "item-2", "nope", "item-4", "item-5", "item-3"});

    assert(fetched.entities.size() == 5);
    assert(fetched.entities[0].id == "item-1");
    assert(fetched.entities[2].id == "item-4");
    assert(fetched.summary.total_processed == 6);
    assert(fetched.summary.total_failed == 1);
    assert(fetched.summary.failed[0].code == error_code::not_found);
    assert(f.handle->contains("item-3"));
    assert(f.store->calls("fetch_one") == 6);

    std::cout << " OK" << std::endl;
}

void test_optimistic_batch() {
    std::cout << "  test_optimistic_batch..." << std::flush;

    fixture f;
    f.seed(4);
    optimistic_coordinator coordinator(f.handle, f.store);
    batch_executor executor(f.handle, f.store, &coordinator, nullptr, batch_config{}, f.workers);

    batch_options options;
    options.batch_size = 2;
    options.optimistic = true;
    auto items = f.updates(4, {{"status", "suspended"}});
    items.push_back(mutation_request{mutation_kind::create, "members", "new-row", {{"status", "active"}},
                                     std::nullopt});
    auto result = executor.run(items, options);

    assert(result.total_successful == 5);
    assert(f.handle->get("item-3")->fields["status"] == "suspended");
    assert(f.handle->entry("item-3")->state == entry_state::confirmed);
    // The created row is cached under the id the remote assigned
    assert(f.handle->contains(result.successful.back()));
    assert(result.successful.back().rfind("mock-", 0) == 0);

    batch_executor plain(f.handle, f.store, nullptr, nullptr, batch_config{}, f.workers);
    assert(error_of([&] { plain.run(items, options); }) == error_code::invalid_argument);

    std::cout << " OK" << std::endl;
}

void test_shutdown_drains_running_batch() {
    std::cout << "  test_shutdown_drains_running_batch..." << std::flush;

    fixture f;
    f.seed(4);
    f.store->set_latency(std::chrono::milliseconds(150));
    batch_executor executor(f.handle, f.store, nullptr, nullptr, batch_config{}, f.workers);

    batch_result result;
    std::thread runner([&] { result = executor.run(f.updates(4, {{"status", "suspended"}}), 2); });

    // Shut down while the first chunk is talking to the store
    assert(test_support::eventually([&] { return f.store->calls("update") == 2; }));
    assert(f.handle.in_flight() == 1);
    f.handle.shutdown();
    assert(f.handle.in_flight() == 0);
    runner.join();

    // The running chunk finished before the cache was cleared; the next one never started
    assert(result.total_processed == 2);
    assert(result.total_successful == 2);
    assert(result.cancelled);
    assert(f.store->calls("update") == 2);
    assert(f.handle->size() == 0);

    assert(error_of([&] { executor.run(f.updates(1, {{"x", 1}}), 1); }) == error_code::shut_down);
    assert(f.store->calls("update") == 2);
    assert(f.handle->size() == 0);

    std::cout << " OK" << std::endl;
}

void test_unusual_failures_are_recorded() {
    std::cout << "  test_unusual_failures_are_recorded..." << std::flush;

    // A non-standard exception counts as a failed item
    {
        fixture f;
        auto store = std::make_shared<throwing_store>(f.clock, "item-2");
        for (size_t i = 1; i <= 3; ++i) {
            store->seed(make_entity("item-" + std::to_string(i), static_cast<version_t>(i), {{"n", i}}));
        }
        batch_executor executor(f.handle, store, nullptr, nullptr, batch_config{}, f.workers);
        auto result = executor.run(f.updates(3, {{"status", "suspended"}}), 3);
        assert(result.total_processed == 3);
        assert(result.total_successful == 2);
        assert(result.failed.size() == 1);
        assert(result.failed[0].id == "item-2");
        assert(!result.failed[0].code);
    }

    // Work a stopping scheduler dropped still runs
    {
        fixture f;
        f.seed(3);
        auto workers = std::make_shared<closing_scheduler>();
        batch_executor executor(f.handle, f.store, nullptr, nullptr, batch_config{}, workers);
        auto result = executor.run(f.updates(3, {{"status", "suspended"}}), 3);
        assert(workers->dropped() == 2);
        assert(result.total_processed == 3);
        assert(result.total_successful == 3);
        assert(f.store->calls("update") == 3);
    }

    std::cout << " OK" << std::endl;
}

void run_all() {
    std::cout << std::endl;
    std::cout << "--- Batch Executor Tests ---" << std::endl;

    test_partial_failure_with_progress();
    test_empty_batch();
    test_zero_batch_size_rejected();
    test_batch_completeness();
    test_stop_between_chunks();
    test_success_invalidates_table_views();
    test_bulk_set_field_and_soft_delete();
    test_hard_delete_records_undo();
    test_bulk_fetch();
    test_optimistic_batch();
    test_shutdown_drains_running_batch();
    test_unusual_failures_are_recorded();

    std::cout << "--- Batch Executor Tests: All passed ---" << std::endl;
}

} // namespace batch_tests
