#pragma once

#include "TestSupport.hpp"
#include <atomic>

namespace conflict_tests {

using namespace cohere;
using test_support::make_entity;
using test_support::error_of;

struct fixture {
    std::shared_ptr<manual_clock> clock = test_support::make_clock();
    cache_handle handle = cache_handle::init(clock);
    std::shared_ptr<mock_remote_store> store = std::make_shared<mock_remote_store>(clock);
    std::shared_ptr<conflict_store> conflicts = std::make_shared<conflict_store>(clock);

    entity local = make_entity("m1", 5, {{"status", "suspended"}, {"name", "Ann"}, {"note", "vip"}});
    entity remote = make_entity("m1", 6, {{"status", "active"}, {"name", "Ann B"}});

    fixture() {
        store->seed(remote);
        handle->put(make_entity("m1", 5, {{"status", "active"}, {"name", "Ann"}}));
    }
};

void test_resolve_exactly_once() {
    std::cout << "  test_resolve_exactly_once..." << std::flush;

    fixture f;
    conflict_resolver resolver(f.handle, f.conflicts, nullptr);
    auto record = f.conflicts->add(f.local, f.remote);
    assert(f.conflicts->has_pending("m1"));

    auto outcome = resolver.resolve(record.id, resolution::remote());
    assert(outcome == f.remote);
    assert(f.handle->get("m1") == f.remote);
    assert(error_of([&] { resolver.resolve(record.id, resolution::remote()); }) == error_code::already_resolved);
    assert(error_of([&] { resolver.auto_resolve(record.id, auto_strategy::remote_wins); }) ==
           error_code::already_resolved);
    assert(error_of([&] { resolver.resolve("no-such-conflict", resolution::remote()); }) == error_code::not_found);

    auto settled = f.conflicts->get(record.id);
    assert(settled->resolved);
    assert(!settled->automatic);
    assert(settled->resolution == "remote");
    assert(settled->resolved_at == f.clock->now());
    assert(!f.conflicts->has_pending("m1"));

    std::cout << " OK" << std::endl;
}

void test_concurrent_resolution_single_winner() {
    std::cout << "  test_concurrent_resolution_single_winner..." << std::flush;

    fixture f;
    conflict_resolver resolver(f.handle, f.conflicts, nullptr);
    auto record = f.conflicts->add(f.local, f.remote);

    std::atomic<int> won{0};
    std::atomic<int> refused{0};
    std::vector<std::thread> threads;
    for (int i = 0; i < 4; ++i) {
        threads.emplace_back([&] {
            auto code = error_of([&] { resolver.resolve(record.id, resolution::remote()); });
            if (!code) {
                ++won;
            } else if (*code == error_code::already_resolved) {
                ++refused;
            }
        });
    }
    for (auto& t : threads) t.join();

    assert(won == 1);
    assert(refused == 3);
    assert(f.conflicts->history().size() == 1);

    std::cout << " OK" << std::endl;
}

void test_local_resolution_pushes() {
    std::cout << "  test_local_resolution_pushes..." << std::flush;

    fixture f;
    optimistic_coordinator coordinator(f.handle, f.store);
    conflict_resolver resolver(f.handle, f.conflicts, &coordinator);
    auto record = f.conflicts->add(f.local, f.remote);

    auto outcome = resolver.resolve(record.id, resolution::local());
    assert(outcome.version == 7);
    assert(outcome.fields == f.local.fields);
    assert(f.store->stored("m1")->fields == f.local.fields);
    assert(f.handle->get("m1") == outcome);
    assert(f.handle->entry("m1")->state == entry_state::confirmed);
    assert(f.conflicts->history()[0].resolution == "local");

    std::cout << " OK" << std::endl;
}

void test_merge_fields() {
    std::cout << "  test_merge_fields..." << std::flush;

    fixture f;
    conflict_resolver resolver(f.handle, f.conflicts, nullptr);
    auto record = f.conflicts->add(f.local, f.remote);

    auto merged = resolver.resolve(record.id, resolution::merge({"status", "note"}));
    assert(merged.version == 6);
    assert(merged.fields["status"] == "suspended");
    assert(merged.fields["name"] == "Ann B");
    assert(merged.fields["note"] == "vip");
    assert(f.handle->get("m1") == merged);

    // A listed field missing locally is dropped from the result
    auto local = make_entity("m2", 1, {{"a", 1}});
    auto remote = make_entity("m2", 2, {{"a", 2}, {"b", 3}});
    auto combined = conflict_resolver::merge_fields(local, remote, {"b"});
    assert(combined.fields == nlohmann::json({{"a", 2}}));
    assert(combined.version == 2);

    std::cout << " OK" << std::endl;
}

void test_merge_function_is_pushed() {
    std::cout << "  test_merge_function_is_pushed..." << std::flush;

    fixture f;
    optimistic_coordinator coordinator(f.handle, f.store);
    conflict_resolver resolver(f.handle, f.conflicts, &coordinator);
    auto record = f.conflicts->add(f.local, f.remote);

    auto outcome = resolver.resolve(record.id, resolution::merge(), [](const entity& local, const entity& remote) {
        entity out = remote;
        out.fields["note"] = local.fields["note"];
        out.fields["merged"] = true;
        return out;
    });

    auto stored = f.store->stored("m1");
    assert(stored->fields["merged"] == true);
    assert(stored->fields["note"] == "vip");
    assert(stored->fields["name"] == "Ann B");
    assert(outcome == *stored);
    assert(f.handle->get("m1") == *stored);
    assert(f.conflicts->history()[0].resolution == "merge");

    std::cout << " OK" << std::endl;
}

void test_failed_merge_leaves_cache_untouched() {
    std::cout << "  test_failed_merge_leaves_cache_untouched..." << std::flush;

    fixture f;
    optimistic_coordinator coordinator(f.handle, f.store);
    conflict_resolver resolver(f.handle, f.conflicts, &coordinator);
    auto record = f.conflicts->add(f.local, f.remote);
    auto before = f.handle->entry("m1");

    f.store->fail_on("m1", error_code::network, "offline");
    assert(error_of([&] { resolver.resolve(record.id, resolution::merge({"status"})); }) == error_code::network);
    assert(f.handle->entry("m1") == before);
    assert(f.conflicts->pending_count() == 1);
    assert(*f.store->stored("m1") == f.remote);

    // With a write in flight the cache falls back to the remote copy
    auto token = f.handle->begin_optimistic(f.local);
    assert(error_of([&] { resolver.resolve(record.id, resolution::merge({"status"})); }) == error_code::network);
    assert(f.handle->get("m1") == f.remote);
    assert(f.handle->entry("m1")->state == entry_state::confirmed);
    assert(!f.handle->rollback(token));
    assert(f.conflicts->pending_count() == 1);

    f.store->clear_failure("m1");
    auto merged = resolver.resolve(record.id, resolution::merge({"status"}));
    assert(merged.fields["status"] == "suspended");
    assert(*f.store->stored("m1") == merged);
    assert(f.handle->get("m1") == merged);
    assert(f.conflicts->pending_count() == 0);

    std::cout << " OK" << std::endl;
}

void test_auto_strategies() {
    std::cout << "  test_auto_strategies..." << std::flush;

    // Equal versions go to the remote copy
    {
        fixture f;
        conflict_resolver resolver(f.handle, f.conflicts, nullptr);
        auto tied = make_entity("m1", 6, {{"status", "suspended"}});
        auto record = f.conflicts->add(tied, f.remote);
        auto outcome = resolver.auto_resolve(record.id, auto_strategy::newest_wins);
        assert(outcome == f.remote);
        auto settled = f.conflicts->get(record.id);
        assert(settled->automatic);
        assert(settled->resolution == "remote");
    }

    // A newer local copy wins and is pushed
    {
        fixture f;
        optimistic_coordinator coordinator(f.handle, f.store);
        conflict_resolver resolver(f.handle, f.conflicts, &coordinator);
        auto newer = make_entity("m1", 8, {{"status", "suspended"}});
        auto record = f.conflicts->add(newer, f.remote);
        resolver.auto_resolve(record.id, auto_strategy::newest_wins);
        assert(f.conflicts->get(record.id)->resolution == "local");
        assert(f.store->stored("m1")->fields == nlohmann::json({{"status", "suspended"}}));
    }

    // Fixed strategies ignore versions
    {
        fixture f;
        optimistic_coordinator coordinator(f.handle, f.store);
        conflict_resolver resolver(f.handle, f.conflicts, &coordinator);
        f.conflicts->add(f.local, f.remote);
        f.conflicts->add(make_entity("m9", 1, {{"x", 1}}), make_entity("m9", 2, {{"x", 2}}));
        f.store->seed(make_entity("m9", 2, {{"x", 2}}));
        assert(resolver.auto_resolve(auto_strategy::local_wins) == 2);
        assert(f.store->stored("m9")->fields["x"] == 1);
        assert(f.conflicts->pending_count() == 0);
    }

    {
        fixture f;
        conflict_resolver resolver(f.handle, f.conflicts, nullptr);
        auto record = f.conflicts->add(make_entity("m1", 9, {{"status", "x"}}), f.remote);
        assert(resolver.auto_resolve(record.id, auto_strategy::remote_wins) == f.remote);
    }

    std::cout << " OK" << std::endl;
}

void test_repeat_detection_refreshes_record() {
    std::cout << "  test_repeat_detection_refreshes_record..." << std::flush;

    fixture f;
    auto first = f.conflicts->add(f.local, f.remote);
    auto newer_remote = make_entity("m1", 8, {{"status", "archived"}});
    auto second = f.conflicts->add(f.local, newer_remote);
    assert(second.id == first.id);
    assert(f.conflicts->pending_count() == 1);
    assert(f.conflicts->pending_for("m1")->remote == newer_remote);

    // An older remote copy does not replace a newer one
    f.conflicts->add(f.local, f.remote);
    assert(f.conflicts->pending_for("m1")->remote == newer_remote);

    std::cout << " OK" << std::endl;
}

void test_failed_resolution_stays_pending() {
    std::cout << "  test_failed_resolution_stays_pending..." << std::flush;

    fixture f;
    conflict_resolver resolver(f.handle, f.conflicts, nullptr);
    auto record = f.conflicts->add(f.local, f.remote);

    assert(error_of([&] { resolver.resolve(record.id, resolution::local()); }) == error_code::invalid_argument);
    assert(f.conflicts->pending_count() == 1);
    assert(f.conflicts->pending_for("m1"));

    // Unresolvable records are left for the next pass
    assert(resolver.auto_resolve(auto_strategy::local_wins) == 0);
    assert(f.conflicts->pending_count() == 1);

    resolver.resolve(record.id, resolution::remote());
    assert(f.conflicts->pending_count() == 0);

    std::cout << " OK" << std::endl;
}

void test_observers_hear_add_and_settle() {
    std::cout << "  test_observers_hear_add_and_settle..." << std::flush;

    fixture f;
    conflict_resolver resolver(f.handle, f.conflicts, nullptr);
    std::vector<conflict_record> seen;
    auto token = f.conflicts->observe([&](const conflict_record& r) { seen.push_back(r); });

    auto record = f.conflicts->add(f.local, f.remote);
    resolver.resolve(record.id, resolution::remote());
    assert(seen.size() == 2);
    assert(!seen[0].resolved);
    assert(seen[1].resolved);
    assert(seen[1].outcome == f.remote);

    token.unregister();
    f.conflicts->add_resolved(f.local, std::nullopt, "remote_delete");
    assert(seen.size() == 2);
    assert(f.conflicts->history().size() == 2);

    std::cout << " OK" << std::endl;
}

void run_all() {
    std::cout << std::endl;
    std::cout << "--- Conflict Resolver Tests ---" << std::endl;

    test_resolve_exactly_once();
    test_concurrent_resolution_single_winner();
    test_local_resolution_pushes();
    test_merge_fields();
    test_merge_function_is_pushed();
    test_failed_merge_leaves_cache_untouched();
    test_auto_strategies();
    test_repeat_detection_refreshes_record();
    test_failed_resolution_stays_pending();
    test_observers_hear_add_and_settle();

    std::cout << "--- Conflict Resolver Tests: All passed ---" << std::endl;
}

} // namespace conflict_tests
