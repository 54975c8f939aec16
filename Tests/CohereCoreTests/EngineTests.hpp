#pragma once

#include "TestSupport.hpp"

namespace engine_tests {

using namespace cohere;
using test_support::make_entity;
using test_support::error_of;
using namespace std::chrono_literals;

struct fixture {
    std::shared_ptr<manual_clock> clock = test_support::make_clock();
    std::shared_ptr<mock_remote_store> store = std::make_shared<mock_remote_store>(clock);

    engine_config config() const {
        engine_config c;
        c.level = log_level::off;
        c.feed.poll_interval = 10ms;
        c.feed.base_delay = 100ms;
        c.batch.workers = 2;
        return c;
    }

    void seed_members() {
        store->seed(make_entity("m1", 1, {{"status", "active"}, {"name", "Ann"}}));
        store->seed(make_entity("m2", 2, {{"status", "active"}, {"name", "Bo"}}));
        store->seed(make_entity("m3", 3, {{"status", "inactive"}, {"name", "Cy"}}));
    }
};

void test_optimistic_write_invalidates_read() {
    std::cout << "  test_optimistic_write_invalidates_read..." << std::flush;

    fixture f;
    f.seed_members();
    engine e(f.store, f.config(), f.clock);
    assert(get_log_level() == log_level::off);

    view_key active = list_view{"members", {{"status", "active"}}, sort_order{"name", false}, std::nullopt, 0};
    e.queries().register_view(active);
    assert(e.queries().read(active).ids == (std::vector<entity_id>{"m1", "m2"}));

    e.coordinator().update("members", "m2", {{"status", "inactive"}});
    assert(!e.cache().get_view(active));
    assert(e.queries().read(active).ids == std::vector<entity_id>{"m1"});
    assert(e.queries().fetch_count() == 2);

    std::cout << " OK" << std::endl;
}

void test_context_transition_runs_commands() {
    std::cout << "  test_context_transition_runs_commands..." << std::flush;

    fixture f;
    f.seed_members();
    engine e(f.store, f.config(), f.clock);
    view_key by_status = count_view{"members", {}, std::string("status")};
    e.staleness().declare_scope({"dashboard", {by_status}, {}, {}});

    assert(e.on_context_transition(context_transition::navigate("dashboard")) == 1);
    auto view = e.cache().get_view(by_status);
    assert(view);
    assert(view->aggregate["total"] == 3);
    assert(view->aggregate["groups"]["active"] == 2);
    assert(view->aggregate["groups"]["inactive"] == 1);

    // Fresh views are not refetched on the way back
    assert(e.on_context_transition(context_transition::navigate("dashboard")) == 0);
    assert(e.queries().fetch_count() == 1);

    std::cout << " OK" << std::endl;
}

void test_network_regained_reconnects_feeds() {
    std::cout << "  test_network_regained_reconnects_feeds..." << std::flush;

    fixture f;
    f.store->set_emit_changes(true);
    engine e(f.store, f.config(), f.clock);
    auto& reconciler = e.watch("members", false);
    assert(&reconciler == e.reconciler("members"));
    assert(e.reconciler("plans") == nullptr);
    assert(reconciler.status().state == connection_state::connected);

    f.store->drop_connections("link down");
    reconciler.step(50ms);
    assert(reconciler.status().state == connection_state::disconnected);

    e.on_context_transition(context_transition::of(context_kind::network_lost));
    auto back = context_transition::of(context_kind::network_regained);
    back.quality = network_quality::slow;
    assert(e.on_context_transition(back) == 1);
    assert(reconciler.status().state == connection_state::connected);
    assert(reconciler.status().attempts == 0);
    assert(e.staleness().strategy() == sync_strategy::conservative);

    auto created = f.store->create("members", {{"status", "active"}});
    assert(reconciler.step(100ms));
    assert(e.cache().contains(created.id));

    std::cout << " OK" << std::endl;
}

void test_bulk_delete_and_undo() {
    std::cout << "  test_bulk_delete_and_undo..." << std::flush;

    fixture f;
    f.seed_members();
    engine e(f.store, f.config(), f.clock);

    auto result = e.batches().bulk_delete("members", {"m1", "m3"}, delete_mode::hard);
    assert(result.total_successful == 2);
    assert(!f.store->stored("m1"));
    assert(result.undo_id);

    f.clock->advance(e.config().undo.ttl - 1s);
    e.undo().execute(*result.undo_id);
    assert(f.store->stored("m1")->fields["name"] == "Ann");
    assert(f.store->stored("m3")->fields["status"] == "inactive");
    assert(e.cache().contains("m3"));

    auto again = e.batches().bulk_delete("members", {"m2"}, delete_mode::hard);
    f.clock->advance(e.config().undo.ttl);
    assert(error_of([&] { e.undo().execute(*again.undo_id); }) == error_code::expired);
    assert(!f.store->stored("m2"));

    std::cout << " OK" << std::endl;
}

void test_conflict_flow() {
    std::cout << "  test_conflict_flow..." << std::flush;

    fixture f;
    f.seed_members();
    engine e(f.store, f.config(), f.clock);
    auto& reconciler = e.watch("members", false);

    e.cache().put(*f.store->stored("m1"));
    auto token = e.cache().begin_optimistic(make_entity("m1", 1, {{"status", "suspended"}, {"name", "Ann"}}));
    auto previous = *f.store->stored("m1");
    auto remote = f.store->update("members", "m1", {{"name", "Annie"}});
    assert(reconciler.apply(test_support::make_event(change_type::update, remote, previous)) ==
           apply_outcome::conflict);
    assert(e.conflicts().pending_count() == 1);
    assert(reconciler.status().pending_conflicts == 1);

    auto record = e.conflicts().pending_for("m1");
    auto merged = e.resolver().resolve(record->id, resolution::merge({"status"}));
    assert(merged.fields["status"] == "suspended");
    assert(merged.fields["name"] == "Annie");
    assert(merged.version > remote.version);
    assert(*f.store->stored("m1") == merged);
    assert(e.cache().get("m1") == merged);
    assert(!e.cache().rollback(token));
    assert(e.conflicts().pending_count() == 0);

    std::cout << " OK" << std::endl;
}

void test_shutdown_stops_everything() {
    std::cout << "  test_shutdown_stops_everything..." << std::flush;

    fixture f;
    f.seed_members();
    engine e(f.store, f.config(), f.clock);
    auto& reconciler = e.watch("members");
    assert(reconciler.running());
    e.cache().put(*f.store->stored("m1"));

    e.shutdown();
    assert(!reconciler.running());
    assert(!e.handle().is_open());
    assert(e.cache().size() == 0);
    assert(error_of([&] { e.watch("plans"); }) == error_code::shut_down);
    assert(error_of([&] { e.coordinator().update("members", "m1", {{"x", 1}}); }) == error_code::shut_down);
    e.shutdown();

    std::cout << " OK" << std::endl;
}

void run_all() {
    std::cout << std::endl;
    std::cout << "--- Engine Tests ---" << std::endl;

    test_optimistic_write_invalidates_read();
    test_context_transition_runs_commands();
    test_network_regained_reconnects_feeds();
    test_bulk_delete_and_undo();
    test_conflict_flow();
    test_shutdown_stops_everything();

    std::cout << "--- Engine Tests: All passed ---" << std::endl;
}

} // namespace engine_tests
