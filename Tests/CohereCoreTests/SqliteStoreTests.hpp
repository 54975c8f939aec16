#pragma once

#include "TestSupport.hpp"
#include <filesystem>

namespace sqlite_store_tests {

using namespace cohere;
using test_support::error_of;
using namespace std::chrono_literals;

void test_database_transactions() {
    std::cout << "  test_database_transactions..." << std::flush;

    database db(":memory:");
    db.execute("CREATE TABLE t (k TEXT PRIMARY KEY, v INTEGER)");

    // Unwinding an open transaction rolls it back
    bool unwound = false;
    try {
        transaction tx(db);
        db.execute("INSERT INTO t (k, v) VALUES (?, ?)", {std::string("a"), int64_t(1)});
        assert(db.is_in_transaction());
        throw std::runtime_error("abort");
    } catch (const std::runtime_error& e) {
        unwound = std::string(e.what()) == "abort";
    }
    assert(unwound);
    assert(!db.is_in_transaction());
    assert(db.query("SELECT k FROM t").empty());

    {
        transaction tx(db);
        db.execute("INSERT INTO t (k, v) VALUES (?, ?)", {std::string("b"), int64_t(2)});
        tx.commit();
    }
    auto rows = db.query("SELECT k, v FROM t");
    assert(rows.size() == 1);
    assert(text_column(rows[0], "k") == "b");
    assert(int_column(rows[0], "v") == 2);
    assert(!text_column(rows[0], "v"));
    assert(!int_column(rows[0], "missing"));

    assert(error_of([&] { db.execute("INSERT INTO nowhere VALUES (1)"); }) == error_code::storage);

    std::cout << " OK" << std::endl;
}

void test_crud_and_versions() {
    std::cout << "  test_crud_and_versions..." << std::flush;

    sqlite_remote_store store(":memory:", test_support::make_clock());
    auto a = store.create("members", {{"name", "Ann"}, {"status", "active"}});
    auto b = store.create("members", {{"name", "Bo"}, {"status", "inactive"}});
    assert(!a.id.empty());
    assert(a.id != b.id);
    assert(b.version > a.version);
    assert(store.fetch_one("members", a.id) == a);

    auto updated = store.update("members", a.id, {{"status", "suspended"}, {"name", nullptr}});
    assert(updated.version > b.version);
    assert(updated.fields == nlohmann::json({{"status", "suspended"}}));
    assert(store.fetch_one("members", a.id) == updated);

    // Same id in another table is a different entity
    assert(error_of([&] { store.fetch_one("plans", a.id); }) == error_code::not_found);

    store.remove("members", a.id);
    assert(error_of([&] { store.fetch_one("members", a.id); }) == error_code::not_found);
    assert(error_of([&] { store.remove("members", a.id); }) == error_code::not_found);
    assert(error_of([&] { store.update("members", a.id, {{"x", 1}}); }) == error_code::not_found);

    std::cout << " OK" << std::endl;
}

void test_write_preconditions() {
    std::cout << "  test_write_preconditions..." << std::flush;

    sqlite_remote_store store;
    auto a = store.create("members", {{"name", "Ann"}}, std::string("m1"));
    assert(a.id == "m1");
    assert(error_of([&] { store.create("members", {{"name", "again"}}, std::string("m1")); }) ==
           error_code::conflict);
    assert(error_of([&] { store.update("members", "m1", {{"x", 1}}, a.version + 7); }) == error_code::conflict);
    assert(store.update("members", "m1", {{"x", 1}}, a.version).fields["x"] == 1);
    assert(error_of([&] { store.create("members", nlohmann::json::array()); }) == error_code::validation);

    store.set_validator([](const std::string& table, const nlohmann::json& fields) -> std::optional<std::string> {
        if (table == "members" && !fields.contains("name")) return std::string("name is required");
        return std::nullopt;
    });
    assert(error_of([&] { store.create("members", {{"status", "active"}}); }) == error_code::validation);
    assert(error_of([&] { store.update("members", "m1", {{"name", nullptr}}); }) == error_code::validation);
    assert(store.fetch_one("members", "m1").fields["name"] == "Ann");
    store.create("plans", {{"tier", "gold"}});

    std::cout << " OK" << std::endl;
}

void test_collection_queries() {
    std::cout << "  test_collection_queries..." << std::flush;

    sqlite_remote_store store;
    for (int i = 1; i <= 5; ++i) {
        store.create("members", {{"n", i}, {"status", i % 2 ? "active" : "inactive"}});
    }
    store.create("plans", {{"n", 99}, {"status", "active"}});

    collection_query query;
    query.table = "members";
    query.filter = {{"status", "active"}};
    query.order = sort_order{"n", true};
    auto active = store.fetch_collection(query);
    assert(active.size() == 3);
    assert(active[0].fields["n"] == 5);
    assert(active[2].fields["n"] == 1);

    query.limit = 1;
    query.offset = 1;
    auto page = store.fetch_collection(query);
    assert(page.size() == 1);
    assert(page[0].fields["n"] == 3);

    collection_query everything;
    everything.table = "members";
    assert(store.fetch_collection(everything).size() == 5);

    std::cout << " OK" << std::endl;
}

void test_change_feed() {
    std::cout << "  test_change_feed..." << std::flush;

    sqlite_remote_store store;
    auto before = store.create("members", {{"name", "Ann"}});
    auto subscription = store.subscribe_changes("members");

    // Nothing from before the subscription is replayed
    assert(!subscription->next(20ms));

    auto created = store.create("members", {{"name", "Bo"}});
    store.create("plans", {{"tier", "gold"}});
    auto updated = store.update("members", before.id, {{"name", "Ann B"}});
    store.remove("members", created.id);

    auto first = subscription->next(500ms);
    assert(first && first->type == feed_message::kind::event);
    assert(first->event->type == change_type::insert);
    assert(first->event->value == created);

    auto second = subscription->next(500ms);
    assert(second->event->type == change_type::update);
    assert(second->event->value == updated);
    assert(second->event->previous->fields["name"] == "Ann");

    auto third = subscription->next(500ms);
    assert(third->event->type == change_type::remove);
    assert(third->event->value.id == created.id);
    assert(third->event->value.version > updated.version);

    assert(!subscription->next(20ms));
    subscription->close();
    auto closed = subscription->next(20ms);
    assert(closed && closed->type == feed_message::kind::closed);

    std::cout << " OK" << std::endl;
}

void test_reconciler_over_sqlite() {
    std::cout << "  test_reconciler_over_sqlite..." << std::flush;

    auto clock = test_support::make_clock();
    auto store = std::make_shared<sqlite_remote_store>(":memory:", clock);
    auto handle = cache_handle::init(clock);
    change_reconciler reconciler(handle, store, std::make_shared<conflict_store>(clock), "members");

    auto ann = store->create("members", {{"name", "Ann"}});
    handle->put(ann);
    assert(reconciler.connect());
    auto renamed = store->update("members", ann.id, {{"name", "Ann B"}});
    assert(reconciler.step(500ms));
    assert(handle->get(ann.id) == renamed);

    std::cout << " OK" << std::endl;
}

void test_data_survives_reopen() {
    std::cout << "  test_data_survives_reopen..." << std::flush;

    auto path = std::filesystem::temp_directory_path() / ("cohere_store_" + uuid_t::generate().to_string() + ".sqlite");
    entity saved;
    {
        sqlite_remote_store store(path.string());
        saved = store.create("members", {{"name", "Ann"}});
    }
    {
        sqlite_remote_store store(path.string());
        assert(store.fetch_one("members", saved.id) == saved);
        auto next = store.create("members", {{"name", "Bo"}});
        assert(next.version > saved.version);
        assert(store.latest_change() == 2);
    }
    std::filesystem::remove(path);

    std::cout << " OK" << std::endl;
}

void run_all() {
    std::cout << std::endl;
    std::cout << "--- SQLite Store Tests ---" << std::endl;

    test_database_transactions();
    test_crud_and_versions();
    test_write_preconditions();
    test_collection_queries();
    test_change_feed();
    test_reconciler_over_sqlite();
    test_data_survives_reopen();

    std::cout << "--- SQLite Store Tests: All passed ---" << std::endl;
}

} // namespace sqlite_store_tests
