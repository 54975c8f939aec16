#pragma once

#include "TestSupport.hpp"

namespace config_tests {

using namespace cohere;
using namespace std::chrono_literals;

void test_defaults() {
    std::cout << "  test_defaults..." << std::flush;

    engine_config config;
    assert(config.batch.batch_size == 50);
    assert(config.batch.fetch_batch_size == 100);
    assert(config.batch.soft_delete_patch["status"] == "inactive");
    assert(config.mutation.timeout == 0ms);
    assert(config.feed.base_delay == 1s);
    assert(config.feed.max_delay == 30s);
    assert(config.feed.max_attempts == 5);
    assert(config.staleness.focus_throttle == 5min);
    assert(config.staleness.stale_time == 60s);
    assert(config.undo.ttl == 5min);
    assert(config.level == log_level::warn);

    std::cout << " OK" << std::endl;
}

void test_partial_document() {
    std::cout << "  test_partial_document..." << std::flush;

    auto config = engine_config::from_json(R"({
        "batch": {"batch_size": 25, "inter_batch_delay_ms": 200},
        "feed": {"max_attempts": 8},
        "undo": {"ttl_ms": 60000},
        "log_level": "debug"
    })");
    assert(config);
    assert(config->batch.batch_size == 25);
    assert(config->batch.inter_batch_delay == 200ms);
    assert(config->batch.workers == 8);
    assert(config->feed.max_attempts == 8);
    assert(config->feed.base_delay == 1s);
    assert(config->undo.ttl == 1min);
    assert(config->level == log_level::debug);

    assert(engine_config::from_json("{}"));

    auto built = engine_config::from_document(nlohmann::json{{"mutation", {{"timeout_ms", 250}}}});
    assert(built);
    assert(built->mutation.timeout == 250ms);

    std::cout << " OK" << std::endl;
}

void test_rejects_malformed_documents() {
    std::cout << "  test_rejects_malformed_documents..." << std::flush;

    assert(!engine_config::from_json("not json"));
    assert(!engine_config::from_json("[1, 2]"));
    assert(!engine_config::from_json(R"({"batch": 5})"));
    assert(!engine_config::from_json(R"({"batch": {"batch_size": "ten"}})"));
    assert(!engine_config::from_json(R"({"batch": {"batch_size": -1}})"));
    assert(!engine_config::from_json(R"({"feed": {"base_delay_ms": 1.5}})"));
    assert(!engine_config::from_json(R"({"batch": {"soft_delete_patch": "deleted"}})"));
    assert(!engine_config::from_json(R"({"log_level": "verbose"})"));
    assert(!engine_config::from_json(R"({"log_level": 3})"));

    std::cout << " OK" << std::endl;
}

void test_json_round_trip() {
    std::cout << "  test_json_round_trip..." << std::flush;

    engine_config config;
    config.batch.soft_delete_patch = {{"archived", true}};
    config.mutation.timeout = 1500ms;
    config.staleness.detail_retention = 2min;
    config.level = log_level::info;

    auto parsed = engine_config::from_json(config.to_json().dump());
    assert(parsed);
    assert(parsed->to_json() == config.to_json());
    assert(parsed->mutation.timeout == 1500ms);
    assert(parsed->batch.soft_delete_patch["archived"] == true);

    std::cout << " OK" << std::endl;
}

void run_all() {
    std::cout << std::endl;
    std::cout << "--- Config Tests ---" << std::endl;

    test_defaults();
    test_partial_document();
    test_rejects_malformed_documents();
    test_json_round_trip();

    std::cout << "--- Config Tests: All passed ---" << std::endl;
}

} // namespace config_tests
