#include "cohere/config.hpp"

namespace cohere {

namespace {

using ms = std::chrono::milliseconds;

// Each reader leaves `out` untouched when the key is absent and returns
// false when it is present with the wrong type.

bool read_duration(const nlohmann::json& j, const char* key, ms& out) {
    if (!j.contains(key)) return true;
    const auto& v = j[key];
    if (!v.is_number_integer() || v.get<int64_t>() < 0) return false;
    out = ms(v.get<int64_t>());
    return true;
}

bool read_size(const nlohmann::json& j, const char* key, size_t& out) {
    if (!j.contains(key)) return true;
    const auto& v = j[key];
    if (!v.is_number_integer() || v.get<int64_t>() < 0) return false;
    out = v.get<size_t>();
    return true;
}

bool read_section(const nlohmann::json& j, const char* key, const nlohmann::json*& out) {
    out = nullptr;
    if (!j.contains(key)) return true;
    if (!j[key].is_object()) return false;
    out = &j[key];
    return true;
}

} // namespace

nlohmann::json engine_config::to_json() const {
    return nlohmann::json{
        {"batch", {
            {"batch_size", batch.batch_size},
            {"inter_batch_delay_ms", batch.inter_batch_delay.count()},
            {"workers", batch.workers},
            {"fetch_batch_size", batch.fetch_batch_size},
            {"soft_delete_patch", batch.soft_delete_patch}
        }},
        {"mutation", {
            {"timeout_ms", mutation.timeout.count()},
            {"remote_workers", mutation.remote_workers}
        }},
        {"feed", {
            {"base_delay_ms", feed.base_delay.count()},
            {"max_delay_ms", feed.max_delay.count()},
            {"max_attempts", feed.max_attempts},
            {"poll_interval_ms", feed.poll_interval.count()}
        }},
        {"staleness", {
            {"focus_throttle_ms", staleness.focus_throttle.count()},
            {"detail_retention_ms", staleness.detail_retention.count()},
            {"stale_time_ms", staleness.stale_time.count()},
            {"sync_interval_ms", staleness.sync_interval.count()},
            {"default_max_age_ms", staleness.default_max_age.count()},
            {"detail_max_age_ms", staleness.detail_max_age.count()}
        }},
        {"undo", {
            {"ttl_ms", undo.ttl.count()}
        }},
        {"log_level", to_string(level)}
    };
}

std::optional<engine_config> engine_config::from_json(const std::string& text) {
    auto j = nlohmann::json::parse(text, nullptr, false);
    if (j.is_discarded()) return std::nullopt;
    return from_document(j);
}

std::optional<engine_config> engine_config::from_document(const nlohmann::json& j) {
    if (!j.is_object()) return std::nullopt;
    engine_config config;
    const nlohmann::json* section = nullptr;

    if (!read_section(j, "batch", section)) return std::nullopt;
    if (section) {
        if (!read_size(*section, "batch_size", config.batch.batch_size)) return std::nullopt;
        if (!read_duration(*section, "inter_batch_delay_ms", config.batch.inter_batch_delay)) return std::nullopt;
        if (!read_size(*section, "workers", config.batch.workers)) return std::nullopt;
        if (!read_size(*section, "fetch_batch_size", config.batch.fetch_batch_size)) return std::nullopt;
        if (section->contains("soft_delete_patch")) {
            if (!(*section)["soft_delete_patch"].is_object()) return std::nullopt;
            config.batch.soft_delete_patch = (*section)["soft_delete_patch"];
        }
    }

    if (!read_section(j, "mutation", section)) return std::nullopt;
    if (section) {
        if (!read_duration(*section, "timeout_ms", config.mutation.timeout)) return std::nullopt;
        if (!read_size(*section, "remote_workers", config.mutation.remote_workers)) return std::nullopt;
    }

    if (!read_section(j, "feed", section)) return std::nullopt;
    if (section) {
        if (!read_duration(*section, "base_delay_ms", config.feed.base_delay)) return std::nullopt;
        if (!read_duration(*section, "max_delay_ms", config.feed.max_delay)) return std::nullopt;
        if (!read_size(*section, "max_attempts", config.feed.max_attempts)) return std::nullopt;
        if (!read_duration(*section, "poll_interval_ms", config.feed.poll_interval)) return std::nullopt;
    }

    if (!read_section(j, "staleness", section)) return std::nullopt;
    if (section) {
        auto& s = config.staleness;
        if (!read_duration(*section, "focus_throttle_ms", s.focus_throttle)) return std::nullopt;
        if (!read_duration(*section, "detail_retention_ms", s.detail_retention)) return std::nullopt;
        if (!read_duration(*section, "stale_time_ms", s.stale_time)) return std::nullopt;
        if (!read_duration(*section, "sync_interval_ms", s.sync_interval)) return std::nullopt;
        if (!read_duration(*section, "default_max_age_ms", s.default_max_age)) return std::nullopt;
        if (!read_duration(*section, "detail_max_age_ms", s.detail_max_age)) return std::nullopt;
    }

    if (!read_section(j, "undo", section)) return std::nullopt;
    if (section) {
        if (!read_duration(*section, "ttl_ms", config.undo.ttl)) return std::nullopt;
    }

    if (j.contains("log_level")) {
        if (!j["log_level"].is_string()) return std::nullopt;
        auto level = parse_log_level(j["log_level"].get<std::string>());
        if (!level) return std::nullopt;
        config.level = *level;
    }
    return config;
}

} // namespace cohere
