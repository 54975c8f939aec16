#include "cohere/types.hpp"
#include <set>

namespace cohere {

nlohmann::json entity::to_json() const {
    return nlohmann::json{
        {"id", id},
        {"table", table},
        {"version", version},
        {"fields", fields}
    };
}

std::optional<entity> entity::from_json(const nlohmann::json& j) {
    if (!j.is_object()) return std::nullopt;
    if (!j.contains("id") || !j["id"].is_string()) return std::nullopt;
    if (!j.contains("version") || !j["version"].is_number_integer()) return std::nullopt;

    entity e;
    e.id = j["id"].get<std::string>();
    e.version = j["version"].get<version_t>();
    if (j.contains("table") && j["table"].is_string()) {
        e.table = j["table"].get<std::string>();
    }
    if (j.contains("fields")) {
        if (!j["fields"].is_object()) return std::nullopt;
        e.fields = j["fields"];
    }
    return e;
}

std::optional<change_type> parse_change_type(const std::string& name) {
    if (name == "INSERT") return change_type::insert;
    if (name == "UPDATE") return change_type::update;
    if (name == "DELETE") return change_type::remove;
    return std::nullopt;
}

std::vector<std::string> changed_fields(const nlohmann::json& before, const nlohmann::json& after) {
    std::set<std::string> names;
    if (before.is_object()) {
        for (auto it = before.begin(); it != before.end(); ++it) {
            if (!after.is_object() || !after.contains(it.key()) || after[it.key()] != it.value()) {
                names.insert(it.key());
            }
        }
    }
    if (after.is_object()) {
        for (auto it = after.begin(); it != after.end(); ++it) {
            if (!before.is_object() || !before.contains(it.key())) {
                names.insert(it.key());
            }
        }
    }
    return {names.begin(), names.end()};
}

std::string field_text(const nlohmann::json& value) {
    if (value.is_string()) return value.get<std::string>();
    return value.dump();
}

} // namespace cohere
