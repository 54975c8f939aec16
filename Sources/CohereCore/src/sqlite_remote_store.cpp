#include "cohere/sqlite_remote_store.hpp"
#include "cohere/log.hpp"
#include <atomic>
#include <deque>
#include <thread>

namespace cohere {

namespace {

nlohmann::json parse_payload(const std::string& text) {
    auto parsed = nlohmann::json::parse(text, nullptr, false);
    if (parsed.is_discarded()) {
        LOG_ERROR("store", "Corrupt JSON payload in store");
        throw db_error("Corrupt JSON payload in store");
    }
    return parsed;
}

entity entity_from_row(const database::row_t& row, const std::string& table) {
    entity e;
    e.table = table;
    e.id = text_column(row, "id").value_or("");
    e.version = int_column(row, "version").value_or(0);
    e.fields = parse_payload(text_column(row, "fields").value_or("{}"));
    return e;
}

// Tails ChangeLog for one table. Polls in short slices until the caller's
// timeout elapses.
class sqlite_change_subscription : public change_subscription {
public:
    sqlite_change_subscription(sqlite_remote_store& store, std::string table, int64_t cursor)
        : store_(store), table_(std::move(table)), cursor_(cursor) {}

    std::optional<feed_message> next(std::chrono::milliseconds timeout) override {
        if (closed_) {
            return feed_message::failure(feed_message::kind::closed, "subscription closed");
        }
        auto deadline = std::chrono::steady_clock::now() + timeout;
        while (buffer_.empty()) {
            try {
                for (auto& [seq, event] : store_.changes_after(table_, cursor_)) {
                    cursor_ = seq;
                    buffer_.push_back(std::move(event));
                }
            } catch (const db_error& e) {
                return feed_message::failure(feed_message::kind::error, e.what());
            }
            if (!buffer_.empty() || closed_) break;
            auto now = std::chrono::steady_clock::now();
            if (now >= deadline) return std::nullopt;
            std::this_thread::sleep_for(std::min<std::chrono::steady_clock::duration>(
                deadline - now, std::chrono::milliseconds(5)));
        }
        if (buffer_.empty()) {
            return feed_message::failure(feed_message::kind::closed, "subscription closed");
        }
        auto event = std::move(buffer_.front());
        buffer_.pop_front();
        return feed_message::of(std::move(event));
    }

    void close() override { closed_ = true; }

private:
    sqlite_remote_store& store_;
    std::string table_;
    int64_t cursor_;
    std::deque<change_event> buffer_;
    std::atomic<bool> closed_{false};
};

} // namespace

sqlite_remote_store::sqlite_remote_store(const std::string& path, shared_clock clk)
    : clock_(clk ? std::move(clk) : make_system_clock()), db_(path) {
    ensure_schema();
}

void sqlite_remote_store::ensure_schema() {
    std::lock_guard<std::mutex> lock(mutex_);
    db_.execute(
        "CREATE TABLE IF NOT EXISTS Entity ("
        "tableName TEXT NOT NULL, "
        "id TEXT NOT NULL, "
        "version INTEGER NOT NULL, "
        "fields TEXT NOT NULL, "
        "PRIMARY KEY (tableName, id))");
    db_.execute(
        "CREATE TABLE IF NOT EXISTS ChangeLog ("
        "seq INTEGER PRIMARY KEY AUTOINCREMENT, "
        "tableName TEXT NOT NULL, "
        "event TEXT NOT NULL)");
    db_.execute("CREATE INDEX IF NOT EXISTS ChangeLog_table ON ChangeLog (tableName, seq)");
    db_.execute(
        "CREATE TABLE IF NOT EXISTS _VersionSequence ("
        "id INTEGER PRIMARY KEY CHECK (id = 1), "
        "value INTEGER NOT NULL)");
    db_.execute("INSERT OR IGNORE INTO _VersionSequence (id, value) VALUES (1, 0)");
}

void sqlite_remote_store::set_validator(validator v) {
    std::lock_guard<std::mutex> lock(mutex_);
    validator_ = std::move(v);
}

void sqlite_remote_store::validate(const std::string& table, const nlohmann::json& fields) const {
    if (!fields.is_object()) {
        throw engine_error(error_code::validation, "payload must be an object");
    }
    if (validator_) {
        if (auto problem = validator_(table, fields)) {
            throw engine_error(error_code::validation, *problem);
        }
    }
}

std::optional<entity> sqlite_remote_store::load_locked(const std::string& table, const entity_id& id) {
    auto rows = db_.query("SELECT id, version, fields FROM Entity WHERE tableName = ? AND id = ?",
                          {table, id});
    if (rows.empty()) return std::nullopt;
    return entity_from_row(rows.front(), table);
}

version_t sqlite_remote_store::next_version_locked() {
    db_.execute("UPDATE _VersionSequence SET value = value + 1 WHERE id = 1");
    auto rows = db_.query("SELECT value FROM _VersionSequence WHERE id = 1");
    if (rows.empty()) {
        throw db_error("Version sequence missing");
    }
    return int_column(rows.front(), "value").value_or(0);
}

void sqlite_remote_store::log_change_locked(change_type type, const entity& value,
                                            const std::optional<entity>& previous) {
    change_event e;
    e.type = type;
    e.value = value;
    e.previous = previous;
    e.committed_at = clock_->now();
    db_.execute("INSERT INTO ChangeLog (tableName, event) VALUES (?, ?)",
                {value.table, e.to_json().dump()});
}

entity sqlite_remote_store::fetch_one(const std::string& table, const entity_id& id) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto found = load_locked(table, id);
    if (!found) {
        throw engine_error(error_code::not_found, id + " not found");
    }
    return *found;
}

std::vector<entity> sqlite_remote_store::fetch_collection(const collection_query& query) {
    std::vector<entity> all;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto rows = db_.query("SELECT id, version, fields FROM Entity WHERE tableName = ? ORDER BY id",
                              {query.table});
        all.reserve(rows.size());
        for (const auto& row : rows) {
            all.push_back(entity_from_row(row, query.table));
        }
    }
    return apply_query(std::move(all), query);
}

entity sqlite_remote_store::create(const std::string& table, const nlohmann::json& payload,
                                   const std::optional<entity_id>& id) {
    std::lock_guard<std::mutex> lock(mutex_);
    validate(table, payload);

    transaction tx(db_);
    entity e;
    e.table = table;
    e.id = id ? *id : uuid_t::generate().to_string();
    if (load_locked(table, e.id)) {
        throw engine_error(error_code::conflict, e.id + " already exists");
    }
    e.version = next_version_locked();
    e.fields = payload;
    db_.execute("INSERT INTO Entity (tableName, id, version, fields) VALUES (?, ?, ?, ?)",
                {table, e.id, static_cast<int64_t>(e.version), e.fields.dump()});
    log_change_locked(change_type::insert, e, std::nullopt);
    tx.commit();

    LOG_DEBUG("store", "Created %s/%s v%lld", table.c_str(), e.id.c_str(), (long long)e.version);
    return e;
}

entity sqlite_remote_store::update(const std::string& table, const entity_id& id, const nlohmann::json& patch,
                                   std::optional<version_t> expected_version) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!patch.is_object()) {
        throw engine_error(error_code::validation, "patch must be an object");
    }

    transaction tx(db_);
    auto current = load_locked(table, id);
    if (!current) {
        throw engine_error(error_code::not_found, id + " not found");
    }
    if (expected_version && *expected_version != current->version) {
        throw engine_error(error_code::conflict,
                           "version mismatch for " + id + ": expected " + std::to_string(*expected_version) +
                           ", found " + std::to_string(current->version));
    }

    entity updated = *current;
    updated.fields.merge_patch(patch);
    validate(table, updated.fields);
    updated.version = next_version_locked();
    db_.execute("UPDATE Entity SET version = ?, fields = ? WHERE tableName = ? AND id = ?",
                {static_cast<int64_t>(updated.version), updated.fields.dump(), table, id});
    log_change_locked(change_type::update, updated, current);
    tx.commit();
    return updated;
}

void sqlite_remote_store::remove(const std::string& table, const entity_id& id) {
    std::lock_guard<std::mutex> lock(mutex_);
    transaction tx(db_);
    auto current = load_locked(table, id);
    if (!current) {
        throw engine_error(error_code::not_found, id + " not found");
    }
    db_.execute("DELETE FROM Entity WHERE tableName = ? AND id = ?", {table, id});
    entity removed = *current;
    removed.version = next_version_locked();
    log_change_locked(change_type::remove, removed, current);
    tx.commit();
}

std::unique_ptr<change_subscription> sqlite_remote_store::subscribe_changes(const std::string& table) {
    int64_t cursor = latest_change();
    LOG_DEBUG("store", "Subscribing to %s after change #%lld", table.c_str(), (long long)cursor);
    return std::make_unique<sqlite_change_subscription>(*this, table, cursor);
}

std::vector<std::pair<int64_t, change_event>> sqlite_remote_store::changes_after(const std::string& table,
                                                                                 int64_t cursor, size_t limit) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto rows = db_.query("SELECT seq, event FROM ChangeLog WHERE tableName = ? AND seq > ? ORDER BY seq LIMIT ?",
                          {table, cursor, static_cast<int64_t>(limit)});
    std::vector<std::pair<int64_t, change_event>> result;
    result.reserve(rows.size());
    for (const auto& row : rows) {
        auto seq = int_column(row, "seq").value_or(cursor);
        auto event = change_event::from_json(parse_payload(text_column(row, "event").value_or("{}")));
        if (!event) {
            LOG_WARN("store", "Skipping undecodable change #%lld", (long long)seq);
            cursor = seq;
            continue;
        }
        result.emplace_back(seq, std::move(*event));
    }
    return result;
}

int64_t sqlite_remote_store::latest_change() {
    std::lock_guard<std::mutex> lock(mutex_);
    auto rows = db_.query("SELECT COALESCE(MAX(seq), 0) AS seq FROM ChangeLog");
    if (rows.empty()) return 0;
    return int_column(rows.front(), "seq").value_or(0);
}

} // namespace cohere
