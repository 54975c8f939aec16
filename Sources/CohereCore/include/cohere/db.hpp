#pragma once

#ifdef __cplusplus

#include "error.hpp"
#include <sqlite3.h>
#include <cstdint>
#include <optional>
#include <string>
#include <unordered_map>
#include <variant>
#include <vector>

namespace cohere {

// SQLite column value
using column_value_t = std::variant<
    std::nullptr_t,
    int64_t,
    double,
    std::string,
    std::vector<uint8_t>
>;

// ============================================================================
// database - Thin owner of one SQLite connection
// ============================================================================

class database {
public:
    using row_t = std::unordered_map<std::string, column_value_t>;

    /// Opens (creating if needed) the database at `path`; ":memory:" for a
    /// private in-memory database.
    explicit database(const std::string& path);
    ~database();

    database(const database&) = delete;
    database& operator=(const database&) = delete;

    database(database&& other) noexcept;
    database& operator=(database&& other) noexcept;

    // Execute SQL with optional params (no result rows)
    void execute(const std::string& sql, const std::vector<column_value_t>& params = {});

    // Rows as column-name maps
    std::vector<row_t> query(const std::string& sql, const std::vector<column_value_t>& params = {});

    // Transaction support
    void begin_transaction();
    void commit();
    void rollback();
    [[nodiscard]] bool is_in_transaction() const;

private:
    void bind_value(sqlite3_stmt* stmt, int index, const column_value_t& value);
    column_value_t extract_column(sqlite3_stmt* stmt, int index);

    sqlite3* db_ = nullptr;
};

// RAII transaction guard; rolls back unless committed
class transaction {
public:
    explicit transaction(database& db);
    ~transaction();

    transaction(const transaction&) = delete;
    transaction& operator=(const transaction&) = delete;

    void commit();
    void rollback();

private:
    database& db_;
    bool completed_ = false;
};

// Typed column access; nullopt for NULL, missing or differently-typed values
std::optional<std::string> text_column(const database::row_t& row, const std::string& name);
std::optional<int64_t> int_column(const database::row_t& row, const std::string& name);

} // namespace cohere

#endif // __cplusplus
