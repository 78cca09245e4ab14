/**
 * @file statement.hpp
 * @brief Prepared statement with typed parameter binding
 *
 * The engine's own bookkeeping (tracking tables, log rows, backup
 * catalogue) always goes through prepared statements with bound
 * parameters. Only migration procedures, which are hand-authored DDL,
 * reach the database as flattened SQL text via StatementAdapter.
 *
 *   auto stmt = conn.prepare("INSERT INTO __migrations (id, name) VALUES (?, ?)");
 *   stmt.bind(1, migration.id).bind(2, migration.name).execute();
 */

#pragma once

#include <string>
#include <vector>
#include <optional>
#include <variant>
#include <cstdint>
#include <sqlite3.h>
#include "exceptions.hpp"

namespace stockdb {

class Connection;

/**
 * @brief Sentinel for SQL NULL
 */
struct NullValue {};
static constexpr NullValue null{};

/**
 * @brief A single SQLite value
 *
 * NULL -> NullValue, INTEGER -> int64_t, REAL -> double,
 * TEXT -> std::string, BLOB -> std::vector<uint8_t>
 */
using Value = std::variant<NullValue, int64_t, double, std::string, std::vector<uint8_t>>;

/**
 * @brief RAII wrapper for sqlite3_stmt
 *
 * Parameters are 1-indexed, columns 0-indexed (SQLite convention).
 * The parent Connection must outlive the statement.
 */
class Statement {
public:
    /**
     * @throws QueryException if the SQL does not compile
     */
    Statement(Connection& conn, const std::string& sql);

    ~Statement();

    Statement(const Statement&) = delete;
    Statement& operator=(const Statement&) = delete;

    Statement(Statement&& other) noexcept;
    Statement& operator=(Statement&& other) noexcept;

    // ========== Parameter Binding ==========

    Statement& bind(int index, int value);
    Statement& bind(int index, int64_t value);
    Statement& bind(int index, double value);
    Statement& bind(int index, const std::string& value);
    Statement& bind(int index, const char* value);
    Statement& bind(int index, NullValue);

    /**
     * @brief Bind a value, or NULL when the optional is empty
     */
    Statement& bind(int index, const std::optional<std::string>& value);

    // ========== Execution ==========

    /**
     * @brief Run a statement that returns no rows, then reset it
     * @throws ConstraintException / QueryException
     */
    void execute();

    /**
     * @brief Step to the next result row
     * @return true if a row is available, false when done
     */
    bool step();

    // ========== Column Access ==========

    bool isNull(int index) const;

    int columnInt(int index) const;
    int64_t columnInt64(int index) const;
    double columnDouble(int index) const;
    std::string columnString(int index) const;

    std::optional<int64_t> columnOptionalInt64(int index) const;
    std::optional<std::string> columnOptionalString(int index) const;

    const std::string& sql() const { return sql_; }

private:
    void checkResult(int result, const std::string& operation);
    void finalize();

    sqlite3_stmt* stmt_ = nullptr;
    Connection* conn_;
    std::string sql_;
};

} // namespace stockdb
