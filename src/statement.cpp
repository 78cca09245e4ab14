/**
 * @file statement.cpp
 * @brief Implementation of Statement class
 */

#include "stockdb/statement.hpp"
#include "stockdb/connection.hpp"
#include <cstring>

namespace stockdb {

Statement::Statement(Connection& conn, const std::string& sql)
    : conn_(&conn)
    , sql_(sql)
{
    if (!conn.isOpen()) {
        throw QueryException("Connection is closed", sql);
    }

    int result = sqlite3_prepare_v2(
        conn.handle(),
        sql.c_str(),
        static_cast<int>(sql.size()),
        &stmt_,
        nullptr
    );

    if (result != SQLITE_OK) {
        throw QueryException(sqlite3_errmsg(conn.handle()), sql, result);
    }
}

Statement::~Statement() {
    finalize();
}

Statement::Statement(Statement&& other) noexcept
    : stmt_(other.stmt_)
    , conn_(other.conn_)
    , sql_(std::move(other.sql_))
{
    other.stmt_ = nullptr;
}

Statement& Statement::operator=(Statement&& other) noexcept {
    if (this != &other) {
        finalize();
        stmt_ = other.stmt_;
        conn_ = other.conn_;
        sql_ = std::move(other.sql_);
        other.stmt_ = nullptr;
    }
    return *this;
}

void Statement::finalize() {
    if (stmt_) {
        sqlite3_finalize(stmt_);
        stmt_ = nullptr;
    }
}

void Statement::checkResult(int result, const std::string& operation) {
    if (result != SQLITE_OK) {
        throw QueryException(
            operation + " failed: " + sqlite3_errmsg(conn_->handle()),
            sql_,
            result
        );
    }
}

// ========== Parameter Binding ==========

Statement& Statement::bind(int index, int value) {
    checkResult(sqlite3_bind_int(stmt_, index, value), "bind int");
    return *this;
}

Statement& Statement::bind(int index, int64_t value) {
    checkResult(sqlite3_bind_int64(stmt_, index, value), "bind int64");
    return *this;
}

Statement& Statement::bind(int index, double value) {
    checkResult(sqlite3_bind_double(stmt_, index, value), "bind double");
    return *this;
}

Statement& Statement::bind(int index, const std::string& value) {
    // SQLITE_TRANSIENT: SQLite keeps its own copy
    checkResult(
        sqlite3_bind_text(stmt_, index, value.c_str(),
                          static_cast<int>(value.size()), SQLITE_TRANSIENT),
        "bind text"
    );
    return *this;
}

Statement& Statement::bind(int index, const char* value) {
    if (value == nullptr) {
        return bind(index, null);
    }
    checkResult(
        sqlite3_bind_text(stmt_, index, value,
                          static_cast<int>(std::strlen(value)), SQLITE_TRANSIENT),
        "bind text"
    );
    return *this;
}

Statement& Statement::bind(int index, NullValue) {
    checkResult(sqlite3_bind_null(stmt_, index), "bind null");
    return *this;
}

Statement& Statement::bind(int index, const std::optional<std::string>& value) {
    if (!value) {
        return bind(index, null);
    }
    return bind(index, *value);
}

// ========== Execution ==========

void Statement::execute() {
    int result = sqlite3_step(stmt_);

    if (result != SQLITE_DONE && result != SQLITE_ROW) {
        std::string error = sqlite3_errmsg(conn_->handle());
        sqlite3_reset(stmt_);
        if ((result & 0xFF) == SQLITE_CONSTRAINT) {
            throw ConstraintException(error, result);
        }
        throw QueryException(error, sql_, result);
    }

    sqlite3_reset(stmt_);
}

bool Statement::step() {
    int result = sqlite3_step(stmt_);

    if (result == SQLITE_ROW) {
        return true;
    } else if (result == SQLITE_DONE) {
        return false;
    } else {
        throw QueryException(sqlite3_errmsg(conn_->handle()), sql_, result);
    }
}

// ========== Column Access ==========

bool Statement::isNull(int index) const {
    return sqlite3_column_type(stmt_, index) == SQLITE_NULL;
}

int Statement::columnInt(int index) const {
    return sqlite3_column_int(stmt_, index);
}

int64_t Statement::columnInt64(int index) const {
    return sqlite3_column_int64(stmt_, index);
}

double Statement::columnDouble(int index) const {
    return sqlite3_column_double(stmt_, index);
}

std::string Statement::columnString(int index) const {
    const unsigned char* text = sqlite3_column_text(stmt_, index);
    int size = sqlite3_column_bytes(stmt_, index);
    if (text == nullptr) {
        return "";
    }
    return std::string(reinterpret_cast<const char*>(text), size);
}

std::optional<int64_t> Statement::columnOptionalInt64(int index) const {
    if (isNull(index)) {
        return std::nullopt;
    }
    return columnInt64(index);
}

std::optional<std::string> Statement::columnOptionalString(int index) const {
    if (isNull(index)) {
        return std::nullopt;
    }
    return columnString(index);
}

} // namespace stockdb
