/**
 * @file connection.cpp
 * @brief Implementation of Connection class
 */

#include "stockdb/connection.hpp"
#include "stockdb/statement.hpp"
#include "stockdb/transaction.hpp"

namespace stockdb {

Connection::Connection(const std::string& dbPath, const ConnectionOptions& options)
    : dbPath_(dbPath)
    , options_(options)
{
    openHandle();
}

Connection::~Connection() {
    close();
}

Connection::Connection(Connection&& other) noexcept
    : db_(other.db_)
    , dbPath_(std::move(other.dbPath_))
    , options_(other.options_)
{
    other.db_ = nullptr;
}

Connection& Connection::operator=(Connection&& other) noexcept {
    if (this != &other) {
        close();
        db_ = other.db_;
        dbPath_ = std::move(other.dbPath_);
        options_ = other.options_;
        other.db_ = nullptr;
    }
    return *this;
}

std::unique_ptr<Connection> Connection::open(const std::string& dbPath,
                                             const ConnectionOptions& options) {
    return std::make_unique<Connection>(dbPath, options);
}

std::unique_ptr<Connection> Connection::inMemory(const ConnectionOptions& options) {
    return open(kMemoryPath, options);
}

bool Connection::isEphemeralPath(const std::string& dbPath) {
    return dbPath.empty()
        || dbPath == kMemoryPath
        || dbPath.rfind("file::memory:", 0) == 0;
}

void Connection::openHandle() {
    int flags = 0;

    if (options_.readOnly) {
        flags = SQLITE_OPEN_READONLY;
    } else {
        flags = SQLITE_OPEN_READWRITE;
        if (options_.createIfNotExists) {
            flags |= SQLITE_OPEN_CREATE;
        }
    }

    int result = sqlite3_open_v2(dbPath_.c_str(), &db_, flags, nullptr);

    if (result != SQLITE_OK) {
        std::string error = db_ ? sqlite3_errmsg(db_) : "Unknown error";
        if (db_) {
            sqlite3_close(db_);
            db_ = nullptr;
        }
        throw ConnectionException("Failed to open database '" + dbPath_ + "': " + error, result);
    }

    applyOptions();
}

void Connection::applyOptions() {
    if (options_.extendedResultCodes) {
        sqlite3_extended_result_codes(db_, 1);
    }

    sqlite3_busy_timeout(db_, options_.busyTimeoutMs);

    if (options_.enableForeignKeys) {
        execute("PRAGMA foreign_keys = ON");
    }

    // In-memory databases ignore journal_mode=WAL and stay in "memory" mode
    if (options_.enableWAL && isFileBacked()) {
        execute("PRAGMA journal_mode = WAL");
    }
}

void Connection::close() {
    if (db_) {
        // Statements still owned by live Statement objects keep the old
        // handle alive until they finalize
        sqlite3_close_v2(db_);
        db_ = nullptr;
    }
}

void Connection::reopen() {
    close();
    openHandle();
}

void Connection::execute(const std::string& sql) {
    if (!db_) {
        throw QueryException("Connection is closed", sql);
    }

    char* errMsg = nullptr;
    int result = sqlite3_exec(db_, sql.c_str(), nullptr, nullptr, &errMsg);

    if (result != SQLITE_OK) {
        std::string error = errMsg ? errMsg : sqlite3_errmsg(db_);
        sqlite3_free(errMsg);

        // Extended codes are (base | (N << 8))
        if ((result & 0xFF) == SQLITE_CONSTRAINT) {
            throw ConstraintException(error, result);
        }
        throw QueryException(error, sql, result);
    }
}

Statement Connection::prepare(const std::string& sql) {
    return Statement(*this, sql);
}

Transaction Connection::beginTransaction() {
    return Transaction(*this);
}

int64_t Connection::lastInsertRowId() const {
    return sqlite3_last_insert_rowid(db_);
}

bool Connection::inTransaction() const {
    return db_ != nullptr && sqlite3_get_autocommit(db_) == 0;
}

bool Connection::tableExists(const std::string& tableName) {
    auto stmt = prepare(
        "SELECT 1 FROM sqlite_master WHERE type='table' AND name=?");
    stmt.bind(1, tableName);
    return stmt.step();
}

bool Connection::indexExists(const std::string& indexName) {
    auto stmt = prepare(
        "SELECT 1 FROM sqlite_master WHERE type='index' AND name=?");
    stmt.bind(1, indexName);
    return stmt.step();
}

std::vector<std::string> Connection::indexNames(const std::string& tableName) {
    // PRAGMA arguments cannot be bound; the table-valued form can
    auto stmt = prepare("SELECT name FROM pragma_index_list(?)");
    stmt.bind(1, tableName);

    std::vector<std::string> names;
    while (stmt.step()) {
        names.push_back(stmt.columnString(0));
    }
    return names;
}

void Connection::interrupt() {
    if (db_) {
        sqlite3_interrupt(db_);
    }
}

} // namespace stockdb
