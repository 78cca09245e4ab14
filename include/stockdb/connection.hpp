/**
 * @file connection.hpp
 * @brief RAII connection to the dashboard's SQLite database
 *
 * The migration engine talks to exactly one embedded SQLite database
 * through a single Connection. Two properties matter beyond a plain
 * open/close wrapper:
 *
 * - The connection can be closed and re-opened in place (reopen()). The
 *   backup store needs this to overwrite the live database file while
 *   everything else keeps holding the same Connection reference.
 *
 * - The location ":memory:" (or an empty path) is an ephemeral database.
 *   Such databases have no file to back up, so isFileBacked() is false
 *   and the backup store turns into a no-op.
 */

#pragma once

#include <string>
#include <vector>
#include <memory>
#include <sqlite3.h>
#include "exceptions.hpp"

namespace stockdb {

/**
 * @brief Configuration options for database connection
 *
 *   ConnectionOptions opts;
 *   opts.enableWAL = false;
 *   opts.busyTimeoutMs = 30000;
 *   auto conn = Connection::open("dashboard.db", opts);
 */
struct ConnectionOptions {
    // Write-Ahead Logging; backups checkpoint the WAL before copying
    bool enableWAL = true;

    // Timeout when database is locked by another connection
    int busyTimeoutMs = 5000;

    // Foreign key enforcement is off by default in SQLite
    bool enableForeignKeys = true;

    bool readOnly = false;

    bool createIfNotExists = true;

    bool extendedResultCodes = true;
};

class Statement;
class Transaction;

/**
 * @brief RAII wrapper for a SQLite database connection
 *
 * Non-copyable, moveable. The destructor finalizes dangling statements
 * and closes the handle.
 */
class Connection {
public:
    static constexpr const char* kMemoryPath = ":memory:";

    /**
     * @brief Open a database connection
     * @param dbPath Path to database file, or ":memory:" for in-memory DB
     * @param options Connection configuration
     * @throws ConnectionException if opening fails
     */
    explicit Connection(const std::string& dbPath,
                        const ConnectionOptions& options = ConnectionOptions{});

    ~Connection();

    Connection(const Connection&) = delete;
    Connection& operator=(const Connection&) = delete;

    Connection(Connection&& other) noexcept;
    Connection& operator=(Connection&& other) noexcept;

    static std::unique_ptr<Connection> open(
        const std::string& dbPath,
        const ConnectionOptions& options = ConnectionOptions{});

    static std::unique_ptr<Connection> inMemory(
        const ConnectionOptions& options = ConnectionOptions{});

    /**
     * @brief True for paths that denote an ephemeral, non-file-backed database
     */
    static bool isEphemeralPath(const std::string& dbPath);

    /**
     * @brief Execute one or more SQL statements without results
     * @throws ConstraintException on constraint violations
     * @throws QueryException for any other failure
     */
    void execute(const std::string& sql);

    /**
     * @brief Create a prepared statement
     * @param sql SQL with optional ? placeholders
     */
    Statement prepare(const std::string& sql);

    /**
     * @brief Begin a new transaction (RAII guard)
     */
    Transaction beginTransaction();

    int64_t lastInsertRowId() const;

    /**
     * @brief Whether a transaction is currently open on this connection
     *
     * SQLite may end a transaction on its own (e.g. after an interrupt),
     * so guards consult this before issuing ROLLBACK.
     */
    bool inTransaction() const;

    bool tableExists(const std::string& tableName);

    bool indexExists(const std::string& indexName);

    /**
     * @brief Names of all indexes on a table, as reported by PRAGMA index_list
     */
    std::vector<std::string> indexNames(const std::string& tableName);

    /**
     * @brief Abort any statement currently running on this connection
     *
     * Safe to call from another thread. The interrupted statement fails
     * with SQLITE_INTERRUPT.
     */
    void interrupt();

    /**
     * @brief Close the handle. Further use requires reopen().
     *
     * Statements prepared on the old handle stay valid only for
     * destruction; the handle is released once the last one finalizes.
     */
    void close();

    /**
     * @brief Close (if open) and open the same location with the same options
     * @throws ConnectionException if opening fails
     */
    void reopen();

    sqlite3* handle() const { return db_; }

    const std::string& path() const { return dbPath_; }

    bool isFileBacked() const { return !isEphemeralPath(dbPath_); }

    bool isOpen() const { return db_ != nullptr; }

private:
    void openHandle();
    void applyOptions();

    sqlite3* db_ = nullptr;
    std::string dbPath_;
    ConnectionOptions options_;
};

} // namespace stockdb
