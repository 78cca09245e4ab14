/**
 * @file exceptions.hpp
 * @brief Exception hierarchy for the storage layer and the migration engine
 *
 * Custom Exception Hierarchy
 * ==========================
 * Everything below the public migration API reports failures by throwing
 * one of these types. The runners catch them at their boundary and turn
 * them into result objects, so callers of run()/runEnhanced()/rollback()
 * only ever see `success` flags and error strings.
 *
 *   DatabaseException
 *   ├── ConnectionException     opening / re-opening the database
 *   ├── QueryException          SQL failed to prepare or execute
 *   ├── ConstraintException     UNIQUE / FOREIGN KEY / NOT NULL violations
 *   ├── TransactionException    BEGIN / COMMIT / ROLLBACK failed
 *   ├── QueryFormatError        malformed SqlFragment handed to the adapter
 *   ├── BackupException         copying database files failed
 *   └── MigrationException      a migration procedure failed
 *       ├── MigrationTimeout    procedure exceeded its time budget
 *       └── IntegrityException  post-migration validation failed
 */

#pragma once

#include <exception>
#include <string>
#include <sqlite3.h>

namespace stockdb {

/**
 * @brief Base exception for all database errors
 */
class DatabaseException : public std::exception {
public:
    explicit DatabaseException(std::string message, int errorCode = 0)
        : message_(std::move(message))
        , errorCode_(errorCode)
    {
        if (errorCode_ != 0) {
            fullMessage_ = message_ + " (SQLite error code: " + std::to_string(errorCode_) + ")";
        } else {
            fullMessage_ = message_;
        }
    }

    const char* what() const noexcept override {
        return fullMessage_.c_str();
    }

    int errorCode() const noexcept {
        return errorCode_;
    }

    const std::string& message() const noexcept {
        return message_;
    }

protected:
    std::string message_;
    std::string fullMessage_;
    int errorCode_;
};

/**
 * @brief Thrown when opening or re-opening the database fails
 */
class ConnectionException : public DatabaseException {
public:
    explicit ConnectionException(const std::string& message, int errorCode = 0)
        : DatabaseException("Connection error: " + message, errorCode) {}
};

/**
 * @brief Thrown when a query fails to prepare or execute
 */
class QueryException : public DatabaseException {
public:
    QueryException(const std::string& message, const std::string& sql, int errorCode = 0)
        : DatabaseException("Query error: " + message, errorCode)
        , sql_(sql)
    {
        if (!sql_.empty()) {
            fullMessage_ += "\nSQL: " + sql_;
        }
    }

    const std::string& sql() const noexcept {
        return sql_;
    }

private:
    std::string sql_;
};

/**
 * @brief Thrown when a constraint violation occurs (unique, foreign key, etc.)
 */
class ConstraintException : public DatabaseException {
public:
    explicit ConstraintException(const std::string& message, int errorCode = 0)
        : DatabaseException("Constraint violation: " + message, errorCode) {}
};

/**
 * @brief Thrown when a transaction operation fails
 */
class TransactionException : public DatabaseException {
public:
    explicit TransactionException(const std::string& message, int errorCode = 0)
        : DatabaseException("Transaction error: " + message, errorCode) {}
};

/**
 * @brief Thrown by StatementAdapter when a query fragment cannot be flattened
 */
class QueryFormatError : public DatabaseException {
public:
    explicit QueryFormatError(const std::string& message)
        : DatabaseException("Invalid query format: " + message) {}
};

/**
 * @brief Thrown when a backup file cannot be written or restored
 */
class BackupException : public DatabaseException {
public:
    BackupException(const std::string& message, std::string path)
        : DatabaseException("Backup error: " + message)
        , path_(std::move(path)) {}

    const std::string& path() const noexcept {
        return path_;
    }

private:
    std::string path_;
};

/**
 * @brief Thrown when a migration's forward or backward procedure fails
 *
 * The message is kept as given (no prefix) because it ends up verbatim
 * in run results and in the migration log.
 */
class MigrationException : public DatabaseException {
public:
    MigrationException(const std::string& message, std::string migrationId)
        : DatabaseException(message)
        , migrationId_(std::move(migrationId)) {}

    const std::string& migrationId() const noexcept {
        return migrationId_;
    }

private:
    std::string migrationId_;
};

/**
 * @brief Synthetic error raised when a procedure outlives its timeout
 */
class MigrationTimeout : public MigrationException {
public:
    MigrationTimeout(const std::string& message, std::string migrationId)
        : MigrationException(message, std::move(migrationId)) {}
};

/**
 * @brief Raised when integrity validation fails after a forward procedure
 */
class IntegrityException : public MigrationException {
public:
    IntegrityException(const std::string& message, std::string migrationId)
        : MigrationException(message, std::move(migrationId)) {}
};

/**
 * @brief Message text without the SQLite error-code suffix where available
 */
inline std::string errorMessage(const std::exception& e) {
    if (auto* db = dynamic_cast<const DatabaseException*>(&e)) {
        return db->message();
    }
    return e.what();
}

} // namespace stockdb
