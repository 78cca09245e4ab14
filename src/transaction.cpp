/**
 * @file transaction.cpp
 * @brief Implementation of Transaction class
 */

#include "stockdb/transaction.hpp"
#include "stockdb/connection.hpp"
#include "stockdb/logging.hpp"

namespace stockdb {

Transaction::Transaction(Connection& conn)
    : conn_(&conn)
{
    try {
        conn_->execute("BEGIN IMMEDIATE TRANSACTION");
    } catch (const DatabaseException& e) {
        throw TransactionException("Failed to begin transaction: " + e.message(), e.errorCode());
    }
}

Transaction::~Transaction() {
    if (active_) {
        rollbackQuietly();
    }
}

Transaction::Transaction(Transaction&& other) noexcept
    : conn_(other.conn_)
    , active_(other.active_)
{
    other.conn_ = nullptr;
    other.active_ = false;
}

Transaction& Transaction::operator=(Transaction&& other) noexcept {
    if (this != &other) {
        if (active_) {
            rollbackQuietly();
        }

        conn_ = other.conn_;
        active_ = other.active_;
        other.conn_ = nullptr;
        other.active_ = false;
    }
    return *this;
}

void Transaction::rollbackQuietly() noexcept {
    active_ = false;
    if (!conn_ || !conn_->inTransaction()) {
        return;
    }
    try {
        conn_->execute("ROLLBACK");
    } catch (const std::exception& e) {
        STOCKDB_LOG_ERROR("rollback in transaction guard failed",
                          {StringField("error", e.what())});
    }
}

void Transaction::commit() {
    if (!active_) {
        throw TransactionException("Transaction already ended");
    }
    if (!conn_->inTransaction()) {
        active_ = false;
        throw TransactionException("Transaction was rolled back by the database");
    }

    try {
        conn_->execute("COMMIT");
        active_ = false;
    } catch (const DatabaseException& e) {
        throw TransactionException("Failed to commit: " + e.message(), e.errorCode());
    }
}

void Transaction::rollback() {
    if (!active_) {
        throw TransactionException("Transaction already ended");
    }
    active_ = false;
    if (!conn_->inTransaction()) {
        return;
    }

    try {
        conn_->execute("ROLLBACK");
    } catch (const DatabaseException& e) {
        throw TransactionException("Failed to rollback: " + e.message(), e.errorCode());
    }
}

} // namespace stockdb
