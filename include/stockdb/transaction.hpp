/**
 * @file transaction.hpp
 * @brief Scoped transaction guard
 *
 * Each migration's forward procedure runs together with the insert of its
 * tracking record inside one Transaction:
 *
 *   {
 *       Transaction txn(conn);
 *       migration.up(adapter);
 *       recordApplied(migration);
 *       txn.commit();
 *   }   // no commit() -> ROLLBACK, schema and record both discarded
 *
 * SQLite can end a transaction by itself (an interrupted statement, some
 * I/O errors). The guard therefore only issues ROLLBACK when the
 * connection still reports an open transaction.
 */

#pragma once

#include <string>
#include "exceptions.hpp"

namespace stockdb {

class Connection;

class Transaction {
public:
    /**
     * @brief BEGIN IMMEDIATE: the write lock is reserved up front
     * @throws TransactionException if BEGIN fails
     */
    explicit Transaction(Connection& conn);

    /**
     * @brief Rolls back if neither commit() nor rollback() was called
     *
     * Never throws; a failed ROLLBACK is logged.
     */
    ~Transaction();

    Transaction(const Transaction&) = delete;
    Transaction& operator=(const Transaction&) = delete;

    Transaction(Transaction&& other) noexcept;
    Transaction& operator=(Transaction&& other) noexcept;

    /**
     * @throws TransactionException if COMMIT fails or the transaction ended
     */
    void commit();

    /**
     * @throws TransactionException if ROLLBACK fails or the transaction ended
     */
    void rollback();

    bool isActive() const { return active_; }

private:
    void rollbackQuietly() noexcept;

    Connection* conn_;
    bool active_ = true;
};

} // namespace stockdb
