/**
 * @file migration_log.cpp
 * @brief Implementation of MigrationLog
 */

#include "stockdb/migration_log.hpp"
#include "stockdb/clock.hpp"
#include "stockdb/statement.hpp"
#include <stdexcept>

namespace stockdb {

namespace {

constexpr const char* kSelectColumns =
    "SELECT id, name, status, started_at, completed_at, error_message, "
    "backup_path, attempt_count, created_at FROM __migration_logs";

MigrationLogEntry readEntry(const Statement& stmt) {
    MigrationLogEntry entry;
    entry.id = stmt.columnString(0);
    entry.name = stmt.columnString(1);
    entry.status = parseMigrationStatus(stmt.columnString(2));
    entry.startedAt = stmt.columnOptionalInt64(3);
    entry.completedAt = stmt.columnOptionalInt64(4);
    entry.errorMessage = stmt.columnOptionalString(5);
    entry.backupPath = stmt.columnOptionalString(6);
    entry.attemptCount = stmt.columnInt(7);
    entry.createdAt = stmt.columnInt64(8);
    return entry;
}

} // namespace

const char* toString(MigrationStatus status) {
    switch (status) {
        case MigrationStatus::Pending:    return "pending";
        case MigrationStatus::Running:    return "running";
        case MigrationStatus::Completed:  return "completed";
        case MigrationStatus::Failed:     return "failed";
        case MigrationStatus::RolledBack: return "rolled_back";
    }
    return "pending";
}

MigrationStatus parseMigrationStatus(const std::string& text) {
    if (text == "pending") return MigrationStatus::Pending;
    if (text == "running") return MigrationStatus::Running;
    if (text == "completed") return MigrationStatus::Completed;
    if (text == "failed") return MigrationStatus::Failed;
    if (text == "rolled_back") return MigrationStatus::RolledBack;
    throw std::invalid_argument("unknown migration status '" + text + "'");
}

MigrationLog::MigrationLog(Connection& conn)
    : conn_(conn)
{
    ensureTable();
}

void MigrationLog::ensureTable() {
    conn_.execute(R"(
        CREATE TABLE IF NOT EXISTS __migration_logs (
            id TEXT PRIMARY KEY,
            name TEXT NOT NULL,
            status TEXT NOT NULL,
            started_at INTEGER,
            completed_at INTEGER,
            error_message TEXT,
            backup_path TEXT,
            attempt_count INTEGER NOT NULL DEFAULT 0,
            created_at INTEGER NOT NULL
                DEFAULT (CAST((julianday('now') - 2440587.5) * 86400000 AS INTEGER))
        )
    )");
}

void MigrationLog::markPending(const std::string& id, const std::string& name) {
    // A new run starts from a clean slate but keeps created_at
    auto stmt = conn_.prepare(R"(
        INSERT INTO __migration_logs (id, name, status, attempt_count, created_at)
        VALUES (?, ?, 'pending', 0, ?)
        ON CONFLICT(id) DO UPDATE SET
            name = excluded.name,
            status = 'pending',
            started_at = NULL,
            completed_at = NULL,
            error_message = NULL,
            backup_path = NULL,
            attempt_count = 0
    )");
    stmt.bind(1, id).bind(2, name).bind(3, unixMillisNow()).execute();
}

void MigrationLog::markRunning(const std::string& id, const std::string& name) {
    int64_t now = unixMillisNow();
    auto stmt = conn_.prepare(R"(
        INSERT INTO __migration_logs (id, name, status, started_at, attempt_count, created_at)
        VALUES (?, ?, 'running', ?, 1, ?)
        ON CONFLICT(id) DO UPDATE SET
            name = excluded.name,
            status = 'running',
            started_at = excluded.started_at,
            completed_at = NULL,
            error_message = NULL,
            attempt_count = 1
    )");
    stmt.bind(1, id).bind(2, name).bind(3, now).bind(4, now).execute();
}

void MigrationLog::recordAttempt(const std::string& id, int attempt) {
    auto stmt = conn_.prepare("UPDATE __migration_logs SET attempt_count = ? WHERE id = ?");
    stmt.bind(1, attempt).bind(2, id).execute();
}

void MigrationLog::recordBackup(const std::string& id, const std::string& backupPath) {
    auto stmt = conn_.prepare("UPDATE __migration_logs SET backup_path = ? WHERE id = ?");
    stmt.bind(1, backupPath).bind(2, id).execute();
}

void MigrationLog::updateStatus(const std::string& id, MigrationStatus status) {
    auto stmt = conn_.prepare(
        "UPDATE __migration_logs SET status = ?, completed_at = ? WHERE id = ?");
    stmt.bind(1, toString(status)).bind(2, unixMillisNow()).bind(3, id).execute();
}

void MigrationLog::markCompleted(const std::string& id) {
    updateStatus(id, MigrationStatus::Completed);
}

void MigrationLog::markRolledBack(const std::string& id) {
    updateStatus(id, MigrationStatus::RolledBack);
}

void MigrationLog::markFailed(const std::string& id, const std::string& error, int attempts) {
    auto stmt = conn_.prepare(R"(
        UPDATE __migration_logs
        SET status = 'failed', error_message = ?, attempt_count = ?
        WHERE id = ?
    )");
    stmt.bind(1, error).bind(2, attempts).bind(3, id).execute();
}

std::vector<MigrationLogEntry> MigrationLog::entries() {
    auto stmt = conn_.prepare(std::string(kSelectColumns) +
                              " ORDER BY created_at DESC, rowid DESC");
    std::vector<MigrationLogEntry> result;
    while (stmt.step()) {
        result.push_back(readEntry(stmt));
    }
    return result;
}

} // namespace stockdb
