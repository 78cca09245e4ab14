/**
 * @file migration_log.hpp
 * @brief Current-state audit trail of enhanced migration runs
 *
 * One row per migration id in __migration_logs, overwritten in place:
 *
 *   pending -> running -> completed
 *                      -> failed
 *   completed -> rolled_back   (auto-rollback)
 *
 * Rows are never deleted. created_at survives every overwrite, so the log
 * also tells when a migration was first seen.
 */

#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>
#include "connection.hpp"

namespace stockdb {

enum class MigrationStatus {
    Pending,
    Running,
    Completed,
    Failed,
    RolledBack
};

/**
 * @brief "pending", "running", "completed", "failed", "rolled_back"
 */
const char* toString(MigrationStatus status);

/**
 * @throws std::invalid_argument for an unknown status string
 */
MigrationStatus parseMigrationStatus(const std::string& text);

struct MigrationLogEntry {
    std::string id;
    std::string name;
    MigrationStatus status = MigrationStatus::Pending;
    std::optional<int64_t> startedAt;     // Unix ms
    std::optional<int64_t> completedAt;   // Unix ms
    std::optional<std::string> errorMessage;
    std::optional<std::string> backupPath;
    int attemptCount = 0;
    int64_t createdAt = 0;                // Unix ms
};

class MigrationLog {
public:
    /**
     * @brief Creates __migration_logs if absent
     * @throws DatabaseException if the table cannot be created
     */
    explicit MigrationLog(Connection& conn);

    void markPending(const std::string& id, const std::string& name);
    void markRunning(const std::string& id, const std::string& name);
    void recordAttempt(const std::string& id, int attempt);
    void recordBackup(const std::string& id, const std::string& backupPath);
    void markCompleted(const std::string& id);
    void markFailed(const std::string& id, const std::string& error, int attempts);
    void markRolledBack(const std::string& id);

    /**
     * @brief All entries, newest first
     */
    std::vector<MigrationLogEntry> entries();

private:
    void ensureTable();
    void updateStatus(const std::string& id, MigrationStatus status);

    Connection& conn_;
};

} // namespace stockdb
