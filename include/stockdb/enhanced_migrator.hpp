/**
 * @file enhanced_migrator.hpp
 * @brief Migration runner with retries, backups, integrity checks and auto-rollback
 *
 * INDUSTRY PRACTICE: Defensive Migrations
 * ==========================================
 * runEnhanced() wraps the base runner's per-migration step with:
 *
 * - Integrity validation before the run, after every migration (inside its
 *   transaction, before COMMIT) and after the whole run
 * - A file backup before the first attempt of each migration
 * - Up to maxRetries attempts with exponential backoff (2^n * retryBaseDelay)
 * - Restore of the backup when a migration exhausts its attempts
 * - Auto-rollback of everything applied in this run, in reverse order, once
 *   the runner's cumulative failure count reaches maxRetries
 * - A per-migration status row in __migration_logs
 *
 * The failure count belongs to the runner instance and accumulates across
 * runEnhanced() calls until resetFailureCount().
 */

#pragma once

#include <optional>
#include <string>
#include <vector>
#include "backup_store.hpp"
#include "integrity.hpp"
#include "migration.hpp"
#include "migration_log.hpp"

namespace stockdb {

struct EnhancedRunResult {
    bool success = true;
    std::vector<std::string> applied;     // committed this run, in order
    std::vector<std::string> errors;
    std::vector<std::string> backups;     // backup files created this run
    std::vector<std::string> rolledBack;  // reverted by auto-rollback, in order
};

class EnhancedMigrator : public DatabaseMigrator {
public:
    static constexpr std::chrono::milliseconds kDefaultEnhancedTimeout{60000};

    /**
     * @throws std::invalid_argument for invalid options
     * @throws DatabaseException if the database or tracking tables cannot be set up
     */
    explicit EnhancedMigrator(const std::string& dbPath = Connection::kMemoryPath,
                              MigratorOptions options = MigratorOptions{});

    /**
     * @param timeout Budget per attempt, 0 for none
     */
    EnhancedRunResult runEnhanced(std::chrono::milliseconds timeout = kDefaultEnhancedTimeout);

    /**
     * @brief Run the integrity suite; a check that cannot run becomes an issue
     */
    IntegrityReport validateDataIntegrity();

    /**
     * @brief Migration log entries, newest first. Empty if unreadable.
     */
    std::vector<MigrationLogEntry> getMigrationLogs();

    std::optional<BackupDescriptor> createBackup(const std::string& migrationId);

    /**
     * @return false if nothing was restored (ephemeral database or error)
     */
    bool restoreFromBackup(const std::string& backupPath);

    /**
     * @return Number of backups removed, 0 on error
     */
    size_t cleanupOldBackups(int retainDays = 7);

    std::vector<BackupDescriptor> listBackups();

    int failureCount() const { return failureCount_; }
    void resetFailureCount() { failureCount_ = 0; }

private:
    struct AttemptOutcome {
        bool succeeded = false;
        int attempts = 0;
        std::string lastError;
        std::optional<std::string> backupPath;
    };

    AttemptOutcome applyWithRetries(const Migration& migration,
                                    std::chrono::milliseconds timeout,
                                    EnhancedRunResult& result);

    void autoRollback(const std::vector<std::string>& appliedThisRun,
                      std::chrono::milliseconds timeout,
                      EnhancedRunResult& result);

    static std::string joinIssues(const std::vector<std::string>& issues);

    MigrationLog log_;
    BackupStore backups_;
    IntegrityValidator validator_;
    int failureCount_ = 0;
};

} // namespace stockdb
