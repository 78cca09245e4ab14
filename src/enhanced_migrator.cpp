/**
 * @file enhanced_migrator.cpp
 * @brief Implementation of EnhancedMigrator
 */

#include "stockdb/enhanced_migrator.hpp"
#include "stockdb/logging.hpp"
#include <thread>

namespace stockdb {

EnhancedMigrator::EnhancedMigrator(const std::string& dbPath, MigratorOptions options)
    : DatabaseMigrator(dbPath, std::move(options))
    , log_(connection())
    , backups_(connection(), this->options().backupDir)
    , validator_(this->options().integrity)
{}

std::string EnhancedMigrator::joinIssues(const std::vector<std::string>& issues) {
    std::string joined;
    for (const auto& issue : issues) {
        if (!joined.empty()) {
            joined += ", ";
        }
        joined += issue;
    }
    return joined;
}

IntegrityReport EnhancedMigrator::validateDataIntegrity() {
    try {
        return validator_.validate(connection());
    } catch (const std::exception& e) {
        IntegrityReport report;
        report.valid = false;
        report.issues.push_back("Integrity validation error: " + errorMessage(e));
        return report;
    }
}

EnhancedRunResult EnhancedMigrator::runEnhanced(std::chrono::milliseconds timeout) {
    EnhancedRunResult result;

    try {
        IntegrityReport pre = validator_.validate(connection());
        if (!pre.valid) {
            result.success = false;
            result.errors.push_back("Pre-migration validation failed: " + joinIssues(pre.issues));
            STOCKDB_LOG_ERROR("pre-migration validation failed",
                              {StringField("issues", joinIssues(pre.issues))});
            return result;
        }

        std::vector<Migration> pending = pendingMigrations();
        if (pending.empty()) {
            STOCKDB_LOG_INFO("no pending migrations");
            return result;
        }

        STOCKDB_LOG_INFO("running enhanced migrations",
                         {IntField("pending", static_cast<int64_t>(pending.size())),
                          IntField("max_retries", options().maxRetries)});

        for (const auto& migration : pending) {
            log_.markPending(migration.id, migration.name);
        }

        for (size_t i = 0; i < pending.size(); ++i) {
            const Migration& migration = pending[i];
            reportProgress(result.applied.size(), pending.size(), migration.name);

            AttemptOutcome outcome = applyWithRetries(migration, timeout, result);
            if (outcome.succeeded) {
                result.applied.push_back(migration.id);
                log_.markCompleted(migration.id);
                continue;
            }

            result.success = false;

            bool restoreFailed = false;
            if (outcome.backupPath) {
                try {
                    backups_.restoreFromBackup(*outcome.backupPath);
                } catch (const std::exception& e) {
                    restoreFailed = true;
                    result.errors.push_back("Backup restore for " + migration.id + " failed: " +
                                            errorMessage(e));
                    STOCKDB_LOG_ERROR("backup restore failed",
                                      {StringField("migration", migration.id),
                                       StringField("path", *outcome.backupPath),
                                       StringField("error", errorMessage(e))});
                }
            }

            // Written after the restore so the row survives it
            log_.markFailed(migration.id, outcome.lastError, outcome.attempts);
            if (outcome.backupPath) {
                log_.recordBackup(migration.id, *outcome.backupPath);
            }
            result.errors.push_back("Migration " + migration.id + " failed: " + outcome.lastError);
            STOCKDB_LOG_ERROR("migration failed",
                              {StringField("migration", migration.id),
                               IntField("attempts", outcome.attempts),
                               StringField("error", outcome.lastError)});

            if (!restoreFailed && failureCount_ >= options().maxRetries) {
                STOCKDB_LOG_ERROR("failure threshold reached, rolling back this run",
                                  {IntField("failures", failureCount_),
                                   IntField("threshold", options().maxRetries)});
                autoRollback(result.applied, timeout, result);
            }
            return result;
        }

        IntegrityReport post = validator_.validate(connection());
        if (!post.valid) {
            result.success = false;
            result.errors.push_back("Final validation failed: " + joinIssues(post.issues));
            STOCKDB_LOG_ERROR("final validation failed",
                              {StringField("issues", joinIssues(post.issues))});
            return result;
        }

        STOCKDB_LOG_INFO("all migrations applied",
                         {IntField("applied", static_cast<int64_t>(result.applied.size()))});
    } catch (const std::exception& e) {
        result.success = false;
        result.errors.push_back("Migration system error: " + errorMessage(e));
        STOCKDB_LOG_ERROR("migration system error", {StringField("error", errorMessage(e))});
    }

    return result;
}

EnhancedMigrator::AttemptOutcome EnhancedMigrator::applyWithRetries(
        const Migration& migration,
        std::chrono::milliseconds timeout,
        EnhancedRunResult& result) {
    AttemptOutcome outcome;
    const int maxRetries = options().maxRetries;

    log_.markRunning(migration.id, migration.name);

    for (int attempt = 1; attempt <= maxRetries; ++attempt) {
        outcome.attempts = attempt;
        if (attempt == 1) {
            if (auto backup = backups_.createBackup(migration.id)) {
                outcome.backupPath = backup->path;
                result.backups.push_back(backup->path);
                log_.recordBackup(migration.id, backup->path);
            } else {
                STOCKDB_LOG_INFO("applying without backup",
                                 {StringField("migration", migration.id),
                                  BoolField("file_backed", connection().isFileBacked())});
            }
        } else {
            log_.recordAttempt(migration.id, attempt);
        }

        STOCKDB_LOG_INFO("applying migration",
                         {StringField("migration", migration.id),
                          IntField("attempt", attempt),
                          IntField("max_attempts", maxRetries)});

        try {
            applyMigration(migration, timeout, [this, &migration] {
                IntegrityReport report = validator_.validate(connection());
                if (!report.valid) {
                    throw IntegrityException(
                        "Post-migration validation failed: " + joinIssues(report.issues),
                        migration.id);
                }
            });
            outcome.succeeded = true;
            return outcome;
        } catch (const std::exception& e) {
            outcome.lastError = errorMessage(e);
            ++failureCount_;
            STOCKDB_LOG_WARN("migration attempt failed",
                             {StringField("migration", migration.id),
                              IntField("attempt", attempt),
                              StringField("error", outcome.lastError)});
        }

        if (attempt < maxRetries) {
            auto delay = options().retryBaseDelay * (int64_t{1} << attempt);
            STOCKDB_LOG_INFO("retrying after backoff",
                             {StringField("migration", migration.id),
                              IntField("delay_ms", static_cast<int64_t>(delay.count()))});
            std::this_thread::sleep_for(delay);
        }
    }

    return outcome;
}

void EnhancedMigrator::autoRollback(const std::vector<std::string>& appliedThisRun,
                                    std::chrono::milliseconds timeout,
                                    EnhancedRunResult& result) {
    for (auto it = appliedThisRun.rbegin(); it != appliedThisRun.rend(); ++it) {
        RollbackResult rolled = rollback(*it, timeout);
        if (!rolled.success) {
            result.errors.push_back("Auto-rollback of " + *it + " failed: " + rolled.error);
            return;
        }
        log_.markRolledBack(*it);
        result.rolledBack.push_back(*it);
    }
}

std::vector<MigrationLogEntry> EnhancedMigrator::getMigrationLogs() {
    try {
        return log_.entries();
    } catch (const std::exception& e) {
        STOCKDB_LOG_ERROR("cannot read migration logs", {StringField("error", errorMessage(e))});
        return {};
    }
}

std::optional<BackupDescriptor> EnhancedMigrator::createBackup(const std::string& migrationId) {
    return backups_.createBackup(migrationId);
}

bool EnhancedMigrator::restoreFromBackup(const std::string& backupPath) {
    try {
        return backups_.restoreFromBackup(backupPath);
    } catch (const std::exception& e) {
        STOCKDB_LOG_ERROR("backup restore failed",
                          {StringField("path", backupPath), StringField("error", errorMessage(e))});
        return false;
    }
}

size_t EnhancedMigrator::cleanupOldBackups(int retainDays) {
    try {
        return backups_.cleanupOldBackups(retainDays);
    } catch (const std::exception& e) {
        STOCKDB_LOG_ERROR("backup cleanup failed", {StringField("error", errorMessage(e))});
        return 0;
    }
}

std::vector<BackupDescriptor> EnhancedMigrator::listBackups() {
    try {
        return backups_.listBackups();
    } catch (const std::exception& e) {
        STOCKDB_LOG_ERROR("cannot list backups", {StringField("error", errorMessage(e))});
        return {};
    }
}

} // namespace stockdb
