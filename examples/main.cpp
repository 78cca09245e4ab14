/**
 * @file main.cpp
 * @brief Walk-through of the dashboard's migration engine
 *
 * This example shows:
 * 1. Opening a file database with environment-driven options
 * 2. Registering the built-in migrations and validating the registry
 * 3. Health check before and after
 * 4. An enhanced run (backups, retries, integrity checks)
 * 5. Migration log and backup catalogue
 * 6. Rolling the newest migration back
 * 7. Pruning old backups
 *
 * Usage: stockdb_demo [database-path]   (default: dashboard.db)
 */

#include <iostream>
#include <iomanip>
#include "stockdb/stockdb.hpp"

using namespace stockdb;

// ========== Demo Functions ==========

void printSection(const std::string& title) {
    std::cout << "\n" << std::string(60, '=') << "\n";
    std::cout << " " << title << "\n";
    std::cout << std::string(60, '=') << "\n\n";
}

void printHealth(DatabaseMigrator& migrator) {
    HealthStatus health = migrator.healthCheck();
    std::cout << "  healthy:            " << std::boolalpha << health.healthy << "\n";
    std::cout << "  connection test:    " << health.connectionTest << "\n";
    std::cout << "  total migrations:   " << health.totalMigrations << "\n";
    std::cout << "  applied migrations: " << health.appliedMigrations << "\n";
    std::cout << "  pending migrations: " << health.pendingMigrations << "\n";
    std::cout << "  last migration:     " << health.lastMigration << "\n";
    if (!health.error.empty()) {
        std::cout << "  error:              " << health.error << "\n";
    }
}

void printLogs(EnhancedMigrator& migrator) {
    for (const auto& entry : migrator.getMigrationLogs()) {
        std::cout << "  " << std::left << std::setw(34) << entry.id
                  << std::setw(12) << toString(entry.status)
                  << "attempts=" << entry.attemptCount;
        if (entry.backupPath) {
            std::cout << " backup=" << *entry.backupPath;
        }
        if (entry.errorMessage) {
            std::cout << " error=" << *entry.errorMessage;
        }
        std::cout << "\n";
    }
}

void printBackups(EnhancedMigrator& migrator) {
    auto backups = migrator.listBackups();
    if (backups.empty()) {
        std::cout << "  (no backups)\n";
    }
    for (const auto& backup : backups) {
        std::cout << "  #" << backup.id << " " << backup.migrationId
                  << " " << backup.fileSize << " bytes " << backup.path << "\n";
    }
}

// ========== Main ==========

int main(int argc, char** argv) {
    std::cout << "stockdb migration engine " << VERSION_STRING << "\n";
    std::cout << "SQLite version: " << sqliteVersion() << "\n";

    const std::string dbPath = argc > 1 ? argv[1] : "dashboard.db";

    try {
        MigratorOptions options = MigratorOptions::fromEnvironment();
        options.onProgress = [](size_t done, size_t total, const std::string& name) {
            std::cout << "  [" << done << "/" << total << "] " << name << "\n";
        };

        EnhancedMigrator migrator(dbPath, options);
        migrations::registerDefaultMigrations(migrator);

        printSection("Registry");

        ValidationResult validation = migrator.validate();
        std::cout << "  " << migrator.migrations().size() << " migrations registered, "
                  << (validation.valid ? "valid" : "INVALID") << "\n";
        for (const auto& issue : validation.issues) {
            std::cout << "    - " << issue << "\n";
        }
        if (!validation.valid) {
            return 1;
        }

        printSection("Health Check");
        printHealth(migrator);

        printSection("Enhanced Run");

        EnhancedRunResult result = migrator.runEnhanced();
        std::cout << "\n  success: " << std::boolalpha << result.success << "\n";
        for (const auto& id : result.applied) {
            std::cout << "  applied:     " << id << "\n";
        }
        for (const auto& path : result.backups) {
            std::cout << "  backup:      " << path << "\n";
        }
        for (const auto& id : result.rolledBack) {
            std::cout << "  rolled back: " << id << "\n";
        }
        for (const auto& error : result.errors) {
            std::cout << "  error:       " << error << "\n";
        }

        printSection("Migration Log");
        printLogs(migrator);

        printSection("Backups");
        printBackups(migrator);

        printSection("Integrity");
        IntegrityReport report = migrator.validateDataIntegrity();
        std::cout << "  valid: " << report.valid << "\n";
        for (const auto& issue : report.issues) {
            std::cout << "    - " << issue << "\n";
        }

        printSection("Rollback");

        auto applied = migrator.appliedMigrations();
        if (!applied.empty()) {
            const std::string newest = applied.back().id;
            RollbackResult rolled = migrator.rollback(newest);
            std::cout << "  " << newest << ": "
                      << (rolled.success ? "rolled back" : "failed: " + rolled.error) << "\n";
        } else {
            std::cout << "  nothing to roll back\n";
        }
        printHealth(migrator);

        printSection("Backup Retention");
        size_t removed = migrator.cleanupOldBackups(7);
        std::cout << "  removed " << removed << " backups older than 7 days\n";

        std::cout << "\nDemo completed " << (result.success ? "successfully" : "with errors") << "\n";
        return result.success ? 0 : 1;

    } catch (const DatabaseException& e) {
        std::cerr << "Database error: " << e.what() << "\n";
        return 1;
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }
}
