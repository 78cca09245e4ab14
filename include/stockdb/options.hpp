/**
 * @file options.hpp
 * @brief Runner configuration
 *
 *   MigratorOptions opts = MigratorOptions::fromEnvironment();
 *   opts.maxRetries = 1;
 *   opts.onProgress = [](size_t done, size_t total, const std::string& name) {
 *       std::cout << done << "/" << total << " " << name << "\n";
 *   };
 *   EnhancedMigrator migrator("dashboard.db", opts);
 *
 * Environment overrides (applied by fromEnvironment()):
 *   STOCKDB_BACKUP_DIR (or BACKUP_DIR)   backup directory
 *   STOCKDB_MAX_RETRIES                  attempts per migration
 *   STOCKDB_BATCH_SIZE                   migrations per batch
 */

#pragma once

#include <chrono>
#include <cstddef>
#include <functional>
#include <string>
#include "connection.hpp"
#include "integrity.hpp"

namespace stockdb {

/**
 * @brief Called before each migration with (completed, total, currentName)
 */
using ProgressCallback = std::function<void(size_t, size_t, const std::string&)>;

struct MigratorOptions {
    // Pending migrations are applied in batches with a short pause between them
    size_t batchSize = 5;

    // Attempts per migration in runEnhanced(), also the auto-rollback threshold
    int maxRetries = 3;

    std::string backupDir = "./backups";

    // Delay before retry n is 2^n * retryBaseDelay
    std::chrono::milliseconds retryBaseDelay{1000};

    // Voluntary pause between batches
    std::chrono::milliseconds batchPause{10};

    ProgressCallback onProgress;

    ConnectionOptions connection;

    IntegrityRules integrity = IntegrityRules::stockDefaults();

    /**
     * @brief Defaults with STOCKDB_* environment overrides applied
     */
    static MigratorOptions fromEnvironment();
};

} // namespace stockdb
