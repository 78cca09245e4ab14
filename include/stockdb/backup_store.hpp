/**
 * @file backup_store.hpp
 * @brief Point-in-time copies of the database file
 *
 * Backups are whole-file copies taken right before a risky migration:
 *
 *   <backupDir>/backup_<migrationId>_<2024-05-01T10-00-00-123Z>.db
 *
 * and catalogued in __migration_backups. Ephemeral (":memory:") databases
 * have no file, so every operation on them is a no-op.
 *
 * The live connection is shared with the runners; restore closes and
 * re-opens it in place, so existing references stay valid.
 */

#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>
#include "connection.hpp"

namespace stockdb {

struct BackupDescriptor {
    int64_t id = 0;
    std::string migrationId;
    std::string path;
    int64_t fileSize = 0;
    int64_t createdAt = 0;   // Unix ms
};

class BackupStore {
public:
    /**
     * @brief Creates the backup directory (logged on failure) and the catalogue table
     * @throws DatabaseException if the catalogue table cannot be created
     */
    BackupStore(Connection& conn, std::string backupDir);

    /**
     * @brief Copy the database file and catalogue the copy
     * @return The descriptor, or nullopt for ephemeral databases and on failure
     */
    std::optional<BackupDescriptor> createBackup(const std::string& migrationId);

    /**
     * @brief Replace the live database file with a backup and re-open
     *
     * Must not be called while a transaction is open or a Statement on the
     * connection is mid-iteration.
     * @return false for ephemeral databases, true once restored
     * @throws BackupException if the backup cannot be copied into place
     * @throws ConnectionException if the database cannot be re-opened
     */
    bool restoreFromBackup(const std::string& backupPath);

    /**
     * @brief Delete backups older than retainDays
     *
     * A file that cannot be deleted is logged and skipped.
     * @return Number of catalogue entries removed
     */
    size_t cleanupOldBackups(int retainDays);

    /**
     * @brief Catalogue, newest first
     */
    std::vector<BackupDescriptor> listBackups();

    const std::string& backupDir() const { return backupDir_; }

private:
    void ensureTable();
    void insertDescriptor(const BackupDescriptor& descriptor, bool keepId);

    Connection& conn_;
    std::string backupDir_;
};

} // namespace stockdb
