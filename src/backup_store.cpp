/**
 * @file backup_store.cpp
 * @brief Implementation of BackupStore
 */

#include "stockdb/backup_store.hpp"
#include "stockdb/clock.hpp"
#include "stockdb/logging.hpp"
#include "stockdb/statement.hpp"
#include <filesystem>
#include <system_error>

namespace fs = std::filesystem;

namespace stockdb {

namespace {

// Migration ids become part of a file name; anything outside
// [A-Za-z0-9._-] is replaced with '_'
std::string fileSafeId(const std::string& migrationId) {
    std::string safe = migrationId;
    for (char& c : safe) {
        bool allowed = (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') ||
                       (c >= '0' && c <= '9') || c == '.' || c == '_' || c == '-';
        if (!allowed) {
            c = '_';
        }
    }
    return safe;
}

} // namespace

BackupStore::BackupStore(Connection& conn, std::string backupDir)
    : conn_(conn)
    , backupDir_(std::move(backupDir))
{
    std::error_code ec;
    fs::create_directories(backupDir_, ec);
    if (ec) {
        STOCKDB_LOG_ERROR("cannot create backup directory",
                          {StringField("dir", backupDir_), StringField("error", ec.message())});
    }

    ensureTable();
}

void BackupStore::ensureTable() {
    conn_.execute(R"(
        CREATE TABLE IF NOT EXISTS __migration_backups (
            id INTEGER PRIMARY KEY AUTOINCREMENT,
            migration_id TEXT NOT NULL,
            backup_path TEXT NOT NULL,
            file_size INTEGER NOT NULL,
            created_at INTEGER NOT NULL
                DEFAULT (CAST((julianday('now') - 2440587.5) * 86400000 AS INTEGER))
        )
    )");
}

void BackupStore::insertDescriptor(const BackupDescriptor& descriptor, bool keepId) {
    if (keepId) {
        auto stmt = conn_.prepare(R"(
            INSERT OR IGNORE INTO __migration_backups
                (id, migration_id, backup_path, file_size, created_at)
            VALUES (?, ?, ?, ?, ?)
        )");
        stmt.bind(1, descriptor.id)
            .bind(2, descriptor.migrationId)
            .bind(3, descriptor.path)
            .bind(4, descriptor.fileSize)
            .bind(5, descriptor.createdAt)
            .execute();
        return;
    }

    auto stmt = conn_.prepare(R"(
        INSERT INTO __migration_backups (migration_id, backup_path, file_size, created_at)
        VALUES (?, ?, ?, ?)
    )");
    stmt.bind(1, descriptor.migrationId)
        .bind(2, descriptor.path)
        .bind(3, descriptor.fileSize)
        .bind(4, descriptor.createdAt)
        .execute();
}

std::optional<BackupDescriptor> BackupStore::createBackup(const std::string& migrationId) {
    if (!conn_.isFileBacked()) {
        return std::nullopt;
    }

    try {
        // Fold the WAL into the main file so the copy is complete
        conn_.execute("PRAGMA wal_checkpoint(TRUNCATE)");

        TimePoint now = Clock::now();
        fs::path target = fs::absolute(
            fs::path(backupDir_) / ("backup_" + fileSafeId(migrationId) + "_" + fileSafeTimestamp(now) + ".db"));

        std::error_code ec;
        fs::create_directories(target.parent_path(), ec);
        fs::copy_file(conn_.path(), target, fs::copy_options::overwrite_existing, ec);
        if (ec) {
            throw BackupException("cannot copy database: " + ec.message(), target.string());
        }

        BackupDescriptor descriptor;
        descriptor.migrationId = migrationId;
        descriptor.path = target.string();
        descriptor.fileSize = static_cast<int64_t>(fs::file_size(target));
        descriptor.createdAt = toUnixMillis(now);

        insertDescriptor(descriptor, false);
        descriptor.id = conn_.lastInsertRowId();

        STOCKDB_LOG_INFO("backup created",
                         {StringField("migration", migrationId),
                          StringField("path", descriptor.path),
                          IntField("bytes", descriptor.fileSize)});
        return descriptor;
    } catch (const std::exception& e) {
        STOCKDB_LOG_ERROR("backup failed",
                          {StringField("migration", migrationId),
                           StringField("error", errorMessage(e))});
        return std::nullopt;
    }
}

bool BackupStore::restoreFromBackup(const std::string& backupPath) {
    if (!conn_.isFileBacked()) {
        return false;
    }

    if (!fs::exists(backupPath)) {
        throw BackupException("backup file does not exist", backupPath);
    }

    // The catalogue lives in the file being overwritten; carry it across
    std::vector<BackupDescriptor> catalogue = listBackups();

    const std::string livePath = conn_.path();
    conn_.close();

    std::error_code ec;
    fs::remove(livePath + "-wal", ec);
    fs::remove(livePath + "-shm", ec);

    fs::copy_file(backupPath, livePath, fs::copy_options::overwrite_existing, ec);
    if (ec) {
        conn_.reopen();
        throw BackupException("cannot restore database: " + ec.message(), backupPath);
    }

    conn_.reopen();
    ensureTable();
    for (const auto& descriptor : catalogue) {
        insertDescriptor(descriptor, true);
    }

    STOCKDB_LOG_INFO("database restored from backup", {StringField("path", backupPath)});
    return true;
}

size_t BackupStore::cleanupOldBackups(int retainDays) {
    const int64_t cutoff = unixMillisNow() - static_cast<int64_t>(retainDays) * 24 * 60 * 60 * 1000;

    std::vector<BackupDescriptor> expired;
    {
        auto stmt = conn_.prepare(
            "SELECT id, migration_id, backup_path, file_size, created_at "
            "FROM __migration_backups WHERE created_at < ?");
        stmt.bind(1, cutoff);
        while (stmt.step()) {
            expired.push_back({stmt.columnInt64(0), stmt.columnString(1), stmt.columnString(2),
                               stmt.columnInt64(3), stmt.columnInt64(4)});
        }
    }

    for (const auto& backup : expired) {
        std::error_code ec;
        fs::remove(backup.path, ec);
        if (ec) {
            STOCKDB_LOG_WARN("cannot delete backup file",
                             {StringField("path", backup.path), StringField("error", ec.message())});
        }
    }

    auto del = conn_.prepare("DELETE FROM __migration_backups WHERE created_at < ?");
    del.bind(1, cutoff).execute();

    STOCKDB_LOG_INFO("old backups cleaned up",
                     {IntField("retain_days", retainDays),
                      IntField("removed", static_cast<int64_t>(expired.size()))});
    return expired.size();
}

std::vector<BackupDescriptor> BackupStore::listBackups() {
    auto stmt = conn_.prepare(
        "SELECT id, migration_id, backup_path, file_size, created_at "
        "FROM __migration_backups ORDER BY created_at DESC, id DESC");
    std::vector<BackupDescriptor> result;
    while (stmt.step()) {
        result.push_back({stmt.columnInt64(0), stmt.columnString(1), stmt.columnString(2),
                          stmt.columnInt64(3), stmt.columnInt64(4)});
    }
    return result;
}

} // namespace stockdb
