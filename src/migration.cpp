/**
 * @file migration.cpp
 * @brief Implementation of DatabaseMigrator
 */

#include "stockdb/migration.hpp"
#include "stockdb/logging.hpp"
#include "stockdb/statement.hpp"
#include "stockdb/transaction.hpp"
#include <algorithm>
#include <future>
#include <set>
#include <stdexcept>
#include <thread>

namespace stockdb {

DatabaseMigrator::DatabaseMigrator(const std::string& dbPath, MigratorOptions options)
    : options_(std::move(options))
{
    if (options_.batchSize == 0) {
        throw std::invalid_argument("batchSize must be at least 1");
    }
    if (options_.maxRetries < 1) {
        throw std::invalid_argument("maxRetries must be at least 1");
    }

    conn_ = Connection::open(dbPath, options_.connection);
    adapter_ = std::make_unique<StatementAdapter>(*conn_);
    ensureMigrationTable();
}

DatabaseMigrator::~DatabaseMigrator() = default;

void DatabaseMigrator::ensureMigrationTable() {
    // Millisecond precision keeps applied_at ordering stable within one run
    conn_->execute(R"(
        CREATE TABLE IF NOT EXISTS __migrations (
            id TEXT PRIMARY KEY,
            name TEXT NOT NULL,
            applied_at DATETIME NOT NULL DEFAULT (strftime('%Y-%m-%d %H:%M:%f', 'now'))
        )
    )");
}

void DatabaseMigrator::add(Migration migration) {
    migrations_.push_back(std::move(migration));
}

void DatabaseMigrator::add(std::string id, std::string name,
                           MigrationProcedure up, MigrationProcedure down) {
    add(Migration{std::move(id), std::move(name), std::move(up), std::move(down)});
}

ValidationResult DatabaseMigrator::validate() const {
    ValidationResult result;

    std::set<std::string> seen;
    std::vector<std::string> duplicates;
    for (const auto& migration : migrations_) {
        if (!seen.insert(migration.id).second &&
            std::find(duplicates.begin(), duplicates.end(), migration.id) == duplicates.end()) {
            duplicates.push_back(migration.id);
        }
    }
    if (!duplicates.empty()) {
        std::string joined;
        for (const auto& id : duplicates) {
            if (!joined.empty()) {
                joined += ", ";
            }
            joined += id;
        }
        result.issues.push_back("Duplicate migration IDs: " + joined);
    }

    for (const auto& migration : migrations_) {
        if (!migration.up) {
            result.issues.push_back("Migration " + migration.id + " missing up function");
        }
        if (!migration.down) {
            result.issues.push_back("Migration " + migration.id + " missing down function");
        }
    }

    result.valid = result.issues.empty();
    return result;
}

std::vector<Migration> DatabaseMigrator::pendingMigrations() {
    std::set<std::string> applied;
    auto stmt = conn_->prepare("SELECT id FROM __migrations");
    while (stmt.step()) {
        applied.insert(stmt.columnString(0));
    }

    std::vector<Migration> pending;
    for (const auto& migration : migrations_) {
        if (applied.count(migration.id) == 0) {
            pending.push_back(migration);
        }
    }
    return pending;
}

const Migration* DatabaseMigrator::findMigration(const std::string& migrationId) const {
    auto it = std::find_if(migrations_.begin(), migrations_.end(),
                           [&](const Migration& m) { return m.id == migrationId; });
    return it == migrations_.end() ? nullptr : &*it;
}

void DatabaseMigrator::rawExecute(const std::string& sql) {
    conn_->execute(sql);
}

void DatabaseMigrator::recordApplied(const Migration& migration) {
    auto stmt = conn_->prepare("INSERT INTO __migrations (id, name) VALUES (?, ?)");
    stmt.bind(1, migration.id).bind(2, migration.name).execute();
}

void DatabaseMigrator::removeApplied(const std::string& migrationId) {
    auto stmt = conn_->prepare("DELETE FROM __migrations WHERE id = ?");
    stmt.bind(1, migrationId).execute();
}

void DatabaseMigrator::setAdapter(std::unique_ptr<StatementAdapter> adapter) {
    if (!adapter) {
        throw std::invalid_argument("adapter must not be null");
    }
    adapter_ = std::move(adapter);
}

void DatabaseMigrator::reportProgress(size_t completed, size_t total,
                                      const std::string& currentName) const {
    if (options_.onProgress) {
        options_.onProgress(completed, total, currentName);
    }
}

void DatabaseMigrator::runWithTimeout(const MigrationProcedure& procedure,
                                      const std::string& migrationId,
                                      std::chrono::milliseconds timeout,
                                      const std::string& label) {
    if (!procedure) {
        throw MigrationException("procedure is not defined", migrationId);
    }

    adapter_->resetCancellation();

    if (timeout.count() <= 0) {
        procedure(*adapter_);
        return;
    }

    StatementAdapter& adapter = *adapter_;
    auto worker = std::async(std::launch::async, [&procedure, &adapter] {
        procedure(adapter);
    });

    if (worker.wait_for(timeout) == std::future_status::ready) {
        worker.get();
        return;
    }

    // Stop further statements, then keep interrupting the running one
    // until the procedure gives up
    adapter.cancel();
    conn_->interrupt();
    while (worker.wait_for(std::chrono::milliseconds(10)) != std::future_status::ready) {
        conn_->interrupt();
    }

    try {
        worker.get();
    } catch (const std::exception& e) {
        STOCKDB_LOG_DEBUG("procedure stopped after timeout",
                          {StringField("migration", migrationId),
                           StringField("error", errorMessage(e))});
    }

    throw MigrationTimeout(label + " timeout after " + std::to_string(timeout.count()) + "ms",
                           migrationId);
}

void DatabaseMigrator::applyMigration(const Migration& migration,
                                      std::chrono::milliseconds timeout,
                                      const std::function<void()>& beforeCommit) {
    Transaction txn(*conn_);
    runWithTimeout(migration.up, migration.id, timeout, "Migration");
    recordApplied(migration);
    if (beforeCommit) {
        beforeCommit();
    }
    txn.commit();
}

void DatabaseMigrator::revertMigration(const Migration& migration,
                                       std::chrono::milliseconds timeout) {
    Transaction txn(*conn_);
    runWithTimeout(migration.down, migration.id, timeout, "Rollback");
    removeApplied(migration.id);
    txn.commit();
}

MigrationRunResult DatabaseMigrator::run(std::chrono::milliseconds timeout) {
    MigrationRunResult result;

    std::vector<Migration> pending;
    try {
        pending = pendingMigrations();
    } catch (const std::exception& e) {
        result.success = false;
        result.errors.push_back("Migration system error: " + errorMessage(e));
        return result;
    }

    if (pending.empty()) {
        STOCKDB_LOG_INFO("no pending migrations");
        return result;
    }

    STOCKDB_LOG_INFO("running migrations",
                     {IntField("pending", static_cast<int64_t>(pending.size())),
                      IntField("batch_size", static_cast<int64_t>(options_.batchSize))});

    for (size_t start = 0; start < pending.size(); start += options_.batchSize) {
        size_t end = std::min(start + options_.batchSize, pending.size());

        for (size_t i = start; i < end; ++i) {
            const Migration& migration = pending[i];
            reportProgress(result.applied.size(), pending.size(), migration.name);

            try {
                applyMigration(migration, timeout);
            } catch (const std::exception& e) {
                result.success = false;
                result.errors.push_back("Migration " + migration.id + ": " + errorMessage(e));
                STOCKDB_LOG_ERROR("migration failed",
                                  {StringField("migration", migration.id),
                                   StringField("error", errorMessage(e))});
                return result;
            }

            result.applied.push_back(migration.id);
            STOCKDB_LOG_INFO("migration applied", {StringField("migration", migration.id)});
        }

        if (end < pending.size() && options_.batchPause.count() > 0) {
            std::this_thread::sleep_for(options_.batchPause);
        }
    }

    return result;
}

RollbackResult DatabaseMigrator::rollback(const std::string& migrationId,
                                          std::chrono::milliseconds timeout) {
    RollbackResult result;

    const Migration* migration = findMigration(migrationId);
    if (migration == nullptr) {
        result.error = "Migration " + migrationId + " not found";
        STOCKDB_LOG_WARN("rollback requested for unknown migration",
                         {StringField("migration", migrationId)});
        return result;
    }

    try {
        revertMigration(*migration, timeout);
    } catch (const std::exception& e) {
        result.error = errorMessage(e);
        STOCKDB_LOG_ERROR("rollback failed",
                          {StringField("migration", migrationId),
                           StringField("error", result.error)});
        return result;
    }

    result.success = true;
    STOCKDB_LOG_INFO("migration rolled back", {StringField("migration", migrationId)});
    return result;
}

std::vector<AppliedMigration> DatabaseMigrator::appliedMigrations() {
    std::vector<AppliedMigration> applied;
    try {
        auto stmt = conn_->prepare(
            "SELECT id, name, applied_at FROM __migrations ORDER BY applied_at, rowid");
        while (stmt.step()) {
            applied.push_back({stmt.columnString(0), stmt.columnString(1), stmt.columnString(2)});
        }
    } catch (const DatabaseException& e) {
        STOCKDB_LOG_ERROR("cannot read applied migrations", {StringField("error", e.message())});
        applied.clear();
    }
    return applied;
}

HealthStatus DatabaseMigrator::healthCheck() {
    HealthStatus status;

    try {
        auto stmt = conn_->prepare("SELECT 1 AS test");
        status.connectionTest = stmt.step() && stmt.columnInt(0) == 1;

        std::set<std::string> appliedIds;
        std::string lastName;
        auto rows = conn_->prepare(
            "SELECT id, name FROM __migrations ORDER BY applied_at, rowid");
        size_t appliedCount = 0;
        while (rows.step()) {
            appliedIds.insert(rows.columnString(0));
            lastName = rows.columnString(1);
            ++appliedCount;
        }

        status.totalMigrations = migrations_.size();
        status.appliedMigrations = appliedCount;
        status.pendingMigrations = static_cast<size_t>(std::count_if(
            migrations_.begin(), migrations_.end(),
            [&](const Migration& m) { return appliedIds.count(m.id) == 0; }));
        if (!lastName.empty()) {
            status.lastMigration = lastName;
        }
        status.healthy = status.connectionTest;
    } catch (const DatabaseException& e) {
        status = HealthStatus{};
        status.error = e.message();
    }

    return status;
}

void DatabaseMigrator::close() {
    conn_->close();
}

} // namespace stockdb
