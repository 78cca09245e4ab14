/**
 * @file migration.hpp
 * @brief Migration registry and the base migration runner
 *
 * INDUSTRY PRACTICE #12: Schema Migrations
 * ==========================================
 * The dashboard schema evolves as hand-authored migrations. Each one has a
 * string id ("<seq>_<semver>_<slug>", e.g. "002_v1.1_create_stocks_tables"),
 * a display name and a forward/backward procedure pair.
 *
 * The database remembers what it has seen in the __migrations table:
 *
 *   __migrations(id TEXT PRIMARY KEY, name TEXT NOT NULL, applied_at DATETIME)
 *
 * Pending = registered ids without a row there, in registration order.
 * A new installation runs everything; an existing one only the tail.
 *
 * Atomicity
 * ==========================================
 * A forward procedure and the insert of its tracking row share one
 * transaction. If the procedure throws or times out, neither the schema
 * change nor the row survives, and the migration is still pending on the
 * next run. The same holds for rollback and the row delete.
 *
 * Procedures must therefore not issue BEGIN / COMMIT themselves.
 */

#pragma once

#include <chrono>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>
#include "connection.hpp"
#include "options.hpp"
#include "statement_adapter.hpp"

namespace stockdb {

/**
 * @brief Forward or backward procedure. Signals failure by throwing.
 */
using MigrationProcedure = std::function<void(StatementAdapter&)>;

/**
 * @brief A hand-authored schema change
 *
 *   Migration m{
 *       "003_v1.2_add_watchlists",
 *       "Add watchlists",
 *       [](StatementAdapter& db) { db.execute("CREATE TABLE watchlists (id TEXT PRIMARY KEY)"); },
 *       [](StatementAdapter& db) { db.execute("DROP TABLE watchlists"); }
 *   };
 */
struct Migration {
    std::string id;
    std::string name;
    MigrationProcedure up;
    MigrationProcedure down;
};

/**
 * @brief A row of __migrations
 */
struct AppliedMigration {
    std::string id;
    std::string name;
    std::string appliedAt;  // "YYYY-MM-DD HH:MM:SS.SSS", UTC
};

struct MigrationRunResult {
    bool success = true;
    std::vector<std::string> applied;
    std::vector<std::string> errors;
};

struct RollbackResult {
    bool success = false;
    std::string error;
};

struct ValidationResult {
    bool valid = true;
    std::vector<std::string> issues;
};

struct HealthStatus {
    bool healthy = false;
    bool connectionTest = false;
    size_t totalMigrations = 0;
    size_t appliedMigrations = 0;
    size_t pendingMigrations = 0;
    std::string lastMigration = "none";
    std::string error;  // set when the check itself failed
};

/**
 * @brief Registry plus base runner
 *
 * Usage:
 *   DatabaseMigrator migrator("dashboard.db");
 *   migrations::registerDefaultMigrations(migrator);
 *
 *   auto check = migrator.validate();
 *   auto result = migrator.run();
 *   if (!result.success) {
 *       for (const auto& e : result.errors) std::cerr << e << "\n";
 *   }
 *
 * None of the operations below throw; failures come back in result
 * objects. Only the constructor throws (bad options, unopenable database).
 * A single migrator must not be used from several threads at once.
 */
class DatabaseMigrator {
public:
    static constexpr std::chrono::milliseconds kDefaultRunTimeout{30000};

    /**
     * @param dbPath Database file, or ":memory:" for an ephemeral database
     * @throws std::invalid_argument if batchSize is 0 or maxRetries < 1
     * @throws ConnectionException if the database cannot be opened
     */
    explicit DatabaseMigrator(const std::string& dbPath = Connection::kMemoryPath,
                              MigratorOptions options = MigratorOptions{});

    virtual ~DatabaseMigrator();

    DatabaseMigrator(const DatabaseMigrator&) = delete;
    DatabaseMigrator& operator=(const DatabaseMigrator&) = delete;

    /**
     * @brief Append to the registry. Uniqueness is checked by validate().
     */
    void add(Migration migration);

    void add(std::string id, std::string name,
             MigrationProcedure up, MigrationProcedure down);

    /**
     * @brief Report every registry problem found, not just the first
     *
     * Issues: "Duplicate migration IDs: a, b",
     *         "Migration X missing up function",
     *         "Migration X missing down function".
     */
    ValidationResult validate() const;

    /**
     * @brief Apply pending migrations in registry order
     *
     * Migrations are processed in batches of options().batchSize with
     * options().batchPause between batches. The first failure stops the
     * run; the result keeps the ids committed before it.
     *
     * @param timeout Budget per forward procedure, 0 for none
     */
    MigrationRunResult run(std::chrono::milliseconds timeout = kDefaultRunTimeout);

    /**
     * @brief Run one migration's backward procedure and forget its record
     */
    RollbackResult rollback(const std::string& migrationId,
                            std::chrono::milliseconds timeout = kDefaultRunTimeout);

    /**
     * @brief Tracking rows ordered by applied_at ascending
     *
     * Returns an empty list if the tracking table cannot be read.
     */
    std::vector<AppliedMigration> appliedMigrations();

    HealthStatus healthCheck();

    const std::vector<Migration>& migrations() const { return migrations_; }

    const MigratorOptions& options() const { return options_; }

    Connection& connection() { return *conn_; }

    /**
     * @brief Close the database connection; see Connection::close()
     */
    void close();

protected:
    /**
     * @brief Registered migrations without a tracking row, registry order
     * @throws DatabaseException if the tracking table cannot be read
     */
    std::vector<Migration> pendingMigrations();

    const Migration* findMigration(const std::string& migrationId) const;

    StatementAdapter& adapter() { return *adapter_; }

    /**
     * @brief Execute SQL directly, bypassing the adapter's cancellation state
     */
    void rawExecute(const std::string& sql);

    void recordApplied(const Migration& migration);
    void removeApplied(const std::string& migrationId);

    /**
     * @brief Run a procedure with a time budget
     *
     * On expiry the adapter is cancelled and the running statement is
     * interrupted; the call returns only once the procedure has stopped,
     * then throws MigrationTimeout("<label> timeout after <N>ms").
     */
    void runWithTimeout(const MigrationProcedure& procedure,
                        const std::string& migrationId,
                        std::chrono::milliseconds timeout,
                        const std::string& label);

    void reportProgress(size_t completed, size_t total, const std::string& currentName) const;

    /**
     * @brief Forward procedure, tracking row and optional check in one transaction
     *
     * beforeCommit runs after the tracking row is written; throwing from it
     * rolls the whole attempt back.
     *
     * @throws on any failure; the transaction is rolled back
     */
    void applyMigration(const Migration& migration,
                        std::chrono::milliseconds timeout,
                        const std::function<void()>& beforeCommit = nullptr);

    /**
     * @brief Backward procedure and row delete in one transaction
     * @throws on any failure; the transaction is rolled back
     */
    void revertMigration(const Migration& migration, std::chrono::milliseconds timeout);

    /**
     * @brief Swap the statement adapter, e.g. for one that injects failures
     */
    void setAdapter(std::unique_ptr<StatementAdapter> adapter);

private:
    void ensureMigrationTable();

    MigratorOptions options_;
    std::unique_ptr<Connection> conn_;
    std::unique_ptr<StatementAdapter> adapter_;
    std::vector<Migration> migrations_;
};

} // namespace stockdb
