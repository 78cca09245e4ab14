/**
 * @file test_main.cpp
 * @brief Unit tests for the stockdb migration engine
 *
 * Test with In-Memory Databases
 * =====================================================
 * Most tests run against ":memory:" so each one starts from an empty
 * schema. Backup and restore need a real file; those tests work inside a
 * throwaway directory under the system temp path.
 *
 * Retry backoff is configured down to a millisecond so that retry tests
 * finish quickly while still going through the sleep path. One test keeps
 * a measurable base delay to check the exponential growth.
 */

#include <algorithm>
#include <atomic>
#include <chrono>
#include <cstdlib>
#include <filesystem>
#include <iostream>
#include <limits>
#include <sstream>
#include <thread>
#include "stockdb/stockdb.hpp"
#include "stockdb/clock.hpp"

using namespace stockdb;
namespace fs = std::filesystem;

// Simple test framework macros
#define TEST(name) void test_##name()
#define RUN_TEST(name) do { \
    std::cout << "  Running " #name "... "; \
    try { \
        test_##name(); \
        std::cout << "PASSED\n"; \
        passed++; \
    } catch (const std::exception& e) { \
        std::cout << "FAILED: " << e.what() << "\n"; \
        failed++; \
    } \
} while(0)

#define ASSERT_TRUE(expr) do { \
    if (!(expr)) throw std::runtime_error("Assertion failed: " #expr); \
} while(0)

#define ASSERT_EQ(a, b) do { \
    if ((a) != (b)) { \
        std::ostringstream oss; \
        oss << "Assertion failed: " << (a) << " != " << (b); \
        throw std::runtime_error(oss.str()); \
    } \
} while(0)

#define ASSERT_THROWS(expr, ExceptionType) do { \
    bool caught = false; \
    try { expr; } catch (const ExceptionType&) { caught = true; } \
    if (!caught) throw std::runtime_error("Expected " #ExceptionType " not thrown"); \
} while(0)

// ========== Helpers ==========

namespace {

class TempDir {
public:
    TempDir() {
        static int counter = 0;
        path_ = fs::temp_directory_path() /
                ("stockdb_test_" + std::to_string(unixMillisNow()) + "_" + std::to_string(counter++));
        fs::create_directories(path_);
    }

    ~TempDir() {
        std::error_code ec;
        fs::remove_all(path_, ec);
    }

    TempDir(const TempDir&) = delete;
    TempDir& operator=(const TempDir&) = delete;

    std::string file(const std::string& name) const { return (path_ / name).string(); }

private:
    fs::path path_;
};

MigratorOptions fastOptions() {
    MigratorOptions options;
    options.retryBaseDelay = std::chrono::milliseconds(1);
    options.batchPause = std::chrono::milliseconds(1);
    options.integrity = IntegrityRules::pragmasOnly();
    options.backupDir = (fs::temp_directory_path() / "stockdb_test_backups").string();
    return options;
}

Migration tableMigration(const std::string& id, const std::string& table) {
    return Migration{
        id,
        "Create " + table,
        [table](StatementAdapter& db) { db.execute("CREATE TABLE " + table + " (id INTEGER PRIMARY KEY)"); },
        [table](StatementAdapter& db) { db.execute("DROP TABLE " + table); }
    };
}

int64_t scalar(Connection& conn, const std::string& sql) {
    auto stmt = conn.prepare(sql);
    if (!stmt.step()) {
        throw std::runtime_error("no row for: " + sql);
    }
    return stmt.columnInt64(0);
}

bool contains(const std::vector<std::string>& items, const std::string& text) {
    return std::find(items.begin(), items.end(), text) != items.end();
}

bool startsWith(const std::string& text, const std::string& prefix) {
    return text.compare(0, prefix.size(), prefix) == 0;
}

/**
 * @brief Adapter that fails on the N-th statement it is asked to send
 */
class FailingAdapter : public StatementAdapter {
public:
    FailingAdapter(Connection& conn, int failOn)
        : StatementAdapter(conn), failOn_(failOn) {}

    int sent() const { return sent_; }

protected:
    void send(const std::string& sql) override {
        if (++sent_ == failOn_) {
            throw QueryException("injected failure", sql);
        }
        StatementAdapter::send(sql);
    }

private:
    int failOn_;
    int sent_ = 0;
};

class TestMigrator : public EnhancedMigrator {
public:
    using EnhancedMigrator::EnhancedMigrator;

    void useAdapter(std::unique_ptr<StatementAdapter> adapter) {
        setAdapter(std::move(adapter));
    }
};

} // namespace

// ========== Connection Tests ==========

TEST(connection_open_memory) {
    auto conn = Connection::inMemory();
    ASSERT_TRUE(conn->isOpen());
    ASSERT_EQ(conn->path(), ":memory:");
    ASSERT_TRUE(!conn->isFileBacked());
    ASSERT_TRUE(Connection::isEphemeralPath(""));
}

TEST(connection_introspection) {
    auto conn = Connection::inMemory();
    conn->execute("CREATE TABLE test (id INTEGER PRIMARY KEY, value TEXT)");
    conn->execute("CREATE INDEX test_value_idx ON test (value)");

    ASSERT_TRUE(conn->tableExists("test"));
    ASSERT_TRUE(conn->indexExists("test_value_idx"));
    auto indexes = conn->indexNames("test");
    ASSERT_TRUE(contains(indexes, "test_value_idx"));
}

TEST(connection_reopen_file) {
    TempDir dir;
    auto conn = Connection::open(dir.file("reopen.db"));
    ASSERT_TRUE(conn->isFileBacked());
    conn->execute("CREATE TABLE kept (id INTEGER)");

    conn->close();
    ASSERT_TRUE(!conn->isOpen());
    ASSERT_THROWS(conn->execute("SELECT 1"), QueryException);

    conn->reopen();
    ASSERT_TRUE(conn->tableExists("kept"));
}

TEST(connection_reopen_with_live_statement) {
    TempDir dir;
    auto conn = Connection::open(dir.file("live.db"));
    conn->execute("CREATE TABLE t (id INTEGER)");
    {
        auto stmt = conn->prepare("SELECT id FROM t");
        conn->reopen();
        ASSERT_TRUE(conn->tableExists("t"));
    }   // finalized after its handle was closed
    ASSERT_EQ(scalar(*conn, "SELECT COUNT(*) FROM t"), 0);
}

// ========== Statement Tests ==========

TEST(statement_query_results) {
    auto conn = Connection::inMemory();
    conn->execute("CREATE TABLE test (id INTEGER PRIMARY KEY, name TEXT, value REAL)");

    auto insert = conn->prepare("INSERT INTO test (name, value) VALUES (?, ?)");
    insert.bind(1, "test").bind(2, 3.14).execute();
    ASSERT_EQ(conn->lastInsertRowId(), 1);

    auto stmt = conn->prepare("SELECT id, name, value FROM test WHERE id = ?");
    stmt.bind(1, 1);
    ASSERT_TRUE(stmt.step());
    ASSERT_EQ(stmt.columnInt64(0), 1);
    ASSERT_EQ(stmt.columnString(1), "test");
    ASSERT_TRUE(stmt.columnDouble(2) > 3.13 && stmt.columnDouble(2) < 3.15);
}

TEST(statement_null_handling) {
    auto conn = Connection::inMemory();
    conn->execute("CREATE TABLE test (id INTEGER PRIMARY KEY, value TEXT)");

    auto stmt = conn->prepare("INSERT INTO test (value) VALUES (?)");
    stmt.bind(1, null).execute();

    auto query = conn->prepare("SELECT value FROM test WHERE id = 1");
    ASSERT_TRUE(query.step());
    ASSERT_TRUE(query.isNull(0));
    ASSERT_TRUE(!query.columnOptionalString(0).has_value());
}

// ========== Transaction Tests ==========

TEST(transaction_commit) {
    auto conn = Connection::inMemory();
    conn->execute("CREATE TABLE test (id INTEGER PRIMARY KEY)");

    {
        Transaction txn = conn->beginTransaction();
        conn->execute("INSERT INTO test DEFAULT VALUES");
        ASSERT_TRUE(conn->inTransaction());
        txn.commit();
    }

    ASSERT_TRUE(!conn->inTransaction());
    ASSERT_EQ(scalar(*conn, "SELECT COUNT(*) FROM test"), 1);
}

TEST(transaction_rollback_on_scope_exit) {
    auto conn = Connection::inMemory();

    {
        Transaction txn(*conn);
        conn->execute("CREATE TABLE ddl_in_txn (id INTEGER)");
        // No commit: DDL is transactional in SQLite
    }

    ASSERT_TRUE(!conn->tableExists("ddl_in_txn"));
}

TEST(transaction_explicit_rollback) {
    auto conn = Connection::inMemory();
    conn->execute("CREATE TABLE test (id INTEGER PRIMARY KEY)");

    Transaction txn = conn->beginTransaction();
    conn->execute("INSERT INTO test DEFAULT VALUES");
    txn.rollback();

    ASSERT_EQ(scalar(*conn, "SELECT COUNT(*) FROM test"), 0);
    ASSERT_THROWS(txn.commit(), TransactionException);
}

// ========== Exception Tests ==========

TEST(exception_query) {
    auto conn = Connection::inMemory();
    ASSERT_THROWS(conn->execute("SELECT * FROM nonexistent"), QueryException);
}

TEST(exception_constraint) {
    auto conn = Connection::inMemory();
    conn->execute("CREATE TABLE test (id INTEGER PRIMARY KEY, email TEXT UNIQUE)");
    conn->execute("INSERT INTO test (email) VALUES ('test@example.com')");

    ASSERT_THROWS(
        conn->execute("INSERT INTO test (email) VALUES ('test@example.com')"),
        ConstraintException
    );
}

TEST(exception_message_without_code) {
    MigrationException plain("boom", "001_x");
    ASSERT_EQ(errorMessage(plain), "boom");
    ASSERT_EQ(plain.migrationId(), "001_x");

    std::runtime_error other("other failure");
    ASSERT_EQ(errorMessage(other), "other failure");
}

// ========== Statement Adapter Tests ==========

TEST(adapter_executes_literal_sql) {
    auto conn = Connection::inMemory();
    StatementAdapter adapter(*conn);

    adapter.execute("CREATE TABLE plain (id INTEGER)");
    ASSERT_TRUE(conn->tableExists("plain"));
}

TEST(adapter_flattens_nested_fragments) {
    auto conn = Connection::inMemory();
    StatementAdapter adapter(*conn);
    adapter.execute("CREATE TABLE quotes (n INTEGER, who TEXT, note TEXT, price REAL, raw BLOB)");

    SqlFragment values = sql("VALUES (")
        .param(int64_t{42}).append(", ")
        .param(std::string("O'Neil")).append(", ")
        .param(null).append(", ")
        .param(2.5).append(", ")
        .param(std::vector<uint8_t>{0x0A, 0xFF}).append(")");

    SqlFragment insert = sql("INSERT INTO ", SqlFragment::raw("quotes"),
                             " (n, who, note, price, raw) ", values);

    ASSERT_EQ(StatementAdapter::flatten(insert),
              "INSERT INTO quotes (n, who, note, price, raw) VALUES (42, 'O''Neil', NULL, 2.5, X'0AFF')");

    adapter.execute(insert);

    auto stmt = conn->prepare("SELECT n, who, note FROM quotes");
    ASSERT_TRUE(stmt.step());
    ASSERT_EQ(stmt.columnInt(0), 42);
    ASSERT_EQ(stmt.columnString(1), "O'Neil");
    ASSERT_TRUE(stmt.isNull(2));
}

TEST(adapter_rejects_malformed_fragments) {
    auto conn = Connection::inMemory();
    StatementAdapter adapter(*conn);

    SqlFragment nullNested("SELECT ");
    nullNested.nest(SqlFragment::Nested{});
    ASSERT_THROWS(StatementAdapter::flatten(nullNested), QueryFormatError);
    ASSERT_THROWS(adapter.execute(nullNested), QueryFormatError);

    SqlFragment notFinite = sql("SELECT ").param(std::numeric_limits<double>::infinity());
    ASSERT_THROWS(StatementAdapter::flatten(notFinite), QueryFormatError);

    SqlFragment deep("SELECT 1");
    for (int i = 0; i < StatementAdapter::kMaxNestingDepth + 5; ++i) {
        SqlFragment outer;
        outer.nest(std::move(deep));
        deep = std::move(outer);
    }
    ASSERT_THROWS(StatementAdapter::flatten(deep), QueryFormatError);
}

TEST(adapter_cancellation) {
    auto conn = Connection::inMemory();
    StatementAdapter adapter(*conn);

    adapter.cancel();
    ASSERT_TRUE(adapter.cancelled());
    ASSERT_THROWS(adapter.execute("CREATE TABLE never (id INTEGER)"), MigrationTimeout);
    ASSERT_TRUE(!conn->tableExists("never"));

    adapter.resetCancellation();
    adapter.execute("CREATE TABLE later (id INTEGER)");
    ASSERT_TRUE(conn->tableExists("later"));
}

// ========== Configuration Tests ==========

TEST(options_from_environment) {
    setenv("STOCKDB_MAX_RETRIES", "5", 1);
    setenv("STOCKDB_BATCH_SIZE", "not-a-number", 1);
    setenv("STOCKDB_BACKUP_DIR", "/tmp/stockdb-env-backups", 1);

    MigratorOptions options = MigratorOptions::fromEnvironment();

    unsetenv("STOCKDB_MAX_RETRIES");
    unsetenv("STOCKDB_BATCH_SIZE");
    unsetenv("STOCKDB_BACKUP_DIR");

    ASSERT_EQ(options.maxRetries, 5);
    ASSERT_EQ(options.batchSize, 5u);
    ASSERT_EQ(options.backupDir, "/tmp/stockdb-env-backups");
}

TEST(constructor_rejects_bad_options) {
    MigratorOptions zeroBatch = fastOptions();
    zeroBatch.batchSize = 0;
    ASSERT_THROWS(DatabaseMigrator(":memory:", zeroBatch), std::invalid_argument);

    MigratorOptions noRetries = fastOptions();
    noRetries.maxRetries = 0;
    ASSERT_THROWS(EnhancedMigrator(":memory:", noRetries), std::invalid_argument);
}

TEST(file_safe_timestamp) {
    TimePoint tp{std::chrono::milliseconds(1714557600123)};
    ASSERT_EQ(fileSafeTimestamp(tp), "2024-05-01T10-00-00-123Z");
    ASSERT_EQ(toUnixMillis(tp), 1714557600123);
}

// ========== Registry Tests ==========

TEST(validate_reports_every_issue) {
    DatabaseMigrator migrator(":memory:", fastOptions());
    migrator.add(tableMigration("X", "first_x"));
    migrator.add(tableMigration("X", "second_x"));
    migrator.add("Y", "No way back",
                 [](StatementAdapter& db) { db.execute("CREATE TABLE y (id INTEGER)"); },
                 nullptr);
    migrator.add("Z", "No way forward", nullptr,
                 [](StatementAdapter& db) { db.execute("DROP TABLE z"); });

    ValidationResult result = migrator.validate();
    ASSERT_TRUE(!result.valid);
    ASSERT_TRUE(contains(result.issues, "Duplicate migration IDs: X"));
    ASSERT_TRUE(contains(result.issues, "Migration Y missing down function"));
    ASSERT_TRUE(contains(result.issues, "Migration Z missing up function"));
    ASSERT_EQ(result.issues.size(), 3u);
}

TEST(validate_default_migrations) {
    DatabaseMigrator migrator(":memory:", fastOptions());
    migrations::registerDefaultMigrations(migrator);

    ValidationResult result = migrator.validate();
    ASSERT_TRUE(result.valid);
    ASSERT_EQ(migrator.migrations().size(), 2u);
    ASSERT_EQ(migrator.migrations()[0].id, migrations::kAuthTablesId);
}

// ========== Base Runner Tests ==========

TEST(run_applies_in_registry_order) {
    DatabaseMigrator migrator(":memory:", fastOptions());
    migrator.add(tableMigration("003_c", "c"));
    migrator.add(tableMigration("001_a", "a"));
    migrator.add(tableMigration("002_b", "b"));

    MigrationRunResult result = migrator.run();
    ASSERT_TRUE(result.success);
    ASSERT_EQ(result.applied.size(), 3u);
    ASSERT_EQ(result.applied[0], "003_c");
    ASSERT_EQ(result.applied[2], "002_b");

    auto applied = migrator.appliedMigrations();
    ASSERT_EQ(applied.size(), 3u);
    ASSERT_EQ(applied[0].id, "003_c");
    ASSERT_EQ(applied[1].id, "001_a");
    ASSERT_EQ(applied[2].id, "002_b");
    ASSERT_EQ(applied[1].name, "Create a");
    ASSERT_TRUE(!applied[0].appliedAt.empty());
}

TEST(run_is_idempotent) {
    DatabaseMigrator migrator(":memory:", fastOptions());
    migrator.add(tableMigration("001_a", "a"));

    ASSERT_EQ(migrator.run().applied.size(), 1u);

    MigrationRunResult second = migrator.run();
    ASSERT_TRUE(second.success);
    ASSERT_TRUE(second.applied.empty());
    ASSERT_TRUE(second.errors.empty());
}

TEST(run_stops_at_first_failure) {
    DatabaseMigrator migrator(":memory:", fastOptions());
    migrator.add(tableMigration("001_a", "a"));
    migrator.add("002_b", "Broken",
                 [](StatementAdapter& db) {
                     db.execute("CREATE TABLE b_partial (id INTEGER)");
                     throw std::runtime_error("boom");
                 },
                 [](StatementAdapter& db) { db.execute("DROP TABLE b_partial"); });
    migrator.add(tableMigration("003_c", "c"));

    MigrationRunResult result = migrator.run();
    ASSERT_TRUE(!result.success);
    ASSERT_EQ(result.applied.size(), 1u);
    ASSERT_EQ(result.applied[0], "001_a");
    ASSERT_EQ(result.errors.size(), 1u);
    ASSERT_EQ(result.errors[0], "Migration 002_b: boom");

    Connection& conn = migrator.connection();
    ASSERT_TRUE(conn.tableExists("a"));
    ASSERT_TRUE(!conn.tableExists("b_partial"));
    ASSERT_TRUE(!conn.tableExists("c"));

    auto applied = migrator.appliedMigrations();
    ASSERT_EQ(applied.size(), 1u);
    ASSERT_EQ(applied[0].id, "001_a");
}

TEST(run_batches_and_reports_progress) {
    struct Progress {
        size_t completed;
        size_t total;
        std::string name;
    };
    std::vector<Progress> seen;

    MigratorOptions options = fastOptions();
    options.batchSize = 2;
    options.onProgress = [&seen](size_t completed, size_t total, const std::string& name) {
        seen.push_back({completed, total, name});
    };

    DatabaseMigrator migrator(":memory:", options);
    for (int i = 1; i <= 5; ++i) {
        migrator.add(tableMigration("00" + std::to_string(i), "t" + std::to_string(i)));
    }

    MigrationRunResult result = migrator.run();
    ASSERT_TRUE(result.success);
    ASSERT_EQ(result.applied.size(), 5u);
    ASSERT_EQ(seen.size(), 5u);
    for (size_t i = 0; i < seen.size(); ++i) {
        ASSERT_EQ(seen[i].completed, i);
        ASSERT_EQ(seen[i].total, 5u);
    }
    ASSERT_EQ(seen[4].name, "Create t5");
}

TEST(rollback_removes_record_and_schema) {
    DatabaseMigrator migrator(":memory:", fastOptions());
    migrator.add(tableMigration("001_a", "a"));
    migrator.add(tableMigration("002_b", "b"));
    migrator.run();

    RollbackResult rolled = migrator.rollback("002_b");
    ASSERT_TRUE(rolled.success);
    ASSERT_TRUE(rolled.error.empty());
    ASSERT_TRUE(!migrator.connection().tableExists("b"));
    ASSERT_TRUE(migrator.connection().tableExists("a"));

    auto applied = migrator.appliedMigrations();
    ASSERT_EQ(applied.size(), 1u);
    ASSERT_EQ(applied[0].id, "001_a");

    RollbackResult missing = migrator.rollback("999_missing");
    ASSERT_TRUE(!missing.success);
    ASSERT_EQ(missing.error, "Migration 999_missing not found");
}

TEST(rollback_failure_keeps_record) {
    DatabaseMigrator migrator(":memory:", fastOptions());
    migrator.add("001_a", "Sticky",
                 [](StatementAdapter& db) { db.execute("CREATE TABLE sticky (id INTEGER)"); },
                 [](StatementAdapter& db) {
                     db.execute("DROP TABLE sticky");
                     db.execute("DROP TABLE does_not_exist");
                 });
    migrator.run();

    RollbackResult rolled = migrator.rollback("001_a");
    ASSERT_TRUE(!rolled.success);
    ASSERT_TRUE(!rolled.error.empty());
    ASSERT_TRUE(migrator.connection().tableExists("sticky"));
    ASSERT_EQ(migrator.appliedMigrations().size(), 1u);
}

TEST(run_times_out_blocked_procedure) {
    std::atomic<bool> reachedDatabase{false};

    DatabaseMigrator migrator(":memory:", fastOptions());
    migrator.add("001_slow", "Slow",
                 [&reachedDatabase](StatementAdapter& db) {
                     std::this_thread::sleep_for(std::chrono::milliseconds(300));
                     reachedDatabase = true;
                     db.execute("CREATE TABLE slow_t (id INTEGER)");
                 },
                 [](StatementAdapter& db) { db.execute("DROP TABLE slow_t"); });

    MigrationRunResult result = migrator.run(std::chrono::milliseconds(50));
    ASSERT_TRUE(!result.success);
    ASSERT_EQ(result.errors.size(), 1u);
    ASSERT_EQ(result.errors[0], "Migration 001_slow: Migration timeout after 50ms");

    // The procedure was waited for but its late statement was refused
    ASSERT_TRUE(reachedDatabase.load());
    ASSERT_TRUE(!migrator.connection().tableExists("slow_t"));
    ASSERT_TRUE(migrator.appliedMigrations().empty());

    // Without a limit the same migration goes through
    MigrationRunResult retry = migrator.run(std::chrono::milliseconds(0));
    ASSERT_TRUE(retry.success);
    ASSERT_TRUE(migrator.connection().tableExists("slow_t"));
}

TEST(run_times_out_long_statement) {
    DatabaseMigrator migrator(":memory:", fastOptions());
    migrator.add("001_spin", "Spin",
                 [](StatementAdapter& db) {
                     db.execute("CREATE TABLE spin_t (id INTEGER)");
                     db.execute("WITH RECURSIVE c(x) AS (SELECT 1 UNION ALL SELECT x + 1 FROM c) "
                                "SELECT count(*) FROM c");
                 },
                 [](StatementAdapter& db) { db.execute("DROP TABLE spin_t"); });

    MigrationRunResult result = migrator.run(std::chrono::milliseconds(100));
    ASSERT_TRUE(!result.success);
    ASSERT_EQ(result.errors[0], "Migration 001_spin: Migration timeout after 100ms");
    ASSERT_TRUE(!migrator.connection().tableExists("spin_t"));
    ASSERT_TRUE(!migrator.connection().inTransaction());

    HealthStatus health = migrator.healthCheck();
    ASSERT_TRUE(health.healthy);
}

TEST(rollback_times_out) {
    DatabaseMigrator migrator(":memory:", fastOptions());
    migrator.add("001_a", "Slow down",
                 [](StatementAdapter& db) { db.execute("CREATE TABLE slow_down (id INTEGER)"); },
                 [](StatementAdapter& db) {
                     std::this_thread::sleep_for(std::chrono::milliseconds(200));
                     db.execute("DROP TABLE slow_down");
                 });
    migrator.run();

    RollbackResult rolled = migrator.rollback("001_a", std::chrono::milliseconds(30));
    ASSERT_TRUE(!rolled.success);
    ASSERT_EQ(rolled.error, "Rollback timeout after 30ms");
    ASSERT_TRUE(migrator.connection().tableExists("slow_down"));
    ASSERT_EQ(migrator.appliedMigrations().size(), 1u);
}

TEST(health_check_accuracy) {
    DatabaseMigrator migrator(":memory:", fastOptions());
    migrator.add(tableMigration("001_a", "a"));

    HealthStatus before = migrator.healthCheck();
    ASSERT_TRUE(before.healthy);
    ASSERT_TRUE(before.connectionTest);
    ASSERT_EQ(before.totalMigrations, 1u);
    ASSERT_EQ(before.appliedMigrations, 0u);
    ASSERT_EQ(before.pendingMigrations, 1u);
    ASSERT_EQ(before.lastMigration, "none");

    migrator.run();

    HealthStatus after = migrator.healthCheck();
    ASSERT_EQ(after.appliedMigrations, 1u);
    ASSERT_EQ(after.pendingMigrations, 0u);
    ASSERT_EQ(after.lastMigration, "Create a");
}

TEST(closed_migrator_reports_instead_of_throwing) {
    DatabaseMigrator migrator(":memory:", fastOptions());
    migrator.add(tableMigration("001_a", "a"));
    migrator.close();

    HealthStatus health = migrator.healthCheck();
    ASSERT_TRUE(!health.healthy);
    ASSERT_TRUE(!health.error.empty());
    ASSERT_TRUE(migrator.appliedMigrations().empty());

    MigrationRunResult result = migrator.run();
    ASSERT_TRUE(!result.success);
    ASSERT_TRUE(startsWith(result.errors[0], "Migration system error: "));
}

// ========== Integrity Tests ==========

TEST(schema_validator_pass) {
    auto conn = Connection::inMemory();
    conn->execute("CREATE TABLE stocks (ts_code TEXT PRIMARY KEY, name TEXT NOT NULL)");
    conn->execute("CREATE INDEX stocks_name_idx ON stocks (name)");

    SchemaValidator validator;
    validator.requireTable("stocks")
             .requireColumn("stocks", "ts_code", "TEXT")
             .requireColumn("stocks", "name", "TEXT")
             .requireNotNull("stocks", "name")
             .requireIndex("stocks", "stocks_name_idx");

    ASSERT_TRUE(validator.validate(*conn).empty());
}

TEST(schema_validator_fail) {
    auto conn = Connection::inMemory();
    conn->execute("CREATE TABLE stocks (ts_code INTEGER)");

    SchemaValidator validator;
    validator.requireTable("stocks")
             .requireTable("stock_daily")              // Missing
             .requireColumn("stocks", "name", "TEXT")  // Missing
             .requireColumn("stocks", "ts_code", "TEXT");  // Wrong type

    auto errors = validator.validate(*conn);
    ASSERT_EQ(errors.size(), 3u);
    ASSERT_EQ(errors[0].type, "missing_table");
    ASSERT_EQ(errors[0].subject, "stock_daily");
}

TEST(integrity_validator_clean_database) {
    auto conn = Connection::inMemory();
    IntegrityValidator validator;

    IntegrityReport report = validator.validate(*conn);
    ASSERT_TRUE(report.valid);
    ASSERT_TRUE(report.issues.empty());
}

TEST(integrity_validator_reports_all_issues) {
    auto conn = Connection::inMemory();
    conn->execute("CREATE TABLE stocks (ts_code TEXT PRIMARY KEY, symbol TEXT)");
    conn->execute("CREATE INDEX stocks_symbol_idx ON stocks (symbol)");
    conn->execute("CREATE TABLE __migrations (id TEXT PRIMARY KEY)");
    conn->execute("INSERT INTO __migrations (id) VALUES ('002_v1.1_create_stocks_tables')");

    conn->execute("CREATE TABLE parent (id INTEGER PRIMARY KEY)");
    conn->execute("CREATE TABLE child (id INTEGER, parent_id INTEGER REFERENCES parent (id))");
    conn->execute("PRAGMA foreign_keys = OFF");
    conn->execute("INSERT INTO child (id, parent_id) VALUES (1, 99)");
    conn->execute("INSERT INTO child (id, parent_id) VALUES (2, 98)");
    conn->execute("PRAGMA foreign_keys = ON");

    IntegrityReport report = IntegrityValidator(IntegrityRules::stockDefaults()).validate(*conn);
    ASSERT_TRUE(!report.valid);
    ASSERT_TRUE(contains(report.issues, "Foreign key violations: 2 rows"));
    ASSERT_TRUE(contains(report.issues, "Missing index: stocks_name_idx"));
    ASSERT_TRUE(contains(report.issues, "Missing index: stocks_industry_idx"));
    ASSERT_TRUE(!contains(report.issues, "Missing index: stocks_symbol_idx"));
    ASSERT_TRUE(contains(report.issues, "Missing table: stock_daily"));
    ASSERT_TRUE(contains(report.issues, "Missing table: user_stock_favorites"));
    ASSERT_EQ(report.issues.size(), 5u);
}

// ========== Enhanced Runner Tests ==========

TEST(enhanced_success_and_logs) {
    EnhancedMigrator migrator(":memory:", fastOptions());
    migrator.add(tableMigration("001_a", "a"));
    migrator.add(tableMigration("002_b", "b"));

    EnhancedRunResult result = migrator.runEnhanced();
    ASSERT_TRUE(result.success);
    ASSERT_EQ(result.applied.size(), 2u);
    ASSERT_TRUE(result.errors.empty());
    ASSERT_TRUE(result.backups.empty());  // nothing to copy for :memory:
    ASSERT_EQ(migrator.failureCount(), 0);

    auto logs = migrator.getMigrationLogs();
    ASSERT_EQ(logs.size(), 2u);
    ASSERT_EQ(logs[0].id, "002_b");  // newest first
    for (const auto& entry : logs) {
        ASSERT_TRUE(entry.status == MigrationStatus::Completed);
        ASSERT_EQ(entry.attemptCount, 1);
        ASSERT_TRUE(entry.startedAt.has_value());
        ASSERT_TRUE(entry.completedAt.has_value());
        ASSERT_TRUE(!entry.errorMessage.has_value());
        ASSERT_TRUE(entry.createdAt > 0);
    }

    EnhancedRunResult second = migrator.runEnhanced();
    ASSERT_TRUE(second.success);
    ASSERT_TRUE(second.applied.empty());
}

TEST(enhanced_retry_bound) {
    int attempts = 0;

    MigratorOptions options = fastOptions();
    options.maxRetries = 3;
    EnhancedMigrator migrator(":memory:", options);
    migrator.add("001_bad", "Always fails",
                 [&attempts](StatementAdapter&) {
                     ++attempts;
                     throw std::runtime_error("always fails");
                 },
                 [](StatementAdapter&) {});

    EnhancedRunResult result = migrator.runEnhanced();
    ASSERT_TRUE(!result.success);
    ASSERT_EQ(attempts, 3);
    ASSERT_EQ(migrator.failureCount(), 3);
    ASSERT_TRUE(contains(result.errors, "Migration 001_bad failed: always fails"));
    ASSERT_TRUE(result.applied.empty());
    ASSERT_TRUE(result.rolledBack.empty());

    auto entry = migrator.getMigrationLogs().at(0);
    ASSERT_TRUE(entry.status == MigrationStatus::Failed);
    ASSERT_EQ(entry.attemptCount, 3);
    ASSERT_EQ(entry.errorMessage.value_or(""), "always fails");
}

TEST(enhanced_retry_backoff_delays) {
    MigratorOptions options = fastOptions();
    options.maxRetries = 3;
    options.retryBaseDelay = std::chrono::milliseconds(50);
    EnhancedMigrator migrator(":memory:", options);
    migrator.add("001_bad", "Always fails",
                 [](StatementAdapter&) { throw std::runtime_error("always fails"); },
                 [](StatementAdapter&) {});

    auto start = std::chrono::steady_clock::now();
    EnhancedRunResult result = migrator.runEnhanced();
    auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - start);

    // 2^1 * 50ms before attempt 2, 2^2 * 50ms before attempt 3
    ASSERT_TRUE(!result.success);
    ASSERT_EQ(migrator.failureCount(), 3);
    ASSERT_TRUE(elapsed.count() >= 300);
}

TEST(enhanced_timeout_is_retried) {
    std::atomic<int> attempts{0};

    MigratorOptions options = fastOptions();
    options.maxRetries = 3;
    EnhancedMigrator migrator(":memory:", options);
    migrator.add("001_late", "Late",
                 [&attempts](StatementAdapter& db) {
                     if (++attempts <= 2) {
                         std::this_thread::sleep_for(std::chrono::milliseconds(200));
                     }
                     db.execute("CREATE TABLE late (id INTEGER)");
                 },
                 [](StatementAdapter& db) { db.execute("DROP TABLE late"); });

    EnhancedRunResult result = migrator.runEnhanced(std::chrono::milliseconds(30));
    ASSERT_TRUE(result.success);
    ASSERT_EQ(attempts.load(), 3);
    ASSERT_EQ(migrator.failureCount(), 2);
    ASSERT_EQ(result.applied.size(), 1u);
    ASSERT_TRUE(migrator.connection().tableExists("late"));

    auto entry = migrator.getMigrationLogs().at(0);
    ASSERT_TRUE(entry.status == MigrationStatus::Completed);
    ASSERT_EQ(entry.attemptCount, 3);
}

TEST(tracking_tables_default_created_at) {
    EnhancedMigrator migrator(":memory:", fastOptions());
    Connection& conn = migrator.connection();

    int64_t before = unixMillisNow();
    conn.execute("INSERT INTO __migration_logs (id, name, status) VALUES ('x', 'X', 'pending')");
    conn.execute("INSERT INTO __migration_backups (migration_id, backup_path, file_size) "
                 "VALUES ('x', '/tmp/x.db', 0)");
    int64_t after = unixMillisNow();

    int64_t logCreated = scalar(conn, "SELECT created_at FROM __migration_logs WHERE id = 'x'");
    int64_t backupCreated = scalar(conn, "SELECT created_at FROM __migration_backups");
    ASSERT_TRUE(logCreated >= before - 1000 && logCreated <= after + 1000);
    ASSERT_TRUE(backupCreated >= before - 1000 && backupCreated <= after + 1000);
}

TEST(enhanced_retry_then_success) {
    int attempts = 0;

    EnhancedMigrator migrator(":memory:", fastOptions());
    migrator.add("001_flaky", "Flaky",
                 [&attempts](StatementAdapter& db) {
                     db.execute("CREATE TABLE flaky (id INTEGER)");
                     if (++attempts == 1) {
                         throw std::runtime_error("transient");
                     }
                 },
                 [](StatementAdapter& db) { db.execute("DROP TABLE flaky"); });

    EnhancedRunResult result = migrator.runEnhanced();
    ASSERT_TRUE(result.success);
    ASSERT_EQ(attempts, 2);
    ASSERT_EQ(migrator.failureCount(), 1);
    ASSERT_TRUE(migrator.connection().tableExists("flaky"));

    auto entry = migrator.getMigrationLogs().at(0);
    ASSERT_TRUE(entry.status == MigrationStatus::Completed);
    ASSERT_EQ(entry.attemptCount, 2);
}

TEST(enhanced_auto_rollback_reverse_order) {
    std::vector<std::string> reverted;
    auto tracked = [&reverted](const std::string& id, const std::string& table) {
        return Migration{
            id, "Create " + table,
            [table](StatementAdapter& db) { db.execute("CREATE TABLE " + table + " (id INTEGER)"); },
            [table, id, &reverted](StatementAdapter& db) {
                db.execute("DROP TABLE " + table);
                reverted.push_back(id);
            }
        };
    };

    MigratorOptions options = fastOptions();
    options.maxRetries = 2;
    EnhancedMigrator migrator(":memory:", options);
    migrator.add(tracked("001_a", "a"));
    migrator.add(tracked("002_b", "b"));
    migrator.add("003_bad", "Broken",
                 [](StatementAdapter&) { throw std::runtime_error("nope"); },
                 [](StatementAdapter&) {});

    EnhancedRunResult result = migrator.runEnhanced();
    ASSERT_TRUE(!result.success);
    ASSERT_EQ(result.applied.size(), 2u);
    ASSERT_EQ(result.rolledBack.size(), 2u);
    ASSERT_EQ(result.rolledBack[0], "002_b");
    ASSERT_EQ(result.rolledBack[1], "001_a");
    ASSERT_EQ(reverted.size(), 2u);
    ASSERT_EQ(reverted[0], "002_b");
    ASSERT_EQ(reverted[1], "001_a");

    ASSERT_TRUE(migrator.appliedMigrations().empty());
    ASSERT_TRUE(!migrator.connection().tableExists("a"));

    int rolledBackLogs = 0;
    for (const auto& entry : migrator.getMigrationLogs()) {
        if (entry.status == MigrationStatus::RolledBack) {
            ++rolledBackLogs;
        }
        if (entry.id == "003_bad") {
            ASSERT_TRUE(entry.status == MigrationStatus::Failed);
        }
    }
    ASSERT_EQ(rolledBackLogs, 2);
}

TEST(enhanced_auto_rollback_stops_on_failure) {
    MigratorOptions options = fastOptions();
    options.maxRetries = 1;
    EnhancedMigrator migrator(":memory:", options);
    migrator.add(tableMigration("001_a", "a"));
    migrator.add("002_stuck", "Cannot go back",
                 [](StatementAdapter& db) { db.execute("CREATE TABLE stuck (id INTEGER)"); },
                 [](StatementAdapter&) { throw std::runtime_error("irreversible"); });
    migrator.add("003_bad", "Broken",
                 [](StatementAdapter&) { throw std::runtime_error("nope"); },
                 [](StatementAdapter&) {});

    EnhancedRunResult result = migrator.runEnhanced();
    ASSERT_TRUE(!result.success);
    ASSERT_TRUE(result.rolledBack.empty());
    ASSERT_TRUE(contains(result.errors, "Auto-rollback of 002_stuck failed: irreversible"));

    // 001_a was never reached by the sweep
    ASSERT_EQ(migrator.appliedMigrations().size(), 2u);
    ASSERT_TRUE(migrator.connection().tableExists("a"));
}

TEST(enhanced_failure_count_is_per_instance) {
    MigratorOptions options = fastOptions();
    options.maxRetries = 2;

    EnhancedMigrator failing(":memory:", options);
    failing.add("001_bad", "Broken",
                [](StatementAdapter&) { throw std::runtime_error("nope"); },
                [](StatementAdapter&) {});
    failing.runEnhanced();
    ASSERT_EQ(failing.failureCount(), 2);

    EnhancedMigrator healthy(":memory:", options);
    healthy.add(tableMigration("001_a", "a"));
    EnhancedRunResult result = healthy.runEnhanced();
    ASSERT_TRUE(result.success);
    ASSERT_EQ(healthy.failureCount(), 0);

    // Cumulative across runs of the same instance until reset
    failing.runEnhanced();
    ASSERT_EQ(failing.failureCount(), 4);
    failing.resetFailureCount();
    ASSERT_EQ(failing.failureCount(), 0);
}

TEST(enhanced_pre_validation_blocks_run) {
    EnhancedMigrator migrator(":memory:", fastOptions());
    Connection& conn = migrator.connection();
    conn.execute("CREATE TABLE parent (id INTEGER PRIMARY KEY)");
    conn.execute("CREATE TABLE child (parent_id INTEGER REFERENCES parent (id))");
    conn.execute("PRAGMA foreign_keys = OFF");
    conn.execute("INSERT INTO child (parent_id) VALUES (7)");
    conn.execute("PRAGMA foreign_keys = ON");

    migrator.add(tableMigration("001_a", "a"));

    EnhancedRunResult result = migrator.runEnhanced();
    ASSERT_TRUE(!result.success);
    ASSERT_EQ(result.errors.size(), 1u);
    ASSERT_EQ(result.errors[0], "Pre-migration validation failed: Foreign key violations: 1 rows");
    ASSERT_TRUE(result.applied.empty());
    ASSERT_TRUE(!conn.tableExists("a"));
    ASSERT_TRUE(migrator.getMigrationLogs().empty());
}

TEST(enhanced_post_validation_rolls_back_attempt) {
    int attempts = 0;

    MigratorOptions options = fastOptions();
    options.maxRetries = 2;
    options.integrity.expectedIndexes.push_back({"widgets", {"widgets_name_idx"}});

    EnhancedMigrator migrator(":memory:", options);
    migrator.add("001_widgets", "Widgets without index",
                 [&attempts](StatementAdapter& db) {
                     ++attempts;
                     db.execute("CREATE TABLE widgets (id INTEGER, name TEXT)");
                 },
                 [](StatementAdapter& db) { db.execute("DROP TABLE widgets"); });

    EnhancedRunResult result = migrator.runEnhanced();
    ASSERT_TRUE(!result.success);

    // Each attempt re-ran from the pre-migration schema
    ASSERT_EQ(attempts, 2);
    ASSERT_TRUE(!migrator.connection().tableExists("widgets"));
    ASSERT_TRUE(migrator.appliedMigrations().empty());

    auto entry = migrator.getMigrationLogs().at(0);
    ASSERT_TRUE(entry.status == MigrationStatus::Failed);
    ASSERT_EQ(entry.errorMessage.value_or(""),
              "Post-migration validation failed: Missing index: widgets_name_idx");
}

TEST(enhanced_system_error_is_reported) {
    EnhancedMigrator migrator(":memory:", fastOptions());
    migrator.add(tableMigration("001_a", "a"));
    migrator.close();

    EnhancedRunResult result = migrator.runEnhanced();
    ASSERT_TRUE(!result.success);
    ASSERT_EQ(result.errors.size(), 1u);
    ASSERT_TRUE(startsWith(result.errors[0], "Migration system error: "));

    IntegrityReport report = migrator.validateDataIntegrity();
    ASSERT_TRUE(!report.valid);
    ASSERT_TRUE(startsWith(report.issues.at(0), "Integrity validation error: "));
    ASSERT_TRUE(migrator.getMigrationLogs().empty());
}

// ========== Backup Tests ==========

TEST(backup_noop_in_memory) {
    EnhancedMigrator migrator(":memory:", fastOptions());
    ASSERT_TRUE(!migrator.createBackup("001_a").has_value());
    ASSERT_TRUE(!migrator.restoreFromBackup("/nonexistent/backup.db"));
    ASSERT_TRUE(migrator.listBackups().empty());
}

TEST(backup_create_and_restore) {
    TempDir dir;
    MigratorOptions options = fastOptions();
    options.backupDir = dir.file("backups");

    EnhancedMigrator migrator(dir.file("dashboard.db"), options);
    Connection& conn = migrator.connection();
    conn.execute("CREATE TABLE quotes (id INTEGER PRIMARY KEY)");
    conn.execute("INSERT INTO quotes DEFAULT VALUES");

    auto backup = migrator.createBackup("manual");
    ASSERT_TRUE(backup.has_value());
    ASSERT_TRUE(fs::exists(backup->path));
    ASSERT_TRUE(backup->fileSize > 0);
    ASSERT_EQ(backup->migrationId, "manual");
    std::string fileName = fs::path(backup->path).filename().string();
    ASSERT_TRUE(startsWith(fileName, "backup_manual_"));
    ASSERT_EQ(fileName.substr(fileName.size() - 4), "Z.db");
    ASSERT_TRUE(fileName.find(':') == std::string::npos);

    conn.execute("INSERT INTO quotes DEFAULT VALUES");
    conn.execute("INSERT INTO quotes DEFAULT VALUES");
    ASSERT_EQ(scalar(conn, "SELECT COUNT(*) FROM quotes"), 3);

    ASSERT_TRUE(migrator.restoreFromBackup(backup->path));

    // Same Connection object, re-opened on the restored file
    ASSERT_EQ(scalar(conn, "SELECT COUNT(*) FROM quotes"), 1);

    auto catalogue = migrator.listBackups();
    ASSERT_EQ(catalogue.size(), 1u);
    ASSERT_EQ(catalogue[0].path, backup->path);

    ASSERT_TRUE(!migrator.restoreFromBackup(dir.file("missing.db")));
}

TEST(backup_name_replaces_path_characters) {
    TempDir dir;
    MigratorOptions options = fastOptions();
    options.backupDir = dir.file("backups");

    EnhancedMigrator migrator(dir.file("dashboard.db"), options);
    auto backup = migrator.createBackup("003/nested id");
    ASSERT_TRUE(backup.has_value());
    ASSERT_EQ(backup->migrationId, "003/nested id");
    ASSERT_TRUE(fs::exists(backup->path));

    fs::path file(backup->path);
    ASSERT_TRUE(startsWith(file.filename().string(), "backup_003_nested_id_"));
    ASSERT_TRUE(fs::equivalent(file.parent_path(), dir.file("backups")));
}

TEST(backup_cleanup_removes_old) {
    TempDir dir;
    MigratorOptions options = fastOptions();
    options.backupDir = dir.file("backups");

    EnhancedMigrator migrator(dir.file("dashboard.db"), options);
    auto old = migrator.createBackup("old");
    auto fresh = migrator.createBackup("fresh");
    ASSERT_TRUE(old.has_value() && fresh.has_value());

    // Age the first backup by ten days
    auto stmt = migrator.connection().prepare(
        "UPDATE __migration_backups SET created_at = created_at - ? WHERE id = ?");
    stmt.bind(1, int64_t{10} * 24 * 60 * 60 * 1000).bind(2, old->id).execute();

    ASSERT_EQ(migrator.cleanupOldBackups(7), 1u);
    ASSERT_TRUE(!fs::exists(old->path));
    ASSERT_TRUE(fs::exists(fresh->path));

    auto remaining = migrator.listBackups();
    ASSERT_EQ(remaining.size(), 1u);
    ASSERT_EQ(remaining[0].migrationId, "fresh");
}

TEST(enhanced_restores_backup_on_failure) {
    TempDir dir;
    MigratorOptions options = fastOptions();
    options.backupDir = dir.file("backups");
    options.maxRetries = 2;

    EnhancedMigrator migrator(dir.file("dashboard.db"), options);
    migrator.add(tableMigration("001_a", "a"));
    migrator.add("002_bad", "Broken",
                 [](StatementAdapter& db) {
                     db.execute("CREATE TABLE half_done (id INTEGER)");
                     throw std::runtime_error("disk says no");
                 },
                 [](StatementAdapter& db) { db.execute("DROP TABLE half_done"); });

    EnhancedRunResult result = migrator.runEnhanced();
    ASSERT_TRUE(!result.success);
    ASSERT_EQ(result.backups.size(), 2u);
    for (const auto& path : result.backups) {
        ASSERT_TRUE(fs::exists(path));
    }
    ASSERT_TRUE(contains(result.errors, "Migration 002_bad failed: disk says no"));

    // Two failures reach maxRetries, so 001_a is rolled back as well
    ASSERT_EQ(result.rolledBack.size(), 1u);
    ASSERT_EQ(result.rolledBack[0], "001_a");
    ASSERT_TRUE(!migrator.connection().tableExists("a"));
    ASSERT_TRUE(!migrator.connection().tableExists("half_done"));

    // Catalogue and log survive the file restore
    ASSERT_EQ(migrator.listBackups().size(), 2u);
    bool sawFailed = false;
    for (const auto& entry : migrator.getMigrationLogs()) {
        if (entry.id == "002_bad") {
            sawFailed = true;
            ASSERT_TRUE(entry.status == MigrationStatus::Failed);
            ASSERT_EQ(entry.attemptCount, 2);
            ASSERT_TRUE(entry.backupPath.has_value());
        }
    }
    ASSERT_TRUE(sawFailed);
}

// ========== Stock Tables Tests ==========

TEST(stock_tables_create_and_rollback) {
    DatabaseMigrator migrator(":memory:", fastOptions());
    migrations::registerDefaultMigrations(migrator);

    MigrationRunResult result = migrator.run();
    ASSERT_TRUE(result.success);
    ASSERT_EQ(result.applied.size(), 2u);

    Connection& conn = migrator.connection();
    for (const char* table : {"stocks", "stock_daily", "user_stock_favorites"}) {
        ASSERT_TRUE(conn.tableExists(table));
    }
    for (const char* index : {"stocks_symbol_idx", "stocks_name_idx", "stocks_industry_idx",
                              "stocks_market_idx", "stocks_industry_market_idx",
                              "stock_daily_ts_code_trade_date_idx", "stock_daily_trade_date_idx",
                              "stock_daily_ts_code_idx", "stock_daily_ts_code_date_range_idx",
                              "user_stock_favorites_user_ts_code_idx",
                              "user_stock_favorites_user_id_idx",
                              "user_stock_favorites_ts_code_idx"}) {
        ASSERT_TRUE(conn.indexExists(index));
    }

    ASSERT_EQ(scalar(conn, "SELECT COUNT(*) FROM pragma_foreign_key_list('stock_daily')"), 1);
    ASSERT_EQ(scalar(conn, "SELECT COUNT(*) FROM pragma_foreign_key_list('user_stock_favorites')"), 2);

    RollbackResult rolled = migrator.rollback(migrations::kStocksTablesId);
    ASSERT_TRUE(rolled.success);
    ASSERT_EQ(scalar(conn, "SELECT COUNT(*) FROM sqlite_master "
                           "WHERE name LIKE 'stock%' OR name LIKE 'user_stock_favorites%'"), 0);
    ASSERT_TRUE(conn.tableExists("user"));

    auto applied = migrator.appliedMigrations();
    ASSERT_EQ(applied.size(), 1u);
    ASSERT_EQ(applied[0].id, migrations::kAuthTablesId);
}

TEST(stock_tables_enhanced_with_default_integrity) {
    MigratorOptions options = fastOptions();
    options.integrity = IntegrityRules::stockDefaults();

    EnhancedMigrator migrator(":memory:", options);
    migrations::registerDefaultMigrations(migrator);

    EnhancedRunResult result = migrator.runEnhanced();
    ASSERT_TRUE(result.success);
    ASSERT_EQ(result.applied.size(), 2u);
    ASSERT_TRUE(migrator.validateDataIntegrity().valid);

    HealthStatus health = migrator.healthCheck();
    ASSERT_EQ(health.pendingMigrations, 0u);
    ASSERT_EQ(health.lastMigration, "Create stock data tables");

    // Dropping a required index is caught by the next validation
    migrator.connection().execute("DROP INDEX stocks_name_idx");
    IntegrityReport report = migrator.validateDataIntegrity();
    ASSERT_TRUE(!report.valid);
    ASSERT_TRUE(contains(report.issues, "Missing index: stocks_name_idx"));
}

TEST(stock_tables_injected_failure) {
    MigratorOptions options = fastOptions();
    options.maxRetries = 1;
    options.integrity = IntegrityRules::stockDefaults();

    TestMigrator migrator(":memory:", options);
    auto adapter = std::make_unique<FailingAdapter>(migrator.connection(), 3);
    FailingAdapter* failing = adapter.get();
    migrator.useAdapter(std::move(adapter));
    migrator.add(migrations::createStocksTables());

    EnhancedRunResult result = migrator.runEnhanced();
    ASSERT_TRUE(!result.success);
    ASSERT_TRUE(!result.errors.empty());
    ASSERT_EQ(failing->sent(), 3);

    int64_t created = scalar(migrator.connection(),
        "SELECT COUNT(*) FROM sqlite_master WHERE type = 'table' "
        "AND name IN ('stocks', 'stock_daily', 'user_stock_favorites')");
    ASSERT_TRUE(created < 3);
}

// ========== Main ==========

int main() {
    int passed = 0;
    int failed = 0;

    setLogLevel(spdlog::level::warn);

    std::cout << "\nRunning stockdb tests...\n\n";

    std::cout << "Connection tests:\n";
    RUN_TEST(connection_open_memory);
    RUN_TEST(connection_introspection);
    RUN_TEST(connection_reopen_file);
    RUN_TEST(connection_reopen_with_live_statement);

    std::cout << "\nStatement tests:\n";
    RUN_TEST(statement_query_results);
    RUN_TEST(statement_null_handling);

    std::cout << "\nTransaction tests:\n";
    RUN_TEST(transaction_commit);
    RUN_TEST(transaction_rollback_on_scope_exit);
    RUN_TEST(transaction_explicit_rollback);

    std::cout << "\nException tests:\n";
    RUN_TEST(exception_query);
    RUN_TEST(exception_constraint);
    RUN_TEST(exception_message_without_code);

    std::cout << "\nStatement adapter tests:\n";
    RUN_TEST(adapter_executes_literal_sql);
    RUN_TEST(adapter_flattens_nested_fragments);
    RUN_TEST(adapter_rejects_malformed_fragments);
    RUN_TEST(adapter_cancellation);

    std::cout << "\nConfiguration tests:\n";
    RUN_TEST(options_from_environment);
    RUN_TEST(constructor_rejects_bad_options);
    RUN_TEST(file_safe_timestamp);

    std::cout << "\nRegistry tests:\n";
    RUN_TEST(validate_reports_every_issue);
    RUN_TEST(validate_default_migrations);

    std::cout << "\nBase runner tests:\n";
    RUN_TEST(run_applies_in_registry_order);
    RUN_TEST(run_is_idempotent);
    RUN_TEST(run_stops_at_first_failure);
    RUN_TEST(run_batches_and_reports_progress);
    RUN_TEST(rollback_removes_record_and_schema);
    RUN_TEST(rollback_failure_keeps_record);
    RUN_TEST(run_times_out_blocked_procedure);
    RUN_TEST(run_times_out_long_statement);
    RUN_TEST(rollback_times_out);
    RUN_TEST(health_check_accuracy);
    RUN_TEST(closed_migrator_reports_instead_of_throwing);

    std::cout << "\nIntegrity tests:\n";
    RUN_TEST(schema_validator_pass);
    RUN_TEST(schema_validator_fail);
    RUN_TEST(integrity_validator_clean_database);
    RUN_TEST(integrity_validator_reports_all_issues);

    std::cout << "\nEnhanced runner tests:\n";
    RUN_TEST(enhanced_success_and_logs);
    RUN_TEST(enhanced_retry_bound);
    RUN_TEST(enhanced_retry_backoff_delays);
    RUN_TEST(enhanced_timeout_is_retried);
    RUN_TEST(tracking_tables_default_created_at);
    RUN_TEST(enhanced_retry_then_success);
    RUN_TEST(enhanced_auto_rollback_reverse_order);
    RUN_TEST(enhanced_auto_rollback_stops_on_failure);
    RUN_TEST(enhanced_failure_count_is_per_instance);
    RUN_TEST(enhanced_pre_validation_blocks_run);
    RUN_TEST(enhanced_post_validation_rolls_back_attempt);
    RUN_TEST(enhanced_system_error_is_reported);

    std::cout << "\nBackup tests:\n";
    RUN_TEST(backup_noop_in_memory);
    RUN_TEST(backup_create_and_restore);
    RUN_TEST(backup_name_replaces_path_characters);
    RUN_TEST(backup_cleanup_removes_old);
    RUN_TEST(enhanced_restores_backup_on_failure);

    std::cout << "\nStock tables tests:\n";
    RUN_TEST(stock_tables_create_and_rollback);
    RUN_TEST(stock_tables_enhanced_with_default_integrity);
    RUN_TEST(stock_tables_injected_failure);

    std::cout << "\n" << std::string(40, '=') << "\n";
    std::cout << "Results: " << passed << " passed, " << failed << " failed\n";
    std::cout << std::string(40, '=') << "\n";

    return failed > 0 ? 1 : 0;
}
