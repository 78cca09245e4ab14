/**
 * @file stock_tables.cpp
 * @brief Built-in migrations 001 and 002
 */

#include "stockdb/migrations/stock_tables.hpp"

namespace stockdb {
namespace migrations {

namespace {

struct IndexDef {
    const char* name;
    const char* table;
    const char* columns;
    bool unique;
};

const IndexDef kStocksIndexes[] = {
    {"stocks_symbol_idx", "stocks", "symbol", false},
    {"stocks_name_idx", "stocks", "name", false},
    {"stocks_industry_idx", "stocks", "industry", false},
    {"stocks_market_idx", "stocks", "market", false},
    {"stocks_industry_market_idx", "stocks", "industry, market", false},
};

const IndexDef kStockDailyIndexes[] = {
    {"stock_daily_ts_code_trade_date_idx", "stock_daily", "ts_code, trade_date", true},
    {"stock_daily_trade_date_idx", "stock_daily", "trade_date", false},
    {"stock_daily_ts_code_idx", "stock_daily", "ts_code", false},
    {"stock_daily_ts_code_date_range_idx", "stock_daily", "ts_code, trade_date", false},
};

const IndexDef kFavoritesIndexes[] = {
    {"user_stock_favorites_user_ts_code_idx", "user_stock_favorites", "user_id, ts_code", true},
    {"user_stock_favorites_user_id_idx", "user_stock_favorites", "user_id", false},
    {"user_stock_favorites_ts_code_idx", "user_stock_favorites", "ts_code", false},
};

SqlFragment createIndex(const IndexDef& index) {
    return sql(index.unique ? "CREATE UNIQUE INDEX IF NOT EXISTS " : "CREATE INDEX IF NOT EXISTS ",
               SqlFragment::raw(index.name),
               " ON ", SqlFragment::raw(index.table),
               " (", SqlFragment::raw(index.columns), ")");
}

SqlFragment dropIndex(const IndexDef& index) {
    return sql("DROP INDEX IF EXISTS ", SqlFragment::raw(index.name));
}

template<size_t N>
void createIndexes(StatementAdapter& db, const IndexDef (&indexes)[N]) {
    for (const auto& index : indexes) {
        db.execute(createIndex(index));
    }
}

template<size_t N>
void dropIndexes(StatementAdapter& db, const IndexDef (&indexes)[N]) {
    for (const auto& index : indexes) {
        db.execute(dropIndex(index));
    }
}

} // namespace

Migration createAuthTables() {
    Migration m;
    m.id = kAuthTablesId;
    m.name = "Create authentication tables";

    m.up = [](StatementAdapter& db) {
        db.execute(R"(
            CREATE TABLE IF NOT EXISTS user (
                id TEXT PRIMARY KEY NOT NULL,
                name TEXT NOT NULL,
                email TEXT NOT NULL,
                email_verified INTEGER NOT NULL,
                image TEXT,
                created_at INTEGER NOT NULL,
                updated_at INTEGER NOT NULL
            )
        )");
        db.execute("CREATE UNIQUE INDEX IF NOT EXISTS user_email_unique ON user (email)");

        db.execute(R"(
            CREATE TABLE IF NOT EXISTS session (
                id TEXT PRIMARY KEY NOT NULL,
                expires_at INTEGER NOT NULL,
                token TEXT NOT NULL,
                created_at INTEGER NOT NULL,
                updated_at INTEGER NOT NULL,
                ip_address TEXT,
                user_agent TEXT,
                user_id TEXT NOT NULL,
                FOREIGN KEY (user_id) REFERENCES user (id)
            )
        )");
        db.execute("CREATE UNIQUE INDEX IF NOT EXISTS session_token_unique ON session (token)");

        db.execute(R"(
            CREATE TABLE IF NOT EXISTS account (
                id TEXT PRIMARY KEY NOT NULL,
                account_id TEXT NOT NULL,
                provider_id TEXT NOT NULL,
                user_id TEXT NOT NULL,
                access_token TEXT,
                refresh_token TEXT,
                id_token TEXT,
                access_token_expires_at INTEGER,
                refresh_token_expires_at INTEGER,
                scope TEXT,
                password TEXT,
                created_at INTEGER NOT NULL,
                updated_at INTEGER NOT NULL,
                FOREIGN KEY (user_id) REFERENCES user (id)
            )
        )");

        db.execute(R"(
            CREATE TABLE IF NOT EXISTS verification (
                id TEXT PRIMARY KEY NOT NULL,
                identifier TEXT NOT NULL,
                value TEXT NOT NULL,
                expires_at INTEGER NOT NULL,
                created_at INTEGER,
                updated_at INTEGER
            )
        )");
    };

    m.down = [](StatementAdapter& db) {
        db.execute("DROP TABLE IF EXISTS verification");
        db.execute("DROP TABLE IF EXISTS account");
        db.execute("DROP INDEX IF EXISTS session_token_unique");
        db.execute("DROP TABLE IF EXISTS session");
        db.execute("DROP INDEX IF EXISTS user_email_unique");
        db.execute("DROP TABLE IF EXISTS user");
    };

    return m;
}

Migration createStocksTables() {
    Migration m;
    m.id = kStocksTablesId;
    m.name = "Create stock data tables";

    m.up = [](StatementAdapter& db) {
        db.execute(R"(
            CREATE TABLE IF NOT EXISTS stocks (
                ts_code TEXT PRIMARY KEY,
                symbol TEXT NOT NULL,
                name TEXT NOT NULL,
                area TEXT,
                industry TEXT,
                market TEXT,
                list_date TEXT,
                is_hs TEXT,
                created_at INTEGER NOT NULL,
                updated_at INTEGER NOT NULL
            )
        )");
        createIndexes(db, kStocksIndexes);

        db.execute(R"(
            CREATE TABLE IF NOT EXISTS stock_daily (
                id INTEGER PRIMARY KEY AUTOINCREMENT,
                ts_code TEXT NOT NULL,
                trade_date TEXT NOT NULL,
                open REAL NOT NULL,
                high REAL NOT NULL,
                low REAL NOT NULL,
                close REAL NOT NULL,
                vol REAL DEFAULT 0,
                amount REAL DEFAULT 0,
                created_at INTEGER NOT NULL,
                FOREIGN KEY (ts_code) REFERENCES stocks (ts_code)
                    ON DELETE CASCADE ON UPDATE CASCADE
            )
        )");
        createIndexes(db, kStockDailyIndexes);

        db.execute(R"(
            CREATE TABLE IF NOT EXISTS user_stock_favorites (
                id INTEGER PRIMARY KEY AUTOINCREMENT,
                user_id TEXT NOT NULL,
                ts_code TEXT NOT NULL,
                created_at INTEGER NOT NULL,
                FOREIGN KEY (user_id) REFERENCES user (id)
                    ON DELETE CASCADE ON UPDATE CASCADE,
                FOREIGN KEY (ts_code) REFERENCES stocks (ts_code)
                    ON DELETE CASCADE ON UPDATE CASCADE
            )
        )");
        createIndexes(db, kFavoritesIndexes);
    };

    m.down = [](StatementAdapter& db) {
        dropIndexes(db, kFavoritesIndexes);
        db.execute("DROP TABLE IF EXISTS user_stock_favorites");

        dropIndexes(db, kStockDailyIndexes);
        db.execute("DROP TABLE IF EXISTS stock_daily");

        dropIndexes(db, kStocksIndexes);
        db.execute("DROP TABLE IF EXISTS stocks");
    };

    return m;
}

void registerDefaultMigrations(DatabaseMigrator& migrator) {
    migrator.add(createAuthTables());
    migrator.add(createStocksTables());
}

} // namespace migrations
} // namespace stockdb
