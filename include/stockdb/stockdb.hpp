/**
 * @file stockdb.hpp
 * @brief Main include file for the stockdb migration engine
 *
 * Single Include Header
 * =============================================
 *   #include <stockdb/stockdb.hpp>           // Everything
 * or just what you need:
 *   #include <stockdb/enhanced_migrator.hpp>
 *
 * Layers, bottom up:
 *
 * 1.  Storage: Connection, Statement, Transaction (RAII over sqlite3)
 * 2.  StatementAdapter: SQL strings and SqlFragment trees -> executed SQL
 * 3.  DatabaseMigrator: registry, validate, run, rollback, health check
 * 4.  EnhancedMigrator: retries, backups, integrity checks, auto-rollback,
 *     migration log
 * 5.  migrations::registerDefaultMigrations: the dashboard's schema
 */

#pragma once

#include "exceptions.hpp"
#include "logging.hpp"
#include "connection.hpp"
#include "statement.hpp"
#include "transaction.hpp"
#include "statement_adapter.hpp"
#include "integrity.hpp"
#include "options.hpp"
#include "migration.hpp"
#include "migration_log.hpp"
#include "backup_store.hpp"
#include "enhanced_migrator.hpp"
#include "migrations/stock_tables.hpp"

namespace stockdb {

constexpr int VERSION_MAJOR = 1;
constexpr int VERSION_MINOR = 1;
constexpr int VERSION_PATCH = 0;
constexpr const char* VERSION_STRING = "1.1.0";

/**
 * @brief Version of the linked SQLite library
 */
inline const char* sqliteVersion() {
    return sqlite3_libversion();
}

} // namespace stockdb
