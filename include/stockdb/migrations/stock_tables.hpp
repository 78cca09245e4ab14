/**
 * @file stock_tables.hpp
 * @brief The dashboard's built-in schema migrations
 *
 *   001_v1.0_create_auth_tables    user, session, account, verification
 *   002_v1.1_create_stocks_tables  stocks, stock_daily, user_stock_favorites
 *
 * 002 references user(id), so the two must be registered in this order.
 */

#pragma once

#include "../migration.hpp"

namespace stockdb {
namespace migrations {

inline constexpr const char* kAuthTablesId = "001_v1.0_create_auth_tables";
inline constexpr const char* kStocksTablesId = "002_v1.1_create_stocks_tables";

Migration createAuthTables();

/**
 * @brief Stock master data, daily K-line bars and user favourites
 *
 * Forward: 3 tables, 12 indexes, FKs stock_daily -> stocks and
 * user_stock_favorites -> user, stocks.
 * Backward: indexes then tables, dependents first.
 */
Migration createStocksTables();

/**
 * @brief Register every built-in migration in application order
 */
void registerDefaultMigrations(DatabaseMigrator& migrator);

} // namespace migrations
} // namespace stockdb
