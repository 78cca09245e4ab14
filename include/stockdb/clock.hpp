/**
 * @file clock.hpp
 * @brief Time helpers shared by the migration log and the backup store
 *
 * All persisted timestamps in __migration_logs and __migration_backups are
 * Unix milliseconds.
 */

#pragma once

#include <chrono>
#include <cstdint>
#include <string>

namespace stockdb {

using Clock = std::chrono::system_clock;
using TimePoint = Clock::time_point;

int64_t toUnixMillis(TimePoint tp);

int64_t unixMillisNow();

/**
 * @brief UTC ISO-8601 timestamp safe for file names
 *
 * "2024-05-01T10:00:00.123Z" becomes "2024-05-01T10-00-00-123Z".
 */
std::string fileSafeTimestamp(TimePoint tp);

} // namespace stockdb
