/**
 * @file logging.hpp
 * @brief Structured logging for the migration engine
 *
 * Messages go to a dedicated spdlog logger named "stockdb", created on
 * first use. Context is attached as key=value fields so log lines stay
 * greppable:
 *
 *   STOCKDB_LOG_INFO("migration applied", {StringField("id", m.id),
 *                                          IntField("attempt", 2)});
 *
 *   => 2024-05-01T10:00:00.123+0000 [info] migration applied id=002_... attempt=2
 *
 * Level and pattern come from STOCKDB_LOG_LEVEL / STOCKDB_LOG_PATTERN,
 * or can be set programmatically with setLogLevel().
 */

#pragma once

#include <spdlog/common.h>

#include <cstdint>
#include <initializer_list>
#include <string>
#include <string_view>

namespace stockdb {

struct LogField {
    std::string key;
    std::string value;
};

LogField StringField(std::string_view key, std::string_view value);
LogField IntField(std::string_view key, std::int64_t value);
LogField BoolField(std::string_view key, bool value);

/**
 * @brief Override the level resolved from the environment
 */
void setLogLevel(spdlog::level::level_enum level);

void log(spdlog::level::level_enum level, std::string_view message,
         std::initializer_list<LogField> fields = {});

inline void logDebug(std::string_view message, std::initializer_list<LogField> fields = {}) {
    log(spdlog::level::debug, message, fields);
}

inline void logInfo(std::string_view message, std::initializer_list<LogField> fields = {}) {
    log(spdlog::level::info, message, fields);
}

inline void logWarn(std::string_view message, std::initializer_list<LogField> fields = {}) {
    log(spdlog::level::warn, message, fields);
}

inline void logError(std::string_view message, std::initializer_list<LogField> fields = {}) {
    log(spdlog::level::err, message, fields);
}

} // namespace stockdb

#define STOCKDB_LOG_DEBUG(message, ...) ::stockdb::logDebug((message), ##__VA_ARGS__)
#define STOCKDB_LOG_INFO(message, ...) ::stockdb::logInfo((message), ##__VA_ARGS__)
#define STOCKDB_LOG_WARN(message, ...) ::stockdb::logWarn((message), ##__VA_ARGS__)
#define STOCKDB_LOG_ERROR(message, ...) ::stockdb::logError((message), ##__VA_ARGS__)
