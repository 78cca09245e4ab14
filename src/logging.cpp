/**
 * @file logging.cpp
 * @brief spdlog-backed implementation of the logging helpers
 */

#include "stockdb/logging.hpp"

#include <cstdlib>
#include <memory>
#include <sstream>

#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

namespace stockdb {
namespace {

constexpr const char* kLoggerName = "stockdb";

std::string resolveLevel() {
    if (const char* level = std::getenv("STOCKDB_LOG_LEVEL")) {
        return level;
    }
    return "info";
}

std::string resolvePattern() {
    if (const char* pattern = std::getenv("STOCKDB_LOG_PATTERN")) {
        return pattern;
    }
    return "%Y-%m-%dT%H:%M:%S.%e%z [%^%l%$] %v";
}

std::shared_ptr<spdlog::logger> logger() {
    // Function-local static: initialised once, thread-safe since C++11
    static std::shared_ptr<spdlog::logger> instance = [] {
        auto existing = spdlog::get(kLoggerName);
        if (existing) {
            return existing;
        }
        auto created = spdlog::stdout_color_mt(kLoggerName);
        created->set_pattern(resolvePattern());
        created->set_level(spdlog::level::from_str(resolveLevel()));
        created->flush_on(spdlog::level::warn);
        return created;
    }();
    return instance;
}

std::string serializeFields(std::initializer_list<LogField> fields) {
    std::ostringstream out;
    bool first = true;
    for (const auto& field : fields) {
        if (!first) {
            out << ' ';
        }
        first = false;
        out << field.key << '=' << field.value;
    }
    return out.str();
}

} // namespace

LogField StringField(std::string_view key, std::string_view value) {
    return {std::string(key), std::string(value)};
}

LogField IntField(std::string_view key, std::int64_t value) {
    return {std::string(key), std::to_string(value)};
}

LogField BoolField(std::string_view key, bool value) {
    return {std::string(key), value ? "true" : "false"};
}

void setLogLevel(spdlog::level::level_enum level) {
    logger()->set_level(level);
}

void log(spdlog::level::level_enum level, std::string_view message,
         std::initializer_list<LogField> fields) {
    auto serialized = serializeFields(fields);
    if (serialized.empty()) {
        logger()->log(level, "{}", message);
        return;
    }
    logger()->log(level, "{} {}", message, serialized);
}

} // namespace stockdb
