/**
 * @file options.cpp
 * @brief Environment overrides for MigratorOptions
 */

#include "stockdb/options.hpp"
#include "stockdb/logging.hpp"
#include <cstdlib>
#include <string>

namespace stockdb {

namespace {

bool parsePositive(const char* name, long& out) {
    const char* raw = std::getenv(name);
    if (raw == nullptr || *raw == '\0') {
        return false;
    }

    char* end = nullptr;
    long value = std::strtol(raw, &end, 10);
    if (end == raw || *end != '\0' || value <= 0) {
        STOCKDB_LOG_WARN("ignoring invalid environment override",
                         {StringField("variable", name), StringField("value", raw)});
        return false;
    }
    out = value;
    return true;
}

} // namespace

MigratorOptions MigratorOptions::fromEnvironment() {
    MigratorOptions options;

    if (const char* dir = std::getenv("STOCKDB_BACKUP_DIR"); dir && *dir) {
        options.backupDir = dir;
    } else if (const char* legacy = std::getenv("BACKUP_DIR"); legacy && *legacy) {
        options.backupDir = legacy;
    }

    long value = 0;
    if (parsePositive("STOCKDB_MAX_RETRIES", value)) {
        options.maxRetries = static_cast<int>(value);
    }
    if (parsePositive("STOCKDB_BATCH_SIZE", value)) {
        options.batchSize = static_cast<size_t>(value);
    }

    return options;
}

} // namespace stockdb
