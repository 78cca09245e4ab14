/**
 * @file clock.cpp
 * @brief Implementation of time helpers
 */

#include "stockdb/clock.hpp"
#include <ctime>
#include <iomanip>
#include <sstream>

namespace stockdb {

int64_t toUnixMillis(TimePoint tp) {
    return std::chrono::duration_cast<std::chrono::milliseconds>(tp.time_since_epoch()).count();
}

int64_t unixMillisNow() {
    return toUnixMillis(Clock::now());
}

std::string fileSafeTimestamp(TimePoint tp) {
    auto seconds = std::chrono::time_point_cast<std::chrono::seconds>(tp);
    auto millis = std::chrono::duration_cast<std::chrono::milliseconds>(tp - seconds).count();

    std::time_t raw = Clock::to_time_t(seconds);
    std::tm utc{};
    gmtime_r(&raw, &utc);

    std::ostringstream oss;
    oss << std::put_time(&utc, "%Y-%m-%dT%H-%M-%S")
        << '-' << std::setw(3) << std::setfill('0') << millis << 'Z';
    return oss.str();
}

} // namespace stockdb
