#ifndef TIME_UTILS_HPP
#define TIME_UTILS_HPP

#include <string>
#include <chrono>
#include <cstdint>

namespace TimeUtils {

// Time format constants
constexpr const char* ISO_8601_WITH_Z = "%Y-%m-%dT%H:%M:%SZ";
constexpr const char* HUMAN_READABLE = "%Y-%m-%d %H:%M:%S";
constexpr const char* LOG_FILENAME = "%d-%H-%M";

// Local wall-clock time for log lines
std::string get_current_human_readable_time();

// UTC, e.g. 2024-03-01T14:30:00Z
std::string format_iso_time_with_z(const std::chrono::system_clock::time_point& time_point);

std::chrono::system_clock::time_point from_epoch_seconds(std::int64_t epoch_seconds);
std::int64_t to_epoch_seconds(const std::chrono::system_clock::time_point& time_point);

} // namespace TimeUtils

#endif // TIME_UTILS_HPP
