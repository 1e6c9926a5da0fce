#include "time_utils.hpp"
#include <ctime>
#include <iomanip>
#include <sstream>

namespace TimeUtils {

std::string get_current_human_readable_time() {
    auto now = std::chrono::system_clock::now();
    auto in_time_t = std::chrono::system_clock::to_time_t(now);
    std::stringstream ss;

    // Use thread-safe localtime_r instead of localtime
    struct tm timeinfo;
    localtime_r(&in_time_t, &timeinfo);
    ss << std::put_time(&timeinfo, HUMAN_READABLE);
    return ss.str();
}

std::string format_iso_time_with_z(const std::chrono::system_clock::time_point& time_point) {
    auto in_time_t = std::chrono::system_clock::to_time_t(time_point);
    std::stringstream ss;

    // Use thread-safe gmtime_r instead of gmtime
    struct tm timeinfo;
    gmtime_r(&in_time_t, &timeinfo);
    ss << std::put_time(&timeinfo, ISO_8601_WITH_Z);
    return ss.str();
}

std::chrono::system_clock::time_point from_epoch_seconds(std::int64_t epoch_seconds) {
    return std::chrono::system_clock::time_point(std::chrono::seconds(epoch_seconds));
}

std::int64_t to_epoch_seconds(const std::chrono::system_clock::time_point& time_point) {
    return std::chrono::duration_cast<std::chrono::seconds>(time_point.time_since_epoch()).count();
}

} // namespace TimeUtils
