#ifndef ZONE_LOGS_HPP
#define ZONE_LOGS_HPP

#include <cstddef>
#include <string>

namespace TightZone {
namespace Logging {

class ZoneLogs {
public:
    static void log_batch_started(std::size_t symbol_count, int worker_count);
    static void log_symbol_zones(const std::string& symbol, std::size_t bar_count, std::size_t zone_count);
    static void log_symbol_failed(const std::string& symbol, const std::string& error_message);
    static void log_batch_completed(std::size_t succeeded_count, std::size_t failed_count);
    static void log_batch_cancelled();
};

} // namespace Logging
} // namespace TightZone

#endif // ZONE_LOGS_HPP
