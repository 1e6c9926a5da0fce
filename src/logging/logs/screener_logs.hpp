#ifndef SCREENER_LOGS_HPP
#define SCREENER_LOGS_HPP

#include <cstddef>
#include <string>

namespace TightZone {
namespace Logging {

class ScreenerLogs {
public:
    static void log_scan_started(const std::string& market, int page_size, std::size_t filter_count, bool apply_vcp_filter);
    static void log_page_requested(int range_start, int range_end);
    static void log_page_received(int range_start, int range_end, std::size_t row_count);
    static void log_scan_completed(std::size_t total_rows, int page_count);
    static void log_scan_failed(const std::string& error_kind, const std::string& error_message);
    static void log_scan_cancelled(std::size_t discarded_rows);
    static void log_qualification_summary(std::size_t candidate_rows, std::size_t qualified_rows);
};

} // namespace Logging
} // namespace TightZone

#endif // SCREENER_LOGS_HPP
