#include "screener_logs.hpp"
#include "logging/logging_macros.hpp"

namespace TightZone {
namespace Logging {

void ScreenerLogs::log_scan_started(const std::string& market, int page_size, std::size_t filter_count, bool apply_vcp_filter) {
    LOG_SECTION_HEADER("SCAN " + market);
    LOG_CONTENT("Page size: " + std::to_string(page_size));
    LOG_CONTENT("Filters: " + std::to_string(filter_count));
    LOG_CONTENT(std::string("VCP qualification: ") + (apply_vcp_filter ? "on" : "off"));
}

void ScreenerLogs::log_page_requested(int range_start, int range_end) {
    LOG_CONTENT("Requesting rows [" + std::to_string(range_start) + ", " + std::to_string(range_end) + "]");
}

void ScreenerLogs::log_page_received(int range_start, int range_end, std::size_t row_count) {
    LOG_CONTENT("Rows [" + std::to_string(range_start) + ", " + std::to_string(range_end) + "] returned " +
                std::to_string(row_count));
}

void ScreenerLogs::log_scan_completed(std::size_t total_rows, int page_count) {
    LOG_CONTENT("Scan complete: " + std::to_string(total_rows) + " rows in " + std::to_string(page_count) + " page(s)");
    LOG_SECTION_FOOTER();
}

void ScreenerLogs::log_scan_failed(const std::string& error_kind, const std::string& error_message) {
    log_message("ERROR: Scan failed (" + error_kind + "): " + error_message, "");
}

void ScreenerLogs::log_scan_cancelled(std::size_t discarded_rows) {
    log_message("WARNING: Scan cancelled, discarding " + std::to_string(discarded_rows) + " accumulated rows", "");
}

void ScreenerLogs::log_qualification_summary(std::size_t candidate_rows, std::size_t qualified_rows) {
    LOG_CONTENT("VCP qualified " + std::to_string(qualified_rows) + " of " + std::to_string(candidate_rows) + " rows");
}

} // namespace Logging
} // namespace TightZone
