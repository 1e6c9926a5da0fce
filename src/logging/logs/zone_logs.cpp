#include "zone_logs.hpp"
#include "logging/logging_macros.hpp"

namespace TightZone {
namespace Logging {

void ZoneLogs::log_batch_started(std::size_t symbol_count, int worker_count) {
    LOG_SECTION_HEADER("CONTRACTION ZONES");
    LOG_CONTENT("Symbols: " + std::to_string(symbol_count) + ", workers: " + std::to_string(worker_count));
}

void ZoneLogs::log_symbol_zones(const std::string& symbol, std::size_t bar_count, std::size_t zone_count) {
    LOG_CONTENT(symbol + ": " + std::to_string(bar_count) + " bars, " + std::to_string(zone_count) + " zone(s)");
}

void ZoneLogs::log_symbol_failed(const std::string& symbol, const std::string& error_message) {
    LOG_CONTENT("WARNING: " + symbol + " skipped: " + error_message);
}

void ZoneLogs::log_batch_completed(std::size_t succeeded_count, std::size_t failed_count) {
    LOG_CONTENT("Done: " + std::to_string(succeeded_count) + " ok, " + std::to_string(failed_count) + " failed");
    LOG_SECTION_FOOTER();
}

void ZoneLogs::log_batch_cancelled() {
    log_message("WARNING: Contraction zone scan cancelled", "");
}

} // namespace Logging
} // namespace TightZone
