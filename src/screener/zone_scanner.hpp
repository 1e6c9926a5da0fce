#ifndef ZONE_SCANNER_HPP
#define ZONE_SCANNER_HPP

#include <optional>
#include <string>
#include <vector>
#include "api/general/history_provider_interface.hpp"
#include "contraction_zones.hpp"
#include "screener_structures.hpp"

namespace TightZone {
namespace Screener {

constexpr const char* NO_PRICE_HISTORY_MESSAGE = "No price history";

struct ZoneScanOptions {
    int segment_count;
    std::string period;
    std::string interval;
    int max_concurrent_fetches;

    ZoneScanOptions() : segment_count(DEFAULT_SEGMENT_COUNT), period("6mo"), interval("1d"), max_concurrent_fetches(4) {}
};

struct SymbolZoneResult {
    std::string symbol;
    std::size_t bar_count = 0;
    std::vector<ContractionZone> zones;
    std::optional<std::string> error_message;

    bool succeeded() const { return !error_message.has_value(); }
};

/**
 * Fetches history and detects contraction zones for many symbols on a
 * bounded set of worker threads. One symbol failing is recorded on its
 * result and never stops the others.
 */
class ZoneScanner {
public:
    ZoneScanner(const API::HistoryProviderInterface& history_provider, const ZoneScanOptions& scan_options);

    SymbolZoneResult scan_symbol(const std::string& symbol) const;

    // Results come back in input order. Throws ScanCancelledError once the token fires.
    std::vector<SymbolZoneResult> scan_symbols(const std::vector<std::string>& symbols,
                                               const CancellationToken* cancellation_token = nullptr) const;

private:
    const API::HistoryProviderInterface& provider_ref;
    ZoneScanOptions options;
};

} // namespace Screener
} // namespace TightZone

#endif // ZONE_SCANNER_HPP
