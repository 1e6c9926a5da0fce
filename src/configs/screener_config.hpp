#ifndef SCREENER_CONFIG_HPP
#define SCREENER_CONFIG_HPP

#include <string>
#include <vector>

namespace TightZone {
namespace Config {

struct ScreenerConfig {
    // ========================================================================
    // SCAN REQUEST DEFAULTS
    // ========================================================================

    std::string market;                          // Free-form market name, normalized before use
    int page_size;                               // Rows requested per page
    std::string sort_by;                         // Sort column
    std::string sort_order;                      // "asc" or "desc"
    std::string language;                        // options.lang
    std::vector<std::string> columns;            // Requested columns, in order
    bool apply_vcp_filter;                       // Post-filter rows through the VCP qualifier

    ScreenerConfig()
        : market("america"), page_size(150), sort_by("market_cap_basic"), sort_order("desc"), language("en"),
          columns({"name", "close", "SMA200", "market_cap_basic", "beta_1_year", "average_volume_30d_calc"}),
          apply_vcp_filter(true) {}
};

struct ZoneConfig {
    // ========================================================================
    // CONTRACTION ZONES
    // ========================================================================

    int segment_count;                           // Windows per series
    std::string history_period;                  // e.g. "6mo"
    std::string history_interval;                // e.g. "1d"
    int max_concurrent_fetches;                  // History worker threads

    ZoneConfig() : segment_count(4), history_period("6mo"), history_interval("1d"), max_concurrent_fetches(4) {}
};

} // namespace Config
} // namespace TightZone

#endif // SCREENER_CONFIG_HPP
