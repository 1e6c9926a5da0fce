#ifndef MARKET_SCREENER_HPP
#define MARKET_SCREENER_HPP

#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "api/general/scanner_transport_interface.hpp"
#include "screener_structures.hpp"

namespace TightZone {
namespace Screener {

constexpr int DEFAULT_PAGE_SIZE = 150;

const std::vector<std::string>& default_columns();

// Scan options (to avoid multi-parameter functions).
struct ScreenerOptions {
    std::string market;
    std::optional<std::string> exchange;
    std::optional<double> min_price;
    std::optional<double> max_price;
    std::optional<double> min_volume;
    std::vector<FilterCondition> custom_filters;
    std::vector<std::string> columns;
    std::optional<std::vector<std::string>> symbol_types;
    SortSpec sort;
    std::string language;
    int page_size;
    bool apply_vcp_filter;

    ScreenerOptions()
        : market("america"), columns(default_columns()), language("en"),
          page_size(DEFAULT_PAGE_SIZE), apply_vcp_filter(true) {}
};

/**
 * Request template plus the scan entry point. The options are validated
 * when the screener is constructed, so a bad market or page size fails
 * before any network call.
 */
class MarketScreener {
public:
    MarketScreener(const ScreenerOptions& screener_options, API::ScannerTransportInterface& transport);

    ScreenerRequest build_request(int range_start, int range_end) const;

    // Exact request body for rows [range_start, range_end].
    nlohmann::json payload(int range_start, int range_end) const;

    // All pages, then the VCP post-filter when enabled.
    std::vector<Row> scan(const CancellationToken* cancellation_token = nullptr);

    const ScreenerOptions& get_options() const { return options; }

private:
    ScreenerOptions options;
    API::ScannerTransportInterface& transport_ref;
};

} // namespace Screener
} // namespace TightZone

#endif // MARKET_SCREENER_HPP
