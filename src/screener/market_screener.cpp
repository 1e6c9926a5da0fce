#include "market_screener.hpp"
#include "filter_builder.hpp"
#include "market_slug.hpp"
#include "paginated_scanner.hpp"
#include "screener_errors.hpp"
#include "vcp_qualifier.hpp"
#include "logging/logs/screener_logs.hpp"

using TightZone::Logging::ScreenerLogs;

namespace TightZone {
namespace Screener {

const std::vector<std::string>& default_columns() {
    static const std::vector<std::string> columns = {
        "name", "close", "SMA200", "market_cap_basic", "beta_1_year", "average_volume_30d_calc",
    };
    return columns;
}

MarketScreener::MarketScreener(const ScreenerOptions& screener_options, API::ScannerTransportInterface& transport)
    : options(screener_options), transport_ref(transport) {
    options.market = normalize_market_slug(options.market);
    if (options.page_size < 1) {
        throw InvalidInputError("page_size must be >= 1, got " + std::to_string(options.page_size));
    }
}

ScreenerRequest MarketScreener::build_request(int range_start, int range_end) const {
    FilterBuildParams build_params;
    build_params.market = options.market;
    build_params.exchange = options.exchange;
    build_params.min_price = options.min_price;
    build_params.max_price = options.max_price;
    build_params.min_volume = options.min_volume;
    build_params.custom_filters = options.custom_filters;
    build_params.columns = options.columns;
    build_params.required_columns = VcpQualifier::required_columns();
    build_params.apply_qualification = options.apply_vcp_filter;
    build_params.symbol_types = options.symbol_types;
    build_params.sort = options.sort;
    build_params.language = options.language;
    build_params.page_range = PageRange(range_start, range_end);
    return FilterBuilder::build(build_params);
}

nlohmann::json MarketScreener::payload(int range_start, int range_end) const {
    return FilterBuilder::to_payload(build_request(range_start, range_end));
}

std::vector<Row> MarketScreener::scan(const CancellationToken* cancellation_token) {
    ScreenerRequest request_template = build_request(0, options.page_size - 1);
    ScreenerLogs::log_scan_started(request_template.market, options.page_size, request_template.filters.size(),
                                   options.apply_vcp_filter);

    PaginatedScanner paginated_scanner(transport_ref);
    std::vector<Row> rows = paginated_scanner.scan(request_template, options.page_size, cancellation_token);
    if (!options.apply_vcp_filter) {
        return rows;
    }

    std::vector<Row> qualified_rows = VcpQualifier::filter_rows(rows);
    ScreenerLogs::log_qualification_summary(rows.size(), qualified_rows.size());
    return qualified_rows;
}

} // namespace Screener
} // namespace TightZone
