#include "tradingview_scanner_client.hpp"
#include "screener/filter_builder.hpp"
#include "screener/screener_errors.hpp"
#include "utils/http_utils.hpp"

namespace TightZone {
namespace API {

namespace {
    const std::string MARKET_PLACEHOLDER = "{market}";
}

TradingViewScannerClient::TradingViewScannerClient(const Config::ApiProviderConfig& provider_config)
    : config(provider_config) {
    if (config.base_url.empty()) {
        throw Screener::InvalidInputError("Scanner base_url is not configured");
    }
}

std::string TradingViewScannerClient::build_scan_url(const std::string& market_slug) const {
    std::string endpoint_path = config.endpoint;
    std::size_t placeholder_position = endpoint_path.find(MARKET_PLACEHOLDER);
    if (placeholder_position != std::string::npos) {
        endpoint_path.replace(placeholder_position, MARKET_PLACEHOLDER.size(), url_escape(market_slug));
    }
    return config.base_url + endpoint_path;
}

nlohmann::json TradingViewScannerClient::submit(const Screener::ScreenerRequest& request) {
    HttpRequest http_request(build_scan_url(request.market), config.retry_count, config.timeout_seconds,
                             config.enable_ssl_verification, config.rate_limit_delay_ms,
                             Screener::FilterBuilder::to_payload(request).dump());
    http_request.user_agent = config.user_agent;
    http_request.headers.push_back("Accept: application/json");

    std::string response_body = http_post(http_request);
    return parse_json_body(response_body, get_provider_name());
}

} // namespace API
} // namespace TightZone
