#include "yahoo_chart_client.hpp"
#include "screener/price_history.hpp"
#include "screener/screener_errors.hpp"
#include "utils/http_utils.hpp"

namespace TightZone {
namespace API {

namespace {
    const std::string SYMBOL_PLACEHOLDER = "{symbol}";
}

YahooChartClient::YahooChartClient(const Config::ApiProviderConfig& provider_config)
    : config(provider_config) {
    if (config.base_url.empty()) {
        throw Screener::InvalidInputError("History base_url is not configured");
    }
}

std::string YahooChartClient::build_history_url(const HistoryRequest& request) const {
    std::string ticker_string = url_escape(Screener::normalise_symbol(request.symbol));
    std::string endpoint_path = config.endpoint;
    std::size_t placeholder_position = endpoint_path.find(SYMBOL_PLACEHOLDER);
    if (placeholder_position != std::string::npos) {
        endpoint_path.replace(placeholder_position, SYMBOL_PLACEHOLDER.size(), ticker_string);
    } else {
        endpoint_path += "/" + ticker_string;
    }
    return config.base_url + endpoint_path + "?interval=" + url_escape(request.interval) +
           "&range=" + url_escape(request.period);
}

std::vector<Screener::PriceBar> YahooChartClient::fetch_history(const HistoryRequest& request) const {
    if (Screener::normalise_symbol(request.symbol).empty()) {
        throw Screener::InvalidInputError("Empty ticker in symbol '" + request.symbol + "'");
    }

    HttpRequest http_request(build_history_url(request), config.retry_count, config.timeout_seconds,
                             config.enable_ssl_verification, config.rate_limit_delay_ms);
    http_request.user_agent = config.user_agent;
    http_request.headers.push_back("Accept: application/json");

    std::string response_body = http_get(http_request);
    return Screener::parse_history_payload(parse_json_body(response_body, get_provider_name() + " (" + request.symbol + ")"));
}

} // namespace API
} // namespace TightZone
