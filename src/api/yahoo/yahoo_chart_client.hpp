#ifndef YAHOO_CHART_CLIENT_HPP
#define YAHOO_CHART_CLIENT_HPP

#include <string>
#include "api/general/history_provider_interface.hpp"
#include "configs/api_config.hpp"

namespace TightZone {
namespace API {

// Yahoo Finance chart endpoint: GET {base_url}{endpoint}?interval=..&range=..
class YahooChartClient : public HistoryProviderInterface {
public:
    explicit YahooChartClient(const Config::ApiProviderConfig& provider_config);

    std::vector<Screener::PriceBar> fetch_history(const HistoryRequest& request) const override;
    std::string get_provider_name() const override { return "Yahoo Finance chart"; }

    // Exchange prefix stripped from the symbol, ticker URL-escaped.
    std::string build_history_url(const HistoryRequest& request) const;

private:
    Config::ApiProviderConfig config;
};

} // namespace API
} // namespace TightZone

#endif // YAHOO_CHART_CLIENT_HPP
