#ifndef TRADINGVIEW_SCANNER_CLIENT_HPP
#define TRADINGVIEW_SCANNER_CLIENT_HPP

#include <string>
#include "api/general/scanner_transport_interface.hpp"
#include "configs/api_config.hpp"

namespace TightZone {
namespace API {

/**
 * TradingView screener session: POSTs the filter payload to
 * {base_url}{endpoint}, with {market} in the endpoint replaced by the
 * request's market slug.
 */
class TradingViewScannerClient : public ScannerTransportInterface {
public:
    explicit TradingViewScannerClient(const Config::ApiProviderConfig& provider_config);

    nlohmann::json submit(const Screener::ScreenerRequest& request) override;
    std::string get_provider_name() const override { return "TradingView scanner"; }

    std::string build_scan_url(const std::string& market_slug) const;

private:
    Config::ApiProviderConfig config;
};

} // namespace API
} // namespace TightZone

#endif // TRADINGVIEW_SCANNER_CLIENT_HPP
