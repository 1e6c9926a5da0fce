#ifndef API_CONFIG_HPP
#define API_CONFIG_HPP

#include <string>

namespace TightZone {
namespace Config {

enum class ApiProvider {
    SCANNER,
    HISTORY
};

struct ApiProviderConfig {
    std::string base_url;
    std::string endpoint;              // Path template with {market} or {symbol}
    std::string user_agent;

    // HTTP Configuration
    int retry_count;
    int timeout_seconds;
    bool enable_ssl_verification;
    int rate_limit_delay_ms;

    ApiProviderConfig()
        : base_url(""), endpoint(""), user_agent("tightzone/1.0"),
          retry_count(1), timeout_seconds(30), enable_ssl_verification(true), rate_limit_delay_ms(0) {}
};

struct ApiConfig {
    ApiProviderConfig scanner;         // Screener queries (POST)
    ApiProviderConfig history;         // Price history (GET)

    const ApiProviderConfig& get_provider_config(ApiProvider provider) const {
        return provider == ApiProvider::SCANNER ? scanner : history;
    }

    ApiProviderConfig& get_provider_config(ApiProvider provider) {
        return provider == ApiProvider::SCANNER ? scanner : history;
    }
};

} // namespace Config
} // namespace TightZone

#endif // API_CONFIG_HPP
