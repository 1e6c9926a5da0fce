#ifndef SYSTEM_CONFIG_HPP
#define SYSTEM_CONFIG_HPP

#include "api_config.hpp"
#include "logging_config.hpp"
#include "screener_config.hpp"

namespace TightZone {
namespace Config {

/**
 * Complete application configuration.
 * api: scanner and history provider endpoints and HTTP settings
 * screener/zones: scan defaults, overridable from the command line
 */
struct SystemConfig {
    SystemConfig() {}

    ApiConfig api;
    ScreenerConfig screener;
    ZoneConfig zones;
    LoggingConfig logging;
};

} // namespace Config
} // namespace TightZone

#endif // SYSTEM_CONFIG_HPP
