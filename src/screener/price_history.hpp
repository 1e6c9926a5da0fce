#ifndef PRICE_HISTORY_HPP
#define PRICE_HISTORY_HPP

#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "screener_structures.hpp"

namespace TightZone {
namespace Screener {

// "NASDAQ:AAPL" -> "AAPL"; symbols without an exchange prefix are returned as is.
std::string normalise_symbol(const std::string& symbol);

/**
 * Decodes a chart response:
 *   chart.result[0].timestamp[i]                         epoch seconds
 *   chart.result[0].indicators.quote[0].close[i]         null entries dropped
 *   chart.result[0].indicators.quote[0].volume[i]        0 when absent or not numeric
 * Arrays are aligned by index and truncated to the shortest.
 * Throws ProviderLogicalError for a truthy chart.error, DecodeError for any
 * missing level.
 */
std::vector<PriceBar> parse_history_payload(const nlohmann::json& payload);

} // namespace Screener
} // namespace TightZone

#endif // PRICE_HISTORY_HPP
