#ifndef VCP_QUALIFIER_HPP
#define VCP_QUALIFIER_HPP

#include <optional>
#include <string>
#include <vector>
#include "screener_structures.hpp"

namespace TightZone {
namespace Screener {

namespace VcpColumns {
    constexpr const char* CLOSE = "close";
    constexpr const char* SMA200 = "SMA200";
    constexpr const char* MARKET_CAP = "market_cap_basic";
    constexpr const char* BETA = "beta_1_year";
    constexpr const char* AVERAGE_VOLUME_30D = "average_volume_30d_calc";
}

// Fixed VCP thresholds; every comparison is strict.
constexpr double VCP_MINIMUM_CLOSE = 12.0;
constexpr double VCP_MINIMUM_MARKET_CAP = 2000000000.0;
constexpr double VCP_MINIMUM_BETA = 1.0;
constexpr double VCP_MINIMUM_DOLLAR_VOLUME = 900000000.0;

// Numbers and numeric strings that parse to a finite value; null, bool, NaN and text give nullopt.
std::optional<double> coerce_finite_number(const CellValue& cell);

class VcpQualifier {
public:
    /**
     * Volatility Contraction Pattern pre-screen. All five columns must be
     * finite numbers, then in order:
     *   close > SMA200, close > 12, market cap > 2e9, beta > 1,
     *   close * 30-day average volume > 9e8.
     * Fails closed and never throws.
     */
    static bool qualifies(const Row& row);

    // Columns the predicate reads, in the order they are appended to a request.
    static const std::vector<std::string>& required_columns();

    static std::vector<Row> filter_rows(const std::vector<Row>& rows);
};

} // namespace Screener
} // namespace TightZone

#endif // VCP_QUALIFIER_HPP
