#ifndef HISTORY_PROVIDER_INTERFACE_HPP
#define HISTORY_PROVIDER_INTERFACE_HPP

#include <memory>
#include <string>
#include <vector>
#include "screener/screener_structures.hpp"

namespace TightZone {
namespace API {

struct HistoryRequest {
    std::string symbol;
    std::string period;
    std::string interval;

    HistoryRequest(const std::string& input_symbol, const std::string& history_period, const std::string& bar_interval)
        : symbol(input_symbol), period(history_period), interval(bar_interval) {}
};

// Source of chronological close/volume series for one symbol. Must be safe to call from several threads.
class HistoryProviderInterface {
public:
    virtual ~HistoryProviderInterface() = default;

    virtual std::vector<Screener::PriceBar> fetch_history(const HistoryRequest& request) const = 0;
    virtual std::string get_provider_name() const = 0;
};

using HistoryProviderPtr = std::unique_ptr<HistoryProviderInterface>;

} // namespace API
} // namespace TightZone

#endif // HISTORY_PROVIDER_INTERFACE_HPP
