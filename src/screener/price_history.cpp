#include "price_history.hpp"
#include "scan_response_parser.hpp"
#include "screener_errors.hpp"
#include "utils/time_utils.hpp"
#include <algorithm>
#include <cmath>

using json = nlohmann::json;

namespace TightZone {
namespace Screener {

std::string normalise_symbol(const std::string& symbol) {
    std::size_t separator_position = symbol.find(':');
    if (separator_position == std::string::npos) {
        return symbol;
    }
    return symbol.substr(separator_position + 1);
}

std::vector<PriceBar> parse_history_payload(const json& payload) {
    if (!payload.is_object()) {
        throw DecodeError("History response is not a JSON object");
    }

    auto chart_iterator = payload.find("chart");
    if (chart_iterator == payload.end() || !chart_iterator->is_object()) {
        throw DecodeError("History response missing chart data");
    }
    const json& chart = *chart_iterator;

    auto error_iterator = chart.find("error");
    if (error_iterator != chart.end() && is_truthy(*error_iterator)) {
        std::string provider_message = error_iterator->dump();
        if (error_iterator->is_object() && error_iterator->contains("description") &&
            (*error_iterator)["description"].is_string()) {
            provider_message = (*error_iterator)["description"].get<std::string>();
        }
        throw ProviderLogicalError("History provider error: " + provider_message);
    }

    auto result_iterator = chart.find("result");
    if (result_iterator == chart.end() || !result_iterator->is_array() || result_iterator->empty()) {
        throw DecodeError("History response missing result data");
    }
    const json& entries = (*result_iterator)[0];
    if (!entries.is_object()) {
        throw DecodeError("History response malformed");
    }

    auto timestamps_iterator = entries.find("timestamp");
    auto indicators_iterator = entries.find("indicators");
    if (timestamps_iterator == entries.end() || !timestamps_iterator->is_array() ||
        indicators_iterator == entries.end() || !indicators_iterator->is_object()) {
        throw DecodeError("History response missing indicators");
    }

    auto quotes_iterator = indicators_iterator->find("quote");
    if (quotes_iterator == indicators_iterator->end() || !quotes_iterator->is_array() || quotes_iterator->empty()) {
        throw DecodeError("History quote data missing");
    }
    const json& quote = (*quotes_iterator)[0];
    if (!quote.is_object()) {
        throw DecodeError("History quote data malformed");
    }

    auto closes_iterator = quote.find("close");
    if (closes_iterator == quote.end() || !closes_iterator->is_array()) {
        throw DecodeError("History close prices missing");
    }
    const json& closes = *closes_iterator;
    const json& timestamps = *timestamps_iterator;

    const json* volumes_pointer = nullptr;
    auto volumes_iterator = quote.find("volume");
    if (volumes_iterator != quote.end() && volumes_iterator->is_array()) {
        volumes_pointer = &(*volumes_iterator);
    }

    std::size_t point_count = std::min(timestamps.size(), closes.size());
    if (volumes_pointer) {
        point_count = std::min(point_count, volumes_pointer->size());
    }

    std::vector<PriceBar> series;
    series.reserve(point_count);
    for (std::size_t point_index = 0; point_index < point_count; ++point_index) {
        const json& close_entry = closes[point_index];
        const json& timestamp_entry = timestamps[point_index];
        if (close_entry.is_null() || !timestamp_entry.is_number()) {
            continue;
        }
        if (!close_entry.is_number()) {
            throw DecodeError("History close price at index " + std::to_string(point_index) + " is not a number");
        }

        double volume_value = 0.0;
        if (volumes_pointer && (*volumes_pointer)[point_index].is_number()) {
            volume_value = (*volumes_pointer)[point_index].get<double>();
        }

        auto epoch_seconds = static_cast<std::int64_t>(std::floor(timestamp_entry.get<double>()));
        series.emplace_back(TimeUtils::from_epoch_seconds(epoch_seconds), close_entry.get<double>(), volume_value);
    }

    return series;
}

} // namespace Screener
} // namespace TightZone
