#include "result_output.hpp"

using ordered_json = nlohmann::ordered_json;

namespace TightZone {
namespace Cli {

ordered_json cell_to_json(const Screener::CellValue& cell) {
    if (std::holds_alternative<bool>(cell)) {
        return std::get<bool>(cell);
    }
    if (std::holds_alternative<double>(cell)) {
        return std::get<double>(cell);
    }
    if (std::holds_alternative<std::string>(cell)) {
        return std::get<std::string>(cell);
    }
    return nullptr;
}

ordered_json row_to_json(const Screener::Row& row) {
    ordered_json row_json;
    row_json["symbol"] = row.symbol;
    for (const auto& field_entry : row.fields) {
        if (field_entry.first == "symbol") {
            continue;
        }
        row_json[field_entry.first] = cell_to_json(field_entry.second);
    }
    return row_json;
}

ordered_json zones_to_json(const std::vector<Screener::ContractionZone>& zones) {
    ordered_json zones_json = ordered_json::array();
    for (const auto& zone : zones) {
        ordered_json zone_json;
        zone_json["start_index"] = zone.start_index;
        zone_json["end_index"] = zone.end_index;
        zone_json["high"] = zone.high;
        zone_json["low"] = zone.low;
        zones_json.push_back(zone_json);
    }
    return zones_json;
}

void attach_zone_result(ordered_json& row_json, const Screener::SymbolZoneResult& zone_result) {
    if (zone_result.succeeded()) {
        row_json["contraction_zones"] = zones_to_json(zone_result.zones);
    } else {
        row_json["zones_error"] = *zone_result.error_message;
    }
}

void write_result_lines(std::ostream& output_stream, const std::vector<Screener::Row>& rows,
                        const std::vector<Screener::SymbolZoneResult>* zone_results) {
    for (std::size_t row_index = 0; row_index < rows.size(); ++row_index) {
        ordered_json row_json = row_to_json(rows[row_index]);
        if (zone_results && row_index < zone_results->size()) {
            attach_zone_result(row_json, (*zone_results)[row_index]);
        }
        output_stream << row_json.dump() << '\n';
    }
    output_stream.flush();
}

} // namespace Cli
} // namespace TightZone
