#ifndef RESULT_OUTPUT_HPP
#define RESULT_OUTPUT_HPP

#include <ostream>
#include <vector>
#include <nlohmann/json.hpp>
#include "screener/screener_structures.hpp"
#include "screener/zone_scanner.hpp"

namespace TightZone {
namespace Cli {

nlohmann::ordered_json cell_to_json(const Screener::CellValue& cell);

// "symbol" first, then the row's columns in provider order.
nlohmann::ordered_json row_to_json(const Screener::Row& row);

nlohmann::ordered_json zones_to_json(const std::vector<Screener::ContractionZone>& zones);

// Adds "contraction_zones" on success or "zones_error" on failure.
void attach_zone_result(nlohmann::ordered_json& row_json, const Screener::SymbolZoneResult& zone_result);

/**
 * One JSON object per line. zone_results, when given, must be aligned with
 * rows by index.
 */
void write_result_lines(std::ostream& output_stream, const std::vector<Screener::Row>& rows,
                        const std::vector<Screener::SymbolZoneResult>* zone_results = nullptr);

} // namespace Cli
} // namespace TightZone

#endif // RESULT_OUTPUT_HPP
