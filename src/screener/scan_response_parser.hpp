#ifndef SCAN_RESPONSE_PARSER_HPP
#define SCAN_RESPONSE_PARSER_HPP

#include <nlohmann/json.hpp>
#include "screener_structures.hpp"

namespace TightZone {
namespace Screener {

// JSON truthiness: null, false, 0, "" and empty containers are false.
bool is_truthy(const nlohmann::json& value);

CellValue cell_from_json(const nlohmann::json& value);

/**
 * Decodes one scanner page: {"columns": [...], "data": [{"s": ..., "d": [...]}]}.
 * The page's own column list is zipped against each value array; short
 * arrays yield null cells. A missing or null "data" is an empty page.
 * Throws ProviderLogicalError for a truthy "error" key and DecodeError for
 * any other shape violation, including a row without a usable symbol.
 */
ScanPage parse_scan_response(const nlohmann::json& response);

} // namespace Screener
} // namespace TightZone

#endif // SCAN_RESPONSE_PARSER_HPP
