#include "scan_response_parser.hpp"
#include "screener_errors.hpp"

using json = nlohmann::json;

namespace TightZone {
namespace Screener {

bool is_truthy(const json& value) {
    switch (value.type()) {
        case json::value_t::null:
        case json::value_t::discarded:
            return false;
        case json::value_t::boolean:
            return value.get<bool>();
        case json::value_t::number_integer:
        case json::value_t::number_unsigned:
        case json::value_t::number_float:
            return value.get<double>() != 0.0;
        case json::value_t::string:
            return !value.get_ref<const std::string&>().empty();
        default:
            return !value.empty();
    }
}

CellValue cell_from_json(const json& value) {
    if (value.is_null()) {
        return std::monostate{};
    }
    if (value.is_boolean()) {
        return value.get<bool>();
    }
    if (value.is_number()) {
        return value.get<double>();
    }
    if (value.is_string()) {
        return value.get<std::string>();
    }
    // Nested arrays/objects are kept verbatim as their JSON text.
    return value.dump();
}

ScanPage parse_scan_response(const json& response) {
    if (!response.is_object()) {
        throw DecodeError("Scanner response is not a JSON object");
    }

    auto error_iterator = response.find("error");
    if (error_iterator != response.end() && is_truthy(*error_iterator)) {
        std::string provider_message = error_iterator->is_string() ? error_iterator->get<std::string>() : error_iterator->dump();
        throw ProviderLogicalError("Scanner rejected request: " + provider_message);
    }

    ScanPage page;

    auto columns_iterator = response.find("columns");
    if (columns_iterator != response.end() && !columns_iterator->is_null()) {
        if (!columns_iterator->is_array()) {
            throw DecodeError("Scanner response 'columns' is not an array");
        }
        for (const auto& column_entry : *columns_iterator) {
            if (!column_entry.is_string()) {
                throw DecodeError("Scanner response 'columns' contains a non-string entry");
            }
            page.columns.push_back(column_entry.get<std::string>());
        }
    }

    auto data_iterator = response.find("data");
    if (data_iterator == response.end() || data_iterator->is_null()) {
        return page;
    }
    if (!data_iterator->is_array()) {
        throw DecodeError("Scanner response 'data' is not an array");
    }

    page.rows.reserve(data_iterator->size());
    for (const auto& data_entry : *data_iterator) {
        if (!data_entry.is_object()) {
            throw DecodeError("Scanner response row is not an object");
        }

        auto symbol_iterator = data_entry.find("s");
        if (symbol_iterator == data_entry.end() || !symbol_iterator->is_string() ||
            symbol_iterator->get_ref<const std::string&>().empty()) {
            throw DecodeError("Scanner response row is missing its symbol");
        }

        Row row;
        row.symbol = symbol_iterator->get<std::string>();

        const json* values_pointer = nullptr;
        auto values_iterator = data_entry.find("d");
        if (values_iterator != data_entry.end() && !values_iterator->is_null()) {
            if (!values_iterator->is_array()) {
                throw DecodeError("Scanner response values for " + row.symbol + " are not an array");
            }
            values_pointer = &(*values_iterator);
        }

        row.fields.reserve(page.columns.size());
        for (std::size_t column_index = 0; column_index < page.columns.size(); ++column_index) {
            if (values_pointer && column_index < values_pointer->size()) {
                row.fields.emplace_back(page.columns[column_index], cell_from_json((*values_pointer)[column_index]));
            } else {
                row.fields.emplace_back(page.columns[column_index], CellValue(std::monostate{}));
            }
        }
        page.rows.push_back(std::move(row));
    }

    return page;
}

} // namespace Screener
} // namespace TightZone
