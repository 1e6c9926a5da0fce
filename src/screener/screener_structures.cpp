#include "screener_structures.hpp"
#include "screener_errors.hpp"

namespace TightZone {
namespace Screener {

std::string filter_operation_to_string(FilterOperation operation) {
    switch (operation) {
        case FilterOperation::EQUAL: return "equal";
        case FilterOperation::NOT_EQUAL: return "nequal";
        case FilterOperation::GREATER: return "greater";
        case FilterOperation::GREATER_OR_EQUAL: return "egreater";
        case FilterOperation::LESS: return "less";
        case FilterOperation::LESS_OR_EQUAL: return "eless";
        case FilterOperation::NOT_EMPTY: return "nempty";
        case FilterOperation::EMPTY: return "empty";
        case FilterOperation::MATCH: return "match";
    }
    throw InvalidInputError("Unknown filter operation value");
}

FilterOperation parse_filter_operation(const std::string& operation_name) {
    if (operation_name == "equal") return FilterOperation::EQUAL;
    if (operation_name == "nequal") return FilterOperation::NOT_EQUAL;
    if (operation_name == "greater") return FilterOperation::GREATER;
    if (operation_name == "egreater") return FilterOperation::GREATER_OR_EQUAL;
    if (operation_name == "less") return FilterOperation::LESS;
    if (operation_name == "eless") return FilterOperation::LESS_OR_EQUAL;
    if (operation_name == "nempty") return FilterOperation::NOT_EMPTY;
    if (operation_name == "empty") return FilterOperation::EMPTY;
    if (operation_name == "match") return FilterOperation::MATCH;
    throw InvalidInputError("Unsupported filter operation: '" + operation_name + "'");
}

bool filter_operation_requires_value(FilterOperation operation) {
    return operation != FilterOperation::NOT_EMPTY && operation != FilterOperation::EMPTY;
}

std::string sort_order_to_string(SortOrder order) {
    return order == SortOrder::ASCENDING ? "asc" : "desc";
}

SortOrder parse_sort_order(const std::string& order_name) {
    if (order_name == "asc") return SortOrder::ASCENDING;
    if (order_name == "desc") return SortOrder::DESCENDING;
    throw InvalidInputError("Sort order must be 'asc' or 'desc', got: '" + order_name + "'");
}

bool is_null_cell(const CellValue& cell) {
    return std::holds_alternative<std::monostate>(cell);
}

const CellValue* Row::find(const std::string& column) const {
    for (const auto& field_entry : fields) {
        if (field_entry.first == column) {
            return &field_entry.second;
        }
    }
    return nullptr;
}

} // namespace Screener
} // namespace TightZone
