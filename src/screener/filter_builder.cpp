#include "filter_builder.hpp"
#include "market_slug.hpp"
#include "screener_errors.hpp"
#include <algorithm>
#include <cctype>

using json = nlohmann::json;

namespace TightZone {
namespace Screener {

namespace {

std::string to_upper_copy(const std::string& input_string) {
    std::string upper_string = input_string;
    std::transform(upper_string.begin(), upper_string.end(), upper_string.begin(),
                   [](unsigned char character) { return static_cast<char>(std::toupper(character)); });
    return upper_string;
}

void append_bound_condition(std::vector<FilterCondition>& filters, const std::string& field,
                            FilterOperation operation, const std::optional<double>& bound) {
    if (!bound) {
        return;
    }
    filters.emplace_back(field, operation, FilterValue(*bound));
}

json filter_value_to_json(const FilterValue& value) {
    if (std::holds_alternative<double>(value)) {
        return std::get<double>(value);
    }
    return std::get<std::string>(value);
}

} // namespace

ScreenerRequest FilterBuilder::build(const FilterBuildParams& params) {
    ScreenerRequest request;
    request.market = normalize_market_slug(params.market);
    request.symbol_types = resolve_symbol_types(request.market, params.symbol_types);

    if (params.apply_qualification) {
        request.columns = merge_columns(params.columns, params.required_columns);
    } else {
        request.columns = params.columns;
    }

    if (params.exchange && !params.exchange->empty()) {
        request.filters.emplace_back("exchange", FilterOperation::EQUAL, FilterValue(to_upper_copy(*params.exchange)));
    }
    append_bound_condition(request.filters, "close", FilterOperation::GREATER_OR_EQUAL, params.min_price);
    append_bound_condition(request.filters, "close", FilterOperation::LESS_OR_EQUAL, params.max_price);
    append_bound_condition(request.filters, "volume", FilterOperation::GREATER_OR_EQUAL, params.min_volume);

    for (const auto& custom_condition : params.custom_filters) {
        if (filter_operation_requires_value(custom_condition.operation) && !custom_condition.value) {
            continue;
        }
        request.filters.push_back(custom_condition);
    }

    request.sort = params.sort;
    request.language = params.language.empty() ? "en" : params.language;
    request.range = clamp_page_range(params.page_range.start, params.page_range.end);
    return request;
}

PageRange FilterBuilder::clamp_page_range(int start, int end) {
    int clamped_start = std::max(0, start);
    int clamped_end = std::max(clamped_start, end);
    return PageRange(clamped_start, clamped_end);
}

std::vector<std::string> FilterBuilder::merge_columns(const std::vector<std::string>& columns,
                                                      const std::vector<std::string>& required_columns) {
    std::vector<std::string> merged_columns = columns;
    for (const auto& required_column : required_columns) {
        if (std::find(merged_columns.begin(), merged_columns.end(), required_column) == merged_columns.end()) {
            merged_columns.push_back(required_column);
        }
    }
    return merged_columns;
}

json FilterBuilder::condition_to_json(const FilterCondition& condition) {
    json condition_json = {
        {"left", condition.field},
        {"operation", filter_operation_to_string(condition.operation)},
    };
    if (condition.value) {
        condition_json["right"] = filter_value_to_json(*condition.value);
    }
    return condition_json;
}

json FilterBuilder::to_payload(const ScreenerRequest& request) {
    json filter_list = json::array();
    for (const auto& condition : request.filters) {
        filter_list.push_back(condition_to_json(condition));
    }

    json payload;
    payload["markets"] = json::array({request.market});
    payload["symbols"] = {
        {"query", {{"types", request.symbol_types}}},
        {"tickers", json::array()},
    };
    payload["columns"] = request.columns;
    payload["filter"] = filter_list;
    payload["sort"] = {
        {"sortBy", request.sort.sort_by},
        {"sortOrder", sort_order_to_string(request.sort.sort_order)},
    };
    payload["options"] = {{"lang", request.language}};
    payload["range"] = json::array({request.range.start, request.range.end});
    return payload;
}

std::vector<FilterCondition> FilterBuilder::parse_filter_conditions(const json& filters_json) {
    if (!filters_json.is_array()) {
        throw InvalidInputError("Custom filters must be a JSON array of filter objects");
    }

    std::vector<FilterCondition> conditions;
    for (std::size_t filter_index = 0; filter_index < filters_json.size(); ++filter_index) {
        const json& filter_entry = filters_json[filter_index];
        std::string position_string = "filter #" + std::to_string(filter_index);

        if (!filter_entry.is_object()) {
            throw InvalidInputError(position_string + " is not a JSON object");
        }

        auto left_iterator = filter_entry.find("left");
        if (left_iterator == filter_entry.end() || !left_iterator->is_string() || left_iterator->get<std::string>().empty()) {
            throw InvalidInputError(position_string + " requires a non-empty string 'left'");
        }

        auto operation_iterator = filter_entry.find("operation");
        if (operation_iterator == filter_entry.end() || !operation_iterator->is_string()) {
            throw InvalidInputError(position_string + " requires a string 'operation'");
        }

        std::string field_name = left_iterator->get<std::string>();
        FilterOperation operation = parse_filter_operation(operation_iterator->get<std::string>());

        auto right_iterator = filter_entry.find("right");
        if (right_iterator == filter_entry.end() || right_iterator->is_null()) {
            conditions.emplace_back(field_name, operation);
        } else if (right_iterator->is_number()) {
            conditions.emplace_back(field_name, operation, FilterValue(right_iterator->get<double>()));
        } else if (right_iterator->is_string()) {
            conditions.emplace_back(field_name, operation, FilterValue(right_iterator->get<std::string>()));
        } else {
            throw InvalidInputError(position_string + " has an unsupported 'right' value (expected number or string)");
        }
    }
    return conditions;
}

} // namespace Screener
} // namespace TightZone
