#ifndef FILTER_BUILDER_HPP
#define FILTER_BUILDER_HPP

#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "screener_structures.hpp"

namespace TightZone {
namespace Screener {

// Build parameters (to avoid multi-parameter functions).
struct FilterBuildParams {
    std::string market;
    std::optional<std::string> exchange;
    std::optional<double> min_price;
    std::optional<double> max_price;
    std::optional<double> min_volume;
    std::vector<FilterCondition> custom_filters;
    std::vector<std::string> columns;
    std::vector<std::string> required_columns;
    bool apply_qualification;
    std::optional<std::vector<std::string>> symbol_types;
    SortSpec sort;
    std::string language;
    PageRange page_range;

    FilterBuildParams() : apply_qualification(false), language("en") {}
};

class FilterBuilder {
public:
    /**
     * Materializes a provider request.
     * Absent exchange/price/volume bounds contribute no condition at all; a
     * comparison condition without a value is dropped the same way. Required
     * columns are appended only in qualification mode and only when missing.
     */
    static ScreenerRequest build(const FilterBuildParams& params);

    // Negative start becomes 0; an end before start collapses to start.
    static PageRange clamp_page_range(int start, int end);

    static std::vector<std::string> merge_columns(const std::vector<std::string>& columns,
                                                  const std::vector<std::string>& required_columns);

    // Exact JSON body the scanner expects for one page.
    static nlohmann::json to_payload(const ScreenerRequest& request);

    static nlohmann::json condition_to_json(const FilterCondition& condition);

    // Reads a JSON array of {left, operation, right?} objects. Throws InvalidInputError on any other shape.
    static std::vector<FilterCondition> parse_filter_conditions(const nlohmann::json& filters_json);
};

} // namespace Screener
} // namespace TightZone

#endif // FILTER_BUILDER_HPP
