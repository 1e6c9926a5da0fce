#ifndef SCREENER_STRUCTURES_HPP
#define SCREENER_STRUCTURES_HPP

#include <atomic>
#include <chrono>
#include <optional>
#include <string>
#include <utility>
#include <variant>
#include <vector>

namespace TightZone {
namespace Screener {

// ========================================================================
// FILTER DEFINITIONS
// ========================================================================

enum class FilterOperation {
    EQUAL,
    NOT_EQUAL,
    GREATER,
    GREATER_OR_EQUAL,
    LESS,
    LESS_OR_EQUAL,
    NOT_EMPTY,
    EMPTY,
    MATCH
};

// Provider wire name, e.g. "egreater" or "nempty".
std::string filter_operation_to_string(FilterOperation operation);
FilterOperation parse_filter_operation(const std::string& operation_name);

// True for comparison operators that are meaningless without a right-hand side.
bool filter_operation_requires_value(FilterOperation operation);

// Right-hand side of a condition: a literal number, a string literal or another column name.
using FilterValue = std::variant<double, std::string>;

struct FilterCondition {
    std::string field;
    FilterOperation operation;
    std::optional<FilterValue> value;

    FilterCondition(const std::string& field_name, FilterOperation filter_operation)
        : field(field_name), operation(filter_operation), value() {}
    FilterCondition(const std::string& field_name, FilterOperation filter_operation, FilterValue filter_value)
        : field(field_name), operation(filter_operation), value(std::move(filter_value)) {}
};

enum class SortOrder {
    ASCENDING,
    DESCENDING
};

std::string sort_order_to_string(SortOrder order);
SortOrder parse_sort_order(const std::string& order_name);

struct SortSpec {
    std::string sort_by;
    SortOrder sort_order;

    SortSpec() : sort_by("market_cap_basic"), sort_order(SortOrder::DESCENDING) {}
    SortSpec(const std::string& column, SortOrder order) : sort_by(column), sort_order(order) {}
};

// Inclusive, zero-based row window.
struct PageRange {
    int start;
    int end;

    PageRange() : start(0), end(0) {}
    PageRange(int range_start, int range_end) : start(range_start), end(range_end) {}

    bool operator==(const PageRange& other) const { return start == other.start && end == other.end; }
};

struct ScreenerRequest {
    std::string market;
    std::vector<std::string> symbol_types;
    std::vector<std::string> columns;
    std::vector<FilterCondition> filters;
    SortSpec sort;
    std::string language;
    PageRange range;
};

// ========================================================================
// RESULT ROWS
// ========================================================================

// Scalar cell as returned by the scanner; monostate is JSON null.
using CellValue = std::variant<std::monostate, bool, double, std::string>;

bool is_null_cell(const CellValue& cell);

/**
 * One scanner result. Column order is whatever the provider returned for
 * the page the row came from.
 */
struct Row {
    std::string symbol;
    std::vector<std::pair<std::string, CellValue>> fields;

    const CellValue* find(const std::string& column) const;
    bool has_column(const std::string& column) const { return find(column) != nullptr; }
};

struct ScanPage {
    std::vector<std::string> columns;
    std::vector<Row> rows;
};

// ========================================================================
// PRICE SERIES
// ========================================================================

struct PriceBar {
    std::chrono::system_clock::time_point timestamp;  // UTC
    double close;
    double volume;

    PriceBar() : timestamp(), close(0.0), volume(0.0) {}
    PriceBar(std::chrono::system_clock::time_point bar_time, double close_price, double bar_volume)
        : timestamp(bar_time), close(close_price), volume(bar_volume) {}
};

// end_index is inclusive.
struct ContractionZone {
    std::size_t start_index;
    std::size_t end_index;
    double high;
    double low;

    double range() const { return high - low; }
};

// ========================================================================
// CANCELLATION
// ========================================================================

class CancellationToken {
public:
    CancellationToken() = default;
    CancellationToken(const CancellationToken&) = delete;
    CancellationToken& operator=(const CancellationToken&) = delete;

    void cancel() { cancelled.store(true); }
    bool is_cancelled() const { return cancelled.load(); }

private:
    std::atomic<bool> cancelled{false};
};

} // namespace Screener
} // namespace TightZone

#endif // SCREENER_STRUCTURES_HPP
