#include "vcp_qualifier.hpp"
#include <cerrno>
#include <cmath>
#include <cstdlib>

namespace TightZone {
namespace Screener {

namespace {

std::optional<double> parse_numeric_string(const std::string& text_value) {
    const char* whitespace_characters = " \t\r\n";
    std::size_t first_position = text_value.find_first_not_of(whitespace_characters);
    if (first_position == std::string::npos) {
        return std::nullopt;
    }
    std::size_t last_position = text_value.find_last_not_of(whitespace_characters);
    std::string trimmed_value = text_value.substr(first_position, last_position - first_position + 1);

    char* parse_end_pointer = nullptr;
    errno = 0;
    double parsed_value = std::strtod(trimmed_value.c_str(), &parse_end_pointer);
    if (parse_end_pointer != trimmed_value.c_str() + trimmed_value.size() || errno == ERANGE) {
        return std::nullopt;
    }
    return parsed_value;
}

std::optional<double> column_number(const Row& row, const char* column_name) {
    const CellValue* cell_pointer = row.find(column_name);
    if (!cell_pointer) {
        return std::nullopt;
    }
    return coerce_finite_number(*cell_pointer);
}

} // namespace

std::optional<double> coerce_finite_number(const CellValue& cell) {
    std::optional<double> numeric_value;
    if (std::holds_alternative<double>(cell)) {
        numeric_value = std::get<double>(cell);
    } else if (std::holds_alternative<std::string>(cell)) {
        numeric_value = parse_numeric_string(std::get<std::string>(cell));
    }
    if (!numeric_value || !std::isfinite(*numeric_value)) {
        return std::nullopt;
    }
    return numeric_value;
}

bool VcpQualifier::qualifies(const Row& row) {
    std::optional<double> close_value = column_number(row, VcpColumns::CLOSE);
    std::optional<double> sma200_value = column_number(row, VcpColumns::SMA200);
    std::optional<double> market_cap_value = column_number(row, VcpColumns::MARKET_CAP);
    std::optional<double> beta_value = column_number(row, VcpColumns::BETA);
    std::optional<double> average_volume_value = column_number(row, VcpColumns::AVERAGE_VOLUME_30D);

    if (!close_value || !sma200_value || !market_cap_value || !beta_value || !average_volume_value) {
        return false;
    }

    if (!(*close_value > *sma200_value)) return false;
    if (!(*close_value > VCP_MINIMUM_CLOSE)) return false;
    if (!(*market_cap_value > VCP_MINIMUM_MARKET_CAP)) return false;
    if (!(*beta_value > VCP_MINIMUM_BETA)) return false;
    return *close_value * *average_volume_value > VCP_MINIMUM_DOLLAR_VOLUME;
}

const std::vector<std::string>& VcpQualifier::required_columns() {
    static const std::vector<std::string> columns = {
        VcpColumns::CLOSE,
        VcpColumns::SMA200,
        VcpColumns::MARKET_CAP,
        VcpColumns::BETA,
        VcpColumns::AVERAGE_VOLUME_30D,
    };
    return columns;
}

std::vector<Row> VcpQualifier::filter_rows(const std::vector<Row>& rows) {
    std::vector<Row> qualified_rows;
    for (const auto& row : rows) {
        if (qualifies(row)) {
            qualified_rows.push_back(row);
        }
    }
    return qualified_rows;
}

} // namespace Screener
} // namespace TightZone
