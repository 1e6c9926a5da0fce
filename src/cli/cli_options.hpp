#ifndef CLI_OPTIONS_HPP
#define CLI_OPTIONS_HPP

#include <optional>
#include <string>
#include <vector>
#include "configs/system_config.hpp"
#include "screener/market_screener.hpp"
#include "screener/zone_scanner.hpp"

namespace TightZone {
namespace Cli {

// Values given on the command line. Anything left unset falls back to the config files.
struct CliOptions {
    bool show_help = false;
    std::string help_text;
    std::string config_directory;

    std::optional<std::string> market;
    std::optional<std::string> exchange;
    std::optional<double> min_price;
    std::optional<double> max_price;
    std::optional<double> min_volume;
    std::optional<std::string> filters_file;
    std::optional<std::vector<std::string>> columns;
    std::optional<std::vector<std::string>> symbol_types;
    std::optional<std::string> sort_by;
    std::optional<std::string> sort_order;
    std::optional<int> page_size;
    std::optional<bool> apply_vcp_filter;

    bool detect_zones = false;
    std::optional<int> segment_count;
    std::optional<std::string> period;
    std::optional<std::string> interval;

    bool dump_payload = false;
};

// Throws Screener::InvalidInputError for unknown options or bad values.
CliOptions parse_command_line(int argc, const char* const argv[]);

// "a, b,,c" -> {"a", "b", "c"}; an empty string gives an empty list.
std::vector<std::string> split_comma_list(const std::string& list_string);

// Reads a JSON array of {left, operation, right?} filter objects.
std::vector<Screener::FilterCondition> load_filters_file(const std::string& filters_path);

Screener::ScreenerOptions build_screener_options(const CliOptions& cli_options, const Config::SystemConfig& config);
Screener::ZoneScanOptions build_zone_scan_options(const CliOptions& cli_options, const Config::SystemConfig& config);

} // namespace Cli
} // namespace TightZone

#endif // CLI_OPTIONS_HPP
