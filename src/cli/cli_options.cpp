#include "cli_options.hpp"
#include "screener/filter_builder.hpp"
#include "screener/screener_errors.hpp"
#include <boost/program_options/options_description.hpp>
#include <boost/program_options/parsers.hpp>
#include <boost/program_options/variables_map.hpp>
#include <fstream>
#include <sstream>

namespace po = boost::program_options;

namespace TightZone {
namespace Cli {

namespace {

template <typename ValueType>
void copy_if_set(const po::variables_map& vm, const char* option_name, std::optional<ValueType>& target) {
    if (vm.count(option_name)) {
        target = vm[option_name].as<ValueType>();
    }
}

} // namespace

std::vector<std::string> split_comma_list(const std::string& list_string) {
    std::vector<std::string> list_items;
    std::stringstream list_stream(list_string);
    std::string list_item;
    while (std::getline(list_stream, list_item, ',')) {
        const char* whitespace_characters = " \t";
        std::size_t first_position = list_item.find_first_not_of(whitespace_characters);
        if (first_position == std::string::npos) {
            continue;
        }
        std::size_t last_position = list_item.find_last_not_of(whitespace_characters);
        list_items.push_back(list_item.substr(first_position, last_position - first_position + 1));
    }
    return list_items;
}

CliOptions parse_command_line(int argc, const char* const argv[]) {
    po::options_description desc("Allowed options");
    desc.add_options()
        ("help", "print this help and exit")
        ("config-dir", po::value<std::string>(), "directory holding api_endpoints_config.csv and screener_config.csv")
        ("market", po::value<std::string>(), "market to scan, e.g. america, US, crypto")
        ("exchange", po::value<std::string>(), "limit results to one exchange, e.g. NASDAQ")
        ("min-price", po::value<double>(), "minimum close price")
        ("max-price", po::value<double>(), "maximum close price")
        ("min-volume", po::value<double>(), "minimum volume")
        ("filters", po::value<std::string>(), "JSON file with an array of {left, operation, right} filters")
        ("columns", po::value<std::string>(), "comma separated columns to request")
        ("symbol-types", po::value<std::string>(), "comma separated symbol types; an empty value requests none")
        ("sort-by", po::value<std::string>(), "sort column")
        ("sort-order", po::value<std::string>(), "asc or desc")
        ("page-size", po::value<int>(), "rows requested per page")
        ("vcp", po::bool_switch(), "keep only rows passing the VCP qualification")
        ("no-vcp", po::bool_switch(), "return every matching row")
        ("zones", po::bool_switch(), "detect contraction zones for every result")
        ("segments", po::value<int>(), "contraction zone windows per series")
        ("period", po::value<std::string>(), "price history range, e.g. 6mo")
        ("interval", po::value<std::string>(), "price history bar interval, e.g. 1d")
        ("dump-payload", po::bool_switch(), "print the first page request body and exit");

    po::variables_map vm;
    try {
        po::store(po::parse_command_line(argc, argv, desc,
             po::command_line_style::unix_style ^ po::command_line_style::allow_short), vm);
        po::notify(vm);
    } catch (const po::error& option_error) {
        throw Screener::InvalidInputError(std::string("Invalid command line: ") + option_error.what());
    }

    CliOptions cli_options;
    std::ostringstream help_stream;
    help_stream << "Usage: tightzone [options]\n" << desc;
    cli_options.help_text = help_stream.str();
    cli_options.show_help = vm.count("help") > 0;

    if (vm.count("config-dir")) {
        cli_options.config_directory = vm["config-dir"].as<std::string>();
    }
    copy_if_set(vm, "market", cli_options.market);
    copy_if_set(vm, "exchange", cli_options.exchange);
    copy_if_set(vm, "min-price", cli_options.min_price);
    copy_if_set(vm, "max-price", cli_options.max_price);
    copy_if_set(vm, "min-volume", cli_options.min_volume);
    copy_if_set(vm, "filters", cli_options.filters_file);
    copy_if_set(vm, "sort-by", cli_options.sort_by);
    copy_if_set(vm, "sort-order", cli_options.sort_order);
    copy_if_set(vm, "page-size", cli_options.page_size);
    copy_if_set(vm, "segments", cli_options.segment_count);
    copy_if_set(vm, "period", cli_options.period);
    copy_if_set(vm, "interval", cli_options.interval);

    if (vm.count("columns")) {
        cli_options.columns = split_comma_list(vm["columns"].as<std::string>());
    }
    if (vm.count("symbol-types")) {
        cli_options.symbol_types = split_comma_list(vm["symbol-types"].as<std::string>());
    }

    bool vcp_requested = vm["vcp"].as<bool>();
    bool vcp_disabled = vm["no-vcp"].as<bool>();
    if (vcp_requested && vcp_disabled) {
        throw Screener::InvalidInputError("--vcp and --no-vcp are mutually exclusive");
    }
    if (vcp_requested || vcp_disabled) {
        cli_options.apply_vcp_filter = vcp_requested;
    }

    cli_options.detect_zones = vm["zones"].as<bool>();
    cli_options.dump_payload = vm["dump-payload"].as<bool>();
    return cli_options;
}

std::vector<Screener::FilterCondition> load_filters_file(const std::string& filters_path) {
    std::ifstream filters_stream(filters_path);
    if (!filters_stream.is_open()) {
        throw Screener::InvalidInputError("Cannot open filters file " + filters_path);
    }

    nlohmann::json filters_json;
    try {
        filters_stream >> filters_json;
    } catch (const nlohmann::json::parse_error& parse_exception_error) {
        throw Screener::InvalidInputError("Filters file " + filters_path + " is not valid JSON: " + parse_exception_error.what());
    }
    return Screener::FilterBuilder::parse_filter_conditions(filters_json);
}

Screener::ScreenerOptions build_screener_options(const CliOptions& cli_options, const Config::SystemConfig& config) {
    Screener::ScreenerOptions screener_options;
    screener_options.market = cli_options.market.value_or(config.screener.market);
    screener_options.exchange = cli_options.exchange;
    screener_options.min_price = cli_options.min_price;
    screener_options.max_price = cli_options.max_price;
    screener_options.min_volume = cli_options.min_volume;
    if (cli_options.filters_file) {
        screener_options.custom_filters = load_filters_file(*cli_options.filters_file);
    }
    screener_options.columns = cli_options.columns.value_or(config.screener.columns);
    screener_options.symbol_types = cli_options.symbol_types;
    screener_options.sort = Screener::SortSpec(cli_options.sort_by.value_or(config.screener.sort_by),
                                               Screener::parse_sort_order(cli_options.sort_order.value_or(config.screener.sort_order)));
    screener_options.language = config.screener.language;
    screener_options.page_size = cli_options.page_size.value_or(config.screener.page_size);
    screener_options.apply_vcp_filter = cli_options.apply_vcp_filter.value_or(config.screener.apply_vcp_filter);
    return screener_options;
}

Screener::ZoneScanOptions build_zone_scan_options(const CliOptions& cli_options, const Config::SystemConfig& config) {
    Screener::ZoneScanOptions zone_options;
    zone_options.segment_count = cli_options.segment_count.value_or(config.zones.segment_count);
    zone_options.period = cli_options.period.value_or(config.zones.history_period);
    zone_options.interval = cli_options.interval.value_or(config.zones.history_interval);
    zone_options.max_concurrent_fetches = config.zones.max_concurrent_fetches;
    return zone_options;
}

} // namespace Cli
} // namespace TightZone
