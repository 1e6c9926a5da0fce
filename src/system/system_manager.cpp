#include "system_manager.hpp"
#include <iostream>
#include <stdexcept>
#include "api/tradingview/tradingview_scanner_client.hpp"
#include "api/yahoo/yahoo_chart_client.hpp"
#include "cli/result_output.hpp"
#include "configs/config_loader.hpp"
#include "logging/logs/system_logs.hpp"
#include "screener/market_screener.hpp"
#include "screener/zone_scanner.hpp"
#include "threads/system_threads/logging_thread.hpp"

using namespace TightZone::Logging;

namespace TightZone {
namespace System {

std::unique_ptr<SystemState> initialize(const std::string& config_directory_override) {
    // Initialize minimal logging context early - required before any logging calls
    auto early_logging_context = std::make_shared<LoggingContext>();
    set_logging_context(*early_logging_context);

    std::string config_directory = Config::resolve_config_directory(config_directory_override);
    Config::SystemConfig initial_config;
    std::string config_error_message;
    if (Config::load_system_config(initial_config, config_directory, config_error_message) != 0) {
        SystemLogs::log_system_startup_error(config_error_message);
        throw std::runtime_error("Configuration loading failed: " + config_error_message);
    }

    auto system_state = std::make_unique<SystemState>(initial_config, config_directory);
    system_state->logging_context = early_logging_context;

    // Validates the configuration before the logger is created
    system_state->logger = initialize_application_foundation(system_state->config);

    // Running is raised before the thread starts so an early shutdown cannot be lost
    system_state->logger->running.store(true);
    system_state->logger_thread = std::thread(TightZone::Threads::LoggingThread(
        system_state->logger, *system_state->logging_context, system_state->config.logging));

    SystemLogs::log_startup_configuration(config_directory, system_state->config);
    return system_state;
}

int run(SystemState& system_state, const TightZone::Cli::CliOptions& cli_options) {
    const Config::SystemConfig& config = system_state.config;

    Screener::ScreenerOptions screener_options = Cli::build_screener_options(cli_options, config);
    API::TradingViewScannerClient scanner_client(config.api.scanner);
    Screener::MarketScreener market_screener(screener_options, scanner_client);

    if (cli_options.dump_payload) {
        std::cout << market_screener.payload(0, screener_options.page_size - 1).dump(2) << std::endl;
        return EXIT_CODE_SUCCESS;
    }

    std::vector<Screener::Row> rows = market_screener.scan(&system_state.cancellation_token);

    if (!cli_options.detect_zones) {
        Cli::write_result_lines(std::cout, rows);
        return EXIT_CODE_SUCCESS;
    }

    API::YahooChartClient history_client(config.api.history);
    Screener::ZoneScanner zone_scanner(history_client, Cli::build_zone_scan_options(cli_options, config));

    std::vector<std::string> symbols;
    symbols.reserve(rows.size());
    for (const auto& row : rows) {
        symbols.push_back(row.symbol);
    }
    std::vector<Screener::SymbolZoneResult> zone_results = zone_scanner.scan_symbols(symbols, &system_state.cancellation_token);

    Cli::write_result_lines(std::cout, rows, &zone_results);
    return EXIT_CODE_SUCCESS;
}

void shutdown(SystemState& system_state) {
    if (system_state.logger) {
        shutdown_global_logger(*system_state.logger);
    }
    if (system_state.logger_thread.joinable()) {
        system_state.logger_thread.join();
    }
    // Later log lines go straight to stderr
    if (system_state.logging_context) {
        system_state.logging_context->async_logger.reset();
    }
}

} // namespace System
} // namespace TightZone
