#include "system_logs.hpp"
#include "logging/logging_macros.hpp"
#include "configs/config_loader.hpp"

namespace TightZone {
namespace Logging {

void SystemLogs::log_startup_configuration(const std::string& config_directory, const Config::SystemConfig& config) {
    LOG_STARTUP_SECTION_HEADER("TIGHTZONE STARTUP");
    LOG_STARTUP_CONTENT("Config directory: " + config_directory);
    LOG_STARTUP_CONTENT("Scanner: " + config.api.scanner.base_url + config.api.scanner.endpoint);
    LOG_STARTUP_CONTENT("History: " + config.api.history.base_url + config.api.history.endpoint);
    LOG_STARTUP_CONTENT("Market: " + config.screener.market + ", page size " + std::to_string(config.screener.page_size) +
                        ", VCP filter " + (config.screener.apply_vcp_filter ? "on" : "off"));
    LOG_STARTUP_CONTENT("Log file: " + (config.logging.log_file.empty() ? std::string("(console only)") : config.logging.log_file));
    LOG_STARTUP_SEPARATOR();
}

void SystemLogs::log_system_startup_error(const std::string& error_message) {
    log_message(std::string("ERROR: System startup error: ") + error_message, "");
}

void SystemLogs::log_shutdown_requested() {
    log_message("WARNING: Shutdown requested, cancelling scan", "");
}

void SystemLogs::log_shutdown_complete(int exit_code) {
    log_message("Shutdown complete (exit " + std::to_string(exit_code) + ")", "");
}

void SystemLogs::log_fatal_error(const std::string& error_message) {
    log_message(std::string("FATAL: ") + error_message, "");
}

} // namespace Logging
} // namespace TightZone
