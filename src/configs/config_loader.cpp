#include "config_loader.hpp"
#include "system_config.hpp"
#include <algorithm>
#include <cstdlib>
#include <fstream>
#include <sstream>
#include <stdexcept>

namespace TightZone {
namespace Config {

namespace {
    inline std::string trim(const std::string& s) {
        const char* ws = " \t\r\n";
        auto b = s.find_first_not_of(ws);
        auto e = s.find_last_not_of(ws);
        if (b == std::string::npos) return "";
        return s.substr(b, e - b + 1);
    }

    inline bool to_bool(const std::string& v) {
        std::string s = v; std::transform(s.begin(), s.end(), s.begin(), ::tolower);
        return s == "1" || s == "true" || s == "yes";
    }

    // Returns true when the key belonged to a provider section.
    bool apply_provider_key(ApiProviderConfig& provider_config, const std::string& field, const std::string& value) {
        if (field == "base_url") provider_config.base_url = value;
        else if (field == "endpoint") provider_config.endpoint = value;
        else if (field == "user_agent") provider_config.user_agent = value;
        else if (field == "retry_count") provider_config.retry_count = std::stoi(value);
        else if (field == "timeout_seconds") provider_config.timeout_seconds = std::stoi(value);
        else if (field == "enable_ssl_verification") provider_config.enable_ssl_verification = to_bool(value);
        else if (field == "rate_limit_delay_ms") provider_config.rate_limit_delay_ms = std::stoi(value);
        else return false;
        return true;
    }

    void apply_config_key(SystemConfig& cfg, const std::string& key, const std::string& value) {
        // API providers
        if (key.rfind("scanner.", 0) == 0) {
            apply_provider_key(cfg.api.scanner, key.substr(8), value);
            return;
        }
        if (key.rfind("history.", 0) == 0) {
            std::string field = key.substr(8);
            if (field == "period") cfg.zones.history_period = value;
            else if (field == "interval") cfg.zones.history_interval = value;
            else if (field == "max_concurrent_fetches") cfg.zones.max_concurrent_fetches = std::stoi(value);
            else apply_provider_key(cfg.api.history, field, value);
            return;
        }

        // Screener
        if (key == "screener.market") cfg.screener.market = value;
        else if (key == "screener.page_size") cfg.screener.page_size = std::stoi(value);
        else if (key == "screener.sort_by") cfg.screener.sort_by = value;
        else if (key == "screener.sort_order") cfg.screener.sort_order = value;
        else if (key == "screener.language") cfg.screener.language = value;
        else if (key == "screener.columns") cfg.screener.columns = split_column_list(value);
        else if (key == "screener.apply_vcp_filter") cfg.screener.apply_vcp_filter = to_bool(value);

        // Zones
        else if (key == "zones.segment_count") cfg.zones.segment_count = std::stoi(value);

        // Logging
        else if (key == "logging.log_file") cfg.logging.log_file = value;
        else if (key == "logging.console_enabled") cfg.logging.console_enabled = to_bool(value);
        else if (key == "logging.poll_interval_ms") cfg.logging.poll_interval_ms = std::stoi(value);
    }
}

std::vector<std::string> split_column_list(const std::string& column_list_string) {
    std::vector<std::string> column_names;
    std::stringstream column_stream(column_list_string);
    std::string column_name;
    while (std::getline(column_stream, column_name, '|')) {
        column_name = trim(column_name);
        if (!column_name.empty()) {
            column_names.push_back(column_name);
        }
    }
    return column_names;
}

bool load_config_from_csv(SystemConfig& cfg, const std::string& csv_path, std::string& error_message) {
    std::ifstream in(csv_path);
    if (!in.is_open()) {
        error_message = "Cannot open config file " + csv_path;
        return false;
    }
    std::string line;
    int line_number = 0;
    while (std::getline(in, line)) {
        ++line_number;
        line = trim(line);
        if (line.empty() || line[0] == '#') continue; // Skip comments and empty lines
        std::stringstream ss(line);
        std::string key, value;
        if (!std::getline(ss, key, ',')) continue;
        if (!std::getline(ss, value)) value.clear();
        key = trim(key); value = trim(value);

        try {
            apply_config_key(cfg, key, value);
        } catch (const std::exception& conversion_exception_error) {
            error_message = csv_path + ":" + std::to_string(line_number) + ": invalid value '" + value +
                            "' for " + key + " (" + conversion_exception_error.what() + ")";
            return false;
        }
    }
    return true;
}

std::string resolve_config_directory(const std::string& command_line_directory) {
    if (!command_line_directory.empty()) {
        return command_line_directory;
    }
    const char* environment_directory = std::getenv(CONFIG_DIRECTORY_ENVIRONMENT_VARIABLE);
    if (environment_directory && *environment_directory) {
        return environment_directory;
    }
    return DEFAULT_CONFIG_DIRECTORY;
}

int load_system_config(SystemConfig& config, const std::string& config_directory, std::string& error_message) {
    std::string api_config_path = config_directory + "/" + API_ENDPOINTS_CONFIG_FILENAME;
    if (!load_config_from_csv(config, api_config_path, error_message)) {
        return 1;
    }

    std::string screener_config_path = config_directory + "/" + SCREENER_CONFIG_FILENAME;
    if (!load_config_from_csv(config, screener_config_path, error_message)) {
        return 1;
    }

    return 0;
}

bool validate_config(const SystemConfig& config, std::string& error_message) {
    if (config.api.scanner.base_url.empty() || config.api.history.base_url.empty()) {
        error_message = "API base URLs missing (scanner.base_url / history.base_url)";
        return false;
    }
    if (config.api.scanner.timeout_seconds < 1 || config.api.history.timeout_seconds < 1) {
        error_message = "timeout_seconds must be >= 1";
        return false;
    }
    if (config.api.scanner.retry_count < 1 || config.api.history.retry_count < 1) {
        error_message = "retry_count must be >= 1";
        return false;
    }
    if (trim(config.screener.market).empty()) {
        error_message = "screener.market is empty";
        return false;
    }
    if (config.screener.page_size < 1) {
        error_message = "screener.page_size must be >= 1";
        return false;
    }
    if (config.screener.sort_order != "asc" && config.screener.sort_order != "desc") {
        error_message = "screener.sort_order must be 'asc' or 'desc'";
        return false;
    }
    if (config.zones.segment_count < 1) {
        error_message = "zones.segment_count must be >= 1";
        return false;
    }
    if (config.zones.max_concurrent_fetches < 1) {
        error_message = "history.max_concurrent_fetches must be >= 1";
        return false;
    }
    return true;
}

} // namespace Config
} // namespace TightZone
