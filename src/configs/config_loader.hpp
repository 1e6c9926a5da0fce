#ifndef CONFIG_LOADER_HPP
#define CONFIG_LOADER_HPP

#include <string>
#include <vector>

namespace TightZone {
namespace Config {

struct SystemConfig;

constexpr const char* DEFAULT_CONFIG_DIRECTORY = "config";
constexpr const char* CONFIG_DIRECTORY_ENVIRONMENT_VARIABLE = "TIGHTZONE_CONFIG_DIR";
constexpr const char* API_ENDPOINTS_CONFIG_FILENAME = "api_endpoints_config.csv";
constexpr const char* SCREENER_CONFIG_FILENAME = "screener_config.csv";

// Load key,value CSV into SystemConfig. Unknown keys are ignored. Returns false with a message on failure.
bool load_config_from_csv(SystemConfig& cfg, const std::string& csv_path, std::string& error_message);

// Command-line value first, then TIGHTZONE_CONFIG_DIR, then "config".
std::string resolve_config_directory(const std::string& command_line_directory);

// Load both CSV files from config_directory. Returns 0 on success, 1 on failure.
int load_system_config(SystemConfig& config, const std::string& config_directory, std::string& error_message);

// Validate system configuration. Returns true if valid, false otherwise with error message.
bool validate_config(const SystemConfig& config, std::string& error_message);

// Splits "a|b|c" into its non-empty, trimmed parts.
std::vector<std::string> split_column_list(const std::string& column_list_string);

} // namespace Config
} // namespace TightZone

#endif // CONFIG_LOADER_HPP
