#ifndef SYSTEM_LOGS_HPP
#define SYSTEM_LOGS_HPP

#include <string>
#include "configs/system_config.hpp"

namespace TightZone {
namespace Logging {

/**
 * Specialized logging for system management operations.
 * Handles all system-level logging in a consistent format.
 */
class SystemLogs {
public:
    // System startup and shutdown
    static void log_startup_configuration(const std::string& config_directory, const Config::SystemConfig& config);
    static void log_system_startup_error(const std::string& error_message);
    static void log_shutdown_requested();
    static void log_shutdown_complete(int exit_code);
    static void log_fatal_error(const std::string& error_message);
};

} // namespace Logging
} // namespace TightZone

#endif // SYSTEM_LOGS_HPP
