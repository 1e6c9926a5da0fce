// LoggingConfig.hpp
#ifndef LOGGING_CONFIG_HPP
#define LOGGING_CONFIG_HPP

#include <string>

namespace TightZone {
namespace Config {

struct LoggingConfig {
    std::string log_file;              // Empty disables the log file
    bool console_enabled;              // Mirror log lines to stderr
    int poll_interval_ms;              // Logging thread drain interval

    LoggingConfig() : log_file(""), console_enabled(true), poll_interval_ms(100) {}
};

} // namespace Config
} // namespace TightZone

#endif // LOGGING_CONFIG_HPP
