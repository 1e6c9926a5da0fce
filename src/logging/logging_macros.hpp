#ifndef LOGGING_MACROS_HPP
#define LOGGING_MACROS_HPP

#include "logging/logger/async_logger.hpp"

// Standard indentation levels
#define LOG_INDENT_L0 ""                    // No indentation
#define LOG_INDENT_L1 "        "            // 8 spaces - Main section level
#define LOG_INDENT_L2 "        |   "        // 8 spaces + |   - Content level

// Section headers and footers
#define LOG_SECTION_HEADER(title) log_message(LOG_INDENT_L1 "+-- " + std::string(title), "")
#define LOG_SECTION_FOOTER() log_message(LOG_INDENT_L1 "+-- ", "")

// Content logging macros
#define LOG_CONTENT(msg) log_message(LOG_INDENT_L2 + std::string(msg), "")

// Startup-specific macros (no indentation for top-level sections)
#define LOG_STARTUP_SECTION_HEADER(title) log_message("+-- " + std::string(title), "")
#define LOG_STARTUP_CONTENT(msg) log_message("|   " + std::string(msg), "")
#define LOG_STARTUP_SEPARATOR() log_message("|", "")

#endif // LOGGING_MACROS_HPP
