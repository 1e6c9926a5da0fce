#include "logging_thread_logs.hpp"
#include "logging/logger/async_logger.hpp"
#include <iostream>

using namespace TightZone::Logging;

// The logging thread cannot log through its own queue while failing, so these go straight to stderr.

void LoggingThreadLogs::log_thread_exception(const std::string& error_message) {
    std::cerr << "LoggingThread exception: " << error_message << std::endl;
}

void LoggingThreadLogs::log_log_file_open_failure(const std::string& log_file_path) {
    std::cerr << "LoggingThread could not open log file " << log_file_path << ", console only" << std::endl;
}

void LoggingThreadLogs::log_loop_iteration_exception(const std::string& error_message) {
    std::cerr << "LoggingThread loop iteration exception: " << error_message << std::endl;
}
