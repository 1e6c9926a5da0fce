#ifndef LOGGING_THREAD_LOGS_HPP
#define LOGGING_THREAD_LOGS_HPP

#include <string>

namespace TightZone {
namespace Logging {

class LoggingThreadLogs {
public:
    // Thread lifecycle logging
    static void log_thread_exception(const std::string& error_message);
    static void log_log_file_open_failure(const std::string& log_file_path);

    // Loop logging
    static void log_loop_iteration_exception(const std::string& error_message);
};

} // namespace Logging
} // namespace TightZone

#endif // LOGGING_THREAD_LOGS_HPP
