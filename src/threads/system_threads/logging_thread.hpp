#ifndef LOGGING_THREAD_HPP
#define LOGGING_THREAD_HPP

#include <memory>
#include "logging/logger/async_logger.hpp"
#include "configs/logging_config.hpp"

namespace TightZone {
namespace Threads {

class LoggingThread {
public:
    LoggingThread(std::shared_ptr<TightZone::Logging::AsyncLogger> logger,
                  TightZone::Logging::LoggingContext& parent_logging_context,
                  const TightZone::Config::LoggingConfig& logging_config)
        : logger_ptr(logger), logging_context(parent_logging_context), config(logging_config) {}

    void operator()();

private:
    std::shared_ptr<TightZone::Logging::AsyncLogger> logger_ptr;
    TightZone::Logging::LoggingContext& logging_context;
    const TightZone::Config::LoggingConfig& config;

    void setup_logging_thread();
    void execute_logging_processing_loop();
};

} // namespace Threads
} // namespace TightZone

#endif // LOGGING_THREAD_HPP
