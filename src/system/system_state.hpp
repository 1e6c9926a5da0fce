#ifndef SYSTEM_STATE_HPP
#define SYSTEM_STATE_HPP

#include <atomic>
#include <memory>
#include <string>
#include <thread>
#include "configs/system_config.hpp"
#include "logging/logger/async_logger.hpp"
#include "screener/screener_structures.hpp"

namespace TightZone {
namespace System {

/**
 * @brief Central system state container
 *
 * Owns the loaded configuration, the logging context and thread, and the
 * cancellation token shared with the signal handler.
 */
struct SystemState {
    // =========================================================================
    // CONFIGURATION
    // =========================================================================
    TightZone::Config::SystemConfig config;
    std::string config_directory;

    // =========================================================================
    // LOGGING
    // =========================================================================
    std::shared_ptr<TightZone::Logging::LoggingContext> logging_context;
    std::shared_ptr<TightZone::Logging::AsyncLogger> logger;
    std::thread logger_thread;

    // =========================================================================
    // SYSTEM CONTROL FLAGS
    // =========================================================================
    TightZone::Screener::CancellationToken cancellation_token;  // Cancelled on SIGINT/SIGTERM
    std::atomic<bool> shutdown_requested{false};

    SystemState(const TightZone::Config::SystemConfig& initial, const std::string& directory)
        : config(initial), config_directory(directory) {}

    SystemState(const SystemState&) = delete;
    SystemState& operator=(const SystemState&) = delete;
};

} // namespace System
} // namespace TightZone

#endif // SYSTEM_STATE_HPP
