// main.cpp
#include "system/system_manager.hpp"
#include "cli/cli_options.hpp"
#include "logging/logs/system_logs.hpp"
#include "screener/screener_errors.hpp"
#include <curl/curl.h>
#include <iostream>
#include <csignal>
#include <atomic>
#include <memory>

using namespace TightZone::System;

// =============================================================================
// ENCAPSULATED SHUTDOWN HANDLER - NO GLOBAL VARIABLES
// =============================================================================
class ShutdownHandler {
private:
    std::atomic<bool> shutdown_requested_flag{false};
    std::atomic<SystemState*> system_state_pointer{nullptr};

public:
    static ShutdownHandler& get_instance() {
        static ShutdownHandler instance;
        return instance;
    }

    void set_system_state(SystemState* state) {
        system_state_pointer.store(state);
    }

    bool is_shutdown_requested() const {
        return shutdown_requested_flag.load();
    }

    void signal_handler(int signal_number) {
        if (signal_number == SIGINT || signal_number == SIGTERM) {
            shutdown_requested_flag.store(true);
            SystemState* state = system_state_pointer.load();
            if (state) {
                state->shutdown_requested.store(true);
                state->cancellation_token.cancel();
            }
        }
    }

private:
    ShutdownHandler() = default;
    ShutdownHandler(const ShutdownHandler&) = delete;
    ShutdownHandler& operator=(const ShutdownHandler&) = delete;
};

// =============================================================================
// STATIC SIGNAL HANDLER FUNCTION
// =============================================================================
static void signal_handler(int signal_number) {
    ShutdownHandler::get_instance().signal_handler(signal_number);
}

// Owns libcurl's process-wide state for the lifetime of main.
class CurlGlobalGuard {
public:
    CurlGlobalGuard() {
        if (curl_global_init(CURL_GLOBAL_DEFAULT) != CURLE_OK) {
            throw std::runtime_error("curl_global_init failed");
        }
    }
    ~CurlGlobalGuard() { curl_global_cleanup(); }

    CurlGlobalGuard(const CurlGlobalGuard&) = delete;
    CurlGlobalGuard& operator=(const CurlGlobalGuard&) = delete;
};

// =============================================================================
// MAIN APPLICATION ENTRY POINT
// =============================================================================

int main(int argc, char* argv[]) {
    std::unique_ptr<SystemState> system_state;
    int exit_code = EXIT_CODE_FAILURE;

    try {
        TightZone::Cli::CliOptions cli_options = TightZone::Cli::parse_command_line(argc, argv);
        if (cli_options.show_help) {
            std::cout << cli_options.help_text;
            return EXIT_CODE_SUCCESS;
        }

        CurlGlobalGuard curl_global_guard;

        // Register signal handlers for graceful shutdown
        std::signal(SIGINT, signal_handler);
        std::signal(SIGTERM, signal_handler);

        // Initialize system - handles config loading, validation and logging
        system_state = initialize(cli_options.config_directory);
        ShutdownHandler::get_instance().set_system_state(system_state.get());

        exit_code = run(*system_state, cli_options);
    } catch (const TightZone::Screener::ScanCancelledError& cancelled_error) {
        std::cerr << "Cancelled: " << cancelled_error.what() << std::endl;
        exit_code = EXIT_CODE_CANCELLED;
    } catch (const std::exception& exception_error) {
        if (system_state) {
            TightZone::Logging::SystemLogs::log_fatal_error(exception_error.what());
        }
        std::cerr << "Error: " << exception_error.what() << std::endl;
        exit_code = EXIT_CODE_FAILURE;
    }

    if (system_state) {
        ShutdownHandler::get_instance().set_system_state(nullptr);
        if (ShutdownHandler::get_instance().is_shutdown_requested()) {
            TightZone::Logging::SystemLogs::log_shutdown_requested();
        }
        TightZone::Logging::SystemLogs::log_shutdown_complete(exit_code);
        shutdown(*system_state);
    }
    return exit_code;
}
