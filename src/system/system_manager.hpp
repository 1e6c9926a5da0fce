#ifndef SYSTEM_MANAGER_HPP
#define SYSTEM_MANAGER_HPP

#include <memory>
#include <string>
#include "cli/cli_options.hpp"
#include "system/system_state.hpp"

namespace TightZone {
namespace System {

constexpr int EXIT_CODE_SUCCESS = 0;
constexpr int EXIT_CODE_FAILURE = 1;
constexpr int EXIT_CODE_CANCELLED = 130;

// Loads and validates configuration, installs logging and starts the logging thread.
std::unique_ptr<SystemState> initialize(const std::string& config_directory_override);

// Runs the scan described by cli_options and prints results to stdout. Returns the exit code.
int run(SystemState& system_state, const TightZone::Cli::CliOptions& cli_options);

// Stops and joins the logging thread after a final flush.
void shutdown(SystemState& system_state);

} // namespace System
} // namespace TightZone

#endif // SYSTEM_MANAGER_HPP
