#pragma once

#include "core/logging/logger.hpp"

#include <filesystem>
#include <optional>
#include <string_view>

namespace netdiag::cli {

inline constexpr std::string_view kAgentVersion = "0.1.0";

// Options for `netdiag-agent run`. Command-line values win over the config file.
struct RunOptions {
  std::filesystem::path config_path;
  std::optional<core::logging::LogLevel> log_level;
  std::optional<std::filesystem::path> log_file;
  // argv[0]; used for autostart registration when the platform cannot report
  // the running binary itself.
  std::filesystem::path invoked_as;
};

// Loads the config and runs the agent session until it is stopped.
int ExecuteAgentRun(const RunOptions& options);

// Routes `netdiag-agent` subcommands and returns process exit codes with a
// stable contract for service managers:
//   0  => success
//   1  => command failed after valid invocation
//   2  => usage error (unknown command / invalid args)
//   10 => config file invalid
//   11 => agreement id missing at registration
// With no subcommand the agent runs with the default config path.
int Dispatch(int argc, char** argv);

} // namespace netdiag::cli
