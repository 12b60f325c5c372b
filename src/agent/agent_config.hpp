#pragma once

#include "agent/locality_table.hpp"
#include "core/logging/logger.hpp"
#include "probe/probe_runner.hpp"

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <string>
#include <string_view>

namespace netdiag::agent {

inline constexpr std::string_view kDefaultConfigFileName = "config.json";
inline constexpr std::string_view kDefaultServerUrl = "ws://ort.chrsnv.ru:8765";
inline constexpr std::string_view kDefaultLogFileName = "logs.txt";

constexpr std::uint32_t kDefaultMaxConcurrentProbes = 4U;
constexpr std::uint32_t kMaxConcurrentProbesLimit = 64U;
constexpr std::chrono::seconds kDefaultReconnectDelay{5};

// Everything the agent reads from its config file, plus the derived city.
//
// Only `agreement_id`, `server_url` and `autostart` appear in a freshly
// written file; the remaining keys are optional tuning knobs.
struct AgentConfig {
  std::string agreement_id;
  // Derived from `agreement_id` through the locality table; never read from disk.
  std::string city{kUndefinedLocality};
  std::string server_url{kDefaultServerUrl};
  bool autostart = true;
  std::uint32_t max_concurrent_probes = kDefaultMaxConcurrentProbes;
  std::chrono::seconds reconnect_delay = kDefaultReconnectDelay;
  core::logging::LogLevel log_level = core::logging::LogLevel::kInfo;
  // Empty disables the file mirror. Relative paths resolve against the
  // directory holding the config file.
  std::filesystem::path log_file{std::string(kDefaultLogFileName)};
  probe::ProbeRunnerOptions probe;
};

// Parses config JSON text. Unknown keys are ignored; known keys with a wrong
// type or out-of-range value are errors.
bool ParseAgentConfig(std::string_view json_text,
                      const LocalityTable& localities,
                      AgentConfig& config,
                      std::string& error);

// Writes the default config (empty agreement id, default server, autostart on).
bool WriteDefaultAgentConfig(const std::filesystem::path& path, std::string& error);

// Reads `path`, writing the default file first when it does not exist.
// `created` reports whether the default file was written on this call.
bool LoadOrCreateAgentConfig(const std::filesystem::path& path,
                             const LocalityTable& localities,
                             AgentConfig& config,
                             bool& created,
                             std::string& error);

} // namespace netdiag::agent
