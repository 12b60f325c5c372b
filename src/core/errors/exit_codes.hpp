#pragma once

namespace netdiag::core::errors {

// Stable process-exit contract for service managers and wrappers.
//
// The first three values preserve conventional meanings used by scripts:
// - 0 success
// - 1 generic command failure
// - 2 usage/argument failure
//
// The rest classify startup failures that a restart loop cannot fix, so a
// supervisor can stop respawning the agent.
enum class ExitCode : int {
  kSuccess = 0,
  kFailure = 1,
  kUsage = 2,
  kConfigInvalid = 10,
  kIdentityMissing = 11,
};

constexpr int ToInt(ExitCode code) {
  return static_cast<int>(code);
}

} // namespace netdiag::core::errors
