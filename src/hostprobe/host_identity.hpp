#pragma once

#include <string>

namespace netdiag::hostprobe {

inline constexpr const char* kUnknownHostField = "unknown";

// What the agent tells the control server about the machine it runs on.
struct HostIdentity {
  // OS family as `uname -s` spells it: "Linux", "Darwin" or "Windows".
  std::string os_name{kUnknownHostField};
  std::string hostname{kUnknownHostField};
};

// Best-effort; fields that cannot be probed stay "unknown".
HostIdentity CollectHostIdentity();

} // namespace netdiag::hostprobe
