#pragma once

#include <optional>
#include <string>
#include <string_view>

namespace netdiag::probe {

enum class CommandKind {
  kLatencyProbe,
  kRouteTrace,
};

// Wire names used by the control server: "ping" and "tracert".
std::string_view ToWireName(CommandKind kind);

// Returns nullopt for any name the agent does not execute.
std::optional<CommandKind> ParseCommandKind(std::string_view wire_name);

// One command received from the control server. Transient: it lives only until
// its result has been handed to the session for sending.
struct DiagnosticCommand {
  CommandKind kind = CommandKind::kLatencyProbe;
  std::string target;
};

} // namespace netdiag::probe
