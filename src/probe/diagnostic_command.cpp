#include "probe/diagnostic_command.hpp"

namespace netdiag::probe {

namespace {

constexpr std::string_view kPingName = "ping";
constexpr std::string_view kTracertName = "tracert";

} // namespace

std::string_view ToWireName(const CommandKind kind) {
  switch (kind) {
  case CommandKind::kLatencyProbe:
    return kPingName;
  case CommandKind::kRouteTrace:
    return kTracertName;
  }
  return kPingName;
}

std::optional<CommandKind> ParseCommandKind(const std::string_view wire_name) {
  if (wire_name == kPingName) {
    return CommandKind::kLatencyProbe;
  }
  if (wire_name == kTracertName) {
    return CommandKind::kRouteTrace;
  }
  return std::nullopt;
}

} // namespace netdiag::probe
