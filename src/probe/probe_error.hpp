#pragma once

#include <optional>
#include <string>
#include <string_view>

namespace netdiag::probe {

// Stable classification for probe failures. The code travels in log fields;
// the control server only ever sees the human-readable message.
enum class ProbeErrorCode {
  kUnsupportedCommand,
  kInvalidTarget,
  kLaunchFailed,
  kStderrOutput,
  kParseFailed,
};

std::string_view ToStableErrorCode(ProbeErrorCode code);

struct ProbeError {
  ProbeErrorCode code = ProbeErrorCode::kLaunchFailed;
  std::string message;
};

// Prefix every error result carries on the wire.
inline constexpr std::string_view kWireErrorPrefix = "Error:";

// Exactly one of `payload_json` and `error` is set.
struct ProbeOutcome {
  std::optional<std::string> payload_json;
  std::optional<ProbeError> error;

  static ProbeOutcome Success(std::string payload_json);
  static ProbeOutcome Failure(ProbeErrorCode code, std::string message);

  bool ok() const {
    return payload_json.has_value();
  }
};

// Renders the outcome for the `result` field of a result message:
// the JSON payload as-is, or "Error: <message>".
std::string ToWireString(const ProbeOutcome& outcome);

} // namespace netdiag::probe
