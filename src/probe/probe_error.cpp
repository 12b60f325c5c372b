#include "probe/probe_error.hpp"

#include <utility>

namespace netdiag::probe {

std::string_view ToStableErrorCode(const ProbeErrorCode code) {
  switch (code) {
  case ProbeErrorCode::kUnsupportedCommand:
    return "PROBE_UNSUPPORTED_COMMAND";
  case ProbeErrorCode::kInvalidTarget:
    return "PROBE_INVALID_TARGET";
  case ProbeErrorCode::kLaunchFailed:
    return "PROBE_LAUNCH_FAILED";
  case ProbeErrorCode::kStderrOutput:
    return "PROBE_STDERR_OUTPUT";
  case ProbeErrorCode::kParseFailed:
    return "PROBE_PARSE_FAILED";
  }
  return "PROBE_LAUNCH_FAILED";
}

ProbeOutcome ProbeOutcome::Success(std::string payload_json) {
  ProbeOutcome outcome;
  outcome.payload_json = std::move(payload_json);
  return outcome;
}

ProbeOutcome ProbeOutcome::Failure(const ProbeErrorCode code, std::string message) {
  ProbeOutcome outcome;
  outcome.error = ProbeError{.code = code, .message = std::move(message)};
  return outcome;
}

std::string ToWireString(const ProbeOutcome& outcome) {
  if (outcome.payload_json.has_value()) {
    return *outcome.payload_json;
  }
  const std::string message = outcome.error.has_value() ? outcome.error->message : "unknown";
  return std::string(kWireErrorPrefix) + " " + message;
}

} // namespace netdiag::probe
