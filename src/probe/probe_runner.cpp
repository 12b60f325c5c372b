#include "probe/probe_runner.hpp"

#include "core/logging/logger.hpp"

#include <cctype>
#include <exception>
#include <utility>
#include <variant>

namespace netdiag::probe {

namespace {

std::string_view ParseFailureMessage(const CommandKind kind) {
  return kind == CommandKind::kLatencyProbe ? "Could not parse ping output"
                                            : "Could not parse tracert output";
}

} // namespace

std::vector<std::string> BuildProbeArgv(const CommandKind kind, const std::string& target) {
  const std::string count = std::to_string(kLatencyProbePacketCount);
  const std::string size = std::to_string(kLatencyProbePacketSizeBytes);
  switch (kind) {
  case CommandKind::kLatencyProbe:
#if defined(_WIN32)
    return {"ping", "-n", count, "-l", size, target};
#else
    return {"ping", "-c", count, "-s", size, target};
#endif
  case CommandKind::kRouteTrace:
#if defined(_WIN32)
    return {"tracert", "/4", target};
#else
    return {"traceroute", "-4", target};
#endif
  }
  return {};
}

bool IsValidProbeTarget(const std::string_view target) {
  if (target.empty() || target.size() > 253U || target.front() == '-') {
    return false;
  }
  for (const char c : target) {
    const auto u = static_cast<unsigned char>(c);
    if (std::isalnum(u) == 0 && c != '.' && c != '-' && c != '_' && c != ':') {
      return false;
    }
  }
  return true;
}

ProbeRunner::ProbeRunner(IProcessLauncher& launcher,
                         core::logging::Logger& logger,
                         ProbeRunnerOptions options)
    : launcher_(launcher), logger_(logger), options_(std::move(options)) {}

ProbeOutcome ProbeRunner::Run(const DiagnosticCommand& command) {
  return Run(ToWireName(command.kind), command.target);
}

ProbeOutcome ProbeRunner::Run(const std::string_view command, const std::string& target) {
  const std::optional<CommandKind> kind = ParseCommandKind(command);
  if (!kind.has_value()) {
    const ProbeErrorCode code = ProbeErrorCode::kUnsupportedCommand;
    logger_.Error("probe rejected",
                  {{"command", command},
                   {"target", target},
                   {"error_code", ToStableErrorCode(code)}});
    return ProbeOutcome::Failure(code, "Unsupported command: " + std::string(command));
  }
  if (!IsValidProbeTarget(target)) {
    const ProbeErrorCode code = ProbeErrorCode::kInvalidTarget;
    logger_.Error("probe rejected",
                  {{"command", command},
                   {"target", target},
                   {"error_code", ToStableErrorCode(code)}});
    return ProbeOutcome::Failure(code, "Invalid target: " + target);
  }

  try {
    return Execute(*kind, target);
  } catch (const std::exception& e) {
    const ProbeErrorCode code = ProbeErrorCode::kLaunchFailed;
    logger_.Error("probe execution failed",
                  {{"command", command},
                   {"target", target},
                   {"error_code", ToStableErrorCode(code)},
                   {"error", e.what()}});
    return ProbeOutcome::Failure(code, e.what());
  }
}

ProbeOutcome ProbeRunner::Execute(const CommandKind kind, const std::string& target) {
  const std::string_view command = ToWireName(kind);
  logger_.Info("probe started", {{"command", command}, {"target", target}});

  ProcessCapture capture;
  std::string launch_error;
  if (!launcher_.Run(BuildProbeArgv(kind, target), capture, launch_error)) {
    const ProbeErrorCode code = ProbeErrorCode::kLaunchFailed;
    logger_.Error("probe execution failed",
                  {{"command", command},
                   {"target", target},
                   {"error_code", ToStableErrorCode(code)},
                   {"error", launch_error}});
    return ProbeOutcome::Failure(code, launch_error);
  }

  // Any stderr text fails the whole probe, even when stdout looks complete.
  if (!capture.stderr_bytes.empty()) {
    const std::string stderr_text =
        DecodeProcessOutput(capture.stderr_bytes, options_.output_encoding);
    const ProbeErrorCode code = ProbeErrorCode::kStderrOutput;
    logger_.Error("probe wrote to stderr",
                  {{"command", command},
                   {"target", target},
                   {"error_code", ToStableErrorCode(code)},
                   {"exit_code", std::to_string(capture.exit_code)},
                   {"stderr", stderr_text}});
    return ProbeOutcome::Failure(code, stderr_text);
  }

  const std::string stdout_text =
      DecodeProcessOutput(capture.stdout_bytes, options_.output_encoding);
  logger_.Info("probe finished",
               {{"command", command},
                {"target", target},
                {"exit_code", std::to_string(capture.exit_code)}});
  return ParseOutput(kind, target, stdout_text);
}

ProbeOutcome ProbeRunner::ParseOutput(const CommandKind kind, const std::string& target,
                                      const std::string& text) {
  std::optional<ParseFailure> failure;
  if (kind == CommandKind::kLatencyProbe) {
    const LatencyParseOutcome parsed = ParseLatencyOutput(text);
    if (const auto* result = std::get_if<LatencyResult>(&parsed)) {
      return ProbeOutcome::Success(ToJson(*result));
    }
    failure = std::get<ParseFailure>(parsed);
  } else {
    const RouteTraceParseOutcome parsed = ParseRouteTraceOutput(text, options_.route_trace);
    if (const auto* hops = std::get_if<std::vector<RouteHop>>(&parsed)) {
      return ProbeOutcome::Success(ToJson(*hops));
    }
    failure = std::get<ParseFailure>(parsed);
  }

  const ProbeErrorCode code = ProbeErrorCode::kParseFailed;
  logger_.Warn("probe output not recognized",
               {{"command", ToWireName(kind)},
                {"target", target},
                {"error_code", ToStableErrorCode(code)},
                {"reason", failure->reason},
                {"raw_output", failure->raw_text}});
  return ProbeOutcome::Failure(code, std::string(ParseFailureMessage(kind)));
}

} // namespace netdiag::probe
