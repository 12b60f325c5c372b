#include "../common/assertions.hpp"
#include "../common/probe_fixtures.hpp"
#include "core/logging/logger.hpp"
#include "probe/probe_runner.hpp"

#include <sstream>
#include <string>

namespace {

using netdiag::tests::common::AssertContains;
using netdiag::tests::common::AssertEqual;
using netdiag::tests::common::Fail;
using netdiag::tests::common::ScriptedProcessLauncher;
using netdiag::tests::common::StdoutOnly;

constexpr const char* kPingReport =
    "Ping statistics for 10.0.0.1:\r\n"
    "    Packets: Sent = 30, Received = 30, Lost = 0 (0% loss),\r\n"
    "Approximate round trip times in milli-seconds:\r\n"
    "    Minimum = 10ms, Maximum = 22ms, Average = 15ms\r\n";

constexpr const char* kTraceReport =
    "Tracing route to 10.0.0.1\r\n"
    "over a maximum of 30 hops:\r\n"
    "\r\n"
    "  1    10 ms    12 ms    11 ms  10.0.0.1\r\n";

std::string ProgramFor(netdiag::probe::CommandKind kind) {
  return netdiag::probe::BuildProbeArgv(kind, "10.0.0.1").front();
}

netdiag::probe::ProbeRunnerOptions WindowsStyleOptions() {
  netdiag::probe::ProbeRunnerOptions options;
  options.output_encoding = netdiag::probe::TextEncoding::kUtf8;
  options.route_trace = netdiag::probe::RouteTraceParseOptions{};
  return options;
}

} // namespace

int main() {
  using netdiag::probe::CommandKind;
  using netdiag::probe::ProbeErrorCode;
  using netdiag::probe::ProbeOutcome;
  using netdiag::probe::ToWireString;

  std::ostringstream log_output;
  netdiag::core::logging::Logger logger(netdiag::core::logging::LogLevel::kDebug, log_output);

  {
    // Fixed invocation: 30 packets of 1200 bytes, IPv4-only trace.
    const auto ping_argv = netdiag::probe::BuildProbeArgv(CommandKind::kLatencyProbe, "host");
    if (ping_argv.size() != 6U || ping_argv[2] != "30" || ping_argv[4] != "1200" ||
        ping_argv[5] != "host") {
      Fail("latency probe argv does not match the fixed invocation");
    }
    const auto trace_argv = netdiag::probe::BuildProbeArgv(CommandKind::kRouteTrace, "host");
    if (trace_argv.size() != 3U || trace_argv[2] != "host") {
      Fail("route trace argv does not match the fixed invocation");
    }
  }

  {
    ScriptedProcessLauncher launcher;
    launcher.Script(ProgramFor(CommandKind::kLatencyProbe), StdoutOnly(kPingReport));
    launcher.Script(ProgramFor(CommandKind::kRouteTrace), StdoutOnly(kTraceReport));
    netdiag::probe::ProbeRunner runner(launcher, logger, WindowsStyleOptions());

    const ProbeOutcome ping = runner.Run("ping", "10.0.0.1");
    if (!ping.ok()) {
      Fail("expected ping to succeed");
    }
    AssertEqual(ToWireString(ping), R"({"packet_loss":0,"min_rtt":10,"avg_rtt":15,"max_rtt":22})");

    const ProbeOutcome trace = runner.Run("tracert", "10.0.0.1");
    AssertEqual(ToWireString(trace),
                R"([{"hop":1,"ip":"10.0.0.1","min_rtt":10,"avg_rtt":11,"max_rtt":12}])");

    const auto invocations = launcher.invocations();
    if (invocations.size() != 2U || invocations[0].back() != "10.0.0.1") {
      Fail("expected one launch per probe with the target as the last argument");
    }
  }

  {
    // Any stderr output fails the probe and is reported verbatim.
    ScriptedProcessLauncher launcher;
    netdiag::probe::ProcessCapture capture = StdoutOnly(kPingReport);
    capture.stderr_bytes = "ping: sendmsg: Operation not permitted";
    launcher.Script(ProgramFor(CommandKind::kLatencyProbe), capture);
    netdiag::probe::ProbeRunner runner(launcher, logger, WindowsStyleOptions());

    const ProbeOutcome outcome = runner.Run("ping", "10.0.0.1");
    if (outcome.ok() || outcome.error->code != ProbeErrorCode::kStderrOutput) {
      Fail("expected stderr output to fail the probe");
    }
    AssertEqual(ToWireString(outcome), "Error: ping: sendmsg: Operation not permitted");
  }

  {
    // Unparseable stdout reports a fixed message per command kind.
    ScriptedProcessLauncher launcher;
    launcher.Script(ProgramFor(CommandKind::kLatencyProbe),
                    StdoutOnly("Ping request could not find host nosuchhost."));
    netdiag::probe::ProbeRunner runner(launcher, logger, WindowsStyleOptions());

    const ProbeOutcome outcome = runner.Run("ping", "nosuchhost");
    AssertEqual(ToWireString(outcome), "Error: Could not parse ping output");
    if (outcome.error->code != ProbeErrorCode::kParseFailed) {
      Fail("expected kParseFailed");
    }
  }

  {
    // Rejected commands and targets never reach the launcher.
    ScriptedProcessLauncher launcher;
    netdiag::probe::ProbeRunner runner(launcher, logger, WindowsStyleOptions());

    const ProbeOutcome unsupported = runner.Run("nslookup", "10.0.0.1");
    AssertEqual(ToWireString(unsupported), "Error: Unsupported command: nslookup");
    if (unsupported.error->code != ProbeErrorCode::kUnsupportedCommand) {
      Fail("expected kUnsupportedCommand");
    }

    for (const char* bad_target : {"", "-f", "10.0.0.1; reboot", "a b"}) {
      const ProbeOutcome invalid = runner.Run("ping", bad_target);
      if (invalid.ok() || invalid.error->code != ProbeErrorCode::kInvalidTarget) {
        Fail(std::string("expected invalid target for: ") + bad_target);
      }
      AssertContains(ToWireString(invalid), "Error: Invalid target");
    }
    if (!launcher.invocations().empty()) {
      Fail("rejected probes must not launch a process");
    }
  }

  {
    ScriptedProcessLauncher launcher;
    launcher.FailLaunch(ProgramFor(CommandKind::kRouteTrace), "traceroute: not found");
    netdiag::probe::ProbeRunner runner(launcher, logger, WindowsStyleOptions());

    const ProbeOutcome outcome = runner.Run("tracert", "example.net");
    AssertEqual(ToWireString(outcome), "Error: traceroute: not found");
    if (outcome.error->code != ProbeErrorCode::kLaunchFailed) {
      Fail("expected kLaunchFailed");
    }
  }

  const std::string logs = log_output.str();
  AssertContains(logs, "msg=\"probe started\"");
  AssertContains(logs, "error_code=\"PROBE_STDERR_OUTPUT\"");
  AssertContains(logs, "error_code=\"PROBE_PARSE_FAILED\"");
  AssertContains(logs, "raw_output=\"Ping request could not find host nosuchhost.\"");
  return 0;
}
