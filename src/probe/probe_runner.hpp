#pragma once

#include "probe/diagnostic_command.hpp"
#include "probe/output_parser.hpp"
#include "probe/probe_error.hpp"
#include "probe/process_launcher.hpp"
#include "probe/text_decode.hpp"

#include <string>
#include <string_view>
#include <vector>

namespace netdiag::core::logging {
class Logger;
}

namespace netdiag::probe {

// Fixed tool parameters. The parser's patterns assume exactly this output
// shape, so these are not configurable.
constexpr int kLatencyProbePacketCount = 30;
constexpr int kLatencyProbePacketSizeBytes = 1200;

// Builds the platform's command line for one probe:
//   Windows: ping -n 30 -l 1200 <target> | tracert /4 <target>
//   POSIX:   ping -c 30 -s 1200 <target> | traceroute -4 <target>
std::vector<std::string> BuildProbeArgv(CommandKind kind, const std::string& target);

// Accepts hostnames and IPv4/IPv6 literals. Rejects empty targets, anything
// starting with '-' (it would be read as a tool option) and shell or
// whitespace characters.
bool IsValidProbeTarget(std::string_view target);

struct ProbeRunnerOptions {
  TextEncoding output_encoding = PlatformOutputEncoding();
  RouteTraceParseOptions route_trace = PlatformRouteTraceOptions();
};

// Executes one external diagnostic per call and turns it into a ProbeOutcome.
// Run never throws: every launch, decoding or parsing fault becomes a
// ProbeError. Safe to call from several worker threads at once as long as the
// launcher is.
class ProbeRunner {
public:
  ProbeRunner(IProcessLauncher& launcher,
              core::logging::Logger& logger,
              ProbeRunnerOptions options = {});

  // `command` is the wire name ("ping" or "tracert"); anything else fails fast
  // with kUnsupportedCommand.
  ProbeOutcome Run(std::string_view command, const std::string& target);

  ProbeOutcome Run(const DiagnosticCommand& command);

  const ProbeRunnerOptions& options() const {
    return options_;
  }

private:
  ProbeOutcome Execute(CommandKind kind, const std::string& target);
  ProbeOutcome ParseOutput(CommandKind kind, const std::string& target,
                           const std::string& text);

  IProcessLauncher& launcher_;
  core::logging::Logger& logger_;
  ProbeRunnerOptions options_;
};

} // namespace netdiag::probe
