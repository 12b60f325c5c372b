#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <regex>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace netdiag::probe {

// Sentinel rendered for an unmeasured hop statistic or an unknown hop address.
inline constexpr std::string_view kWildcardMarker = "*";

// Summary of one latency probe. Values are integers in the unit the tool
// prints; they are not normalized across locales.
struct LatencyResult {
  int packet_loss_percent = 0;
  int min_rtt_ms = 0;
  int avg_rtt_ms = 0;
  int max_rtt_ms = 0;
};

// One hop of a route trace. An empty optional statistic is a timed-out hop and
// serializes as the wildcard marker.
struct RouteHop {
  std::uint32_t hop_index = 0;
  std::string address{kWildcardMarker};
  std::optional<double> min_rtt_ms;
  std::optional<double> avg_rtt_ms;
  std::optional<double> max_rtt_ms;
};

// Parse failure with the raw probe text kept for postmortem logging.
struct ParseFailure {
  std::string reason;
  std::string raw_text;
};

using LatencyParseOutcome = std::variant<LatencyResult, ParseFailure>;
using RouteTraceParseOutcome = std::variant<std::vector<RouteHop>, ParseFailure>;

// Patterns for one ping summary format. Each pattern has exactly one capture
// group holding the integer part of its value.
struct LatencyDialect {
  std::string name;
  std::regex packet_loss;
  std::regex min_rtt;
  std::regex avg_rtt;
  std::regex max_rtt;
};

LatencyDialect MakeLatencyDialect(std::string name,
                                  std::string_view packet_loss_pattern,
                                  std::string_view min_rtt_pattern,
                                  std::string_view avg_rtt_pattern,
                                  std::string_view max_rtt_pattern);

// Windows English, Windows Russian and iputils/BSD summaries, in that order.
const std::vector<LatencyDialect>& DefaultLatencyDialects();

// Succeeds only when one dialect yields all four values; a partially matched
// report is a failure, never a partially populated result.
LatencyParseOutcome ParseLatencyOutput(std::string_view text);
LatencyParseOutcome ParseLatencyOutput(std::string_view text,
                                       const std::vector<LatencyDialect>& dialects);

// Column order of one hop line.
enum class HopLineLayout {
  // Windows tracert: `  3    10 ms    12 ms    11 ms  host [10.0.0.1]`
  kAddressLast,
  // traceroute: ` 3  host (10.0.0.1)  10.1 ms  12.0 ms  11.4 ms`
  kAddressFirst,
};

// Banner length of Windows tracert once the output has been trimmed.
constexpr std::size_t kDefaultRouteTraceHeaderLines = 3;

struct RouteTraceParseOptions {
  // Lines dropped before hop parsing starts. nullopt detects the banner by
  // skipping up to the first line that starts with a hop index.
  std::optional<std::size_t> header_lines = kDefaultRouteTraceHeaderLines;
  HopLineLayout layout = HopLineLayout::kAddressLast;
};

// Options matching the route-trace tool the agent launches on this platform.
RouteTraceParseOptions PlatformRouteTraceOptions();

// Lines that do not look like a hop are skipped, so output with no recognized
// hop is an empty sequence. Only an internal fault produces ParseFailure.
RouteTraceParseOutcome ParseRouteTraceOutput(std::string_view text,
                                             const RouteTraceParseOptions& options = {});

// Compact JSON with the wire field names (`packet_loss`, `hop`, `ip`, ...).
std::string ToJson(const LatencyResult& result);
std::string ToJson(const RouteHop& hop);
std::string ToJson(const std::vector<RouteHop>& hops);

} // namespace netdiag::probe
