#include "probe/output_parser.hpp"

#include <catch2/catch_test_macros.hpp>

#include <string>
#include <variant>
#include <vector>

using netdiag::probe::HopLineLayout;
using netdiag::probe::ParseFailure;
using netdiag::probe::ParseRouteTraceOutput;
using netdiag::probe::RouteHop;
using netdiag::probe::RouteTraceParseOptions;
using netdiag::probe::RouteTraceParseOutcome;
using netdiag::probe::ToJson;

namespace {

constexpr const char* kTwoHopTrace =
    "\r\n"
    "Tracing route to example.net [10.0.0.9]\r\n"
    "over a maximum of 30 hops:\r\n"
    "\r\n"
    "  1    10 ms    12 ms    11 ms  10.0.0.1\r\n"
    "  2     *        *        *     Request timed out.\r\n"
    "\r\n"
    "Trace complete.\r\n";

constexpr const char* kNamedHopTrace =
    "Tracing route to example.net [93.184.216.34]\r\n"
    "over a maximum of 30 hops:\r\n"
    "\r\n"
    "  1    <1 ms    <1 ms    <1 ms  router.lan [192.168.1.1]\r\n"
    "  2     5 ms     *        7 ms  100.64.0.1\r\n"
    "  3    20 ms    21 ms    22 ms  edge.example.net [93.184.216.34]\r\n";

constexpr const char* kRussianTrace =
    "Трассировка маршрута к example.net [10.0.0.9]\r\n"
    "с максимальным числом прыжков 30:\r\n"
    "\r\n"
    "  1     2 ms     3 ms     4 ms  10.0.0.1\r\n"
    "  2     *        *        *     Превышен интервал ожидания для запроса.\r\n";

constexpr const char* kTracerouteOutput =
    "traceroute to example.net (10.0.0.9), 30 hops max, 60 byte packets\n"
    " 1  _gateway (192.168.1.1)  0.5 ms  1.5 ms  1.0 ms\n"
    " 2  * * *\n"
    " 3  10.20.0.1  4.000 ms  6.000 ms *\n";

std::vector<RouteHop> RequireHops(const RouteTraceParseOutcome& outcome) {
  REQUIRE(std::holds_alternative<std::vector<RouteHop>>(outcome));
  return std::get<std::vector<RouteHop>>(outcome);
}

RouteTraceParseOptions TracerouteOptions() {
  RouteTraceParseOptions options;
  options.header_lines = 1U;
  options.layout = HopLineLayout::kAddressFirst;
  return options;
}

} // namespace

TEST_CASE("Numeric hop and timed-out hop serialize to the wire shape", "[probe][trace]") {
  const std::vector<RouteHop> hops = RequireHops(ParseRouteTraceOutput(kTwoHopTrace));
  REQUIRE(hops.size() == 2U);
  REQUIRE(ToJson(hops) ==
          R"([{"hop":1,"ip":"10.0.0.1","min_rtt":10,"avg_rtt":11,"max_rtt":12},)"
          R"({"hop":2,"ip":"*","min_rtt":"*","avg_rtt":"*","max_rtt":"*"}])");
}

TEST_CASE("Hop indices follow source lines in order", "[probe][trace]") {
  const std::vector<RouteHop> hops = RequireHops(ParseRouteTraceOutput(kNamedHopTrace));
  REQUIRE(hops.size() == 3U);
  for (std::size_t i = 0; i < hops.size(); ++i) {
    REQUIRE(hops[i].hop_index == i + 1U);
  }
}

TEST_CASE("Bracketed IP wins over the host name and <1 counts as 1", "[probe][trace]") {
  const std::vector<RouteHop> hops = RequireHops(ParseRouteTraceOutput(kNamedHopTrace));
  REQUIRE(hops[0].address == "192.168.1.1");
  REQUIRE(*hops[0].min_rtt_ms == 1.0);
  REQUIRE(*hops[0].max_rtt_ms == 1.0);
  REQUIRE(hops[2].address == "93.184.216.34");
}

TEST_CASE("Partial timeouts average only the measured samples", "[probe][trace]") {
  const std::vector<RouteHop> hops = RequireHops(ParseRouteTraceOutput(kNamedHopTrace));
  REQUIRE(hops[1].address == "100.64.0.1");
  REQUIRE(*hops[1].min_rtt_ms == 5.0);
  REQUIRE(*hops[1].avg_rtt_ms == 6.0);
  REQUIRE(*hops[1].max_rtt_ms == 7.0);
}

TEST_CASE("Russian tracert output is recognized", "[probe][trace]") {
  const std::vector<RouteHop> hops = RequireHops(ParseRouteTraceOutput(kRussianTrace));
  REQUIRE(hops.size() == 2U);
  REQUIRE(ToJson(hops[0]) == R"({"hop":1,"ip":"10.0.0.1","min_rtt":2,"avg_rtt":3,"max_rtt":4})");
  REQUIRE(hops[1].address == "*");
  REQUIRE_FALSE(hops[1].avg_rtt_ms.has_value());
}

TEST_CASE("Output without hop lines is an empty sequence", "[probe][trace]") {
  const std::vector<RouteHop> hops = RequireHops(
      ParseRouteTraceOutput("Unable to resolve target system name nosuchhost.\r\n"));
  REQUIRE(hops.empty());
  REQUIRE(ToJson(hops) == "[]");
  REQUIRE(RequireHops(ParseRouteTraceOutput("")).empty());
}

TEST_CASE("Header skip is configurable and detectable", "[probe][trace]") {
  const std::string short_banner =
      "Tracing route to 10.0.0.1\r\n"
      "  1    10 ms    12 ms    11 ms  10.0.0.1\r\n"
      "  2    13 ms    12 ms    14 ms  10.0.0.2\r\n";

  // The fixed three-line skip swallows every hop after a one-line banner.
  REQUIRE(RequireHops(ParseRouteTraceOutput(short_banner)).empty());

  RouteTraceParseOptions detect;
  detect.header_lines.reset();
  const std::vector<RouteHop> detected = RequireHops(ParseRouteTraceOutput(short_banner, detect));
  REQUIRE(detected.size() == 2U);
  REQUIRE(detected[0].hop_index == 1U);

  RouteTraceParseOptions none;
  none.header_lines = 0U;
  REQUIRE(RequireHops(ParseRouteTraceOutput(short_banner, none)).size() == 2U);
}

TEST_CASE("traceroute layout reads address first and decimal samples", "[probe][trace]") {
  const std::vector<RouteHop> hops =
      RequireHops(ParseRouteTraceOutput(kTracerouteOutput, TracerouteOptions()));
  REQUIRE(hops.size() == 3U);
  REQUIRE(ToJson(hops[0]) ==
          R"({"hop":1,"ip":"192.168.1.1","min_rtt":0.5,"avg_rtt":1,"max_rtt":1.5})");
  REQUIRE(ToJson(hops[1]) == R"({"hop":2,"ip":"*","min_rtt":"*","avg_rtt":"*","max_rtt":"*"})");
  REQUIRE(hops[2].address == "10.20.0.1");
  REQUIRE(*hops[2].avg_rtt_ms == 5.0);
}

TEST_CASE("Route trace parsing is deterministic", "[probe][trace]") {
  const std::string first = ToJson(RequireHops(ParseRouteTraceOutput(kNamedHopTrace)));
  const std::string second = ToJson(RequireHops(ParseRouteTraceOutput(kNamedHopTrace)));
  REQUIRE(first == second);
}
