#include "probe/output_parser.hpp"

#include "core/json_utils.hpp"

#include <algorithm>
#include <charconv>
#include <cctype>
#include <exception>
#include <numeric>
#include <sstream>
#include <system_error>
#include <utility>

namespace netdiag::probe {

namespace {

std::string_view Trim(std::string_view value) {
  const auto is_space = [](const char c) {
    return std::isspace(static_cast<unsigned char>(c)) != 0;
  };
  while (!value.empty() && is_space(value.front())) {
    value.remove_prefix(1);
  }
  while (!value.empty() && is_space(value.back())) {
    value.remove_suffix(1);
  }
  return value;
}

std::vector<std::string> SplitLines(std::string_view text) {
  std::vector<std::string> lines;
  std::size_t start = 0;
  while (start <= text.size()) {
    const std::size_t end = text.find('\n', start);
    std::string_view line = text.substr(start, end == std::string_view::npos
                                                   ? std::string_view::npos
                                                   : end - start);
    if (!line.empty() && line.back() == '\r') {
      line.remove_suffix(1);
    }
    lines.emplace_back(line);
    if (end == std::string_view::npos) {
      break;
    }
    start = end + 1U;
  }
  return lines;
}

std::optional<int> ToInt(std::string_view digits) {
  int value = 0;
  const auto [ptr, ec] = std::from_chars(digits.data(), digits.data() + digits.size(), value);
  if (ec != std::errc() || ptr != digits.data() + digits.size()) {
    return std::nullopt;
  }
  return value;
}

std::optional<double> ToDecimal(std::string_view token) {
  if (token.empty() || std::isdigit(static_cast<unsigned char>(token.front())) == 0) {
    return std::nullopt;
  }
  double value = 0.0;
  const auto [ptr, ec] = std::from_chars(token.data(), token.data() + token.size(), value);
  if (ec != std::errc() || ptr != token.data() + token.size()) {
    return std::nullopt;
  }
  return value;
}

std::optional<int> SearchInt(const std::string& text, const std::regex& pattern) {
  std::smatch match;
  if (!std::regex_search(text, match, pattern) || match.size() < 2U) {
    return std::nullopt;
  }
  return ToInt(std::string_view(text).substr(static_cast<std::size_t>(match.position(1)),
                                             static_cast<std::size_t>(match.length(1))));
}

std::optional<LatencyResult> MatchDialect(const std::string& text, const LatencyDialect& dialect) {
  const auto loss = SearchInt(text, dialect.packet_loss);
  const auto min_rtt = SearchInt(text, dialect.min_rtt);
  const auto avg_rtt = SearchInt(text, dialect.avg_rtt);
  const auto max_rtt = SearchInt(text, dialect.max_rtt);
  if (!loss.has_value() || !min_rtt.has_value() || !avg_rtt.has_value() ||
      !max_rtt.has_value()) {
    return std::nullopt;
  }
  if (*loss < 0 || *loss > 100) {
    return std::nullopt;
  }

  return LatencyResult{
      .packet_loss_percent = *loss,
      .min_rtt_ms = *min_rtt,
      .avg_rtt_ms = *avg_rtt,
      .max_rtt_ms = *max_rtt,
  };
}

void ApplySamples(RouteHop& hop, const std::vector<double>& samples) {
  if (samples.empty()) {
    hop.min_rtt_ms.reset();
    hop.avg_rtt_ms.reset();
    hop.max_rtt_ms.reset();
    return;
  }
  const auto [min_it, max_it] = std::minmax_element(samples.begin(), samples.end());
  hop.min_rtt_ms = *min_it;
  hop.max_rtt_ms = *max_it;
  hop.avg_rtt_ms = std::accumulate(samples.begin(), samples.end(), 0.0) /
                   static_cast<double>(samples.size());
}

const std::regex& HopStartPattern() {
  static const std::regex pattern(R"(^\s*\d+\s)");
  return pattern;
}

// Every RTT token must end at whitespace or end of line, so the leading digits
// of an address such as 10.0.0.1 are never taken for a sample.
const std::regex& AddressLastLinePattern() {
  static const std::regex pattern(
      R"(^\s*(\d+)((?:\s+(?:<?\d+(?:\s*(?:ms|мс))?|\*)(?=\s|$))+)\s*(.*)$)");
  return pattern;
}

const std::regex& AddressLastTokenPattern() {
  static const std::regex pattern(R"(<?(\d+)|\*)");
  return pattern;
}

const std::regex& AddressPattern() {
  static const std::regex pattern(R"(^([\w.\-:]+)(?:\s+\[([0-9A-Fa-f.:]+)\])?$)");
  return pattern;
}

std::optional<RouteHop> ParseAddressLastLine(const std::string& line) {
  std::smatch match;
  if (!std::regex_match(line, match, AddressLastLinePattern())) {
    return std::nullopt;
  }

  RouteHop hop;
  const auto index = ToInt(match.str(1));
  if (!index.has_value() || *index <= 0) {
    return std::nullopt;
  }
  hop.hop_index = static_cast<std::uint32_t>(*index);

  std::vector<double> samples;
  const std::string rtt_field = match.str(2);
  for (auto it = std::sregex_iterator(rtt_field.begin(), rtt_field.end(),
                                      AddressLastTokenPattern());
       it != std::sregex_iterator(); ++it) {
    if ((*it)[1].matched) {
      const auto value = ToInt((*it)[1].str());
      if (value.has_value()) {
        samples.push_back(static_cast<double>(*value));
      }
    }
  }
  ApplySamples(hop, samples);

  // Anything that is not a single host token (for example "Request timed out.")
  // leaves the address unknown.
  const std::string rest(Trim(match.str(3)));
  std::smatch address_match;
  if (std::regex_match(rest, address_match, AddressPattern())) {
    hop.address = address_match[2].matched ? address_match.str(2) : address_match.str(1);
  }
  return hop;
}

std::optional<RouteHop> ParseAddressFirstLine(const std::string& line) {
  if (!std::regex_search(line, HopStartPattern())) {
    return std::nullopt;
  }

  std::istringstream in(line);
  std::vector<std::string> tokens;
  std::string token;
  while (in >> token) {
    tokens.push_back(token);
  }

  RouteHop hop;
  const auto index = ToInt(tokens.front());
  if (!index.has_value() || *index <= 0) {
    return std::nullopt;
  }
  hop.hop_index = static_cast<std::uint32_t>(*index);

  // Only the first responder of a hop is reported; when traceroute prints
  // "name (ip)" the numeric address wins.
  std::vector<double> samples;
  std::size_t address_token = 0;
  for (std::size_t i = 1; i < tokens.size(); ++i) {
    const std::string& current = tokens[i];
    if (current == kWildcardMarker || current == "ms" || current.front() == '!') {
      continue;
    }
    if (const auto value = ToDecimal(current);
        value.has_value() && i + 1U < tokens.size() && tokens[i + 1U] == "ms") {
      samples.push_back(*value);
      continue;
    }
    if (current.size() > 2U && current.front() == '(' && current.back() == ')') {
      if (address_token != 0U && address_token + 1U == i) {
        hop.address = current.substr(1U, current.size() - 2U);
      }
      continue;
    }
    if (address_token == 0U) {
      hop.address = current;
      address_token = i;
    }
  }
  ApplySamples(hop, samples);
  return hop;
}

std::size_t DetectHeaderLines(const std::vector<std::string>& lines) {
  for (std::size_t i = 0; i < lines.size(); ++i) {
    if (std::regex_search(lines[i], HopStartPattern())) {
      return i;
    }
  }
  return lines.size();
}

std::string RttToJson(const std::optional<double>& value) {
  if (!value.has_value()) {
    return core::QuoteJson(kWildcardMarker);
  }
  return core::FormatJsonNumber(*value);
}

} // namespace

LatencyDialect MakeLatencyDialect(std::string name,
                                  const std::string_view packet_loss_pattern,
                                  const std::string_view min_rtt_pattern,
                                  const std::string_view avg_rtt_pattern,
                                  const std::string_view max_rtt_pattern) {
  return LatencyDialect{
      .name = std::move(name),
      .packet_loss = std::regex(std::string(packet_loss_pattern)),
      .min_rtt = std::regex(std::string(min_rtt_pattern)),
      .avg_rtt = std::regex(std::string(avg_rtt_pattern)),
      .max_rtt = std::regex(std::string(max_rtt_pattern)),
  };
}

const std::vector<LatencyDialect>& DefaultLatencyDialects() {
  static const std::vector<LatencyDialect> dialects = [] {
    std::vector<LatencyDialect> built;
    built.push_back(MakeLatencyDialect("windows-en",
                                       R"((\d+)% loss)",
                                       R"(Minimum = (\d+)\s*ms)",
                                       R"(Average = (\d+)\s*ms)",
                                       R"(Maximum = (\d+)\s*ms)"));
    built.push_back(MakeLatencyDialect("windows-ru",
                                       R"((\d+)% потерь)",
                                       R"(Минимальное = (\d+)\s*мсек)",
                                       R"(Среднее = (\d+)\s*мсек)",
                                       R"(Максимальное = (\d+)\s*мсек)"));
    built.push_back(MakeLatencyDialect(
        "iputils",
        R"((\d+)(?:\.\d+)?% packet loss)",
        R"(min/avg/max(?:/(?:mdev|stddev))? = (\d+)(?:\.\d+)?/)",
        R"(min/avg/max(?:/(?:mdev|stddev))? = [\d.]+/(\d+)(?:\.\d+)?/)",
        R"(min/avg/max(?:/(?:mdev|stddev))? = [\d.]+/[\d.]+/(\d+))"));
    return built;
  }();
  return dialects;
}

LatencyParseOutcome ParseLatencyOutput(const std::string_view text) {
  return ParseLatencyOutput(text, DefaultLatencyDialects());
}

LatencyParseOutcome ParseLatencyOutput(const std::string_view text,
                                       const std::vector<LatencyDialect>& dialects) {
  const std::string owned(text);
  try {
    for (const LatencyDialect& dialect : dialects) {
      if (auto result = MatchDialect(owned, dialect); result.has_value()) {
        return *result;
      }
    }
  } catch (const std::exception& e) {
    return ParseFailure{.reason = e.what(), .raw_text = owned};
  }
  return ParseFailure{
      .reason = "packet loss, minimum, average and maximum were not all found",
      .raw_text = owned,
  };
}

RouteTraceParseOptions PlatformRouteTraceOptions() {
#if defined(_WIN32)
  return RouteTraceParseOptions{};
#else
  // traceroute prints a single "traceroute to ..." banner line.
  return RouteTraceParseOptions{
      .header_lines = 1U,
      .layout = HopLineLayout::kAddressFirst,
  };
#endif
}

RouteTraceParseOutcome ParseRouteTraceOutput(const std::string_view text,
                                             const RouteTraceParseOptions& options) {
  try {
    const std::vector<std::string> lines = SplitLines(Trim(text));
    const std::size_t skip = options.header_lines.has_value() ? *options.header_lines
                                                              : DetectHeaderLines(lines);

    std::vector<RouteHop> hops;
    for (std::size_t i = skip; i < lines.size(); ++i) {
      const std::optional<RouteHop> hop = options.layout == HopLineLayout::kAddressLast
                                              ? ParseAddressLastLine(lines[i])
                                              : ParseAddressFirstLine(lines[i]);
      if (hop.has_value()) {
        hops.push_back(*hop);
      }
    }
    return hops;
  } catch (const std::exception& e) {
    return ParseFailure{.reason = e.what(), .raw_text = std::string(text)};
  }
}

std::string ToJson(const LatencyResult& result) {
  std::ostringstream out;
  out << "{\"packet_loss\":" << result.packet_loss_percent
      << ",\"min_rtt\":" << result.min_rtt_ms
      << ",\"avg_rtt\":" << result.avg_rtt_ms
      << ",\"max_rtt\":" << result.max_rtt_ms << '}';
  return out.str();
}

std::string ToJson(const RouteHop& hop) {
  std::ostringstream out;
  out << "{\"hop\":" << hop.hop_index
      << ",\"ip\":" << core::QuoteJson(hop.address)
      << ",\"min_rtt\":" << RttToJson(hop.min_rtt_ms)
      << ",\"avg_rtt\":" << RttToJson(hop.avg_rtt_ms)
      << ",\"max_rtt\":" << RttToJson(hop.max_rtt_ms) << '}';
  return out.str();
}

std::string ToJson(const std::vector<RouteHop>& hops) {
  std::string out = "[";
  for (std::size_t i = 0; i < hops.size(); ++i) {
    if (i > 0U) {
      out += ',';
    }
    out += ToJson(hops[i]);
  }
  out += ']';
  return out;
}

} // namespace netdiag::probe
