#include "agent/agent_config.hpp"

#include "agent/server_url.hpp"
#include "core/json_dom.hpp"
#include "core/json_utils.hpp"

#include <cmath>
#include <fstream>
#include <iterator>
#include <limits>
#include <optional>
#include <system_error>

namespace fs = std::filesystem;

namespace netdiag::agent {

namespace {

using JsonValue = core::json::Value;

bool TryGetNonNegativeInteger(const JsonValue& value, std::uint64_t& out) {
  if (value.type != JsonValue::Type::kNumber) {
    return false;
  }
  if (!std::isfinite(value.number_value) || value.number_value < 0.0) {
    return false;
  }
  const double floored = std::floor(value.number_value);
  if (floored != value.number_value ||
      floored > static_cast<double>(std::numeric_limits<std::uint32_t>::max())) {
    return false;
  }
  out = static_cast<std::uint64_t>(floored);
  return true;
}

bool ReadStringField(const JsonValue& root, std::string_view key,
                     std::optional<std::string>& out, std::string& error) {
  out.reset();
  const JsonValue* value = core::json::FindMember(root, key);
  if (value == nullptr) {
    return true;
  }
  if (value->type != JsonValue::Type::kString) {
    error = "config field '" + std::string(key) + "' must be a string";
    return false;
  }
  out = value->string_value;
  return true;
}

bool ReadUintField(const JsonValue& root, std::string_view key, std::uint64_t min_value,
                   std::uint64_t max_value, std::optional<std::uint64_t>& out,
                   std::string& error) {
  out.reset();
  const JsonValue* value = core::json::FindMember(root, key);
  if (value == nullptr) {
    return true;
  }
  std::uint64_t parsed = 0;
  if (!TryGetNonNegativeInteger(*value, parsed) || parsed < min_value || parsed > max_value) {
    error = "config field '" + std::string(key) + "' must be an integer in range [" +
            std::to_string(min_value) + "," + std::to_string(max_value) + "]";
    return false;
  }
  out = parsed;
  return true;
}

// "autostart" historically came from an ini file, so "true"/"false" strings are
// accepted alongside JSON booleans.
bool ReadAutostart(const JsonValue& root, bool& autostart, std::string& error) {
  const JsonValue* value = core::json::FindMember(root, "autostart");
  if (value == nullptr) {
    return true;
  }
  if (value->type == JsonValue::Type::kBool) {
    autostart = value->bool_value;
    return true;
  }
  if (value->type == JsonValue::Type::kString) {
    if (value->string_value == "true" || value->string_value == "True") {
      autostart = true;
      return true;
    }
    if (value->string_value == "false" || value->string_value == "False") {
      autostart = false;
      return true;
    }
  }
  error = "config field 'autostart' must be a boolean";
  return false;
}

bool ReadTraceHeaderLines(const JsonValue& root, probe::RouteTraceParseOptions& options,
                          std::string& error) {
  const JsonValue* value = core::json::FindMember(root, "trace_header_lines");
  if (value == nullptr) {
    return true;
  }
  if (value->type == JsonValue::Type::kString && value->string_value == "auto") {
    options.header_lines.reset();
    return true;
  }
  std::uint64_t parsed = 0;
  if (!TryGetNonNegativeInteger(*value, parsed) || parsed > 100U) {
    error = "config field 'trace_header_lines' must be \"auto\" or an integer in range [0,100]";
    return false;
  }
  options.header_lines = static_cast<std::size_t>(parsed);
  return true;
}

} // namespace

bool ParseAgentConfig(const std::string_view json_text,
                      const LocalityTable& localities,
                      AgentConfig& config,
                      std::string& error) {
  config = AgentConfig{};
  error.clear();

  JsonValue root;
  std::string parse_error;
  if (!core::json::Parse(json_text, root, parse_error)) {
    error = "invalid config JSON: " + parse_error;
    return false;
  }
  if (root.type != JsonValue::Type::kObject) {
    error = "config root must be a JSON object";
    return false;
  }

  std::optional<std::string> agreement_id;
  std::optional<std::string> server_url;
  std::optional<std::string> log_level;
  std::optional<std::string> log_file;
  std::optional<std::string> output_encoding;
  std::optional<std::uint64_t> max_concurrent_probes;
  std::optional<std::uint64_t> reconnect_delay_s;
  if (!ReadStringField(root, "agreement_id", agreement_id, error) ||
      !ReadStringField(root, "server_url", server_url, error) ||
      !ReadStringField(root, "log_level", log_level, error) ||
      !ReadStringField(root, "log_file", log_file, error) ||
      !ReadStringField(root, "output_encoding", output_encoding, error) ||
      !ReadUintField(root, "max_concurrent_probes", 1U, kMaxConcurrentProbesLimit,
                     max_concurrent_probes, error) ||
      !ReadUintField(root, "reconnect_delay_s", 1U, 3600U, reconnect_delay_s, error) ||
      !ReadAutostart(root, config.autostart, error) ||
      !ReadTraceHeaderLines(root, config.probe.route_trace, error)) {
    return false;
  }

  if (agreement_id.has_value()) {
    config.agreement_id = *agreement_id;
  }
  config.city = localities.Lookup(config.agreement_id);

  if (server_url.has_value()) {
    config.server_url = *server_url;
  }
  ServerEndpoint endpoint;
  std::string url_error;
  if (!ParseServerUrl(config.server_url, endpoint, url_error)) {
    error = "config field 'server_url': " + url_error;
    return false;
  }

  if (log_level.has_value()) {
    std::string level_error;
    if (!core::logging::ParseLogLevel(*log_level, config.log_level, level_error)) {
      error = "config field 'log_level': " + level_error;
      return false;
    }
  }
  if (log_file.has_value()) {
    config.log_file = *log_file;
  }
  if (output_encoding.has_value()) {
    const auto encoding = probe::ParseTextEncoding(*output_encoding);
    if (!encoding.has_value()) {
      error = "config field 'output_encoding' must be one of: utf-8|cp866";
      return false;
    }
    config.probe.output_encoding = *encoding;
  }
  if (max_concurrent_probes.has_value()) {
    config.max_concurrent_probes = static_cast<std::uint32_t>(*max_concurrent_probes);
  }
  if (reconnect_delay_s.has_value()) {
    config.reconnect_delay = std::chrono::seconds(*reconnect_delay_s);
  }
  return true;
}

bool WriteDefaultAgentConfig(const fs::path& path, std::string& error) {
  std::error_code ec;
  if (path.has_parent_path()) {
    fs::create_directories(path.parent_path(), ec);
    if (ec) {
      error = "failed to create config directory '" + path.parent_path().string() +
              "': " + ec.message();
      return false;
    }
  }

  std::ofstream out(path, std::ios::binary | std::ios::trunc);
  if (!out) {
    error = "failed to create config file: " + path.string();
    return false;
  }
  out << "{\n"
      << "  \"agreement_id\": \"\",\n"
      << "  \"server_url\": " << core::QuoteJson(kDefaultServerUrl) << ",\n"
      << "  \"autostart\": true\n"
      << "}\n";
  if (!out) {
    error = "failed to write config file: " + path.string();
    return false;
  }
  return true;
}

bool LoadOrCreateAgentConfig(const fs::path& path,
                             const LocalityTable& localities,
                             AgentConfig& config,
                             bool& created,
                             std::string& error) {
  created = false;
  error.clear();

  std::error_code ec;
  if (!fs::exists(path, ec)) {
    if (ec) {
      error = "failed to check config path '" + path.string() + "': " + ec.message();
      return false;
    }
    if (!WriteDefaultAgentConfig(path, error)) {
      return false;
    }
    created = true;
  }

  std::ifstream input(path, std::ios::binary);
  if (!input) {
    error = "unable to open config file: " + path.string();
    return false;
  }
  const std::string text((std::istreambuf_iterator<char>(input)),
                         std::istreambuf_iterator<char>());

  std::string parse_error;
  if (!ParseAgentConfig(text, localities, config, parse_error)) {
    error = path.string() + ": " + parse_error;
    return false;
  }

  if (!config.log_file.empty() && config.log_file.is_relative()) {
    config.log_file = path.parent_path() / config.log_file;
  }
  return true;
}

} // namespace netdiag::agent
