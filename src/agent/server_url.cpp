#include "agent/server_url.hpp"

#include <cctype>

namespace netdiag::agent {

namespace {

constexpr std::string_view kPlainScheme = "ws://";
constexpr std::string_view kTlsScheme = "wss://";

bool IsValidPort(std::string_view port) {
  if (port.empty() || port.size() > 5U) {
    return false;
  }
  unsigned value = 0;
  for (const char c : port) {
    if (std::isdigit(static_cast<unsigned char>(c)) == 0) {
      return false;
    }
    value = value * 10U + static_cast<unsigned>(c - '0');
  }
  return value > 0U && value <= 65535U;
}

} // namespace

std::string ServerEndpoint::HostHeader() const {
  const bool ipv6 = host.find(':') != std::string::npos;
  const std::string printable_host = ipv6 ? "[" + host + "]" : host;
  if (port == "80") {
    return printable_host;
  }
  return printable_host + ":" + port;
}

bool ParseServerUrl(std::string_view url, ServerEndpoint& endpoint, std::string& error) {
  endpoint = ServerEndpoint{};
  error.clear();

  if (url.substr(0, kTlsScheme.size()) == kTlsScheme) {
    error = "wss:// server urls are not supported; use ws://";
    return false;
  }
  if (url.substr(0, kPlainScheme.size()) != kPlainScheme) {
    error = "server url must start with ws:// (got '" + std::string(url) + "')";
    return false;
  }
  url.remove_prefix(kPlainScheme.size());

  const std::size_t path_start = url.find('/');
  std::string_view authority = url.substr(0, path_start);
  if (path_start != std::string_view::npos) {
    endpoint.target = std::string(url.substr(path_start));
  }

  if (!authority.empty() && authority.front() == '[') {
    const std::size_t close = authority.find(']');
    if (close == std::string_view::npos) {
      error = "unterminated IPv6 literal in server url";
      return false;
    }
    endpoint.host = std::string(authority.substr(1U, close - 1U));
    authority.remove_prefix(close + 1U);
    if (!authority.empty()) {
      if (authority.front() != ':') {
        error = "unexpected text after IPv6 literal in server url";
        return false;
      }
      endpoint.port = std::string(authority.substr(1U));
    }
  } else {
    const std::size_t colon = authority.rfind(':');
    if (colon != std::string_view::npos) {
      endpoint.port = std::string(authority.substr(colon + 1U));
      authority = authority.substr(0, colon);
    }
    endpoint.host = std::string(authority);
  }

  if (endpoint.host.empty()) {
    error = "server url has no host";
    return false;
  }
  if (!IsValidPort(endpoint.port)) {
    error = "server url has invalid port '" + endpoint.port + "'";
    return false;
  }
  return true;
}

} // namespace netdiag::agent
