#pragma once

#include <string>
#include <string_view>

namespace netdiag::agent {

// Control-server address split into what the WebSocket handshake needs.
struct ServerEndpoint {
  std::string host;
  std::string port = "80";
  std::string target = "/";

  // Value for the HTTP Host header: "host" or "host:port" for non-default ports.
  std::string HostHeader() const;
};

// Accepts `ws://host[:port][/path]`. IPv6 literals use brackets
// (`ws://[::1]:8765`). `wss://` is rejected: the agent speaks plain WebSocket.
bool ParseServerUrl(std::string_view url, ServerEndpoint& endpoint, std::string& error);

} // namespace netdiag::agent
