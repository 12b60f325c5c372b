#pragma once

#include "agent/server_url.hpp"
#include "core/errors/exit_codes.hpp"
#include "session/session_controller.hpp"

#include <utility>  // boost 1.74 awaitable.hpp uses std::exchange without including it
#include <boost/asio/awaitable.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/signal_set.hpp>
#include <boost/asio/steady_timer.hpp>

#include <chrono>
#include <cstdint>
#include <memory>
#include <string>

namespace netdiag::session {

struct WebSocketSessionOptions {
  agent::ServerEndpoint endpoint;
  std::chrono::milliseconds reconnect_delay{std::chrono::seconds(5)};
  // A ping goes out after half of this much silence; no reply by the full
  // interval drops the connection.
  std::chrono::milliseconds idle_timeout{std::chrono::seconds(20)};
  // Stop cleanly on SIGINT/SIGTERM. Tests turn this off and call Stop().
  bool handle_signals = true;
};

// Long-lived connection to the control server. One io_context thread does all
// network I/O; probes run on the dispatcher and their results come back through
// a single-writer outbox per connection. Any transport failure drops the
// connection and a new one is attempted after `reconnect_delay`, forever.
class WebSocketSession {
public:
  WebSocketSession(WebSocketSessionOptions options,
                   SessionIdentity identity,
                   IProbeDispatcher& dispatcher,
                   core::logging::Logger& logger);
  ~WebSocketSession();

  WebSocketSession(const WebSocketSession&) = delete;
  WebSocketSession& operator=(const WebSocketSession&) = delete;

  // Blocks until Stop(), a handled signal, or a fatal misconfiguration.
  // Drains the dispatcher before returning.
  core::errors::ExitCode Run();

  // Safe to call from any thread.
  void Stop();

private:
  struct Connection;

  boost::asio::awaitable<void> ConnectLoop();
  boost::asio::awaitable<void> RunConnection(std::shared_ptr<Connection> connection);
  boost::asio::awaitable<void> WriteLoop(std::shared_ptr<Connection> connection);

  void DeliverResult(std::uint64_t generation, std::string frame);
  void RequestStop(core::errors::ExitCode exit_code);
  void CloseConnection(Connection& connection);

  WebSocketSessionOptions options_;
  IProbeDispatcher& dispatcher_;
  core::logging::Logger& logger_;
  boost::asio::io_context io_;
  boost::asio::steady_timer reconnect_timer_;
  boost::asio::signal_set signals_;
  SessionController controller_;
  std::shared_ptr<Connection> current_;
  bool stopping_ = false;
  core::errors::ExitCode exit_code_ = core::errors::ExitCode::kSuccess;
};

} // namespace netdiag::session
