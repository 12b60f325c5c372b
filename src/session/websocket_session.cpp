#include "session/websocket_session.hpp"

#include "core/logging/logger.hpp"

#include <boost/asio/co_spawn.hpp>
#include <boost/asio/detached.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/post.hpp>
#include <boost/asio/redirect_error.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http/field.hpp>
#include <boost/beast/websocket.hpp>

#include <csignal>
#include <deque>
#include <exception>
#include <utility>

namespace netdiag::session {

namespace asio = boost::asio;
namespace beast = boost::beast;
namespace websocket = beast::websocket;
using tcp = asio::ip::tcp;

namespace {

constexpr std::chrono::seconds kConnectTimeout{30};
constexpr const char* kUserAgent = "netdiag-agent";

} // namespace

struct WebSocketSession::Connection {
  explicit Connection(asio::io_context& io) : resolver(io), ws(io), wake_writer(io) {}

  tcp::resolver resolver;
  websocket::stream<beast::tcp_stream> ws;
  // Parked at time_point::max() while the outbox is empty; cancelled to wake.
  asio::steady_timer wake_writer;
  std::deque<std::string> outbox;
  bool closed = false;
};

WebSocketSession::WebSocketSession(WebSocketSessionOptions options,
                                   SessionIdentity identity,
                                   IProbeDispatcher& dispatcher,
                                   core::logging::Logger& logger)
    : options_(std::move(options)),
      dispatcher_(dispatcher),
      logger_(logger),
      reconnect_timer_(io_),
      signals_(io_),
      controller_(std::move(identity), dispatcher, logger,
                  [this](const std::uint64_t generation, std::string frame) {
                    asio::post(io_, [this, generation, frame = std::move(frame)]() mutable {
                      DeliverResult(generation, std::move(frame));
                    });
                  }) {}

WebSocketSession::~WebSocketSession() {
  // Workers post into io_; none may outlive it.
  dispatcher_.Drain();
}

core::errors::ExitCode WebSocketSession::Run() {
  if (options_.handle_signals) {
    boost::system::error_code ec;
    signals_.add(SIGINT, ec);
    if (!ec) {
      signals_.add(SIGTERM, ec);
    }
    if (ec) {
      logger_.Warn("signal handling unavailable", {{"error", ec.message()}});
    } else {
      signals_.async_wait([this](const boost::system::error_code& wait_ec, const int signal_number) {
        if (wait_ec) {
          return;
        }
        logger_.Info("shutdown signal received", {{"signal", std::to_string(signal_number)}});
        RequestStop(core::errors::ExitCode::kSuccess);
      });
    }
  }

  asio::co_spawn(io_, ConnectLoop(), [this](std::exception_ptr failure) {
    if (!failure) {
      return;
    }
    try {
      std::rethrow_exception(failure);
    } catch (const std::exception& ex) {
      logger_.Error("session loop failed", {{"error", ex.what()}});
      RequestStop(core::errors::ExitCode::kFailure);
    }
  });

  io_.run();

  logger_.Info("session stopped, waiting for running probes");
  dispatcher_.Drain();
  return exit_code_;
}

void WebSocketSession::Stop() {
  asio::post(io_, [this]() { RequestStop(core::errors::ExitCode::kSuccess); });
}

void WebSocketSession::RequestStop(const core::errors::ExitCode exit_code) {
  if (stopping_) {
    return;
  }
  stopping_ = true;
  exit_code_ = exit_code;

  boost::system::error_code ec;
  signals_.cancel(ec);
  if (ec) {
    logger_.Debug("failed to cancel signal wait", {{"error", ec.message()}});
  }
  reconnect_timer_.cancel();
  if (current_ != nullptr) {
    CloseConnection(*current_);
  }
}

void WebSocketSession::CloseConnection(Connection& connection) {
  if (connection.closed) {
    return;
  }
  connection.closed = true;
  connection.resolver.cancel();
  beast::get_lowest_layer(connection.ws).close();
  connection.wake_writer.cancel();
}

asio::awaitable<void> WebSocketSession::ConnectLoop() {
  while (!stopping_) {
    auto connection = std::make_shared<Connection>(io_);
    current_ = connection;
    controller_.OnConnecting();

    co_await RunConnection(connection);

    CloseConnection(*connection);
    current_.reset();
    controller_.OnDisconnected();
    if (stopping_) {
      break;
    }

    logger_.Info("reconnecting after delay",
                 {{"delay_ms", std::to_string(options_.reconnect_delay.count())}});
    reconnect_timer_.expires_after(options_.reconnect_delay);
    boost::system::error_code ec;
    co_await reconnect_timer_.async_wait(asio::redirect_error(asio::use_awaitable, ec));
  }
}

asio::awaitable<void> WebSocketSession::RunConnection(std::shared_ptr<Connection> connection) {
  const agent::ServerEndpoint& endpoint = options_.endpoint;
  logger_.Info("connecting to control server", {
                                                   {"host", endpoint.host},
                                                   {"port", endpoint.port},
                                                   {"path", endpoint.target},
                                               });

  try {
    const auto results = co_await connection->resolver.async_resolve(
        endpoint.host, endpoint.port, asio::use_awaitable);

    auto& tcp_layer = beast::get_lowest_layer(connection->ws);
    tcp_layer.expires_after(kConnectTimeout);
    co_await tcp_layer.async_connect(results, asio::use_awaitable);
    tcp_layer.expires_never();

    // A peer that vanishes without closing TCP stops answering pings; the
    // pending read then fails with a timeout and the connection is dropped.
    auto timeouts = websocket::stream_base::timeout::suggested(beast::role_type::client);
    timeouts.idle_timeout = options_.idle_timeout;
    timeouts.keep_alive_pings = true;
    connection->ws.set_option(timeouts);
    connection->ws.set_option(
        websocket::stream_base::decorator([](websocket::request_type& request) {
          request.set(beast::http::field::user_agent, kUserAgent);
        }));
    co_await connection->ws.async_handshake(endpoint.HostHeader(), endpoint.target,
                                            asio::use_awaitable);
  } catch (const boost::system::system_error& ex) {
    if (!stopping_) {
      logger_.Error("connection attempt failed", {{"error", ex.code().message()}});
    }
    co_return;
  }

  std::string registration;
  std::string error;
  if (!controller_.BeginRegistration(registration, error)) {
    logger_.Error("cannot register with control server", {{"error", error}});
    RequestStop(core::errors::ExitCode::kIdentityMissing);
    co_return;
  }

  try {
    co_await connection->ws.async_write(asio::buffer(registration), asio::use_awaitable);
  } catch (const boost::system::system_error& ex) {
    if (!stopping_) {
      logger_.Error("failed to send registration", {{"error", ex.code().message()}});
    }
    co_return;
  }
  controller_.OnRegistered();

  asio::co_spawn(io_, WriteLoop(connection), asio::detached);

  beast::flat_buffer buffer;
  std::string reason;
  try {
    for (;;) {
      co_await connection->ws.async_read(buffer, asio::use_awaitable);
      const std::string frame = beast::buffers_to_string(buffer.data());
      buffer.consume(buffer.size());
      controller_.HandleFrame(frame);
    }
  } catch (const boost::system::system_error& ex) {
    reason = ex.code() == websocket::error::closed ? "closed by server" : ex.code().message();
  }
  if (!stopping_) {
    logger_.Warn("connection lost", {{"reason", reason}});
  }
}

asio::awaitable<void> WebSocketSession::WriteLoop(std::shared_ptr<Connection> connection) {
  try {
    while (!connection->closed) {
      if (connection->outbox.empty()) {
        connection->wake_writer.expires_at(asio::steady_timer::time_point::max());
        // Cancellation is the wake-up signal, so the error code carries nothing.
        boost::system::error_code ec;
        co_await connection->wake_writer.async_wait(asio::redirect_error(asio::use_awaitable, ec));
        continue;
      }
      const std::string frame = std::move(connection->outbox.front());
      connection->outbox.pop_front();
      co_await connection->ws.async_write(asio::buffer(frame), asio::use_awaitable);
    }
  } catch (const boost::system::system_error& ex) {
    if (!connection->closed) {
      logger_.Warn("failed to send result", {{"error", ex.code().message()}});
      CloseConnection(*connection);
    }
  }
}

void WebSocketSession::DeliverResult(const std::uint64_t generation, std::string frame) {
  if (current_ == nullptr || current_->closed || !controller_.AcceptsResultFrom(generation)) {
    logger_.Warn("discarding result from a closed connection",
                 {{"generation", std::to_string(generation)}});
    return;
  }
  current_->outbox.push_back(std::move(frame));
  current_->wake_writer.cancel();
}

} // namespace netdiag::session
