#pragma once

#include "hostprobe/host_identity.hpp"
#include "session/probe_dispatcher.hpp"
#include "session/session_state.hpp"

#include <cstdint>
#include <functional>
#include <string>
#include <string_view>

namespace netdiag::core::logging {
class Logger;
}

namespace netdiag::session {

// Who this agent says it is in registration and result messages.
struct SessionIdentity {
  std::string agreement_id;
  std::string city;
  hostprobe::HostIdentity host;
};

// Transport-independent half of the session: lifecycle state, registration,
// frame handling and result framing. Not thread-safe; the owning transport
// calls it from its single I/O thread. Only the result sink runs elsewhere.
class SessionController {
public:
  // Receives a ready-to-send result frame together with the connection
  // generation its command arrived on. Called on a probe worker thread.
  using ResultSink = std::function<void(std::uint64_t generation, std::string frame)>;

  SessionController(SessionIdentity identity,
                    IProbeDispatcher& dispatcher,
                    core::logging::Logger& logger,
                    ResultSink result_sink);

  SessionState state() const {
    return state_;
  }

  // Incremented on every new connection attempt.
  std::uint64_t generation() const {
    return generation_;
  }

  const SessionIdentity& identity() const {
    return identity_;
  }

  // Disconnected -> Connecting.
  void OnConnecting();

  // Connecting -> Registering, producing the registration frame to send.
  // Fails without changing state when the agreement id is empty; that is a
  // static misconfiguration and the caller must stop the agent.
  bool BeginRegistration(std::string& frame, std::string& error);

  // Registering -> Active, once the registration frame was written.
  void OnRegistered();

  // Any state -> Disconnected. Results still in flight for the old
  // connection are no longer accepted.
  void OnDisconnected();

  // Handles one inbound frame while Active. Returns false only for frames that
  // are not JSON objects; those are logged and otherwise ignored.
  bool HandleFrame(std::string_view frame);

  // A result may be sent only on the connection its command arrived on.
  bool AcceptsResultFrom(std::uint64_t generation) const;

private:
  void Transition(SessionState next);
  void DispatchCommand(probe::DiagnosticCommand command, std::string wire_command);

  SessionIdentity identity_;
  IProbeDispatcher& dispatcher_;
  core::logging::Logger& logger_;
  ResultSink result_sink_;
  SessionState state_ = SessionState::kDisconnected;
  std::uint64_t generation_ = 0;
};

} // namespace netdiag::session
