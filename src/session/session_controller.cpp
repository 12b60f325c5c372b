#include "session/session_controller.hpp"

#include "core/logging/logger.hpp"
#include "probe/probe_error.hpp"
#include "session/messages.hpp"

#include <utility>

namespace netdiag::session {

SessionController::SessionController(SessionIdentity identity,
                                     IProbeDispatcher& dispatcher,
                                     core::logging::Logger& logger,
                                     ResultSink result_sink)
    : identity_(std::move(identity)),
      dispatcher_(dispatcher),
      logger_(logger),
      result_sink_(std::move(result_sink)) {}

void SessionController::Transition(const SessionState next) {
  if (next == state_) {
    return;
  }
  logger_.Debug("session state changed", {
                                             {"from", ToString(state_)},
                                             {"to", ToString(next)},
                                         });
  state_ = next;
}

void SessionController::OnConnecting() {
  ++generation_;
  Transition(SessionState::kConnecting);
}

bool SessionController::BeginRegistration(std::string& frame, std::string& error) {
  frame.clear();
  error.clear();
  if (identity_.agreement_id.empty()) {
    error = "agreement_id is not set in the agent config";
    return false;
  }

  Transition(SessionState::kRegistering);
  frame = BuildRegistrationMessage(RegistrationInfo{
      .agreement_id = identity_.agreement_id,
      .city = identity_.city,
      .os = identity_.host.os_name,
      .hostname = identity_.host.hostname,
  });
  return true;
}

void SessionController::OnRegistered() {
  Transition(SessionState::kActive);
  logger_.Info("registered with control server", {
                                                     {"city", identity_.city},
                                                     {"os", identity_.host.os_name},
                                                     {"hostname", identity_.host.hostname},
                                                 });
}

void SessionController::OnDisconnected() {
  Transition(SessionState::kDisconnected);
}

bool SessionController::AcceptsResultFrom(const std::uint64_t generation) const {
  return state_ == SessionState::kActive && generation == generation_;
}

bool SessionController::HandleFrame(const std::string_view frame) {
  if (state_ != SessionState::kActive) {
    logger_.Debug("frame ignored outside active state", {{"state", ToString(state_)}});
    return true;
  }

  InboundMessage message;
  std::string error;
  if (!ParseInboundMessage(frame, message, error)) {
    logger_.Error("malformed frame from control server", {{"error", error}});
    return false;
  }

  if (!message.type.has_value() || *message.type != kCommandMessageType) {
    logger_.Debug("ignoring frame", {{"type", message.type.value_or("")}});
    return true;
  }

  const std::string wire_command = message.command.value_or("");
  const auto kind = probe::ParseCommandKind(wire_command);
  if (!kind.has_value()) {
    logger_.Debug("ignoring unknown command", {{"command", wire_command}});
    return true;
  }

  DispatchCommand(probe::DiagnosticCommand{.kind = *kind,
                                           .target = message.target.value_or("")},
                  wire_command);
  return true;
}

void SessionController::DispatchCommand(probe::DiagnosticCommand command,
                                        std::string wire_command) {
  logger_.Info("command received", {
                                       {"command", wire_command},
                                       {"target", command.target},
                                   });

  // The completion runs on a worker thread: it only reads copies and the
  // immutable identity, never session state.
  ResultMessage result{
      .agreement = identity_.agreement_id,
      .city = identity_.city,
      .command = std::move(wire_command),
      .target = command.target,
      .result = {},
  };
  dispatcher_.Dispatch(std::move(command),
                       [sink = result_sink_, generation = generation_,
                        result = std::move(result)](probe::ProbeOutcome outcome) mutable {
                         result.result = probe::ToWireString(outcome);
                         sink(generation, BuildResultMessage(result));
                       });
}

} // namespace netdiag::session
