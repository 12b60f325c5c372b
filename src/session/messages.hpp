#pragma once

#include <optional>
#include <string>
#include <string_view>

namespace netdiag::session {

inline constexpr std::string_view kCommandMessageType = "command";
inline constexpr std::string_view kRegistrationMessageType = "registration";
inline constexpr std::string_view kResultMessageType = "result";

// Fields of an inbound frame the agent cares about. Fields that are absent or
// not strings are left empty; deciding what to do with them is the caller's job.
struct InboundMessage {
  std::optional<std::string> type;
  std::optional<std::string> command;
  std::optional<std::string> target;
};

// Fails only when the frame is not JSON or not a JSON object.
bool ParseInboundMessage(std::string_view frame, InboundMessage& message, std::string& error);

struct RegistrationInfo {
  std::string agreement_id;
  std::string city;
  std::string os;
  std::string hostname;
};

// {"type":"registration","data":{"agreement_id":..,"city":..,"os":..,"hostname":..}}
std::string BuildRegistrationMessage(const RegistrationInfo& info);

struct ResultMessage {
  std::string agreement;
  std::string city;
  std::string command;
  std::string target;
  // JSON payload text or "Error: ..."; always sent as a JSON string.
  std::string result;
};

// {"type":"result","agreement":..,"city":..,"command":..,"target":..,"result":..}
std::string BuildResultMessage(const ResultMessage& message);

} // namespace netdiag::session
