#include "session/messages.hpp"

#include "core/json_dom.hpp"
#include "core/json_utils.hpp"

#include <sstream>

namespace netdiag::session {

namespace {

std::optional<std::string> OptionalString(const core::json::Value& root, std::string_view key) {
  const std::string* value = core::json::FindString(root, key);
  if (value == nullptr) {
    return std::nullopt;
  }
  return *value;
}

} // namespace

bool ParseInboundMessage(const std::string_view frame, InboundMessage& message,
                         std::string& error) {
  message = InboundMessage{};
  error.clear();

  core::json::Value root;
  if (!core::json::Parse(frame, root, error)) {
    return false;
  }
  if (root.type != core::json::Value::Type::kObject) {
    error = "inbound frame must be a JSON object";
    return false;
  }

  message.type = OptionalString(root, "type");
  message.command = OptionalString(root, "command");
  message.target = OptionalString(root, "target");
  return true;
}

std::string BuildRegistrationMessage(const RegistrationInfo& info) {
  std::ostringstream out;
  out << "{\"type\":" << core::QuoteJson(kRegistrationMessageType)
      << ",\"data\":{"
      << "\"agreement_id\":" << core::QuoteJson(info.agreement_id)
      << ",\"city\":" << core::QuoteJson(info.city)
      << ",\"os\":" << core::QuoteJson(info.os)
      << ",\"hostname\":" << core::QuoteJson(info.hostname)
      << "}}";
  return out.str();
}

std::string BuildResultMessage(const ResultMessage& message) {
  std::ostringstream out;
  out << "{\"type\":" << core::QuoteJson(kResultMessageType)
      << ",\"agreement\":" << core::QuoteJson(message.agreement)
      << ",\"city\":" << core::QuoteJson(message.city)
      << ",\"command\":" << core::QuoteJson(message.command)
      << ",\"target\":" << core::QuoteJson(message.target)
      << ",\"result\":" << core::QuoteJson(message.result)
      << "}";
  return out.str();
}

} // namespace netdiag::session
