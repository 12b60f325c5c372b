#pragma once

#include <string_view>

namespace netdiag::session {

// Connection lifecycle. Owned by the session; probe workers never touch it.
enum class SessionState {
  kDisconnected,
  kConnecting,
  kRegistering,
  kActive,
};

inline std::string_view ToString(const SessionState state) {
  switch (state) {
  case SessionState::kDisconnected:
    return "disconnected";
  case SessionState::kConnecting:
    return "connecting";
  case SessionState::kRegistering:
    return "registering";
  case SessionState::kActive:
    return "active";
  }
  return "disconnected";
}

} // namespace netdiag::session
