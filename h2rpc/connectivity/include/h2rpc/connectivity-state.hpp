#pragma once

#include <cstdint>
#include <string_view>

namespace h2rpc {

// Public lifecycle state of a client connection. shutdown is terminal.
enum class ConnectivityState : uint8_t { idle, connecting, ready, transientFailure, shutdown };

inline constexpr int kNbConnectivityStates = 5;

constexpr std::string_view ConnectivityStateName(ConnectivityState state) noexcept {
  switch (state) {
    case ConnectivityState::idle:
      return "idle";
    case ConnectivityState::connecting:
      return "connecting";
    case ConnectivityState::ready:
      return "ready";
    case ConnectivityState::transientFailure:
      return "transient-failure";
    case ConnectivityState::shutdown:
      return "shutdown";
    default:
      return "unknown";
  }
}

}  // namespace h2rpc
