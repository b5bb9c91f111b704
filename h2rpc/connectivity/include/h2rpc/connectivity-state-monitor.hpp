#pragma once

#include <array>
#include <functional>
#include <mutex>

#include "h2rpc/connectivity-state.hpp"

namespace h2rpc {

// Receives every connectivity state change of a connection.
class ConnectivityStateDelegate {
 public:
  virtual ~ConnectivityStateDelegate() = default;

  virtual void connectivityStateDidChange(ConnectivityState oldState, ConnectivityState newState) = 0;
};

// Holds the connectivity state of a connection and notifies observers of its changes.
// State changes come from the connection's serial context, the state may be queried from any thread.
// The delegate and callbacks are invoked outside of the internal lock, from the thread updating the state.
class ConnectivityStateMonitor {
 public:
  using Callback = std::function<void()>;

  // 'delegate' is not owned and may be null.
  explicit ConnectivityStateMonitor(ConnectivityStateDelegate* delegate = nullptr) noexcept : _delegate(delegate) {}

  // Moves to 'newState'. Updating to the current state is a no-op, as is any update once shutdown has been entered.
  void updateState(ConnectivityState newState);

  // Registers a single-fire callback for the next entry into 'state', replacing a pending one for the same state.
  void onNext(ConnectivityState state, Callback callback);

  void setDelegate(ConnectivityStateDelegate* delegate) noexcept;

  [[nodiscard]] ConnectivityState state() const noexcept;

 private:
  mutable std::mutex _mutex;
  std::array<Callback, kNbConnectivityStates> _callbacks;
  ConnectivityStateDelegate* _delegate;
  ConnectivityState _state{ConnectivityState::idle};
};

}  // namespace h2rpc
