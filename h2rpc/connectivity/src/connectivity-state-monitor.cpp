#include "h2rpc/connectivity-state-monitor.hpp"

#include <mutex>
#include <utility>

#include "h2rpc/connectivity-state.hpp"
#include "h2rpc/log.hpp"

namespace h2rpc {

void ConnectivityStateMonitor::updateState(ConnectivityState newState) {
  ConnectivityState oldState;
  ConnectivityStateDelegate* delegate;
  Callback callback;
  {
    std::scoped_lock lock(_mutex);
    oldState = _state;
    if (oldState == newState) {
      return;
    }
    if (oldState == ConnectivityState::shutdown) {
      log::warn("Ignoring connectivity state update to {} after shutdown", ConnectivityStateName(newState));
      return;
    }
    _state = newState;
    delegate = _delegate;
    callback = std::exchange(_callbacks[static_cast<int>(newState)], {});
  }

  log::debug("Connectivity state change: {} -> {}", ConnectivityStateName(oldState), ConnectivityStateName(newState));
  if (delegate != nullptr) {
    delegate->connectivityStateDidChange(oldState, newState);
  }
  if (callback) {
    callback();
  }
}

void ConnectivityStateMonitor::onNext(ConnectivityState state, Callback callback) {
  std::scoped_lock lock(_mutex);
  _callbacks[static_cast<int>(state)] = std::move(callback);
}

void ConnectivityStateMonitor::setDelegate(ConnectivityStateDelegate* delegate) noexcept {
  std::scoped_lock lock(_mutex);
  _delegate = delegate;
}

ConnectivityState ConnectivityStateMonitor::state() const noexcept {
  std::scoped_lock lock(_mutex);
  return _state;
}

}  // namespace h2rpc
