#include "h2rpc/connection-manager.hpp"

#include <chrono>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "h2rpc/channel.hpp"
#include "h2rpc/client-connection-config.hpp"
#include "h2rpc/connectivity-state.hpp"
#include "h2rpc/invalid-state-error.hpp"
#include "h2rpc/log.hpp"
#include "h2rpc/scheduler.hpp"
#include "h2rpc/status-code.hpp"
#include "h2rpc/status.hpp"
#include "h2rpc/timedef.hpp"

namespace h2rpc {

ConnectionManager::ConnectionManager(Scheduler& scheduler, ChannelConnector& connector,
                                     std::optional<ConnectionBackoff> backoff, ConnectivityStateDelegate* delegate)
    : ConnectionManager(scheduler, connector, ClientConnectionConfig{}.withConnectionBackoff(std::move(backoff)),
                        delegate) {}

ConnectionManager::ConnectionManager(Scheduler& scheduler, ChannelConnector& connector, ClientConnectionConfig config,
                                     ConnectivityStateDelegate* delegate)
    : _scheduler(scheduler), _connector(connector), _monitor(delegate), _config(std::move(config)) {
  _config.validate();
}

ConnectionManager::~ConnectionManager() { _scheduledReconnect.cancel(); }

void ConnectionManager::getChannel(ChannelWaiter waiter) {
  switch (_state) {
    case State::idle:
      _waiters.push_back(std::move(waiter));
      startConnecting();
      break;
    case State::connecting:
      [[fallthrough]];
    case State::active:
      [[fallthrough]];
    case State::transientFailure:
      _waiters.push_back(std::move(waiter));
      break;
    case State::ready:
      waiter(_channel, Status{});
      break;
    case State::shutdown:
      waiter(nullptr, Status(StatusCode::unavailable, "connection is shut down"));
      break;
    default:
      invalidState("getChannel");
  }
}

ChannelPtr ConnectionManager::getOptimisticChannel() {
  if (_state == State::idle) {
    startConnecting();
  }
  return _channel;
}

void ConnectionManager::shutdown() {
  if (_state == State::shutdown) {
    return;
  }
  _scheduledReconnect.cancel();
  ChannelPtr channel = std::exchange(_channel, nullptr);
  _backoffIterator.reset();
  setState(State::shutdown);

  failWaiters(Status(StatusCode::unavailable, "connection is shut down"));
  // In connecting state the channel is closed when it becomes active.
  if (channel) {
    channel->close();
  }
}

void ConnectionManager::channelActive(ChannelPtr channel) {
  switch (_state) {
    case State::connecting:
      _channel = std::move(channel);
      setState(State::active);
      break;
    case State::shutdown:
      // Shut down while connecting.
      if (channel) {
        channel->close();
      }
      break;
    default:
      invalidState("channelActive");
  }
}

void ConnectionManager::channelInactive() {
  switch (_state) {
    case State::active:
      _channel.reset();
      if (_reconnectDelay) {
        scheduleReconnect(*_reconnectDelay);
      } else {
        setState(State::shutdown);
        failWaiters(Status(StatusCode::unavailable, "connection closed before being ready"));
      }
      break;
    case State::ready:
      _channel.reset();
      if (_config.connectionBackoff) {
        // Replace the channel right away, with a fresh backoff sequence.
        _backoffIterator = _config.connectionBackoff->makeIterator();
        scheduleReconnect(FloatingSeconds::zero());
      } else {
        setState(State::shutdown);
      }
      break;
    case State::idle:
      // Expected after an idle close.
      [[fallthrough]];
    case State::shutdown:
      break;
    default:
      invalidState("channelInactive");
  }
}

void ConnectionManager::ready() {
  switch (_state) {
    case State::active: {
      _backoffIterator.reset();
      setState(State::ready);
      std::vector<ChannelWaiter> waiters = std::exchange(_waiters, {});
      const ChannelPtr channel = _channel;
      for (auto& waiter : waiters) {
        waiter(channel, Status{});
      }
      break;
    }
    case State::shutdown:
      break;
    default:
      invalidState("ready");
  }
}

void ConnectionManager::idle() {
  if (_state != State::ready) {
    invalidState("idle");
  }
  _channel.reset();
  setState(State::idle);
}

void ConnectionManager::connectionFailed(std::string_view reason) {
  switch (_state) {
    case State::connecting:
      log::warn("Connection attempt failed: {}", reason);
      if (_reconnectDelay) {
        scheduleReconnect(*_reconnectDelay);
      } else {
        setState(State::shutdown);
        failWaiters(Status(StatusCode::unavailable, std::string(reason)));
      }
      break;
    case State::shutdown:
      // Shut down while connecting.
      break;
    default:
      invalidState("connectionFailed");
  }
}

void ConnectionManager::setState(State state) {
  log::debug("Connection manager state change: {} -> {}", ConnectionManagerStateName(_state),
             ConnectionManagerStateName(state));
  _state = state;
  switch (state) {
    case State::idle:
      _monitor.updateState(ConnectivityState::idle);
      break;
    case State::connecting:
      _monitor.updateState(ConnectivityState::connecting);
      break;
    case State::active:
      // Not visible from the outside, still connecting.
      break;
    case State::ready:
      _monitor.updateState(ConnectivityState::ready);
      break;
    case State::transientFailure:
      _monitor.updateState(ConnectivityState::transientFailure);
      break;
    case State::shutdown:
      _monitor.updateState(ConnectivityState::shutdown);
      break;
    default:
      break;
  }
}

void ConnectionManager::startConnecting() {
  switch (_state) {
    case State::idle:
      if (_config.connectionBackoff) {
        _backoffIterator = _config.connectionBackoff->makeIterator();
      }
      break;
    case State::transientFailure:
      _scheduledReconnect = {};
      break;
    case State::shutdown:
      // Shut down before the scheduled attempt started.
      return;
    default:
      invalidState("startConnecting");
  }

  std::optional<ConnectionBackoffIterator::Element> timeoutAndBackoff;
  if (_backoffIterator) {
    timeoutAndBackoff = _backoffIterator->next();
  }
  std::optional<FloatingSeconds> connectTimeout;
  if (timeoutAndBackoff) {
    connectTimeout = timeoutAndBackoff->timeout;
    _reconnectDelay = timeoutAndBackoff->backoff;
  } else {
    // No backoff configured, or retries exhausted: this is the last attempt.
    _reconnectDelay.reset();
  }
  setState(State::connecting);
  _connector.connect(*this, connectTimeout);
}

void ConnectionManager::scheduleReconnect(FloatingSeconds delay) {
  log::debug("Reconnecting in {:.3f}s", delay.count());
  setState(State::transientFailure);
  _scheduledReconnect = _scheduler.scheduleTask(std::chrono::duration_cast<SteadyDuration>(delay),
                                                [this] { startConnecting(); });
}

void ConnectionManager::failWaiters(const Status& status) {
  std::vector<ChannelWaiter> waiters = std::exchange(_waiters, {});
  for (auto& waiter : waiters) {
    waiter(nullptr, status);
  }
}

void ConnectionManager::invalidState(std::string_view event) const {
  log::error("Invalid connection manager state {} for {}", ConnectionManagerStateName(_state), event);
  throw InvalidStateError("Invalid connection manager state {} for {}", ConnectionManagerStateName(_state), event);
}

}  // namespace h2rpc
