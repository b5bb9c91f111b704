#include "h2rpc/connection-idle-observer.hpp"

#include <cstdint>
#include <string_view>
#include <utility>

#include "h2rpc/channel.hpp"
#include "h2rpc/client-connection-config.hpp"
#include "h2rpc/connection-keepalive.hpp"
#include "h2rpc/connection-manager.hpp"
#include "h2rpc/log.hpp"
#include "h2rpc/scheduler.hpp"
#include "h2rpc/timedef.hpp"

namespace h2rpc {

ConnectionIdleObserver::ConnectionIdleObserver(Scheduler& scheduler, ConnectionManager& manager)
    : ConnectionIdleObserver(scheduler, manager, manager.config().idleTimeout, manager.config().keepalive) {}

ConnectionIdleObserver::ConnectionIdleObserver(Scheduler& scheduler, ConnectionManager& manager,
                                               SteadyDuration idleTimeout, ConnectionKeepalive keepalive)
    : _scheduler(scheduler),
      _manager(&manager),
      _idleTimeout(idleTimeout),
      _keepalive(keepalive),
      _pingData(kClientPingData) {}

ConnectionIdleObserver::ConnectionIdleObserver(Scheduler& scheduler, SteadyDuration idleTimeout,
                                               ConnectionKeepalive keepalive)
    : _scheduler(scheduler),
      _manager(nullptr),
      _idleTimeout(idleTimeout),
      _keepalive(keepalive),
      _pingData(kServerPingData) {}

ConnectionIdleObserver::~ConnectionIdleObserver() { cancelTimers(); }

void ConnectionIdleObserver::streamCreated(uint32_t streamId) {
  if (_state == State::closed) {
    return;
  }
  cancelIdleTimeout();
  ++_activeStreams;
  _pingsWithoutData = 0;
  log::trace("Stream {} created, {} active", streamId, _activeStreams);
  if (!_keepaliveStarted) {
    _keepaliveStarted = true;
    scheduleNextPing();
  }
}

void ConnectionIdleObserver::streamClosed(uint32_t streamId) {
  if (_state == State::closed) {
    return;
  }
  if (_activeStreams == 0) {
    log::warn("Stream {} closed while no stream is active", streamId);
    return;
  }
  --_activeStreams;
  log::trace("Stream {} closed, {} active", streamId, _activeStreams);
  if (_activeStreams == 0) {
    scheduleIdleTimeout();
  }
}

void ConnectionIdleObserver::channelActive(ChannelPtr channel) {
  if (_state != State::notReady) {
    return;
  }
  _channel = channel;
  if (_manager != nullptr) {
    _manager->channelActive(std::move(channel));
  }
}

void ConnectionIdleObserver::channelInactive() {
  cancelTimers();
  _channel.reset();
  _state = State::closed;
  if (_manager != nullptr && !_managerDetached) {
    // Not forwarded after idle(): the manager may already be connecting a new channel.
    _managerDetached = true;
    _manager->channelInactive();
  }
}

void ConnectionIdleObserver::settingsReceived() {
  if (_state != State::notReady) {
    // Only the first SETTINGS frame matters.
    return;
  }
  _state = State::ready;
  if (_activeStreams == 0) {
    scheduleIdleTimeout();
  }
  if (_manager != nullptr) {
    _manager->ready();
  }
}

void ConnectionIdleObserver::goAwayReceived() {
  if (_state == State::closed) {
    return;
  }
  if (_activeStreams != 0) {
    // Streams in flight may complete, idling is evaluated again when the last one closes.
    log::debug("GOAWAY received with {} active streams", _activeStreams);
    return;
  }
  close("GOAWAY received", true);
}

void ConnectionIdleObserver::pingReceived(uint64_t opaqueData, bool ack) {
  if (_state == State::closed) {
    return;
  }
  if (!ack) {
    sendPing(opaqueData, true);
    return;
  }
  if (opaqueData == _pingData) {
    _pingTimeoutTask.cancel();
    _pingTimeoutTask = {};
  } else {
    log::debug("Ignoring acknowledgment of unknown ping {}", opaqueData);
  }
}

void ConnectionIdleObserver::scheduleIdleTimeout() {
  cancelIdleTimeout();
  if (_state == State::closed || _idleTimeout == kNoIdleTimeout) {
    return;
  }
  _idleTask = _scheduler.scheduleTask(_idleTimeout, [this] { idleTimeoutFired(); });
}

void ConnectionIdleObserver::cancelIdleTimeout() noexcept {
  _idleTask.cancel();
  _idleTask = {};
}

void ConnectionIdleObserver::idleTimeoutFired() {
  _idleTask = {};
  if (_state == State::closed || _activeStreams != 0) {
    return;
  }
  close("idle timeout", true);
}

void ConnectionIdleObserver::scheduleNextPing() {
  if (!_keepalive.enabled() || _state == State::closed) {
    return;
  }
  _pingTask = _scheduler.scheduleTask(_keepalive.interval, [this] { pingTimerFired(); });
}

void ConnectionIdleObserver::pingTimerFired() {
  _pingTask = {};
  if (_state == State::closed) {
    return;
  }
  if (!shouldBlockPing()) {
    sendPing(_pingData, false);
    // The timeout is smaller than the interval, so it fires before the next ping is sent.
    _pingTimeoutTask.cancel();
    _pingTimeoutTask = _scheduler.scheduleTask(_keepalive.timeout, [this] { pingTimeoutFired(); });
  }
  scheduleNextPing();
}

void ConnectionIdleObserver::pingTimeoutFired() {
  _pingTimeoutTask = {};
  if (_state == State::closed) {
    return;
  }
  log::warn("Keepalive ping not acknowledged within {}ms", _keepalive.timeout.count());
  close("keepalive timeout", false);
}

bool ConnectionIdleObserver::shouldBlockPing() const {
  if (_activeStreams != 0) {
    return false;
  }
  if (!_keepalive.permitWithoutCalls || _pingsWithoutData >= _keepalive.maxPingsWithoutData) {
    return true;
  }
  return _pingSent && _scheduler.now() - _lastPingSentTime < _keepalive.minSentPingIntervalWithoutData;
}

void ConnectionIdleObserver::sendPing(uint64_t opaqueData, bool ack) {
  if (_activeStreams == 0) {
    ++_pingsWithoutData;
  }
  _lastPingSentTime = _scheduler.now();
  _pingSent = true;
  if (_channel) {
    _channel->sendPing(opaqueData, ack);
  }
}

void ConnectionIdleObserver::cancelTimers() noexcept {
  cancelIdleTimeout();
  _pingTask.cancel();
  _pingTask = {};
  _pingTimeoutTask.cancel();
  _pingTimeoutTask = {};
}

void ConnectionIdleObserver::close(std::string_view reason, bool idle) {
  cancelTimers();
  const State previous = std::exchange(_state, State::closed);
  log::debug("Closing connection ({}), state was {}", reason, ConnectionIdleObserverStateName(previous));
  // Before being ready, or when closed for another reason than idling, the manager learns about the closed channel
  // when it becomes inactive.
  if (_manager != nullptr && idle && previous == State::ready) {
    _managerDetached = true;
    _manager->idle();
  }
  ChannelPtr channel = std::exchange(_channel, nullptr);
  if (channel) {
    _scheduler.execute([channel = std::move(channel)] { channel->close(); });
  }
}

}  // namespace h2rpc
