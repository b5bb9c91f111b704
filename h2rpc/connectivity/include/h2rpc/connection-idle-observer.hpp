#pragma once

#include <cstdint>
#include <string_view>

#include "h2rpc/channel.hpp"
#include "h2rpc/connection-keepalive.hpp"
#include "h2rpc/scheduler.hpp"
#include "h2rpc/timedef.hpp"

namespace h2rpc {

class ConnectionManager;

// Watches the stream activity of one physical connection and closes it once it has had no active stream for the
// idle timeout. In the client role, lifecycle events are forwarded to the ConnectionManager.
// It also runs the keepalive of the connection: a connection whose ping is not acknowledged in time is closed
// without being reported as idle, the manager then sees it as failed when it becomes inactive.
//
// All methods must be called from the scheduler's context. The connection is closed on a later tick of the
// scheduler, never from within an event handler.
class ConnectionIdleObserver {
 public:
  static constexpr SteadyDuration kNoIdleTimeout = SteadyDuration::max();

  enum class State : uint8_t { notReady, ready, closed };

  // Opaque data of the keepalive pings, per role.
  static constexpr uint64_t kClientPingData = 5;
  static constexpr uint64_t kServerPingData = 10;

  // Client role, with the idle timeout and keepalive of the manager's configuration.
  ConnectionIdleObserver(Scheduler& scheduler, ConnectionManager& manager);

  // Client role.
  ConnectionIdleObserver(Scheduler& scheduler, ConnectionManager& manager, SteadyDuration idleTimeout,
                         ConnectionKeepalive keepalive = {});

  // Server role: no manager to notify.
  ConnectionIdleObserver(Scheduler& scheduler, SteadyDuration idleTimeout, ConnectionKeepalive keepalive = {});

  ConnectionIdleObserver(const ConnectionIdleObserver&) = delete;
  ConnectionIdleObserver(ConnectionIdleObserver&&) = delete;
  ConnectionIdleObserver& operator=(const ConnectionIdleObserver&) = delete;
  ConnectionIdleObserver& operator=(ConnectionIdleObserver&&) = delete;

  ~ConnectionIdleObserver();

  void streamCreated(uint32_t streamId);

  void streamClosed(uint32_t streamId);

  // The connection is established. 'channel' is the one closed on idle.
  void channelActive(ChannelPtr channel);

  void channelInactive();

  // A SETTINGS frame was received from the peer.
  void settingsReceived();

  // A GOAWAY frame was received from the peer.
  void goAwayReceived();

  // A PING frame was received from the peer. Pings are acknowledged, acknowledgments of our keepalive ping cancel
  // its timeout.
  void pingReceived(uint64_t opaqueData, bool ack);

  [[nodiscard]] State state() const noexcept { return _state; }

  [[nodiscard]] uint32_t activeStreams() const noexcept { return _activeStreams; }

  [[nodiscard]] bool idleTimerScheduled() const noexcept {
    return _idleTask && !_idleTask.isCancelled() && !_idleTask.hasRun();
  }

  [[nodiscard]] bool pingTimeoutScheduled() const noexcept {
    return _pingTimeoutTask && !_pingTimeoutTask.isCancelled() && !_pingTimeoutTask.hasRun();
  }

 private:
  void scheduleIdleTimeout();

  void cancelIdleTimeout() noexcept;

  void idleTimeoutFired();

  void scheduleNextPing();

  void pingTimerFired();

  void pingTimeoutFired();

  [[nodiscard]] bool shouldBlockPing() const;

  void sendPing(uint64_t opaqueData, bool ack);

  void cancelTimers() noexcept;

  // Moves to closed and closes the channel on the next tick. A ready connection closed for being idle is reported
  // to the manager as such.
  void close(std::string_view reason, bool idle);

  Scheduler& _scheduler;
  ConnectionManager* _manager;
  ChannelPtr _channel;
  SteadyDuration _idleTimeout;
  ConnectionKeepalive _keepalive;
  ScheduledTask _idleTask;
  ScheduledTask _pingTask;
  ScheduledTask _pingTimeoutTask;
  SteadyTimePoint _lastPingSentTime;
  uint64_t _pingData;
  uint32_t _activeStreams{};
  uint32_t _pingsWithoutData{};
  State _state{State::notReady};
  // Set once the manager has been told the channel is gone (idle or inactive).
  bool _managerDetached{false};
  bool _keepaliveStarted{false};
  bool _pingSent{false};
};

constexpr std::string_view ConnectionIdleObserverStateName(ConnectionIdleObserver::State state) noexcept {
  switch (state) {
    case ConnectionIdleObserver::State::notReady:
      return "not-ready";
    case ConnectionIdleObserver::State::ready:
      return "ready";
    case ConnectionIdleObserver::State::closed:
      return "closed";
    default:
      return "unknown";
  }
}

}  // namespace h2rpc
