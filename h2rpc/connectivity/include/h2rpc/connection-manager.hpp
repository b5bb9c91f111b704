#pragma once

#include <cstdint>
#include <functional>
#include <optional>
#include <string_view>
#include <vector>

#include "h2rpc/channel.hpp"
#include "h2rpc/client-connection-config.hpp"
#include "h2rpc/connection-backoff.hpp"
#include "h2rpc/connectivity-state-monitor.hpp"
#include "h2rpc/connectivity-state.hpp"
#include "h2rpc/scheduler.hpp"
#include "h2rpc/status.hpp"
#include "h2rpc/timedef.hpp"

namespace h2rpc {

// Client side lifecycle of a logical connection: establishes physical channels on demand, replaces them when they
// fail (following the backoff sequence) and lets them go when they become idle.
//
//   idle -> connecting -> active -> ready -> idle
//                |           |        |
//                v           v        v
//         transientFailure (then connecting again)  /  shutdown (terminal, reachable from any state)
//
// 'active' means connected but not usable yet (the peer SETTINGS have not been received), it is reported as
// connecting. All methods must be called from the scheduler's context.
class ConnectionManager {
 public:
  enum class State : uint8_t { idle, connecting, active, ready, transientFailure, shutdown };

  // Invoked once with a ready channel and an ok status, or with a null channel and an unavailable status.
  using ChannelWaiter = std::function<void(const ChannelPtr&, const Status&)>;

  // 'scheduler', 'connector' and 'delegate' are not owned and should outlive the manager. 'delegate' may be null.
  // 'backoff' is std::nullopt to never reconnect.
  ConnectionManager(Scheduler& scheduler, ChannelConnector& connector, std::optional<ConnectionBackoff> backoff,
                    ConnectivityStateDelegate* delegate = nullptr);

  // Manager reconnecting with the backoff of 'config'. The rest of 'config' is exposed through config() for the
  // connections it establishes. Throws invalid_argument if 'config' is invalid.
  ConnectionManager(Scheduler& scheduler, ChannelConnector& connector, ClientConnectionConfig config,
                    ConnectivityStateDelegate* delegate = nullptr);

  ConnectionManager(const ConnectionManager&) = delete;
  ConnectionManager(ConnectionManager&&) = delete;
  ConnectionManager& operator=(const ConnectionManager&) = delete;
  ConnectionManager& operator=(ConnectionManager&&) = delete;

  ~ConnectionManager();

  // Calls 'waiter' once a ready channel is available, starting to connect if idle.
  void getChannel(ChannelWaiter waiter);

  // Current channel, whether ready or not, starting to connect if idle. Returns null if there is none yet.
  ChannelPtr getOptimisticChannel();

  // Moves to shutdown: cancels any scheduled reconnection, fails channel waiters and closes the channel. Idempotent.
  void shutdown();

  // ---- Events from the channel ----

  // The connection attempt succeeded.
  void channelActive(ChannelPtr channel);

  // An active or ready channel was closed.
  void channelInactive();

  // The first SETTINGS frame of the peer was received.
  void ready();

  // The ready channel has no active streams anymore and is being closed.
  void idle();

  // The connection attempt failed.
  void connectionFailed(std::string_view reason);

  [[nodiscard]] State state() const noexcept { return _state; }

  [[nodiscard]] ConnectivityStateMonitor& monitor() noexcept { return _monitor; }

  [[nodiscard]] ConnectivityState connectivityState() const noexcept { return _monitor.state(); }

  [[nodiscard]] const ClientConnectionConfig& config() const noexcept { return _config; }

 private:
  void setState(State state);

  void startConnecting();

  // Schedules a connection attempt after 'delay' and moves to transientFailure.
  void scheduleReconnect(FloatingSeconds delay);

  void failWaiters(const Status& status);

  [[noreturn]] void invalidState(std::string_view event) const;

  Scheduler& _scheduler;
  ChannelConnector& _connector;
  ConnectivityStateMonitor _monitor;
  ClientConnectionConfig _config;
  std::optional<ConnectionBackoffIterator> _backoffIterator;
  // Delay before the next attempt if the current one fails, std::nullopt to shut down instead.
  std::optional<FloatingSeconds> _reconnectDelay;
  std::vector<ChannelWaiter> _waiters;
  // Candidate channel in active state, ready channel in ready state.
  ChannelPtr _channel;
  ScheduledTask _scheduledReconnect;
  State _state{State::idle};
};

constexpr std::string_view ConnectionManagerStateName(ConnectionManager::State state) noexcept {
  switch (state) {
    case ConnectionManager::State::idle:
      return "idle";
    case ConnectionManager::State::connecting:
      return "connecting";
    case ConnectionManager::State::active:
      return "active";
    case ConnectionManager::State::ready:
      return "ready";
    case ConnectionManager::State::transientFailure:
      return "transient-failure";
    case ConnectionManager::State::shutdown:
      return "shutdown";
    default:
      return "unknown";
  }
}

}  // namespace h2rpc
