#include <h2rpc/channel.hpp>
#include <h2rpc/client-connection-config.hpp>
#include <h2rpc/connection-backoff.hpp>
#include <h2rpc/connection-idle-observer.hpp>
#include <h2rpc/connection-manager.hpp>
#include <h2rpc/connectivity-state-monitor.hpp>
#include <h2rpc/connectivity-state.hpp>
#include <h2rpc/log.hpp>
#include <h2rpc/serial-executor.hpp>
#include <h2rpc/status.hpp>
#include <h2rpc/timedef.hpp>

#include <chrono>
#include <cstdint>
#include <exception>
#include <iostream>
#include <memory>
#include <optional>
#include <string>
#include <vector>

using namespace h2rpc;

namespace {

// In-process channel: closing it reports the channel as inactive on the next tick, pings are acknowledged by the
// other end on the next tick.
class LoopbackChannel final : public Channel {
 public:
  LoopbackChannel(SerialExecutor& executor, ConnectionIdleObserver& observer)
      : _executor(executor), _observer(observer) {}

  void close() override {
    log::info("Closing loopback channel");
    _executor.execute([this] { _observer.channelInactive(); });
  }

  void sendPing(uint64_t opaqueData, bool ack) override {
    if (!ack) {
      _executor.execute([this, opaqueData] { _observer.pingReceived(opaqueData, true); });
    }
  }

 private:
  SerialExecutor& _executor;
  ConnectionIdleObserver& _observer;
};

// Refuses the first 'nbFailures' attempts, then connects immediately.
class SimulatedConnector final : public ChannelConnector {
 public:
  SimulatedConnector(SerialExecutor& executor, int nbFailures) : _executor(executor), _nbFailures(nbFailures) {}

  void connect(ConnectionManager& manager, std::optional<FloatingSeconds> connectTimeout) override {
    ++_nbAttempts;
    log::info("Connection attempt {} (timeout {})", _nbAttempts,
              connectTimeout ? std::to_string(connectTimeout->count()) + "s" : std::string("none"));
    if (_nbAttempts <= _nbFailures) {
      _executor.execute([&manager] { manager.connectionFailed("connection refused"); });
      return;
    }
    auto& observer =
        *_observers.emplace_back(std::make_unique<ConnectionIdleObserver>(_executor, manager));
    auto& channel = _channels.emplace_back(std::make_shared<LoopbackChannel>(_executor, observer));
    _executor.execute([&observer, channel] {
      observer.channelActive(channel);
      observer.settingsReceived();
    });
  }

 private:
  SerialExecutor& _executor;
  // Kept until the end of the program, pending tasks may still refer to them.
  std::vector<std::unique_ptr<ConnectionIdleObserver>> _observers;
  std::vector<ChannelPtr> _channels;
  int _nbFailures;
  int _nbAttempts{};
};

class PrintingDelegate final : public ConnectivityStateDelegate {
 public:
  void connectivityStateDidChange(ConnectivityState oldState, ConnectivityState newState) override {
    std::cout << "connectivity: " << ConnectivityStateName(oldState) << " -> " << ConnectivityStateName(newState)
              << '\n';
  }
};

}  // namespace

int main(int argc, char** argv) {
  int nbFailures = 2;
  if (argc > 1) {
    nbFailures = std::stoi(argv[1]);
  }

  log::set_level(log::level::debug);

  try {
    SerialExecutor executor;
    PrintingDelegate delegate;
    SimulatedConnector connector(executor, nbFailures);

    ConnectionBackoff backoff;
    backoff.withInitialBackoff(FloatingSeconds(0.05))
        .withMaximumBackoff(FloatingSeconds(1))
        .withMultiplier(2.0)
        .withMinimumConnectionTimeout(FloatingSeconds(1));

    ClientConnectionConfig config;
    config.withConnectionBackoff(backoff).withIdleTimeout(std::chrono::milliseconds(200));

    ConnectionManager manager(executor, connector, config, &delegate);

    // Once the channel went idle after being ready, stop the loop.
    bool wasReady = false;
    manager.monitor().onNext(ConnectivityState::ready, [&wasReady] { wasReady = true; });

    executor.execute([&] {
      manager.getChannel([&](const ChannelPtr& channel, const Status& status) {
        if (channel) {
          std::cout << "Got a ready channel\n";
        } else {
          std::cout << "No channel: " << status.toString() << '\n';
          executor.stop();
        }
      });
      manager.monitor().onNext(ConnectivityState::idle, [&] {
        if (wasReady) {
          std::cout << "Connection went idle, shutting down\n";
          executor.execute([&] {
            manager.shutdown();
            executor.stop();
          });
        }
      });
    });

    executor.run();
  } catch (const std::exception& e) {
    std::cerr << "Error: " << e.what() << '\n';
    return 1;
  }
  return 0;
}
