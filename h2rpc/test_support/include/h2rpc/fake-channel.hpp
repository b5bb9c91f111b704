#pragma once

#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <vector>

#include "h2rpc/channel.hpp"
#include "h2rpc/timedef.hpp"

namespace h2rpc::test {

// Channel recording close requests and sent pings.
class FakeChannel final : public Channel {
 public:
  struct Ping {
    uint64_t opaqueData;
    bool ack;

    bool operator==(const Ping&) const noexcept = default;
  };

  static std::shared_ptr<FakeChannel> Make() { return std::make_shared<FakeChannel>(); }

  void close() override { ++_nbCloseCalls; }

  void sendPing(uint64_t opaqueData, bool ack) override { _pings.push_back(Ping{opaqueData, ack}); }

  [[nodiscard]] const std::vector<Ping>& pings() const noexcept { return _pings; }

  [[nodiscard]] bool closed() const noexcept { return _nbCloseCalls != 0; }

  [[nodiscard]] std::size_t nbCloseCalls() const noexcept { return _nbCloseCalls; }

 private:
  std::vector<Ping> _pings;
  std::size_t _nbCloseCalls{};
};

// Connector recording connection attempts. Tests report their outcome to the manager by hand.
class FakeConnector final : public ChannelConnector {
 public:
  void connect(ConnectionManager& /*manager*/, std::optional<FloatingSeconds> connectTimeout) override {
    _attempts.push_back(connectTimeout);
  }

  [[nodiscard]] std::size_t nbAttempts() const noexcept { return _attempts.size(); }

  [[nodiscard]] const std::vector<std::optional<FloatingSeconds>>& attempts() const noexcept { return _attempts; }

 private:
  std::vector<std::optional<FloatingSeconds>> _attempts;
};

}  // namespace h2rpc::test
