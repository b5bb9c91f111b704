#pragma once

#include <chrono>
#include <cstdint>

namespace h2rpc {

// HTTP/2 PING based keepalive of a connection, driven by ConnectionIdleObserver.
// Pings start with the first stream of the connection and are sent every 'interval'. If a ping is not acknowledged
// within 'timeout', the connection is considered dead and closed.
struct ConnectionKeepalive {
  static constexpr std::chrono::milliseconds kDefaultTimeout = std::chrono::seconds(20);
  static constexpr std::chrono::milliseconds kDefaultMinSentPingIntervalWithoutData = std::chrono::minutes(5);
  static constexpr uint32_t kDefaultMaxPingsWithoutData = 2;

  // Throws invalid_argument if any parameter is invalid.
  void validate() const;

  [[nodiscard]] bool enabled() const noexcept { return interval.count() > 0; }

  ConnectionKeepalive& withInterval(std::chrono::milliseconds value) {
    interval = value;
    return *this;
  }

  ConnectionKeepalive& withTimeout(std::chrono::milliseconds value) {
    timeout = value;
    return *this;
  }

  ConnectionKeepalive& withPermitWithoutCalls(bool value = true) {
    permitWithoutCalls = value;
    return *this;
  }

  ConnectionKeepalive& withMaxPingsWithoutData(uint32_t value) {
    maxPingsWithoutData = value;
    return *this;
  }

  ConnectionKeepalive& withMinSentPingIntervalWithoutData(std::chrono::milliseconds value) {
    minSentPingIntervalWithoutData = value;
    return *this;
  }

  bool operator==(const ConnectionKeepalive&) const noexcept = default;

  // Delay between two pings. 0 disables keepalive.
  std::chrono::milliseconds interval{0};

  // Maximum time to wait for the acknowledgment of a ping. Should be smaller than 'interval'.
  std::chrono::milliseconds timeout{kDefaultTimeout};

  // Keep pinging when the connection has no active stream.
  bool permitWithoutCalls{false};

  // Without active streams, at most this number of pings is sent until a stream is created again.
  uint32_t maxPingsWithoutData{kDefaultMaxPingsWithoutData};

  // Without active streams, minimum delay between two sent pings.
  std::chrono::milliseconds minSentPingIntervalWithoutData{kDefaultMinSentPingIntervalWithoutData};
};

}  // namespace h2rpc
