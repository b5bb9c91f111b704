#pragma once

#include <cstdint>
#include <memory>
#include <optional>

#include "h2rpc/timedef.hpp"

namespace h2rpc {

// Physical connection carrying the streams of a client or server.
class Channel {
 public:
  virtual ~Channel() = default;

  // Closes the connection and all its streams, without waiting for the outcome.
  // The transport later reports the channel as inactive.
  virtual void close() = 0;

  // Sends a PING frame carrying 'opaqueData', flagged as an acknowledgment if 'ack' is set.
  virtual void sendPing(uint64_t opaqueData, bool ack) = 0;
};

using ChannelPtr = std::shared_ptr<Channel>;

class ConnectionManager;

// Starts physical connection attempts on behalf of a ConnectionManager.
// The outcome of an attempt is reported to the manager, from its scheduler's context:
// channelActive() once connected, or connectionFailed() if the attempt failed (including on timeout).
class ChannelConnector {
 public:
  virtual ~ChannelConnector() = default;

  // 'connectTimeout' is std::nullopt when the attempt should not time out.
  virtual void connect(ConnectionManager& manager, std::optional<FloatingSeconds> connectTimeout) = 0;
};

}  // namespace h2rpc
