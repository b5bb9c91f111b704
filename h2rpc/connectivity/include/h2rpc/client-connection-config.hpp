#pragma once

#include <chrono>
#include <cstddef>
#include <optional>
#include <utility>

#include "h2rpc/compression-algorithm.hpp"
#include "h2rpc/connection-backoff.hpp"
#include "h2rpc/connection-keepalive.hpp"
#include "h2rpc/message-codec.hpp"
#include "h2rpc/message-encoding-config.hpp"
#include "h2rpc/read-write-states.hpp"
#include "h2rpc/timedef.hpp"

namespace h2rpc {

// Configuration of a client connection, given to the ConnectionManager. The idle observers and the stream states of
// the connections it establishes are built from it.
struct ClientConnectionConfig {
  static constexpr SteadyDuration kDefaultIdleTimeout = std::chrono::minutes(5);
  static constexpr std::size_t kDefaultMaxReceiveMessageLength = 4UL * 1024UL * 1024UL;

  // Throws invalid_argument if any parameter is invalid.
  void validate() const;

  // Reconnect with the given backoff parameters, or never if std::nullopt.
  ClientConnectionConfig& withConnectionBackoff(std::optional<ConnectionBackoff> backoff) {
    connectionBackoff = std::move(backoff);
    return *this;
  }

  // Close connections without active streams after 'timeout'. ConnectionIdleObserver::kNoIdleTimeout disables it.
  ClientConnectionConfig& withIdleTimeout(SteadyDuration timeout) {
    idleTimeout = timeout;
    return *this;
  }

  ClientConnectionConfig& withKeepalive(ConnectionKeepalive value) {
    keepalive = value;
    return *this;
  }

  ClientConnectionConfig& withMessageEncoding(MessageEncodingConfig config) {
    messageEncoding = std::move(config);
    return *this;
  }

  ClientConnectionConfig& withMaxReceiveMessageLength(std::size_t length) {
    maxReceiveMessageLength = length;
    return *this;
  }

  // Write side of a new stream, compressing with the outbound algorithm if any.
  template <class Message, class Codec = MessageCodec<Message>>
  [[nodiscard]] WriteState<Message, Codec> makeWriteState(MessageArity arity) const {
    return WriteState<Message, Codec>(arity, messageEncoding.makeWriter());
  }

  // Read side of a new stream whose messages were announced as compressed with 'inbound', rejecting messages longer
  // than maxReceiveMessageLength. Returns std::nullopt if 'inbound' is not accepted.
  template <class Message, class Codec = MessageCodec<Message>>
  [[nodiscard]] std::optional<ReadState<Message, Codec>> makeReadState(
      MessageArity arity, std::optional<CompressionAlgorithm> inbound) const {
    auto reader = messageEncoding.makeReader(inbound);
    if (!reader) {
      return std::nullopt;
    }
    return ReadState<Message, Codec>(arity, std::move(*reader), maxReceiveMessageLength);
  }

  std::optional<ConnectionBackoff> connectionBackoff{ConnectionBackoff{}};
  SteadyDuration idleTimeout{kDefaultIdleTimeout};
  ConnectionKeepalive keepalive;
  MessageEncodingConfig messageEncoding;
  std::size_t maxReceiveMessageLength{kDefaultMaxReceiveMessageLength};
};

}  // namespace h2rpc
