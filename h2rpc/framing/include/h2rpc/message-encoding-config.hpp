#pragma once

#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "h2rpc/compression-algorithm.hpp"
#include "h2rpc/compression-config.hpp"
#include "h2rpc/decompression-limit.hpp"
#include "h2rpc/length-prefixed-message-reader.hpp"
#include "h2rpc/length-prefixed-message-writer.hpp"

namespace h2rpc {

// Message compression settings of a connection. The default value disables compression in both directions.
struct MessageEncodingConfig {
  static constexpr DecompressionLimit kDefaultDecompressionLimit = DecompressionLimit::Ratio(20);

  MessageEncodingConfig& withOutbound(std::optional<CompressionAlgorithm> algorithm) {
    outbound = algorithm;
    return *this;
  }

  MessageEncodingConfig& withAccepted(std::vector<CompressionAlgorithm> algorithms) {
    accepted = std::move(algorithms);
    return *this;
  }

  MessageEncodingConfig& withDecompressionLimit(DecompressionLimit limit) {
    decompressionLimit = limit;
    return *this;
  }

  MessageEncodingConfig& withCompressionConfig(CompressionConfig config) {
    compression = config;
    return *this;
  }

  // Throws invalid_argument if an algorithm is not enabled in this build or if a parameter is out of range.
  void validate() const;

  // Tells whether messages received with 'algorithm' can be decoded. identity is always accepted.
  [[nodiscard]] bool acceptsInbound(CompressionAlgorithm algorithm) const noexcept;

  // Comma separated list of accepted algorithms, as sent in grpc-accept-encoding. Empty if none is accepted.
  [[nodiscard]] std::string acceptEncodingHeaderValue() const;

  // Writer compressing messages with the outbound algorithm, if any.
  [[nodiscard]] LengthPrefixedMessageWriter makeWriter() const;

  // Reader for a stream whose messages were announced as compressed with 'inbound' (std::nullopt when the peer
  // did not send any grpc-encoding). Returns std::nullopt if 'inbound' is not accepted.
  [[nodiscard]] std::optional<LengthPrefixedMessageReader> makeReader(std::optional<CompressionAlgorithm> inbound) const;

  // Algorithm used to compress outbound messages, std::nullopt to send them uncompressed.
  std::optional<CompressionAlgorithm> outbound;
  // Algorithms accepted for inbound messages, in preference order.
  std::vector<CompressionAlgorithm> accepted;
  DecompressionLimit decompressionLimit = kDefaultDecompressionLimit;
  CompressionConfig compression;
};

}  // namespace h2rpc
