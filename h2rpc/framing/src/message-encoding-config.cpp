#include "h2rpc/message-encoding-config.hpp"

#include <algorithm>
#include <optional>
#include <string>

#include "h2rpc/compression-algorithm.hpp"
#include "h2rpc/invalid-argument-exception.hpp"
#include "h2rpc/length-prefixed-message-reader.hpp"
#include "h2rpc/length-prefixed-message-writer.hpp"
#include "h2rpc/message-compressor.hpp"

namespace h2rpc {

void MessageEncodingConfig::validate() const {
  if (outbound && !IsCompressionAlgorithmEnabled(*outbound)) {
    throw invalid_argument("Outbound compression {} is not enabled in this build", CompressionAlgorithmName(*outbound));
  }
  for (CompressionAlgorithm algorithm : accepted) {
    if (!IsCompressionAlgorithmEnabled(algorithm)) {
      throw invalid_argument("Accepted compression {} is not enabled in this build",
                             CompressionAlgorithmName(algorithm));
    }
  }
  decompressionLimit.validate();
  compression.validate();
}

bool MessageEncodingConfig::acceptsInbound(CompressionAlgorithm algorithm) const noexcept {
  return algorithm == CompressionAlgorithm::identity || std::ranges::find(accepted, algorithm) != accepted.end();
}

std::string MessageEncodingConfig::acceptEncodingHeaderValue() const {
  std::string ret;
  for (CompressionAlgorithm algorithm : accepted) {
    if (!ret.empty()) {
      ret.push_back(',');
    }
    ret.append(CompressionAlgorithmName(algorithm));
  }
  return ret;
}

LengthPrefixedMessageWriter MessageEncodingConfig::makeWriter() const {
  if (!outbound) {
    return LengthPrefixedMessageWriter();
  }
  return LengthPrefixedMessageWriter(MakeMessageCompressor(*outbound, compression));
}

std::optional<LengthPrefixedMessageReader> MessageEncodingConfig::makeReader(
    std::optional<CompressionAlgorithm> inbound) const {
  if (!inbound) {
    return std::optional<LengthPrefixedMessageReader>(std::in_place);
  }
  if (!acceptsInbound(*inbound)) {
    return std::nullopt;
  }
  return std::optional<LengthPrefixedMessageReader>(std::in_place, *inbound, decompressionLimit);
}

}  // namespace h2rpc
