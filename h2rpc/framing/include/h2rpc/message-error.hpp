#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>

namespace h2rpc {

// Per-stream message failure. Failing a message poisons the read or write path of its stream only,
// the connection is not affected.
struct MessageError {
  enum class Code : uint8_t {
    None,
    // More messages read or written than the RPC arity allows.
    CardinalityViolation,
    SerializationFailed,
    DeserializationFailed,
    // Bytes remaining after the single message of a unary read.
    LeftOverBytes,
    // Decompressed message larger than the configured limit. 'compressedSize' holds the compressed size.
    DecompressionLimitExceeded,
    InvalidState,
    // Compressed message received while no compression algorithm was negotiated.
    CompressionUnsupported,
    PayloadLengthLimitExceeded,
    CompressionFailed,
    DecompressionFailed,
    // Pending write discarded because the connection closed.
    ConnectionClosed,
  };

  static constexpr MessageError DecompressionLimitExceeded(std::size_t compressedSize) noexcept {
    return MessageError{Code::DecompressionLimitExceeded, compressedSize};
  }

  [[nodiscard]] constexpr bool isError() const noexcept { return code != Code::None; }

  [[nodiscard]] std::string toString() const;

  constexpr bool operator==(const MessageError&) const noexcept = default;

  Code code{Code::None};
  std::size_t compressedSize{};
};

constexpr std::string_view MessageErrorCodeName(MessageError::Code code) noexcept {
  switch (code) {
    case MessageError::Code::None:
      return "none";
    case MessageError::Code::CardinalityViolation:
      return "cardinality violation";
    case MessageError::Code::SerializationFailed:
      return "serialization failed";
    case MessageError::Code::DeserializationFailed:
      return "deserialization failed";
    case MessageError::Code::LeftOverBytes:
      return "left over bytes";
    case MessageError::Code::DecompressionLimitExceeded:
      return "decompression limit exceeded";
    case MessageError::Code::InvalidState:
      return "invalid state";
    case MessageError::Code::CompressionUnsupported:
      return "compression unsupported";
    case MessageError::Code::PayloadLengthLimitExceeded:
      return "payload length limit exceeded";
    case MessageError::Code::CompressionFailed:
      return "compression failed";
    case MessageError::Code::DecompressionFailed:
      return "decompression failed";
    case MessageError::Code::ConnectionClosed:
      return "connection closed";
    default:
      return "unknown";
  }
}

}  // namespace h2rpc
