#pragma once

#include <cstddef>
#include <cstdint>
#include <limits>
#include <memory>
#include <optional>
#include <span>

#include "h2rpc/byte-buffer.hpp"
#include "h2rpc/compression-algorithm.hpp"
#include "h2rpc/decompression-limit.hpp"
#include "h2rpc/message-compressor.hpp"
#include "h2rpc/message-error.hpp"

namespace h2rpc {

// Incremental parser of length prefixed messages.
// Bytes are appended as they arrive from the transport, complete messages are extracted one at a time.
class LengthPrefixedMessageReader {
 public:
  static constexpr std::size_t kNoMaxLength = std::numeric_limits<uint32_t>::max();

  struct Result {
    enum class Kind : uint8_t { NeedMoreData, Message, Error };

    Kind kind{Kind::NeedMoreData};
    // Decompressed payload, set for Kind::Message.
    ByteBuffer message;
    // Set for Kind::Error.
    MessageError error;
  };

  // Reader for a stream without negotiated compression: compressed messages are rejected.
  LengthPrefixedMessageReader() noexcept = default;

  // Reader for a stream whose messages may be compressed with 'algorithm'.
  // Messages flagged as compressed are passed through as is for identity.
  // Throws invalid_argument if 'algorithm' is not enabled in this build.
  LengthPrefixedMessageReader(CompressionAlgorithm algorithm, DecompressionLimit decompressionLimit);

  // Reader decompressing messages flagged as compressed with 'decompressor', which should not be null.
  LengthPrefixedMessageReader(std::unique_ptr<MessageDecompressor> decompressor, DecompressionLimit decompressionLimit);

  void append(std::span<const std::byte> bytes);

  // Extracts the next complete message. Messages whose declared length is larger than 'maxLength' are rejected
  // with PayloadLengthLimitExceeded.
  Result nextMessage(std::size_t maxLength = kNoMaxLength);

  // Number of buffered bytes that have not been consumed by a returned message or a parsed header part.
  [[nodiscard]] std::size_t unprocessedBytes() const noexcept { return _buffer.readableBytes(); }

  // Tells whether the reader is in the middle of a message (at least its flag has been parsed).
  [[nodiscard]] bool isReading() const noexcept { return _state != State::ExpectingCompressedFlag; }

  [[nodiscard]] std::optional<CompressionAlgorithm> compression() const noexcept { return _compression; }

 private:
  enum class State : uint8_t { ExpectingCompressedFlag, ExpectingMessageLength, ExpectingMessage };

  void discardReadBytesIfWorthIt() noexcept;

  ByteBuffer _buffer;
  std::unique_ptr<MessageDecompressor> _decompressor;
  std::optional<CompressionAlgorithm> _compression;
  DecompressionLimit _decompressionLimit{DecompressionLimit::Ratio(20)};
  uint32_t _messageLength{};
  bool _compressed{false};
  State _state{State::ExpectingCompressedFlag};
};

}  // namespace h2rpc
