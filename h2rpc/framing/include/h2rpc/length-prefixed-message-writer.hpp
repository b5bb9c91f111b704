#pragma once

#include <cstddef>
#include <memory>
#include <span>
#include <utility>

#include "h2rpc/byte-buffer.hpp"
#include "h2rpc/message-compressor.hpp"
#include "h2rpc/message-error.hpp"

namespace h2rpc {

// Writes messages in their length prefixed wire form: [flag (1 byte)][length (4 bytes, big endian)][payload].
class LengthPrefixedMessageWriter {
 public:
  // 'compressor' may be null, in which case messages are always written uncompressed.
  explicit LengthPrefixedMessageWriter(std::unique_ptr<MessageCompressor> compressor = nullptr) noexcept
      : _compressor(std::move(compressor)) {}

  // Appends the framed form of 'payload' to 'out', compressed if 'compress' is set and compression is supported.
  // On failure, the bytes already appended to 'out' for this message are unspecified.
  [[nodiscard]] MessageError write(std::span<const std::byte> payload, bool compress, ByteBuffer& out);

  [[nodiscard]] bool supportsCompression() const noexcept { return static_cast<bool>(_compressor); }

 private:
  std::unique_ptr<MessageCompressor> _compressor;
};

}  // namespace h2rpc
