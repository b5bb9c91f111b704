#pragma once

#include <cstddef>
#include <cstdint>
#include <memory>
#include <span>
#include <string_view>

#include "h2rpc/byte-buffer.hpp"
#include "h2rpc/compression-algorithm.hpp"
#include "h2rpc/compression-config.hpp"
#include "h2rpc/decompression-limit.hpp"

namespace h2rpc {

// Compresses whole messages, one at a time. Each call produces an independent compressed stream,
// the internal state is reused (and reset) between messages.
class MessageCompressor {
 public:
  virtual ~MessageCompressor() = default;

  // Appends the compressed form of 'input' to 'out' and returns the number of bytes written.
  // Throws std::runtime_error on failure.
  virtual std::size_t compress(std::span<const std::byte> input, ByteBuffer& out) = 0;

  [[nodiscard]] virtual CompressionAlgorithm algorithm() const noexcept = 0;
};

enum class DecompressStatus : int8_t { Ok, LimitExceeded, Error };

constexpr std::string_view DecompressStatusName(DecompressStatus status) noexcept {
  switch (status) {
    case DecompressStatus::Ok:
      return "ok";
    case DecompressStatus::LimitExceeded:
      return "limit-exceeded";
    case DecompressStatus::Error:
      return "error";
    default:
      return "unknown";
  }
}

// Decompresses whole messages, one at a time.
class MessageDecompressor {
 public:
  virtual ~MessageDecompressor() = default;

  // Appends the decompressed form of 'input' to 'out', which may not exceed limit.maximumDecompressedSize(input.size())
  // bytes. On failure the content appended to 'out' is unspecified.
  [[nodiscard]] virtual DecompressStatus decompress(std::span<const std::byte> input, const DecompressionLimit& limit,
                                                    ByteBuffer& out) = 0;

  [[nodiscard]] virtual CompressionAlgorithm algorithm() const noexcept = 0;
};

// Creates a compressor for 'algorithm'. Returns nullptr for identity.
// Throws invalid_argument if the algorithm is not enabled in this build.
std::unique_ptr<MessageCompressor> MakeMessageCompressor(CompressionAlgorithm algorithm,
                                                         const CompressionConfig& config = {});

// Creates a decompressor for 'algorithm'. Returns nullptr for identity.
// Throws invalid_argument if the algorithm is not enabled in this build.
std::unique_ptr<MessageDecompressor> MakeMessageDecompressor(CompressionAlgorithm algorithm);

}  // namespace h2rpc
