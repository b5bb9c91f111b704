#pragma once

#include <cstddef>
#include <cstdint>
#include <span>
#include <stdexcept>
#include <string>
#include <string_view>

#include "h2rpc/byte-buffer.hpp"
#include "h2rpc/compression-algorithm.hpp"
#include "h2rpc/decompression-limit.hpp"
#include "h2rpc/message-compressor.hpp"

namespace h2rpc::test {

inline std::span<const std::byte> AsBytes(std::string_view data) { return std::as_bytes(std::span<const char>(data)); }

inline ByteBuffer Payload(std::size_t size, char fill = 'x') { return ByteBuffer(std::string(size, fill)); }

// Frame of 'payload' as it should appear on the wire.
inline std::string Frame(std::string_view payload, uint8_t flag = 0) {
  std::string frame;
  frame.push_back(static_cast<char>(flag));
  const auto size = static_cast<uint32_t>(payload.size());
  frame.push_back(static_cast<char>(size >> 24));
  frame.push_back(static_cast<char>(size >> 16));
  frame.push_back(static_cast<char>(size >> 8));
  frame.push_back(static_cast<char>(size));
  frame.append(payload);
  return frame;
}

// Compressor copying its input, failing on messages equal to "boom".
class CopyingCompressor : public MessageCompressor {
 public:
  std::size_t compress(std::span<const std::byte> input, ByteBuffer& out) override {
    const std::string_view view(reinterpret_cast<const char*>(input.data()), input.size());
    if (view == "boom") {
      throw std::runtime_error("boom");
    }
    out.writeBytes(input);
    return input.size();
  }

  [[nodiscard]] CompressionAlgorithm algorithm() const noexcept override { return CompressionAlgorithm::gzip; }
};

// Decompressor whose output never fits in the limit.
class OverflowingDecompressor : public MessageDecompressor {
 public:
  [[nodiscard]] DecompressStatus decompress(std::span<const std::byte> /*input*/, const DecompressionLimit& /*limit*/,
                                            ByteBuffer& /*out*/) override {
    return DecompressStatus::LimitExceeded;
  }

  [[nodiscard]] CompressionAlgorithm algorithm() const noexcept override { return CompressionAlgorithm::gzip; }
};

}  // namespace h2rpc::test
