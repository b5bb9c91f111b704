#pragma once

#include <cstddef>
#include <cstdint>
#include <span>

#include "h2rpc/byte-buffer.hpp"
#include "h2rpc/compression-algorithm.hpp"
#include "h2rpc/decompression-limit.hpp"
#include "h2rpc/message-compressor.hpp"
#include "h2rpc/zlib-stream.hpp"

namespace h2rpc {

// gzip or deflate compressor.
class ZlibMessageCompressor final : public MessageCompressor {
 public:
  ZlibMessageCompressor(CompressionAlgorithm algorithm, int8_t level) : _stream(algorithm, level) {}

  std::size_t compress(std::span<const std::byte> input, ByteBuffer& out) override;

  [[nodiscard]] CompressionAlgorithm algorithm() const noexcept override { return _stream.algorithm(); }

 private:
  ZlibStream _stream;
};

class ZlibMessageDecompressor final : public MessageDecompressor {
 public:
  explicit ZlibMessageDecompressor(CompressionAlgorithm algorithm) : _stream(algorithm) {}

  [[nodiscard]] DecompressStatus decompress(std::span<const std::byte> input, const DecompressionLimit& limit,
                                            ByteBuffer& out) override;

  [[nodiscard]] CompressionAlgorithm algorithm() const noexcept override { return _stream.algorithm(); }

 private:
  ZlibStream _stream;
};

}  // namespace h2rpc
