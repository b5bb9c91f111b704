#pragma once

#include <zstd.h>

#include <cstddef>
#include <cstdint>
#include <memory>
#include <span>

#include "h2rpc/byte-buffer.hpp"
#include "h2rpc/compression-algorithm.hpp"
#include "h2rpc/decompression-limit.hpp"
#include "h2rpc/message-compressor.hpp"

namespace h2rpc {

class ZstdMessageCompressor final : public MessageCompressor {
 public:
  // Throws std::bad_alloc if the context cannot be created, std::runtime_error if the level is rejected.
  explicit ZstdMessageCompressor(int8_t compressionLevel);

  std::size_t compress(std::span<const std::byte> input, ByteBuffer& out) override;

  [[nodiscard]] CompressionAlgorithm algorithm() const noexcept override { return CompressionAlgorithm::zstd; }

 private:
  std::unique_ptr<ZSTD_CCtx, decltype(&ZSTD_freeCCtx)> _ctx{ZSTD_createCCtx(), &ZSTD_freeCCtx};
};

class ZstdMessageDecompressor final : public MessageDecompressor {
 public:
  ZstdMessageDecompressor();

  [[nodiscard]] DecompressStatus decompress(std::span<const std::byte> input, const DecompressionLimit& limit,
                                            ByteBuffer& out) override;

  [[nodiscard]] CompressionAlgorithm algorithm() const noexcept override { return CompressionAlgorithm::zstd; }

 private:
  std::unique_ptr<ZSTD_DCtx, decltype(&ZSTD_freeDCtx)> _ctx{ZSTD_createDCtx(), &ZSTD_freeDCtx};
};

}  // namespace h2rpc
