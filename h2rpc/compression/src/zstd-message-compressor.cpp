#include "h2rpc/zstd-message-compressor.hpp"

#include <zstd.h>

#include <cstddef>
#include <cstdint>
#include <format>
#include <new>
#include <span>
#include <stdexcept>

#include "decompression-output.hpp"
#include "h2rpc/byte-buffer.hpp"
#include "h2rpc/decompression-limit.hpp"
#include "h2rpc/log.hpp"
#include "h2rpc/message-compressor.hpp"

namespace h2rpc {

ZstdMessageCompressor::ZstdMessageCompressor(int8_t compressionLevel) {
  if (!_ctx) {
    throw std::bad_alloc();
  }
  const std::size_t ret = ZSTD_CCtx_setParameter(_ctx.get(), ZSTD_c_compressionLevel, compressionLevel);
  if (ZSTD_isError(ret) != 0U) {
    throw std::runtime_error(std::format("ZSTD_CCtx_setParameter(level={}) failed: {}", compressionLevel,
                                         ZSTD_getErrorName(ret)));
  }
}

std::size_t ZstdMessageCompressor::compress(std::span<const std::byte> input, ByteBuffer& out) {
  const std::size_t maxCompressedSize = ZSTD_compressBound(input.size());
  out.ensureWritable(maxCompressedSize);
  // Session-only reset keeps the parameters.
  ZSTD_CCtx_reset(_ctx.get(), ZSTD_reset_session_only);
  const std::size_t written =
      ZSTD_compress2(_ctx.get(), out.writableData(), maxCompressedSize, input.data(), input.size());
  if (ZSTD_isError(written) != 0U) [[unlikely]] {
    throw std::runtime_error(std::format("ZSTD_compress2 failed: {}", ZSTD_getErrorName(written)));
  }
  out.commitWrite(written);
  return written;
}

ZstdMessageDecompressor::ZstdMessageDecompressor() {
  if (!_ctx) {
    throw std::bad_alloc();
  }
}

DecompressStatus ZstdMessageDecompressor::decompress(std::span<const std::byte> input, const DecompressionLimit& limit,
                                                     ByteBuffer& out) {
  ZSTD_DCtx_reset(_ctx.get(), ZSTD_reset_session_only);

  DecompressionOutput output(out, input.size(), limit.maximumDecompressedSize(input.size()));
  ZSTD_inBuffer in{input.data(), input.size(), 0};
  while (true) {
    const std::size_t available = output.prepare();
    ZSTD_outBuffer outBuffer{output.data(), available, 0};
    const std::size_t ret = ZSTD_decompressStream(_ctx.get(), &outBuffer, &in);
    if (ZSTD_isError(ret) != 0U) [[unlikely]] {
      log::error("zstd decompression - ZSTD_decompressStream failed with error {}", ZSTD_getErrorName(ret));
      return DecompressStatus::Error;
    }
    output.commit(outBuffer.pos);
    if (output.limitExceeded()) {
      return DecompressStatus::LimitExceeded;
    }
    if (ret == 0) {
      // A frame is complete.
      if (in.pos != in.size) {
        log::error("zstd decompression - {} trailing bytes after end of frame", in.size - in.pos);
        return DecompressStatus::Error;
      }
      return DecompressStatus::Ok;
    }
    if (outBuffer.pos == outBuffer.size) {
      if (!output.grow()) {
        return DecompressStatus::LimitExceeded;
      }
    } else if (in.pos == in.size) {
      log::error("zstd decompression - truncated input");
      return DecompressStatus::Error;
    }
  }
}

}  // namespace h2rpc
