#include "h2rpc/zlib-message-compressor.hpp"

#include <zconf.h>
#include <zlib.h>

#include <cstddef>
#include <format>
#include <span>
#include <stdexcept>

#include "decompression-output.hpp"
#include "h2rpc/byte-buffer.hpp"
#include "h2rpc/compression-algorithm.hpp"
#include "h2rpc/decompression-limit.hpp"
#include "h2rpc/log.hpp"
#include "h2rpc/message-compressor.hpp"
#include "h2rpc/zlib-stream.hpp"

namespace h2rpc {

namespace {

// Resets the stream when leaving scope, so that the next message starts from a clean state even after a failure.
class ResetGuard {
 public:
  explicit ResetGuard(ZlibStream& stream) noexcept : _stream(stream) {}

  ResetGuard(const ResetGuard&) = delete;
  ResetGuard& operator=(const ResetGuard&) = delete;

  ~ResetGuard() { _stream.reset(); }

 private:
  ZlibStream& _stream;
};

}  // namespace

std::size_t ZlibMessageCompressor::compress(std::span<const std::byte> input, ByteBuffer& out) {
  ResetGuard resetGuard(_stream);
  z_stream& zstream = _stream.get();

  zstream.next_in = reinterpret_cast<Bytef*>(const_cast<std::byte*>(input.data()));
  zstream.avail_in = static_cast<uInt>(input.size());

  const auto maxCompressedSize = static_cast<std::size_t>(deflateBound(&zstream, static_cast<uLong>(input.size())));
  out.ensureWritable(maxCompressedSize);

  zstream.next_out = reinterpret_cast<Bytef*>(out.writableData());
  zstream.avail_out = static_cast<uInt>(maxCompressedSize);

  const auto rc = deflate(&zstream, Z_FINISH);
  if (rc != Z_STREAM_END) {
    throw std::runtime_error(std::format("Error {} during {} compression", rc, CompressionAlgorithmName(algorithm())));
  }

  const std::size_t written = maxCompressedSize - zstream.avail_out;
  out.commitWrite(written);
  return written;
}

DecompressStatus ZlibMessageDecompressor::decompress(std::span<const std::byte> input, const DecompressionLimit& limit,
                                                     ByteBuffer& out) {
  ResetGuard resetGuard(_stream);
  z_stream& zstream = _stream.get();

  zstream.next_in = reinterpret_cast<Bytef*>(const_cast<std::byte*>(input.data()));
  zstream.avail_in = static_cast<uInt>(input.size());

  DecompressionOutput output(out, input.size(), limit.maximumDecompressedSize(input.size()));
  while (true) {
    const std::size_t available = output.prepare();
    zstream.next_out = reinterpret_cast<Bytef*>(output.data());
    zstream.avail_out = static_cast<uInt>(available);

    const auto rc = inflate(&zstream, Z_NO_FLUSH);
    output.commit(available - zstream.avail_out);

    if (output.limitExceeded()) {
      return DecompressStatus::LimitExceeded;
    }
    switch (rc) {
      case Z_STREAM_END:
        if (zstream.avail_in != 0) {
          log::error("{} decompression - {} trailing bytes after end of stream", CompressionAlgorithmName(algorithm()),
                     zstream.avail_in);
          return DecompressStatus::Error;
        }
        return DecompressStatus::Ok;
      case Z_OK:
        [[fallthrough]];
      case Z_BUF_ERROR:
        if (zstream.avail_out == 0) {
          if (!output.grow()) {
            return DecompressStatus::LimitExceeded;
          }
          break;
        }
        if (zstream.avail_in == 0) {
          log::error("{} decompression - truncated input", CompressionAlgorithmName(algorithm()));
          return DecompressStatus::Error;
        }
        break;
      default:
        log::error("{} decompression - inflate failed with error {}", CompressionAlgorithmName(algorithm()), rc);
        return DecompressStatus::Error;
    }
  }
}

}  // namespace h2rpc
