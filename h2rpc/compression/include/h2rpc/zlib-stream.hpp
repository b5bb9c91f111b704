#pragma once

#include <zlib.h>

#include <cstdint>

#include "h2rpc/compression-algorithm.hpp"

namespace h2rpc {

// Owns a z_stream set up for one of the zlib based message encodings (gzip or deflate).
// A single stream serves all the messages of a compressor or decompressor, with a reset() between them.
class ZlibStream {
 public:
  enum class Mode : int8_t { inflate, deflate };

  // Stream decompressing 'algorithm'.
  // Throws invalid_argument if 'algorithm' is not gzip nor deflate, std::runtime_error if zlib fails.
  explicit ZlibStream(CompressionAlgorithm algorithm);

  // Stream compressing with 'algorithm' at 'level'.
  ZlibStream(CompressionAlgorithm algorithm, int8_t level);

  ZlibStream(const ZlibStream&) = delete;
  ZlibStream(ZlibStream&&) = delete;
  ZlibStream& operator=(const ZlibStream&) = delete;
  ZlibStream& operator=(ZlibStream&&) = delete;

  ~ZlibStream();

  // Makes the stream ready for a new message, keeping its parameters and allocated state.
  void reset() noexcept;

  [[nodiscard]] z_stream& get() noexcept { return _stream; }

  [[nodiscard]] CompressionAlgorithm algorithm() const noexcept { return _algorithm; }

  [[nodiscard]] Mode mode() const noexcept { return _mode; }

 private:
  z_stream _stream{};
  CompressionAlgorithm _algorithm;
  Mode _mode;
};

}  // namespace h2rpc
