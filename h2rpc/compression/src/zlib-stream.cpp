#include "h2rpc/zlib-stream.hpp"

#include <zconf.h>
#include <zlib.h>

#include <cstdint>
#include <format>
#include <stdexcept>

#include "h2rpc/compression-algorithm.hpp"
#include "h2rpc/invalid-argument-exception.hpp"
#include "h2rpc/log.hpp"

namespace h2rpc {

namespace {

// gzip adds its header and trailer around the raw deflate data, 'deflate' is the zlib format.
int WindowBits(CompressionAlgorithm algorithm) {
  switch (algorithm) {
    case CompressionAlgorithm::gzip:
      return MAX_WBITS + 16;
    case CompressionAlgorithm::deflate:
      return MAX_WBITS;
    default:
      throw invalid_argument("{} is not a zlib encoding", CompressionAlgorithmName(algorithm));
  }
}

}  // namespace

ZlibStream::ZlibStream(CompressionAlgorithm algorithm) : _algorithm(algorithm), _mode(Mode::inflate) {
  const auto rc = inflateInit2(&_stream, WindowBits(algorithm));
  if (rc != Z_OK) {
    throw std::runtime_error(
        std::format("{} inflateInit2 failed with error {}", CompressionAlgorithmName(algorithm), rc));
  }
}

ZlibStream::ZlibStream(CompressionAlgorithm algorithm, int8_t level) : _algorithm(algorithm), _mode(Mode::deflate) {
  const auto rc = deflateInit2(&_stream, level, Z_DEFLATED, WindowBits(algorithm), 8, Z_DEFAULT_STRATEGY);
  if (rc != Z_OK) {
    throw std::runtime_error(
        std::format("{} deflateInit2 failed with error {}", CompressionAlgorithmName(algorithm), rc));
  }
}

ZlibStream::~ZlibStream() {
  const auto rc = _mode == Mode::inflate ? inflateEnd(&_stream) : deflateEnd(&_stream);
  // Z_DATA_ERROR only tells that a deflate stream was ended in the middle of a message.
  if (rc != Z_OK && rc != Z_DATA_ERROR) {
    log::error("{} stream end failed with error {}", CompressionAlgorithmName(_algorithm), rc);
  }
}

void ZlibStream::reset() noexcept {
  const auto rc = _mode == Mode::inflate ? inflateReset(&_stream) : deflateReset(&_stream);
  if (rc != Z_OK) {
    log::error("{} stream reset failed with error {}", CompressionAlgorithmName(_algorithm), rc);
  }
}

}  // namespace h2rpc
