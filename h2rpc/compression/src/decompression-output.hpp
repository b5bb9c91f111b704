#pragma once

#include <algorithm>
#include <cstddef>
#include <limits>

#include "h2rpc/byte-buffer.hpp"

namespace h2rpc {

/// Controls the growth of the output buffer of a message decompression.
/// The first window is twice the compressed size, each following one doubles, never beyond one byte more
/// than the maximum allowed size: producing that extra byte is how an exceeded limit is detected.
class DecompressionOutput {
 public:
  DecompressionOutput(ByteBuffer& out, std::size_t compressedSize, std::size_t maxDecompressedSize)
      : _out(out),
        _limit(maxDecompressedSize == std::numeric_limits<std::size_t>::max() ? maxDecompressedSize
                                                                              : maxDecompressedSize + 1U),
        _maxDecompressedSize(maxDecompressedSize),
        _target(std::min(std::max<std::size_t>(compressedSize * 2U, kMinWindow), _limit)) {}

  /// Makes room for the current window and returns the number of bytes that can be produced.
  std::size_t prepare() {
    const std::size_t available = _target - _written;
    _out.ensureWritable(available);
    return available;
  }

  std::byte* data() noexcept { return _out.writableData(); }

  void commit(std::size_t nbBytes) {
    _out.commitWrite(nbBytes);
    _written += nbBytes;
  }

  /// Called when the current window is full. Returns false if it cannot grow anymore.
  bool grow() noexcept {
    if (_target == _limit) {
      return false;
    }
    _target = _target > _limit / 2U ? _limit : _target * 2U;
    return true;
  }

  [[nodiscard]] bool limitExceeded() const noexcept { return _written > _maxDecompressedSize; }

 private:
  static constexpr std::size_t kMinWindow = 64;

  ByteBuffer& _out;
  std::size_t _limit;
  std::size_t _maxDecompressedSize;
  std::size_t _target;
  std::size_t _written{};
};

}  // namespace h2rpc
