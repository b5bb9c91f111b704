#include "h2rpc/decompression-limit.hpp"

#include <cstddef>
#include <limits>

#include "h2rpc/invalid-argument-exception.hpp"

namespace h2rpc {

std::size_t DecompressionLimit::maximumDecompressedSize(std::size_t compressedSize) const noexcept {
  switch (_kind) {
    case Kind::absolute:
      return _value;
    case Kind::ratio:
      if (compressedSize != 0 && _value > std::numeric_limits<std::size_t>::max() / compressedSize) {
        return std::numeric_limits<std::size_t>::max();
      }
      return _value * compressedSize;
    default:
      return 0;
  }
}

void DecompressionLimit::validate() const {
  if (_value == 0) {
    throw invalid_argument("{} decompression limit must be > 0", _kind == Kind::absolute ? "absolute" : "ratio");
  }
}

}  // namespace h2rpc
