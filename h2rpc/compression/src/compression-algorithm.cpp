#include "h2rpc/compression-algorithm.hpp"

#include <optional>
#include <string_view>

namespace h2rpc {

std::optional<CompressionAlgorithm> ParseCompressionAlgorithm(std::string_view token) noexcept {
  for (int idx = 0; idx < kNbCompressionAlgorithms; ++idx) {
    const auto algorithm = static_cast<CompressionAlgorithm>(idx);
    if (CompressionAlgorithmName(algorithm) == token) {
      return algorithm;
    }
  }
  return std::nullopt;
}

}  // namespace h2rpc
