#pragma once

#include <cstdint>
#include <optional>
#include <string_view>

#include "h2rpc/features.hpp"

namespace h2rpc {

// Message compression algorithms, as negotiated through the grpc-encoding / grpc-accept-encoding headers.
enum class CompressionAlgorithm : int8_t { identity, deflate, gzip, zstd };

inline constexpr int kNbCompressionAlgorithms = 4;

constexpr std::string_view CompressionAlgorithmName(CompressionAlgorithm algorithm) noexcept {
  switch (algorithm) {
    case CompressionAlgorithm::identity:
      return "identity";
    case CompressionAlgorithm::deflate:
      return "deflate";
    case CompressionAlgorithm::gzip:
      return "gzip";
    case CompressionAlgorithm::zstd:
      return "zstd";
    default:
      return "unknown";
  }
}

// Tells whether messages compressed with 'algorithm' can be produced and consumed by this build.
constexpr bool IsCompressionAlgorithmEnabled(CompressionAlgorithm algorithm) noexcept {
  switch (algorithm) {
    case CompressionAlgorithm::identity:
      return true;
    case CompressionAlgorithm::deflate:
      [[fallthrough]];
    case CompressionAlgorithm::gzip:
      return zlibEnabled();
    case CompressionAlgorithm::zstd:
      return zstdEnabled();
    default:
      return false;
  }
}

// Parses an encoding token (case sensitive, as sent on the wire). Returns std::nullopt for unknown tokens.
std::optional<CompressionAlgorithm> ParseCompressionAlgorithm(std::string_view token) noexcept;

}  // namespace h2rpc
