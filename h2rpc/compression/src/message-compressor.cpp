#include "h2rpc/message-compressor.hpp"

#include <memory>

#include "h2rpc/compression-algorithm.hpp"
#include "h2rpc/compression-config.hpp"
#include "h2rpc/invalid-argument-exception.hpp"

#ifdef H2RPC_ENABLE_ZLIB
#include "h2rpc/zlib-message-compressor.hpp"
#endif

#ifdef H2RPC_ENABLE_ZSTD
#include "h2rpc/zstd-message-compressor.hpp"
#endif

namespace h2rpc {

std::unique_ptr<MessageCompressor> MakeMessageCompressor(CompressionAlgorithm algorithm,
                                                         [[maybe_unused]] const CompressionConfig& config) {
  switch (algorithm) {
    case CompressionAlgorithm::identity:
      return nullptr;
#ifdef H2RPC_ENABLE_ZLIB
    case CompressionAlgorithm::deflate:
      [[fallthrough]];
    case CompressionAlgorithm::gzip:
      return std::make_unique<ZlibMessageCompressor>(algorithm, config.zlib.level);
#endif
#ifdef H2RPC_ENABLE_ZSTD
    case CompressionAlgorithm::zstd:
      return std::make_unique<ZstdMessageCompressor>(config.zstd.compressionLevel);
#endif
    default:
      throw invalid_argument("Compression algorithm {} is not enabled", CompressionAlgorithmName(algorithm));
  }
}

std::unique_ptr<MessageDecompressor> MakeMessageDecompressor(CompressionAlgorithm algorithm) {
  switch (algorithm) {
    case CompressionAlgorithm::identity:
      return nullptr;
#ifdef H2RPC_ENABLE_ZLIB
    case CompressionAlgorithm::deflate:
      [[fallthrough]];
    case CompressionAlgorithm::gzip:
      return std::make_unique<ZlibMessageDecompressor>(algorithm);
#endif
#ifdef H2RPC_ENABLE_ZSTD
    case CompressionAlgorithm::zstd:
      return std::make_unique<ZstdMessageDecompressor>();
#endif
    default:
      throw invalid_argument("Decompression algorithm {} is not enabled", CompressionAlgorithmName(algorithm));
  }
}

}  // namespace h2rpc
