#include "h2rpc/compression-config.hpp"

#include "h2rpc/features.hpp"
#include "h2rpc/invalid-argument-exception.hpp"

#ifdef H2RPC_ENABLE_ZSTD
#include <zstd.h>
#endif

namespace h2rpc {

void CompressionConfig::validate() const {
  if constexpr (zlibEnabled()) {
    if (zlib.level != Zlib::kDefaultLevel && (zlib.level < Zlib::kMinLevel || zlib.level > Zlib::kMaxLevel)) {
      throw invalid_argument("Invalid zlib compression level {}", zlib.level);
    }
  }
#ifdef H2RPC_ENABLE_ZSTD
  if (zstd.compressionLevel < ZSTD_minCLevel() || zstd.compressionLevel > ZSTD_maxCLevel()) {
    throw invalid_argument("Invalid zstd compression level {}", zstd.compressionLevel);
  }
#endif
}

}  // namespace h2rpc
