#pragma once

#include <cstdint>

#ifdef H2RPC_ENABLE_ZLIB
#include <zlib.h>
#endif

#ifdef H2RPC_ENABLE_ZSTD
#include <zstd.h>
#endif

namespace h2rpc {

// Compression parameters of outbound messages.
struct CompressionConfig {
  void validate() const;

  struct Zlib {
#ifdef H2RPC_ENABLE_ZLIB
    static constexpr int8_t kDefaultLevel = Z_DEFAULT_COMPRESSION;
    static constexpr int8_t kMinLevel = Z_BEST_SPEED;
    static constexpr int8_t kMaxLevel = Z_BEST_COMPRESSION;
#else
    static constexpr int8_t kDefaultLevel = 0;
    static constexpr int8_t kMinLevel = 0;
    static constexpr int8_t kMaxLevel = 0;
#endif
    int8_t level = kDefaultLevel;
  } zlib;

  struct Zstd {
#ifdef H2RPC_ENABLE_ZSTD
    int8_t compressionLevel = ZSTD_CLEVEL_DEFAULT;
#else
    int8_t compressionLevel = 0;
#endif
  } zstd;
};

}  // namespace h2rpc
