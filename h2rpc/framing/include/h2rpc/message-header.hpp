#pragma once

#include <cstddef>
#include <cstdint>

namespace h2rpc {

// Every message on the wire is prefixed by a 1 byte compression flag and its length, as a 4 bytes big endian integer.
inline constexpr std::size_t kMessageHeaderLength = 5;

inline constexpr uint8_t kUncompressedFlag = 0;
inline constexpr uint8_t kCompressedFlag = 1;

// Default HTTP/2 max frame size.
inline constexpr std::size_t kDefaultMaxFrameSize = 16384;

// Messages up to this size (header excluded) are coalesced into a shared buffer, larger ones are emitted as is.
inline constexpr std::size_t kCoalescingSingleBufferSizeLimit = kDefaultMaxFrameSize - kMessageHeaderLength;

}  // namespace h2rpc
