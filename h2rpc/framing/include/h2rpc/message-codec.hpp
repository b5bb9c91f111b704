#pragma once

#include <optional>
#include <span>

#include "h2rpc/byte-buffer.hpp"

namespace h2rpc {

// Customization point converting application messages to and from their serialized payload.
// A specialization must provide:
//
//   static bool Serialize(const T& message, ByteBuffer& out);            // false on failure
//   static std::optional<T> Deserialize(std::span<const std::byte> bytes); // std::nullopt on failure
template <class T>
struct MessageCodec;

// Opaque message whose payload is sent and received as is.
struct RawMessage {
  ByteBuffer bytes;

  bool operator==(const RawMessage&) const noexcept = default;
};

template <>
struct MessageCodec<RawMessage> {
  static bool Serialize(const RawMessage& message, ByteBuffer& out) {
    out.writeBytes(message.bytes.readableSpan());
    return true;
  }

  static std::optional<RawMessage> Deserialize(std::span<const std::byte> bytes) {
    return RawMessage{ByteBuffer(bytes)};
  }
};

}  // namespace h2rpc
