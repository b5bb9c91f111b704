#pragma once

#include <cstddef>
#include <memory>
#include <optional>
#include <span>

#include "h2rpc/byte-buffer.hpp"
#include "h2rpc/length-prefixed-message-writer.hpp"
#include "h2rpc/message-compressor.hpp"
#include "h2rpc/message-error.hpp"
#include "h2rpc/message-header.hpp"
#include "h2rpc/one-or-many-queue.hpp"
#include "h2rpc/write-promise.hpp"

namespace h2rpc {

// Frames outbound messages of a stream, batching small ones into a single buffer.
//
// Consecutive pending messages that are small (at most singleBufferSizeLimit bytes) or compressed are framed
// together into one reusable scratch buffer, and their promises are chained onto the first one. A large
// uncompressed message is not copied: its 5 bytes header is emitted alone, then its payload as is.
class CoalescingMessageWriter {
 public:
  // Unit of output. On success 'data' views the bytes to send and 'promise' must be completed once they have been
  // written. On failure 'error' is set, 'data' is empty and 'promise' should be failed by the caller.
  // 'data' stays valid until the next call to next() or discardPending().
  struct Chunk {
    std::span<const std::byte> data;
    WritePromise promise;
    MessageError error;
  };

  // 'compressor' may be null, in which case the compress flag of appended messages is ignored.
  explicit CoalescingMessageWriter(std::unique_ptr<MessageCompressor> compressor = nullptr,
                                   std::size_t singleBufferSizeLimit = kCoalescingSingleBufferSizeLimit);

  void append(ByteBuffer message, bool compress, WritePromise promise = {});

  // Returns the next chunk to write, or std::nullopt if nothing is pending.
  std::optional<Chunk> next();

  // Fails all pending promises with 'error' (typically ConnectionClosed) and drops their messages.
  void discardPending(MessageError error);

  [[nodiscard]] bool hasPending() const noexcept { return !_pending.empty() || _largeFrameBody.has_value(); }

  [[nodiscard]] bool supportsCompression() const noexcept { return _framer.supportsCompression(); }

 private:
  struct PendingMessage {
    ByteBuffer payload;
    WritePromise promise;
    bool compress;
  };

  [[nodiscard]] bool shouldCoalesce(const PendingMessage& message) const noexcept {
    return message.compress || message.payload.readableBytes() <= _singleBufferSizeLimit;
  }

  LengthPrefixedMessageWriter _framer;
  std::size_t _singleBufferSizeLimit;
  OneOrManyQueue<PendingMessage> _pending;
  ByteBuffer _scratch;
  // Body of a large message whose header has just been emitted.
  std::optional<PendingMessage> _largeFrameBody;
  // Body returned by the last next() call, kept alive until the following one.
  std::optional<ByteBuffer> _emittedBody;
};

}  // namespace h2rpc
