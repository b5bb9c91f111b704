#include "h2rpc/coalescing-message-writer.hpp"

#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <utility>

#include "h2rpc/byte-buffer.hpp"
#include "h2rpc/message-compressor.hpp"
#include "h2rpc/message-error.hpp"
#include "h2rpc/message-header.hpp"
#include "h2rpc/write-promise.hpp"

namespace h2rpc {

CoalescingMessageWriter::CoalescingMessageWriter(std::unique_ptr<MessageCompressor> compressor,
                                                 std::size_t singleBufferSizeLimit)
    : _framer(std::move(compressor)), _singleBufferSizeLimit(singleBufferSizeLimit) {}

void CoalescingMessageWriter::append(ByteBuffer message, bool compress, WritePromise promise) {
  _pending.push(PendingMessage{std::move(message), std::move(promise), compress && supportsCompression()});
}

std::optional<CoalescingMessageWriter::Chunk> CoalescingMessageWriter::next() {
  _emittedBody.reset();

  if (_largeFrameBody) {
    // The header was emitted by the previous call, now the body.
    PendingMessage body = std::move(*_largeFrameBody);
    _largeFrameBody.reset();
    _emittedBody.emplace(std::move(body.payload));
    return Chunk{_emittedBody->readableSpan(), std::move(body.promise), {}};
  }

  if (_pending.empty()) {
    return std::nullopt;
  }

  // Compute how many messages can be framed together, the capacity they need, and chain their promises.
  std::size_t nbToCoalesce = 0;
  std::size_t requiredCapacity = 0;
  WritePromise promise;
  for (; nbToCoalesce < _pending.size(); ++nbToCoalesce) {
    const PendingMessage& message = _pending[nbToCoalesce];
    if (!shouldCoalesce(message)) {
      break;
    }
    requiredCapacity += message.payload.readableBytes() + kMessageHeaderLength;
    if (promise) {
      promise.cascadeTo(message.promise);
    } else {
      promise = message.promise;
    }
  }

  if (nbToCoalesce == 0) {
    // Large message: emit the header alone, the body will be emitted as is by the next call.
    _largeFrameBody = std::move(*_pending.pop());
    _scratch.clear(kMessageHeaderLength);
    _scratch.writeU8(kUncompressedFlag);
    _scratch.writeU32BE(static_cast<uint32_t>(_largeFrameBody->payload.readableBytes()));
    return Chunk{_scratch.readableSpan(), {}, {}};
  }

  _scratch.clear(requiredCapacity);
  for (; nbToCoalesce != 0; --nbToCoalesce) {
    const PendingMessage message = std::move(*_pending.pop());
    const MessageError error = _framer.write(message.payload.readableSpan(), message.compress, _scratch);
    if (error.isError()) {
      // The whole batch is dropped, the chained promises all get the failure through the representative one.
      for (--nbToCoalesce; nbToCoalesce != 0; --nbToCoalesce) {
        (void)_pending.pop();
      }
      _scratch.clear();
      return Chunk{{}, std::move(promise), error};
    }
  }
  return Chunk{_scratch.readableSpan(), std::move(promise), {}};
}

void CoalescingMessageWriter::discardPending(MessageError error) {
  _emittedBody.reset();
  if (_largeFrameBody) {
    _largeFrameBody->promise.fail(error);
    _largeFrameBody.reset();
  }
  while (auto message = _pending.pop()) {
    message->promise.fail(error);
  }
}

}  // namespace h2rpc
