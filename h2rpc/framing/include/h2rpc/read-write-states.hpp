#pragma once

#include <cstddef>
#include <cstdint>
#include <span>
#include <utility>
#include <variant>
#include <vector>

#include "h2rpc/byte-buffer.hpp"
#include "h2rpc/length-prefixed-message-reader.hpp"
#include "h2rpc/length-prefixed-message-writer.hpp"
#include "h2rpc/log.hpp"
#include "h2rpc/message-codec.hpp"
#include "h2rpc/message-error.hpp"

namespace h2rpc {

// Number of messages expected in one direction of a stream.
enum class MessageArity : uint8_t { One, Many };

// Write side of a stream. Enforces the message count of its arity: once in NotWriting state (after the single
// message of a 'One' stream or after a failure), every write fails with CardinalityViolation.
template <class Message, class Codec = MessageCodec<Message>>
class WriteState {
 public:
  WriteState(MessageArity arity, LengthPrefixedMessageWriter writer)
      : _state(Writing{std::move(writer), arity}) {}

  static WriteState NotWriting() { return WriteState(); }

  // Serializes and frames 'message' into 'out'.
  [[nodiscard]] MessageError write(const Message& message, bool compress, ByteBuffer& out) {
    Writing* writing = std::get_if<Writing>(&_state);
    if (writing == nullptr) {
      return MessageError{MessageError::Code::CardinalityViolation};
    }

    _serialized.clear();
    if (!Codec::Serialize(message, _serialized)) {
      log::error("Failed to serialize message");
      _state.template emplace<NotWritingState>();
      return MessageError{MessageError::Code::SerializationFailed};
    }

    const MessageError error = writing->writer.write(_serialized.readableSpan(), compress, out);
    if (error.isError() || writing->arity == MessageArity::One) {
      _state.template emplace<NotWritingState>();
    }
    return error;
  }

  [[nodiscard]] bool isWriting() const noexcept { return std::holds_alternative<Writing>(_state); }

 private:
  struct Writing {
    LengthPrefixedMessageWriter writer;
    MessageArity arity;
  };

  struct NotWritingState {};

  WriteState() noexcept : _state(NotWritingState{}) {}

  std::variant<Writing, NotWritingState> _state;
  ByteBuffer _serialized;
};

// Read side of a stream. Turns received bytes into decoded messages while enforcing the message count of its arity.
template <class Message, class Codec = MessageCodec<Message>>
class ReadState {
 public:
  struct ReadResult {
    std::vector<Message> messages;
    MessageError error;
  };

  ReadState(MessageArity arity, LengthPrefixedMessageReader reader,
            std::size_t maxReceiveMessageLength = LengthPrefixedMessageReader::kNoMaxLength)
      : _state(Reading{std::move(reader), maxReceiveMessageLength, arity}) {}

  static ReadState NotReading() { return ReadState(); }

  // Buffers 'bytes' then extracts and decodes every complete message.
  // For arity One, at most one message is ever produced; leftover bytes after it are an error.
  ReadResult readMessages(std::span<const std::byte> bytes) {
    ReadResult result;
    Reading* reading = std::get_if<Reading>(&_state);
    if (reading == nullptr) {
      result.error = MessageError{MessageError::Code::CardinalityViolation};
      return result;
    }

    LengthPrefixedMessageReader& reader = reading->reader;
    reader.append(bytes);

    while (true) {
      auto next = reader.nextMessage(reading->maxReceiveMessageLength);
      if (next.kind == LengthPrefixedMessageReader::Result::Kind::NeedMoreData) {
        break;
      }
      if (next.kind == LengthPrefixedMessageReader::Result::Kind::Error) {
        log::debug("Stream read failed: {}", next.error.toString());
        if (reading->arity == MessageArity::One && !result.messages.empty()) {
          // Whatever follows the single message of the stream is not a valid frame.
          return fail(std::move(result), MessageError{MessageError::Code::LeftOverBytes});
        }
        return fail(std::move(result), next.error);
      }
      auto message = Codec::Deserialize(next.message.readableSpan());
      if (!message) {
        log::error("Failed to deserialize message of {} bytes", next.message.readableBytes());
        return fail(std::move(result), MessageError{MessageError::Code::DeserializationFailed});
      }
      result.messages.push_back(std::move(*message));
    }

    if (reading->arity == MessageArity::Many || result.messages.empty()) {
      // The payload of a message may be split across several reads.
      return result;
    }

    if (result.messages.size() == 1) {
      const bool hasLeftOver = reader.unprocessedBytes() != 0 || reader.isReading();
      _state.template emplace<NotReadingState>();
      if (hasLeftOver) {
        result.messages.clear();
        result.error = MessageError{MessageError::Code::LeftOverBytes};
      }
      return result;
    }

    return fail(std::move(result), MessageError{MessageError::Code::CardinalityViolation});
  }

  [[nodiscard]] bool isReading() const noexcept { return std::holds_alternative<Reading>(_state); }

 private:
  struct Reading {
    LengthPrefixedMessageReader reader;
    std::size_t maxReceiveMessageLength;
    MessageArity arity;
  };

  struct NotReadingState {};

  ReadState() noexcept : _state(NotReadingState{}) {}

  ReadResult fail(ReadResult result, MessageError error) {
    _state.template emplace<NotReadingState>();
    result.messages.clear();
    result.error = error;
    return result;
  }

  std::variant<Reading, NotReadingState> _state;
};

}  // namespace h2rpc
