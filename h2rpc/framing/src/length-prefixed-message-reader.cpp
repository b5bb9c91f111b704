#include "h2rpc/length-prefixed-message-reader.hpp"

#include <cstddef>
#include <memory>
#include <span>
#include <utility>

#include "h2rpc/byte-buffer.hpp"
#include "h2rpc/compression-algorithm.hpp"
#include "h2rpc/decompression-limit.hpp"
#include "h2rpc/log.hpp"
#include "h2rpc/message-compressor.hpp"
#include "h2rpc/message-error.hpp"
#include "h2rpc/message-header.hpp"

namespace h2rpc {

LengthPrefixedMessageReader::LengthPrefixedMessageReader(CompressionAlgorithm algorithm,
                                                         DecompressionLimit decompressionLimit)
    : _decompressor(MakeMessageDecompressor(algorithm)),
      _compression(algorithm),
      _decompressionLimit(decompressionLimit) {}

LengthPrefixedMessageReader::LengthPrefixedMessageReader(std::unique_ptr<MessageDecompressor> decompressor,
                                                         DecompressionLimit decompressionLimit)
    : _decompressor(std::move(decompressor)),
      _compression(_decompressor->algorithm()),
      _decompressionLimit(decompressionLimit) {}

void LengthPrefixedMessageReader::append(std::span<const std::byte> bytes) {
  if (bytes.empty()) {
    return;
  }
  if (_state == State::ExpectingMessage) {
    // Reserve room for the rest of the message or the incoming bytes, whichever is larger.
    const std::size_t remainingMessageBytes =
        _messageLength > _buffer.readableBytes() ? _messageLength - _buffer.readableBytes() : 0;
    _buffer.ensureWritable(remainingMessageBytes > bytes.size() ? remainingMessageBytes : bytes.size());
  }
  _buffer.writeBytes(bytes);
}

LengthPrefixedMessageReader::Result LengthPrefixedMessageReader::nextMessage(std::size_t maxLength) {
  Result result;
  while (true) {
    switch (_state) {
      case State::ExpectingCompressedFlag: {
        const auto flag = _buffer.readU8();
        if (!flag) {
          discardReadBytesIfWorthIt();
          return result;
        }
        _compressed = *flag != kUncompressedFlag;
        if (_compressed && !_compression) {
          result.kind = Result::Kind::Error;
          result.error = MessageError{MessageError::Code::CompressionUnsupported};
          return result;
        }
        _state = State::ExpectingMessageLength;
        break;
      }
      case State::ExpectingMessageLength: {
        const auto length = _buffer.readU32BE();
        if (!length) {
          discardReadBytesIfWorthIt();
          return result;
        }
        if (*length > maxLength) {
          log::debug("Rejecting message of {} bytes, limit is {}", *length, maxLength);
          result.kind = Result::Kind::Error;
          result.error = MessageError{MessageError::Code::PayloadLengthLimitExceeded};
          return result;
        }
        _messageLength = *length;
        _state = State::ExpectingMessage;
        break;
      }
      case State::ExpectingMessage: {
        const auto payload = _buffer.readSpan(_messageLength);
        if (!payload) {
          discardReadBytesIfWorthIt();
          return result;
        }
        _state = State::ExpectingCompressedFlag;
        if (_compressed && _decompressor) {
          switch (_decompressor->decompress(*payload, _decompressionLimit, result.message)) {
            case DecompressStatus::Ok:
              break;
            case DecompressStatus::LimitExceeded:
              result.kind = Result::Kind::Error;
              result.error = MessageError::DecompressionLimitExceeded(payload->size());
              return result;
            default:
              result.kind = Result::Kind::Error;
              result.error = MessageError{MessageError::Code::DecompressionFailed};
              return result;
          }
        } else {
          result.message.writeBytes(*payload);
        }
        result.kind = Result::Kind::Message;
        discardReadBytesIfWorthIt();
        return result;
      }
      default:
        result.kind = Result::Kind::Error;
        result.error = MessageError{MessageError::Code::InvalidState};
        return result;
    }
  }
}

void LengthPrefixedMessageReader::discardReadBytesIfWorthIt() noexcept {
  if (_buffer.empty()) {
    _buffer.clear();
  } else if (_buffer.readerIndex() > 1024U && _buffer.readerIndex() > _buffer.capacity() / 2U) {
    // Only shift when more has been read than remains writable, to avoid moving lots of bytes for little gain.
    _buffer.discardReadBytes();
  }
}

}  // namespace h2rpc
