#include "h2rpc/length-prefixed-message-writer.hpp"

#include <cstddef>
#include <cstdint>
#include <exception>
#include <limits>
#include <span>

#include "h2rpc/byte-buffer.hpp"
#include "h2rpc/compression-algorithm.hpp"
#include "h2rpc/log.hpp"
#include "h2rpc/message-error.hpp"
#include "h2rpc/message-header.hpp"

namespace h2rpc {

MessageError LengthPrefixedMessageWriter::write(std::span<const std::byte> payload, bool compress, ByteBuffer& out) {
  if (!compress || !_compressor) {
    if (payload.size() > std::numeric_limits<uint32_t>::max()) {
      return MessageError{MessageError::Code::PayloadLengthLimitExceeded};
    }
    out.ensureWritable(kMessageHeaderLength + payload.size());
    out.writeU8(kUncompressedFlag);
    out.writeU32BE(static_cast<uint32_t>(payload.size()));
    out.writeBytes(payload);
    return {};
  }

  const std::size_t headerIndex = out.writerIndex();
  out.writeU8(kCompressedFlag);
  // Length placeholder, patched once the compressed size is known.
  const std::size_t lengthIndex = out.writerIndex();
  out.writeU32BE(0);

  std::size_t written;
  try {
    written = _compressor->compress(payload, out);
  } catch (const std::exception& ex) {
    log::error("{} compression of a {} bytes message failed: {}", CompressionAlgorithmName(_compressor->algorithm()),
               payload.size(), ex.what());
    out.truncate(headerIndex);
    return MessageError{MessageError::Code::CompressionFailed};
  }
  if (written > std::numeric_limits<uint32_t>::max()) {
    out.truncate(headerIndex);
    return MessageError{MessageError::Code::PayloadLengthLimitExceeded};
  }
  out.setU32BE(lengthIndex, static_cast<uint32_t>(written));
  return {};
}

}  // namespace h2rpc
