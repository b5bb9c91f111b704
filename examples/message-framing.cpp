#include <h2rpc/byte-buffer.hpp>
#include <h2rpc/coalescing-message-writer.hpp>
#include <h2rpc/compression-algorithm.hpp>
#include <h2rpc/features.hpp>
#include <h2rpc/length-prefixed-message-reader.hpp>
#include <h2rpc/message-codec.hpp>
#include <h2rpc/message-compressor.hpp>
#include <h2rpc/message-encoding-config.hpp>
#include <h2rpc/read-write-states.hpp>
#include <h2rpc/write-promise.hpp>

#include <cstddef>
#include <exception>
#include <iostream>
#include <memory>
#include <string>
#include <string_view>
#include <utility>

using namespace h2rpc;

// Frames a few messages for the wire then decodes them back, optionally with gzip compression.
int main() {
  try {
    MessageEncodingConfig encoding;
    if constexpr (zlibEnabled()) {
      encoding.withOutbound(CompressionAlgorithm::gzip).withAccepted({CompressionAlgorithm::gzip});
    }
    encoding.validate();

    std::unique_ptr<MessageCompressor> compressor;
    if (encoding.outbound) {
      compressor = MakeMessageCompressor(*encoding.outbound, encoding.compression);
    }
    CoalescingMessageWriter writer(std::move(compressor));

    const std::string_view texts[] = {"hello", "small messages are coalesced", std::string_view{}};
    for (std::string_view text : texts) {
      auto promise = WritePromise::Make();
      promise.whenComplete([text](const MessageError& error) {
        std::cout << "write of '" << text << "': " << (error.isError() ? error.toString() : "done") << '\n';
      });
      writer.append(ByteBuffer(text), encoding.outbound.has_value(), promise);
    }
    const std::string large(32768, 'x');
    writer.append(ByteBuffer(large), false, WritePromise{});

    ByteBuffer wire;
    while (auto chunk = writer.next()) {
      if (chunk->error.isError()) {
        chunk->promise.fail(chunk->error);
        continue;
      }
      std::cout << "chunk of " << chunk->data.size() << " bytes\n";
      wire.writeBytes(chunk->data);
      chunk->promise.succeed();
    }

    auto reader = encoding.makeReader(encoding.outbound);
    if (!reader) {
      std::cerr << "Inbound compression not accepted\n";
      return 1;
    }
    ReadState<RawMessage> readState(MessageArity::Many, std::move(*reader));
    auto result = readState.readMessages(wire.readableSpan());
    if (result.error.isError()) {
      std::cerr << "Read failed: " << result.error.toString() << '\n';
      return 1;
    }
    for (const RawMessage& message : result.messages) {
      std::cout << "read message of " << message.bytes.readableBytes() << " bytes\n";
    }
  } catch (const std::exception& e) {
    std::cerr << "Error: " << e.what() << '\n';
    return 1;
  }
  return 0;
}
