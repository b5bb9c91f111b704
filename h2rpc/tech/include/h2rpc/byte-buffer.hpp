#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <span>
#include <string_view>

namespace h2rpc {

/**
 * Contiguous growable byte buffer with separate reader and writer indexes.
 *
 *   +-------------------+------------------+------------------+
 *   | discardable bytes |  readable bytes  |  writable bytes  |
 *   +-------------------+------------------+------------------+
 *   0              readerIndex        writerIndex        capacity
 *
 * Memory is managed with malloc / realloc and grows exponentially.
 * Used for wire frames, message payloads and compression scratch space.
 */
class ByteBuffer {
 public:
  using size_type = std::size_t;

  ByteBuffer() noexcept = default;

  explicit ByteBuffer(size_type capacity);

  explicit ByteBuffer(std::span<const std::byte> data);

  explicit ByteBuffer(std::string_view data);

  ByteBuffer(const ByteBuffer &rhs);
  ByteBuffer(ByteBuffer &&rhs) noexcept;

  ByteBuffer &operator=(const ByteBuffer &rhs);
  ByteBuffer &operator=(ByteBuffer &&rhs) noexcept;

  ~ByteBuffer();

  // ---- write side ----

  void writeBytes(std::span<const std::byte> data);

  void writeBytes(std::string_view data);

  void writeU8(uint8_t value);

  void writeU32BE(uint32_t value);

  // Overwrites 4 already written bytes at absolute position 'pos' (relative to the start of the storage).
  void setU32BE(size_type pos, uint32_t value);

  // Makes sure that at least 'nbBytes' can be written after writerIndex without reallocation.
  void ensureWritable(size_type nbBytes);

  [[nodiscard]] std::byte *writableData() noexcept { return _buf + _writerIndex; }

  [[nodiscard]] size_type writableBytes() const noexcept { return _capacity - _writerIndex; }

  // Marks 'nbBytes' bytes written directly through writableData() as readable.
  void commitWrite(size_type nbBytes);

  // Drops the bytes written after absolute position 'pos', which should be between readerIndex and writerIndex.
  void truncate(size_type pos);

  // ---- read side ----

  [[nodiscard]] size_type readableBytes() const noexcept { return _writerIndex - _readerIndex; }

  [[nodiscard]] bool empty() const noexcept { return _writerIndex == _readerIndex; }

  [[nodiscard]] std::span<const std::byte> readableSpan() const noexcept {
    return {_buf + _readerIndex, readableBytes()};
  }

  [[nodiscard]] std::string_view readableView() const noexcept {
    return {reinterpret_cast<const char *>(_buf + _readerIndex), readableBytes()};
  }

  // Each read* method returns std::nullopt (and consumes nothing) if not enough bytes are readable.
  [[nodiscard]] std::optional<uint8_t> readU8() noexcept;

  [[nodiscard]] std::optional<uint32_t> readU32BE() noexcept;

  // Returns a view of the next 'nbBytes' readable bytes and consumes them.
  // The view is valid until the next non-const operation on the buffer.
  [[nodiscard]] std::optional<std::span<const std::byte>> readSpan(size_type nbBytes) noexcept;

  void moveReaderIndex(size_type nbBytes);

  // Moves readable bytes to the start of the storage.
  void discardReadBytes() noexcept;

  // Resets both indexes to 0, keeping the storage (and making sure it can hold at least 'minCapacity' bytes).
  void clear(size_type minCapacity = 0);

  [[nodiscard]] size_type readerIndex() const noexcept { return _readerIndex; }

  [[nodiscard]] size_type writerIndex() const noexcept { return _writerIndex; }

  [[nodiscard]] size_type capacity() const noexcept { return _capacity; }

  void swap(ByteBuffer &rhs) noexcept;

  // Compares readable bytes only.
  bool operator==(const ByteBuffer &rhs) const noexcept;

 private:
  void reallocUp(size_type newCapacity);

  std::byte *_buf = nullptr;
  size_type _readerIndex = 0;
  size_type _writerIndex = 0;
  size_type _capacity = 0;
};

inline void swap(ByteBuffer &lhs, ByteBuffer &rhs) noexcept { lhs.swap(rhs); }

}  // namespace h2rpc
