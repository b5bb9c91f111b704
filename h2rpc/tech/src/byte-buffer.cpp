#include "h2rpc/byte-buffer.hpp"

#include <cstddef>
#include <cstdint>
#include <cstdlib>
#include <cstring>
#include <limits>
#include <new>
#include <optional>
#include <span>
#include <stdexcept>
#include <string_view>
#include <utility>

#include "h2rpc/big-endian.hpp"

namespace h2rpc {

ByteBuffer::ByteBuffer(size_type capacity)
    : _buf(static_cast<std::byte *>(std::malloc(capacity))), _capacity(capacity) {
  if (capacity != 0 && _buf == nullptr) {
    throw std::bad_alloc();
  }
}

ByteBuffer::ByteBuffer(std::span<const std::byte> data) : ByteBuffer(data.size()) {
  if (!data.empty()) {
    std::memcpy(_buf, data.data(), data.size());
    _writerIndex = data.size();
  }
}

ByteBuffer::ByteBuffer(std::string_view data) : ByteBuffer(std::as_bytes(std::span<const char>(data))) {}

ByteBuffer::ByteBuffer(const ByteBuffer &rhs) : ByteBuffer(rhs.readableSpan()) {}

ByteBuffer::ByteBuffer(ByteBuffer &&rhs) noexcept
    : _buf(std::exchange(rhs._buf, nullptr)),
      _readerIndex(std::exchange(rhs._readerIndex, 0)),
      _writerIndex(std::exchange(rhs._writerIndex, 0)),
      _capacity(std::exchange(rhs._capacity, 0)) {}

ByteBuffer &ByteBuffer::operator=(const ByteBuffer &rhs) {
  if (this != &rhs) {
    clear(rhs.readableBytes());
    writeBytes(rhs.readableSpan());
  }
  return *this;
}

ByteBuffer &ByteBuffer::operator=(ByteBuffer &&rhs) noexcept {
  if (this != &rhs) {
    std::free(_buf);
    _buf = std::exchange(rhs._buf, nullptr);
    _readerIndex = std::exchange(rhs._readerIndex, 0);
    _writerIndex = std::exchange(rhs._writerIndex, 0);
    _capacity = std::exchange(rhs._capacity, 0);
  }
  return *this;
}

ByteBuffer::~ByteBuffer() { std::free(_buf); }

void ByteBuffer::writeBytes(std::span<const std::byte> data) {
  if (!data.empty()) {
    ensureWritable(data.size());
    std::memcpy(_buf + _writerIndex, data.data(), data.size());
    _writerIndex += data.size();
  }
}

void ByteBuffer::writeBytes(std::string_view data) { writeBytes(std::as_bytes(std::span<const char>(data))); }

void ByteBuffer::writeU8(uint8_t value) {
  ensureWritable(1U);
  _buf[_writerIndex++] = static_cast<std::byte>(value);
}

void ByteBuffer::writeU32BE(uint32_t value) {
  ensureWritable(sizeof(uint32_t));
  Write32BE(_buf + _writerIndex, value);
  _writerIndex += sizeof(uint32_t);
}

void ByteBuffer::setU32BE(size_type pos, uint32_t value) {
  if (_writerIndex < pos || _writerIndex - pos < sizeof(uint32_t)) {
    throw std::out_of_range("setU32BE outside of written bytes");
  }
  Write32BE(_buf + pos, value);
}

void ByteBuffer::ensureWritable(size_type nbBytes) {
  if (writableBytes() >= nbBytes) {
    return;
  }
  if (std::numeric_limits<size_type>::max() - _writerIndex < nbBytes) {
    throw std::bad_alloc();
  }
  const size_type required = _writerIndex + nbBytes;
  size_type newCapacity = _capacity > std::numeric_limits<size_type>::max() / 2U ? required : (_capacity * 2U) + 1U;
  // NOLINTNEXTLINE(readability-use-std-min-max) to avoid include of <algorithm> which is a big include
  if (newCapacity < required) {
    newCapacity = required;
  }
  reallocUp(newCapacity);
}

void ByteBuffer::commitWrite(size_type nbBytes) {
  if (writableBytes() < nbBytes) {
    throw std::out_of_range("commitWrite beyond capacity");
  }
  _writerIndex += nbBytes;
}

void ByteBuffer::truncate(size_type pos) {
  if (pos < _readerIndex || pos > _writerIndex) {
    throw std::out_of_range("truncate outside of readable bytes");
  }
  _writerIndex = pos;
}

std::optional<uint8_t> ByteBuffer::readU8() noexcept {
  if (readableBytes() < 1U) {
    return std::nullopt;
  }
  return static_cast<uint8_t>(_buf[_readerIndex++]);
}

std::optional<uint32_t> ByteBuffer::readU32BE() noexcept {
  if (readableBytes() < sizeof(uint32_t)) {
    return std::nullopt;
  }
  const uint32_t value = Read32BE(_buf + _readerIndex);
  _readerIndex += sizeof(uint32_t);
  return value;
}

std::optional<std::span<const std::byte>> ByteBuffer::readSpan(size_type nbBytes) noexcept {
  if (readableBytes() < nbBytes) {
    return std::nullopt;
  }
  std::span<const std::byte> ret(_buf + _readerIndex, nbBytes);
  _readerIndex += nbBytes;
  return ret;
}

void ByteBuffer::moveReaderIndex(size_type nbBytes) {
  if (readableBytes() < nbBytes) {
    throw std::out_of_range("moveReaderIndex beyond readable bytes");
  }
  _readerIndex += nbBytes;
}

void ByteBuffer::discardReadBytes() noexcept {
  if (_readerIndex == 0) {
    return;
  }
  const size_type nbReadable = readableBytes();
  if (nbReadable != 0) {
    std::memmove(_buf, _buf + _readerIndex, nbReadable);
  }
  _readerIndex = 0;
  _writerIndex = nbReadable;
}

void ByteBuffer::clear(size_type minCapacity) {
  _readerIndex = 0;
  _writerIndex = 0;
  if (_capacity < minCapacity) {
    reallocUp(minCapacity);
  }
}

void ByteBuffer::swap(ByteBuffer &rhs) noexcept {
  using std::swap;
  swap(_buf, rhs._buf);
  swap(_readerIndex, rhs._readerIndex);
  swap(_writerIndex, rhs._writerIndex);
  swap(_capacity, rhs._capacity);
}

bool ByteBuffer::operator==(const ByteBuffer &rhs) const noexcept {
  const auto lhsBytes = readableSpan();
  const auto rhsBytes = rhs.readableSpan();
  if (lhsBytes.size() != rhsBytes.size()) {
    return false;
  }
  // memcmp with nullptr is undefined behavior even if size is zero
  return lhsBytes.empty() || std::memcmp(lhsBytes.data(), rhsBytes.data(), lhsBytes.size()) == 0;
}

void ByteBuffer::reallocUp(size_type newCapacity) {
  auto *newBuf = static_cast<std::byte *>(std::realloc(_buf, newCapacity));
  if (newBuf == nullptr) {
    throw std::bad_alloc();
  }
  _buf = newBuf;
  _capacity = newCapacity;
}

}  // namespace h2rpc
