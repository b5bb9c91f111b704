#pragma once

#include <cstddef>
#include <cstdint>

namespace h2rpc {

// Upper bound on the size of a decompressed message, either absolute or relative to its compressed size.
// Protects against compression bombs.
class DecompressionLimit {
 public:
  enum class Kind : int8_t { absolute, ratio };

  // Decompressed messages may not be larger than 'maxBytes'.
  static constexpr DecompressionLimit Absolute(std::size_t maxBytes) noexcept {
    return DecompressionLimit(Kind::absolute, maxBytes);
  }

  // Decompressed messages may not be larger than 'ratio' times their compressed size.
  static constexpr DecompressionLimit Ratio(std::size_t ratio) noexcept { return DecompressionLimit(Kind::ratio, ratio); }

  [[nodiscard]] constexpr Kind kind() const noexcept { return _kind; }

  [[nodiscard]] constexpr std::size_t value() const noexcept { return _value; }

  // Maximum allowed decompressed size for a message of 'compressedSize' bytes (saturating).
  [[nodiscard]] std::size_t maximumDecompressedSize(std::size_t compressedSize) const noexcept;

  // Throws invalid_argument if the limit would reject every non empty message.
  void validate() const;

  constexpr bool operator==(const DecompressionLimit&) const noexcept = default;

 private:
  constexpr DecompressionLimit(Kind kind, std::size_t value) noexcept : _value(value), _kind(kind) {}

  std::size_t _value;
  Kind _kind;
};

}  // namespace h2rpc
