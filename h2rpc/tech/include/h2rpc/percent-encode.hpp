#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>

namespace h2rpc {

namespace internal {

inline constexpr std::string_view kUpperHexDigits = "0123456789ABCDEF";

// Value of the hexadecimal digit 'ch' (either case), or -1 if it is not one.
constexpr int HexDigitValue(char ch) noexcept {
  if (ch >= '0' && ch <= '9') {
    return ch - '0';
  }
  const char lower = static_cast<char>(ch | 0x20);
  if (lower >= 'a' && lower <= 'f') {
    return lower - 'a' + 10;
  }
  return -1;
}

}  // namespace internal

/// Returns the size of the percent encoded form of 'data', where every char 'ch' for which
/// isNotEncodedFunc(ch) is false takes 3 chars (%XX).
template <class IsNotEncodedFunc>
constexpr std::size_t PercentEncodedSize(std::string_view data, IsNotEncodedFunc isNotEncodedFunc) {
  std::size_t nbChars = 0;
  for (char ch : data) {
    if (isNotEncodedFunc(ch)) {
      ++nbChars;
    } else {
      nbChars += 3UL;
    }
  }
  return nbChars;
}

/// Writes the percent encoded form of 'data' into 'buf', which should have room for
/// PercentEncodedSize(data, isNotEncodedFunc) chars. Hexadecimal digits are in upper case.
/// Returns a pointer to the char immediately after the last written char.
template <class IsNotEncodedFunc>
constexpr char *PercentEncode(std::string_view data, IsNotEncodedFunc isNotEncodedFunc, char *buf) {
  for (char ch : data) {
    if (isNotEncodedFunc(ch)) {
      *buf++ = ch;
    } else {
      const auto byte = static_cast<unsigned char>(ch);
      *buf++ = '%';
      *buf++ = internal::kUpperHexDigits[byte >> 4U];
      *buf++ = internal::kUpperHexDigits[byte & 0x0FU];
    }
  }
  return buf;
}

/// Decodes every %XX sequence of 'data' (hexadecimal digits of either case), other chars are copied as is.
/// Returns std::nullopt if a '%' is not followed by two hexadecimal digits.
std::optional<std::string> PercentDecode(std::string_view data);

}  // namespace h2rpc
