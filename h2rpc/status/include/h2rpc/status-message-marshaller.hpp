#pragma once

#include <string>
#include <string_view>

namespace h2rpc {

// Status messages travel in the grpc-message trailer, percent encoded.
//
// Bytes in the printable ASCII range 0x20-0x7E are sent as is, except '%' (0x25).
// Every other byte is sent as %XX with upper case hexadecimal digits.

constexpr bool IsUnreservedStatusMessageChar(char ch) noexcept {
  const auto byte = static_cast<unsigned char>(ch);
  return byte >= 0x20 && byte <= 0x7E && byte != '%';
}

// Percent encodes 'message' for the grpc-message trailer. Never fails.
std::string MarshallStatusMessage(std::string_view message);

// Decodes a grpc-message trailer value. Never fails: malformed input (a '%' not followed by two hexadecimal digits)
// is returned verbatim.
std::string UnmarshallStatusMessage(std::string_view message);

}  // namespace h2rpc
