#pragma once

#include <cstdint>
#include <optional>
#include <string_view>

namespace h2rpc {

// Flavours of the gRPC protocol, identified by the content-type header of a stream.
enum class ContentType : uint8_t {
  // application/grpc, application/grpc+proto
  Binary,
  // application/grpc-web, application/grpc-web+proto
  Web,
  // application/grpc-web-text, application/grpc-web-text+proto
  WebText,
};

// Parses a content-type header value. Returns std::nullopt if it is not a gRPC content type.
std::optional<ContentType> ParseContentType(std::string_view value) noexcept;

// Value to send in the content-type header for 'contentType'.
constexpr std::string_view CanonicalContentType(ContentType contentType) noexcept {
  switch (contentType) {
    case ContentType::Binary:
      return "application/grpc";
    case ContentType::Web:
      return "application/grpc-web+proto";
    case ContentType::WebText:
      return "application/grpc-web-text+proto";
    default:
      return "application/grpc";
  }
}

}  // namespace h2rpc
