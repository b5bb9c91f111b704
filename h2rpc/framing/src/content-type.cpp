#include "h2rpc/content-type.hpp"

#include <optional>
#include <string_view>

namespace h2rpc {

namespace {

constexpr std::string_view kProtoSuffix = "+proto";

}  // namespace

std::optional<ContentType> ParseContentType(std::string_view value) noexcept {
  if (value.ends_with(kProtoSuffix)) {
    value.remove_suffix(kProtoSuffix.size());
  }
  if (value == "application/grpc") {
    return ContentType::Binary;
  }
  if (value == "application/grpc-web") {
    return ContentType::Web;
  }
  if (value == "application/grpc-web-text") {
    return ContentType::WebText;
  }
  return std::nullopt;
}

}  // namespace h2rpc
