#include "h2rpc/status-message-marshaller.hpp"

#include <string>
#include <string_view>
#include <utility>

#include "h2rpc/percent-encode.hpp"

namespace h2rpc {

std::string MarshallStatusMessage(std::string_view message) {
  std::string ret(PercentEncodedSize(message, IsUnreservedStatusMessageChar), '\0');
  PercentEncode(message, IsUnreservedStatusMessageChar, ret.data());
  return ret;
}

std::string UnmarshallStatusMessage(std::string_view message) {
  if (!message.contains('%')) {
    return std::string(message);
  }
  auto decoded = PercentDecode(message);
  if (!decoded) {
    return std::string(message);
  }
  return std::move(*decoded);
}

}  // namespace h2rpc
