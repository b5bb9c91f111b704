#include "h2rpc/message-error.hpp"

#include <format>
#include <string>

namespace h2rpc {

std::string MessageError::toString() const {
  if (code == Code::DecompressionLimitExceeded) {
    return std::format("{} (compressed size {})", MessageErrorCodeName(code), compressedSize);
  }
  return std::string(MessageErrorCodeName(code));
}

}  // namespace h2rpc
