#include "h2rpc/status.hpp"

#include <format>
#include <string>

#include "h2rpc/status-code.hpp"

namespace h2rpc {

std::string Status::toString() const {
  if (_message.empty()) {
    return std::format("{} ({})", StatusCodeName(_code), static_cast<int>(_code));
  }
  return std::format("{} ({}): {}", StatusCodeName(_code), static_cast<int>(_code), _message);
}

}  // namespace h2rpc
