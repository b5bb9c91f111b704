#pragma once

#include <format>
#include <utility>

#include "h2rpc/exception.hpp"

namespace h2rpc {

// Thrown when a connection lifecycle event is not valid in the current state.
// This denotes a bug in the caller (transport integration), not a network condition.
class InvalidStateError : public exception {
 public:
  template <typename... Args>
  explicit InvalidStateError(std::format_string<Args...> fmt, Args&&... args)
      : exception(fmt, std::forward<Args>(args)...) {}
};

}  // namespace h2rpc
