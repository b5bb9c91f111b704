#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "h2rpc/status-code.hpp"

namespace h2rpc {

// Ordered list of header name / value pairs. Names may repeat.
using Metadata = std::vector<std::pair<std::string, std::string>>;

// Outcome of an RPC: a code and an optional human readable message.
class Status {
 public:
  Status() noexcept = default;

  explicit Status(StatusCode code) noexcept : _code(code) {}

  Status(StatusCode code, std::string message) : _message(std::move(message)), _code(code) {}

  [[nodiscard]] StatusCode code() const noexcept { return _code; }

  [[nodiscard]] std::string_view message() const noexcept { return _message; }

  [[nodiscard]] bool isOk() const noexcept { return _code == StatusCode::ok; }

  // "<code name> (<code value>)", followed by ": <message>" if there is a message.
  [[nodiscard]] std::string toString() const;

  bool operator==(const Status&) const noexcept = default;

 private:
  std::string _message;
  StatusCode _code{StatusCode::ok};
};

// Final status of an RPC together with the trailing metadata sent with it, if any.
struct StatusAndTrailers {
  Status status;
  std::optional<Metadata> trailers;

  bool operator==(const StatusAndTrailers&) const = default;
};

}  // namespace h2rpc
