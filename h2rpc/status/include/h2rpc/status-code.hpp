#pragma once

#include <cstdint>
#include <optional>
#include <string_view>

namespace h2rpc {

// Status codes of RPC outcomes, carried in the grpc-status trailer.
enum class StatusCode : uint8_t {
  ok = 0,
  cancelled = 1,
  unknown = 2,
  invalidArgument = 3,
  deadlineExceeded = 4,
  notFound = 5,
  alreadyExists = 6,
  permissionDenied = 7,
  resourceExhausted = 8,
  failedPrecondition = 9,
  aborted = 10,
  outOfRange = 11,
  unimplemented = 12,
  internalError = 13,
  unavailable = 14,
  dataLoss = 15,
  unauthenticated = 16,
};

inline constexpr int kNbStatusCodes = 17;

constexpr std::string_view StatusCodeName(StatusCode code) noexcept {
  switch (code) {
    case StatusCode::ok:
      return "ok";
    case StatusCode::cancelled:
      return "cancelled";
    case StatusCode::unknown:
      return "unknown";
    case StatusCode::invalidArgument:
      return "invalid argument";
    case StatusCode::deadlineExceeded:
      return "deadline exceeded";
    case StatusCode::notFound:
      return "not found";
    case StatusCode::alreadyExists:
      return "already exists";
    case StatusCode::permissionDenied:
      return "permission denied";
    case StatusCode::resourceExhausted:
      return "resource exhausted";
    case StatusCode::failedPrecondition:
      return "failed precondition";
    case StatusCode::aborted:
      return "aborted";
    case StatusCode::outOfRange:
      return "out of range";
    case StatusCode::unimplemented:
      return "unimplemented";
    case StatusCode::internalError:
      return "internal error";
    case StatusCode::unavailable:
      return "unavailable";
    case StatusCode::dataLoss:
      return "data loss";
    case StatusCode::unauthenticated:
      return "unauthenticated";
    default:
      return "invalid status code";
  }
}

// Converts the numeric value of a grpc-status trailer. Returns std::nullopt outside of [0, 16].
constexpr std::optional<StatusCode> StatusCodeFromValue(int value) noexcept {
  if (value < 0 || value >= kNbStatusCodes) {
    return std::nullopt;
  }
  return static_cast<StatusCode>(value);
}

}  // namespace h2rpc
