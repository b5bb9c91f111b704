#pragma once

#include <cerrno>
#include <format>
#include <system_error>
#include <utility>

namespace h2rpc {

// Throws std::system_error for the current errno, with a message formatted from 'fmt' and 'args'.
// errno is read before formatting.
template <typename... Args>
[[noreturn]] void throw_errno(std::format_string<Args...> fmt, Args&&... args) {
  const int err = errno;
  throw std::system_error(err, std::system_category(), std::format(fmt, std::forward<Args>(args)...));
}

}  // namespace h2rpc
