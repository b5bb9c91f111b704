#pragma once

#include <algorithm>
#include <cstddef>
#include <exception>
#include <format>
#include <iterator>
#include <string_view>
#include <utility>

namespace h2rpc {

/// Base exception of the library.
/// The message is stored inline (no dynamic allocation) and truncated with "..." when it does not fit.
class exception : public std::exception {
 public:
  static constexpr std::size_t kMsgMaxLen = 87;

  template <unsigned N>
  explicit exception(const char (&str)[N]) noexcept
    requires(N <= kMsgMaxLen + 1)
  {
    std::copy_n(str, N, _data);
  }

  template <typename... Args>
  explicit exception(std::format_string<Args...> fmt, Args&&... args) {
    const auto ret = std::format_to_n(_data, kMsgMaxLen, fmt, std::forward<Args>(args)...);
    if (std::cmp_less(kMsgMaxLen, ret.size)) {
      std::ranges::copy(std::string_view("..."), _data + kMsgMaxLen - 3);
      _data[kMsgMaxLen] = '\0';
    } else {
      *ret.out = '\0';
    }
  }

  [[nodiscard]] const char* what() const noexcept override { return _data; }

 private:
  char _data[kMsgMaxLen + 1];
};

}  // namespace h2rpc
