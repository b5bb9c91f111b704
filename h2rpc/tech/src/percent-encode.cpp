#include "h2rpc/percent-encode.hpp"

#include <optional>
#include <string>
#include <string_view>

namespace h2rpc {

std::optional<std::string> PercentDecode(std::string_view data) {
  std::string out(data.size(), '\0');
  char* pOut = out.data();
  const char* first = data.data();
  const char* last = first + data.size();
  for (; first < last; ++first) {
    if (*first != '%') {
      *pOut++ = *first;
      continue;
    }
    if (last - first < 3) {
      return std::nullopt;
    }
    const int v1 = internal::HexDigitValue(*++first);
    const int v2 = internal::HexDigitValue(*++first);
    if (v1 < 0 || v2 < 0) {
      return std::nullopt;
    }
    *pOut++ = static_cast<char>((v1 << 4) | v2);
  }
  out.resize(static_cast<std::string::size_type>(pOut - out.data()));
  return out;
}

}  // namespace h2rpc
