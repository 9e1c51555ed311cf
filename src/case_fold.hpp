#pragma once

// Internal helpers for case-insensitive comparison of UTF-8 field values.

#include <string>
#include <string_view>

namespace eligo::detail {

// Lowercases ASCII letters and the Latin-1 Supplement capitals U+00C0..U+00DE
// (except U+00D7) encoded as 0xC3 0x80..0x9E. Other bytes pass through.
inline auto fold_case(std::string_view in) -> std::string {
  std::string out(in);
  for (std::size_t i = 0; i < out.size(); ++i) {
    auto c = static_cast<unsigned char>(out[i]);
    if (c >= 'A' && c <= 'Z') {
      out[i] = static_cast<char>(c - 'A' + 'a');
    } else if (c == 0xC3 && i + 1 < out.size()) {
      auto n = static_cast<unsigned char>(out[i + 1]);
      if (n >= 0x80 && n <= 0x9E && n != 0x97) out[i + 1] = static_cast<char>(n + 0x20);
      ++i;
    }
  }
  return out;
}

} // namespace eligo::detail
