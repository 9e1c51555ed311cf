#include "eligo/decimal.hpp"

#include <algorithm>
#include <cstddef>

namespace eligo {

namespace {

using boost::multiprecision::cpp_int;

auto is_space(char c) noexcept -> bool {
  return c == ' ' || c == '\t' || c == '\n' || c == '\r' || c == '\f' || c == '\v';
}

auto trim(std::string_view s) noexcept -> std::string_view {
  while (!s.empty() && is_space(s.front())) s.remove_prefix(1);
  while (!s.empty() && is_space(s.back())) s.remove_suffix(1);
  return s;
}

} // anonymous namespace

auto parse_decimal(std::string_view text) -> std::expected<decimal, core::error> {
  const std::string_view s = trim(text);
  auto malformed = [&] {
    return core::make_error(core::error_code::malformed_value,
                            "not a decimal literal: '" + std::string(text) + "'", "decimal");
  };
  if (s.empty()) return malformed();

  std::size_t pos = 0;
  bool negative = false;
  if (s[pos] == '+' || s[pos] == '-') {
    negative = (s[pos] == '-');
    ++pos;
  }

  cpp_int digits = 0;
  std::size_t int_digits = 0;
  std::size_t frac_digits = 0;
  for (; pos < s.size() && s[pos] >= '0' && s[pos] <= '9'; ++pos, ++int_digits) {
    digits = digits * 10 + (s[pos] - '0');
  }
  if (pos < s.size() && s[pos] == '.') {
    ++pos;
    for (; pos < s.size() && s[pos] >= '0' && s[pos] <= '9'; ++pos, ++frac_digits) {
      digits = digits * 10 + (s[pos] - '0');
    }
  }
  if (pos != s.size() || (int_digits == 0 && frac_digits == 0)) return malformed();

  const cpp_int scale = boost::multiprecision::pow(cpp_int(10), static_cast<unsigned>(frac_digits));
  decimal value(negative ? cpp_int(-digits) : digits, scale);
  return value;
}

auto to_string(const decimal& value) -> std::string {
  const cpp_int num = boost::multiprecision::numerator(value);
  const cpp_int den = boost::multiprecision::denominator(value);
  if (den == 1) return num.str();

  // A terminating expansion exists iff the reduced denominator is 2^a * 5^b.
  cpp_int rest = den;
  unsigned twos = 0, fives = 0;
  while (rest % 2 == 0) { rest /= 2; ++twos; }
  while (rest % 5 == 0) { rest /= 5; ++fives; }
  if (rest != 1) return num.str() + "/" + den.str();

  const unsigned places = std::max(twos, fives);
  const cpp_int scaled = num * boost::multiprecision::pow(cpp_int(10), places) / den;
  const bool negative = scaled < 0;
  std::string digits = (negative ? cpp_int(-scaled) : scaled).str();
  if (digits.size() <= places) digits.insert(0, places - digits.size() + 1, '0');
  digits.insert(digits.size() - places, 1, '.');
  return negative ? "-" + digits : digits;
}

} // namespace eligo
