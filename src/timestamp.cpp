#include "eligo/timestamp.hpp"

#include <charconv>
#include <cstdio>
#include <tuple>

namespace eligo {

namespace {

using namespace std::chrono;

// Reads exactly n ASCII digits at s[pos], advancing pos.
auto read_fixed(std::string_view s, std::size_t& pos, std::size_t n, int& out) noexcept -> bool {
  if (pos + n > s.size()) return false;
  for (std::size_t i = 0; i < n; ++i) {
    const char c = s[pos + i];
    if (c < '0' || c > '9') return false;
  }
  const auto res = std::from_chars(s.data() + pos, s.data() + pos + n, out);
  if (res.ec != std::errc{}) return false;
  pos += n;
  return true;
}

auto expect_char(std::string_view s, std::size_t& pos, char c) noexcept -> bool {
  if (pos >= s.size() || s[pos] != c) return false;
  ++pos;
  return true;
}

// Parses the zone designator at s[pos..]; returns the offset east of UTC.
auto read_offset(std::string_view s, std::size_t& pos, seconds& offset) noexcept -> bool {
  offset = seconds{0};
  if (pos == s.size()) return true;
  if (s[pos] == 'Z' || s[pos] == 'z') {
    ++pos;
    return true;
  }
  if (s[pos] != '+' && s[pos] != '-') return false;
  const int sign = (s[pos] == '-') ? -1 : 1;
  ++pos;
  int hh = 0, mm = 0;
  if (!read_fixed(s, pos, 2, hh)) return false;
  if (pos < s.size()) {
    if (s[pos] == ':') ++pos;
    if (!read_fixed(s, pos, 2, mm)) return false;
  }
  if (hh > 23 || mm > 59) return false;
  offset = sign * (hours{hh} + minutes{mm});
  return true;
}

} // anonymous namespace

auto parse_timestamp(std::string_view text) -> std::expected<timestamp, core::error> {
  auto malformed = [&] {
    return core::make_error(core::error_code::malformed_value,
                            "not an ISO-8601 date: '" + std::string(text) + "'", "timestamp");
  };

  std::size_t pos = 0;
  int y = 0, mo = 0, d = 0;
  if (!read_fixed(text, pos, 4, y) || !expect_char(text, pos, '-') ||
      !read_fixed(text, pos, 2, mo) || !expect_char(text, pos, '-') ||
      !read_fixed(text, pos, 2, d)) {
    return malformed();
  }
  const year_month_day ymd{year{y}, month{static_cast<unsigned>(mo)}, day{static_cast<unsigned>(d)}};
  if (!ymd.ok()) return malformed();

  int hh = 0, mi = 0, ss = 0;
  seconds offset{0};
  if (pos < text.size()) {
    if (text[pos] != 'T' && text[pos] != 't' && text[pos] != ' ') return malformed();
    ++pos;
    if (!read_fixed(text, pos, 2, hh) || !expect_char(text, pos, ':') ||
        !read_fixed(text, pos, 2, mi)) {
      return malformed();
    }
    if (pos < text.size() && text[pos] == ':') {
      ++pos;
      if (!read_fixed(text, pos, 2, ss)) return malformed();
      if (pos < text.size() && (text[pos] == '.' || text[pos] == ',')) {
        ++pos;
        const std::size_t start = pos;
        while (pos < text.size() && text[pos] >= '0' && text[pos] <= '9') ++pos;
        if (pos == start) return malformed();
      }
    }
    if (hh > 23 || mi > 59 || ss > 59) return malformed();
    if (!read_offset(text, pos, offset)) return malformed();
  }
  if (pos != text.size()) return malformed();

  const timestamp local = sys_days{ymd} + hours{hh} + minutes{mi} + seconds{ss};
  return local - offset;
}

auto to_string(timestamp t) -> std::string {
  const auto dp = floor<days>(t);
  const year_month_day ymd{dp};
  const hh_mm_ss<seconds> tod{t - dp};
  char buf[32];
  std::snprintf(buf, sizeof(buf), "%04d-%02u-%02uT%02d:%02d:%02dZ",
                static_cast<int>(ymd.year()), static_cast<unsigned>(ymd.month()),
                static_cast<unsigned>(ymd.day()), static_cast<int>(tod.hours().count()),
                static_cast<int>(tod.minutes().count()), static_cast<int>(tod.seconds().count()));
  return buf;
}

auto whole_years_between(timestamp a, timestamp b) noexcept -> std::int64_t {
  const timestamp lo = (a < b) ? a : b;
  const timestamp hi = (a < b) ? b : a;
  const auto lo_day = floor<days>(lo);
  const auto hi_day = floor<days>(hi);
  const year_month_day lo_ymd{lo_day};
  const year_month_day hi_ymd{hi_day};
  std::int64_t years = static_cast<int>(hi_ymd.year()) - static_cast<int>(lo_ymd.year());
  const auto lo_key = std::make_tuple(static_cast<unsigned>(lo_ymd.month()),
                                      static_cast<unsigned>(lo_ymd.day()), (lo - lo_day).count());
  const auto hi_key = std::make_tuple(static_cast<unsigned>(hi_ymd.month()),
                                      static_cast<unsigned>(hi_ymd.day()), (hi - hi_day).count());
  if (hi_key < lo_key) --years;
  return years;
}

auto whole_days_between(timestamp a, timestamp b) noexcept -> std::int64_t {
  const seconds span = (a < b) ? (b - a) : (a - b);
  return floor<days>(span).count();
}

auto now_seconds() noexcept -> timestamp {
  return floor<seconds>(system_clock::now());
}

} // namespace eligo
