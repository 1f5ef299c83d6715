#include "dockworker/util/time.hpp"

#include <charconv>
#include <ctime>
#include <format>

namespace dockworker {

namespace {

auto parse_int(std::string_view text, std::size_t pos, std::size_t len,
               int& out) -> bool {
  if (pos + len > text.size()) {
    return false;
  }
  auto* first = text.data() + pos;
  auto* last = first + len;
  auto [ptr, ec] = std::from_chars(first, last, out);
  return ec == std::errc{} && ptr == last;
}

}  // namespace

auto parse_iso8601(std::string_view text)
    -> Result<std::chrono::system_clock::time_point> {
  // YYYY-MM-DDTHH:MM:SS
  constexpr std::size_t kBaseLength = 19;
  if (text.size() < kBaseLength || text[4] != '-' || text[7] != '-' ||
      (text[10] != 'T' && text[10] != ' ') || text[13] != ':' ||
      text[16] != ':') {
    return fail(Error::ParseError);
  }

  std::tm tm{};
  int year = 0, month = 0, day = 0, hour = 0, minute = 0, second = 0;
  if (!parse_int(text, 0, 4, year) || !parse_int(text, 5, 2, month) ||
      !parse_int(text, 8, 2, day) || !parse_int(text, 11, 2, hour) ||
      !parse_int(text, 14, 2, minute) || !parse_int(text, 17, 2, second)) {
    return fail(Error::ParseError);
  }
  tm.tm_year = year - 1900;
  tm.tm_mon = month - 1;
  tm.tm_mday = day;
  tm.tm_hour = hour;
  tm.tm_min = minute;
  tm.tm_sec = second;

  auto tp = std::chrono::system_clock::from_time_t(timegm(&tm));

  std::size_t pos = kBaseLength;
  if (pos < text.size() && text[pos] == '.') {
    ++pos;
    std::size_t digits = 0;
    long long millis = 0;
    while (pos < text.size() && text[pos] >= '0' && text[pos] <= '9') {
      if (digits < 3) {
        millis = millis * 10 + (text[pos] - '0');
      }
      ++digits;
      ++pos;
    }
    if (digits == 0) {
      return fail(Error::ParseError);
    }
    for (auto i = digits; i < 3; ++i) {
      millis *= 10;
    }
    tp += std::chrono::milliseconds(millis);
  }

  if (pos < text.size() && text[pos] == 'Z') {
    ++pos;
  }
  if (pos != text.size()) {
    return fail(Error::ParseError);
  }
  return tp;
}

auto format_iso8601(std::chrono::system_clock::time_point tp) -> std::string {
  return std::format("{:%Y-%m-%dT%H:%M:%S}Z",
                     std::chrono::floor<std::chrono::milliseconds>(tp));
}

}  // namespace dockworker
