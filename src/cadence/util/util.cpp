#include "cadence/util/util.hpp"

#include <charconv>
#include <chrono>
#include <ctime>

namespace cadence {

namespace {

auto parse_int(std::string_view text, std::size_t pos, std::size_t len,
               int& out) -> bool {
  if (pos + len > text.size()) {
    return false;
  }
  const char* first = text.data() + pos;
  auto [ptr, ec] = std::from_chars(first, first + len, out);
  return ec == std::errc{} && ptr == first + len;
}

}  // namespace

auto format_iso8601(TimePoint tp) -> std::string {
  auto ms = to_millis(tp);
  auto secs = static_cast<std::time_t>(ms / 1000);
  auto frac = static_cast<int>(ms % 1000);
  if (frac < 0) {
    frac += 1000;
    --secs;
  }
  std::tm tm{};
  gmtime_r(&secs, &tm);
  return std::format("{:04d}-{:02d}-{:02d}T{:02d}:{:02d}:{:02d}.{:03d}Z",
                     tm.tm_year + 1900, tm.tm_mon + 1, tm.tm_mday, tm.tm_hour,
                     tm.tm_min, tm.tm_sec, frac);
}

auto parse_iso8601(std::string_view text) -> std::optional<TimePoint> {
  std::tm tm{};
  int year = 0, month = 0, day = 0;
  if (!parse_int(text, 0, 4, year) || text.size() < 10 || text[4] != '-' ||
      !parse_int(text, 5, 2, month) || text[7] != '-' ||
      !parse_int(text, 8, 2, day)) {
    return std::nullopt;
  }
  tm.tm_year = year - 1900;
  tm.tm_mon = month - 1;
  tm.tm_mday = day;

  std::size_t pos = 10;
  int millis = 0;
  int offset_minutes = 0;

  if (pos < text.size() && (text[pos] == 'T' || text[pos] == ' ')) {
    if (!parse_int(text, pos + 1, 2, tm.tm_hour) || text.size() < pos + 9 ||
        text[pos + 3] != ':' || !parse_int(text, pos + 4, 2, tm.tm_min) ||
        text[pos + 6] != ':' || !parse_int(text, pos + 7, 2, tm.tm_sec)) {
      return std::nullopt;
    }
    pos += 9;

    if (pos < text.size() && text[pos] == '.') {
      ++pos;
      int digits = 0;
      while (pos < text.size() && text[pos] >= '0' && text[pos] <= '9') {
        if (digits < 3) {
          millis = millis * 10 + (text[pos] - '0');
        }
        ++digits;
        ++pos;
      }
      for (; digits < 3; ++digits) {
        millis *= 10;
      }
    }

    if (pos < text.size()) {
      if (text[pos] == 'Z') {
        ++pos;
      } else if (text[pos] == '+' || text[pos] == '-') {
        int sign = text[pos] == '-' ? -1 : 1;
        int hh = 0, mm = 0;
        if (!parse_int(text, pos + 1, 2, hh) || text.size() < pos + 6 ||
            text[pos + 3] != ':' || !parse_int(text, pos + 4, 2, mm) ||
            hh < 0 || hh > 23 || mm < 0 || mm > 59) {
          return std::nullopt;
        }
        offset_minutes = sign * (hh * 60 + mm);
        pos += 6;
      }
    }
  }

  if (pos != text.size()) {
    return std::nullopt;
  }
  // timegm would normalise out-of-range fields instead of rejecting them.
  auto date = std::chrono::year{year} / std::chrono::month{
                  static_cast<unsigned>(month)} /
              std::chrono::day{static_cast<unsigned>(day)};
  if (month < 1 || day < 1 || !date.ok() || tm.tm_hour < 0 ||
      tm.tm_hour > 23 || tm.tm_min < 0 || tm.tm_min > 59 || tm.tm_sec < 0 ||
      tm.tm_sec > 59) {
    return std::nullopt;
  }

  auto secs = timegm(&tm);
  if (secs == static_cast<std::time_t>(-1)) {
    return std::nullopt;
  }
  auto tp = Clock::from_time_t(secs) + std::chrono::milliseconds(millis) -
            std::chrono::minutes(offset_minutes);
  return std::chrono::time_point_cast<Clock::duration>(tp);
}

}  // namespace cadence
