#include "time.hpp"

#include <cctype>
#include <charconv>
#include <cstdio>

namespace pricing::util {

namespace {

bool ReadInt(std::string_view text, size_t pos, size_t len, int& out) {
  if (pos + len > text.size()) return false;
  for (size_t i = pos; i < pos + len; ++i) {
    if (!std::isdigit(static_cast<unsigned char>(text[i]))) return false;
  }
  auto [ptr, ec] = std::from_chars(text.data() + pos, text.data() + pos + len, out);
  return ec == std::errc() && ptr == text.data() + pos + len;
}

} // namespace

TimePoint Now() {
  return Clock::now();
}

int64_t ToUnixMillis(TimePoint tp) {
  return std::chrono::duration_cast<std::chrono::milliseconds>(tp.time_since_epoch()).count();
}

TimePoint FromUnixMillis(int64_t ms) {
  return TimePoint{} + std::chrono::milliseconds(ms);
}

std::optional<TimePoint> ParseTimestamp(std::string_view text) {
  int year = 0, month = 0, day = 0;
  if (!ReadInt(text, 0, 4, year) || text.size() < 10 || text[4] != '-' || !ReadInt(text, 5, 2, month) || text[7] != '-' ||
      !ReadInt(text, 8, 2, day)) {
    return std::nullopt;
  }

  const std::chrono::year_month_day ymd{std::chrono::year{year}, std::chrono::month{static_cast<unsigned>(month)},
                                        std::chrono::day{static_cast<unsigned>(day)}};
  if (!ymd.ok()) return std::nullopt;

  int    hour = 0, minute = 0, second = 0, millis = 0;
  size_t pos = 10;
  if (pos < text.size() && (text[pos] == 'T' || text[pos] == ' ')) {
    if (!ReadInt(text, pos + 1, 2, hour) || text.size() < pos + 9 || text[pos + 3] != ':' || !ReadInt(text, pos + 4, 2, minute) ||
        text[pos + 6] != ':' || !ReadInt(text, pos + 7, 2, second)) {
      return std::nullopt;
    }
    pos += 9;

    if (pos < text.size() && text[pos] == '.') {
      ++pos;
      int digits = 0;
      while (pos < text.size() && std::isdigit(static_cast<unsigned char>(text[pos]))) {
        if (digits < 3) millis = millis * 10 + (text[pos] - '0');
        ++digits;
        ++pos;
      }
      if (digits == 0) return std::nullopt;
      for (int i = digits; i < 3; ++i) millis *= 10;
    }
  }
  if (hour > 23 || minute > 59 || second > 60) return std::nullopt;

  std::chrono::minutes offset{0};
  if (pos < text.size()) {
    if (text[pos] == 'Z' && pos + 1 == text.size()) {
      pos += 1;
    } else if ((text[pos] == '+' || text[pos] == '-') && text.size() == pos + 6 && text[pos + 3] == ':') {
      int oh = 0, om = 0;
      if (!ReadInt(text, pos + 1, 2, oh) || !ReadInt(text, pos + 4, 2, om)) return std::nullopt;
      offset = std::chrono::hours(oh) + std::chrono::minutes(om);
      if (text[pos] == '-') offset = -offset;
      pos += 6;
    } else {
      return std::nullopt;
    }
  }

  const auto local = std::chrono::sys_days{ymd} + std::chrono::hours(hour) + std::chrono::minutes(minute) + std::chrono::seconds(second) +
                     std::chrono::milliseconds(millis);
  return std::chrono::time_point_cast<Clock::duration>(local - offset);
}

std::string FormatTimestamp(TimePoint tp) {
  const auto ms   = std::chrono::time_point_cast<std::chrono::milliseconds>(tp);
  const auto days = std::chrono::floor<std::chrono::days>(ms);
  const std::chrono::year_month_day ymd{days};
  const std::chrono::hh_mm_ss       hms{ms - days};

  char buf[32];
  std::snprintf(buf, sizeof(buf), "%04d-%02u-%02uT%02d:%02d:%02d.%03dZ", static_cast<int>(ymd.year()), static_cast<unsigned>(ymd.month()),
                static_cast<unsigned>(ymd.day()), static_cast<int>(hms.hours().count()), static_cast<int>(hms.minutes().count()),
                static_cast<int>(hms.seconds().count()), static_cast<int>(hms.subseconds().count()));
  return buf;
}

} // namespace pricing::util
