#pragma once

#include <chrono>
#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <string_view>

namespace pricing::util {

/*
  Time utilities. Single place to control the clock source.

  Components that depend on "now" take a NowFn so tests can drive time.
*/

using Clock     = std::chrono::system_clock;
using TimePoint = Clock::time_point;
using NowFn     = std::function<TimePoint()>;

TimePoint Now();

int64_t   ToUnixMillis(TimePoint tp);
TimePoint FromUnixMillis(int64_t ms);

// ISO-8601 ("2024-01-31T10:00:00Z", "2024-01-31T12:00:00+02:00",
// "2024-01-31 10:00:00", "2024-01-31"). A timestamp without an offset is UTC.
std::optional<TimePoint> ParseTimestamp(std::string_view text);

std::string FormatTimestamp(TimePoint tp);

} // namespace pricing::util
