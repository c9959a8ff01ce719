#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>

namespace flashback::util {

/*
  Time utilities: single place to control the clock source.

  Log timestamps are Unix epoch milliseconds. Operator-facing times use the
  local zone, matching the "yyyy-MM-dd HH:mm:ss" form accepted on the CLI.
*/

using Clock     = std::chrono::system_clock;
using TimePoint = Clock::time_point;

TimePoint Now();

int64_t ToUnixMillis(TimePoint tp);
TimePoint FromUnixMillis(int64_t millis);

// "yyyy-MM-dd HH:mm:ss" in the local zone; nullopt on malformed input.
std::optional<int64_t> ParseLocalDateTime(const std::string& text);

// Inverse of ParseLocalDateTime (millisecond part dropped).
std::string FormatLocalDateTime(int64_t unix_millis);

} // namespace flashback::util
