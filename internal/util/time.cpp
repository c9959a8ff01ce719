#include "time.hpp"

#include <ctime>
#include <iomanip>
#include <sstream>

namespace flashback::util {

TimePoint Now() {
  return Clock::now();
}

int64_t ToUnixMillis(TimePoint tp) {
  return std::chrono::duration_cast<std::chrono::milliseconds>(tp.time_since_epoch()).count();
}

TimePoint FromUnixMillis(int64_t millis) {
  return TimePoint{} + std::chrono::milliseconds(millis);
}

std::optional<int64_t> ParseLocalDateTime(const std::string& text) {
  std::tm tm{};
  std::istringstream in(text);
  in >> std::get_time(&tm, "%Y-%m-%d %H:%M:%S");
  if (in.fail()) {
    return std::nullopt;
  }

  // trailing garbage is a format error
  in >> std::ws;
  if (!in.eof()) {
    return std::nullopt;
  }

  tm.tm_isdst = -1;
  const std::time_t seconds = std::mktime(&tm);
  if (seconds == static_cast<std::time_t>(-1)) {
    return std::nullopt;
  }
  return static_cast<int64_t>(seconds) * 1000;
}

std::string FormatLocalDateTime(int64_t unix_millis) {
  std::time_t seconds = static_cast<std::time_t>(unix_millis / 1000);
  if (unix_millis < 0 && unix_millis % 1000 != 0) {
    --seconds;
  }

  std::tm tm{};
  localtime_r(&seconds, &tm);

  std::ostringstream out;
  out << std::put_time(&tm, "%Y-%m-%d %H:%M:%S");
  return out.str();
}

} // namespace flashback::util
