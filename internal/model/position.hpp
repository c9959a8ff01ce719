#pragma once

#include <cstdint>
#include <optional>
#include <string>

#include "internal/model/coordinate.hpp"

namespace flashback::model {

// Wall-clock window, Unix epoch milliseconds. At least one bound is required.
struct TimeWindow {
  std::optional<std::int64_t> start_ms;
  std::optional<std::int64_t> end_ms;
};

struct FileTimeRange {
  std::string  file;
  std::int64_t start_ms = 0; // first timestamped event of the file
  std::int64_t end_ms   = 0; // start of the next-newer file, or now
};

enum class PositionRole : std::uint8_t {
  kRangeStart,
  kRangeEnd,
};

struct PositionResult {
  Coordinate   coordinate;
  std::int64_t timestamp_ms = 0;
  PositionRole role         = PositionRole::kRangeStart;
};

struct LocateResult {
  std::optional<PositionResult> range_start;
  std::optional<PositionResult> range_end;

  bool Found() const {
    return range_start.has_value() || range_end.has_value();
  }
};

} // namespace flashback::model
