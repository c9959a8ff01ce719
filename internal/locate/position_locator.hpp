#pragma once

#include <chrono>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>

#include "internal/model/position.hpp"
#include "internal/rollback/table_filter.hpp"
#include "internal/stream/event_source.hpp"

namespace flashback::locate {

struct LocatorOptions {
  std::chrono::milliseconds probe_timeout{5000};
  std::chrono::milliseconds replay_timeout{300000};
  // pause after each disconnect before the next connection
  std::chrono::milliseconds settle_delay{1000};
};

/*
  Time -> coordinate search over a file-segmented log.

  Files are visited newest first. Each file's time range is its first
  timestamped event up to the first timestamped event of the next-newer file
  (now, for the newest). Only files whose range contains a requested bound are
  replayed, and the search stops at the first file that yields every
  requested bound on its own.

  Strictly sequential: one probe connection per file, one replay connection
  per candidate, each followed by the settle delay.
*/
class PositionLocator {
 public:
  explicit PositionLocator(std::shared_ptr<stream::EventSource> source, LocatorOptions options = {});

  // Throws util::ArgumentError for a window without bounds or with start > end,
  // util::ConnectionError when the file list cannot be read.
  // The filter narrows the suggested rollback, not the search.
  model::LocateResult Locate(const model::TimeWindow& window, const rollback::TableFilter& filter);

  // Timestamp of the first timestamped event of `file`; nullopt when the file
  // has none or cannot be read.
  std::optional<std::int64_t> ProbeStart(const std::string& file);

 private:
  struct NewerFile {
    std::string  name;
    std::int64_t start_ms = 0;
  };

  model::LocateResult Replay(const model::FileTimeRange& range, const model::TimeWindow& window, bool need_start, bool need_end,
                             const std::optional<NewerFile>& newer);

  void Settle() const;

  std::shared_ptr<stream::EventSource> source_;
  LocatorOptions                       options_;
};

} // namespace flashback::locate
