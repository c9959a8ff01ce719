#include "position_locator.hpp"

#include <stdexcept>
#include <thread>

#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"

namespace flashback::locate {

using flashback::observability::BoolField;
using flashback::observability::IntField;
using flashback::observability::StringField;

namespace {

bool Contains(const model::FileTimeRange& range, std::int64_t instant) {
  return instant >= range.start_ms && instant < range.end_ms;
}

bool Complete(const model::LocateResult& result, bool need_start, bool need_end) {
  return (!need_start || result.range_start.has_value()) && (!need_end || result.range_end.has_value());
}

} // namespace

PositionLocator::PositionLocator(std::shared_ptr<stream::EventSource> source, LocatorOptions options)
    : source_(std::move(source)), options_(options) {
  if (!source_) {
    throw std::invalid_argument("PositionLocator requires an event source");
  }
}

model::LocateResult PositionLocator::Locate(const model::TimeWindow& window, const rollback::TableFilter& filter) {
  if (!window.start_ms && !window.end_ms) {
    throw util::ArgumentError("a start time or an end time is required");
  }
  if (window.start_ms && window.end_ms && *window.start_ms > *window.end_ms) {
    throw util::ArgumentError("start time is after end time");
  }

  const bool need_start = window.start_ms.has_value();
  const bool need_end   = window.end_ms.has_value();

  auto files = source_->ListLogFiles();
  if (files.empty()) {
    FLASHBACK_LOG_WARN("No log files available");
    return {};
  }

  FLASHBACK_LOG_INFO("Searching log files newest first",
                     {IntField("files", static_cast<std::int64_t>(files.size())), BoolField("need_start", need_start),
                      BoolField("need_end", need_end), IntField("databases", static_cast<std::int64_t>(filter.Databases().size())),
                      IntField("tables", static_cast<std::int64_t>(filter.Tables().size()))});

  std::optional<NewerFile> newer;

  for (auto it = files.rbegin(); it != files.rend(); ++it) {
    const auto& file = it->name;

    auto start_ms = ProbeStart(file);
    if (!start_ms) {
      FLASHBACK_LOG_WARN("Cannot determine time range, skipping file", {StringField("file", file)});
      continue;
    }

    model::FileTimeRange range;
    range.file     = file;
    range.start_ms = *start_ms;
    range.end_ms   = newer ? newer->start_ms : util::ToUnixMillis(util::Now());

    const bool start_here = need_start && Contains(range, *window.start_ms);
    const bool end_here   = need_end && Contains(range, *window.end_ms);

    FLASHBACK_LOG_DEBUG("File time range", {StringField("file", file), StringField("from", util::FormatLocalDateTime(range.start_ms)),
                                            StringField("to", util::FormatLocalDateTime(range.end_ms)),
                                            BoolField("holds_start", start_here), BoolField("holds_end", end_here)});

    if (start_here || end_here) {
      auto found = Replay(range, window, start_here, end_here, newer);
      if (Complete(found, need_start, need_end)) {
        FLASHBACK_LOG_INFO("Located window", {StringField("file", file)});
        return found;
      }
      FLASHBACK_LOG_INFO("File holds only part of the window, continuing with older files", {StringField("file", file)});
    }

    newer = NewerFile{file, range.start_ms};
  }

  FLASHBACK_LOG_INFO("No log position matches the requested window");
  return {};
}

std::optional<std::int64_t> PositionLocator::ProbeStart(const std::string& file) {
  stream::StreamRequest request;
  request.file             = file;
  request.offset           = source_->MinimalOffset();
  request.stop_at_file_end = true;

  std::optional<std::int64_t> first;
  auto                        probe = source_->Open(request);
  try {
    probe->Connect(options_.probe_timeout);
    probe->Run([&](model::ChangeEvent&& event) {
      if (event.timestamp_ms == 0) {
        return true;
      }
      first = event.timestamp_ms;
      return false;
    });
  } catch (const util::ConnectionError& e) {
    FLASHBACK_LOG_WARN("Probe failed", {StringField("file", file), StringField("error", e.what())});
    first.reset();
  }
  probe->Disconnect();
  Settle();
  return first;
}

model::LocateResult PositionLocator::Replay(const model::FileTimeRange& range, const model::TimeWindow& window, bool need_start,
                                            bool need_end, const std::optional<NewerFile>& newer) {
  model::LocateResult result;

  stream::StreamRequest request;
  request.file             = range.file;
  request.offset           = source_->MinimalOffset();
  request.stop_at_file_end = true;

  // last timestamped event seen before the current one
  model::PositionResult previous;
  previous.coordinate = model::Coordinate{range.file, source_->MinimalOffset()};
  previous.role       = model::PositionRole::kRangeEnd;

  auto replay = source_->Open(request);
  try {
    replay->Connect(options_.replay_timeout);
    replay->Run([&](model::ChangeEvent&& event) {
      if (event.timestamp_ms == 0) {
        return true;
      }
      if (need_start && !result.range_start && event.timestamp_ms >= *window.start_ms) {
        result.range_start = model::PositionResult{event.coordinate, event.timestamp_ms, model::PositionRole::kRangeStart};
      }
      if (need_end && !result.range_end && event.timestamp_ms > *window.end_ms) {
        result.range_end = previous;
      }
      previous.coordinate   = event.coordinate;
      previous.timestamp_ms = event.timestamp_ms;
      return !Complete(result, need_start, need_end);
    });
  } catch (const util::ConnectionError& e) {
    FLASHBACK_LOG_WARN("Replay failed", {StringField("file", range.file), StringField("error", e.what())});
    replay->Disconnect();
    Settle();
    return {};
  }
  replay->Disconnect();
  Settle();

  // every later event lives in a newer file, which starts after window.end
  if (need_end && !result.range_end && previous.timestamp_ms != 0) {
    result.range_end = previous;
  }
  // the first event at or after window.start opens the next-newer file
  if (need_start && !result.range_start && newer) {
    result.range_start =
        model::PositionResult{model::Coordinate{newer->name, source_->MinimalOffset()}, newer->start_ms, model::PositionRole::kRangeStart};
  }
  return result;
}

void PositionLocator::Settle() const {
  if (options_.settle_delay.count() > 0) {
    std::this_thread::sleep_for(options_.settle_delay);
  }
}

} // namespace flashback::locate
