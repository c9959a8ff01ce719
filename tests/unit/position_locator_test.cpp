#include "internal/locate/position_locator.hpp"

#include <algorithm>
#include <cassert>
#include <iostream>
#include <memory>
#include <string>

#include "internal/locate/position_report.hpp"
#include "internal/util/errors.hpp"
#include "tests/support/fakes.hpp"

namespace {

using flashback::locate::LocatorOptions;
using flashback::locate::PositionLocator;
using flashback::model::Coordinate;
using flashback::model::PositionRole;
using flashback::model::TimeWindow;
using flashback::rollback::TableFilter;
using flashback::testing::FakeEventSource;
using flashback::testing::Marker;

LocatorOptions FastOptions() {
  LocatorOptions options;
  options.probe_timeout  = std::chrono::milliseconds(100);
  options.replay_timeout = std::chrono::milliseconds(100);
  options.settle_delay   = std::chrono::milliseconds(0);
  return options;
}

// binlog.000001 [100, 200), binlog.000002 [200, 300), binlog.000003 [300, now)
std::shared_ptr<FakeEventSource> ThreeFiles() {
  auto source = std::make_shared<FakeEventSource>();
  for (std::int64_t ts : {100, 150, 190}) {
    source->Append("binlog.000001", ts, Marker());
  }
  for (std::int64_t ts : {200, 220, 250, 260, 290}) {
    source->Append("binlog.000002", ts, Marker());
  }
  // untimestamped lead-in events are ignored
  source->Append("binlog.000003", 0, Marker("rotate"));
  for (std::int64_t ts : {300, 350}) {
    source->Append("binlog.000003", ts, Marker());
  }
  return source;
}

std::uint64_t Offset(int index) {
  return FakeEventSource::kFirstOffset + FakeEventSource::kStep * static_cast<std::uint64_t>(index);
}

TimeWindow Window(std::optional<std::int64_t> start, std::optional<std::int64_t> end) {
  return TimeWindow{start, end};
}

void TestStartOnlyResolvesInsideSecondFile() {
  auto            source = ThreeFiles();
  PositionLocator locator(source, FastOptions());

  auto result = locator.Locate(Window(250, std::nullopt), TableFilter{});
  assert(result.range_start.has_value());
  assert(!result.range_end.has_value());
  assert(result.range_start->coordinate == (Coordinate{"binlog.000002", Offset(2)}));
  assert(result.range_start->timestamp_ms == 250);
  assert(result.range_start->role == PositionRole::kRangeStart);

  // the oldest file is never opened once an answer is found
  assert(std::count(source->opened.begin(), source->opened.end(), "binlog.000001") == 0);
}

void TestEndIsEventBeforeFirstLaterOne() {
  PositionLocator locator(ThreeFiles(), FastOptions());

  auto result = locator.Locate(Window(std::nullopt, 255), TableFilter{});
  assert(!result.range_start.has_value());
  assert(result.range_end.has_value());
  assert(result.range_end->coordinate == (Coordinate{"binlog.000002", Offset(2)}));
  assert(result.range_end->timestamp_ms == 250);
  assert(result.range_end->role == PositionRole::kRangeEnd);
}

void TestBothBoundsInOneFile() {
  PositionLocator locator(ThreeFiles(), FastOptions());

  auto result = locator.Locate(Window(210, 255), TableFilter{});
  assert(result.range_start->coordinate == (Coordinate{"binlog.000002", Offset(1)}));
  assert(result.range_end->coordinate == (Coordinate{"binlog.000002", Offset(2)}));
}

void TestSplitWindowIsNotReported() {
  auto            source = ThreeFiles();
  PositionLocator locator(source, FastOptions());

  auto result = locator.Locate(Window(250, 350), TableFilter{});
  assert(!result.Found());
  // every file was probed after the partial matches
  assert(std::count(source->opened.begin(), source->opened.end(), "binlog.000001") == 1);
}

void TestEndPastLastEventOfFile() {
  PositionLocator locator(ThreeFiles(), FastOptions());

  auto result = locator.Locate(Window(std::nullopt, 295), TableFilter{});
  assert(result.range_end->coordinate == (Coordinate{"binlog.000002", Offset(4)}));
  assert(result.range_end->timestamp_ms == 290);
}

void TestStartPastLastEventOpensNewerFile() {
  PositionLocator locator(ThreeFiles(), FastOptions());

  auto result = locator.Locate(Window(295, std::nullopt), TableFilter{});
  assert(result.range_start->coordinate == (Coordinate{"binlog.000003", FakeEventSource::kFirstOffset}));
  assert(result.range_start->timestamp_ms == 300);
}

void TestUnprobeableFileIsSkipped() {
  auto source = ThreeFiles();
  source->FailConnect("binlog.000002");
  PositionLocator locator(source, FastOptions());

  // binlog.000001 now spans [100, 300)
  auto result = locator.Locate(Window(150, 190), TableFilter{});
  assert(result.range_start->coordinate == (Coordinate{"binlog.000001", Offset(1)}));
  assert(result.range_end->coordinate == (Coordinate{"binlog.000001", Offset(2)}));
}

void TestNothingBeforeTheLog() {
  PositionLocator locator(ThreeFiles(), FastOptions());
  assert(!locator.Locate(Window(50, 60), TableFilter{}).Found());

  PositionLocator empty(std::make_shared<FakeEventSource>(), FastOptions());
  assert(!empty.Locate(Window(50, std::nullopt), TableFilter{}).Found());
}

void TestInvalidWindowsAreRejected() {
  PositionLocator locator(ThreeFiles(), FastOptions());

  for (const auto& window : {Window(std::nullopt, std::nullopt), Window(300, 200)}) {
    bool threw = false;
    try {
      (void)locator.Locate(window, TableFilter{});
    } catch (const flashback::util::ArgumentError&) {
      threw = true;
    }
    assert(threw);
  }
}

void TestProbeStart() {
  PositionLocator locator(ThreeFiles(), FastOptions());
  assert(locator.ProbeStart("binlog.000003") == std::optional<std::int64_t>(300));
  assert(!locator.ProbeStart("binlog.000099").has_value());
}

void TestReport() {
  PositionLocator locator(ThreeFiles(), FastOptions());
  auto            result = locator.Locate(Window(210, 255), TableFilter{});

  flashback::locate::ReportContext context{"conf/flashback.yaml", TableFilter({"shop"}, {"orders", "items"})};

  const auto command = flashback::locate::RollbackCommand(*result.range_start, context);
  assert(command ==
         "flashback rollback --config conf/flashback.yaml --file binlog.000002 --position 104 --databases shop --tables items,orders");

  const auto report = flashback::locate::FormatReport(result, context);
  assert(report.find("Range start:") != std::string::npos);
  assert(report.find("Range end:") != std::string::npos);
  assert(report.find("--position 204") != std::string::npos);

  const auto none = flashback::locate::FormatReport({}, context);
  assert(none == "No log position matches the requested time range\n");
}

} // namespace

int main() {
  TestStartOnlyResolvesInsideSecondFile();
  TestEndIsEventBeforeFirstLaterOne();
  TestBothBoundsInOneFile();
  TestSplitWindowIsNotReported();
  TestEndPastLastEventOfFile();
  TestStartPastLastEventOpensNewerFile();
  TestUnprobeableFileIsSkipped();
  TestNothingBeforeTheLog();
  TestInvalidWindowsAreRejected();
  TestProbeStart();
  TestReport();

  std::cout << "flashback_unit_position_locator: pass\n";
  return 0;
}
