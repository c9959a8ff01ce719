#include "internal/rollback/change_stream_processor.hpp"

#include <cassert>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <memory>
#include <stop_token>
#include <string>
#include <thread>
#include <vector>

#include "internal/util/errors.hpp"
#include "tests/support/fakes.hpp"

namespace {

using flashback::catalog::TableCatalog;
using flashback::model::ChangeKind;
using flashback::model::Null;
using flashback::model::RowImage;
using flashback::model::Value;
using flashback::rollback::ChangeStreamProcessor;
using flashback::rollback::RunSummary;
using flashback::rollback::StartPosition;
using flashback::rollback::TableFilter;
using namespace flashback::testing;

struct Harness {
  std::shared_ptr<FakeEventSource>   source  = std::make_shared<FakeEventSource>();
  std::shared_ptr<FakeCatalogSource> tables  = std::make_shared<FakeCatalogSource>();
  std::shared_ptr<TableCatalog>      catalog = std::make_shared<TableCatalog>(tables);
  RecordingSink                      sink;

  Harness() {
    tables->DefineSimple("shop", "orders", {"id", "name", "qty"}, {"id"});
    tables->DefineSimple("mydb", "orders", {"id", "total"}, {"id"});
    tables->DefineSimple("other", "x", {"id"}, {"id"});
  }

  RunSummary Run(const StartPosition& start, const TableFilter& filter = {}) {
    ChangeStreamProcessor processor(source, catalog);
    return processor.Run(start, filter, sink, std::stop_token{});
  }
};

StartPosition From(const std::string& file, std::uint64_t offset = FakeEventSource::kFirstOffset) {
  return StartPosition{file, offset};
}

RowImage Order(std::int64_t id, const std::string& name, std::int64_t qty) {
  return RowImage{Int(id), Str(name), Int(qty)};
}

void TestStatementsFollowLogOrder() {
  Harness h;
  h.source->Append("binlog.000001", 1000, Define(1, "shop", "orders", 3));
  const auto insert_at = h.source->Append("binlog.000001", 1001, Insert(1, {Order(1, "apple", 3), Order(2, "pear", 4)}));
  h.source->Append("binlog.000001", 1002, Marker("xid"));
  h.source->Append("binlog.000001", 1003, Define(1, "shop", "orders", 3));
  h.source->Append("binlog.000001", 1004, Update(1, {{Order(1, "apple", 3), Order(1, "apple", 5)}}));
  h.source->Append("binlog.000001", 1005, Define(1, "shop", "orders", 3));
  h.source->Append("binlog.000001", 1006, Delete(1, {Order(2, "pear", 4)}));

  const auto summary = h.Run(From("binlog.000001"));

  const std::vector<std::string> expected = {
      "DELETE FROM `shop`.`orders` WHERE `id` = 1",
      "DELETE FROM `shop`.`orders` WHERE `id` = 2",
      "UPDATE `shop`.`orders` SET `qty` = 3 WHERE `id` = 1",
      "INSERT INTO `shop`.`orders` (`id`, `name`, `qty`) VALUES (2, 'pear', 4)",
  };
  assert(h.sink.Sql() == expected);

  assert(h.sink.statements[0].reverses == ChangeKind::kInsert);
  assert(h.sink.statements[0].coordinate == insert_at);
  assert(h.sink.statements[0].timestamp_ms == 1001);
  assert(h.sink.statements[0].database == "shop" && h.sink.statements[0].table == "orders");
  assert(h.sink.statements[2].reverses == ChangeKind::kUpdate);
  assert(h.sink.statements[3].reverses == ChangeKind::kDelete);

  assert(summary.events == 7);
  assert(summary.statements == 4);
  assert(summary.dropped_rows == 0);
  assert(summary.last.offset == FakeEventSource::kFirstOffset + 6 * FakeEventSource::kStep);
  assert(!summary.cancelled);

  // explicit start: no resolved-start annotation
  assert(h.sink.comments.empty());
  assert(h.sink.begun == 1);
}

void TestFilterIsConjunctiveWithWildcards() {
  Harness h;
  h.source->Append("binlog.000001", 1000, Define(1, "mydb", "orders"));
  h.source->Append("binlog.000001", 1001, Insert(1, {RowImage{Int(10), Int(99)}}));
  h.source->Append("binlog.000001", 1002, Define(2, "other", "x"));
  h.source->Append("binlog.000001", 1003, Insert(2, {RowImage{Int(11)}}));

  const auto summary = h.Run(From("binlog.000001"), TableFilter({"mydb"}, {}));

  assert(h.sink.Sql() == std::vector<std::string>{"DELETE FROM `mydb`.`orders` WHERE `id` = 10"});
  assert(summary.dropped_rows == 1);
  // filtered tables are never introspected
  assert(h.catalog->Find("other", "x") == nullptr);
}

void TestTableFilterAloneMatchesAnyDatabase() {
  Harness h;
  h.source->Append("binlog.000001", 1000, Define(1, "mydb", "orders"));
  h.source->Append("binlog.000001", 1001, Insert(1, {RowImage{Int(1), Int(2)}}));
  h.source->Append("binlog.000001", 1002, Define(2, "shop", "orders"));
  h.source->Append("binlog.000001", 1003, Insert(2, {Order(3, "fig", 1)}));
  h.source->Append("binlog.000001", 1004, Define(3, "other", "x"));
  h.source->Append("binlog.000001", 1005, Insert(3, {RowImage{Int(1)}}));

  h.Run(From("binlog.000001"), TableFilter({}, {"orders"}));
  assert(h.sink.statements.size() == 2);
  assert(h.sink.statements[0].database == "mydb");
  assert(h.sink.statements[1].database == "shop");
}

void TestRowsOutsideTheirTableContextAreDropped() {
  Harness h;
  h.source->Append("binlog.000001", 1000, Insert(1, {Order(1, "orphan", 1)}));
  h.source->Append("binlog.000001", 1001, Define(1, "shop", "orders"));
  h.source->Append("binlog.000001", 1002, Insert(2, {Order(2, "wrong id", 1)}));
  h.source->Append("binlog.000001", 1003, Insert(1, {Order(3, "ok", 1)}));

  const auto summary = h.Run(From("binlog.000001"));
  assert(h.sink.Sql() == std::vector<std::string>{"DELETE FROM `shop`.`orders` WHERE `id` = 3"});
  assert(summary.dropped_rows == 2);
}

void TestFailedTableIsNotRetried() {
  Harness                  h;
  FakeCatalogSource::Table broken;
  broken.fail_columns = true;
  h.tables->Define("shop", "broken", broken);

  h.source->Append("binlog.000001", 1000, Define(5, "shop", "broken"));
  h.source->Append("binlog.000001", 1001, Insert(5, {RowImage{Int(1)}}));
  h.source->Append("binlog.000001", 1002, Define(5, "shop", "broken"));
  h.source->Append("binlog.000001", 1003, Delete(5, {RowImage{Int(1)}}));
  h.source->Append("binlog.000001", 1004, Define(1, "shop", "orders"));
  h.source->Append("binlog.000001", 1005, Insert(1, {Order(8, "still works", 1)}));

  const auto summary = h.Run(From("binlog.000001"));
  assert(h.tables->list_calls == 2); // broken once, orders once
  assert(summary.dropped_rows == 2);
  assert(h.sink.Sql() == std::vector<std::string>{"DELETE FROM `shop`.`orders` WHERE `id` = 8"});
}

void TestNoOpUpdateProducesNothing() {
  Harness h;
  h.source->Append("binlog.000001", 1000, Define(1, "shop", "orders"));
  h.source->Append("binlog.000001", 1001, Update(1, {{Order(1, "same", 1), Order(1, "same", 1)}}));

  const auto summary = h.Run(From("binlog.000001"));
  assert(h.sink.statements.empty());
  assert(summary.skipped_rows == 1);
}

void TestNullValuesFlowThrough() {
  Harness h;
  h.source->Append("binlog.000001", 1000, Define(1, "shop", "orders"));
  h.source->Append("binlog.000001", 1001, Delete(1, {RowImage{Int(4), Value{Null{}}, Int(0)}}));

  h.Run(From("binlog.000001"));
  assert(h.sink.Sql() == std::vector<std::string>{"INSERT INTO `shop`.`orders` (`id`, `name`, `qty`) VALUES (4, NULL, 0)"});
}

void TestStartOffsetSkipsEarlierEvents() {
  Harness h;
  h.source->Append("binlog.000001", 1000, Define(1, "shop", "orders"));
  h.source->Append("binlog.000001", 1001, Insert(1, {Order(1, "before", 1)}));
  const auto from = h.source->Append("binlog.000001", 1002, Define(1, "shop", "orders"));
  h.source->Append("binlog.000001", 1003, Insert(1, {Order(2, "after", 1)}));
  h.source->Append("binlog.000002", 2000, Define(1, "shop", "orders"));
  h.source->Append("binlog.000002", 2001, Insert(1, {Order(3, "next file", 1)}));

  const auto summary = h.Run(From(from.file, from.offset));
  assert(summary.start == from);
  assert((h.sink.Sql() == std::vector<std::string>{"DELETE FROM `shop`.`orders` WHERE `id` = 2", "DELETE FROM `shop`.`orders` WHERE `id` = 3"}));
}

void TestImplicitStartIsAnnotated() {
  Harness h;
  h.source->Append("binlog.000001", 1000, Define(1, "shop", "orders"));
  h.source->Append("binlog.000002", 2000, Define(1, "shop", "orders"));

  const auto summary = h.Run(StartPosition{});
  assert(summary.events == 0);
  assert(summary.start.file == "binlog.000002");
  assert(h.sink.comments.size() == 1);
  assert(h.sink.comments[0] == "Resolved start: binlog.000002:104");
}

void TestZeroOffsetIsAnImplicitStart() {
  Harness h;
  h.source->Append("binlog.000001", 1000, Define(1, "shop", "orders"));
  h.source->Append("binlog.000001", 1001, Insert(1, {Order(7, "plum", 1)}));

  const auto summary = h.Run(From("binlog.000001", 0));
  assert(summary.start.file == "binlog.000001");
  assert(summary.start.offset == FakeEventSource::kFirstOffset);
  assert(h.sink.Sql() == std::vector<std::string>{"DELETE FROM `shop`.`orders` WHERE `id` = 7"});
  assert(h.sink.comments.size() == 1);
  assert(h.sink.comments[0] == "Resolved start: binlog.000001:4");
}

void TestUpstreamLossIsFatal() {
  Harness h;
  h.source->Append("binlog.000001", 1000, Define(1, "shop", "orders"));
  h.source->Append("binlog.000001", 1001, Insert(1, {Order(1, "a", 1)}));
  h.source->Append("binlog.000001", 1002, Insert(1, {Order(2, "b", 1)}));
  h.source->FailRunAfter(2);

  bool threw = false;
  try {
    h.Run(From("binlog.000001"));
  } catch (const flashback::util::ConnectionError&) {
    threw = true;
  }
  assert(threw);
  // what arrived before the failure was still emitted
  assert(h.sink.Sql() == std::vector<std::string>{"DELETE FROM `shop`.`orders` WHERE `id` = 1"});
}

void TestConnectFailureIsFatal() {
  Harness h;
  h.source->Append("binlog.000001", 1000, Define(1, "shop", "orders"));
  h.source->FailConnect("binlog.000001");

  bool threw = false;
  try {
    h.Run(From("binlog.000001"));
  } catch (const flashback::util::ConnectionError&) {
    threw = true;
  }
  assert(threw);
  assert(h.sink.begun == 0);
}

void TestConnectFailureKeepsEarlierScript() {
  Harness h;
  h.source->Append("binlog.000001", 1000, Define(1, "shop", "orders"));
  h.source->FailConnect("binlog.000001");

  const auto dir = std::filesystem::temp_directory_path() / "flashback_processor_tests";
  std::filesystem::create_directories(dir);
  const auto path = dir / "rollback.sql";
  {
    std::ofstream out(path, std::ios::trunc);
    out << "INSERT INTO `shop`.`orders` (`id`) VALUES (1);\n";
  }

  flashback::rollback::ScriptFileSink script(path.string(), flashback::rollback::ScriptHeader{});
  ChangeStreamProcessor               processor(h.source, h.catalog);

  bool threw = false;
  try {
    processor.Run(From("binlog.000001"), TableFilter{}, script, std::stop_token{});
  } catch (const flashback::util::ConnectionError&) {
    threw = true;
  }
  assert(threw);

  std::ifstream            in(path);
  std::vector<std::string> lines;
  for (std::string line; std::getline(in, line);) {
    lines.push_back(line);
  }
  assert(lines == std::vector<std::string>{"INSERT INTO `shop`.`orders` (`id`) VALUES (1);"});
}

void TestStopRequestEndsLiveRun() {
  Harness h;
  h.source->SetLive(true);
  h.source->Append("binlog.000001", 1000, Define(1, "shop", "orders"));
  h.source->Append("binlog.000001", 1001, Insert(1, {Order(1, "a", 1)}));

  ChangeStreamProcessor processor(h.source, h.catalog, flashback::rollback::ProcessorOptions{4, std::chrono::milliseconds(100)});
  std::stop_source      stop;
  RunSummary            summary;

  std::thread runner([&] { summary = processor.Run(From("binlog.000001"), TableFilter{}, h.sink, stop.get_token()); });

  std::this_thread::sleep_for(std::chrono::milliseconds(50));
  h.source->Append("binlog.000001", 1002, Insert(1, {Order(2, "b", 1)}));
  std::this_thread::sleep_for(std::chrono::milliseconds(50));
  stop.request_stop();
  runner.join();

  assert(summary.cancelled);
  assert(summary.statements == 2);
}

} // namespace

int main() {
  TestStatementsFollowLogOrder();
  TestFilterIsConjunctiveWithWildcards();
  TestTableFilterAloneMatchesAnyDatabase();
  TestRowsOutsideTheirTableContextAreDropped();
  TestFailedTableIsNotRetried();
  TestNoOpUpdateProducesNothing();
  TestNullValuesFlowThrough();
  TestStartOffsetSkipsEarlierEvents();
  TestImplicitStartIsAnnotated();
  TestZeroOffsetIsAnImplicitStart();
  TestUpstreamLossIsFatal();
  TestConnectFailureIsFatal();
  TestConnectFailureKeepsEarlierScript();
  TestStopRequestEndsLiveRun();

  std::cout << "flashback_unit_change_stream_processor: pass\n";
  return 0;
}
