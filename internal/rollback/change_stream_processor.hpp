#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <stop_token>
#include <string>
#include <unordered_set>

#include "internal/catalog/table_catalog.hpp"
#include "internal/model/change_event.hpp"
#include "internal/rollback/statement_sink.hpp"
#include "internal/rollback/table_filter.hpp"
#include "internal/stream/event_source.hpp"

namespace flashback::rollback {

struct ProcessorOptions {
  std::size_t               channel_capacity = 1024;
  std::chrono::milliseconds connect_timeout{300000};
};

struct StartPosition {
  std::optional<std::string>   file;
  std::optional<std::uint64_t> offset;
};

struct RunSummary {
  std::uint64_t     events       = 0;
  std::uint64_t     statements   = 0;
  std::uint64_t     dropped_rows = 0; // filtered, unresolved or out of context
  std::uint64_t     skipped_rows = 0; // nothing to compensate
  model::Coordinate start;
  model::Coordinate last;
  bool              cancelled = false;
};

/*
  Rollback pipeline.

  A producer thread runs the upstream stream and feeds a bounded channel; the
  calling thread consumes it in log order, tracks the live TableDefine
  context, and hands one compensating statement per row to the sink as soon
  as it is synthesized.

  Run() blocks until `stop` is requested or the upstream ends. Upstream
  failures are rethrown as util::ConnectionError; there is no reconnect.
*/
class ChangeStreamProcessor {
 public:
  ChangeStreamProcessor(std::shared_ptr<stream::EventSource> source, std::shared_ptr<catalog::TableCatalog> catalog,
                        ProcessorOptions options = {});

  RunSummary Run(const StartPosition& start, const TableFilter& filter, StatementSink& sink, std::stop_token stop);

  // Consumes one event. Run() calls this for every event it pops.
  void Handle(const model::ChangeEvent& event, const TableFilter& filter, StatementSink& sink, RunSummary& summary);

 private:
  struct TableContext {
    std::uint64_t               table_id = 0;
    std::string                 database;
    std::string                 table;
    const model::TableMetadata* metadata = nullptr; // nullptr: inert
  };

  void OnTableDefine(const model::TableDefine& define, const TableFilter& filter);

  // Context for a row event of `table_id`, or nullptr when its rows are dropped.
  const TableContext* ContextFor(std::uint64_t table_id, const model::Coordinate& at);

  void Emit(model::ChangeKind kind, const TableContext& context, const model::RowImage* before, const model::RowImage* after,
            const model::ChangeEvent& event, StatementSink& sink, RunSummary& summary);

  std::shared_ptr<stream::EventSource>  source_;
  std::shared_ptr<catalog::TableCatalog> catalog_;
  ProcessorOptions                      options_;

  std::optional<TableContext>     context_;
  std::unordered_set<std::string> failed_tables_;
};

} // namespace flashback::rollback
