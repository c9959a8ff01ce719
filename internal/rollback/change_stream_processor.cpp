#include "change_stream_processor.hpp"

#include <exception>
#include <stdexcept>
#include <thread>
#include <type_traits>
#include <variant>

#include "internal/observability/logging.hpp"
#include "internal/sql/compensation_synthesizer.hpp"
#include "internal/stream/event_channel.hpp"
#include "internal/util/errors.hpp"

namespace flashback::rollback {

using flashback::observability::BoolField;
using flashback::observability::IntField;
using flashback::observability::StringField;

ChangeStreamProcessor::ChangeStreamProcessor(std::shared_ptr<stream::EventSource> source, std::shared_ptr<catalog::TableCatalog> catalog,
                                             ProcessorOptions options)
    : source_(std::move(source)), catalog_(std::move(catalog)), options_(options) {
  if (!source_ || !catalog_) {
    throw std::invalid_argument("ChangeStreamProcessor requires an event source and a table catalog");
  }
  if (options_.channel_capacity == 0) {
    options_.channel_capacity = 1;
  }
}

// ------------------------------------------------------------
// Run loop
// ------------------------------------------------------------

RunSummary ChangeStreamProcessor::Run(const StartPosition& start, const TableFilter& filter, StatementSink& sink, std::stop_token stop) {
  RunSummary summary;

  stream::StreamRequest request;
  request.file   = start.file;
  request.offset = start.offset;

  auto                 upstream = source_->Open(request);
  stream::EventChannel channel(options_.channel_capacity);

  std::stop_callback on_stop(stop, [&] {
    upstream->Disconnect();
    channel.Close();
  });

  try {
    upstream->Connect(options_.connect_timeout);
  } catch (const util::ConnectionError& e) {
    if (stop.stop_requested()) {
      summary.cancelled = true;
      return summary;
    }
    FLASHBACK_LOG_ERROR("Cannot connect to change stream", {StringField("error", e.what())});
    throw;
  }

  summary.start = upstream->Position();
  FLASHBACK_LOG_INFO("Connected to change stream",
                     {StringField("file", summary.start.file), IntField("offset", static_cast<std::int64_t>(summary.start.offset))});

  try {
    sink.Begin();
    if (!start.file || !start.offset || *start.offset == 0) {
      sink.Comment("Resolved start: " + model::ToString(summary.start));
    }
  } catch (const std::exception& e) {
    FLASHBACK_LOG_ERROR("Cannot open statement sink", {StringField("error", e.what())});
    upstream->Disconnect();
    throw;
  }

  std::exception_ptr upstream_error;

  std::thread producer([&] {
    try {
      upstream->Run([&](model::ChangeEvent&& event) { return channel.Push(std::move(event)); });
    } catch (const std::exception& e) {
      upstream_error = std::make_exception_ptr(util::ConnectionError(e.what()));
    }
    channel.Close();
  });

  auto shutdown = [&] {
    upstream->Disconnect();
    channel.Close();
    if (producer.joinable()) {
      producer.join();
    }
  };

  try {
    while (auto event = channel.Pop()) {
      if (stop.stop_requested()) {
        break;
      }
      Handle(*event, filter, sink, summary);
    }
  } catch (...) {
    shutdown();
    throw;
  }

  shutdown();
  summary.cancelled = stop.stop_requested();

  FLASHBACK_LOG_INFO("Rollback run finished", {IntField("events", static_cast<std::int64_t>(summary.events)),
                                               IntField("statements", static_cast<std::int64_t>(summary.statements)),
                                               IntField("dropped_rows", static_cast<std::int64_t>(summary.dropped_rows)),
                                               IntField("skipped_rows", static_cast<std::int64_t>(summary.skipped_rows)),
                                               StringField("last", model::ToString(summary.last)),
                                               BoolField("cancelled", summary.cancelled)});

  if (upstream_error && !summary.cancelled) {
    try {
      std::rethrow_exception(upstream_error);
    } catch (const std::exception& e) {
      FLASHBACK_LOG_ERROR("Change stream failed", {StringField("error", e.what()), StringField("last", model::ToString(summary.last))});
      throw;
    }
  }

  return summary;
}

// ------------------------------------------------------------
// Event handling
// ------------------------------------------------------------

void ChangeStreamProcessor::Handle(const model::ChangeEvent& event, const TableFilter& filter, StatementSink& sink, RunSummary& summary) {
  ++summary.events;
  summary.last = event.coordinate;

  std::visit(
      [&](const auto& body) {
        using T = std::decay_t<decltype(body)>;

        if constexpr (std::is_same_v<T, model::TableDefine>) {
          OnTableDefine(body, filter);
        } else if constexpr (std::is_same_v<T, model::RowInsert>) {
          const auto* context = ContextFor(body.table_id, event.coordinate);
          if (!context) {
            summary.dropped_rows += body.rows.size();
            return;
          }
          for (const auto& row : body.rows) {
            Emit(model::ChangeKind::kInsert, *context, nullptr, &row, event, sink, summary);
          }
        } else if constexpr (std::is_same_v<T, model::RowDelete>) {
          const auto* context = ContextFor(body.table_id, event.coordinate);
          if (!context) {
            summary.dropped_rows += body.rows.size();
            return;
          }
          for (const auto& row : body.rows) {
            Emit(model::ChangeKind::kDelete, *context, &row, nullptr, event, sink, summary);
          }
        } else if constexpr (std::is_same_v<T, model::RowUpdate>) {
          const auto* context = ContextFor(body.table_id, event.coordinate);
          if (!context) {
            summary.dropped_rows += body.rows.size();
            return;
          }
          for (const auto& [before, after] : body.rows) {
            Emit(model::ChangeKind::kUpdate, *context, &before, &after, event, sink, summary);
          }
        }
      },
      event.body);
}

void ChangeStreamProcessor::OnTableDefine(const model::TableDefine& define, const TableFilter& filter) {
  TableContext next;
  next.table_id = define.table_id;
  next.database = define.database;
  next.table    = define.table;

  if (filter.Accepts(define.database, define.table)) {
    const auto key = model::QualifiedName(define.database, define.table);
    if (failed_tables_.count(key) == 0) {
      try {
        next.metadata = &catalog_->Resolve(define.database, define.table);
      } catch (const util::CatalogError& e) {
        failed_tables_.insert(key);
        FLASHBACK_LOG_ERROR("Table metadata unavailable, dropping its events", {StringField("table", key), StringField("error", e.what())});
      }
    }

    if (next.metadata && define.column_count != 0 && define.column_count != next.metadata->columns.size()) {
      FLASHBACK_LOG_DEBUG("Column count differs from cached metadata",
                          {StringField("table", key), IntField("event_columns", define.column_count),
                           IntField("cached_columns", static_cast<std::int64_t>(next.metadata->columns.size()))});
    }
  }

  context_ = std::move(next);
}

const ChangeStreamProcessor::TableContext* ChangeStreamProcessor::ContextFor(std::uint64_t table_id, const model::Coordinate& at) {
  if (!context_) {
    FLASHBACK_LOG_WARN("Row event without a preceding table definition", {StringField("at", model::ToString(at))});
    return nullptr;
  }
  if (context_->table_id != table_id) {
    FLASHBACK_LOG_WARN("Row event does not match the live table definition",
                       {StringField("at", model::ToString(at)), IntField("table_id", static_cast<std::int64_t>(table_id)),
                        IntField("context_table_id", static_cast<std::int64_t>(context_->table_id))});
    return nullptr;
  }
  if (!context_->metadata) {
    return nullptr;
  }
  return &*context_;
}

void ChangeStreamProcessor::Emit(model::ChangeKind kind, const TableContext& context, const model::RowImage* before,
                                 const model::RowImage* after, const model::ChangeEvent& event, StatementSink& sink,
                                 RunSummary& summary) {
  auto sql = sql::Synthesize(kind, sql::TableRef{context.database, context.table}, *context.metadata, before, after);
  if (!sql) {
    ++summary.skipped_rows;
    FLASHBACK_LOG_DEBUG("Nothing to compensate", {StringField("kind", model::ChangeKindName(kind)),
                                                  StringField("at", model::ToString(event.coordinate))});
    return;
  }

  model::CompensatingStatement statement;
  statement.sql          = std::move(*sql);
  statement.reverses     = kind;
  statement.database     = context.database;
  statement.table        = context.table;
  statement.coordinate   = event.coordinate;
  statement.timestamp_ms = event.timestamp_ms;

  sink.Accept(statement);
  ++summary.statements;
}

} // namespace flashback::rollback
