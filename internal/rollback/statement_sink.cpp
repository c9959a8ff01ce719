#include "statement_sink.hpp"

#include <stdexcept>
#include <utility>

#include "internal/observability/logging.hpp"
#include "internal/util/time.hpp"

namespace flashback::rollback {

using flashback::observability::StringField;

// ------------------------------------------------------------
// ScriptFileSink
// ------------------------------------------------------------

ScriptFileSink::ScriptFileSink(std::string path, ScriptHeader header) : path_(std::move(path)), header_(std::move(header)) {
}

void ScriptFileSink::Begin() {
  if (out_.is_open()) {
    return;
  }
  out_.open(path_, std::ios::trunc);
  if (!out_) {
    throw std::runtime_error("cannot open output file " + path_);
  }

  Write("-- Rollback SQL script");
  Write("-- Generated at: " + util::FormatLocalDateTime(header_.generated_at_ms));
  if (header_.source_file && !header_.source_file->empty()) {
    Write("-- Source log file: " + *header_.source_file);
  }
  Write("-- Mode: " + header_.mode);
  Write("");
}

void ScriptFileSink::Accept(const model::CompensatingStatement& statement) {
  Write(statement.sql + ";");
}

void ScriptFileSink::Comment(const std::string& text) {
  Write("-- " + text);
}

void ScriptFileSink::Write(const std::string& line) {
  if (!out_.is_open()) {
    Begin();
  }
  out_ << line << '\n';
  out_.flush();
  if (!out_) {
    throw std::runtime_error("write to " + path_ + " failed");
  }
}

// ------------------------------------------------------------
// LogSink
// ------------------------------------------------------------

void LogSink::Accept(const model::CompensatingStatement& statement) {
  FLASHBACK_LOG_INFO(statement.sql + ";", {StringField("reverses", model::ChangeKindName(statement.reverses)),
                                           StringField("at", model::ToString(statement.coordinate))});
}

void LogSink::Comment(const std::string& text) {
  FLASHBACK_LOG_INFO(text);
}

// ------------------------------------------------------------
// TeeSink
// ------------------------------------------------------------

TeeSink::TeeSink(std::vector<std::shared_ptr<StatementSink>> sinks) : sinks_(std::move(sinks)) {
}

void TeeSink::Begin() {
  for (const auto& sink : sinks_) {
    sink->Begin();
  }
}

void TeeSink::Accept(const model::CompensatingStatement& statement) {
  for (const auto& sink : sinks_) {
    sink->Accept(statement);
  }
}

void TeeSink::Comment(const std::string& text) {
  for (const auto& sink : sinks_) {
    sink->Comment(text);
  }
}

} // namespace flashback::rollback
