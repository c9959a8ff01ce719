#include "internal/sql/compensation_synthesizer.hpp"

#include <algorithm>
#include <stdexcept>
#include <vector>

#include "internal/sql/sql_literal.hpp"

namespace flashback::sql {

namespace {

std::string Join(const std::vector<std::string>& parts, const char* separator) {
  std::string out;
  for (std::size_t i = 0; i < parts.size(); ++i) {
    if (i > 0) {
      out += separator;
    }
    out += parts[i];
  }
  return out;
}

std::string Assignment(const std::string& column, const model::Value& value) {
  return QuoteIdentifier(column) + " = " + FormatValue(value);
}

std::string Condition(const std::string& column, const model::Value& value) {
  if (model::KindOf(value) == model::ValueKind::kNull) {
    return QuoteIdentifier(column) + " IS NULL";
  }
  return Assignment(column, value);
}

// Conditions identifying `row`: primary key columns in declared order, or
// every column when the table has none or part of its key is outside the image.
std::vector<std::string> RowConditions(const model::TableMetadata& metadata, const model::RowImage& row) {
  std::vector<std::string> conditions;

  for (const auto& pk : metadata.primary_keys) {
    const auto it    = std::find(metadata.columns.begin(), metadata.columns.end(), pk);
    const auto index = static_cast<std::size_t>(it - metadata.columns.begin());
    if (it == metadata.columns.end() || index >= row.size()) {
      conditions.clear();
      break;
    }
    conditions.push_back(Condition(pk, row[index]));
  }

  if (!conditions.empty()) {
    return conditions;
  }

  const auto width = std::min(metadata.columns.size(), row.size());
  for (std::size_t i = 0; i < width; ++i) {
    conditions.push_back(Condition(metadata.columns[i], row[i]));
  }
  return conditions;
}

} // namespace

std::optional<std::string> InvertInsert(const TableRef& table, const model::TableMetadata& metadata, const model::RowImage& inserted) {
  const auto conditions = RowConditions(metadata, inserted);
  if (conditions.empty()) {
    return std::nullopt;
  }

  return "DELETE FROM " + QualifiedTable(table.database, table.table) + " WHERE " + Join(conditions, " AND ");
}

std::optional<std::string> InvertDelete(const TableRef& table, const model::TableMetadata& metadata, const model::RowImage& deleted) {
  const auto width = std::min(metadata.columns.size(), deleted.size());
  if (width == 0) {
    return std::nullopt;
  }

  std::vector<std::string> columns;
  std::vector<std::string> values;
  columns.reserve(width);
  values.reserve(width);
  for (std::size_t i = 0; i < width; ++i) {
    columns.push_back(QuoteIdentifier(metadata.columns[i]));
    values.push_back(FormatValue(deleted[i]));
  }

  return "INSERT INTO " + QualifiedTable(table.database, table.table) + " (" + Join(columns, ", ") + ") VALUES (" +
         Join(values, ", ") + ")";
}

std::optional<std::string> InvertUpdate(const TableRef& table, const model::TableMetadata& metadata, const model::RowImage& before,
                                        const model::RowImage& after) {
  std::vector<std::string> assignments;

  // a column is unchanged when both images render the same literal
  const auto width = std::min({metadata.columns.size(), before.size(), after.size()});
  for (std::size_t i = 0; i < width; ++i) {
    auto old_literal = FormatValue(before[i]);
    if (old_literal != FormatValue(after[i])) {
      assignments.push_back(QuoteIdentifier(metadata.columns[i]) + " = " + old_literal);
    }
  }

  if (assignments.empty()) {
    return std::nullopt;
  }

  const auto conditions = RowConditions(metadata, after);
  if (conditions.empty()) {
    return std::nullopt;
  }

  return "UPDATE " + QualifiedTable(table.database, table.table) + " SET " + Join(assignments, ", ") + " WHERE " +
         Join(conditions, " AND ");
}

std::optional<std::string> Synthesize(model::ChangeKind kind, const TableRef& table, const model::TableMetadata& metadata,
                                      const model::RowImage* before, const model::RowImage* after) {
  switch (kind) {
    case model::ChangeKind::kInsert:
      if (!after) throw std::invalid_argument("insert compensation needs the inserted row");
      return InvertInsert(table, metadata, *after);
    case model::ChangeKind::kDelete:
      if (!before) throw std::invalid_argument("delete compensation needs the deleted row");
      return InvertDelete(table, metadata, *before);
    case model::ChangeKind::kUpdate:
      if (!before || !after) throw std::invalid_argument("update compensation needs both row images");
      return InvertUpdate(table, metadata, *before, *after);
  }
  throw std::logic_error("unhandled change kind");
}

} // namespace flashback::sql
