#pragma once

#include <optional>
#include <string>

#include "internal/model/row_value.hpp"
#include "internal/model/statement.hpp"
#include "internal/model/table_metadata.hpp"

namespace flashback::sql {

/*
  Turns one captured row change into the SQL statement that undoes it.

    INSERT -> DELETE  WHERE primary key = inserted values
    DELETE -> INSERT  full column list, deleted values
    UPDATE -> UPDATE  SET changed columns to before values,
                      WHERE primary key = after values

  Without a primary key the WHERE clause matches every column of the row,
  which is only exact when the table holds no duplicate rows. NULL values
  are matched with IS NULL.

  A row image shorter than the column list is truncated to the shorter
  length. Returns nullopt when no meaningful statement exists (an UPDATE
  that changed nothing, an empty row image).

  Pure: no I/O, no shared state.
*/
struct TableRef {
  std::string database;
  std::string table;
};

std::optional<std::string> InvertInsert(const TableRef& table, const model::TableMetadata& metadata, const model::RowImage& inserted);

std::optional<std::string> InvertDelete(const TableRef& table, const model::TableMetadata& metadata, const model::RowImage& deleted);

std::optional<std::string> InvertUpdate(const TableRef& table, const model::TableMetadata& metadata, const model::RowImage& before,
                                        const model::RowImage& after);

// Dispatch on the change kind; `before`/`after` as captured. Throws
// std::invalid_argument when the kind's required image is missing.
std::optional<std::string> Synthesize(model::ChangeKind kind, const TableRef& table, const model::TableMetadata& metadata,
                                      const model::RowImage* before, const model::RowImage* after);

} // namespace flashback::sql
