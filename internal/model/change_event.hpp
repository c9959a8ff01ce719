#pragma once

#include <cstdint>
#include <string>
#include <utility>
#include <variant>
#include <vector>

#include "internal/model/coordinate.hpp"
#include "internal/model/row_value.hpp"

namespace flashback::model {

// Announces the table that the immediately following row events refer to.
struct TableDefine {
  std::uint64_t table_id = 0;
  std::string   database;
  std::string   table;
  std::uint32_t column_count = 0;
};

struct RowInsert {
  std::uint64_t         table_id = 0;
  std::vector<RowImage> rows;
};

struct RowDelete {
  std::uint64_t         table_id = 0;
  std::vector<RowImage> rows;
};

struct RowUpdate {
  std::uint64_t table_id = 0;
  // (before, after) per changed row
  std::vector<std::pair<RowImage, RowImage>> rows;
};

// Anything else the log carries (transaction boundaries, heartbeats, rotations).
struct Marker {
  std::string kind;
};

using EventBody = std::variant<TableDefine, RowInsert, RowUpdate, RowDelete, Marker>;

struct ChangeEvent {
  Coordinate   coordinate;
  std::int64_t timestamp_ms = 0; // 0: producer had no timestamp
  EventBody    body;
};

} // namespace flashback::model
