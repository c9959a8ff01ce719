#pragma once

#include <cstdint>
#include <string>

#include "internal/model/coordinate.hpp"

namespace flashback::model {

enum class ChangeKind : std::uint8_t {
  kInsert,
  kUpdate,
  kDelete,
};

// SQL undoing one captured row change, plus where it came from.
struct CompensatingStatement {
  std::string  sql;
  ChangeKind   reverses = ChangeKind::kInsert;
  std::string  database;
  std::string  table;
  Coordinate   coordinate;
  std::int64_t timestamp_ms = 0;
};

inline const char* ChangeKindName(ChangeKind kind) {
  switch (kind) {
    case ChangeKind::kInsert:
      return "INSERT";
    case ChangeKind::kUpdate:
      return "UPDATE";
    case ChangeKind::kDelete:
      return "DELETE";
  }
  return "UNKNOWN";
}

} // namespace flashback::model
