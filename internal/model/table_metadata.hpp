#pragma once

#include <string>
#include <vector>

namespace flashback::model {

/*
  Column layout of one table as the server reports it.

  columns:      index-significant order, aligned with row images
  primary_keys: ordered subset of columns, possibly empty (no primary key)
*/
struct TableMetadata {
  std::vector<std::string> columns;
  std::vector<std::string> primary_keys;
};

// "database.table", the cache key used for the lifetime of a run
inline std::string QualifiedName(const std::string& database, const std::string& table) {
  return database + "." + table;
}

} // namespace flashback::model
