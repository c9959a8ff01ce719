#pragma once

#include <string>
#include <vector>

namespace flashback::catalog {

struct ColumnInfo {
  std::string name;
  bool        primary = false;
};

/*
  Relational catalog queries used to describe a table.

  Implementations translate backend failures into util::CatalogError.
  Upper layers never see driver error types.
*/
class CatalogSource {
 public:
  virtual ~CatalogSource() = default;

  // Columns in server order with the per-column primary flag.
  virtual std::vector<ColumnInfo> ListColumns(const std::string& database, const std::string& table) = 0;

  // Ordered primary key columns from the key-constraint catalog.
  virtual std::vector<std::string> PrimaryKeyFromConstraints(const std::string& database, const std::string& table) = 0;

  // Ordered columns of the primary index, listed directly.
  virtual std::vector<std::string> PrimaryKeyFromIndex(const std::string& database, const std::string& table) = 0;
};

} // namespace flashback::catalog
