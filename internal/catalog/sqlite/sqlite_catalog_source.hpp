#pragma once

#include <map>
#include <memory>
#include <string>
#include <vector>

#include "internal/catalog/catalog_source.hpp"
#include "internal/catalog/sqlite/sqlite_db.hpp"

namespace flashback::catalog::sqlite {

/*
  Catalog backed by a SQLite schema snapshot.

  A database name maps to a SQLite schema: "main" for the opened file, or
  the name a file was attached under.

    ListColumns               pragma_table_info, pk > 0 flags the column
    PrimaryKeyFromConstraints pragma_table_info ordered by pk ordinal
    PrimaryKeyFromIndex       pragma_index_list (origin 'pk') + pragma_index_info
*/
class SqliteCatalogSource : public CatalogSource {
 public:
  explicit SqliteCatalogSource(std::shared_ptr<SqliteDB> db);

  // Opens `path` read-only and attaches `attach` (schema -> file).
  static std::shared_ptr<SqliteCatalogSource> Open(const std::string& path, const std::map<std::string, std::string>& attach);

  std::vector<ColumnInfo> ListColumns(const std::string& database, const std::string& table) override;

  std::vector<std::string> PrimaryKeyFromConstraints(const std::string& database, const std::string& table) override;

  std::vector<std::string> PrimaryKeyFromIndex(const std::string& database, const std::string& table) override;

 private:
  std::shared_ptr<SqliteDB> db_;
};

} // namespace flashback::catalog::sqlite
