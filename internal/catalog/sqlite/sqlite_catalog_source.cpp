#include "sqlite_catalog_source.hpp"

namespace flashback::catalog::sqlite {

SqliteCatalogSource::SqliteCatalogSource(std::shared_ptr<SqliteDB> db) : db_(std::move(db)) {
}

std::shared_ptr<SqliteCatalogSource> SqliteCatalogSource::Open(const std::string& path, const std::map<std::string, std::string>& attach) {
  auto db = std::make_shared<SqliteDB>(path, /*read_only=*/true);
  for (const auto& [schema, file] : attach) {
    db->Attach(schema, file);
  }
  return std::make_shared<SqliteCatalogSource>(std::move(db));
}

std::vector<ColumnInfo> SqliteCatalogSource::ListColumns(const std::string& database, const std::string& table) {
  Statement st(*db_, "SELECT name, pk FROM pragma_table_info(?, ?) ORDER BY cid;");
  st.BindText(1, table);
  st.BindText(2, database);

  std::vector<ColumnInfo> columns;
  while (st.Step()) {
    columns.push_back(ColumnInfo{st.ColumnText(0), st.ColumnInt(1) > 0});
  }
  return columns;
}

std::vector<std::string> SqliteCatalogSource::PrimaryKeyFromConstraints(const std::string& database, const std::string& table) {
  Statement st(*db_, "SELECT name FROM pragma_table_info(?, ?) WHERE pk > 0 ORDER BY pk;");
  st.BindText(1, table);
  st.BindText(2, database);

  std::vector<std::string> keys;
  while (st.Step()) {
    keys.push_back(st.ColumnText(0));
  }
  return keys;
}

std::vector<std::string> SqliteCatalogSource::PrimaryKeyFromIndex(const std::string& database, const std::string& table) {
  std::string index_name;
  {
    Statement st(*db_, "SELECT name FROM pragma_index_list(?, ?) WHERE origin = 'pk';");
    st.BindText(1, table);
    st.BindText(2, database);
    if (!st.Step()) {
      return {};
    }
    index_name = st.ColumnText(0);
  }

  Statement st(*db_, "SELECT name FROM pragma_index_info(?, ?) ORDER BY seqno;");
  st.BindText(1, index_name);
  st.BindText(2, database);

  std::vector<std::string> keys;
  while (st.Step()) {
    keys.push_back(st.ColumnText(0));
  }
  return keys;
}

} // namespace flashback::catalog::sqlite
