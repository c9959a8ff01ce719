#include "mysql_catalog_source.hpp"

#include <mysql.h>

#include <strings.h>

#include <algorithm>
#include <cstdio>
#include <cstring>
#include <memory>

#include "internal/catalog/mysql/remote_sql.hpp"
#include "internal/sql/sql_literal.hpp"
#include "internal/util/errors.hpp"

namespace flashback::catalog::mysql {

namespace {

struct MysqlCloser {
  void operator()(MYSQL* conn) const {
    mysql_close(conn);
  }
};

struct ResultFree {
  void operator()(MYSQL_RES* res) const {
    mysql_free_result(res);
  }
};

using ConnectionPtr = std::unique_ptr<MYSQL, MysqlCloser>;
using ResultPtr     = std::unique_ptr<MYSQL_RES, ResultFree>;

ConnectionPtr Connect(const MysqlEndpoint& endpoint) {
  MYSQL* raw = mysql_init(nullptr);
  if (!raw) {
    throw util::CatalogError("mysql_init() failed");
  }
  ConnectionPtr conn(raw);

  mysql_options(conn.get(), MYSQL_SET_CHARSET_NAME, "utf8mb4");
  unsigned int timeout = static_cast<unsigned int>(std::max<std::int64_t>(1, endpoint.connect_timeout.count() / 1000));
  mysql_options(conn.get(), MYSQL_OPT_CONNECT_TIMEOUT, &timeout);

  const char* pass = endpoint.password.empty() ? nullptr : endpoint.password.c_str();
  if (!mysql_real_connect(conn.get(), endpoint.host.c_str(), endpoint.user.c_str(), pass, nullptr, endpoint.port, nullptr, 0)) {
    throw util::CatalogError(std::string("catalog connect failed: ") + mysql_error(conn.get()));
  }
  return conn;
}

std::string Escape(MYSQL* conn, const std::string& value) {
  std::string out(value.size() * 2 + 1, '\0');
  const auto  n = mysql_real_escape_string(conn, out.data(), value.c_str(), static_cast<unsigned long>(value.size()));
  out.resize(n);
  return out;
}

std::string Format(const char* templ, const std::string& a, const std::string& b = {}) {
  const int   n = std::snprintf(nullptr, 0, templ, a.c_str(), b.c_str());
  std::string out(static_cast<std::size_t>(n) + 1, '\0');
  std::snprintf(out.data(), out.size(), templ, a.c_str(), b.c_str());
  out.resize(static_cast<std::size_t>(n));
  return out;
}

ResultPtr Query(MYSQL* conn, const std::string& query) {
  if (mysql_real_query(conn, query.c_str(), static_cast<unsigned long>(query.size()))) {
    throw util::CatalogError(std::string("catalog query failed: ") + mysql_error(conn));
  }
  MYSQL_RES* res = mysql_store_result(conn);
  if (!res) {
    throw util::CatalogError(std::string("catalog query returned no result: ") + mysql_error(conn));
  }
  return ResultPtr(res);
}

// index of a named column in the result, -1 when absent
int FieldIndex(MYSQL_RES* res, const char* name) {
  const unsigned int count  = mysql_num_fields(res);
  MYSQL_FIELD*       fields = mysql_fetch_fields(res);
  for (unsigned int i = 0; i < count; ++i) {
    if (strcasecmp(fields[i].name, name) == 0) {
      return static_cast<int>(i);
    }
  }
  return -1;
}

std::vector<std::string> ColumnValues(MYSQL_RES* res, const char* field) {
  const int index = FieldIndex(res, field);
  if (index < 0) {
    throw util::CatalogError(std::string("catalog result lacks column ") + field);
  }

  std::vector<std::string> values;
  while (MYSQL_ROW row = mysql_fetch_row(res)) {
    if (row[index]) {
      values.emplace_back(row[index]);
    }
  }
  return values;
}

} // namespace

MysqlCatalogSource::MysqlCatalogSource(MysqlEndpoint endpoint) : endpoint_(std::move(endpoint)) {
}

std::vector<ColumnInfo> MysqlCatalogSource::ListColumns(const std::string& database, const std::string& table) {
  auto conn = Connect(endpoint_);
  auto res  = Query(conn.get(), Format(remote_sql::SHOW_COLUMNS, sql::QualifiedTable(database, table)));

  const int field = FieldIndex(res.get(), "Field");
  const int key   = FieldIndex(res.get(), "Key");
  if (field < 0 || key < 0) {
    throw util::CatalogError("unexpected SHOW COLUMNS layout");
  }

  std::vector<ColumnInfo> columns;
  while (MYSQL_ROW row = mysql_fetch_row(res.get())) {
    ColumnInfo info;
    info.name    = row[field] ? row[field] : "";
    info.primary = row[key] && strcasecmp(row[key], "PRI") == 0;
    columns.push_back(std::move(info));
  }
  return columns;
}

std::vector<std::string> MysqlCatalogSource::PrimaryKeyFromConstraints(const std::string& database, const std::string& table) {
  auto conn = Connect(endpoint_);
  auto res  = Query(conn.get(),
                    Format(remote_sql::PRIMARY_KEY_CONSTRAINT_COLUMNS, Escape(conn.get(), database), Escape(conn.get(), table)));
  return ColumnValues(res.get(), "COLUMN_NAME");
}

std::vector<std::string> MysqlCatalogSource::PrimaryKeyFromIndex(const std::string& database, const std::string& table) {
  auto conn = Connect(endpoint_);
  auto res  = Query(conn.get(), Format(remote_sql::SHOW_PRIMARY_INDEX, sql::QualifiedTable(database, table)));
  return ColumnValues(res.get(), "Column_name");
}

} // namespace flashback::catalog::mysql
