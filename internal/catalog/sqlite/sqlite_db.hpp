#pragma once

#include <sqlite3.h>

#include <string>

namespace flashback::catalog::sqlite {

/*
  Thin RAII wrapper around sqlite3*.

  Failures surface as util::CatalogError carrying sqlite's message.
*/
class SqliteDB {
 public:
  SqliteDB(std::string path, bool read_only);
  ~SqliteDB();

  SqliteDB(const SqliteDB&)            = delete;
  SqliteDB& operator=(const SqliteDB&) = delete;

  sqlite3* Handle() const {
    return db_;
  }

  const std::string& Path() const {
    return path_;
  }

  // Execute a SQL string (pragmas, DDL in tests)
  void Exec(const std::string& sql);

  // ATTACH DATABASE `file` AS `schema`
  void Attach(const std::string& schema, const std::string& file);

 private:
  void Configure(bool read_only);

  sqlite3*    db_ = nullptr;
  std::string path_;
};

/*
  Prepared statement, finalized on scope exit.
*/
class Statement {
 public:
  Statement(SqliteDB& db, const std::string& sql);
  ~Statement();

  Statement(const Statement&)            = delete;
  Statement& operator=(const Statement&) = delete;

  void BindText(int idx, const std::string& value);

  // true while a row is available
  bool Step();

  std::string ColumnText(int col) const;
  int         ColumnInt(int col) const;

 private:
  sqlite3*      db_   = nullptr;
  sqlite3_stmt* stmt_ = nullptr;
};

} // namespace flashback::catalog::sqlite
