#include "sqlite_db.hpp"

#include "internal/util/errors.hpp"

namespace flashback::catalog::sqlite {

static void ThrowIf(int rc, sqlite3* db, const char* what) {
  if (rc != SQLITE_OK) {
    throw util::CatalogError(std::string(what) + ": " + sqlite3_errmsg(db));
  }
}

SqliteDB::SqliteDB(std::string path, bool read_only) : path_(std::move(path)) {
  const int flags = read_only ? SQLITE_OPEN_READONLY : (SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE);
  int       rc    = sqlite3_open_v2(path_.c_str(), &db_, flags | SQLITE_OPEN_FULLMUTEX, nullptr);

  if (rc != SQLITE_OK) {
    std::string msg = db_ ? sqlite3_errmsg(db_) : "sqlite open failed";
    if (db_) sqlite3_close(db_);
    db_ = nullptr;
    throw util::CatalogError("sqlite open " + path_ + ": " + msg);
  }

  try {
    Configure(read_only);
  } catch (...) {
    sqlite3_close(db_);
    db_ = nullptr;
    throw;
  }
}

SqliteDB::~SqliteDB() {
  if (db_) sqlite3_close(db_);
}

void SqliteDB::Exec(const std::string& sql) {
  char* err = nullptr;
  int   rc  = sqlite3_exec(db_, sql.c_str(), nullptr, nullptr, &err);
  if (rc != SQLITE_OK) {
    std::string msg = err ? err : "sqlite exec failed";
    sqlite3_free(err);
    throw util::CatalogError(msg);
  }
}

void SqliteDB::Attach(const std::string& schema, const std::string& file) {
  Statement st(*this, "ATTACH DATABASE ? AS ?;");
  st.BindText(1, file);
  st.BindText(2, schema);
  st.Step();
}

void SqliteDB::Configure(bool read_only) {
  // wait for locks instead of failing immediately
  ThrowIf(sqlite3_busy_timeout(db_, 5000), db_, "busy_timeout");

  if (!read_only) {
    Exec("PRAGMA foreign_keys=ON;");
  }
}

// ------------------------------------------------------------------
// Statement
// ------------------------------------------------------------------

Statement::Statement(SqliteDB& db, const std::string& sql) : db_(db.Handle()) {
  ThrowIf(sqlite3_prepare_v2(db_, sql.c_str(), -1, &stmt_, nullptr), db_, "sqlite prepare");
}

Statement::~Statement() {
  if (stmt_) sqlite3_finalize(stmt_);
}

void Statement::BindText(int idx, const std::string& value) {
  ThrowIf(sqlite3_bind_text(stmt_, idx, value.c_str(), -1, SQLITE_TRANSIENT), db_, "sqlite bind");
}

bool Statement::Step() {
  const int rc = sqlite3_step(stmt_);
  if (rc == SQLITE_ROW) return true;
  if (rc == SQLITE_DONE) return false;
  throw util::CatalogError(std::string("sqlite step: ") + sqlite3_errmsg(db_));
}

std::string Statement::ColumnText(int col) const {
  const unsigned char* t = sqlite3_column_text(stmt_, col);
  return t ? reinterpret_cast<const char*>(t) : "";
}

int Statement::ColumnInt(int col) const {
  return sqlite3_column_int(stmt_, col);
}

} // namespace flashback::catalog::sqlite
