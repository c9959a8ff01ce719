#pragma once

#include <chrono>
#include <cstdint>
#include <string>
#include <vector>

#include "internal/catalog/catalog_source.hpp"

namespace flashback::catalog::mysql {

struct MysqlEndpoint {
  std::string               host = "127.0.0.1";
  std::uint32_t             port = 3306;
  std::string               user;
  std::string               password;
  std::chrono::milliseconds connect_timeout{5000};
};

/*
  Catalog backed by the source MySQL server (libmysqlclient).

  Each call opens its own short-lived connection; resolution happens once
  per table per run so there is nothing to pool.
*/
class MysqlCatalogSource : public CatalogSource {
 public:
  explicit MysqlCatalogSource(MysqlEndpoint endpoint);

  std::vector<ColumnInfo> ListColumns(const std::string& database, const std::string& table) override;

  std::vector<std::string> PrimaryKeyFromConstraints(const std::string& database, const std::string& table) override;

  std::vector<std::string> PrimaryKeyFromIndex(const std::string& database, const std::string& table) override;

 private:
  MysqlEndpoint endpoint_;
};

} // namespace flashback::catalog::mysql
