#pragma once

#include <memory>
#include <string>
#include <unordered_map>

#include "internal/catalog/catalog_source.hpp"
#include "internal/model/table_metadata.hpp"

namespace flashback::catalog {

/*
  Per-run cache of table layouts keyed by "database.table".

  Entries are created on first resolution and never invalidated: a schema
  change in the middle of a run leaves the cached layout stale.

  Owned by the single consumer of a run; not synchronized.
*/
class TableCatalog {
 public:
  explicit TableCatalog(std::shared_ptr<CatalogSource> source);

  // Idempotent per run. Throws util::CatalogError when introspection fails.
  // An empty primary key is a valid result.
  const model::TableMetadata& Resolve(const std::string& database, const std::string& table);

  // Cached entry or nullptr; never queries the source.
  const model::TableMetadata* Find(const std::string& database, const std::string& table) const;

  std::size_t Size() const {
    return cache_.size();
  }

 private:
  model::TableMetadata Load(const std::string& database, const std::string& table);

  std::shared_ptr<CatalogSource>                        source_;
  std::unordered_map<std::string, model::TableMetadata> cache_;
};

} // namespace flashback::catalog
