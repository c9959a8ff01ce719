#include "internal/catalog/table_catalog.hpp"

#include <stdexcept>

#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

namespace flashback::catalog {

using flashback::observability::IntField;
using flashback::observability::StringField;

namespace {

std::string JoinColumns(const std::vector<std::string>& columns) {
  std::string out;
  for (const auto& c : columns) {
    if (!out.empty()) out += ",";
    out += c;
  }
  return out;
}

} // namespace

TableCatalog::TableCatalog(std::shared_ptr<CatalogSource> source) : source_(std::move(source)) {
  if (!source_) {
    throw std::invalid_argument("TableCatalog requires a catalog source");
  }
}

const model::TableMetadata& TableCatalog::Resolve(const std::string& database, const std::string& table) {
  const auto key = model::QualifiedName(database, table);

  auto it = cache_.find(key);
  if (it != cache_.end()) {
    return it->second;
  }

  auto metadata = Load(database, table);

  FLASHBACK_LOG_INFO("Loaded table metadata", {StringField("table", key), IntField("columns", static_cast<int64_t>(metadata.columns.size())),
                                               StringField("primary_key", JoinColumns(metadata.primary_keys))});

  return cache_.emplace(key, std::move(metadata)).first->second;
}

const model::TableMetadata* TableCatalog::Find(const std::string& database, const std::string& table) const {
  auto it = cache_.find(model::QualifiedName(database, table));
  return it == cache_.end() ? nullptr : &it->second;
}

// ------------------------------------------------------------
// Introspection: column flags -> key constraints -> primary index
// ------------------------------------------------------------

model::TableMetadata TableCatalog::Load(const std::string& database, const std::string& table) {
  model::TableMetadata metadata;

  for (auto& column : source_->ListColumns(database, table)) {
    if (column.primary) {
      metadata.primary_keys.push_back(column.name);
    }
    metadata.columns.push_back(std::move(column.name));
  }

  if (metadata.columns.empty()) {
    throw util::CatalogError("table has no columns or does not exist: " + model::QualifiedName(database, table));
  }

  if (!metadata.primary_keys.empty()) {
    return metadata;
  }

  try {
    metadata.primary_keys = source_->PrimaryKeyFromConstraints(database, table);
  } catch (const util::CatalogError& e) {
    FLASHBACK_LOG_WARN("Key constraint lookup failed, listing primary index",
                       {StringField("table", model::QualifiedName(database, table)), StringField("error", e.what())});
  }

  if (metadata.primary_keys.empty()) {
    metadata.primary_keys = source_->PrimaryKeyFromIndex(database, table);
  }

  return metadata;
}

} // namespace flashback::catalog
