#include "table_filter.hpp"

namespace flashback::rollback {

TableFilter::TableFilter(std::set<std::string> databases, std::set<std::string> tables)
    : databases_(std::move(databases)), tables_(std::move(tables)) {
}

bool TableFilter::Accepts(const std::string& database, const std::string& table) const {
  const bool database_ok = databases_.empty() || databases_.count(database) > 0;
  const bool table_ok    = tables_.empty() || tables_.count(table) > 0;
  return database_ok && table_ok;
}

std::set<std::string> TableFilter::ParseList(std::string_view csv) {
  std::set<std::string> items;
  std::size_t           begin = 0;
  while (begin <= csv.size()) {
    auto end = csv.find(',', begin);
    if (end == std::string_view::npos) {
      end = csv.size();
    }
    auto item = csv.substr(begin, end - begin);
    while (!item.empty() && item.front() == ' ') item.remove_prefix(1);
    while (!item.empty() && item.back() == ' ') item.remove_suffix(1);
    if (!item.empty()) {
      items.emplace(item);
    }
    begin = end + 1;
  }
  return items;
}

} // namespace flashback::rollback
