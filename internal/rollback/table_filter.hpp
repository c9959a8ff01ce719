#pragma once

#include <set>
#include <string>
#include <string_view>

namespace flashback::rollback {

/*
  Database/table selection.

  A table passes only when BOTH its database and its name pass. An empty set
  places no restriction on that dimension; a non-empty set requires an exact
  match.
*/
class TableFilter {
 public:
  TableFilter() = default;
  TableFilter(std::set<std::string> databases, std::set<std::string> tables);

  bool Accepts(const std::string& database, const std::string& table) const;

  const std::set<std::string>& Databases() const {
    return databases_;
  }

  const std::set<std::string>& Tables() const {
    return tables_;
  }

  // "a,b,,c" -> {a, b, c}
  static std::set<std::string> ParseList(std::string_view csv);

 private:
  std::set<std::string> databases_;
  std::set<std::string> tables_;
};

} // namespace flashback::rollback
