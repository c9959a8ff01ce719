#pragma once

#include <stdexcept>
#include <string>

namespace flashback::util {

/*
  Central error types.

  Adapters translate backend failures (sqlite, mysql, protobuf, filesystem)
  into these; the CLI maps them to exit codes.
*/

// Upstream stream or server unreachable / broken. Fatal to the current run or probe.
class ConnectionError : public std::runtime_error {
 public:
  explicit ConnectionError(const std::string& msg) : std::runtime_error(msg) {
  }
};

// Table introspection failed. Fatal only to the affected table.
class CatalogError : public std::runtime_error {
 public:
  explicit CatalogError(const std::string& msg) : std::runtime_error(msg) {
  }
};

// Invalid or missing operator input. Raised before any connection attempt.
class ArgumentError : public std::runtime_error {
 public:
  explicit ArgumentError(const std::string& msg) : std::runtime_error(msg) {
  }
};

} // namespace flashback::util
