#pragma once

#include <cstdint>
#include <string>

namespace flashback::model {

/*
  (file name, byte offset) addressing one event in the ordered change log.
*/
struct Coordinate {
  std::string   file;
  std::uint64_t offset = 0;

  bool operator==(const Coordinate&) const = default;
};

inline std::string ToString(const Coordinate& c) {
  return c.file + ":" + std::to_string(c.offset);
}

} // namespace flashback::model
