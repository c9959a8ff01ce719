#pragma once

#include <cstdint>
#include <string>
#include <string_view>
#include <type_traits>
#include <variant>
#include <vector>

namespace flashback::model {

struct Null {
  bool operator==(const Null&) const = default;
};

// exact numeric, kept as the server printed it
struct Decimal {
  std::string digits;
  bool operator==(const Decimal&) const = default;
};

struct Text {
  std::string value;
  bool operator==(const Text&) const = default;
};

struct Binary {
  std::string bytes;
  bool operator==(const Binary&) const = default;
};

// zone-less wall clock, microseconds since 1970-01-01 00:00:00
struct Temporal {
  std::int64_t micros = 0;
  bool operator==(const Temporal&) const = default;
};

using Value = std::variant<Null, bool, std::int64_t, std::uint64_t, double, Decimal, Text, Binary, Temporal>;

// Full ordered set of column values captured by one change event.
using RowImage = std::vector<Value>;

enum class ValueKind : std::uint8_t {
  kNull,
  kBoolean,
  kInteger,
  kUnsigned,
  kDouble,
  kDecimal,
  kText,
  kBinary,
  kTemporal,
};

ValueKind KindOf(const Value& value);

std::string_view KindName(ValueKind kind);

} // namespace flashback::model
