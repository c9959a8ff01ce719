#include "internal/model/row_value.hpp"

namespace flashback::model {

// ValueKind mirrors the alternative order of Value
static_assert(std::variant_size_v<Value> == 9);
static_assert(std::is_same_v<std::variant_alternative_t<static_cast<std::size_t>(ValueKind::kBoolean), Value>, bool>);
static_assert(std::is_same_v<std::variant_alternative_t<static_cast<std::size_t>(ValueKind::kTemporal), Value>, Temporal>);

ValueKind KindOf(const Value& value) {
  return static_cast<ValueKind>(value.index());
}

std::string_view KindName(ValueKind kind) {
  switch (kind) {
    case ValueKind::kNull:
      return "null";
    case ValueKind::kBoolean:
      return "boolean";
    case ValueKind::kInteger:
      return "integer";
    case ValueKind::kUnsigned:
      return "unsigned";
    case ValueKind::kDouble:
      return "double";
    case ValueKind::kDecimal:
      return "decimal";
    case ValueKind::kText:
      return "text";
    case ValueKind::kBinary:
      return "binary";
    case ValueKind::kTemporal:
      return "temporal";
  }
  return "unknown";
}

} // namespace flashback::model
