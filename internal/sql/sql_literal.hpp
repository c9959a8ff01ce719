#pragma once

#include <string>
#include <string_view>

#include "internal/model/row_value.hpp"

namespace flashback::sql {

/*
  SQL literal rendering for compensating statements.

    NULL             -> NULL
    text / binary    -> '...' with \ and ' backslash-escaped
    boolean          -> 1 / 0
    temporal         -> 'YYYY-MM-DD HH:MM:SS[.ffffff]'
    numeric          -> shortest round-trip textual form

  Output is deterministic: equal values always render identically.
*/
std::string FormatValue(const model::Value& value);

// Inverse of FormatValue for a known kind. Throws std::invalid_argument.
model::Value ParseLiteral(std::string_view literal, model::ValueKind kind);

// `name` with embedded back-quotes doubled.
std::string QuoteIdentifier(std::string_view name);

// `database`.`table`
std::string QualifiedTable(std::string_view database, std::string_view table);

} // namespace flashback::sql
