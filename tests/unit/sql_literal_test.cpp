#include "internal/sql/sql_literal.hpp"

#include <cassert>
#include <cmath>
#include <iostream>
#include <limits>
#include <stdexcept>
#include <string>
#include <vector>

namespace {

using flashback::model::Binary;
using flashback::model::Decimal;
using flashback::model::KindOf;
using flashback::model::Null;
using flashback::model::Temporal;
using flashback::model::Text;
using flashback::model::Value;
using flashback::model::ValueKind;
using flashback::sql::FormatValue;
using flashback::sql::ParseLiteral;

// 2024-01-02 03:04:05.000123 UTC
constexpr std::int64_t kSampleMicros = 1704164645000123LL;

void TestScalarFormatting() {
  assert(FormatValue(Value{Null{}}) == "NULL");
  assert(FormatValue(Value{true}) == "1");
  assert(FormatValue(Value{false}) == "0");
  assert(FormatValue(Value{std::int64_t{-42}}) == "-42");
  assert(FormatValue(Value{std::numeric_limits<std::uint64_t>::max()}) == "18446744073709551615");
  assert(FormatValue(Value{0.1}) == "0.1");
  assert(FormatValue(Value{Decimal{"12.50"}}) == "12.50");
}

void TestNonFiniteDoubleBecomesNull() {
  assert(FormatValue(Value{std::numeric_limits<double>::quiet_NaN()}) == "NULL");
  assert(FormatValue(Value{std::numeric_limits<double>::infinity()}) == "NULL");
}

void TestTextEscaping() {
  assert(FormatValue(Value{Text{"O'Brien"}}) == "'O\\'Brien'");
  assert(FormatValue(Value{Text{"C:\\tmp"}}) == "'C:\\\\tmp'");
  assert(FormatValue(Value{Binary{std::string("a\0b", 3)}}) == std::string("'a\0b'", 5));
}

void TestTemporalFormatting() {
  assert(FormatValue(Value{Temporal{kSampleMicros}}) == "'2024-01-02 03:04:05.000123'");
  assert(FormatValue(Value{Temporal{1704164645LL * 1000000}}) == "'2024-01-02 03:04:05'");
  assert(FormatValue(Value{Temporal{-1}}) == "'1969-12-31 23:59:59.999999'");
}

void TestRoundTripEveryKind() {
  const std::vector<Value> samples = {
      Value{Null{}},
      Value{true},
      Value{false},
      Value{std::int64_t{-9000000000LL}},
      Value{std::uint64_t{18000000000000000000ULL}},
      Value{3.141592653589793},
      Value{-2.5e-300},
      Value{Decimal{"-0012.3400"}},
      Value{Text{"it's a \\ test\nwith newline"}},
      Value{Text{""}},
      Value{Binary{std::string("\x00\x01'\\\xff", 5)}},
      Value{Temporal{kSampleMicros}},
      Value{Temporal{-1}},
  };

  for (const auto& value : samples) {
    const auto literal = FormatValue(value);
    const auto parsed  = ParseLiteral(literal, KindOf(value));
    assert(parsed == value);
  }
}

void TestNullParsesForAnyKind() {
  assert(ParseLiteral("NULL", ValueKind::kText) == Value{Null{}});
  assert(ParseLiteral("NULL", ValueKind::kInteger) == Value{Null{}});
}

void TestMalformedLiteralsAreRejected() {
  const std::vector<std::pair<std::string, ValueKind>> bad = {
      {"abc", ValueKind::kInteger}, {"2", ValueKind::kBoolean},   {"'unterminated", ValueKind::kText},
      {"x", ValueKind::kNull},      {"'2024-13'", ValueKind::kTemporal}, {"'2024-01-02 03:04:05.'", ValueKind::kTemporal},
      {"1.2.3", ValueKind::kDecimal}, {"e5", ValueKind::kDecimal},     {"1e", ValueKind::kDecimal},
      {"-.5", ValueKind::kDecimal},
  };
  for (const auto& [literal, kind] : bad) {
    bool threw = false;
    try {
      (void)ParseLiteral(literal, kind);
    } catch (const std::invalid_argument&) {
      threw = true;
    }
    assert(threw);
  }
}

void TestDecimalShapeDecidesQuoting() {
  assert(FormatValue(Value{Decimal{"1.5e-3"}}) == "1.5e-3");
  assert(FormatValue(Value{Decimal{"+7"}}) == "+7");
  assert(FormatValue(Value{Decimal{"1.2.3"}}) == "'1.2.3'");
  assert(FormatValue(Value{Decimal{"e5"}}) == "'e5'");
  assert(FormatValue(Value{Decimal{"12."}}) == "'12.'");
  assert(ParseLiteral("'1.2.3'", ValueKind::kDecimal) == Value{Decimal{"1.2.3"}});
}

void TestMalformedLiteralNamesItsKind() {
  std::string message;
  try {
    (void)ParseLiteral("1.2.3", ValueKind::kDecimal);
  } catch (const std::invalid_argument& e) {
    message = e.what();
  }
  assert(message == "malformed decimal literal: 1.2.3");
}

void TestIdentifierQuoting() {
  assert(flashback::sql::QuoteIdentifier("orders") == "`orders`");
  assert(flashback::sql::QuoteIdentifier("we`ird") == "`we``ird`");
  assert(flashback::sql::QualifiedTable("shop", "orders") == "`shop`.`orders`");
}

} // namespace

int main() {
  TestScalarFormatting();
  TestNonFiniteDoubleBecomesNull();
  TestTextEscaping();
  TestTemporalFormatting();
  TestRoundTripEveryKind();
  TestNullParsesForAnyKind();
  TestMalformedLiteralsAreRejected();
  TestDecimalShapeDecidesQuoting();
  TestMalformedLiteralNamesItsKind();
  TestIdentifierQuoting();

  std::cout << "flashback_unit_sql_literal: pass\n";
  return 0;
}
