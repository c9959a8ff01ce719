#include "internal/sql/sql_literal.hpp"

#include <charconv>
#include <cmath>
#include <ctime>
#include <iomanip>
#include <sstream>
#include <stdexcept>
#include <system_error>

namespace flashback::sql {

using model::ValueKind;

namespace {

constexpr std::int64_t kMicrosPerSecond = 1000000;

std::string Quote(std::string_view raw) {
  std::string out;
  out.reserve(raw.size() + 2);
  out.push_back('\'');
  for (char c : raw) {
    if (c == '\\' || c == '\'') {
      out.push_back('\\');
    }
    out.push_back(c);
  }
  out.push_back('\'');
  return out;
}

std::string Unquote(std::string_view literal) {
  if (literal.size() < 2 || literal.front() != '\'' || literal.back() != '\'') {
    throw std::invalid_argument("expected quoted literal: " + std::string(literal));
  }

  std::string out;
  out.reserve(literal.size() - 2);
  for (std::size_t i = 1; i + 1 < literal.size(); ++i) {
    char c = literal[i];
    if (c == '\\') {
      if (i + 2 >= literal.size()) {
        throw std::invalid_argument("dangling escape in literal");
      }
      c = literal[++i];
    } else if (c == '\'') {
      throw std::invalid_argument("unescaped quote in literal");
    }
    out.push_back(c);
  }
  return out;
}

std::size_t SkipDigits(std::string_view text, std::size_t pos) {
  while (pos < text.size() && text[pos] >= '0' && text[pos] <= '9') {
    ++pos;
  }
  return pos;
}

// [sign] digits [. digits] [e [sign] digits]
bool IsNumericLiteral(std::string_view text) {
  std::size_t pos = 0;
  if (pos < text.size() && (text[pos] == '-' || text[pos] == '+')) {
    ++pos;
  }

  std::size_t end = SkipDigits(text, pos);
  if (end == pos) {
    return false;
  }
  pos = end;

  if (pos < text.size() && text[pos] == '.') {
    end = SkipDigits(text, ++pos);
    if (end == pos) {
      return false;
    }
    pos = end;
  }

  if (pos < text.size() && (text[pos] == 'e' || text[pos] == 'E')) {
    ++pos;
    if (pos < text.size() && (text[pos] == '-' || text[pos] == '+')) {
      ++pos;
    }
    end = SkipDigits(text, pos);
    if (end == pos) {
      return false;
    }
    pos = end;
  }
  return pos == text.size();
}

std::invalid_argument Malformed(ValueKind kind, std::string_view literal) {
  return std::invalid_argument("malformed " + std::string(model::KindName(kind)) + " literal: " + std::string(literal));
}

std::string FormatDouble(double value) {
  if (!std::isfinite(value)) {
    // no SQL literal exists for these
    return "NULL";
  }
  char buf[64];
  auto [end, ec] = std::to_chars(buf, buf + sizeof(buf), value);
  if (ec != std::errc()) {
    throw std::runtime_error("double formatting failed");
  }
  return std::string(buf, end);
}

std::string FormatTemporal(const model::Temporal& t) {
  std::int64_t seconds  = t.micros / kMicrosPerSecond;
  std::int64_t fraction = t.micros % kMicrosPerSecond;
  if (fraction < 0) {
    fraction += kMicrosPerSecond;
    --seconds;
  }

  const std::time_t tt = static_cast<std::time_t>(seconds);
  std::tm           tm{};
  gmtime_r(&tt, &tm);

  std::ostringstream out;
  out << std::put_time(&tm, "%Y-%m-%d %H:%M:%S");
  if (fraction != 0) {
    out << '.' << std::setw(6) << std::setfill('0') << fraction;
  }
  return Quote(out.str());
}

model::Temporal ParseTemporal(std::string_view literal) {
  const std::string text = Unquote(literal);

  std::tm            tm{};
  std::istringstream in(text);
  in >> std::get_time(&tm, "%Y-%m-%d %H:%M:%S");
  if (in.fail()) {
    throw Malformed(ValueKind::kTemporal, literal);
  }

  std::int64_t fraction = 0;
  if (in.peek() == '.') {
    in.get();
    int digits = 0;
    for (int c = in.get(); c != std::char_traits<char>::eof(); c = in.get(), ++digits) {
      if (c < '0' || c > '9' || digits == 6) {
        throw Malformed(ValueKind::kTemporal, literal);
      }
      fraction = fraction * 10 + (c - '0');
    }
    if (digits == 0) {
      throw Malformed(ValueKind::kTemporal, literal);
    }
    for (; digits < 6; ++digits) {
      fraction *= 10;
    }
  } else if (in.peek() != std::char_traits<char>::eof()) {
    throw Malformed(ValueKind::kTemporal, literal);
  }

  const std::int64_t seconds = static_cast<std::int64_t>(timegm(&tm));
  return model::Temporal{seconds * kMicrosPerSecond + fraction};
}

template <typename T>
T ParseNumber(std::string_view literal, ValueKind kind) {
  T value{};
  auto [ptr, ec] = std::from_chars(literal.data(), literal.data() + literal.size(), value);
  if (ec != std::errc() || ptr != literal.data() + literal.size()) {
    throw Malformed(kind, literal);
  }
  return value;
}

} // namespace

std::string FormatValue(const model::Value& value) {
  switch (model::KindOf(value)) {
    case ValueKind::kNull:
      return "NULL";
    case ValueKind::kBoolean:
      return std::get<bool>(value) ? "1" : "0";
    case ValueKind::kInteger:
      return std::to_string(std::get<std::int64_t>(value));
    case ValueKind::kUnsigned:
      return std::to_string(std::get<std::uint64_t>(value));
    case ValueKind::kDouble:
      return FormatDouble(std::get<double>(value));
    case ValueKind::kDecimal: {
      const auto& digits = std::get<model::Decimal>(value).digits;
      return IsNumericLiteral(digits) ? digits : Quote(digits);
    }
    case ValueKind::kText:
      return Quote(std::get<model::Text>(value).value);
    case ValueKind::kBinary:
      return Quote(std::get<model::Binary>(value).bytes);
    case ValueKind::kTemporal:
      return FormatTemporal(std::get<model::Temporal>(value));
  }
  throw std::logic_error("unhandled value kind");
}

model::Value ParseLiteral(std::string_view literal, ValueKind kind) {
  if (literal == "NULL") {
    return model::Null{};
  }

  switch (kind) {
    case ValueKind::kNull:
      throw std::invalid_argument("expected NULL, got " + std::string(literal));
    case ValueKind::kBoolean:
      if (literal == "1") return true;
      if (literal == "0") return false;
      throw Malformed(kind, literal);
    case ValueKind::kInteger:
      return ParseNumber<std::int64_t>(literal, kind);
    case ValueKind::kUnsigned:
      return ParseNumber<std::uint64_t>(literal, kind);
    case ValueKind::kDouble:
      return ParseNumber<double>(literal, kind);
    case ValueKind::kDecimal:
      if (!literal.empty() && literal.front() == '\'') {
        return model::Decimal{Unquote(literal)};
      }
      if (!IsNumericLiteral(literal)) {
        throw Malformed(kind, literal);
      }
      return model::Decimal{std::string(literal)};
    case ValueKind::kText:
      return model::Text{Unquote(literal)};
    case ValueKind::kBinary:
      return model::Binary{Unquote(literal)};
    case ValueKind::kTemporal:
      return ParseTemporal(literal);
  }
  throw std::logic_error("unhandled value kind");
}

std::string QuoteIdentifier(std::string_view name) {
  std::string out;
  out.reserve(name.size() + 2);
  out.push_back('`');
  for (char c : name) {
    if (c == '`') {
      out.push_back('`');
    }
    out.push_back(c);
  }
  out.push_back('`');
  return out;
}

std::string QualifiedTable(std::string_view database, std::string_view table) {
  return QuoteIdentifier(database) + "." + QuoteIdentifier(table);
}

} // namespace flashback::sql
