#include "position_report.hpp"

#include <set>
#include <sstream>

#include "internal/util/time.hpp"

namespace flashback::locate {

namespace {

std::string JoinList(const std::set<std::string>& items) {
  std::string out;
  for (const auto& item : items) {
    if (!out.empty()) {
      out += ',';
    }
    out += item;
  }
  return out;
}

void AppendSide(std::ostringstream& out, const char* title, const model::PositionResult& position, const ReportContext& context) {
  out << "\n" << title << ":\n";
  out << "  Log file:   " << position.coordinate.file << "\n";
  out << "  Offset:     " << position.coordinate.offset << "\n";
  out << "  Event time: " << util::FormatLocalDateTime(position.timestamp_ms) << "\n";
  out << "  Rollback:   " << RollbackCommand(position, context) << "\n";
}

} // namespace

std::string RollbackCommand(const model::PositionResult& position, const ReportContext& context) {
  std::ostringstream out;
  out << "flashback rollback --config " << (context.config_path.empty() ? "<config.yaml>" : context.config_path) << " --file "
      << position.coordinate.file << " --position " << position.coordinate.offset;
  if (!context.filter.Databases().empty()) {
    out << " --databases " << JoinList(context.filter.Databases());
  }
  if (!context.filter.Tables().empty()) {
    out << " --tables " << JoinList(context.filter.Tables());
  }
  return out.str();
}

std::string FormatReport(const model::LocateResult& result, const ReportContext& context) {
  if (!result.Found()) {
    return "No log position matches the requested time range\n";
  }

  std::ostringstream out;
  if (result.range_start) {
    AppendSide(out, "Range start", *result.range_start, context);
  }
  if (result.range_end) {
    AppendSide(out, "Range end", *result.range_end, context);
  }
  return out.str();
}

} // namespace flashback::locate
