#pragma once

#include <string>

#include "internal/model/position.hpp"
#include "internal/rollback/table_filter.hpp"

namespace flashback::locate {

// What the operator invoked the lookup with; echoed into the suggested command.
struct ReportContext {
  std::string           config_path;
  rollback::TableFilter filter;
};

// flashback rollback --config <cfg> --file <f> --position <n> [--databases ..] [--tables ..]
std::string RollbackCommand(const model::PositionResult& position, const ReportContext& context);

// Console report for a lookup: file, offset and event time per resolved side,
// each with its rollback command; a single line when nothing was found.
std::string FormatReport(const model::LocateResult& result, const ReportContext& context);

} // namespace flashback::locate
