#include "arguments.hpp"

#include <charconv>
#include <string_view>
#include <vector>

#include "internal/rollback/table_filter.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"

namespace flashback::cli {

namespace {

std::uint64_t ParsePosition(const std::string& text) {
  std::uint64_t value = 0;
  const auto*   end   = text.data() + text.size();
  auto [ptr, ec]      = std::from_chars(text.data(), end, value);
  if (text.empty() || ec != std::errc() || ptr != end) {
    throw util::ArgumentError("invalid --position: " + text);
  }
  return value;
}

std::int64_t ParseTime(const std::string& option, const std::string& text) {
  auto millis = util::ParseLocalDateTime(text);
  if (!millis) {
    throw util::ArgumentError("invalid " + option + " (expected yyyy-MM-dd HH:mm:ss): " + text);
  }
  return *millis;
}

} // namespace

std::string Usage() {
  return "Usage:\n"
         "  flashback rollback --config <config.yaml> [--file <log file>] [--position <offset>]\n"
         "                     [--databases a,b] [--tables x,y] [--output <script.sql>]\n"
         "  flashback locate   --config <config.yaml> [--start-time \"yyyy-MM-dd HH:mm:ss\"]\n"
         "                     [--end-time \"yyyy-MM-dd HH:mm:ss\"] [--databases a,b] [--tables x,y]\n"
         "  flashback --help\n";
}

Arguments ParseArguments(int argc, const char* const* argv) {
  Arguments args;

  std::vector<std::string> tokens;
  for (int i = 1; i < argc; ++i) {
    tokens.emplace_back(argv[i]);
  }

  if (tokens.empty()) {
    throw util::ArgumentError("missing command");
  }

  const auto& command = tokens.front();
  if (command == "--help" || command == "-h" || command == "help") {
    return args;
  }
  if (command == "rollback") {
    args.command = Command::kRollback;
  } else if (command == "locate") {
    args.command = Command::kLocate;
  } else {
    throw util::ArgumentError("unknown command: " + command);
  }

  const bool rollback = args.command == Command::kRollback;

  std::optional<std::string> start_time;
  std::optional<std::string> end_time;

  for (std::size_t i = 1; i < tokens.size(); ++i) {
    const auto& option = tokens[i];
    if (option == "--help" || option == "-h") {
      args.command = Command::kHelp;
      return args;
    }
    if (i + 1 >= tokens.size()) {
      throw util::ArgumentError("missing value for " + option);
    }
    const auto& value = tokens[++i];

    if (option == "--config") {
      args.config_path = value;
    } else if (option == "--databases") {
      args.databases = rollback::TableFilter::ParseList(value);
    } else if (option == "--tables") {
      args.tables = rollback::TableFilter::ParseList(value);
    } else if (rollback && option == "--file") {
      args.file = value;
    } else if (rollback && option == "--position") {
      args.position = ParsePosition(value);
    } else if (rollback && option == "--output") {
      args.output = value;
    } else if (!rollback && option == "--start-time") {
      start_time = value;
    } else if (!rollback && option == "--end-time") {
      end_time = value;
    } else {
      throw util::ArgumentError("unknown option for " + command + ": " + option);
    }
  }

  if (args.config_path.empty()) {
    throw util::ArgumentError("--config is required");
  }

  if (rollback) {
    if (args.position && !args.file) {
      throw util::ArgumentError("--position requires --file");
    }
    if (args.file && args.file->empty()) {
      throw util::ArgumentError("--file must not be empty");
    }
    return args;
  }

  if (!start_time && !end_time) {
    throw util::ArgumentError("locate requires --start-time and/or --end-time");
  }
  if (start_time) {
    args.window.start_ms = ParseTime("--start-time", *start_time);
  }
  if (end_time) {
    args.window.end_ms = ParseTime("--end-time", *end_time);
  }
  if (args.window.start_ms && args.window.end_ms && *args.window.start_ms > *args.window.end_ms) {
    throw util::ArgumentError("--start-time is after --end-time");
  }
  return args;
}

} // namespace flashback::cli
