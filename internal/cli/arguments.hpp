#pragma once

#include <cstdint>
#include <optional>
#include <set>
#include <string>

#include "internal/model/position.hpp"

namespace flashback::cli {

enum class Command {
  kHelp,
  kRollback,
  kLocate,
};

struct Arguments {
  Command     command = Command::kHelp;
  std::string config_path;

  // rollback
  std::optional<std::string>   file;
  std::optional<std::uint64_t> position;
  std::optional<std::string>   output;

  // locate
  model::TimeWindow window;

  std::set<std::string> databases;
  std::set<std::string> tables;
};

// argv[0] is the program name. Throws util::ArgumentError.
Arguments ParseArguments(int argc, const char* const* argv);

std::string Usage();

} // namespace flashback::cli
