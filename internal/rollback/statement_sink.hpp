#pragma once

#include <cstdint>
#include <fstream>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "internal/model/statement.hpp"

namespace flashback::rollback {

/*
  Destination of compensating statements, one call per statement, in log
  order. Implementations must not buffer across calls.
*/
class StatementSink {
 public:
  virtual ~StatementSink() = default;

  // Called once the change stream is connected, before any other call.
  virtual void Begin() {
  }

  virtual void Accept(const model::CompensatingStatement& statement) = 0;

  // Free-form annotation (resolved start coordinate, ...).
  virtual void Comment(const std::string& text) {
    (void)text;
  }
};

struct ScriptHeader {
  std::int64_t               generated_at_ms = 0;
  std::optional<std::string> source_file;
  std::string                mode = "live follow";
};

/*
  Rollback script file: header comment block, then one ';'-terminated
  statement per line. Flushed after every write.

  The file is left untouched until Begin() (or the first write), so a run
  that never connects keeps any earlier script at `path`.
*/
class ScriptFileSink : public StatementSink {
 public:
  ScriptFileSink(std::string path, ScriptHeader header);

  // Truncates the file and writes the header. Throws std::runtime_error.
  void Begin() override;

  void Accept(const model::CompensatingStatement& statement) override;

  void Comment(const std::string& text) override;

  const std::string& Path() const {
    return path_;
  }

 private:
  void Write(const std::string& line);

  std::string   path_;
  ScriptHeader  header_;
  std::ofstream out_;
};

// Console echo through the logger.
class LogSink : public StatementSink {
 public:
  void Accept(const model::CompensatingStatement& statement) override;

  void Comment(const std::string& text) override;
};

class TeeSink : public StatementSink {
 public:
  explicit TeeSink(std::vector<std::shared_ptr<StatementSink>> sinks);

  void Begin() override;

  void Accept(const model::CompensatingStatement& statement) override;

  void Comment(const std::string& text) override;

 private:
  std::vector<std::shared_ptr<StatementSink>> sinks_;
};

} // namespace flashback::rollback
