#pragma once

#include <cstdint>
#include <filesystem>
#include <fstream>
#include <string>

#include "internal/model/change_event.hpp"
#include "internal/model/coordinate.hpp"

namespace flashback::stream::capture {

/*
  Appends decoded change events to a capture spool.

  Starts a new file after the newest existing one; Rotate() closes the
  current file and starts the next. Each Append is flushed before it
  returns, so readers never see a file rotate with records still buffered.
*/
class CaptureWriter {
 public:
  CaptureWriter(std::filesystem::path directory, std::string prefix);

  CaptureWriter(const CaptureWriter&)            = delete;
  CaptureWriter& operator=(const CaptureWriter&) = delete;

  // Coordinate assigned to the event (its coordinate field is ignored).
  model::Coordinate Append(const model::ChangeEvent& event);

  void Rotate();

  const std::string& CurrentFile() const {
    return file_name_;
  }

 private:
  void OpenFile(std::uint32_t index);

  std::filesystem::path directory_;
  std::string           prefix_;
  std::uint32_t         index_ = 0;
  std::string           file_name_;
  std::ofstream         out_;
  std::uint64_t         offset_ = 0;
};

} // namespace flashback::stream::capture
