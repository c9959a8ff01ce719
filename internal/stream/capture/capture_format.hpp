#pragma once

#include <cstdint>
#include <fstream>
#include <optional>
#include <string>
#include <string_view>

#include "capture/change_event.pb.h"
#include "internal/model/change_event.hpp"

namespace flashback::stream::capture {

/*
  Capture spool layout.

    <prefix>.000001, <prefix>.000002, ...   lexical order == log order

  Each file: 4-byte magic, then records of
    varint32 length | flashback.capture.v1.ChangeEvent (length bytes)

  A record's byte offset (position of its length prefix) is its coordinate.
*/

inline constexpr std::string_view kMagic         = "\xfe" "fbc";
inline constexpr std::uint64_t    kMinimalOffset = 4;
inline constexpr std::uint32_t    kMaxRecordSize = 64u * 1024 * 1024;

std::string FileName(const std::string& prefix, std::uint32_t index);

// index of "<prefix>.NNNNNN", nullopt for anything else
std::optional<std::uint32_t> ParseFileIndex(const std::string& prefix, const std::string& name);

model::ChangeEvent ToModel(const flashback::capture::v1::ChangeEvent& record, model::Coordinate coordinate);

flashback::capture::v1::ChangeEvent ToRecord(const model::ChangeEvent& event);

/*
  Sequential record reader over one capture file.

  A trailing record that is only partially written reads as end of data and
  is retried on the next call.
*/
class CaptureFileReader {
 public:
  enum class ReadStatus {
    kEvent,
    kEndOfData,
    kCorrupt,
  };

  // Opens `path` and validates the magic. Throws util::ConnectionError.
  CaptureFileReader(std::string path, std::string file_name);

  // Throws util::ConnectionError when offset is outside the file.
  void Seek(std::uint64_t offset);

  ReadStatus Next(model::ChangeEvent* out);

  std::uint64_t Offset() const {
    return offset_;
  }

  const std::string& FileName() const {
    return file_name_;
  }

  const std::string& Error() const {
    return error_;
  }

 private:
  std::string   path_;
  std::string   file_name_;
  std::ifstream in_;
  std::uint64_t offset_ = kMinimalOffset;
  std::string   error_;
};

} // namespace flashback::stream::capture
