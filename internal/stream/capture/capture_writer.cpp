#include "capture_writer.hpp"

#include <algorithm>
#include <stdexcept>

#include <google/protobuf/util/delimited_message_util.h>

#include "internal/stream/capture/capture_format.hpp"

namespace flashback::stream::capture {

CaptureWriter::CaptureWriter(std::filesystem::path directory, std::string prefix)
    : directory_(std::move(directory)), prefix_(std::move(prefix)) {
  std::filesystem::create_directories(directory_);

  std::uint32_t newest = 0;
  for (const auto& entry : std::filesystem::directory_iterator(directory_)) {
    if (auto index = ParseFileIndex(prefix_, entry.path().filename().string())) {
      newest = std::max(newest, *index);
    }
  }
  OpenFile(newest + 1);
}

model::Coordinate CaptureWriter::Append(const model::ChangeEvent& event) {
  model::Coordinate coordinate{file_name_, offset_};

  if (!google::protobuf::util::SerializeDelimitedToOstream(ToRecord(event), &out_)) {
    throw std::runtime_error("capture write failed: " + file_name_);
  }
  out_.flush();
  if (!out_) {
    throw std::runtime_error("capture write failed: " + file_name_);
  }

  offset_ = static_cast<std::uint64_t>(out_.tellp());
  return coordinate;
}

void CaptureWriter::Rotate() {
  out_.close();
  OpenFile(index_ + 1);
}

void CaptureWriter::OpenFile(std::uint32_t index) {
  index_     = index;
  file_name_ = FileName(prefix_, index_);

  out_.open(directory_ / file_name_, std::ios::binary | std::ios::trunc);
  if (!out_) {
    throw std::runtime_error("cannot create capture file " + (directory_ / file_name_).string());
  }
  out_.write(kMagic.data(), static_cast<std::streamsize>(kMagic.size()));
  out_.flush();
  offset_ = kMinimalOffset;
}

} // namespace flashback::stream::capture
