#include "capture_event_source.hpp"

#include <algorithm>

#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

namespace flashback::stream::capture {

using flashback::observability::StringField;

namespace {

std::vector<std::pair<std::uint32_t, std::filesystem::path>> ScanSpool(const CaptureSourceOptions& options) {
  std::error_code ec;
  if (!std::filesystem::is_directory(options.directory, ec)) {
    throw util::ConnectionError("capture directory unavailable: " + options.directory.string());
  }

  std::vector<std::pair<std::uint32_t, std::filesystem::path>> files;
  for (const auto& entry : std::filesystem::directory_iterator(options.directory, ec)) {
    if (auto index = ParseFileIndex(options.file_prefix, entry.path().filename().string())) {
      files.emplace_back(*index, entry.path());
    }
  }
  if (ec) {
    throw util::ConnectionError("cannot list capture directory: " + ec.message());
  }

  std::sort(files.begin(), files.end());
  return files;
}

} // namespace

// ------------------------------------------------------------
// CaptureEventSource
// ------------------------------------------------------------

CaptureEventSource::CaptureEventSource(CaptureSourceOptions options) : options_(std::move(options)) {
}

std::vector<LogFile> CaptureEventSource::ListLogFiles() {
  std::vector<LogFile> files;
  for (const auto& [index, path] : ScanSpool(options_)) {
    std::error_code ec;
    const auto      size = std::filesystem::file_size(path, ec);
    if (ec) {
      throw util::ConnectionError("cannot stat " + path.string() + ": " + ec.message());
    }
    files.push_back(LogFile{path.filename().string(), size});
  }
  return files;
}

std::unique_ptr<EventStream> CaptureEventSource::Open(const StreamRequest& request) {
  return std::make_unique<CaptureEventStream>(options_, request);
}

// ------------------------------------------------------------
// CaptureEventStream
// ------------------------------------------------------------

CaptureEventStream::CaptureEventStream(CaptureSourceOptions options, StreamRequest request)
    : options_(std::move(options)), request_(std::move(request)) {
}

void CaptureEventStream::Connect(std::chrono::milliseconds timeout) {
  const auto deadline = std::chrono::steady_clock::now() + timeout;

  std::optional<std::uint32_t> index;
  if (request_.file) {
    index = ParseFileIndex(options_.file_prefix, *request_.file);
    if (!index) {
      throw util::ConnectionError("not a log file of this source: " + *request_.file);
    }
  }

  // the spool writer may not have produced the file yet
  while (true) {
    if (index ? FileExists(*index) : NewestIndex().has_value()) {
      break;
    }
    if (std::chrono::steady_clock::now() >= deadline) {
      throw util::ConnectionError("timed out waiting for " + (request_.file ? *request_.file : std::string("any log file")) + " in " +
                                  options_.directory.string());
    }
    if (!WaitFor(std::min(options_.poll_interval, timeout))) {
      throw util::ConnectionError("disconnected while connecting");
    }
  }

  if (index) {
    const auto offset = request_.offset.value_or(0);
    OpenAt(*index, offset == 0 ? kMinimalOffset : offset);
  } else {
    const auto newest = *NewestIndex();
    std::error_code ec;
    const auto size = std::filesystem::file_size(options_.directory / FileName(options_.file_prefix, newest), ec);
    if (ec) {
      throw util::ConnectionError("cannot stat newest log file: " + ec.message());
    }
    OpenAt(newest, std::max<std::uint64_t>(size, kMinimalOffset));
  }

  std::lock_guard lock(mutex_);
  if (stop_requested_) {
    throw util::ConnectionError("disconnected while connecting");
  }
  connected_ = true;
}

void CaptureEventStream::Run(const EventHandler& handler) {
  if (!IsConnected()) {
    throw util::ConnectionError("stream is not connected");
  }

  model::ChangeEvent event;
  bool               saw_next_file = false;
  while (IsConnected()) {
    switch (reader_->Next(&event)) {
      case CaptureFileReader::ReadStatus::kEvent: {
        saw_next_file = false;
        {
          std::lock_guard lock(mutex_);
          position_ = model::Coordinate{reader_->FileName(), reader_->Offset()};
        }
        if (!handler(std::move(event))) {
          return;
        }
        break;
      }

      case CaptureFileReader::ReadStatus::kCorrupt:
        throw util::ConnectionError("corrupt capture file " + reader_->FileName() + ": " + reader_->Error());

      case CaptureFileReader::ReadStatus::kEndOfData: {
        if (request_.stop_at_file_end) {
          return;
        }

        if (saw_next_file) {
          FLASHBACK_LOG_DEBUG("Following log rotation", {StringField("from", reader_->FileName()),
                                                         StringField("to", FileName(options_.file_prefix, index_ + 1))});
          OpenAt(index_ + 1, kMinimalOffset);
          saw_next_file = false;
          break;
        }

        // the writer finishes a file before creating the next one; read the
        // current file once more after seeing the successor
        if (FileExists(index_ + 1)) {
          saw_next_file = true;
          break;
        }

        if (!WaitFor(options_.poll_interval)) {
          return;
        }
        break;
      }
    }
  }
}

void CaptureEventStream::Disconnect() {
  {
    std::lock_guard lock(mutex_);
    stop_requested_ = true;
    connected_      = false;
  }
  wake_.notify_all();
}

bool CaptureEventStream::IsConnected() const {
  std::lock_guard lock(mutex_);
  return connected_;
}

model::Coordinate CaptureEventStream::Position() const {
  std::lock_guard lock(mutex_);
  return position_;
}

std::optional<std::uint32_t> CaptureEventStream::NewestIndex() const {
  const auto files = ScanSpool(options_);
  if (files.empty()) {
    return std::nullopt;
  }
  return files.back().first;
}

bool CaptureEventStream::FileExists(std::uint32_t index) const {
  std::error_code ec;
  return std::filesystem::is_regular_file(options_.directory / FileName(options_.file_prefix, index), ec);
}

void CaptureEventStream::OpenAt(std::uint32_t index, std::uint64_t offset) {
  const auto name = FileName(options_.file_prefix, index);
  auto reader = std::make_unique<CaptureFileReader>((options_.directory / name).string(), name);
  reader->Seek(offset);

  reader_ = std::move(reader);
  index_  = index;

  std::lock_guard lock(mutex_);
  position_ = model::Coordinate{name, offset};
}

bool CaptureEventStream::WaitFor(std::chrono::milliseconds interval) {
  std::unique_lock lock(mutex_);
  wake_.wait_for(lock, interval, [&] { return stop_requested_; });
  return !stop_requested_;
}

} // namespace flashback::stream::capture
