#pragma once

#include <chrono>
#include <condition_variable>
#include <filesystem>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "internal/stream/capture/capture_format.hpp"
#include "internal/stream/event_source.hpp"

namespace flashback::stream::capture {

struct CaptureSourceOptions {
  std::filesystem::path     directory;
  std::string               file_prefix = "binlog";
  std::chrono::milliseconds poll_interval{200};
};

/*
  EventSource over a capture spool directory written by an upstream decoder.
*/
class CaptureEventSource : public EventSource {
 public:
  explicit CaptureEventSource(CaptureSourceOptions options);

  std::vector<LogFile> ListLogFiles() override;

  std::uint64_t MinimalOffset() const override {
    return kMinimalOffset;
  }

  std::unique_ptr<EventStream> Open(const StreamRequest& request) override;

 private:
  CaptureSourceOptions options_;
};

class CaptureEventStream : public EventStream {
 public:
  CaptureEventStream(CaptureSourceOptions options, StreamRequest request);

  void Connect(std::chrono::milliseconds timeout) override;

  void Run(const EventHandler& handler) override;

  void Disconnect() override;

  bool IsConnected() const override;

  model::Coordinate Position() const override;

 private:
  std::optional<std::uint32_t> NewestIndex() const;
  bool                         FileExists(std::uint32_t index) const;
  void                         OpenAt(std::uint32_t index, std::uint64_t offset);

  // false when disconnected while waiting
  bool WaitFor(std::chrono::milliseconds interval);

  CaptureSourceOptions options_;
  StreamRequest        request_;

  std::unique_ptr<CaptureFileReader> reader_;
  std::uint32_t                      index_ = 0;

  mutable std::mutex      mutex_;
  std::condition_variable wake_;
  bool                    connected_     = false;
  bool                    stop_requested_ = false;
  model::Coordinate       position_;
};

} // namespace flashback::stream::capture
