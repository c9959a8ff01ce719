#pragma once

#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "internal/model/change_event.hpp"
#include "internal/model/coordinate.hpp"

namespace flashback::stream {

struct LogFile {
  std::string   name;
  std::uint64_t size_bytes = 0;
};

/*
  Where a stream starts.

    file unset           -> current end of the newest file
    file set, offset 0   -> first event of that file
    stop_at_file_end     -> Run() returns at the end of the start file
                            instead of following rotation / waiting for data
*/
struct StreamRequest {
  std::optional<std::string>   file;
  std::optional<std::uint64_t> offset;
  bool                         stop_at_file_end = false;
};

// Returns false to stop the stream.
using EventHandler = std::function<bool(model::ChangeEvent&&)>;

/*
  One connection to the upstream decoder.

  Connect() and Run() throw util::ConnectionError. Disconnect() may be
  called from any thread and makes a blocked Run() return.
*/
class EventStream {
 public:
  virtual ~EventStream() = default;

  virtual void Connect(std::chrono::milliseconds timeout) = 0;

  // Blocks, delivering events in log order, until the handler declines,
  // Disconnect() is called, or (stop_at_file_end) the file ends.
  virtual void Run(const EventHandler& handler) = 0;

  virtual void Disconnect() = 0;

  virtual bool IsConnected() const = 0;

  // Coordinate of the next event to be read; the resolved start after Connect().
  virtual model::Coordinate Position() const = 0;
};

/*
  Producer of decoded change events for an append-only, file-segmented log.
*/
class EventSource {
 public:
  virtual ~EventSource() = default;

  // Oldest first. Throws util::ConnectionError.
  virtual std::vector<LogFile> ListLogFiles() = 0;

  // Offset of the first event in any file.
  virtual std::uint64_t MinimalOffset() const = 0;

  virtual std::unique_ptr<EventStream> Open(const StreamRequest& request) = 0;
};

} // namespace flashback::stream
