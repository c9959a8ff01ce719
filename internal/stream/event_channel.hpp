#pragma once

#include <condition_variable>
#include <cstddef>
#include <deque>
#include <mutex>
#include <optional>

#include "internal/model/change_event.hpp"

namespace flashback::stream {

/*
  Bounded blocking queue between the upstream stream thread and the
  consumer. Push blocks while full; Close wakes everyone.
*/
class EventChannel {
 public:
  explicit EventChannel(std::size_t capacity);

  // false once the channel is closed; the event is dropped
  bool Push(model::ChangeEvent event);

  // blocking wait; nullopt when closed and drained
  std::optional<model::ChangeEvent> Pop();

  void Close();

  bool IsClosed() const;

  std::size_t Size() const;

 private:
  const std::size_t              capacity_;
  mutable std::mutex             mutex_;
  std::condition_variable        not_empty_;
  std::condition_variable        not_full_;
  std::deque<model::ChangeEvent> queue_;
  bool                           closed_ = false;
};

} // namespace flashback::stream
