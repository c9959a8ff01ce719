#include "event_channel.hpp"

#include <stdexcept>

namespace flashback::stream {

EventChannel::EventChannel(std::size_t capacity) : capacity_(capacity) {
  if (capacity_ == 0) {
    throw std::invalid_argument("event channel capacity must be positive");
  }
}

bool EventChannel::Push(model::ChangeEvent event) {
  {
    std::unique_lock lock(mutex_);
    not_full_.wait(lock, [&] { return closed_ || queue_.size() < capacity_; });

    if (closed_) return false;

    queue_.push_back(std::move(event));
  }
  not_empty_.notify_one();
  return true;
}

std::optional<model::ChangeEvent> EventChannel::Pop() {
  std::optional<model::ChangeEvent> event;
  {
    std::unique_lock lock(mutex_);
    not_empty_.wait(lock, [&] { return closed_ || !queue_.empty(); });

    if (queue_.empty()) return std::nullopt;

    event = std::move(queue_.front());
    queue_.pop_front();
  }
  not_full_.notify_one();
  return event;
}

void EventChannel::Close() {
  {
    std::lock_guard lock(mutex_);
    closed_ = true;
  }
  not_empty_.notify_all();
  not_full_.notify_all();
}

bool EventChannel::IsClosed() const {
  std::lock_guard lock(mutex_);
  return closed_;
}

std::size_t EventChannel::Size() const {
  std::lock_guard lock(mutex_);
  return queue_.size();
}

} // namespace flashback::stream
