#include "internal/coordinator/coordinator_mailbox.hpp"

namespace checkpoint::coordinator {

bool CoordinatorMailbox::Post(CoordinatorEvent event) {
  {
    std::lock_guard lock(mutex_);
    if (shutdown_) return false;
    queue_.push_back(std::move(event));
  }
  cv_.notify_one();
  return true;
}

std::optional<CoordinatorEvent> CoordinatorMailbox::Dequeue() {
  std::unique_lock lock(mutex_);

  cv_.wait(lock, [&] { return shutdown_ || !queue_.empty(); });

  if (queue_.empty()) return std::nullopt;

  CoordinatorEvent event = std::move(queue_.front());
  queue_.pop_front();
  return event;
}

std::optional<CoordinatorEvent> CoordinatorMailbox::TryDequeueFor(std::chrono::milliseconds wait) {
  std::unique_lock lock(mutex_);

  if (!cv_.wait_for(lock, wait, [&] { return shutdown_ || !queue_.empty(); })) return std::nullopt;

  if (queue_.empty()) return std::nullopt;

  CoordinatorEvent event = std::move(queue_.front());
  queue_.pop_front();
  return event;
}

void CoordinatorMailbox::Shutdown() {
  {
    std::lock_guard lock(mutex_);
    shutdown_ = true;
  }
  cv_.notify_all();
}

size_t CoordinatorMailbox::Size() const {
  std::lock_guard lock(mutex_);
  return queue_.size();
}

} // namespace checkpoint::coordinator
