#include "internal/worker/memory_event_log.hpp"

namespace checkpoint::worker {

uint64_t MemoryEventLog::Append(const std::string& partition, const std::string& key, std::optional<std::string> value) {
  std::lock_guard lock(mutex_);
  auto&           events = partitions_[partition];

  LogEvent event;
  event.partition = partition;
  event.offset    = events.size();
  event.key       = key;
  event.value     = std::move(value);
  events.push_back(std::move(event));
  return events.back().offset;
}

uint64_t MemoryEventLog::Replay(const std::string& partition, uint64_t from_offset, const Handler& handler) {
  // Copy the tail so the handler runs without the log lock.
  std::vector<LogEvent> tail;
  {
    std::lock_guard lock(mutex_);
    auto            it = partitions_.find(partition);
    if (it == partitions_.end() || from_offset >= it->second.size()) return 0;
    tail.assign(it->second.begin() + static_cast<std::ptrdiff_t>(from_offset), it->second.end());
  }

  for (const auto& event : tail) {
    handler(event);
  }
  return tail.size();
}

uint64_t MemoryEventLog::EndOffset(const std::string& partition) const {
  std::lock_guard lock(mutex_);
  auto            it = partitions_.find(partition);
  return it == partitions_.end() ? 0 : it->second.size();
}

} // namespace checkpoint::worker
