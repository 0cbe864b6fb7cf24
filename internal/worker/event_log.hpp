#pragma once

#include <cstdint>
#include <functional>
#include <optional>
#include <string>

namespace checkpoint::worker {

struct LogEvent {
  std::string                partition;
  uint64_t                   offset = 0;
  std::string                key;
  std::optional<std::string> value;  // nullopt deletes the key
};

/*
  Append-only event log with stable per-partition offsets.

  Broker adapters implement this; MemoryEventLog is the in-process one.
*/
class EventLog {
 public:
  using Handler = std::function<void(const LogEvent&)>;

  virtual ~EventLog() = default;

  // Returns the offset assigned to the event.
  virtual uint64_t Append(const std::string& partition, const std::string& key, std::optional<std::string> value) = 0;

  // Delivers every event with offset >= from_offset in order. Returns the count.
  virtual uint64_t Replay(const std::string& partition, uint64_t from_offset, const Handler& handler) = 0;

  // Offset the next appended event will receive.
  virtual uint64_t EndOffset(const std::string& partition) const = 0;
};

} // namespace checkpoint::worker
