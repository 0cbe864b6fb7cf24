#pragma once

#include <cstddef>
#include <map>
#include <mutex>
#include <vector>

#include "internal/worker/event_log.hpp"

namespace checkpoint::worker {

class MemoryEventLog final : public EventLog {
 public:
  uint64_t Append(const std::string& partition, const std::string& key, std::optional<std::string> value) override;

  uint64_t Replay(const std::string& partition, uint64_t from_offset, const Handler& handler) override;

  uint64_t EndOffset(const std::string& partition) const override;

 private:
  mutable std::mutex                           mutex_;
  std::map<std::string, std::vector<LogEvent>> partitions_;
};

} // namespace checkpoint::worker
