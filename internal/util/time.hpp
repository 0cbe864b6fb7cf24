#pragma once

#include <chrono>
#include <cstdint>

#include "google/protobuf/timestamp.pb.h"

namespace checkpoint::util {

/*
  Time utilities: single place to control the clock source.

  Wall clock is used for anything persisted (record timestamps).
  Liveness and timers use the monotonic clock.
*/

using Clock     = std::chrono::system_clock;
using TimePoint = Clock::time_point;

using SteadyClock     = std::chrono::steady_clock;
using SteadyTimePoint = SteadyClock::time_point;

TimePoint       Now();
SteadyTimePoint SteadyNow();

google::protobuf::Timestamp ToProto(TimePoint tp);
TimePoint                   FromProto(const google::protobuf::Timestamp& ts);

uint64_t ToUnixMillis(TimePoint tp);

inline uint64_t ElapsedMillis(SteadyTimePoint from, SteadyTimePoint to) {
  if (to <= from) return 0;
  return static_cast<uint64_t>(std::chrono::duration_cast<std::chrono::milliseconds>(to - from).count());
}

} // namespace checkpoint::util
