#pragma once

#include <algorithm>
#include <chrono>
#include <cstdint>

namespace checkpoint::util {

/*
  Bounded exponential backoff (multiplier 2).

  attempt is 1-based: the wait after the first failed attempt is
  initial_backoff, then 2x, 4x ... capped at max_backoff.
*/
struct RetryPolicy {
  uint32_t                  max_attempts{5};
  std::chrono::milliseconds initial_backoff{100};
  std::chrono::milliseconds max_backoff{2000};
};

inline std::chrono::milliseconds BackoffFor(const RetryPolicy& policy, uint32_t attempt) {
  if (attempt == 0) return std::chrono::milliseconds{0};

  auto delay = policy.initial_backoff;
  for (uint32_t i = 1; i < attempt && delay < policy.max_backoff; ++i) {
    delay *= 2;
  }
  return std::min(delay, policy.max_backoff);
}

} // namespace checkpoint::util
