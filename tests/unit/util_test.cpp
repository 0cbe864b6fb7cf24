#include <cassert>
#include <chrono>
#include <iostream>
#include <string>

#include "internal/util/backoff.hpp"
#include "internal/util/checksum.hpp"
#include "internal/util/time.hpp"

namespace {

using namespace std::chrono_literals;

void TestCrc32cKnownValues() {
  assert(checkpoint::util::Crc32c::Compute(std::string("123456789")) == 0xE3069283u);
  assert(checkpoint::util::Crc32c::Compute(std::string()) == 0x00000000u);

  // 32 bytes of zeros, RFC 3720 test vector.
  const std::string zeros(32, '\0');
  assert(checkpoint::util::Crc32c::Compute(zeros) == 0x8A9136AAu);
}

void TestCrc32cIncrementalMatchesOneShot() {
  const std::string text = "partition p0 offset 42 snapshot image";

  checkpoint::util::Crc32c crc;
  crc.Update(text.data(), 10);
  crc.Update(text.data() + 10, text.size() - 10);
  assert(crc.Finalize() == checkpoint::util::Crc32c::Compute(text));

  crc.Reset();
  crc.Update(text.data(), text.size());
  assert(crc.Finalize() == checkpoint::util::Crc32c::Compute(text));
}

void TestBackoffDoublesUpToCap() {
  checkpoint::util::RetryPolicy policy;
  policy.initial_backoff = 100ms;
  policy.max_backoff     = 500ms;

  assert(checkpoint::util::BackoffFor(policy, 0) == 0ms);
  assert(checkpoint::util::BackoffFor(policy, 1) == 100ms);
  assert(checkpoint::util::BackoffFor(policy, 2) == 200ms);
  assert(checkpoint::util::BackoffFor(policy, 3) == 400ms);
  assert(checkpoint::util::BackoffFor(policy, 4) == 500ms);
  assert(checkpoint::util::BackoffFor(policy, 40) == 500ms);
}

void TestTimestampRoundTripKeepsMilliseconds() {
  const auto now   = checkpoint::util::Now();
  const auto proto = checkpoint::util::ToProto(now);
  const auto back  = checkpoint::util::FromProto(proto);
  assert(checkpoint::util::ToUnixMillis(back) == checkpoint::util::ToUnixMillis(now));

  const auto start = checkpoint::util::SteadyNow();
  assert(checkpoint::util::ElapsedMillis(start, start + 6s) == 6000);
  assert(checkpoint::util::ElapsedMillis(start + 1s, start) == 0);
}

} // namespace

int main() {
  TestCrc32cKnownValues();
  TestCrc32cIncrementalMatchesOneShot();
  TestBackoffDoublesUpToCap();
  TestTimestampRoundTripKeepsMilliseconds();

  std::cout << "checkpoint_unit_util: pass\n";
  return 0;
}
