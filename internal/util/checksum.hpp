#pragma once

#include <cstddef>
#include <cstdint>
#include <string_view>

namespace checkpoint::util {

/*
  CRC32C (Castagnoli, reflected polynomial 0x82F63B78).

  Incremental form for streaming callers, one-shot helpers for buffers.
*/
class Crc32c {
 public:
  Crc32c() = default;

  void Update(const void* data, std::size_t len);

  std::uint32_t Finalize() const {
    return value_ ^ 0xFFFFFFFFu;
  }

  void Reset() {
    value_ = 0xFFFFFFFFu;
  }

  static std::uint32_t Compute(const void* data, std::size_t len);
  static std::uint32_t Compute(std::string_view bytes) {
    return Compute(bytes.data(), bytes.size());
  }

 private:
  std::uint32_t value_{0xFFFFFFFFu};
};

} // namespace checkpoint::util
