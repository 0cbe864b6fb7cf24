#include "internal/util/checksum.hpp"

#include <array>

namespace checkpoint::util {
namespace {

constexpr std::uint32_t kPolynomial = 0x82F63B78u;

constexpr std::array<std::uint32_t, 256> BuildTable() {
  std::array<std::uint32_t, 256> table{};
  for (std::uint32_t i = 0; i < 256; ++i) {
    std::uint32_t r = i;
    for (int k = 0; k < 8; ++k) {
      r = (r & 1u) ? (r >> 1) ^ kPolynomial : (r >> 1);
    }
    table[i] = r;
  }
  return table;
}

constexpr auto kTable = BuildTable();

} // namespace

void Crc32c::Update(const void* data, std::size_t len) {
  const auto*   p   = static_cast<const std::uint8_t*>(data);
  std::uint32_t crc = value_;
  for (std::size_t i = 0; i < len; ++i) {
    crc = kTable[(crc ^ p[i]) & 0xFFu] ^ (crc >> 8);
  }
  value_ = crc;
}

std::uint32_t Crc32c::Compute(const void* data, std::size_t len) {
  Crc32c crc;
  crc.Update(data, len);
  return crc.Finalize();
}

} // namespace checkpoint::util
