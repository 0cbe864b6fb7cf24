#pragma once

#include <cstdint>
#include <cstdio>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>

#include "checkpoint/manager/v1_types.hpp"

namespace checkpoint::storage::common {

/*
  Snapshot object key layout:

      coordinated/<worker_id>/<epoch>.snap
      uncoordinated/<worker_id>/<sequence>.snap

  Generations are zero padded to 20 digits so lexical order is numeric order.
*/

constexpr std::string_view kSnapshotSuffix   = ".snap";
constexpr std::string_view kTemporarySuffix  = ".tmp";
constexpr int              kGenerationDigits = 20;

// In-progress writes of stores that stage a file before moving it into place.
inline bool IsTemporaryKey(std::string_view key) {
  return key.size() >= kTemporarySuffix.size() && key.substr(key.size() - kTemporarySuffix.size()) == kTemporarySuffix;
}

inline void ValidateWorkerId(const std::string& worker_id) {
  if (worker_id.empty()) {
    throw std::invalid_argument("worker id must not be empty");
  }
  for (char c : worker_id) {
    if (c == '/' || c == '\\' || c == '\0') {
      throw std::invalid_argument("worker id contains invalid character");
    }
  }
  if (worker_id == "." || worker_id == "..") {
    throw std::invalid_argument("worker id must not be a relative path component");
  }
}

// Keys are relative paths; reject anything that could escape a store root.
inline void ValidateKey(const std::string& key) {
  if (key.empty() || key.front() == '/') {
    throw std::invalid_argument("storage key must be a non-empty relative path");
  }
  std::size_t start = 0;
  while (start <= key.size()) {
    auto end     = key.find('/', start);
    auto segment = std::string_view(key).substr(start, end == std::string::npos ? std::string::npos : end - start);
    if (segment == "." || segment == "..") {
      throw std::invalid_argument("storage key must not contain relative path components");
    }
    if (end == std::string::npos) break;
    start = end + 1;
  }
  for (char c : key) {
    if (c == '\\' || c == '\0') {
      throw std::invalid_argument("storage key contains invalid character");
    }
  }
}

inline std::string StrategyDirectory(manager::v1::Strategy strategy) {
  switch (strategy) {
    case manager::v1::STRATEGY_COORDINATED:
      return "coordinated";
    case manager::v1::STRATEGY_UNCOORDINATED:
      return "uncoordinated";
    default:
      throw std::invalid_argument("snapshot key requires a strategy");
  }
}

inline std::string StrategyPrefix(manager::v1::Strategy strategy) {
  return StrategyDirectory(strategy) + "/";
}

inline std::string WorkerPrefix(manager::v1::Strategy strategy, const std::string& worker_id) {
  ValidateWorkerId(worker_id);
  return StrategyPrefix(strategy) + worker_id + "/";
}

inline std::string SnapshotKey(manager::v1::Strategy strategy, const std::string& worker_id, uint64_t generation) {
  char digits[kGenerationDigits + 1];
  std::snprintf(digits, sizeof(digits), "%020llu", static_cast<unsigned long long>(generation));
  return WorkerPrefix(strategy, worker_id) + digits + std::string(kSnapshotSuffix);
}

struct ParsedKey {
  manager::v1::Strategy strategy{manager::v1::STRATEGY_UNSPECIFIED};
  std::string           worker_id;
  uint64_t              generation{0};
};

/*
  Inverse of SnapshotKey. Returns nullopt for anything that does not follow
  the layout (foreign objects, temporaries).
*/
inline std::optional<ParsedKey> ParseSnapshotKey(const std::string& key) {
  auto first = key.find('/');
  if (first == std::string::npos) return std::nullopt;
  auto second = key.find('/', first + 1);
  if (second == std::string::npos || key.find('/', second + 1) != std::string::npos) return std::nullopt;

  ParsedKey parsed;
  auto      dir = key.substr(0, first);
  if (dir == "coordinated") {
    parsed.strategy = manager::v1::STRATEGY_COORDINATED;
  } else if (dir == "uncoordinated") {
    parsed.strategy = manager::v1::STRATEGY_UNCOORDINATED;
  } else {
    return std::nullopt;
  }

  parsed.worker_id = key.substr(first + 1, second - first - 1);
  if (parsed.worker_id.empty()) return std::nullopt;

  auto file = std::string_view(key).substr(second + 1);
  if (file.size() != kGenerationDigits + kSnapshotSuffix.size() || file.substr(kGenerationDigits) != kSnapshotSuffix) {
    return std::nullopt;
  }

  uint64_t value = 0;
  for (char c : file.substr(0, kGenerationDigits)) {
    if (c < '0' || c > '9') return std::nullopt;
    const auto digit = static_cast<uint64_t>(c - '0');
    if (value > (UINT64_MAX - digit) / 10) return std::nullopt;
    value = value * 10 + digit;
  }
  parsed.generation = value;
  return parsed;
}

} // namespace checkpoint::storage::common
