#pragma once

#include <cstdint>
#include <memory>
#include <string>
#include <string_view>

#include "internal/observability/otlp_config.hpp"

namespace checkpoint::observability {

// Both return false when the signal is disabled in the observability section.
bool InitializeTracing(const checkpoint::runtime::config::RuntimeConfig& config, std::string_view component);
bool InitializeMetrics(const checkpoint::runtime::config::RuntimeConfig& config, std::string_view component);
void ShutdownTracing();
void ShutdownMetrics();

class SpanScope {
 public:
  explicit SpanScope(std::string_view name);
  ~SpanScope();

  SpanScope(const SpanScope&)            = delete;
  SpanScope& operator=(const SpanScope&) = delete;

  SpanScope(SpanScope&&) noexcept;
  SpanScope& operator=(SpanScope&&) noexcept;

  void SetAttribute(std::string_view key, std::string_view value);
  void SetAttribute(std::string_view key, std::int64_t value);
  void SetAttribute(std::string_view key, double value);
  void AddEvent(std::string_view name);
  void RecordException(std::string_view description);

 private:
#ifdef ENABLE_OTEL
  struct Impl;
  std::unique_ptr<Impl> impl_;
#endif
};

class Metrics {
 public:
  static Metrics& Instance();

  void RecordRequest(std::string_view route, bool success);
  void ObserveRequestLatencyMs(std::string_view route, double latency_ms);

  // Epoch finished as COMPLETE or INCOMPLETE.
  void RecordEpochFinished(std::string_view state, double duration_ms);
  // Age of the in-flight epoch; 0 when none is pending.
  void SetEpochStalledMs(std::uint64_t stalled_ms);

  void ObserveSnapshotWrite(std::string_view strategy, double write_ms, std::uint64_t bytes);
  void RecordSnapshotFailure(std::string_view reason);
  void RecordCompactionDeleted(std::string_view strategy, std::uint64_t deleted);
  void SetWorkerCount(std::string_view status, std::uint64_t count);
  // DEAD workers that have not fetched their recovery point yet.
  void SetRecoveryPending(std::uint64_t count);

 private:
  Metrics();
#ifdef ENABLE_OTEL
  struct Impl;
  std::unique_ptr<Impl> impl_;
#endif
};

#ifndef ENABLE_OTEL
inline bool InitializeTracing(const checkpoint::runtime::config::RuntimeConfig&, std::string_view) {
  return false;
}

inline bool InitializeMetrics(const checkpoint::runtime::config::RuntimeConfig&, std::string_view) {
  return false;
}

inline void ShutdownTracing() {
}

inline void ShutdownMetrics() {
}

inline SpanScope::SpanScope(std::string_view) {
}

inline SpanScope::~SpanScope() {
}

inline SpanScope::SpanScope(SpanScope&&) noexcept = default;

inline SpanScope& SpanScope::operator=(SpanScope&&) noexcept = default;

inline void SpanScope::SetAttribute(std::string_view, std::string_view) {
}

inline void SpanScope::SetAttribute(std::string_view, std::int64_t) {
}

inline void SpanScope::SetAttribute(std::string_view, double) {
}

inline void SpanScope::AddEvent(std::string_view) {
}

inline void SpanScope::RecordException(std::string_view) {
}

inline Metrics::Metrics() {
}

inline Metrics& Metrics::Instance() {
  static Metrics instance;
  return instance;
}

inline void Metrics::RecordRequest(std::string_view, bool) {
}

inline void Metrics::ObserveRequestLatencyMs(std::string_view, double) {
}

inline void Metrics::RecordEpochFinished(std::string_view, double) {
}

inline void Metrics::SetEpochStalledMs(std::uint64_t) {
}

inline void Metrics::ObserveSnapshotWrite(std::string_view, double, std::uint64_t) {
}

inline void Metrics::RecordSnapshotFailure(std::string_view) {
}

inline void Metrics::RecordCompactionDeleted(std::string_view, std::uint64_t) {
}

inline void Metrics::SetWorkerCount(std::string_view, std::uint64_t) {
}

inline void Metrics::SetRecoveryPending(std::uint64_t) {
}
#endif

} // namespace checkpoint::observability
