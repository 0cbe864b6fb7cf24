#pragma once

#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace checkpoint::runtime::config {
class RuntimeConfig;
}

namespace checkpoint::observability {

enum class OtlpTransport {
  kGrpc,
  kHttpProtobuf,
};

enum class OtlpSignal {
  kTraces,
  kMetrics,
};

/*
  Exporter settings shared by the trace and metric pipelines.

  `component` is the process role ("coordinator" or "worker") and becomes
  part of service.name; `instance_id` is the worker id when there is one.
*/
struct OtlpConfig {
  std::string   component{};
  std::string   instance_id{};
  std::string   strategy{};
  std::string   endpoint{};
  OtlpTransport transport{OtlpTransport::kGrpc};
  bool          insecure{true};
};

OtlpConfig ResolveOtlpConfig(const checkpoint::runtime::config::RuntimeConfig& config, std::string_view component);

// Explicit endpoint, then OTEL_EXPORTER_OTLP_<SIGNAL>_ENDPOINT, then
// OTEL_EXPORTER_OTLP_ENDPOINT, then the collector default for the transport.
std::string ResolveEndpoint(const OtlpConfig& config, OtlpSignal signal);

std::string ServiceName(const OtlpConfig& config);

std::vector<std::pair<std::string, std::string>> ResourceAttributes(const OtlpConfig& config);

} // namespace checkpoint::observability
