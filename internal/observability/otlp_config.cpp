#include "internal/observability/otlp_config.hpp"

#include <cstdlib>

#include "config/config.pb.h"

namespace checkpoint::observability {
namespace {

using checkpoint::runtime::config::RuntimeConfig;

std::string StrategyLabel(const RuntimeConfig& config) {
  switch (config.checkpoint().strategy()) {
    case checkpoint::manager::core::v1::STRATEGY_COORDINATED:
      return "coordinated";
    case checkpoint::manager::core::v1::STRATEGY_UNCOORDINATED:
      return "uncoordinated";
    default:
      return {};
  }
}

const char* NonEmptyEnv(const char* name) {
  const char* value = std::getenv(name);
  return (value && *value) ? value : nullptr;
}

} // namespace

OtlpConfig ResolveOtlpConfig(const RuntimeConfig& config, std::string_view component) {
  const auto& observability = config.observability();

  OtlpConfig out;
  out.component = std::string(component);
  if (component == "worker") {
    out.instance_id = config.worker().worker_id();
  }
  out.strategy  = StrategyLabel(config);
  out.endpoint  = observability.otlp_endpoint();
  out.transport = observability.transport() == checkpoint::runtime::config::OTLP_TRANSPORT_HTTP ? OtlpTransport::kHttpProtobuf
                                                                                                 : OtlpTransport::kGrpc;
  return out;
}

std::string ResolveEndpoint(const OtlpConfig& config, OtlpSignal signal) {
  if (!config.endpoint.empty()) {
    return config.endpoint;
  }

  const bool traces = signal == OtlpSignal::kTraces;
  if (const char* endpoint = NonEmptyEnv(traces ? "OTEL_EXPORTER_OTLP_TRACES_ENDPOINT" : "OTEL_EXPORTER_OTLP_METRICS_ENDPOINT")) {
    return endpoint;
  }
  if (const char* endpoint = NonEmptyEnv("OTEL_EXPORTER_OTLP_ENDPOINT")) {
    return endpoint;
  }

  if (config.transport == OtlpTransport::kGrpc) {
    return "localhost:4317";
  }
  return traces ? "http://localhost:4318/v1/traces" : "http://localhost:4318/v1/metrics";
}

std::string ServiceName(const OtlpConfig& config) {
  return config.component.empty() ? "checkpoint-manager" : "checkpoint-" + config.component;
}

std::vector<std::pair<std::string, std::string>> ResourceAttributes(const OtlpConfig& config) {
  std::vector<std::pair<std::string, std::string>> attrs = {
      {"service.name", ServiceName(config)},
      {"service.namespace", "checkpoint-manager"},
  };
  if (!config.instance_id.empty()) {
    attrs.emplace_back("service.instance.id", config.instance_id);
  }
  if (!config.strategy.empty()) {
    attrs.emplace_back("checkpoint.strategy", config.strategy);
  }
  return attrs;
}

} // namespace checkpoint::observability
