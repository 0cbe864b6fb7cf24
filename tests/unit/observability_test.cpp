#include <cassert>
#include <cstdlib>
#include <iostream>
#include <string>

#include "config/config.pb.h"
#include "internal/observability/logging.hpp"
#include "internal/observability/otlp_config.hpp"

namespace {

using checkpoint::observability::OtlpSignal;
using checkpoint::observability::OtlpTransport;
using checkpoint::runtime::config::RuntimeConfig;

bool HasAttribute(const checkpoint::observability::OtlpConfig& config, const std::string& key, const std::string& value) {
  for (const auto& [k, v] : checkpoint::observability::ResourceAttributes(config)) {
    if (k == key && v == value) {
      return true;
    }
  }
  return false;
}

void TestLogLineQuotesAwkwardValues() {
  using namespace checkpoint::observability;
  SetContextFields({});

  const auto line = FormatLogLine("snapshot write failed", {StringField("key", "coordinated/w-1/00000000000000000003.snap"),
                                                            StringField("error", "disk full"), IntField("attempt", 3),
                                                            StringField("detail", "say \"hi\""), StringField("empty", "")});
  assert(line ==
         "snapshot write failed key=coordinated/w-1/00000000000000000003.snap error=\"disk full\" attempt=3 "
         "detail=\"say \\\"hi\\\"\" empty=\"\"");
}

void TestContextFieldsFollowCallFields() {
  using namespace checkpoint::observability;
  SetContextFields({StringField("worker_id", "w-7")});

  assert(FormatLogLine("heartbeat sent", {BoolField("ok", true)}) == "heartbeat sent ok=true worker_id=w-7");
  assert(FormatLogLine("idle", {}) == "idle worker_id=w-7");

  SetContextFields({});
  assert(FormatLogLine("idle", {DurationMsField("waited", 250)}) == "idle waited=250ms");
}

void TestOtlpConfigFromRuntimeConfig() {
  RuntimeConfig config;
  config.mutable_checkpoint()->set_strategy(checkpoint::manager::core::v1::STRATEGY_UNCOORDINATED);
  config.mutable_worker()->set_worker_id("w-3");
  config.mutable_observability()->set_transport(checkpoint::runtime::config::OTLP_TRANSPORT_HTTP);

  auto worker = checkpoint::observability::ResolveOtlpConfig(config, "worker");
  assert(worker.transport == OtlpTransport::kHttpProtobuf);
  assert(checkpoint::observability::ServiceName(worker) == "checkpoint-worker");
  assert(HasAttribute(worker, "service.instance.id", "w-3"));
  assert(HasAttribute(worker, "checkpoint.strategy", "uncoordinated"));

  auto coordinator = checkpoint::observability::ResolveOtlpConfig(config, "coordinator");
  assert(coordinator.instance_id.empty());
  assert(HasAttribute(coordinator, "service.name", "checkpoint-coordinator"));
}

void TestEndpointResolutionOrder() {
  unsetenv("OTEL_EXPORTER_OTLP_TRACES_ENDPOINT");
  unsetenv("OTEL_EXPORTER_OTLP_METRICS_ENDPOINT");
  unsetenv("OTEL_EXPORTER_OTLP_ENDPOINT");

  checkpoint::observability::OtlpConfig config;
  assert(checkpoint::observability::ResolveEndpoint(config, OtlpSignal::kTraces) == "localhost:4317");
  config.transport = OtlpTransport::kHttpProtobuf;
  assert(checkpoint::observability::ResolveEndpoint(config, OtlpSignal::kMetrics) == "http://localhost:4318/v1/metrics");

  setenv("OTEL_EXPORTER_OTLP_ENDPOINT", "http://collector:4318", 1);
  assert(checkpoint::observability::ResolveEndpoint(config, OtlpSignal::kTraces) == "http://collector:4318");
  setenv("OTEL_EXPORTER_OTLP_TRACES_ENDPOINT", "http://traces:4318/v1/traces", 1);
  assert(checkpoint::observability::ResolveEndpoint(config, OtlpSignal::kTraces) == "http://traces:4318/v1/traces");
  assert(checkpoint::observability::ResolveEndpoint(config, OtlpSignal::kMetrics) == "http://collector:4318");

  config.endpoint = "otel:4317";
  assert(checkpoint::observability::ResolveEndpoint(config, OtlpSignal::kTraces) == "otel:4317");

  unsetenv("OTEL_EXPORTER_OTLP_TRACES_ENDPOINT");
  unsetenv("OTEL_EXPORTER_OTLP_ENDPOINT");
}

} // namespace

int main() {
  TestLogLineQuotesAwkwardValues();
  TestContextFieldsFollowCallFields();
  TestOtlpConfigFromRuntimeConfig();
  TestEndpointResolutionOrder();

  std::cout << "checkpoint_unit_observability: pass\n";
  return 0;
}
