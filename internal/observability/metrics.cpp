#include "internal/observability/spans.hpp"

#ifdef ENABLE_OTEL

#include <opentelemetry/common/attribute_value.h>
#include <opentelemetry/context/context.h>
#include <opentelemetry/exporters/otlp/otlp_grpc_metric_exporter_factory.h>
#include <opentelemetry/exporters/otlp/otlp_grpc_metric_exporter_options.h>
#include <opentelemetry/exporters/otlp/otlp_http_metric_exporter_factory.h>
#include <opentelemetry/exporters/otlp/otlp_http_metric_exporter_options.h>
#include <opentelemetry/metrics/provider.h>
#include <opentelemetry/sdk/metrics/meter_provider.h>

#include <atomic>
#include <chrono>
#include <memory>
#include <mutex>
#include <unordered_map>
#include <utility>
#if __has_include(<opentelemetry/sdk/metrics/periodic_exporting_metric_reader_factory.h>)
#define CHECKPOINT_OTEL_METRIC_READER_FACTORY 1
#include <opentelemetry/sdk/metrics/periodic_exporting_metric_reader_factory.h>
#elif __has_include(<opentelemetry/sdk/metrics/export/periodic_exporting_metric_reader_factory.h>)
#define CHECKPOINT_OTEL_METRIC_READER_FACTORY 1
#include <opentelemetry/sdk/metrics/export/periodic_exporting_metric_reader_factory.h>
#elif __has_include(<opentelemetry/sdk/metrics/periodic_exporting_metric_reader.h>)
#include <opentelemetry/sdk/metrics/periodic_exporting_metric_reader.h>
#else
#include <opentelemetry/sdk/metrics/export/periodic_exporting_metric_reader.h>
#endif
#include <opentelemetry/sdk/resource/resource.h>

#include "config/config.pb.h"

namespace checkpoint::observability {
namespace otlp        = opentelemetry::exporter::otlp;
namespace metrics_api = opentelemetry::metrics;
namespace sdkmetrics  = opentelemetry::sdk::metrics;
namespace resource    = opentelemetry::sdk::resource;

namespace {
using AttributePair = std::pair<opentelemetry::nostd::string_view, opentelemetry::common::AttributeValue>;
std::shared_ptr<sdkmetrics::MeterProvider> g_provider;

resource::Resource BuildResource(const OtlpConfig& config) {
  resource::ResourceAttributes attrs;
  for (const auto& [key, value] : ResourceAttributes(config)) {
    attrs.SetAttribute(key, opentelemetry::nostd::string_view(value));
  }
  return resource::Resource::Create(attrs);
}

template <typename Provider>
void ConfigureResource(Provider& provider, const resource::Resource& res) {
  if constexpr (requires { provider.SetResource(res); }) {
    provider.SetResource(res);
  }
}

template <typename Provider>
void AddMetricReaderCompat(const std::shared_ptr<Provider>& provider, std::unique_ptr<sdkmetrics::MetricReader> reader) {
  if constexpr (requires { provider->AddMetricReader(std::move(reader)); }) {
    provider->AddMetricReader(std::move(reader));
  } else {
    provider->AddMetricReader(std::shared_ptr<sdkmetrics::MetricReader>(std::move(reader)));
  }
}

template <typename Instrument, typename Value, typename Attributes>
void AddWithAttributes(const opentelemetry::nostd::shared_ptr<Instrument>& instrument, Value value, Attributes&& attributes) {
  if constexpr (requires { instrument->Add(value, std::forward<Attributes>(attributes), opentelemetry::context::Context{}); }) {
    instrument->Add(value, std::forward<Attributes>(attributes), opentelemetry::context::Context{});
  } else {
    instrument->Add(value, std::forward<Attributes>(attributes));
  }
}

template <typename Instrument, typename Value, typename Attributes>
void RecordWithAttributes(const opentelemetry::nostd::shared_ptr<Instrument>& instrument, Value value, Attributes&& attributes) {
  if constexpr (requires { instrument->Record(value, std::forward<Attributes>(attributes), opentelemetry::context::Context{}); }) {
    instrument->Record(value, std::forward<Attributes>(attributes), opentelemetry::context::Context{});
  } else {
    instrument->Record(value, std::forward<Attributes>(attributes));
  }
}

std::unique_ptr<sdkmetrics::PushMetricExporter> MakeExporter(const OtlpConfig& config) {
  const auto endpoint = ResolveEndpoint(config, OtlpSignal::kMetrics);
  if (config.transport == OtlpTransport::kHttpProtobuf) {
    otlp::OtlpHttpMetricExporterOptions options;
    options.url = endpoint;
    return otlp::OtlpHttpMetricExporterFactory::Create(options);
  }

  otlp::OtlpGrpcMetricExporterOptions options;
  options.endpoint            = endpoint;
  options.use_ssl_credentials = !config.insecure;
  return otlp::OtlpGrpcMetricExporterFactory::Create(options);
}

std::unique_ptr<sdkmetrics::MetricReader> MakeReader(std::unique_ptr<sdkmetrics::PushMetricExporter> exporter,
                                                     std::chrono::milliseconds interval, std::chrono::milliseconds timeout) {
  sdkmetrics::PeriodicExportingMetricReaderOptions options;
  options.export_interval_millis = interval;
  if (timeout.count() > 0 && timeout < interval) {
    options.export_timeout_millis = timeout;
  }
#ifdef CHECKPOINT_OTEL_METRIC_READER_FACTORY
  return sdkmetrics::PeriodicExportingMetricReaderFactory::Create(std::move(exporter), options);
#else
  return std::make_unique<sdkmetrics::PeriodicExportingMetricReader>(std::move(exporter), options);
#endif
}

} // namespace

struct Metrics::Impl {
  opentelemetry::nostd::shared_ptr<metrics_api::Meter> meter;

  opentelemetry::nostd::shared_ptr<metrics_api::Counter<std::uint64_t>> request_count;
  opentelemetry::nostd::shared_ptr<metrics_api::Histogram<double>>      request_latency_ms;

  opentelemetry::nostd::shared_ptr<metrics_api::Counter<std::uint64_t>> epoch_finished;
  opentelemetry::nostd::shared_ptr<metrics_api::Histogram<double>>      epoch_duration_ms;
  opentelemetry::nostd::shared_ptr<metrics_api::ObservableInstrument>   epoch_stalled_gauge;

  opentelemetry::nostd::shared_ptr<metrics_api::Histogram<double>>        snapshot_write_ms;
  opentelemetry::nostd::shared_ptr<metrics_api::Counter<std::uint64_t>>   snapshot_bytes;
  opentelemetry::nostd::shared_ptr<metrics_api::Counter<std::uint64_t>>   snapshot_failures;
  opentelemetry::nostd::shared_ptr<metrics_api::Counter<std::uint64_t>>   compaction_deleted;
  opentelemetry::nostd::shared_ptr<metrics_api::ObservableInstrument>     workers_gauge;
  opentelemetry::nostd::shared_ptr<metrics_api::ObservableInstrument>     recovery_pending_gauge;

  std::atomic<std::int64_t> epoch_stalled_ms{0};
  std::atomic<std::int64_t> recovery_pending{0};

  std::mutex                                    workers_mutex;
  std::unordered_map<std::string, std::int64_t> workers_by_status;
};

bool InitializeMetrics(const checkpoint::runtime::config::RuntimeConfig& config, std::string_view component) {
  const auto& observability = config.observability();
  if (!observability.metrics_enabled()) {
    ShutdownMetrics();
    return false;
  }

  const auto otlp_config = ResolveOtlpConfig(config, component);
  const auto interval_ms = observability.metrics().collection_interval_ms() > 0 ? observability.metrics().collection_interval_ms() : 1000;
  auto       reader      = MakeReader(MakeExporter(otlp_config), std::chrono::milliseconds(interval_ms),
                                      std::chrono::milliseconds(observability.metrics().export_timeout_ms()));

  auto res   = BuildResource(otlp_config);
  g_provider = std::make_shared<sdkmetrics::MeterProvider>(std::unique_ptr<sdkmetrics::ViewRegistry>(new sdkmetrics::ViewRegistry()), res);
  ConfigureResource(*g_provider, res);
  AddMetricReaderCompat(g_provider, std::move(reader));

  metrics_api::Provider::SetMeterProvider(opentelemetry::nostd::shared_ptr<metrics_api::MeterProvider>(g_provider));
  return true;
}

void ShutdownMetrics() {
  if (g_provider) {
    g_provider->ForceFlush();
    g_provider->Shutdown();
  }
  g_provider.reset();
}

Metrics::Metrics() : impl_(std::make_unique<Impl>()) {
  auto provider = metrics_api::Provider::GetMeterProvider();
  impl_->meter  = provider->GetMeter("checkpoint-manager", "0.1.0");

  impl_->request_count      = impl_->meter->CreateUInt64Counter("checkpoint.request.count", "1", "Total number of RPC requests");
  impl_->request_latency_ms = impl_->meter->CreateDoubleHistogram("checkpoint.request.latency_ms", "ms", "RPC handler latency in milliseconds");

  impl_->epoch_finished    = impl_->meter->CreateUInt64Counter("checkpoint.epoch.completed", "1", "Epochs that reached a terminal state");
  impl_->epoch_duration_ms = impl_->meter->CreateDoubleHistogram("checkpoint.epoch.duration_ms", "ms", "Barrier request to terminal state");
  impl_->epoch_stalled_gauge =
      impl_->meter->CreateInt64ObservableGauge("checkpoint.epoch.stalled_ms", "Age of the in-flight epoch in milliseconds", "ms");
  impl_->epoch_stalled_gauge->AddCallback(
      [](metrics_api::ObserverResult result, void* state) {
        auto* impl       = static_cast<Impl*>(state);
        auto  int_result = opentelemetry::nostd::get<opentelemetry::nostd::shared_ptr<metrics_api::ObserverResultT<std::int64_t>>>(result);
        int_result->Observe(impl->epoch_stalled_ms.load());
      },
      impl_.get());

  impl_->recovery_pending_gauge =
      impl_->meter->CreateInt64ObservableGauge("checkpoint.recovery.pending", "DEAD workers awaiting their recovery point", "1");
  impl_->recovery_pending_gauge->AddCallback(
      [](metrics_api::ObserverResult result, void* state) {
        auto* impl       = static_cast<Impl*>(state);
        auto  int_result = opentelemetry::nostd::get<opentelemetry::nostd::shared_ptr<metrics_api::ObserverResultT<std::int64_t>>>(result);
        int_result->Observe(impl->recovery_pending.load());
      },
      impl_.get());

  impl_->snapshot_write_ms  = impl_->meter->CreateDoubleHistogram("checkpoint.snapshot.write_ms", "ms", "Snapshot capture to durable write");
  impl_->snapshot_bytes     = impl_->meter->CreateUInt64Counter("checkpoint.snapshot.bytes", "By", "Bytes written by snapshots");
  impl_->snapshot_failures  = impl_->meter->CreateUInt64Counter("checkpoint.snapshot.failures", "1", "Abandoned snapshot attempts");
  impl_->compaction_deleted = impl_->meter->CreateUInt64Counter("checkpoint.compaction.deleted", "1", "Snapshot objects removed by compaction");

  impl_->workers_gauge = impl_->meter->CreateInt64ObservableGauge("checkpoint.workers", "Known workers by liveness status", "1");
  impl_->workers_gauge->AddCallback(
      [](metrics_api::ObserverResult result, void* state) {
        auto*                       impl = static_cast<Impl*>(state);
        std::lock_guard<std::mutex> lock(impl->workers_mutex);
        auto int_result = opentelemetry::nostd::get<opentelemetry::nostd::shared_ptr<metrics_api::ObserverResultT<std::int64_t>>>(result);
        for (const auto& [status, count] : impl->workers_by_status) {
          const std::initializer_list<AttributePair> attributes = {{"status", status}};
          int_result->Observe(count, attributes);
        }
      },
      impl_.get());
}

Metrics& Metrics::Instance() {
  static Metrics instance;
  return instance;
}

void Metrics::RecordRequest(std::string_view route, bool success) {
  if (!impl_ || !impl_->request_count) {
    return;
  }

  const std::initializer_list<AttributePair> attributes = {{"route", std::string(route)}, {"success", success}};
  AddWithAttributes(impl_->request_count, static_cast<std::uint64_t>(1), attributes);
}

void Metrics::ObserveRequestLatencyMs(std::string_view route, double latency_ms) {
  if (!impl_ || !impl_->request_latency_ms) {
    return;
  }

  const std::initializer_list<AttributePair> attributes = {{"route", std::string(route)}};
  RecordWithAttributes(impl_->request_latency_ms, latency_ms, attributes);
}

void Metrics::RecordEpochFinished(std::string_view state, double duration_ms) {
  if (!impl_ || !impl_->epoch_finished) {
    return;
  }

  const std::initializer_list<AttributePair> attributes = {{"state", std::string(state)}};
  AddWithAttributes(impl_->epoch_finished, static_cast<std::uint64_t>(1), attributes);
  RecordWithAttributes(impl_->epoch_duration_ms, duration_ms, attributes);
}

void Metrics::SetEpochStalledMs(std::uint64_t stalled_ms) {
  if (!impl_) {
    return;
  }
  impl_->epoch_stalled_ms.store(static_cast<std::int64_t>(stalled_ms));
}

void Metrics::ObserveSnapshotWrite(std::string_view strategy, double write_ms, std::uint64_t bytes) {
  if (!impl_ || !impl_->snapshot_write_ms) {
    return;
  }

  const std::initializer_list<AttributePair> attributes = {{"strategy", std::string(strategy)}};
  RecordWithAttributes(impl_->snapshot_write_ms, write_ms, attributes);
  AddWithAttributes(impl_->snapshot_bytes, bytes, attributes);
}

void Metrics::RecordSnapshotFailure(std::string_view reason) {
  if (!impl_ || !impl_->snapshot_failures) {
    return;
  }

  const std::initializer_list<AttributePair> attributes = {{"reason", std::string(reason)}};
  AddWithAttributes(impl_->snapshot_failures, static_cast<std::uint64_t>(1), attributes);
}

void Metrics::RecordCompactionDeleted(std::string_view strategy, std::uint64_t deleted) {
  if (!impl_ || !impl_->compaction_deleted || deleted == 0) {
    return;
  }

  const std::initializer_list<AttributePair> attributes = {{"strategy", std::string(strategy)}};
  AddWithAttributes(impl_->compaction_deleted, deleted, attributes);
}

void Metrics::SetWorkerCount(std::string_view status, std::uint64_t count) {
  if (!impl_ || !impl_->workers_gauge) {
    return;
  }

  std::lock_guard<std::mutex> lock(impl_->workers_mutex);
  impl_->workers_by_status[std::string(status)] = static_cast<std::int64_t>(count);
}

void Metrics::SetRecoveryPending(std::uint64_t count) {
  if (!impl_) {
    return;
  }
  impl_->recovery_pending.store(static_cast<std::int64_t>(count));
}

} // namespace checkpoint::observability

#endif
