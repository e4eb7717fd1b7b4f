#include "internal/observability/spans.hpp"

#ifdef ENABLE_OTEL

#include <opentelemetry/common/attribute_value.h>
#include <opentelemetry/context/context.h>
#include <opentelemetry/exporters/otlp/otlp_grpc_metric_exporter_factory.h>
#include <opentelemetry/exporters/otlp/otlp_grpc_metric_exporter_options.h>
#include <opentelemetry/exporters/otlp/otlp_http_metric_exporter_factory.h>
#include <opentelemetry/exporters/otlp/otlp_http_metric_exporter_options.h>
#include <opentelemetry/metrics/provider.h>
#include <opentelemetry/sdk/metrics/export/periodic_exporting_metric_reader_factory.h>
#include <opentelemetry/sdk/metrics/meter_provider.h>
#include <opentelemetry/sdk/metrics/meter_provider_factory.h>
#include <opentelemetry/sdk/resource/resource.h>

#include <chrono>
#include <cstdlib>
#include <memory>
#include <utility>

#include "config/config.pb.h"

namespace lidar::observability {
namespace otlp        = opentelemetry::exporter::otlp;
namespace metrics_api = opentelemetry::metrics;
namespace sdkmetrics  = opentelemetry::sdk::metrics;
namespace resource    = opentelemetry::sdk::resource;

namespace {
using AttributePair = std::pair<opentelemetry::nostd::string_view, opentelemetry::common::AttributeValue>;

std::shared_ptr<sdkmetrics::MeterProvider> g_provider;

std::string ResolveEndpoint(const std::string& configured, OtlpTransport transport) {
  if (!configured.empty()) {
    return configured;
  }

  if (const char* endpoint = std::getenv("OTEL_EXPORTER_OTLP_METRICS_ENDPOINT")) {
    return endpoint;
  }
  if (const char* endpoint = std::getenv("OTEL_EXPORTER_OTLP_ENDPOINT")) {
    return endpoint;
  }

  return transport == OtlpTransport::kHttpProtobuf ? "http://localhost:4318/v1/metrics" : "localhost:4317";
}

} // namespace

struct Metrics::Impl {
  opentelemetry::nostd::shared_ptr<metrics_api::Meter> meter;

  opentelemetry::nostd::unique_ptr<metrics_api::Counter<std::uint64_t>> job_count;
  opentelemetry::nostd::unique_ptr<metrics_api::Histogram<double>>      phase_duration_ms;
  opentelemetry::nostd::unique_ptr<metrics_api::Counter<std::uint64_t>> cache_lookups;
  opentelemetry::nostd::unique_ptr<metrics_api::Counter<std::uint64_t>> trees_detected;
};

bool InitializeMetrics(const lidar::runtime::config::RuntimeConfig& config) {
  const auto& observability = config.observability();
  if (!observability.metrics_enabled()) {
    ShutdownMetrics();
    return false;
  }

  const auto transport =
      observability.transport() == lidar::runtime::config::OTLP_TRANSPORT_HTTP ? OtlpTransport::kHttpProtobuf : OtlpTransport::kGrpc;
  const auto endpoint = ResolveEndpoint(observability.otlp_endpoint(), transport);

  std::unique_ptr<sdkmetrics::PushMetricExporter> exporter;
  if (transport == OtlpTransport::kHttpProtobuf) {
    otlp::OtlpHttpMetricExporterOptions options;
    options.url = endpoint;
    exporter    = otlp::OtlpHttpMetricExporterFactory::Create(options);
  } else {
    otlp::OtlpGrpcMetricExporterOptions options;
    options.endpoint = endpoint;
    exporter         = otlp::OtlpGrpcMetricExporterFactory::Create(options);
  }

  sdkmetrics::PeriodicExportingMetricReaderOptions reader_options;
  reader_options.export_interval_millis =
      std::chrono::milliseconds(observability.metrics_interval_ms() > 0 ? observability.metrics_interval_ms() : 10000);
  reader_options.export_timeout_millis = std::chrono::milliseconds(500);
  auto reader                          = sdkmetrics::PeriodicExportingMetricReaderFactory::Create(std::move(exporter), reader_options);

  const std::string service_name = observability.service_name().empty() ? "lidar-processor" : observability.service_name();
  auto              attrs        = resource::ResourceAttributes{{"service.name", service_name}};
  auto provider = sdkmetrics::MeterProviderFactory::Create(std::make_unique<sdkmetrics::ViewRegistry>(), resource::Resource::Create(attrs));
  provider->AddMetricReader(std::move(reader));

  g_provider = std::shared_ptr<sdkmetrics::MeterProvider>(std::move(provider));
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
  impl_->meter  = provider->GetMeter("lidar-processor", "0.1.0");

  impl_->job_count         = impl_->meter->CreateUInt64Counter("lidar.job.count", "Processing jobs finished, by outcome", "1");
  impl_->phase_duration_ms = impl_->meter->CreateDoubleHistogram("lidar.phase.duration_ms", "Pipeline phase duration", "ms");
  impl_->cache_lookups     = impl_->meter->CreateUInt64Counter("lidar.cache.lookups", "Tile cache lookups, by hit", "1");
  impl_->trees_detected    = impl_->meter->CreateUInt64Counter("lidar.trees.detected", "Trees detected across all jobs", "1");
}

Metrics& Metrics::Instance() {
  static Metrics instance;
  return instance;
}

void Metrics::RecordJobOutcome(bool success) {
  if (!impl_ || !impl_->job_count) {
    return;
  }
  const std::initializer_list<AttributePair> attributes = {{"success", success}};
  impl_->job_count->Add(1, attributes);
}

void Metrics::ObservePhaseDurationMs(std::string_view phase, double duration_ms) {
  if (!impl_ || !impl_->phase_duration_ms) {
    return;
  }
  const std::string                          phase_name(phase);
  const std::initializer_list<AttributePair> attributes = {{"phase", phase_name}};
  impl_->phase_duration_ms->Record(duration_ms, attributes, opentelemetry::context::Context{});
}

void Metrics::RecordCacheLookup(bool hit) {
  if (!impl_ || !impl_->cache_lookups) {
    return;
  }
  const std::initializer_list<AttributePair> attributes = {{"hit", hit}};
  impl_->cache_lookups->Add(1, attributes);
}

void Metrics::RecordTreesDetected(std::uint64_t count) {
  if (!impl_ || !impl_->trees_detected) {
    return;
  }
  impl_->trees_detected->Add(count);
}

} // namespace lidar::observability

#endif
