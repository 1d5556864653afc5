#include "internal/observability/metrics.hpp"

#ifdef ENABLE_OTEL

#include <opentelemetry/common/key_value_iterable_view.h>
#include <opentelemetry/exporters/otlp/otlp_grpc_metric_exporter_factory.h>
#include <opentelemetry/exporters/otlp/otlp_grpc_metric_exporter_options.h>
#include <opentelemetry/metrics/provider.h>
#include <opentelemetry/sdk/metrics/export/periodic_exporting_metric_reader_factory.h>
#include <opentelemetry/sdk/metrics/meter_provider.h>
#include <opentelemetry/sdk/resource/resource.h>

#include <chrono>
#include <cstdlib>
#include <map>
#include <utility>

namespace txcoord::observability {
namespace otlp        = opentelemetry::exporter::otlp;
namespace metrics_api = opentelemetry::metrics;
namespace sdkmetrics  = opentelemetry::sdk::metrics;
namespace resource    = opentelemetry::sdk::resource;

namespace {
std::shared_ptr<sdkmetrics::MeterProvider> g_provider;

std::string ResolveEndpoint(const OtlpConfig& config) {
  if (!config.endpoint.empty()) {
    return config.endpoint;
  }
  if (const char* endpoint = std::getenv("OTEL_EXPORTER_OTLP_METRICS_ENDPOINT")) {
    return endpoint;
  }
  if (const char* endpoint = std::getenv("OTEL_EXPORTER_OTLP_ENDPOINT")) {
    return endpoint;
  }
  return "localhost:4317";
}

using Labels = std::map<std::string, std::string>;

void Add(const opentelemetry::nostd::unique_ptr<metrics_api::Counter<std::uint64_t>>& counter, std::uint64_t value, const Labels& labels) {
  if (!counter || value == 0) return;
  counter->Add(value, opentelemetry::common::KeyValueIterableView<Labels>(labels));
}

} // namespace

struct Metrics::Impl {
  opentelemetry::nostd::shared_ptr<metrics_api::Meter>              meter;
  opentelemetry::nostd::unique_ptr<metrics_api::Counter<std::uint64_t>> xa_operations;
  opentelemetry::nostd::unique_ptr<metrics_api::Counter<std::uint64_t>> retry_attempts;
  opentelemetry::nostd::unique_ptr<metrics_api::Counter<std::uint64_t>> recovery_rolled_back;
  opentelemetry::nostd::unique_ptr<metrics_api::Counter<std::uint64_t>> recovery_failed;
};

bool InitializeMetrics(const OtlpConfig& config) {
  otlp::OtlpGrpcMetricExporterOptions options;
  options.endpoint            = ResolveEndpoint(config);
  options.use_ssl_credentials = !config.insecure;
  auto exporter               = otlp::OtlpGrpcMetricExporterFactory::Create(options);

  sdkmetrics::PeriodicExportingMetricReaderOptions reader_options;
  reader_options.export_interval_millis = std::chrono::milliseconds(1000);
  auto reader = sdkmetrics::PeriodicExportingMetricReaderFactory::Create(std::move(exporter), reader_options);

  resource::ResourceAttributes attrs = {{"service.name", config.service_name}};
  g_provider = std::make_shared<sdkmetrics::MeterProvider>(std::unique_ptr<sdkmetrics::ViewRegistry>(new sdkmetrics::ViewRegistry()),
                                                           resource::Resource::Create(attrs));
  g_provider->AddMetricReader(std::move(reader));

  metrics_api::Provider::SetMeterProvider(opentelemetry::nostd::shared_ptr<metrics_api::MeterProvider>(g_provider));
  return true;
}

void ShutdownMetrics() {
  if (g_provider) {
    g_provider->Shutdown();
    g_provider.reset();
  }
}

Metrics::Metrics() : impl_(std::make_unique<Impl>()) {
  impl_->meter                = metrics_api::Provider::GetMeterProvider()->GetMeter("txcoord");
  impl_->xa_operations        = impl_->meter->CreateUInt64Counter("txcoord.xa.operations");
  impl_->retry_attempts       = impl_->meter->CreateUInt64Counter("txcoord.retry.attempts");
  impl_->recovery_rolled_back = impl_->meter->CreateUInt64Counter("txcoord.recovery.rolled_back");
  impl_->recovery_failed      = impl_->meter->CreateUInt64Counter("txcoord.recovery.failed");
}

Metrics& Metrics::Instance() {
  static Metrics instance;
  return instance;
}

void Metrics::RecordXaOperation(std::string_view participant, std::string_view op, bool success) {
  Add(impl_->xa_operations, 1,
      {{"participant", std::string(participant)}, {"op", std::string(op)}, {"success", success ? "true" : "false"}});
}

void Metrics::RecordRetryAttempt(std::string_view manager, std::string_view outcome) {
  Add(impl_->retry_attempts, 1, {{"manager", std::string(manager)}, {"outcome", std::string(outcome)}});
}

void Metrics::RecordRecoverySweep(std::string_view participant, std::uint64_t rolled_back, std::uint64_t failed) {
  Add(impl_->recovery_rolled_back, rolled_back, {{"participant", std::string(participant)}});
  Add(impl_->recovery_failed, failed, {{"participant", std::string(participant)}});
}

} // namespace txcoord::observability

#endif
