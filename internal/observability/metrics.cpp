#include "internal/observability/metrics.hpp"

#ifdef ENABLE_OTEL

#include <opentelemetry/context/context.h>
#include <opentelemetry/exporters/otlp/otlp_grpc_metric_exporter_factory.h>
#include <opentelemetry/exporters/otlp/otlp_grpc_metric_exporter_options.h>
#include <opentelemetry/exporters/otlp/otlp_http_metric_exporter_factory.h>
#include <opentelemetry/exporters/otlp/otlp_http_metric_exporter_options.h>
#include <opentelemetry/metrics/noop.h>
#include <opentelemetry/metrics/provider.h>
#include <opentelemetry/sdk/metrics/export/periodic_exporting_metric_reader_factory.h>
#include <opentelemetry/sdk/metrics/meter_provider.h>
#include <opentelemetry/sdk/resource/resource.h>

#include <mutex>
#include <utility>

#include "config/config.pb.h"
#include "internal/observability/logging.hpp"
#include "internal/observability/otlp.hpp"

namespace market::observability {
namespace otlp_exporter = opentelemetry::exporter::otlp;
namespace metrics_api   = opentelemetry::metrics;
namespace sdkmetrics    = opentelemetry::sdk::metrics;
namespace resource      = opentelemetry::sdk::resource;

namespace {

using Attribute = std::pair<opentelemetry::nostd::string_view, opentelemetry::common::AttributeValue>;

constexpr const char*   kMeterName             = "affiliate-market";
constexpr const char*   kMeterVersion          = "0.1.0";
constexpr std::uint32_t kDefaultExportInterval = 1000;

std::mutex                                 g_mutex;
std::shared_ptr<sdkmetrics::MeterProvider> g_provider;

std::unique_ptr<sdkmetrics::PushMetricExporter> MakeExporter(const OtlpTarget& target) {
  if (target.transport == OtlpTransport::kHttpProtobuf) {
    otlp_exporter::OtlpHttpMetricExporterOptions options;
    options.url = target.endpoint;
    return otlp_exporter::OtlpHttpMetricExporterFactory::Create(options);
  }
  otlp_exporter::OtlpGrpcMetricExporterOptions options;
  options.endpoint            = target.endpoint;
  options.use_ssl_credentials = false;
  return otlp_exporter::OtlpGrpcMetricExporterFactory::Create(options);
}

} // namespace

// Instruments are bound to whichever provider is global when Instance()
// first runs, so InitializeMetrics must precede the first operation.
struct Metrics::Impl {
  opentelemetry::nostd::shared_ptr<metrics_api::Meter>                  meter;
  opentelemetry::nostd::unique_ptr<metrics_api::Counter<std::uint64_t>> operation_count;
  opentelemetry::nostd::unique_ptr<metrics_api::Histogram<double>>      operation_latency_ms;
  opentelemetry::nostd::unique_ptr<metrics_api::Counter<std::uint64_t>> settled_value;
};

bool InitializeMetrics(const market::runtime::config::RuntimeConfig& config) {
  ShutdownMetrics();
  const auto& observability = config.observability();
  if (!observability.metrics_enabled()) {
    return false;
  }

  const auto target = ResolveOtlpTarget(observability, Signal::kMetrics);

  sdkmetrics::PeriodicExportingMetricReaderOptions reader_options;
  reader_options.export_interval_millis =
      std::chrono::milliseconds(observability.metrics_interval_ms() > 0 ? observability.metrics_interval_ms() : kDefaultExportInterval);
  reader_options.export_timeout_millis = std::chrono::milliseconds(reader_options.export_interval_millis.count() / 2);
  auto reader = sdkmetrics::PeriodicExportingMetricReaderFactory::Create(MakeExporter(target), reader_options);

  auto attrs    = resource::ResourceAttributes{{"service.name", target.service_name}, {"service.version", kMeterVersion}};
  auto provider = std::make_shared<sdkmetrics::MeterProvider>(std::make_unique<sdkmetrics::ViewRegistry>(), resource::Resource::Create(attrs));
  provider->AddMetricReader(std::move(reader));
  {
    std::scoped_lock lock(g_mutex);
    g_provider = provider;
  }
  metrics_api::Provider::SetMeterProvider(opentelemetry::nostd::shared_ptr<metrics_api::MeterProvider>(provider));

  MARKET_LOG_INFO("metrics enabled", {StringField("endpoint", target.endpoint), UIntField("interval_ms", static_cast<std::uint64_t>(reader_options.export_interval_millis.count()))});
  return true;
}

void ShutdownMetrics() {
  std::shared_ptr<sdkmetrics::MeterProvider> provider;
  {
    std::scoped_lock lock(g_mutex);
    provider = std::move(g_provider);
  }
  if (!provider) {
    return;
  }
  provider->ForceFlush();
  provider->Shutdown();
  metrics_api::Provider::SetMeterProvider(opentelemetry::nostd::shared_ptr<metrics_api::MeterProvider>(new metrics_api::NoopMeterProvider()));
}

Metrics::Metrics() : impl_(std::make_unique<Impl>()) {
  impl_->meter = metrics_api::Provider::GetMeterProvider()->GetMeter(kMeterName, kMeterVersion);

  impl_->operation_count      = impl_->meter->CreateUInt64Counter("market.operation.count", "Marketplace operations handled", "1");
  impl_->operation_latency_ms = impl_->meter->CreateDoubleHistogram("market.operation.latency_ms", "Marketplace operation latency", "ms");
  impl_->settled_value        = impl_->meter->CreateUInt64Counter("market.settlement.value", "Units paid out per settlement leg", "1");
}

Metrics& Metrics::Instance() {
  static Metrics instance;
  return instance;
}

void Metrics::RecordOperation(std::string_view operation, bool success, double latency_ms) {
  const std::string name(operation);
  impl_->operation_count->Add(1, {Attribute{"operation", name}, Attribute{"success", success}});
  impl_->operation_latency_ms->Record(latency_ms, {Attribute{"operation", name}}, opentelemetry::context::Context{});
}

void Metrics::AddSettledValue(std::string_view leg, std::uint64_t amount) {
  if (amount == 0) {
    return;
  }
  const std::string name(leg);
  impl_->settled_value->Add(amount, {Attribute{"leg", name}});
}

} // namespace market::observability

#endif
