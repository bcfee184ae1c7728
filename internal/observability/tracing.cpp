#include "internal/observability/tracing.hpp"

#ifdef ENABLE_OTEL

#include <opentelemetry/exporters/otlp/otlp_grpc_exporter_factory.h>
#include <opentelemetry/exporters/otlp/otlp_grpc_exporter_options.h>
#include <opentelemetry/exporters/otlp/otlp_http_exporter_factory.h>
#include <opentelemetry/exporters/otlp/otlp_http_exporter_options.h>
#include <opentelemetry/sdk/resource/resource.h>
#include <opentelemetry/sdk/trace/batch_span_processor_factory.h>
#include <opentelemetry/sdk/trace/batch_span_processor_options.h>
#include <opentelemetry/sdk/trace/samplers/parent_factory.h>
#include <opentelemetry/sdk/trace/samplers/trace_id_ratio_factory.h>
#include <opentelemetry/sdk/trace/tracer_provider_factory.h>
#include <opentelemetry/trace/noop.h>
#include <opentelemetry/trace/provider.h>

#include <mutex>
#include <string>
#include <utility>

#include "config/config.pb.h"
#include "internal/observability/logging.hpp"
#include "internal/observability/otlp.hpp"

namespace market::observability {
namespace otlp_exporter = opentelemetry::exporter::otlp;
namespace trace_api     = opentelemetry::trace;
namespace sdktrace      = opentelemetry::sdk::trace;
namespace resource      = opentelemetry::sdk::resource;

namespace {

constexpr const char* kInstrumentationName    = "affiliate-market";
constexpr const char* kInstrumentationVersion = "0.1.0";

std::mutex                                g_mutex;
std::shared_ptr<sdktrace::TracerProvider> g_provider;

std::unique_ptr<sdktrace::SpanExporter> MakeExporter(const OtlpTarget& target) {
  if (target.transport == OtlpTransport::kHttpProtobuf) {
    otlp_exporter::OtlpHttpExporterOptions options;
    options.url = target.endpoint;
    return otlp_exporter::OtlpHttpExporterFactory::Create(options);
  }
  otlp_exporter::OtlpGrpcExporterOptions options;
  options.endpoint            = target.endpoint;
  options.use_ssl_credentials = false;
  return otlp_exporter::OtlpGrpcExporterFactory::Create(options);
}

opentelemetry::nostd::shared_ptr<trace_api::Tracer> CurrentTracer() {
  return trace_api::Provider::GetTracerProvider()->GetTracer(kInstrumentationName, kInstrumentationVersion);
}

} // namespace

bool InitializeTracing(const market::runtime::config::RuntimeConfig& config) {
  ShutdownTracing();
  const auto& observability = config.observability();
  if (!observability.tracing_enabled()) {
    return false;
  }

  const auto   target = ResolveOtlpTarget(observability, Signal::kTraces);
  const double ratio  = observability.trace_sample_ratio() > 0.0 ? observability.trace_sample_ratio() : 1.0;

  auto processor = sdktrace::BatchSpanProcessorFactory::Create(MakeExporter(target), sdktrace::BatchSpanProcessorOptions{});
  auto sampler   = sdktrace::ParentBasedSamplerFactory::Create(sdktrace::TraceIdRatioBasedSamplerFactory::Create(ratio));
  auto attrs     = resource::ResourceAttributes{{"service.name", target.service_name}, {"service.version", kInstrumentationVersion}};

  std::shared_ptr<sdktrace::TracerProvider> provider =
      sdktrace::TracerProviderFactory::Create(std::move(processor), resource::Resource::Create(attrs), std::move(sampler));
  {
    std::scoped_lock lock(g_mutex);
    g_provider = provider;
  }
  trace_api::Provider::SetTracerProvider(opentelemetry::nostd::shared_ptr<trace_api::TracerProvider>(provider));

  MARKET_LOG_INFO("tracing enabled", {StringField("endpoint", target.endpoint), StringField("service", target.service_name)});
  return true;
}

void ShutdownTracing() {
  std::shared_ptr<sdktrace::TracerProvider> provider;
  {
    std::scoped_lock lock(g_mutex);
    provider = std::move(g_provider);
  }
  if (!provider) {
    return;
  }
  provider->ForceFlush();
  provider->Shutdown();
  trace_api::Provider::SetTracerProvider(opentelemetry::nostd::shared_ptr<trace_api::TracerProvider>(new trace_api::NoopTracerProvider()));
}

struct SpanScope::Impl {
  opentelemetry::nostd::shared_ptr<trace_api::Span> span;
  trace_api::Scope                                  scope;

  explicit Impl(opentelemetry::nostd::shared_ptr<trace_api::Span> s) : span(s), scope(s) {
  }
};

SpanScope::SpanScope(std::string_view name) : impl_(std::make_unique<Impl>(CurrentTracer()->StartSpan(std::string(name)))) {
}

SpanScope::~SpanScope() {
  impl_->span->End();
}

void SpanScope::SetAttribute(std::string_view key, std::string_view value) {
  impl_->span->SetAttribute(std::string(key), std::string(value));
}

void SpanScope::SetAttribute(std::string_view key, std::int64_t value) {
  impl_->span->SetAttribute(std::string(key), value);
}

void SpanScope::RecordException(std::string_view description) {
  impl_->span->AddEvent("exception", {{"exception.message", std::string(description)}});
  impl_->span->SetStatus(trace_api::StatusCode::kError, std::string(description));
}

} // namespace market::observability

#endif
