#include "internal/observability/otlp.hpp"

#include <cassert>
#include <cstdlib>
#include <iostream>

#include "config/config.pb.h"

namespace {

using market::observability::OtlpTransport;
using market::observability::ResolveOtlpTarget;
using market::observability::Signal;
using market::runtime::config::ObservabilityConfig;

void ClearEnvironment() {
  unsetenv("OTEL_SERVICE_NAME");
  unsetenv("OTEL_EXPORTER_OTLP_ENDPOINT");
  unsetenv("OTEL_EXPORTER_OTLP_TRACES_ENDPOINT");
  unsetenv("OTEL_EXPORTER_OTLP_METRICS_ENDPOINT");
}

void TestDefaultsPerTransport() {
  ClearEnvironment();
  ObservabilityConfig config;

  auto grpc = ResolveOtlpTarget(config, Signal::kTraces);
  assert(grpc.transport == OtlpTransport::kGrpc);
  assert(grpc.endpoint == "localhost:4317");
  assert(grpc.service_name == "affiliate-market");

  config.set_transport(market::runtime::config::OTLP_TRANSPORT_HTTP);
  assert(ResolveOtlpTarget(config, Signal::kTraces).endpoint == "http://localhost:4318/v1/traces");
  assert(ResolveOtlpTarget(config, Signal::kMetrics).endpoint == "http://localhost:4318/v1/metrics");
}

void TestConfiguredEndpointWins() {
  ClearEnvironment();
  setenv("OTEL_EXPORTER_OTLP_TRACES_ENDPOINT", "collector:9999", 1);

  ObservabilityConfig config;
  config.set_otlp_endpoint("otel.internal:4317");
  config.set_service_name("market-prod");

  auto target = ResolveOtlpTarget(config, Signal::kTraces);
  assert(target.endpoint == "otel.internal:4317");
  assert(target.service_name == "market-prod");
  ClearEnvironment();
}

void TestSignalEnvironmentBeatsGenericEnvironment() {
  ClearEnvironment();
  setenv("OTEL_EXPORTER_OTLP_ENDPOINT", "http://collector:4318/", 1);
  setenv("OTEL_EXPORTER_OTLP_METRICS_ENDPOINT", "http://metrics:4318/custom", 1);
  setenv("OTEL_SERVICE_NAME", "from-env", 1);

  ObservabilityConfig config;
  config.set_transport(market::runtime::config::OTLP_TRANSPORT_HTTP);

  assert(ResolveOtlpTarget(config, Signal::kMetrics).endpoint == "http://metrics:4318/custom");

  // The generic endpoint is a base URL for HTTP, so the signal path is appended.
  auto traces = ResolveOtlpTarget(config, Signal::kTraces);
  assert(traces.endpoint == "http://collector:4318/v1/traces");
  assert(traces.service_name == "from-env");

  config.set_transport(market::runtime::config::OTLP_TRANSPORT_GRPC);
  assert(ResolveOtlpTarget(config, Signal::kTraces).endpoint == "http://collector:4318/");
  ClearEnvironment();
}

} // namespace

int main() {
  TestDefaultsPerTransport();
  TestConfiguredEndpointWins();
  TestSignalEnvironmentBeatsGenericEnvironment();

  std::cout << "affiliate_market_unit_otlp_target: pass\n";
  return 0;
}
