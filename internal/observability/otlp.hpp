#pragma once

#include <string>

namespace market::runtime::config {
class ObservabilityConfig;
}

namespace market::observability {

enum class Signal {
  kTraces,
  kMetrics,
};

enum class OtlpTransport {
  kGrpc,
  kHttpProtobuf,
};

// Where one signal is exported to, after config and environment are merged.
struct OtlpTarget {
  std::string   service_name;
  std::string   endpoint;
  OtlpTransport transport = OtlpTransport::kGrpc;
};

/*
  Endpoint precedence:
    1. observability.otlp_endpoint
    2. OTEL_EXPORTER_OTLP_TRACES_ENDPOINT / OTEL_EXPORTER_OTLP_METRICS_ENDPOINT
    3. OTEL_EXPORTER_OTLP_ENDPOINT, with /v1/traces or /v1/metrics appended for HTTP
    4. localhost:4317 (gRPC) or http://localhost:4318/v1/<signal> (HTTP)
*/
OtlpTarget ResolveOtlpTarget(const market::runtime::config::ObservabilityConfig& config, Signal signal);

} // namespace market::observability
