#include "internal/observability/otlp.hpp"

#include <cstdlib>

#include "config/config.pb.h"

namespace market::observability {

namespace {

constexpr const char* kDefaultServiceName = "affiliate-market";

const char* Env(const char* name) {
  const char* value = std::getenv(name);
  return value && *value ? value : nullptr;
}

const char* SignalPath(Signal signal) {
  return signal == Signal::kTraces ? "/v1/traces" : "/v1/metrics";
}

std::string JoinPath(std::string base, const char* path) {
  while (!base.empty() && base.back() == '/') {
    base.pop_back();
  }
  return base + path;
}

} // namespace

OtlpTarget ResolveOtlpTarget(const market::runtime::config::ObservabilityConfig& config, Signal signal) {
  OtlpTarget target;
  target.transport =
      config.transport() == market::runtime::config::OTLP_TRANSPORT_HTTP ? OtlpTransport::kHttpProtobuf : OtlpTransport::kGrpc;
  const bool http = target.transport == OtlpTransport::kHttpProtobuf;

  if (!config.service_name().empty()) {
    target.service_name = config.service_name();
  } else if (const char* name = Env("OTEL_SERVICE_NAME")) {
    target.service_name = name;
  } else {
    target.service_name = kDefaultServiceName;
  }

  const char* signal_env = signal == Signal::kTraces ? "OTEL_EXPORTER_OTLP_TRACES_ENDPOINT" : "OTEL_EXPORTER_OTLP_METRICS_ENDPOINT";
  if (!config.otlp_endpoint().empty()) {
    target.endpoint = config.otlp_endpoint();
  } else if (const char* endpoint = Env(signal_env)) {
    target.endpoint = endpoint;
  } else if (const char* base = Env("OTEL_EXPORTER_OTLP_ENDPOINT")) {
    target.endpoint = http ? JoinPath(base, SignalPath(signal)) : base;
  } else {
    target.endpoint = http ? JoinPath("http://localhost:4318", SignalPath(signal)) : "localhost:4317";
  }
  return target;
}

} // namespace market::observability
