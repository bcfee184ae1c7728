#pragma once

#include <chrono>
#include <cstdint>
#include <memory>
#include <string>
#include <string_view>

namespace market::runtime::config {
class RuntimeConfig;
}

namespace market::observability {

// Returns false when metrics are disabled in config or compiled out.
bool InitializeMetrics(const market::runtime::config::RuntimeConfig& config);
void ShutdownMetrics();

/*
  Instruments:
    market.operation.count       {operation, success}
    market.operation.latency_ms  {operation}
    market.settlement.value      {leg}   leg is fee, publisher or producer
*/
class Metrics {
 public:
  static Metrics& Instance();

  void RecordOperation(std::string_view operation, bool success, double latency_ms);
  void AddSettledValue(std::string_view leg, std::uint64_t amount);

 private:
  Metrics();
#ifdef ENABLE_OTEL
  struct Impl;
  std::unique_ptr<Impl> impl_;
#endif
};

// Records one operation when destroyed; counted as failed unless
// Succeed() was called first.
class OperationTimer {
 public:
  explicit OperationTimer(std::string_view operation) : operation_(operation), started_at_(std::chrono::steady_clock::now()) {
  }

  ~OperationTimer() {
    const std::chrono::duration<double, std::milli> elapsed = std::chrono::steady_clock::now() - started_at_;
    Metrics::Instance().RecordOperation(operation_, succeeded_, elapsed.count());
  }

  OperationTimer(const OperationTimer&)            = delete;
  OperationTimer& operator=(const OperationTimer&) = delete;

  void Succeed() {
    succeeded_ = true;
  }

 private:
  std::string                           operation_;
  std::chrono::steady_clock::time_point started_at_;
  bool                                  succeeded_ = false;
};

#ifndef ENABLE_OTEL
inline bool InitializeMetrics(const market::runtime::config::RuntimeConfig&) {
  return false;
}

inline void ShutdownMetrics() {
}

inline Metrics::Metrics() {
}

inline Metrics& Metrics::Instance() {
  static Metrics instance;
  return instance;
}

inline void Metrics::RecordOperation(std::string_view, bool, double) {
}

inline void Metrics::AddSettledValue(std::string_view, std::uint64_t) {
}
#endif

} // namespace market::observability
