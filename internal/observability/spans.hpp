#pragma once

#include <cstdint>
#include <memory>
#include <string_view>

namespace creditgate::runtime::config {
class RuntimeConfig;
}

namespace creditgate::observability {

bool InitializeTracing(const creditgate::runtime::config::RuntimeConfig& config);
bool InitializeMetrics(const creditgate::runtime::config::RuntimeConfig& config);
void ShutdownTracing();
void ShutdownMetrics();

class SpanScope {
 public:
  explicit SpanScope(std::string_view name);
  ~SpanScope();

  SpanScope(const SpanScope&)            = delete;
  SpanScope& operator=(const SpanScope&) = delete;

  SpanScope(SpanScope&&) noexcept;
  SpanScope& operator=(SpanScope&&) noexcept;

  void SetAttribute(std::string_view key, std::string_view value);
  void RecordException(std::string_view description);

 private:
#ifdef ENABLE_OTEL
  struct Impl;
  std::unique_ptr<Impl> impl_;
#endif
};

class Metrics {
 public:
  static Metrics& Instance();

  void RecordRequest(std::string_view route, bool success);
  void ObserveRequestLatencyMs(std::string_view route, double latency_ms);
  void RecordUnlockOutcome(std::string_view outcome);
  void RecordLedgerOperation(std::string_view op, std::string_view outcome);
  void RecordProviderAttempt(std::string_view provider_key, bool success);
  void RecordSweepRecovered(std::string_view kind, std::uint64_t count);
  void ObserveSweepDurationMs(double duration_ms);

 private:
  Metrics();
#ifdef ENABLE_OTEL
  struct Impl;
  std::unique_ptr<Impl> impl_;
#endif
};

#ifndef ENABLE_OTEL
inline bool InitializeTracing(const creditgate::runtime::config::RuntimeConfig&) {
  return false;
}

inline bool InitializeMetrics(const creditgate::runtime::config::RuntimeConfig&) {
  return false;
}

inline void ShutdownTracing() {
}

inline void ShutdownMetrics() {
}

inline SpanScope::SpanScope(std::string_view) {
}

inline SpanScope::~SpanScope() {
}

inline SpanScope::SpanScope(SpanScope&&) noexcept = default;

inline SpanScope& SpanScope::operator=(SpanScope&&) noexcept = default;

inline void SpanScope::SetAttribute(std::string_view, std::string_view) {
}

inline void SpanScope::RecordException(std::string_view) {
}

inline Metrics::Metrics() {
}

inline Metrics& Metrics::Instance() {
  static Metrics instance;
  return instance;
}

inline void Metrics::RecordRequest(std::string_view, bool) {
}

inline void Metrics::ObserveRequestLatencyMs(std::string_view, double) {
}

inline void Metrics::RecordUnlockOutcome(std::string_view) {
}

inline void Metrics::RecordLedgerOperation(std::string_view, std::string_view) {
}

inline void Metrics::RecordProviderAttempt(std::string_view, bool) {
}

inline void Metrics::RecordSweepRecovered(std::string_view, std::uint64_t) {
}

inline void Metrics::ObserveSweepDurationMs(double) {
}
#endif

} // namespace creditgate::observability
