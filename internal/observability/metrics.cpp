#include "internal/observability/spans.hpp"

#ifdef ENABLE_OTEL

#include <opentelemetry/common/attribute_value.h>
#include <opentelemetry/context/context.h>
#include <opentelemetry/exporters/otlp/otlp_grpc_metric_exporter_factory.h>
#include <opentelemetry/exporters/otlp/otlp_grpc_metric_exporter_options.h>
#include <opentelemetry/metrics/provider.h>
#include <opentelemetry/sdk/metrics/export/periodic_exporting_metric_reader_factory.h>
#include <opentelemetry/sdk/metrics/meter_provider.h>
#include <opentelemetry/sdk/resource/resource.h>

#include <chrono>
#include <memory>
#include <string>
#include <utility>

#include "config/config.pb.h"

namespace creditgate::observability {
namespace otlp        = opentelemetry::exporter::otlp;
namespace metrics_api = opentelemetry::metrics;
namespace sdkmetrics  = opentelemetry::sdk::metrics;
namespace resource    = opentelemetry::sdk::resource;

namespace {
using AttributePair = std::pair<opentelemetry::nostd::string_view, opentelemetry::common::AttributeValue>;
std::shared_ptr<sdkmetrics::MeterProvider> g_provider;

resource::Resource ServiceResource(const creditgate::runtime::config::RuntimeConfig& config) {
  resource::ResourceAttributes attrs = {{"service.name", std::string("creditgate")}, {"service.instance.id", config.worker().worker_id()}};
  return resource::Resource::Create(attrs);
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

} // namespace

struct Metrics::Impl {
  opentelemetry::nostd::shared_ptr<metrics_api::Meter> meter;

  opentelemetry::nostd::shared_ptr<metrics_api::Counter<std::uint64_t>> request_count;
  opentelemetry::nostd::shared_ptr<metrics_api::Histogram<double>>      request_latency_ms;
  opentelemetry::nostd::shared_ptr<metrics_api::Counter<std::uint64_t>> unlock_outcomes;
  opentelemetry::nostd::shared_ptr<metrics_api::Counter<std::uint64_t>> ledger_operations;
  opentelemetry::nostd::shared_ptr<metrics_api::Counter<std::uint64_t>> provider_attempts;
  opentelemetry::nostd::shared_ptr<metrics_api::Counter<std::uint64_t>> sweep_recovered;
  opentelemetry::nostd::shared_ptr<metrics_api::Histogram<double>>      sweep_duration_ms;
};

bool InitializeMetrics(const creditgate::runtime::config::RuntimeConfig& config) {
  ShutdownMetrics();
  const auto& observability = config.observability();
  if (!observability.metrics_enabled()) {
    return false;
  }

  // Default-constructed options already honour OTEL_EXPORTER_OTLP_* from the environment.
  otlp::OtlpGrpcMetricExporterOptions exporter_options;
  if (!observability.otlp_endpoint().empty()) {
    exporter_options.endpoint = observability.otlp_endpoint();
  }

  sdkmetrics::PeriodicExportingMetricReaderOptions reader_options;
  const auto interval_ms               = observability.metrics_export_interval_ms();
  reader_options.export_interval_millis = std::chrono::milliseconds(interval_ms > 0 ? interval_ms : 1000);
  auto reader = sdkmetrics::PeriodicExportingMetricReaderFactory::Create(otlp::OtlpGrpcMetricExporterFactory::Create(exporter_options),
                                                                          reader_options);

  g_provider = std::make_shared<sdkmetrics::MeterProvider>(std::unique_ptr<sdkmetrics::ViewRegistry>(new sdkmetrics::ViewRegistry()),
                                                           ServiceResource(config));
  g_provider->AddMetricReader(std::move(reader));

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
  impl_->meter  = provider->GetMeter("creditgate", "0.1.0");

  impl_->request_count      = impl_->meter->CreateUInt64Counter("creditgate.request.count", "Total number of service requests", "1");
  impl_->request_latency_ms = impl_->meter->CreateDoubleHistogram("creditgate.request.latency_ms", "End-to-end request latency", "ms");
  impl_->unlock_outcomes    = impl_->meter->CreateUInt64Counter("creditgate.unlock.outcome.count", "Unlock request outcomes", "1");
  impl_->ledger_operations  = impl_->meter->CreateUInt64Counter("creditgate.ledger.operation.count", "Ledger hold/settle/refund calls", "1");
  impl_->provider_attempts  = impl_->meter->CreateUInt64Counter("creditgate.provider.attempt.count", "Provider call attempts", "1");
  impl_->sweep_recovered    = impl_->meter->CreateUInt64Counter("creditgate.sweep.recovered.count", "Rows recovered by the sweep", "1");
  impl_->sweep_duration_ms  = impl_->meter->CreateDoubleHistogram("creditgate.sweep.duration_ms", "Reliability sweep run duration", "ms");
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

void Metrics::RecordUnlockOutcome(std::string_view outcome) {
  if (!impl_ || !impl_->unlock_outcomes) {
    return;
  }

  const std::initializer_list<AttributePair> attributes = {{"outcome", std::string(outcome)}};
  AddWithAttributes(impl_->unlock_outcomes, static_cast<std::uint64_t>(1), attributes);
}

void Metrics::RecordLedgerOperation(std::string_view op, std::string_view outcome) {
  if (!impl_ || !impl_->ledger_operations) {
    return;
  }

  const std::initializer_list<AttributePair> attributes = {{"op", std::string(op)}, {"outcome", std::string(outcome)}};
  AddWithAttributes(impl_->ledger_operations, static_cast<std::uint64_t>(1), attributes);
}

void Metrics::RecordProviderAttempt(std::string_view provider_key, bool success) {
  if (!impl_ || !impl_->provider_attempts) {
    return;
  }

  const std::initializer_list<AttributePair> attributes = {{"provider", std::string(provider_key)}, {"success", success}};
  AddWithAttributes(impl_->provider_attempts, static_cast<std::uint64_t>(1), attributes);
}

void Metrics::RecordSweepRecovered(std::string_view kind, std::uint64_t count) {
  if (!impl_ || !impl_->sweep_recovered || count == 0) {
    return;
  }

  const std::initializer_list<AttributePair> attributes = {{"kind", std::string(kind)}};
  AddWithAttributes(impl_->sweep_recovered, count, attributes);
}

void Metrics::ObserveSweepDurationMs(double duration_ms) {
  if (!impl_ || !impl_->sweep_duration_ms) {
    return;
  }

  RecordWithAttributes(impl_->sweep_duration_ms, duration_ms, std::initializer_list<AttributePair>{});
}

} // namespace creditgate::observability

#endif
