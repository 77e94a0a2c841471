#include "runtime_settings.hpp"

#include <algorithm>

namespace creditgate::config {

namespace {

template <typename T>
T OrDefault(T value, T fallback, T lo, T hi) {
  if (value <= T{}) return fallback;
  return std::clamp(value, lo, hi);
}

} // namespace

WalletSettings ResolveWalletSettings(const creditgate::runtime::config::WalletConfig& config) {
  WalletSettings s;
  s.capacity                  = OrDefault(config.capacity(), 10.0, 1.0, 10000.0);
  s.refill_seconds_per_credit = OrDefault(config.refill_seconds_per_credit(), 360.0, 1.0, 86400.0);
  s.initial_balance           = config.has_initial_balance() ? std::clamp(config.initial_balance(), 0.0, s.capacity) : s.capacity;
  s.bypass                    = config.bypass();
  return s;
}

UnlockSettings ResolveUnlockSettings(const creditgate::runtime::config::UnlockConfig& config) {
  UnlockSettings s;
  s.min_cost = OrDefault(config.min_cost(), 0.05, 0.001, 1000.0);
  s.max_cost = OrDefault(config.max_cost(), 1.0, 0.001, 1000.0);
  if (s.max_cost < s.min_cost) s.max_cost = s.min_cost;

  s.reservation_seconds       = OrDefault<uint32_t>(config.reservation_seconds(), 120, 30, 3600);
  s.processing_window_seconds = OrDefault<uint32_t>(config.processing_window_seconds(), 300, 30, 86400);
  return s;
}

CircuitSettings ResolveCircuitSettings(const creditgate::runtime::config::CircuitConfig& config) {
  CircuitSettings s;
  s.fail_fast_enabled = config.fail_fast_enabled();
  s.failure_threshold = OrDefault<uint32_t>(config.failure_threshold(), 5, 1, 100);
  s.cooldown_seconds  = OrDefault<uint32_t>(config.cooldown_seconds(), 60, 5, 3600);
  return s;
}

RetrySettings ResolveRetrySettings(const creditgate::runtime::config::RetryConfig& config) {
  RetrySettings s;
  s.max_attempts  = OrDefault<uint32_t>(config.max_attempts(), 2, 1, 6);
  s.timeout_ms    = OrDefault<uint32_t>(config.timeout_ms(), 25000, 1000, 180000);
  s.base_delay_ms = OrDefault<uint32_t>(config.base_delay_ms(), 250, 50, 10000);
  s.jitter_ms     = config.has_jitter_ms() ? std::min<uint32_t>(config.jitter_ms(), 5000) : 200;
  return s;
}

SweepSettings ResolveSweepSettings(const creditgate::runtime::config::SweepConfig& config) {
  SweepSettings s;
  s.enabled              = config.has_enabled() ? config.enabled() : true;
  s.batch_size           = OrDefault<uint32_t>(config.batch_size(), 100, 10, 1000);
  s.processing_stale_ms  = OrDefault<uint64_t>(config.processing_stale_ms(), 10 * 60 * 1000, 60 * 1000, 24 * 60 * 60 * 1000);
  s.min_interval_ms      = OrDefault<uint64_t>(config.min_interval_ms(), 30 * 1000, 1000, 10 * 60 * 1000);
  s.schedule_interval_ms = OrDefault<uint64_t>(config.schedule_interval_ms(), 60 * 1000, 1000, 24 * 60 * 60 * 1000);
  s.item_logs            = config.has_item_logs() ? config.item_logs() : true;
  return s;
}

WorkerSettings ResolveWorkerSettings(const creditgate::runtime::config::WorkerConfig& config) {
  WorkerSettings s;
  s.enabled = config.enabled();
  if (!config.worker_id().empty()) s.worker_id = config.worker_id();
  s.max_jobs            = OrDefault<uint32_t>(config.max_jobs(), 10, 1, 200);
  s.lease_seconds       = OrDefault<uint32_t>(config.lease_seconds(), 120, 5, 3600);
  s.poll_interval_ms    = OrDefault<uint32_t>(config.poll_interval_ms(), 1000, 10, 60000);
  s.max_attempts        = OrDefault<uint32_t>(config.max_attempts(), 3, 1, 20);
  s.retry_delay_seconds = OrDefault<uint32_t>(config.retry_delay_seconds(), 30, 1, 3600);
  if (!config.provider_key().empty()) s.provider_key = config.provider_key();
  return s;
}

RuntimeSettings ResolveRuntimeSettings(const creditgate::runtime::config::RuntimeConfig& config) {
  RuntimeSettings s;
  s.wallet  = ResolveWalletSettings(config.wallet());
  s.unlock  = ResolveUnlockSettings(config.unlock());
  s.circuit = ResolveCircuitSettings(config.circuit());
  s.retry   = ResolveRetrySettings(config.retry());
  s.sweep   = ResolveSweepSettings(config.sweep());
  s.worker  = ResolveWorkerSettings(config.worker());
  return s;
}

} // namespace creditgate::config
