#pragma once

#include <cstdint>
#include <string>

#include "config/config.pb.h"

namespace creditgate::config {

/*
  Effective settings after defaults and clamps are applied to the
  protobuf RuntimeConfig. Zero/unset config values mean "use default".
*/

struct WalletSettings {
  double capacity                  = 10.0;
  double refill_seconds_per_credit = 360.0;
  double initial_balance           = 10.0;
  bool   bypass                    = false;

  double RefillRatePerSecond() const {
    return 1.0 / refill_seconds_per_credit;
  }
};

struct UnlockSettings {
  double   min_cost                  = 0.05;
  double   max_cost                  = 1.0;
  uint32_t reservation_seconds       = 120;
  uint32_t processing_window_seconds = 300;
};

struct CircuitSettings {
  bool     fail_fast_enabled = false;
  uint32_t failure_threshold = 5;
  uint32_t cooldown_seconds  = 60;
};

struct RetrySettings {
  uint32_t max_attempts  = 2;
  uint32_t timeout_ms    = 25000;
  uint32_t base_delay_ms = 250;
  uint32_t jitter_ms     = 200;
};

struct SweepSettings {
  bool     enabled              = true;
  uint32_t batch_size           = 100;
  uint64_t processing_stale_ms  = 10 * 60 * 1000;
  uint64_t min_interval_ms      = 30 * 1000;
  uint64_t schedule_interval_ms = 60 * 1000;
  bool     item_logs            = true; // per-item recovery events
};

struct WorkerSettings {
  bool        enabled             = false;
  std::string worker_id           = "creditgate-worker";
  uint32_t    max_jobs            = 10;
  uint32_t    lease_seconds       = 120;
  uint32_t    poll_interval_ms    = 1000;
  uint32_t    max_attempts        = 3;
  uint32_t    retry_delay_seconds = 30;
  std::string provider_key        = "artifact_generator";
};

struct RuntimeSettings {
  WalletSettings  wallet;
  UnlockSettings  unlock;
  CircuitSettings circuit;
  RetrySettings   retry;
  SweepSettings   sweep;
  WorkerSettings  worker;
};

WalletSettings  ResolveWalletSettings(const creditgate::runtime::config::WalletConfig& config);
UnlockSettings  ResolveUnlockSettings(const creditgate::runtime::config::UnlockConfig& config);
CircuitSettings ResolveCircuitSettings(const creditgate::runtime::config::CircuitConfig& config);
RetrySettings   ResolveRetrySettings(const creditgate::runtime::config::RetryConfig& config);
SweepSettings   ResolveSweepSettings(const creditgate::runtime::config::SweepConfig& config);
WorkerSettings  ResolveWorkerSettings(const creditgate::runtime::config::WorkerConfig& config);

RuntimeSettings ResolveRuntimeSettings(const creditgate::runtime::config::RuntimeConfig& config);

} // namespace creditgate::config
