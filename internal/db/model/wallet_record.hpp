#pragma once

#include <cstdint>
#include <string>

namespace creditgate::db::model {

struct WalletRecord {
  std::string user_id;
  int64_t     balance_millis      = 0;
  int64_t     capacity_millis     = 0;
  double      refill_rate_per_sec = 0.0;
  int64_t     last_refill_at_ms   = 0;
  int64_t     created_at_ms       = 0;
  int64_t     updated_at_ms       = 0;
  uint64_t    version             = 0;
};

} // namespace creditgate::db::model
