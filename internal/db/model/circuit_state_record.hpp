#pragma once

#include <cstdint>
#include <string>

#include "creditgate/v1/types.pb.h"

namespace creditgate::db::model {

struct CircuitStateRecord {
  std::string provider_key;

  creditgate::v1::CircuitState state = creditgate::v1::CIRCUIT_STATE_CLOSED;

  int64_t     opened_at_ms      = 0;
  int64_t     cooldown_until_ms = 0;
  uint32_t    failure_count     = 0;
  std::string last_error;
  int64_t     updated_at_ms = 0;
  uint64_t    version       = 0;
};

} // namespace creditgate::db::model
