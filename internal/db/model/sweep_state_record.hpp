#pragma once

#include <cstdint>
#include <string>

namespace creditgate::db::model {

struct SweepStateRecord {
  std::string name;
  int64_t     last_started_at_ms  = 0;
  int64_t     last_finished_at_ms = 0;
  std::string last_trace_id;
};

} // namespace creditgate::db::model
