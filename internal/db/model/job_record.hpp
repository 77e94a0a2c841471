#pragma once

#include <cstdint>
#include <string>

#include "creditgate/v1/types.pb.h"

namespace creditgate::db::model {

/*
  Background job row. Leasing is fenced by version.
*/

struct JobRecord {
  std::string id;
  std::string scope;
  std::string dedupe_key; // unique when set

  creditgate::v1::JobStatus status = creditgate::v1::JOB_STATUS_QUEUED;

  uint32_t attempts     = 0;
  uint32_t max_attempts = 0;

  std::string worker_id;
  int64_t     lease_expires_at_ms = 0;
  int64_t     next_run_at_ms      = 0;
  int64_t     started_at_ms       = 0;
  int64_t     finished_at_ms      = 0;

  std::string error_code;
  std::string error_message;
  std::string trace_id;
  std::string payload_json;

  int64_t  created_at_ms = 0;
  int64_t  updated_at_ms = 0;
  uint64_t version       = 0;
};

} // namespace creditgate::db::model
