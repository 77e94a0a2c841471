#pragma once

#include <cstdint>
#include <string>

#include "creditgate/v1/types.pb.h"

namespace creditgate::db::model {

/*
  Persistent unlock row. One per source content item.

  IMPORTANT:
  - version is the CAS token; every write bumps it by exactly one.
  - Empty strings and 0 timestamps mean "not set".
  - Money is stored as integer millicredits.
*/

struct UnlockRecord {
  std::string id;
  std::string source_item_id; // unique
  std::string source_page_id;

  creditgate::v1::UnlockStatus status = creditgate::v1::UNLOCK_STATUS_AVAILABLE;

  int64_t estimated_cost_millis = 0;

  std::string reserved_by_user_id;
  int64_t     reservation_expires_at_ms = 0;
  std::string reservation_id;
  std::string reserved_ledger_id;
  int64_t     reserved_amount_millis = 0;

  std::string blueprint_id;
  std::string job_id;

  std::string last_error_code;
  std::string last_error_message;

  int64_t  created_at_ms = 0;
  int64_t  updated_at_ms = 0;
  uint64_t version       = 0;
};

} // namespace creditgate::db::model
