#pragma once

#include <cstdint>
#include <string>

#include "creditgate/v1/types.pb.h"

namespace creditgate::db::model {

/*
  Append-only ledger row. Never updated after insert.

  idempotency_key is unique. resolves_ledger_id is unique when set,
  so a hold can be settled or refunded at most once.
*/

struct LedgerEntryRecord {
  std::string id;
  std::string idempotency_key;

  creditgate::v1::LedgerEntryType entry_type = creditgate::v1::LEDGER_ENTRY_TYPE_UNSPECIFIED;

  std::string user_id;
  int64_t     amount_millis        = 0;
  int64_t     delta_millis         = 0; // signed balance movement
  int64_t     balance_after_millis = 0;
  std::string reason_code;
  std::string context_json;
  std::string resolves_ledger_id;
  int64_t     created_at_ms = 0;
};

} // namespace creditgate::db::model
