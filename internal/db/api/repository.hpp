#pragma once

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "internal/db/api/result.hpp"
#include "internal/db/api/transaction.hpp"
#include "internal/db/model/circuit_state_record.hpp"
#include "internal/db/model/job_record.hpp"
#include "internal/db/model/ledger_entry_record.hpp"
#include "internal/db/model/sweep_state_record.hpp"
#include "internal/db/model/unlock_record.hpp"
#include "internal/db/model/wallet_record.hpp"

namespace creditgate::db {

struct LedgerQuery {
  std::string user_id;      // empty = every user
  int64_t     from_ms = 0;  // inclusive, 0 = unbounded
  int64_t     to_ms   = 0;  // exclusive, 0 = unbounded
  uint32_t    limit   = 1000;
};

/*
  Repository abstraction.

  CRITICAL GUARANTEES:

  - All reads and writes go through a Transaction
  - Reads inside a transaction see its writes
  - CompareAndSwap* writes only when the stored version equals
    expected_version, returning Conflict on a version miss and NotFound
    when the row is gone. On success record.version is expected + 1.
  - Inserts on a taken unique key return AlreadyExists or
    ConstraintViolation (see Result::IsDuplicate). The caller re-reads.

  The DB is the source of truth for:
    unlock reservations
    wallets and the ledger
    provider circuit state
    jobs
    sweep bookkeeping
*/

class Repository {
 public:
  virtual ~Repository() = default;

  // ---------------------------------------------------------------------
  // Transactions
  // ---------------------------------------------------------------------

  virtual std::unique_ptr<Transaction> Begin() = 0;

  // ---------------------------------------------------------------------
  // Unlocks
  // ---------------------------------------------------------------------

  virtual Result InsertUnlock(Transaction&, const model::UnlockRecord&) = 0;

  virtual std::optional<model::UnlockRecord> GetUnlock(Transaction&, const std::string& id) = 0;

  virtual std::optional<model::UnlockRecord> GetUnlockBySourceItem(Transaction&, const std::string& source_item_id) = 0;

  virtual Result CompareAndSwapUnlock(Transaction&, model::UnlockRecord& record, uint64_t expected_version) = 0;

  // Oldest updated_at first.
  virtual std::vector<model::UnlockRecord> ListUnlocksByStatus(Transaction&, creditgate::v1::UnlockStatus status, uint32_t limit) = 0;

  // Rows in `status` whose reservation expiry is set and earlier than now_ms, oldest expiry first.
  virtual std::vector<model::UnlockRecord> ListExpiredUnlocks(Transaction&, creditgate::v1::UnlockStatus status, int64_t now_ms,
                                                              uint32_t limit) = 0;

  // Reserved or processing rows that point at job_id.
  virtual uint64_t CountActiveUnlocksForJob(Transaction&, const std::string& job_id) = 0;

  // ---------------------------------------------------------------------
  // Wallets
  // ---------------------------------------------------------------------

  virtual Result InsertWallet(Transaction&, const model::WalletRecord&) = 0;

  virtual std::optional<model::WalletRecord> GetWallet(Transaction&, const std::string& user_id) = 0;

  virtual Result CompareAndSwapWallet(Transaction&, model::WalletRecord& record, uint64_t expected_version) = 0;

  // ---------------------------------------------------------------------
  // Ledger (append-only)
  // ---------------------------------------------------------------------

  virtual Result InsertLedgerEntry(Transaction&, const model::LedgerEntryRecord&) = 0;

  virtual std::optional<model::LedgerEntryRecord> GetLedgerEntry(Transaction&, const std::string& id) = 0;

  virtual std::optional<model::LedgerEntryRecord> GetLedgerEntryByKey(Transaction&, const std::string& idempotency_key) = 0;

  // The settle or refund entry that resolves a hold, if any.
  virtual std::optional<model::LedgerEntryRecord> GetLedgerResolution(Transaction&, const std::string& hold_ledger_id) = 0;

  // Oldest created_at first.
  virtual std::vector<model::LedgerEntryRecord> ListLedgerEntries(Transaction&, const LedgerQuery& query) = 0;

  // ---------------------------------------------------------------------
  // Provider circuit state
  // ---------------------------------------------------------------------

  virtual Result InsertCircuitState(Transaction&, const model::CircuitStateRecord&) = 0;

  virtual std::optional<model::CircuitStateRecord> GetCircuitState(Transaction&, const std::string& provider_key) = 0;

  virtual Result CompareAndSwapCircuitState(Transaction&, model::CircuitStateRecord& record, uint64_t expected_version) = 0;

  // ---------------------------------------------------------------------
  // Jobs
  // ---------------------------------------------------------------------

  virtual Result InsertJob(Transaction&, const model::JobRecord&) = 0;

  virtual std::optional<model::JobRecord> GetJob(Transaction&, const std::string& id) = 0;

  virtual std::optional<model::JobRecord> GetJobByDedupeKey(Transaction&, const std::string& dedupe_key) = 0;

  virtual Result CompareAndSwapJob(Transaction&, model::JobRecord& record, uint64_t expected_version) = 0;

  // Queued jobs due at now_ms, then running jobs whose lease lapsed. Oldest first.
  virtual std::vector<model::JobRecord> ListClaimableJobs(Transaction&, const std::vector<std::string>& scopes, int64_t now_ms,
                                                          uint32_t limit) = 0;

  virtual std::vector<model::JobRecord> ListRunningJobsStartedBefore(Transaction&, const std::string& scope, int64_t before_ms,
                                                                     uint32_t limit) = 0;

  // ---------------------------------------------------------------------
  // Sweep bookkeeping
  // ---------------------------------------------------------------------

  virtual std::optional<model::SweepStateRecord> GetSweepState(Transaction&, const std::string& name) = 0;

  virtual Result UpsertSweepState(Transaction&, const model::SweepStateRecord&) = 0;
};

} // namespace creditgate::db
