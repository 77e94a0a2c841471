#pragma once

#include <map>
#include <mutex>
#include <unordered_map>
#include <vector>

#include "internal/db/api/repository.hpp"

namespace creditgate::db::memory {

class MemoryTransaction;

class MemoryRepository final : public db::Repository {
public:
  MemoryRepository();

  std::unique_ptr<Transaction> Begin() override;

  Result InsertUnlock(Transaction&, const model::UnlockRecord&) override;
  std::optional<model::UnlockRecord> GetUnlock(Transaction&, const std::string&) override;
  std::optional<model::UnlockRecord> GetUnlockBySourceItem(Transaction&, const std::string&) override;
  Result CompareAndSwapUnlock(Transaction&, model::UnlockRecord&, uint64_t) override;
  std::vector<model::UnlockRecord> ListUnlocksByStatus(Transaction&, creditgate::v1::UnlockStatus, uint32_t) override;
  std::vector<model::UnlockRecord> ListExpiredUnlocks(Transaction&, creditgate::v1::UnlockStatus, int64_t, uint32_t) override;
  uint64_t CountActiveUnlocksForJob(Transaction&, const std::string&) override;

  Result InsertWallet(Transaction&, const model::WalletRecord&) override;
  std::optional<model::WalletRecord> GetWallet(Transaction&, const std::string&) override;
  Result CompareAndSwapWallet(Transaction&, model::WalletRecord&, uint64_t) override;

  Result InsertLedgerEntry(Transaction&, const model::LedgerEntryRecord&) override;
  std::optional<model::LedgerEntryRecord> GetLedgerEntry(Transaction&, const std::string&) override;
  std::optional<model::LedgerEntryRecord> GetLedgerEntryByKey(Transaction&, const std::string&) override;
  std::optional<model::LedgerEntryRecord> GetLedgerResolution(Transaction&, const std::string&) override;
  std::vector<model::LedgerEntryRecord> ListLedgerEntries(Transaction&, const LedgerQuery&) override;

  Result InsertCircuitState(Transaction&, const model::CircuitStateRecord&) override;
  std::optional<model::CircuitStateRecord> GetCircuitState(Transaction&, const std::string&) override;
  Result CompareAndSwapCircuitState(Transaction&, model::CircuitStateRecord&, uint64_t) override;

  Result InsertJob(Transaction&, const model::JobRecord&) override;
  std::optional<model::JobRecord> GetJob(Transaction&, const std::string&) override;
  std::optional<model::JobRecord> GetJobByDedupeKey(Transaction&, const std::string&) override;
  Result CompareAndSwapJob(Transaction&, model::JobRecord&, uint64_t) override;
  std::vector<model::JobRecord> ListClaimableJobs(Transaction&, const std::vector<std::string>&, int64_t, uint32_t) override;
  std::vector<model::JobRecord> ListRunningJobsStartedBefore(Transaction&, const std::string&, int64_t, uint32_t) override;

  std::optional<model::SweepStateRecord> GetSweepState(Transaction&, const std::string&) override;
  Result UpsertSweepState(Transaction&, const model::SweepStateRecord&) override;

private:
  friend class MemoryTransaction;

  struct State {
    std::unordered_map<std::string, model::UnlockRecord> unlocks;
    std::unordered_map<std::string, std::string> unlock_by_source_item;

    std::unordered_map<std::string, model::WalletRecord> wallets;

    std::vector<model::LedgerEntryRecord> ledger; // append order
    std::unordered_map<std::string, std::size_t> ledger_by_id;
    std::unordered_map<std::string, std::size_t> ledger_by_key;
    std::unordered_map<std::string, std::size_t> ledger_by_resolved_hold;

    std::map<std::string, model::CircuitStateRecord> circuits;

    std::unordered_map<std::string, model::JobRecord> jobs;
    std::unordered_map<std::string, std::string> job_by_dedupe_key;

    std::map<std::string, model::SweepStateRecord> sweep_states;
  };

  // Held by each open transaction. Recursive so a thread that opens a
  // second transaction gets a snapshot instead of deadlocking.
  std::recursive_mutex mutex_;
  State committed_;
};

} // namespace creditgate::db::memory
