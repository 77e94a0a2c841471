#include "memory_repository.hpp"

#include <algorithm>

#include "memory_tx.hpp"

namespace creditgate::db::memory {

using creditgate::v1::JOB_STATUS_QUEUED;
using creditgate::v1::JOB_STATUS_RUNNING;
using creditgate::v1::UNLOCK_STATUS_PROCESSING;
using creditgate::v1::UNLOCK_STATUS_RESERVED;

namespace {

template <typename Record, typename Less>
std::vector<Record> SortAndLimit(std::vector<Record> records, Less less, uint32_t limit) {
  std::stable_sort(records.begin(), records.end(), less);
  if (records.size() > limit) records.resize(limit);
  return records;
}

} // namespace

MemoryRepository::MemoryRepository() = default;

std::unique_ptr<db::Transaction> MemoryRepository::Begin() {
  return std::make_unique<MemoryTransaction>(*this);
}

static MemoryTransaction& TX(db::Transaction& tx) {
  return static_cast<MemoryTransaction&>(tx);
}

// ------------------------------------------------------------------
// Unlocks
// ------------------------------------------------------------------

Result MemoryRepository::InsertUnlock(Transaction& t, const model::UnlockRecord& r) {
  auto& s = TX(t).Mutable();
  if (s.unlocks.contains(r.id) || s.unlock_by_source_item.contains(r.source_item_id)) {
    return Result::Err(ErrorCode::AlreadyExists, "unlock exists for source item " + r.source_item_id);
  }
  s.unlocks[r.id]                         = r;
  s.unlock_by_source_item[r.source_item_id] = r.id;
  return Result::Ok();
}

std::optional<model::UnlockRecord> MemoryRepository::GetUnlock(Transaction& t, const std::string& id) {
  const auto& s  = TX(t).View();
  auto        it = s.unlocks.find(id);
  if (it == s.unlocks.end()) return std::nullopt;
  return it->second;
}

std::optional<model::UnlockRecord> MemoryRepository::GetUnlockBySourceItem(Transaction& t, const std::string& source_item_id) {
  const auto& s  = TX(t).View();
  auto        it = s.unlock_by_source_item.find(source_item_id);
  if (it == s.unlock_by_source_item.end()) return std::nullopt;
  return GetUnlock(t, it->second);
}

Result MemoryRepository::CompareAndSwapUnlock(Transaction& t, model::UnlockRecord& r, uint64_t expected_version) {
  auto& s  = TX(t).Mutable();
  auto  it = s.unlocks.find(r.id);
  if (it == s.unlocks.end()) return Result::Err(ErrorCode::NotFound, r.id);
  if (it->second.version != expected_version) return Result::Err(ErrorCode::Conflict, r.id);

  r.version          = expected_version + 1;
  r.source_item_id   = it->second.source_item_id;
  r.created_at_ms    = it->second.created_at_ms;
  it->second         = r;
  return Result::Ok();
}

std::vector<model::UnlockRecord> MemoryRepository::ListUnlocksByStatus(Transaction& t, creditgate::v1::UnlockStatus status, uint32_t limit) {
  std::vector<model::UnlockRecord> out;
  for (const auto& [_, record] : TX(t).View().unlocks) {
    if (record.status == status) out.push_back(record);
  }
  return SortAndLimit(
      std::move(out), [](const auto& a, const auto& b) { return a.updated_at_ms < b.updated_at_ms; }, limit);
}

std::vector<model::UnlockRecord> MemoryRepository::ListExpiredUnlocks(Transaction& t, creditgate::v1::UnlockStatus status, int64_t now_ms,
                                                                      uint32_t limit) {
  std::vector<model::UnlockRecord> out;
  for (const auto& [_, record] : TX(t).View().unlocks) {
    if (record.status == status && record.reservation_expires_at_ms != 0 && record.reservation_expires_at_ms < now_ms) {
      out.push_back(record);
    }
  }
  return SortAndLimit(
      std::move(out), [](const auto& a, const auto& b) { return a.reservation_expires_at_ms < b.reservation_expires_at_ms; }, limit);
}

uint64_t MemoryRepository::CountActiveUnlocksForJob(Transaction& t, const std::string& job_id) {
  uint64_t count = 0;
  for (const auto& [_, record] : TX(t).View().unlocks) {
    if (record.job_id == job_id && (record.status == UNLOCK_STATUS_RESERVED || record.status == UNLOCK_STATUS_PROCESSING)) {
      ++count;
    }
  }
  return count;
}

// ------------------------------------------------------------------
// Wallets
// ------------------------------------------------------------------

Result MemoryRepository::InsertWallet(Transaction& t, const model::WalletRecord& r) {
  auto& s = TX(t).Mutable();
  if (s.wallets.contains(r.user_id)) return Result::Err(ErrorCode::AlreadyExists, r.user_id);
  s.wallets[r.user_id] = r;
  return Result::Ok();
}

std::optional<model::WalletRecord> MemoryRepository::GetWallet(Transaction& t, const std::string& user_id) {
  const auto& s  = TX(t).View();
  auto        it = s.wallets.find(user_id);
  if (it == s.wallets.end()) return std::nullopt;
  return it->second;
}

Result MemoryRepository::CompareAndSwapWallet(Transaction& t, model::WalletRecord& r, uint64_t expected_version) {
  auto& s  = TX(t).Mutable();
  auto  it = s.wallets.find(r.user_id);
  if (it == s.wallets.end()) return Result::Err(ErrorCode::NotFound, r.user_id);
  if (it->second.version != expected_version) return Result::Err(ErrorCode::Conflict, r.user_id);

  r.version       = expected_version + 1;
  r.created_at_ms = it->second.created_at_ms;
  it->second      = r;
  return Result::Ok();
}

// ------------------------------------------------------------------
// Ledger
// ------------------------------------------------------------------

Result MemoryRepository::InsertLedgerEntry(Transaction& t, const model::LedgerEntryRecord& r) {
  auto& s = TX(t).Mutable();
  if (s.ledger_by_key.contains(r.idempotency_key)) {
    return Result::Err(ErrorCode::ConstraintViolation, "duplicate idempotency key " + r.idempotency_key);
  }
  if (s.ledger_by_id.contains(r.id)) {
    return Result::Err(ErrorCode::ConstraintViolation, "duplicate ledger id " + r.id);
  }
  if (!r.resolves_ledger_id.empty() && s.ledger_by_resolved_hold.contains(r.resolves_ledger_id)) {
    return Result::Err(ErrorCode::ConstraintViolation, "hold already resolved " + r.resolves_ledger_id);
  }

  const auto index = s.ledger.size();
  s.ledger.push_back(r);
  s.ledger_by_id[r.id]               = index;
  s.ledger_by_key[r.idempotency_key] = index;
  if (!r.resolves_ledger_id.empty()) s.ledger_by_resolved_hold[r.resolves_ledger_id] = index;
  return Result::Ok();
}

std::optional<model::LedgerEntryRecord> MemoryRepository::GetLedgerEntry(Transaction& t, const std::string& id) {
  const auto& s  = TX(t).View();
  auto        it = s.ledger_by_id.find(id);
  if (it == s.ledger_by_id.end()) return std::nullopt;
  return s.ledger[it->second];
}

std::optional<model::LedgerEntryRecord> MemoryRepository::GetLedgerEntryByKey(Transaction& t, const std::string& idempotency_key) {
  const auto& s  = TX(t).View();
  auto        it = s.ledger_by_key.find(idempotency_key);
  if (it == s.ledger_by_key.end()) return std::nullopt;
  return s.ledger[it->second];
}

std::optional<model::LedgerEntryRecord> MemoryRepository::GetLedgerResolution(Transaction& t, const std::string& hold_ledger_id) {
  const auto& s  = TX(t).View();
  auto        it = s.ledger_by_resolved_hold.find(hold_ledger_id);
  if (it == s.ledger_by_resolved_hold.end()) return std::nullopt;
  return s.ledger[it->second];
}

std::vector<model::LedgerEntryRecord> MemoryRepository::ListLedgerEntries(Transaction& t, const LedgerQuery& q) {
  std::vector<model::LedgerEntryRecord> out;
  for (const auto& e : TX(t).View().ledger) {
    if (!q.user_id.empty() && e.user_id != q.user_id) continue;
    if (q.from_ms != 0 && e.created_at_ms < q.from_ms) continue;
    if (q.to_ms != 0 && e.created_at_ms >= q.to_ms) continue;
    out.push_back(e);
  }
  return SortAndLimit(
      std::move(out), [](const auto& a, const auto& b) { return a.created_at_ms < b.created_at_ms; }, q.limit);
}

// ------------------------------------------------------------------
// Circuit state
// ------------------------------------------------------------------

Result MemoryRepository::InsertCircuitState(Transaction& t, const model::CircuitStateRecord& r) {
  auto& s = TX(t).Mutable();
  if (s.circuits.contains(r.provider_key)) return Result::Err(ErrorCode::AlreadyExists, r.provider_key);
  s.circuits[r.provider_key] = r;
  return Result::Ok();
}

std::optional<model::CircuitStateRecord> MemoryRepository::GetCircuitState(Transaction& t, const std::string& provider_key) {
  const auto& s  = TX(t).View();
  auto        it = s.circuits.find(provider_key);
  if (it == s.circuits.end()) return std::nullopt;
  return it->second;
}

Result MemoryRepository::CompareAndSwapCircuitState(Transaction& t, model::CircuitStateRecord& r, uint64_t expected_version) {
  auto& s  = TX(t).Mutable();
  auto  it = s.circuits.find(r.provider_key);
  if (it == s.circuits.end()) return Result::Err(ErrorCode::NotFound, r.provider_key);
  if (it->second.version != expected_version) return Result::Err(ErrorCode::Conflict, r.provider_key);

  r.version  = expected_version + 1;
  it->second = r;
  return Result::Ok();
}

// ------------------------------------------------------------------
// Jobs
// ------------------------------------------------------------------

Result MemoryRepository::InsertJob(Transaction& t, const model::JobRecord& r) {
  auto& s = TX(t).Mutable();
  if (s.jobs.contains(r.id)) return Result::Err(ErrorCode::AlreadyExists, r.id);
  if (!r.dedupe_key.empty() && s.job_by_dedupe_key.contains(r.dedupe_key)) {
    return Result::Err(ErrorCode::ConstraintViolation, "duplicate job dedupe key " + r.dedupe_key);
  }
  s.jobs[r.id] = r;
  if (!r.dedupe_key.empty()) s.job_by_dedupe_key[r.dedupe_key] = r.id;
  return Result::Ok();
}

std::optional<model::JobRecord> MemoryRepository::GetJob(Transaction& t, const std::string& id) {
  const auto& s  = TX(t).View();
  auto        it = s.jobs.find(id);
  if (it == s.jobs.end()) return std::nullopt;
  return it->second;
}

std::optional<model::JobRecord> MemoryRepository::GetJobByDedupeKey(Transaction& t, const std::string& dedupe_key) {
  const auto& s  = TX(t).View();
  auto        it = s.job_by_dedupe_key.find(dedupe_key);
  if (it == s.job_by_dedupe_key.end()) return std::nullopt;
  return GetJob(t, it->second);
}

Result MemoryRepository::CompareAndSwapJob(Transaction& t, model::JobRecord& r, uint64_t expected_version) {
  auto& s  = TX(t).Mutable();
  auto  it = s.jobs.find(r.id);
  if (it == s.jobs.end()) return Result::Err(ErrorCode::NotFound, r.id);
  if (it->second.version != expected_version) return Result::Err(ErrorCode::Conflict, r.id);

  r.version       = expected_version + 1;
  r.dedupe_key    = it->second.dedupe_key;
  r.created_at_ms = it->second.created_at_ms;
  it->second      = r;
  return Result::Ok();
}

std::vector<model::JobRecord> MemoryRepository::ListClaimableJobs(Transaction& t, const std::vector<std::string>& scopes, int64_t now_ms,
                                                                  uint32_t limit) {
  std::vector<model::JobRecord> out;
  for (const auto& [_, job] : TX(t).View().jobs) {
    if (std::find(scopes.begin(), scopes.end(), job.scope) == scopes.end()) continue;
    const bool due_queued   = job.status == JOB_STATUS_QUEUED && job.next_run_at_ms <= now_ms;
    const bool lapsed_lease = job.status == JOB_STATUS_RUNNING && job.lease_expires_at_ms != 0 && job.lease_expires_at_ms < now_ms;
    if (due_queued || lapsed_lease) out.push_back(job);
  }
  return SortAndLimit(
      std::move(out),
      [](const auto& a, const auto& b) {
        if (a.next_run_at_ms != b.next_run_at_ms) return a.next_run_at_ms < b.next_run_at_ms;
        return a.created_at_ms < b.created_at_ms;
      },
      limit);
}

std::vector<model::JobRecord> MemoryRepository::ListRunningJobsStartedBefore(Transaction& t, const std::string& scope, int64_t before_ms,
                                                                             uint32_t limit) {
  std::vector<model::JobRecord> out;
  for (const auto& [_, job] : TX(t).View().jobs) {
    if (job.scope == scope && job.status == JOB_STATUS_RUNNING && job.started_at_ms != 0 && job.started_at_ms < before_ms) {
      out.push_back(job);
    }
  }
  return SortAndLimit(
      std::move(out), [](const auto& a, const auto& b) { return a.started_at_ms < b.started_at_ms; }, limit);
}

// ------------------------------------------------------------------
// Sweep bookkeeping
// ------------------------------------------------------------------

std::optional<model::SweepStateRecord> MemoryRepository::GetSweepState(Transaction& t, const std::string& name) {
  const auto& s  = TX(t).View();
  auto        it = s.sweep_states.find(name);
  if (it == s.sweep_states.end()) return std::nullopt;
  return it->second;
}

Result MemoryRepository::UpsertSweepState(Transaction& t, const model::SweepStateRecord& r) {
  TX(t).Mutable().sweep_states[r.name] = r;
  return Result::Ok();
}

} // namespace creditgate::db::memory
