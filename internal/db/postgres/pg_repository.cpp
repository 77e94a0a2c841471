#include "pg_repository.hpp"

#include <optional>
#include <string>

namespace creditgate::db::postgres {

namespace {

constexpr const char* kUnlockColumns =
    "id,source_item_id,source_page_id,status,estimated_cost_millis,reserved_by_user_id,reservation_expires_at_ms,reservation_id,"
    "reserved_ledger_id,reserved_amount_millis,blueprint_id,job_id,last_error_code,last_error_message,created_at_ms,updated_at_ms,version";

constexpr const char* kLedgerColumns =
    "id,idempotency_key,entry_type,user_id,amount_millis,delta_millis,balance_after_millis,reason_code,context_json,resolves_ledger_id,"
    "created_at_ms";

constexpr const char* kJobColumns =
    "id,scope,dedupe_key,status,attempts,max_attempts,worker_id,lease_expires_at_ms,next_run_at_ms,started_at_ms,finished_at_ms,error_code,"
    "error_message,trace_id,payload_json,created_at_ms,updated_at_ms,version";

Result Translate(const std::exception& e) {
  if (dynamic_cast<const pqxx::unique_violation*>(&e)) return Result::Err(ErrorCode::ConstraintViolation, e.what());
  if (dynamic_cast<const pqxx::integrity_constraint_violation*>(&e)) return Result::Err(ErrorCode::ConstraintViolation, e.what());
  if (dynamic_cast<const pqxx::serialization_failure*>(&e)) return Result::Err(ErrorCode::SerializationFailure, e.what());
  if (dynamic_cast<const pqxx::deadlock_detected*>(&e)) return Result::Err(ErrorCode::Busy, e.what());
  if (dynamic_cast<const pqxx::broken_connection*>(&e)) return Result::Err(ErrorCode::IOError, e.what());
  return Result::Err(ErrorCode::InternalError, e.what());
}

std::optional<std::string> NullIfEmpty(const std::string& s) {
  if (s.empty()) return std::nullopt;
  return s;
}

std::optional<int64_t> NullIfZero(int64_t v) {
  if (v == 0) return std::nullopt;
  return v;
}

std::string Text(const pqxx::field& f) {
  return f.is_null() ? "" : f.c_str();
}

int64_t I64(const pqxx::field& f) {
  return f.is_null() ? 0 : f.as<int64_t>();
}

model::UnlockRecord ReadUnlock(const pqxx::row& row) {
  model::UnlockRecord r;
  r.id                        = Text(row[0]);
  r.source_item_id            = Text(row[1]);
  r.source_page_id            = Text(row[2]);
  r.status                    = static_cast<creditgate::v1::UnlockStatus>(row[3].as<int>());
  r.estimated_cost_millis     = I64(row[4]);
  r.reserved_by_user_id       = Text(row[5]);
  r.reservation_expires_at_ms = I64(row[6]);
  r.reservation_id            = Text(row[7]);
  r.reserved_ledger_id        = Text(row[8]);
  r.reserved_amount_millis    = I64(row[9]);
  r.blueprint_id              = Text(row[10]);
  r.job_id                    = Text(row[11]);
  r.last_error_code           = Text(row[12]);
  r.last_error_message        = Text(row[13]);
  r.created_at_ms             = I64(row[14]);
  r.updated_at_ms             = I64(row[15]);
  r.version                   = row[16].as<uint64_t>();
  return r;
}

model::WalletRecord ReadWallet(const pqxx::row& row) {
  model::WalletRecord r;
  r.user_id             = Text(row[0]);
  r.balance_millis      = I64(row[1]);
  r.capacity_millis     = I64(row[2]);
  r.refill_rate_per_sec = row[3].as<double>();
  r.last_refill_at_ms   = I64(row[4]);
  r.created_at_ms       = I64(row[5]);
  r.updated_at_ms       = I64(row[6]);
  r.version             = row[7].as<uint64_t>();
  return r;
}

model::LedgerEntryRecord ReadLedgerEntry(const pqxx::row& row) {
  model::LedgerEntryRecord r;
  r.id                   = Text(row[0]);
  r.idempotency_key      = Text(row[1]);
  r.entry_type           = static_cast<creditgate::v1::LedgerEntryType>(row[2].as<int>());
  r.user_id              = Text(row[3]);
  r.amount_millis        = I64(row[4]);
  r.delta_millis         = I64(row[5]);
  r.balance_after_millis = I64(row[6]);
  r.reason_code          = Text(row[7]);
  r.context_json         = Text(row[8]);
  r.resolves_ledger_id   = Text(row[9]);
  r.created_at_ms        = I64(row[10]);
  return r;
}

model::CircuitStateRecord ReadCircuit(const pqxx::row& row) {
  model::CircuitStateRecord r;
  r.provider_key      = Text(row[0]);
  r.state             = static_cast<creditgate::v1::CircuitState>(row[1].as<int>());
  r.opened_at_ms      = I64(row[2]);
  r.cooldown_until_ms = I64(row[3]);
  r.failure_count     = row[4].as<uint32_t>();
  r.last_error        = Text(row[5]);
  r.updated_at_ms     = I64(row[6]);
  r.version           = row[7].as<uint64_t>();
  return r;
}

model::JobRecord ReadJob(const pqxx::row& row) {
  model::JobRecord r;
  r.id                  = Text(row[0]);
  r.scope               = Text(row[1]);
  r.dedupe_key          = Text(row[2]);
  r.status              = static_cast<creditgate::v1::JobStatus>(row[3].as<int>());
  r.attempts            = row[4].as<uint32_t>();
  r.max_attempts        = row[5].as<uint32_t>();
  r.worker_id           = Text(row[6]);
  r.lease_expires_at_ms = I64(row[7]);
  r.next_run_at_ms      = I64(row[8]);
  r.started_at_ms       = I64(row[9]);
  r.finished_at_ms      = I64(row[10]);
  r.error_code          = Text(row[11]);
  r.error_message       = Text(row[12]);
  r.trace_id            = Text(row[13]);
  r.payload_json        = Text(row[14]);
  r.created_at_ms       = I64(row[15]);
  r.updated_at_ms       = I64(row[16]);
  r.version             = row[17].as<uint64_t>();
  return r;
}

template <typename Read>
auto ReadAll(const pqxx::result& res, Read read) {
  std::vector<decltype(read(res[0]))> out;
  out.reserve(res.size());
  for (const auto& row : res) out.push_back(read(row));
  return out;
}

// An UPDATE guarded by version matched nothing: tell a vanished row from a moved version.
Result MissedCas(pqxx::work& w, const std::string& table, const std::string& key_column, const std::string& key) {
  auto res = w.exec_params("SELECT 1 FROM " + table + " WHERE " + key_column + "=$1;", key);
  if (res.empty()) return Result::Err(ErrorCode::NotFound, key);
  return Result::Err(ErrorCode::Conflict, key);
}

} // namespace

PgRepository::PgRepository(std::shared_ptr<PgPool> pool) : pool_(std::move(pool)) {
}

std::unique_ptr<db::Transaction> PgRepository::Begin() {
  return std::make_unique<PgTransaction>(pool_);
}

PgTransaction& PgRepository::TX(Transaction& t) {
  return static_cast<PgTransaction&>(t);
}

// ------------------------------------------------------------------
// Unlocks
// ------------------------------------------------------------------

Result PgRepository::InsertUnlock(Transaction& t, const model::UnlockRecord& r) {
  try {
    TX(t).Work().exec_params(std::string("INSERT INTO unlocks(") + kUnlockColumns +
                                 ") VALUES($1,$2,$3,$4,$5,$6,$7,$8,$9,$10,$11,$12,$13,$14,$15,$16,$17);",
                             r.id, r.source_item_id, NullIfEmpty(r.source_page_id), static_cast<int>(r.status), r.estimated_cost_millis,
                             NullIfEmpty(r.reserved_by_user_id), NullIfZero(r.reservation_expires_at_ms), NullIfEmpty(r.reservation_id),
                             NullIfEmpty(r.reserved_ledger_id), r.reserved_amount_millis, NullIfEmpty(r.blueprint_id), NullIfEmpty(r.job_id),
                             NullIfEmpty(r.last_error_code), NullIfEmpty(r.last_error_message), r.created_at_ms, r.updated_at_ms,
                             static_cast<int64_t>(r.version));
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

std::optional<model::UnlockRecord> PgRepository::GetUnlock(Transaction& t, const std::string& id) {
  auto res = TX(t).Work().exec_prepared("get_unlock", id);
  if (res.empty()) return std::nullopt;
  return ReadUnlock(res[0]);
}

std::optional<model::UnlockRecord> PgRepository::GetUnlockBySourceItem(Transaction& t, const std::string& source_item_id) {
  auto res = TX(t).Work().exec_params(std::string("SELECT ") + kUnlockColumns + " FROM unlocks WHERE source_item_id=$1;", source_item_id);
  if (res.empty()) return std::nullopt;
  return ReadUnlock(res[0]);
}

Result PgRepository::CompareAndSwapUnlock(Transaction& t, model::UnlockRecord& r, uint64_t expected_version) {
  const uint64_t next_version = expected_version + 1;
  try {
    auto& w   = TX(t).Work();
    auto  res = w.exec_params(
        "UPDATE unlocks SET source_page_id=$2,status=$3,estimated_cost_millis=$4,reserved_by_user_id=$5,reservation_expires_at_ms=$6,"
         "reservation_id=$7,reserved_ledger_id=$8,reserved_amount_millis=$9,blueprint_id=$10,job_id=$11,last_error_code=$12,"
         "last_error_message=$13,updated_at_ms=$14,version=$15 WHERE id=$1 AND version=$16;",
        r.id, NullIfEmpty(r.source_page_id), static_cast<int>(r.status), r.estimated_cost_millis, NullIfEmpty(r.reserved_by_user_id),
        NullIfZero(r.reservation_expires_at_ms), NullIfEmpty(r.reservation_id), NullIfEmpty(r.reserved_ledger_id), r.reserved_amount_millis,
        NullIfEmpty(r.blueprint_id), NullIfEmpty(r.job_id), NullIfEmpty(r.last_error_code), NullIfEmpty(r.last_error_message),
        r.updated_at_ms, static_cast<int64_t>(next_version), static_cast<int64_t>(expected_version));
    if (res.affected_rows() == 0) return MissedCas(w, "unlocks", "id", r.id);
    r.version = next_version;
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

std::vector<model::UnlockRecord> PgRepository::ListUnlocksByStatus(Transaction& t, creditgate::v1::UnlockStatus status, uint32_t limit) {
  auto res = TX(t).Work().exec_params(std::string("SELECT ") + kUnlockColumns + " FROM unlocks WHERE status=$1 ORDER BY updated_at_ms ASC LIMIT $2;",
                                      static_cast<int>(status), static_cast<int64_t>(limit));
  return ReadAll(res, ReadUnlock);
}

std::vector<model::UnlockRecord> PgRepository::ListExpiredUnlocks(Transaction& t, creditgate::v1::UnlockStatus status, int64_t now_ms,
                                                                  uint32_t limit) {
  auto res = TX(t).Work().exec_params(std::string("SELECT ") + kUnlockColumns +
                                          " FROM unlocks WHERE status=$1 AND reservation_expires_at_ms IS NOT NULL AND "
                                          "reservation_expires_at_ms<$2 ORDER BY reservation_expires_at_ms ASC LIMIT $3;",
                                      static_cast<int>(status), now_ms, static_cast<int64_t>(limit));
  return ReadAll(res, ReadUnlock);
}

uint64_t PgRepository::CountActiveUnlocksForJob(Transaction& t, const std::string& job_id) {
  auto res = TX(t).Work().exec_params("SELECT COUNT(*) FROM unlocks WHERE job_id=$1 AND status IN ($2,$3);", job_id,
                                      static_cast<int>(creditgate::v1::UNLOCK_STATUS_RESERVED),
                                      static_cast<int>(creditgate::v1::UNLOCK_STATUS_PROCESSING));
  return res[0][0].as<uint64_t>();
}

// ------------------------------------------------------------------
// Wallets
// ------------------------------------------------------------------

Result PgRepository::InsertWallet(Transaction& t, const model::WalletRecord& r) {
  try {
    TX(t).Work().exec_params(
        "INSERT INTO wallets(user_id,balance_millis,capacity_millis,refill_rate_per_sec,last_refill_at_ms,created_at_ms,updated_at_ms,version) "
        "VALUES($1,$2,$3,$4,$5,$6,$7,$8);",
        r.user_id, r.balance_millis, r.capacity_millis, r.refill_rate_per_sec, r.last_refill_at_ms, r.created_at_ms, r.updated_at_ms,
        static_cast<int64_t>(r.version));
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

std::optional<model::WalletRecord> PgRepository::GetWallet(Transaction& t, const std::string& user_id) {
  auto res = TX(t).Work().exec_prepared("get_wallet", user_id);
  if (res.empty()) return std::nullopt;
  return ReadWallet(res[0]);
}

Result PgRepository::CompareAndSwapWallet(Transaction& t, model::WalletRecord& r, uint64_t expected_version) {
  const uint64_t next_version = expected_version + 1;
  try {
    auto& w   = TX(t).Work();
    auto  res = w.exec_prepared("cas_wallet", r.user_id, r.balance_millis, r.capacity_millis, r.refill_rate_per_sec, r.last_refill_at_ms,
                                r.updated_at_ms, static_cast<int64_t>(next_version), static_cast<int64_t>(expected_version));
    if (res.affected_rows() == 0) return MissedCas(w, "wallets", "user_id", r.user_id);
    r.version = next_version;
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

// ------------------------------------------------------------------
// Ledger
// ------------------------------------------------------------------

Result PgRepository::InsertLedgerEntry(Transaction& t, const model::LedgerEntryRecord& r) {
  try {
    TX(t).Work().exec_params(std::string("INSERT INTO ledger_entries(") + kLedgerColumns + ") VALUES($1,$2,$3,$4,$5,$6,$7,$8,$9::jsonb,$10,$11);",
                             r.id, r.idempotency_key, static_cast<int>(r.entry_type), r.user_id, r.amount_millis, r.delta_millis,
                             r.balance_after_millis, r.reason_code, r.context_json.empty() ? std::string("{}") : r.context_json,
                             NullIfEmpty(r.resolves_ledger_id), r.created_at_ms);
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

std::optional<model::LedgerEntryRecord> PgRepository::GetLedgerEntry(Transaction& t, const std::string& id) {
  auto res = TX(t).Work().exec_params(
      "SELECT id,idempotency_key,entry_type,user_id,amount_millis,delta_millis,balance_after_millis,reason_code,context_json::text,"
      "resolves_ledger_id,created_at_ms FROM ledger_entries WHERE id=$1;",
      id);
  if (res.empty()) return std::nullopt;
  return ReadLedgerEntry(res[0]);
}

std::optional<model::LedgerEntryRecord> PgRepository::GetLedgerEntryByKey(Transaction& t, const std::string& idempotency_key) {
  auto res = TX(t).Work().exec_prepared("get_ledger_by_key", idempotency_key);
  if (res.empty()) return std::nullopt;
  return ReadLedgerEntry(res[0]);
}

std::optional<model::LedgerEntryRecord> PgRepository::GetLedgerResolution(Transaction& t, const std::string& hold_ledger_id) {
  auto res = TX(t).Work().exec_params(
      "SELECT id,idempotency_key,entry_type,user_id,amount_millis,delta_millis,balance_after_millis,reason_code,context_json::text,"
      "resolves_ledger_id,created_at_ms FROM ledger_entries WHERE resolves_ledger_id=$1;",
      hold_ledger_id);
  if (res.empty()) return std::nullopt;
  return ReadLedgerEntry(res[0]);
}

std::vector<model::LedgerEntryRecord> PgRepository::ListLedgerEntries(Transaction& t, const LedgerQuery& q) {
  // Unbounded filters bind as NULL and short-circuit.
  auto res = TX(t).Work().exec_params(
      "SELECT id,idempotency_key,entry_type,user_id,amount_millis,delta_millis,balance_after_millis,reason_code,context_json::text,"
      "resolves_ledger_id,created_at_ms FROM ledger_entries "
      "WHERE ($1::text IS NULL OR user_id=$1) AND ($2::bigint IS NULL OR created_at_ms>=$2) AND ($3::bigint IS NULL OR created_at_ms<$3) "
      "ORDER BY created_at_ms ASC, id ASC LIMIT $4;",
      NullIfEmpty(q.user_id), NullIfZero(q.from_ms), NullIfZero(q.to_ms), static_cast<int64_t>(q.limit));
  return ReadAll(res, ReadLedgerEntry);
}

// ------------------------------------------------------------------
// Circuit state
// ------------------------------------------------------------------

Result PgRepository::InsertCircuitState(Transaction& t, const model::CircuitStateRecord& r) {
  try {
    TX(t).Work().exec_params(
        "INSERT INTO provider_circuit_state(provider_key,state,opened_at_ms,cooldown_until_ms,failure_count,last_error,updated_at_ms,version) "
        "VALUES($1,$2,$3,$4,$5,$6,$7,$8);",
        r.provider_key, static_cast<int>(r.state), NullIfZero(r.opened_at_ms), NullIfZero(r.cooldown_until_ms),
        static_cast<int64_t>(r.failure_count), NullIfEmpty(r.last_error), r.updated_at_ms, static_cast<int64_t>(r.version));
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

std::optional<model::CircuitStateRecord> PgRepository::GetCircuitState(Transaction& t, const std::string& provider_key) {
  auto res = TX(t).Work().exec_prepared("get_circuit", provider_key);
  if (res.empty()) return std::nullopt;
  return ReadCircuit(res[0]);
}

Result PgRepository::CompareAndSwapCircuitState(Transaction& t, model::CircuitStateRecord& r, uint64_t expected_version) {
  const uint64_t next_version = expected_version + 1;
  try {
    auto& w   = TX(t).Work();
    auto  res = w.exec_params(
        "UPDATE provider_circuit_state SET state=$2,opened_at_ms=$3,cooldown_until_ms=$4,failure_count=$5,last_error=$6,updated_at_ms=$7,"
         "version=$8 WHERE provider_key=$1 AND version=$9;",
        r.provider_key, static_cast<int>(r.state), NullIfZero(r.opened_at_ms), NullIfZero(r.cooldown_until_ms),
        static_cast<int64_t>(r.failure_count), NullIfEmpty(r.last_error), r.updated_at_ms, static_cast<int64_t>(next_version),
        static_cast<int64_t>(expected_version));
    if (res.affected_rows() == 0) return MissedCas(w, "provider_circuit_state", "provider_key", r.provider_key);
    r.version = next_version;
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

// ------------------------------------------------------------------
// Jobs
// ------------------------------------------------------------------

Result PgRepository::InsertJob(Transaction& t, const model::JobRecord& r) {
  try {
    TX(t).Work().exec_params(std::string("INSERT INTO jobs(") + kJobColumns +
                                 ") VALUES($1,$2,$3,$4,$5,$6,$7,$8,$9,$10,$11,$12,$13,$14,$15,$16,$17,$18);",
                             r.id, r.scope, NullIfEmpty(r.dedupe_key), static_cast<int>(r.status), static_cast<int64_t>(r.attempts),
                             static_cast<int64_t>(r.max_attempts), NullIfEmpty(r.worker_id), NullIfZero(r.lease_expires_at_ms),
                             r.next_run_at_ms, NullIfZero(r.started_at_ms), NullIfZero(r.finished_at_ms), NullIfEmpty(r.error_code),
                             NullIfEmpty(r.error_message), NullIfEmpty(r.trace_id), NullIfEmpty(r.payload_json), r.created_at_ms,
                             r.updated_at_ms, static_cast<int64_t>(r.version));
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

std::optional<model::JobRecord> PgRepository::GetJob(Transaction& t, const std::string& id) {
  auto res = TX(t).Work().exec_params(std::string("SELECT ") + kJobColumns + " FROM jobs WHERE id=$1;", id);
  if (res.empty()) return std::nullopt;
  return ReadJob(res[0]);
}

std::optional<model::JobRecord> PgRepository::GetJobByDedupeKey(Transaction& t, const std::string& dedupe_key) {
  auto res = TX(t).Work().exec_params(std::string("SELECT ") + kJobColumns + " FROM jobs WHERE dedupe_key=$1;", dedupe_key);
  if (res.empty()) return std::nullopt;
  return ReadJob(res[0]);
}

Result PgRepository::CompareAndSwapJob(Transaction& t, model::JobRecord& r, uint64_t expected_version) {
  const uint64_t next_version = expected_version + 1;
  try {
    auto& w   = TX(t).Work();
    auto  res = w.exec_params(
        "UPDATE jobs SET status=$2,attempts=$3,max_attempts=$4,worker_id=$5,lease_expires_at_ms=$6,next_run_at_ms=$7,started_at_ms=$8,"
         "finished_at_ms=$9,error_code=$10,error_message=$11,trace_id=$12,payload_json=$13,updated_at_ms=$14,version=$15 "
         "WHERE id=$1 AND version=$16;",
        r.id, static_cast<int>(r.status), static_cast<int64_t>(r.attempts), static_cast<int64_t>(r.max_attempts), NullIfEmpty(r.worker_id),
        NullIfZero(r.lease_expires_at_ms), r.next_run_at_ms, NullIfZero(r.started_at_ms), NullIfZero(r.finished_at_ms),
        NullIfEmpty(r.error_code), NullIfEmpty(r.error_message), NullIfEmpty(r.trace_id), NullIfEmpty(r.payload_json), r.updated_at_ms,
        static_cast<int64_t>(next_version), static_cast<int64_t>(expected_version));
    if (res.affected_rows() == 0) return MissedCas(w, "jobs", "id", r.id);
    r.version = next_version;
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

std::vector<model::JobRecord> PgRepository::ListClaimableJobs(Transaction& t, const std::vector<std::string>& scopes, int64_t now_ms,
                                                              uint32_t limit) {
  if (scopes.empty()) return {};

  auto& w = TX(t).Work();

  std::string in_list;
  for (std::size_t i = 0; i < scopes.size(); ++i) {
    if (i > 0) in_list += ",";
    in_list += w.quote(scopes[i]);
  }

  auto res = w.exec_params(std::string("SELECT ") + kJobColumns + " FROM jobs WHERE scope IN (" + in_list +
                               ") AND ((status=$1 AND next_run_at_ms<=$2) OR "
                               "(status=$3 AND lease_expires_at_ms IS NOT NULL AND lease_expires_at_ms<$2)) "
                               "ORDER BY next_run_at_ms ASC, created_at_ms ASC LIMIT $4;",
                           static_cast<int>(creditgate::v1::JOB_STATUS_QUEUED), now_ms, static_cast<int>(creditgate::v1::JOB_STATUS_RUNNING),
                           static_cast<int64_t>(limit));
  return ReadAll(res, ReadJob);
}

std::vector<model::JobRecord> PgRepository::ListRunningJobsStartedBefore(Transaction& t, const std::string& scope, int64_t before_ms,
                                                                         uint32_t limit) {
  auto res = TX(t).Work().exec_params(std::string("SELECT ") + kJobColumns +
                                          " FROM jobs WHERE scope=$1 AND status=$2 AND started_at_ms IS NOT NULL AND started_at_ms<$3 "
                                          "ORDER BY started_at_ms ASC LIMIT $4;",
                                      scope, static_cast<int>(creditgate::v1::JOB_STATUS_RUNNING), before_ms, static_cast<int64_t>(limit));
  return ReadAll(res, ReadJob);
}

// ------------------------------------------------------------------
// Sweep bookkeeping
// ------------------------------------------------------------------

std::optional<model::SweepStateRecord> PgRepository::GetSweepState(Transaction& t, const std::string& name) {
  auto res =
      TX(t).Work().exec_params("SELECT name,last_started_at_ms,last_finished_at_ms,last_trace_id FROM sweep_state WHERE name=$1;", name);
  if (res.empty()) return std::nullopt;

  model::SweepStateRecord r;
  r.name                = Text(res[0][0]);
  r.last_started_at_ms  = I64(res[0][1]);
  r.last_finished_at_ms = I64(res[0][2]);
  r.last_trace_id       = Text(res[0][3]);
  return r;
}

Result PgRepository::UpsertSweepState(Transaction& t, const model::SweepStateRecord& r) {
  try {
    TX(t).Work().exec_params(
        "INSERT INTO sweep_state(name,last_started_at_ms,last_finished_at_ms,last_trace_id) VALUES($1,$2,$3,$4) "
        "ON CONFLICT(name) DO UPDATE SET last_started_at_ms=EXCLUDED.last_started_at_ms,last_finished_at_ms=EXCLUDED.last_finished_at_ms,"
        "last_trace_id=EXCLUDED.last_trace_id;",
        r.name, NullIfZero(r.last_started_at_ms), NullIfZero(r.last_finished_at_ms), NullIfEmpty(r.last_trace_id));
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

} // namespace creditgate::db::postgres
