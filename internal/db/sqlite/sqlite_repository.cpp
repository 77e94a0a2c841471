#include "sqlite_repository.hpp"

#include <sqlite3.h>

#include <stdexcept>
#include <string>

namespace creditgate::db::sqlite {

using creditgate::db::ErrorCode;
using creditgate::db::Result;

namespace {

constexpr const char* kUnlockColumns =
    "id,source_item_id,source_page_id,status,estimated_cost_millis,reserved_by_user_id,reservation_expires_at_ms,reservation_id,"
    "reserved_ledger_id,reserved_amount_millis,blueprint_id,job_id,last_error_code,last_error_message,created_at_ms,updated_at_ms,version";

constexpr const char* kWalletColumns =
    "user_id,balance_millis,capacity_millis,refill_rate_per_sec,last_refill_at_ms,created_at_ms,updated_at_ms,version";

constexpr const char* kLedgerColumns =
    "id,idempotency_key,entry_type,user_id,amount_millis,delta_millis,balance_after_millis,reason_code,context_json,resolves_ledger_id,"
    "created_at_ms";

constexpr const char* kCircuitColumns = "provider_key,state,opened_at_ms,cooldown_until_ms,failure_count,last_error,updated_at_ms,version";

constexpr const char* kJobColumns =
    "id,scope,dedupe_key,status,attempts,max_attempts,worker_id,lease_expires_at_ms,next_run_at_ms,started_at_ms,finished_at_ms,error_code,"
    "error_message,trace_id,payload_json,created_at_ms,updated_at_ms,version";

/*
  Owns one prepared statement. Null when prepare failed.
*/
class Statement {
 public:
  Statement(sqlite3* db, const std::string& sql) {
    if (sqlite3_prepare_v2(db, sql.c_str(), -1, &st_, nullptr) != SQLITE_OK) {
      sqlite3_finalize(st_);
      st_ = nullptr;
    }
  }
  ~Statement() {
    if (st_) sqlite3_finalize(st_);
  }

  Statement(const Statement&)            = delete;
  Statement& operator=(const Statement&) = delete;

  explicit operator bool() const {
    return st_ != nullptr;
  }
  sqlite3_stmt* get() const {
    return st_;
  }
  int Step() {
    return sqlite3_step(st_);
  }

 private:
  sqlite3_stmt* st_ = nullptr;
};

void BindText(sqlite3_stmt* st, int idx, const std::string& s) {
  sqlite3_bind_text(st, idx, s.c_str(), -1, SQLITE_TRANSIENT);
}

// Empty strings are stored as NULL so optional unique columns stay unconstrained.
void BindNullableText(sqlite3_stmt* st, int idx, const std::string& s) {
  if (s.empty()) {
    sqlite3_bind_null(st, idx);
    return;
  }
  BindText(st, idx, s);
}

void BindI64(sqlite3_stmt* st, int idx, int64_t v) {
  sqlite3_bind_int64(st, idx, static_cast<sqlite3_int64>(v));
}

void BindNullableI64(sqlite3_stmt* st, int idx, int64_t v) {
  if (v == 0) {
    sqlite3_bind_null(st, idx);
    return;
  }
  BindI64(st, idx, v);
}

void BindDouble(sqlite3_stmt* st, int idx, double v) {
  sqlite3_bind_double(st, idx, v);
}

std::string ColText(sqlite3_stmt* st, int col) {
  const unsigned char* t = sqlite3_column_text(st, col);
  return t ? reinterpret_cast<const char*>(t) : "";
}

int64_t ColI64(sqlite3_stmt* st, int col) {
  return static_cast<int64_t>(sqlite3_column_int64(st, col));
}

double ColDouble(sqlite3_stmt* st, int col) {
  return sqlite3_column_double(st, col);
}

Result Translate(sqlite3* db, int rc) {
  if (rc == SQLITE_OK || rc == SQLITE_DONE || rc == SQLITE_ROW) return Result::Ok();

  switch (rc & 0xff) {
    case SQLITE_BUSY:
    case SQLITE_LOCKED:
      return Result::Err(ErrorCode::Busy, sqlite3_errmsg(db));
    case SQLITE_CONSTRAINT:
      return Result::Err(ErrorCode::ConstraintViolation, sqlite3_errmsg(db));
    case SQLITE_IOERR:
      return Result::Err(ErrorCode::IOError, sqlite3_errmsg(db));
    case SQLITE_CORRUPT:
      return Result::Err(ErrorCode::Corruption, sqlite3_errmsg(db));
    default:
      return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));
  }
}

template <typename Bind>
Result Execute(sqlite3* db, const std::string& sql, Bind bind) {
  Statement st(db, sql);
  if (!st) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));
  bind(st.get());
  return Translate(db, st.Step());
}

template <typename Row, typename Bind, typename Read>
std::vector<Row> QueryRows(sqlite3* db, const std::string& sql, Bind bind, Read read) {
  Statement st(db, sql);
  if (!st) throw std::runtime_error("sqlite prepare: " + std::string(sqlite3_errmsg(db)));
  bind(st.get());

  std::vector<Row> rows;
  int              rc = SQLITE_OK;
  while ((rc = st.Step()) == SQLITE_ROW) {
    rows.push_back(read(st.get()));
  }
  if (rc != SQLITE_DONE) throw std::runtime_error("sqlite step: " + std::string(sqlite3_errmsg(db)));
  return rows;
}

template <typename Row, typename Bind, typename Read>
std::optional<Row> QueryRow(sqlite3* db, const std::string& sql, Bind bind, Read read) {
  auto rows = QueryRows<Row>(db, sql, bind, read);
  if (rows.empty()) return std::nullopt;
  return std::move(rows.front());
}

// An UPDATE guarded by version matched nothing: tell a vanished row from a moved version.
Result MissedCas(sqlite3* db, const std::string& table, const std::string& key_column, const std::string& key) {
  const auto exists = QueryRow<int64_t>(
      db, "SELECT 1 FROM " + table + " WHERE " + key_column + "=?;", [&](sqlite3_stmt* st) { BindText(st, 1, key); },
      [](sqlite3_stmt* st) { return ColI64(st, 0); });
  if (!exists) return Result::Err(ErrorCode::NotFound, key);
  return Result::Err(ErrorCode::Conflict, key);
}

template <typename Bind>
Result ExecuteCas(sqlite3* db, const std::string& sql, Bind bind, const std::string& table, const std::string& key_column,
                  const std::string& key) {
  auto result = Execute(db, sql, bind);
  if (!result) return result;
  if (sqlite3_changes(db) == 0) return MissedCas(db, table, key_column, key);
  return Result::Ok();
}

model::UnlockRecord ReadUnlock(sqlite3_stmt* st) {
  model::UnlockRecord r;
  r.id                        = ColText(st, 0);
  r.source_item_id            = ColText(st, 1);
  r.source_page_id            = ColText(st, 2);
  r.status                    = static_cast<creditgate::v1::UnlockStatus>(ColI64(st, 3));
  r.estimated_cost_millis     = ColI64(st, 4);
  r.reserved_by_user_id       = ColText(st, 5);
  r.reservation_expires_at_ms = ColI64(st, 6);
  r.reservation_id            = ColText(st, 7);
  r.reserved_ledger_id        = ColText(st, 8);
  r.reserved_amount_millis    = ColI64(st, 9);
  r.blueprint_id              = ColText(st, 10);
  r.job_id                    = ColText(st, 11);
  r.last_error_code           = ColText(st, 12);
  r.last_error_message        = ColText(st, 13);
  r.created_at_ms             = ColI64(st, 14);
  r.updated_at_ms             = ColI64(st, 15);
  r.version                   = static_cast<uint64_t>(ColI64(st, 16));
  return r;
}

model::WalletRecord ReadWallet(sqlite3_stmt* st) {
  model::WalletRecord r;
  r.user_id             = ColText(st, 0);
  r.balance_millis      = ColI64(st, 1);
  r.capacity_millis     = ColI64(st, 2);
  r.refill_rate_per_sec = ColDouble(st, 3);
  r.last_refill_at_ms   = ColI64(st, 4);
  r.created_at_ms       = ColI64(st, 5);
  r.updated_at_ms       = ColI64(st, 6);
  r.version             = static_cast<uint64_t>(ColI64(st, 7));
  return r;
}

model::LedgerEntryRecord ReadLedgerEntry(sqlite3_stmt* st) {
  model::LedgerEntryRecord r;
  r.id                   = ColText(st, 0);
  r.idempotency_key      = ColText(st, 1);
  r.entry_type           = static_cast<creditgate::v1::LedgerEntryType>(ColI64(st, 2));
  r.user_id              = ColText(st, 3);
  r.amount_millis        = ColI64(st, 4);
  r.delta_millis         = ColI64(st, 5);
  r.balance_after_millis = ColI64(st, 6);
  r.reason_code          = ColText(st, 7);
  r.context_json         = ColText(st, 8);
  r.resolves_ledger_id   = ColText(st, 9);
  r.created_at_ms        = ColI64(st, 10);
  return r;
}

model::CircuitStateRecord ReadCircuit(sqlite3_stmt* st) {
  model::CircuitStateRecord r;
  r.provider_key      = ColText(st, 0);
  r.state             = static_cast<creditgate::v1::CircuitState>(ColI64(st, 1));
  r.opened_at_ms      = ColI64(st, 2);
  r.cooldown_until_ms = ColI64(st, 3);
  r.failure_count     = static_cast<uint32_t>(ColI64(st, 4));
  r.last_error        = ColText(st, 5);
  r.updated_at_ms     = ColI64(st, 6);
  r.version           = static_cast<uint64_t>(ColI64(st, 7));
  return r;
}

model::JobRecord ReadJob(sqlite3_stmt* st) {
  model::JobRecord r;
  r.id                  = ColText(st, 0);
  r.scope               = ColText(st, 1);
  r.dedupe_key          = ColText(st, 2);
  r.status              = static_cast<creditgate::v1::JobStatus>(ColI64(st, 3));
  r.attempts            = static_cast<uint32_t>(ColI64(st, 4));
  r.max_attempts        = static_cast<uint32_t>(ColI64(st, 5));
  r.worker_id           = ColText(st, 6);
  r.lease_expires_at_ms = ColI64(st, 7);
  r.next_run_at_ms      = ColI64(st, 8);
  r.started_at_ms       = ColI64(st, 9);
  r.finished_at_ms      = ColI64(st, 10);
  r.error_code          = ColText(st, 11);
  r.error_message       = ColText(st, 12);
  r.trace_id            = ColText(st, 13);
  r.payload_json        = ColText(st, 14);
  r.created_at_ms       = ColI64(st, 15);
  r.updated_at_ms       = ColI64(st, 16);
  r.version             = static_cast<uint64_t>(ColI64(st, 17));
  return r;
}

std::string Select(const char* columns, const std::string& table, const std::string& tail) {
  return std::string("SELECT ") + columns + " FROM " + table + " " + tail;
}

} // namespace

SqliteRepository::SqliteRepository(std::shared_ptr<SqliteDB> db) : db_(std::move(db)) {
}

std::unique_ptr<db::Transaction> SqliteRepository::Begin() {
  return std::make_unique<SqliteTransaction>(db_);
}

SqliteTransaction& SqliteRepository::TX(Transaction& t) {
  return static_cast<SqliteTransaction&>(t);
}

// ------------------------------------------------------------------
// Unlocks
// ------------------------------------------------------------------

Result SqliteRepository::InsertUnlock(Transaction& t, const model::UnlockRecord& r) {
  return Execute(TX(t).Handle(), std::string("INSERT INTO unlocks(") + kUnlockColumns + ") VALUES(?,?,?,?,?,?,?,?,?,?,?,?,?,?,?,?,?);",
                 [&](sqlite3_stmt* st) {
                   BindText(st, 1, r.id);
                   BindText(st, 2, r.source_item_id);
                   BindNullableText(st, 3, r.source_page_id);
                   BindI64(st, 4, r.status);
                   BindI64(st, 5, r.estimated_cost_millis);
                   BindNullableText(st, 6, r.reserved_by_user_id);
                   BindNullableI64(st, 7, r.reservation_expires_at_ms);
                   BindNullableText(st, 8, r.reservation_id);
                   BindNullableText(st, 9, r.reserved_ledger_id);
                   BindI64(st, 10, r.reserved_amount_millis);
                   BindNullableText(st, 11, r.blueprint_id);
                   BindNullableText(st, 12, r.job_id);
                   BindNullableText(st, 13, r.last_error_code);
                   BindNullableText(st, 14, r.last_error_message);
                   BindI64(st, 15, r.created_at_ms);
                   BindI64(st, 16, r.updated_at_ms);
                   BindI64(st, 17, static_cast<int64_t>(r.version));
                 });
}

std::optional<model::UnlockRecord> SqliteRepository::GetUnlock(Transaction& t, const std::string& id) {
  return QueryRow<model::UnlockRecord>(
      TX(t).Handle(), Select(kUnlockColumns, "unlocks", "WHERE id=?;"), [&](sqlite3_stmt* st) { BindText(st, 1, id); }, ReadUnlock);
}

std::optional<model::UnlockRecord> SqliteRepository::GetUnlockBySourceItem(Transaction& t, const std::string& source_item_id) {
  return QueryRow<model::UnlockRecord>(
      TX(t).Handle(), Select(kUnlockColumns, "unlocks", "WHERE source_item_id=?;"),
      [&](sqlite3_stmt* st) { BindText(st, 1, source_item_id); }, ReadUnlock);
}

Result SqliteRepository::CompareAndSwapUnlock(Transaction& t, model::UnlockRecord& r, uint64_t expected_version) {
  const uint64_t next_version = expected_version + 1;

  auto result = ExecuteCas(
      TX(t).Handle(),
      "UPDATE unlocks SET source_page_id=?2,status=?3,estimated_cost_millis=?4,reserved_by_user_id=?5,reservation_expires_at_ms=?6,"
      "reservation_id=?7,reserved_ledger_id=?8,reserved_amount_millis=?9,blueprint_id=?10,job_id=?11,last_error_code=?12,"
      "last_error_message=?13,updated_at_ms=?14,version=?15 WHERE id=?1 AND version=?16;",
      [&](sqlite3_stmt* st) {
        BindText(st, 1, r.id);
        BindNullableText(st, 2, r.source_page_id);
        BindI64(st, 3, r.status);
        BindI64(st, 4, r.estimated_cost_millis);
        BindNullableText(st, 5, r.reserved_by_user_id);
        BindNullableI64(st, 6, r.reservation_expires_at_ms);
        BindNullableText(st, 7, r.reservation_id);
        BindNullableText(st, 8, r.reserved_ledger_id);
        BindI64(st, 9, r.reserved_amount_millis);
        BindNullableText(st, 10, r.blueprint_id);
        BindNullableText(st, 11, r.job_id);
        BindNullableText(st, 12, r.last_error_code);
        BindNullableText(st, 13, r.last_error_message);
        BindI64(st, 14, r.updated_at_ms);
        BindI64(st, 15, static_cast<int64_t>(next_version));
        BindI64(st, 16, static_cast<int64_t>(expected_version));
      },
      "unlocks", "id", r.id);

  if (result) r.version = next_version;
  return result;
}

std::vector<model::UnlockRecord> SqliteRepository::ListUnlocksByStatus(Transaction& t, creditgate::v1::UnlockStatus status, uint32_t limit) {
  return QueryRows<model::UnlockRecord>(
      TX(t).Handle(), Select(kUnlockColumns, "unlocks", "WHERE status=? ORDER BY updated_at_ms ASC LIMIT ?;"),
      [&](sqlite3_stmt* st) {
        BindI64(st, 1, status);
        BindI64(st, 2, limit);
      },
      ReadUnlock);
}

std::vector<model::UnlockRecord> SqliteRepository::ListExpiredUnlocks(Transaction& t, creditgate::v1::UnlockStatus status, int64_t now_ms,
                                                                      uint32_t limit) {
  return QueryRows<model::UnlockRecord>(
      TX(t).Handle(),
      Select(kUnlockColumns, "unlocks",
             "WHERE status=? AND reservation_expires_at_ms IS NOT NULL AND reservation_expires_at_ms<? "
             "ORDER BY reservation_expires_at_ms ASC LIMIT ?;"),
      [&](sqlite3_stmt* st) {
        BindI64(st, 1, status);
        BindI64(st, 2, now_ms);
        BindI64(st, 3, limit);
      },
      ReadUnlock);
}

uint64_t SqliteRepository::CountActiveUnlocksForJob(Transaction& t, const std::string& job_id) {
  const auto count = QueryRow<int64_t>(
      TX(t).Handle(), "SELECT COUNT(*) FROM unlocks WHERE job_id=? AND status IN (?,?);",
      [&](sqlite3_stmt* st) {
        BindText(st, 1, job_id);
        BindI64(st, 2, creditgate::v1::UNLOCK_STATUS_RESERVED);
        BindI64(st, 3, creditgate::v1::UNLOCK_STATUS_PROCESSING);
      },
      [](sqlite3_stmt* st) { return ColI64(st, 0); });
  return count ? static_cast<uint64_t>(*count) : 0;
}

// ------------------------------------------------------------------
// Wallets
// ------------------------------------------------------------------

Result SqliteRepository::InsertWallet(Transaction& t, const model::WalletRecord& r) {
  return Execute(TX(t).Handle(), std::string("INSERT INTO wallets(") + kWalletColumns + ") VALUES(?,?,?,?,?,?,?,?);", [&](sqlite3_stmt* st) {
    BindText(st, 1, r.user_id);
    BindI64(st, 2, r.balance_millis);
    BindI64(st, 3, r.capacity_millis);
    BindDouble(st, 4, r.refill_rate_per_sec);
    BindI64(st, 5, r.last_refill_at_ms);
    BindI64(st, 6, r.created_at_ms);
    BindI64(st, 7, r.updated_at_ms);
    BindI64(st, 8, static_cast<int64_t>(r.version));
  });
}

std::optional<model::WalletRecord> SqliteRepository::GetWallet(Transaction& t, const std::string& user_id) {
  return QueryRow<model::WalletRecord>(
      TX(t).Handle(), Select(kWalletColumns, "wallets", "WHERE user_id=?;"), [&](sqlite3_stmt* st) { BindText(st, 1, user_id); },
      ReadWallet);
}

Result SqliteRepository::CompareAndSwapWallet(Transaction& t, model::WalletRecord& r, uint64_t expected_version) {
  const uint64_t next_version = expected_version + 1;

  auto result = ExecuteCas(
      TX(t).Handle(),
      "UPDATE wallets SET balance_millis=?2,capacity_millis=?3,refill_rate_per_sec=?4,last_refill_at_ms=?5,updated_at_ms=?6,version=?7 "
      "WHERE user_id=?1 AND version=?8;",
      [&](sqlite3_stmt* st) {
        BindText(st, 1, r.user_id);
        BindI64(st, 2, r.balance_millis);
        BindI64(st, 3, r.capacity_millis);
        BindDouble(st, 4, r.refill_rate_per_sec);
        BindI64(st, 5, r.last_refill_at_ms);
        BindI64(st, 6, r.updated_at_ms);
        BindI64(st, 7, static_cast<int64_t>(next_version));
        BindI64(st, 8, static_cast<int64_t>(expected_version));
      },
      "wallets", "user_id", r.user_id);

  if (result) r.version = next_version;
  return result;
}

// ------------------------------------------------------------------
// Ledger
// ------------------------------------------------------------------

Result SqliteRepository::InsertLedgerEntry(Transaction& t, const model::LedgerEntryRecord& r) {
  return Execute(TX(t).Handle(), std::string("INSERT INTO ledger_entries(") + kLedgerColumns + ") VALUES(?,?,?,?,?,?,?,?,?,?,?);",
                 [&](sqlite3_stmt* st) {
                   BindText(st, 1, r.id);
                   BindText(st, 2, r.idempotency_key);
                   BindI64(st, 3, r.entry_type);
                   BindText(st, 4, r.user_id);
                   BindI64(st, 5, r.amount_millis);
                   BindI64(st, 6, r.delta_millis);
                   BindI64(st, 7, r.balance_after_millis);
                   BindText(st, 8, r.reason_code);
                   BindText(st, 9, r.context_json);
                   BindNullableText(st, 10, r.resolves_ledger_id);
                   BindI64(st, 11, r.created_at_ms);
                 });
}

std::optional<model::LedgerEntryRecord> SqliteRepository::GetLedgerEntry(Transaction& t, const std::string& id) {
  return QueryRow<model::LedgerEntryRecord>(
      TX(t).Handle(), Select(kLedgerColumns, "ledger_entries", "WHERE id=?;"), [&](sqlite3_stmt* st) { BindText(st, 1, id); },
      ReadLedgerEntry);
}

std::optional<model::LedgerEntryRecord> SqliteRepository::GetLedgerEntryByKey(Transaction& t, const std::string& idempotency_key) {
  return QueryRow<model::LedgerEntryRecord>(
      TX(t).Handle(), Select(kLedgerColumns, "ledger_entries", "WHERE idempotency_key=?;"),
      [&](sqlite3_stmt* st) { BindText(st, 1, idempotency_key); }, ReadLedgerEntry);
}

std::optional<model::LedgerEntryRecord> SqliteRepository::GetLedgerResolution(Transaction& t, const std::string& hold_ledger_id) {
  return QueryRow<model::LedgerEntryRecord>(
      TX(t).Handle(), Select(kLedgerColumns, "ledger_entries", "WHERE resolves_ledger_id=?;"),
      [&](sqlite3_stmt* st) { BindText(st, 1, hold_ledger_id); }, ReadLedgerEntry);
}

std::vector<model::LedgerEntryRecord> SqliteRepository::ListLedgerEntries(Transaction& t, const LedgerQuery& q) {
  std::string where = "WHERE 1=1";
  if (!q.user_id.empty()) where += " AND user_id=?";
  if (q.from_ms != 0) where += " AND created_at_ms>=?";
  if (q.to_ms != 0) where += " AND created_at_ms<?";

  return QueryRows<model::LedgerEntryRecord>(
      TX(t).Handle(), Select(kLedgerColumns, "ledger_entries", where + " ORDER BY created_at_ms ASC, rowid ASC LIMIT ?;"),
      [&](sqlite3_stmt* st) {
        int idx = 1;
        if (!q.user_id.empty()) BindText(st, idx++, q.user_id);
        if (q.from_ms != 0) BindI64(st, idx++, q.from_ms);
        if (q.to_ms != 0) BindI64(st, idx++, q.to_ms);
        BindI64(st, idx, q.limit);
      },
      ReadLedgerEntry);
}

// ------------------------------------------------------------------
// Circuit state
// ------------------------------------------------------------------

Result SqliteRepository::InsertCircuitState(Transaction& t, const model::CircuitStateRecord& r) {
  return Execute(TX(t).Handle(), std::string("INSERT INTO provider_circuit_state(") + kCircuitColumns + ") VALUES(?,?,?,?,?,?,?,?);",
                 [&](sqlite3_stmt* st) {
                   BindText(st, 1, r.provider_key);
                   BindI64(st, 2, r.state);
                   BindNullableI64(st, 3, r.opened_at_ms);
                   BindNullableI64(st, 4, r.cooldown_until_ms);
                   BindI64(st, 5, r.failure_count);
                   BindNullableText(st, 6, r.last_error);
                   BindI64(st, 7, r.updated_at_ms);
                   BindI64(st, 8, static_cast<int64_t>(r.version));
                 });
}

std::optional<model::CircuitStateRecord> SqliteRepository::GetCircuitState(Transaction& t, const std::string& provider_key) {
  return QueryRow<model::CircuitStateRecord>(
      TX(t).Handle(), Select(kCircuitColumns, "provider_circuit_state", "WHERE provider_key=?;"),
      [&](sqlite3_stmt* st) { BindText(st, 1, provider_key); }, ReadCircuit);
}

Result SqliteRepository::CompareAndSwapCircuitState(Transaction& t, model::CircuitStateRecord& r, uint64_t expected_version) {
  const uint64_t next_version = expected_version + 1;

  auto result = ExecuteCas(
      TX(t).Handle(),
      "UPDATE provider_circuit_state SET state=?2,opened_at_ms=?3,cooldown_until_ms=?4,failure_count=?5,last_error=?6,updated_at_ms=?7,"
      "version=?8 WHERE provider_key=?1 AND version=?9;",
      [&](sqlite3_stmt* st) {
        BindText(st, 1, r.provider_key);
        BindI64(st, 2, r.state);
        BindNullableI64(st, 3, r.opened_at_ms);
        BindNullableI64(st, 4, r.cooldown_until_ms);
        BindI64(st, 5, r.failure_count);
        BindNullableText(st, 6, r.last_error);
        BindI64(st, 7, r.updated_at_ms);
        BindI64(st, 8, static_cast<int64_t>(next_version));
        BindI64(st, 9, static_cast<int64_t>(expected_version));
      },
      "provider_circuit_state", "provider_key", r.provider_key);

  if (result) r.version = next_version;
  return result;
}

// ------------------------------------------------------------------
// Jobs
// ------------------------------------------------------------------

Result SqliteRepository::InsertJob(Transaction& t, const model::JobRecord& r) {
  return Execute(TX(t).Handle(), std::string("INSERT INTO jobs(") + kJobColumns + ") VALUES(?,?,?,?,?,?,?,?,?,?,?,?,?,?,?,?,?,?);",
                 [&](sqlite3_stmt* st) {
                   BindText(st, 1, r.id);
                   BindText(st, 2, r.scope);
                   BindNullableText(st, 3, r.dedupe_key);
                   BindI64(st, 4, r.status);
                   BindI64(st, 5, r.attempts);
                   BindI64(st, 6, r.max_attempts);
                   BindNullableText(st, 7, r.worker_id);
                   BindNullableI64(st, 8, r.lease_expires_at_ms);
                   BindI64(st, 9, r.next_run_at_ms);
                   BindNullableI64(st, 10, r.started_at_ms);
                   BindNullableI64(st, 11, r.finished_at_ms);
                   BindNullableText(st, 12, r.error_code);
                   BindNullableText(st, 13, r.error_message);
                   BindNullableText(st, 14, r.trace_id);
                   BindNullableText(st, 15, r.payload_json);
                   BindI64(st, 16, r.created_at_ms);
                   BindI64(st, 17, r.updated_at_ms);
                   BindI64(st, 18, static_cast<int64_t>(r.version));
                 });
}

std::optional<model::JobRecord> SqliteRepository::GetJob(Transaction& t, const std::string& id) {
  return QueryRow<model::JobRecord>(
      TX(t).Handle(), Select(kJobColumns, "jobs", "WHERE id=?;"), [&](sqlite3_stmt* st) { BindText(st, 1, id); }, ReadJob);
}

std::optional<model::JobRecord> SqliteRepository::GetJobByDedupeKey(Transaction& t, const std::string& dedupe_key) {
  return QueryRow<model::JobRecord>(
      TX(t).Handle(), Select(kJobColumns, "jobs", "WHERE dedupe_key=?;"), [&](sqlite3_stmt* st) { BindText(st, 1, dedupe_key); }, ReadJob);
}

Result SqliteRepository::CompareAndSwapJob(Transaction& t, model::JobRecord& r, uint64_t expected_version) {
  const uint64_t next_version = expected_version + 1;

  auto result = ExecuteCas(
      TX(t).Handle(),
      "UPDATE jobs SET status=?2,attempts=?3,max_attempts=?4,worker_id=?5,lease_expires_at_ms=?6,next_run_at_ms=?7,started_at_ms=?8,"
      "finished_at_ms=?9,error_code=?10,error_message=?11,trace_id=?12,payload_json=?13,updated_at_ms=?14,version=?15 "
      "WHERE id=?1 AND version=?16;",
      [&](sqlite3_stmt* st) {
        BindText(st, 1, r.id);
        BindI64(st, 2, r.status);
        BindI64(st, 3, r.attempts);
        BindI64(st, 4, r.max_attempts);
        BindNullableText(st, 5, r.worker_id);
        BindNullableI64(st, 6, r.lease_expires_at_ms);
        BindI64(st, 7, r.next_run_at_ms);
        BindNullableI64(st, 8, r.started_at_ms);
        BindNullableI64(st, 9, r.finished_at_ms);
        BindNullableText(st, 10, r.error_code);
        BindNullableText(st, 11, r.error_message);
        BindNullableText(st, 12, r.trace_id);
        BindNullableText(st, 13, r.payload_json);
        BindI64(st, 14, r.updated_at_ms);
        BindI64(st, 15, static_cast<int64_t>(next_version));
        BindI64(st, 16, static_cast<int64_t>(expected_version));
      },
      "jobs", "id", r.id);

  if (result) r.version = next_version;
  return result;
}

std::vector<model::JobRecord> SqliteRepository::ListClaimableJobs(Transaction& t, const std::vector<std::string>& scopes, int64_t now_ms,
                                                                  uint32_t limit) {
  if (scopes.empty()) return {};

  std::string placeholders;
  for (std::size_t i = 0; i < scopes.size(); ++i) {
    placeholders += i == 0 ? "?" : ",?";
  }

  return QueryRows<model::JobRecord>(
      TX(t).Handle(),
      Select(kJobColumns, "jobs",
             "WHERE scope IN (" + placeholders +
                 ") AND ((status=? AND next_run_at_ms<=?) OR "
                 "(status=? AND lease_expires_at_ms IS NOT NULL AND lease_expires_at_ms<?)) "
                 "ORDER BY next_run_at_ms ASC, created_at_ms ASC LIMIT ?;"),
      [&](sqlite3_stmt* st) {
        int idx = 1;
        for (const auto& scope : scopes) BindText(st, idx++, scope);
        BindI64(st, idx++, creditgate::v1::JOB_STATUS_QUEUED);
        BindI64(st, idx++, now_ms);
        BindI64(st, idx++, creditgate::v1::JOB_STATUS_RUNNING);
        BindI64(st, idx++, now_ms);
        BindI64(st, idx, limit);
      },
      ReadJob);
}

std::vector<model::JobRecord> SqliteRepository::ListRunningJobsStartedBefore(Transaction& t, const std::string& scope, int64_t before_ms,
                                                                             uint32_t limit) {
  return QueryRows<model::JobRecord>(
      TX(t).Handle(),
      Select(kJobColumns, "jobs",
             "WHERE scope=? AND status=? AND started_at_ms IS NOT NULL AND started_at_ms<? ORDER BY started_at_ms ASC LIMIT ?;"),
      [&](sqlite3_stmt* st) {
        BindText(st, 1, scope);
        BindI64(st, 2, creditgate::v1::JOB_STATUS_RUNNING);
        BindI64(st, 3, before_ms);
        BindI64(st, 4, limit);
      },
      ReadJob);
}

// ------------------------------------------------------------------
// Sweep bookkeeping
// ------------------------------------------------------------------

std::optional<model::SweepStateRecord> SqliteRepository::GetSweepState(Transaction& t, const std::string& name) {
  return QueryRow<model::SweepStateRecord>(
      TX(t).Handle(), "SELECT name,last_started_at_ms,last_finished_at_ms,last_trace_id FROM sweep_state WHERE name=?;",
      [&](sqlite3_stmt* st) { BindText(st, 1, name); },
      [](sqlite3_stmt* st) {
        model::SweepStateRecord r;
        r.name                = ColText(st, 0);
        r.last_started_at_ms  = ColI64(st, 1);
        r.last_finished_at_ms = ColI64(st, 2);
        r.last_trace_id       = ColText(st, 3);
        return r;
      });
}

Result SqliteRepository::UpsertSweepState(Transaction& t, const model::SweepStateRecord& r) {
  return Execute(TX(t).Handle(),
                 "INSERT INTO sweep_state(name,last_started_at_ms,last_finished_at_ms,last_trace_id) VALUES(?,?,?,?) "
                 "ON CONFLICT(name) DO UPDATE SET last_started_at_ms=excluded.last_started_at_ms,"
                 "last_finished_at_ms=excluded.last_finished_at_ms,last_trace_id=excluded.last_trace_id;",
                 [&](sqlite3_stmt* st) {
                   BindText(st, 1, r.name);
                   BindNullableI64(st, 2, r.last_started_at_ms);
                   BindNullableI64(st, 3, r.last_finished_at_ms);
                   BindNullableText(st, 4, r.last_trace_id);
                 });
}

} // namespace creditgate::db::sqlite
