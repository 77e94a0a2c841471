#include "sqlite_schema.hpp"

#include <string>
#include <vector>

namespace creditgate::db::sqlite {

void BootstrapSchema(SqliteDB& db) {
  static const std::vector<std::string> kBootstrapSql = {
      "CREATE TABLE IF NOT EXISTS unlocks (id TEXT PRIMARY KEY, source_item_id TEXT NOT NULL UNIQUE, source_page_id TEXT, status INTEGER NOT NULL, "
      "estimated_cost_millis INTEGER NOT NULL, reserved_by_user_id TEXT, reservation_expires_at_ms INTEGER, reservation_id TEXT, "
      "reserved_ledger_id TEXT, reserved_amount_millis INTEGER NOT NULL DEFAULT 0, blueprint_id TEXT, job_id TEXT, last_error_code TEXT, "
      "last_error_message TEXT, created_at_ms INTEGER NOT NULL, updated_at_ms INTEGER NOT NULL, version INTEGER NOT NULL);",
      "CREATE INDEX IF NOT EXISTS unlocks_status_expiry_idx ON unlocks(status, reservation_expires_at_ms);",
      "CREATE INDEX IF NOT EXISTS unlocks_job_idx ON unlocks(job_id);",
      "CREATE TABLE IF NOT EXISTS wallets (user_id TEXT PRIMARY KEY, balance_millis INTEGER NOT NULL, capacity_millis INTEGER NOT NULL, "
      "refill_rate_per_sec REAL NOT NULL, last_refill_at_ms INTEGER NOT NULL, created_at_ms INTEGER NOT NULL, updated_at_ms INTEGER NOT NULL, "
      "version INTEGER NOT NULL);",
      "CREATE TABLE IF NOT EXISTS ledger_entries (id TEXT PRIMARY KEY, idempotency_key TEXT NOT NULL UNIQUE, entry_type INTEGER NOT NULL, "
      "user_id TEXT NOT NULL, amount_millis INTEGER NOT NULL, delta_millis INTEGER NOT NULL, balance_after_millis INTEGER NOT NULL, "
      "reason_code TEXT NOT NULL, context_json TEXT NOT NULL, resolves_ledger_id TEXT UNIQUE, created_at_ms INTEGER NOT NULL);",
      "CREATE INDEX IF NOT EXISTS ledger_entries_user_created_idx ON ledger_entries(user_id, created_at_ms);",
      "CREATE TABLE IF NOT EXISTS provider_circuit_state (provider_key TEXT PRIMARY KEY, state INTEGER NOT NULL, opened_at_ms INTEGER, "
      "cooldown_until_ms INTEGER, failure_count INTEGER NOT NULL, last_error TEXT, updated_at_ms INTEGER NOT NULL, version INTEGER NOT NULL);",
      "CREATE TABLE IF NOT EXISTS jobs (id TEXT PRIMARY KEY, scope TEXT NOT NULL, dedupe_key TEXT UNIQUE, status INTEGER NOT NULL, "
      "attempts INTEGER NOT NULL, max_attempts INTEGER NOT NULL, worker_id TEXT, lease_expires_at_ms INTEGER, next_run_at_ms INTEGER NOT NULL, "
      "started_at_ms INTEGER, finished_at_ms INTEGER, error_code TEXT, error_message TEXT, trace_id TEXT, payload_json TEXT, "
      "created_at_ms INTEGER NOT NULL, updated_at_ms INTEGER NOT NULL, version INTEGER NOT NULL);",
      "CREATE INDEX IF NOT EXISTS jobs_scope_status_idx ON jobs(scope, status);",
      "CREATE TABLE IF NOT EXISTS sweep_state (name TEXT PRIMARY KEY, last_started_at_ms INTEGER, last_finished_at_ms INTEGER, last_trace_id TEXT);"};

  for (const auto& sql : kBootstrapSql) {
    db.Exec(sql);
  }

  db.Exec("SELECT id,status,reservation_id,version FROM unlocks LIMIT 1;");
  db.Exec("SELECT idempotency_key,resolves_ledger_id FROM ledger_entries LIMIT 1;");
}

} // namespace creditgate::db::sqlite
