#include "pg_schema.hpp"

namespace creditgate::db::postgres {

void BootstrapSchema(const std::shared_ptr<PgPool>& pool) {
  auto       conn = pool->Acquire();
  pqxx::work tx(*conn);

  tx.exec(
      "CREATE TABLE IF NOT EXISTS unlocks (id TEXT PRIMARY KEY, source_item_id TEXT NOT NULL UNIQUE, source_page_id TEXT, status SMALLINT NOT NULL, "
      "estimated_cost_millis BIGINT NOT NULL, reserved_by_user_id TEXT, reservation_expires_at_ms BIGINT, reservation_id TEXT, "
      "reserved_ledger_id TEXT, reserved_amount_millis BIGINT NOT NULL DEFAULT 0, blueprint_id TEXT, job_id TEXT, last_error_code TEXT, "
      "last_error_message TEXT, created_at_ms BIGINT NOT NULL, updated_at_ms BIGINT NOT NULL, version BIGINT NOT NULL);");
  tx.exec("CREATE INDEX IF NOT EXISTS unlocks_status_expiry_idx ON unlocks(status, reservation_expires_at_ms);");
  tx.exec("CREATE INDEX IF NOT EXISTS unlocks_job_idx ON unlocks(job_id);");
  tx.exec(
      "CREATE TABLE IF NOT EXISTS wallets (user_id TEXT PRIMARY KEY, balance_millis BIGINT NOT NULL, capacity_millis BIGINT NOT NULL, "
      "refill_rate_per_sec DOUBLE PRECISION NOT NULL, last_refill_at_ms BIGINT NOT NULL, created_at_ms BIGINT NOT NULL, "
      "updated_at_ms BIGINT NOT NULL, version BIGINT NOT NULL);");
  tx.exec(
      "CREATE TABLE IF NOT EXISTS ledger_entries (id TEXT PRIMARY KEY, idempotency_key TEXT NOT NULL UNIQUE, entry_type SMALLINT NOT NULL, "
      "user_id TEXT NOT NULL, amount_millis BIGINT NOT NULL, delta_millis BIGINT NOT NULL, balance_after_millis BIGINT NOT NULL, "
      "reason_code TEXT NOT NULL, context_json JSONB NOT NULL, resolves_ledger_id TEXT UNIQUE, created_at_ms BIGINT NOT NULL);");
  tx.exec("CREATE INDEX IF NOT EXISTS ledger_entries_user_created_idx ON ledger_entries(user_id, created_at_ms);");
  tx.exec(
      "CREATE TABLE IF NOT EXISTS provider_circuit_state (provider_key TEXT PRIMARY KEY, state SMALLINT NOT NULL, opened_at_ms BIGINT, "
      "cooldown_until_ms BIGINT, failure_count INTEGER NOT NULL, last_error TEXT, updated_at_ms BIGINT NOT NULL, version BIGINT NOT NULL);");
  tx.exec(
      "CREATE TABLE IF NOT EXISTS jobs (id TEXT PRIMARY KEY, scope TEXT NOT NULL, dedupe_key TEXT UNIQUE, status SMALLINT NOT NULL, "
      "attempts INTEGER NOT NULL, max_attempts INTEGER NOT NULL, worker_id TEXT, lease_expires_at_ms BIGINT, next_run_at_ms BIGINT NOT NULL, "
      "started_at_ms BIGINT, finished_at_ms BIGINT, error_code TEXT, error_message TEXT, trace_id TEXT, payload_json TEXT, "
      "created_at_ms BIGINT NOT NULL, updated_at_ms BIGINT NOT NULL, version BIGINT NOT NULL);");
  tx.exec("CREATE INDEX IF NOT EXISTS jobs_scope_status_idx ON jobs(scope, status);");
  tx.exec(
      "CREATE TABLE IF NOT EXISTS sweep_state (name TEXT PRIMARY KEY, last_started_at_ms BIGINT, last_finished_at_ms BIGINT, "
      "last_trace_id TEXT);");

  tx.commit();
}

} // namespace creditgate::db::postgres
