#include "pg_pool.hpp"

namespace creditgate::db::postgres {

PgPool::PgPool(std::string conninfo, std::size_t max_connections)
    : conninfo_(std::move(conninfo)), max_connections_(max_connections == 0 ? 1 : max_connections) {
}

std::shared_ptr<pqxx::connection> PgPool::Acquire() {
  for (;;) {
    std::unique_lock lock(mutex_);

    if (!idle_.empty()) {
      auto conn = std::move(idle_.back());
      idle_.pop_back();
      return Wrap(conn.release());
    }

    if (live_connections_ < max_connections_) {
      ++live_connections_;
      lock.unlock();

      try {
        auto conn = std::make_unique<pqxx::connection>(conninfo_);
        PrepareStatements(*conn);
        return Wrap(conn.release());
      } catch (const std::exception&) {
        std::lock_guard rollback_lock(mutex_);
        --live_connections_;
        cv_.notify_one();
        throw;
      }
    }

    cv_.wait(lock, [this] { return !idle_.empty() || live_connections_ < max_connections_; });
  }
}

void PgPool::PrepareStatements(pqxx::connection& conn) {
  conn.prepare("get_unlock",
               "SELECT id,source_item_id,source_page_id,status,estimated_cost_millis,reserved_by_user_id,reservation_expires_at_ms,"
               "reservation_id,reserved_ledger_id,reserved_amount_millis,blueprint_id,job_id,last_error_code,last_error_message,"
               "created_at_ms,updated_at_ms,version FROM unlocks WHERE id=$1");

  conn.prepare("get_wallet",
               "SELECT user_id,balance_millis,capacity_millis,refill_rate_per_sec,last_refill_at_ms,created_at_ms,updated_at_ms,version "
               "FROM wallets WHERE user_id=$1");

  conn.prepare("cas_wallet",
               "UPDATE wallets SET balance_millis=$2,capacity_millis=$3,refill_rate_per_sec=$4,last_refill_at_ms=$5,updated_at_ms=$6,"
               "version=$7 WHERE user_id=$1 AND version=$8");

  conn.prepare("get_ledger_by_key",
               "SELECT id,idempotency_key,entry_type,user_id,amount_millis,delta_millis,balance_after_millis,reason_code,context_json,"
               "resolves_ledger_id,created_at_ms FROM ledger_entries WHERE idempotency_key=$1");

  conn.prepare("get_circuit",
               "SELECT provider_key,state,opened_at_ms,cooldown_until_ms,failure_count,last_error,updated_at_ms,version "
               "FROM provider_circuit_state WHERE provider_key=$1");
}

std::shared_ptr<pqxx::connection> PgPool::Wrap(pqxx::connection* conn) {
  std::weak_ptr<PgPool> weak_self = shared_from_this();
  return std::shared_ptr<pqxx::connection>(conn, [weak_self](pqxx::connection* released_conn) {
    if (auto self = weak_self.lock()) {
      self->Release(released_conn);
      return;
    }
    delete released_conn;
  });
}

void PgPool::Release(pqxx::connection* conn) {
  {
    std::lock_guard lock(mutex_);
    if (!conn->is_open()) {
      --live_connections_;
      delete conn;
      cv_.notify_one();
      return;
    }
    idle_.emplace_back(conn);
  }
  cv_.notify_one();
}

} // namespace creditgate::db::postgres
