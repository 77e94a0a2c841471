#include <cassert>
#include <chrono>
#include <cstdlib>
#include <filesystem>
#include <functional>
#include <iostream>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

#include "internal/db/api/repository.hpp"
#include "internal/db/memory/memory_repository.hpp"

#if CREDITGATE_DB_SQLITE
#include "internal/db/sqlite/sqlite_db.hpp"
#include "internal/db/sqlite/sqlite_repository.hpp"
#include "internal/db/sqlite/sqlite_schema.hpp"
#endif

#if CREDITGATE_DB_POSTGRES
#include "internal/db/postgres/pg_pool.hpp"
#include "internal/db/postgres/pg_repository.hpp"
#include "internal/db/postgres/pg_schema.hpp"
#endif

namespace {

using creditgate::db::ErrorCode;
using creditgate::db::Repository;
using creditgate::db::memory::MemoryRepository;
using creditgate::db::model::CircuitStateRecord;
using creditgate::db::model::JobRecord;
using creditgate::db::model::LedgerEntryRecord;
using creditgate::db::model::SweepStateRecord;
using creditgate::db::model::UnlockRecord;
using creditgate::db::model::WalletRecord;
using namespace creditgate::v1;

int64_t NowMs() {
  return std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::system_clock::now().time_since_epoch()).count();
}

struct BackendFactory {
  std::string                                       name;
  std::function<std::shared_ptr<Repository>()>      make_repository;
  std::function<bool()>                             supports_restart;
  std::function<void(std::shared_ptr<Repository>&)> restart;
  std::function<void()>                             cleanup;
};

UnlockRecord MakeUnlock(const std::string& id, const std::string& source_item_id) {
  UnlockRecord r;
  r.id                    = id;
  r.source_item_id        = source_item_id;
  r.source_page_id        = "page-1";
  r.status                = UNLOCK_STATUS_AVAILABLE;
  r.estimated_cost_millis = 250;
  r.created_at_ms         = NowMs();
  r.updated_at_ms         = r.created_at_ms;
  r.version               = 1;
  return r;
}

LedgerEntryRecord MakeEntry(const std::string& id, const std::string& key, const std::string& user, LedgerEntryType type,
                            int64_t delta_millis, const std::string& resolves = {}) {
  LedgerEntryRecord e;
  e.id                   = id;
  e.idempotency_key      = key;
  e.entry_type           = type;
  e.user_id              = user;
  e.amount_millis        = delta_millis < 0 ? -delta_millis : delta_millis;
  e.delta_millis         = delta_millis;
  e.balance_after_millis = 10'000 + delta_millis;
  e.reason_code          = "TEST";
  e.context_json         = R"({"unlockId":"u"})";
  e.resolves_ledger_id   = resolves;
  e.created_at_ms        = NowMs();
  return e;
}

// Constraint violations abort a postgres transaction, so each duplicate
// insert runs alone and is rolled back.
template <typename Fn>
void ExpectDuplicate(Repository& repo, Fn&& insert) {
  auto tx = repo.Begin();
  assert(insert(*tx).IsDuplicate());
  tx->Rollback();
}

void VerifyUnlockCompareAndSwap(Repository& repo, const std::string& prefix) {
  const auto unlock = MakeUnlock(prefix + "-u", prefix + "-item");
  {
    auto tx = repo.Begin();
    assert(repo.InsertUnlock(*tx, unlock));
    tx->Commit();
  }
  ExpectDuplicate(repo, [&](auto& tx) { return repo.InsertUnlock(tx, MakeUnlock(prefix + "-u2", prefix + "-item")); });

  auto tx      = repo.Begin();
  auto by_item = repo.GetUnlockBySourceItem(*tx, prefix + "-item");
  assert(by_item.has_value());
  assert(by_item->id == unlock.id);
  assert(by_item->version == 1);

  auto next                      = *by_item;
  next.status                    = UNLOCK_STATUS_RESERVED;
  next.reserved_by_user_id       = "alice";
  next.reservation_id            = "r_1";
  next.reservation_expires_at_ms = 1000;
  next.job_id                    = prefix + "-job";
  assert(repo.CompareAndSwapUnlock(*tx, next, 1));
  assert(next.version == 2);

  auto stale = *by_item;
  assert(repo.CompareAndSwapUnlock(*tx, stale, 1).code == ErrorCode::Conflict);

  auto missing = MakeUnlock(prefix + "-missing", prefix + "-missing-item");
  assert(repo.CompareAndSwapUnlock(*tx, missing, 1).code == ErrorCode::NotFound);

  auto read = repo.GetUnlock(*tx, unlock.id);
  assert(read->status == UNLOCK_STATUS_RESERVED);
  assert(read->reserved_by_user_id == "alice");
  assert(read->source_item_id == prefix + "-item");
  assert(read->blueprint_id.empty());

  bool found = false;
  for (const auto& row : repo.ListExpiredUnlocks(*tx, UNLOCK_STATUS_RESERVED, 2000, 1000)) {
    found = found || row.id == unlock.id;
  }
  assert(found);
  for (const auto& row : repo.ListExpiredUnlocks(*tx, UNLOCK_STATUS_RESERVED, 1000, 1000)) {
    assert(row.id != unlock.id);
  }

  assert(repo.CountActiveUnlocksForJob(*tx, prefix + "-job") == 1);
  assert(repo.CountActiveUnlocksForJob(*tx, prefix + "-other-job") == 0);

  tx->Commit();
}

void VerifyLedgerUniqueness(Repository& repo, const std::string& prefix) {
  const auto user = prefix + "-user";

  WalletRecord wallet;
  wallet.user_id             = user;
  wallet.balance_millis      = 10'000;
  wallet.capacity_millis     = 10'000;
  wallet.refill_rate_per_sec = 1.0 / 360.0;
  wallet.last_refill_at_ms   = NowMs();
  wallet.version             = 1;

  const auto hold   = MakeEntry(prefix + "-hold", prefix + "-hold-key", user, LEDGER_ENTRY_TYPE_HOLD, -250);
  const auto settle = MakeEntry(prefix + "-settle", prefix + "-settle-key", user, LEDGER_ENTRY_TYPE_SETTLE, 0, hold.id);
  {
    auto tx = repo.Begin();
    assert(repo.InsertWallet(*tx, wallet));
    tx->Commit();
  }
  ExpectDuplicate(repo, [&](auto& tx) { return repo.InsertWallet(tx, wallet); });

  {
    auto tx               = repo.Begin();
    wallet.balance_millis = 9'750;
    assert(repo.CompareAndSwapWallet(*tx, wallet, 1));
    assert(wallet.version == 2);
    assert(repo.CompareAndSwapWallet(*tx, wallet, 1).code == ErrorCode::Conflict);

    assert(repo.InsertLedgerEntry(*tx, hold));
    assert(!repo.GetLedgerResolution(*tx, hold.id).has_value());
    tx->Commit();
  }
  ExpectDuplicate(repo, [&](auto& tx) {
    return repo.InsertLedgerEntry(tx, MakeEntry(prefix + "-hold2", prefix + "-hold-key", user, LEDGER_ENTRY_TYPE_HOLD, -250));
  });

  {
    auto tx = repo.Begin();
    assert(repo.InsertLedgerEntry(*tx, settle));
    tx->Commit();
  }
  // A hold resolves at most once, whatever the key.
  ExpectDuplicate(repo, [&](auto& tx) {
    return repo.InsertLedgerEntry(tx, MakeEntry(prefix + "-refund", prefix + "-refund-key", user, LEDGER_ENTRY_TYPE_REFUND, 250, hold.id));
  });

  auto tx         = repo.Begin();
  auto resolution = repo.GetLedgerResolution(*tx, hold.id);
  assert(resolution.has_value());
  assert(resolution->id == settle.id);
  assert(resolution->entry_type == LEDGER_ENTRY_TYPE_SETTLE);

  auto by_key = repo.GetLedgerEntryByKey(*tx, prefix + "-hold-key");
  assert(by_key.has_value());
  assert(by_key->delta_millis == -250);
  assert(by_key->context_json.find("unlockId") != std::string::npos);

  assert(repo.GetWallet(*tx, user)->balance_millis == 9'750);

  creditgate::db::LedgerQuery query;
  query.user_id = user;
  auto entries  = repo.ListLedgerEntries(*tx, query);
  assert(entries.size() == 2);
  assert(entries[0].created_at_ms <= entries[1].created_at_ms);

  tx->Commit();
}

void VerifyJobs(Repository& repo, const std::string& prefix) {
  const auto scope = prefix + "-scope";
  const auto now   = NowMs();

  JobRecord job;
  job.id             = prefix + "-job";
  job.scope          = scope;
  job.dedupe_key     = prefix + "-dedupe";
  job.status         = JOB_STATUS_QUEUED;
  job.max_attempts   = 3;
  job.next_run_at_ms = now;
  job.payload_json   = "{}";
  job.created_at_ms  = now;
  job.updated_at_ms  = now;
  job.version        = 1;
  {
    auto tx = repo.Begin();
    assert(repo.InsertJob(*tx, job));
    tx->Commit();
  }

  auto duplicate = job;
  duplicate.id   = prefix + "-job2";
  ExpectDuplicate(repo, [&](auto& tx) { return repo.InsertJob(tx, duplicate); });

  auto tx = repo.Begin();
  assert(repo.GetJobByDedupeKey(*tx, prefix + "-dedupe")->id == job.id);

  assert(repo.ListClaimableJobs(*tx, {scope}, now - 1, 10).empty());
  auto claimable = repo.ListClaimableJobs(*tx, {scope}, now, 10);
  assert(claimable.size() == 1);

  auto running                = claimable[0];
  running.status              = JOB_STATUS_RUNNING;
  running.attempts            = 1;
  running.worker_id           = "w";
  running.started_at_ms       = now;
  running.lease_expires_at_ms = now + 60'000;
  assert(repo.CompareAndSwapJob(*tx, running, 1));

  assert(repo.ListClaimableJobs(*tx, {scope}, now + 1000, 10).empty());
  assert(repo.ListClaimableJobs(*tx, {scope}, now + 60'001, 10).size() == 1);

  assert(repo.ListRunningJobsStartedBefore(*tx, scope, now, 10).empty());
  auto running_jobs = repo.ListRunningJobsStartedBefore(*tx, scope, now + 1, 10);
  assert(running_jobs.size() == 1);
  assert(running_jobs[0].worker_id == "w");
  assert(running_jobs[0].attempts == 1);

  tx->Commit();
}

void VerifyCircuitAndSweepState(Repository& repo, const std::string& prefix) {
  CircuitStateRecord circuit;
  circuit.provider_key  = prefix + "-provider";
  circuit.failure_count = 1;
  circuit.last_error    = "boom";
  circuit.version       = 1;
  {
    auto tx = repo.Begin();
    assert(repo.InsertCircuitState(*tx, circuit));
    tx->Commit();
  }
  ExpectDuplicate(repo, [&](auto& tx) { return repo.InsertCircuitState(tx, circuit); });

  auto tx                   = repo.Begin();
  circuit.state             = CIRCUIT_STATE_OPEN;
  circuit.cooldown_until_ms = 5000;
  assert(repo.CompareAndSwapCircuitState(*tx, circuit, 1));
  auto read = repo.GetCircuitState(*tx, circuit.provider_key);
  assert(read->state == CIRCUIT_STATE_OPEN);
  assert(read->cooldown_until_ms == 5000);
  assert(read->version == 2);

  SweepStateRecord state;
  state.name               = prefix + "-sweep";
  state.last_started_at_ms = 100;
  assert(repo.UpsertSweepState(*tx, state));
  state.last_finished_at_ms = 200;
  state.last_trace_id       = "ut_1";
  assert(repo.UpsertSweepState(*tx, state));

  auto sweep = repo.GetSweepState(*tx, state.name);
  assert(sweep->last_started_at_ms == 100);
  assert(sweep->last_finished_at_ms == 200);
  assert(sweep->last_trace_id == "ut_1");

  tx->Commit();
}

void VerifyRollbackBehavior(Repository& repo, const std::string& prefix) {
  {
    auto tx = repo.Begin();
    assert(repo.InsertUnlock(*tx, MakeUnlock(prefix + "-u", prefix + "-item")));
    tx->Rollback();
  }
  auto tx = repo.Begin();
  assert(!repo.GetUnlock(*tx, prefix + "-u").has_value());
  assert(!repo.GetUnlockBySourceItem(*tx, prefix + "-item").has_value());
  tx->Commit();
}

void VerifyConcurrentCompareAndSwap(Repository& repo, const std::string& prefix) {
  const auto id = prefix + "-u";
  {
    auto tx = repo.Begin();
    assert(repo.InsertUnlock(*tx, MakeUnlock(id, prefix + "-item")));
    tx->Commit();
  }

  constexpr int            kThreads = 8;
  std::vector<std::thread> threads;
  for (int i = 0; i < kThreads; ++i) {
    threads.emplace_back([&repo, &id] {
      for (;;) {
        auto tx      = repo.Begin();
        auto current = repo.GetUnlock(*tx, id);
        auto next    = *current;
        next.estimated_cost_millis += 1;
        const auto result = repo.CompareAndSwapUnlock(*tx, next, current->version);
        if (result) {
          tx->Commit();
          return;
        }
        tx->Rollback();
        assert(result.code != ErrorCode::NotFound);
      }
    });
  }
  for (auto& t : threads) t.join();

  auto tx    = repo.Begin();
  auto final = repo.GetUnlock(*tx, id);
  assert(final->version == 1 + kThreads);
  assert(final->estimated_cost_millis == 250 + kThreads);
  tx->Commit();
}

void VerifyRestartDurability(BackendFactory& backend, const std::string& prefix) {
  if (!backend.supports_restart()) {
    return;
  }

  auto repo = backend.make_repository();
  {
    auto tx = repo->Begin();
    assert(repo->InsertUnlock(*tx, MakeUnlock(prefix + "-u", prefix + "-item")));
    assert(repo->InsertLedgerEntry(*tx, MakeEntry(prefix + "-hold", prefix + "-key", prefix + "-user", LEDGER_ENTRY_TYPE_HOLD, -100)));
    tx->Commit();
  }

  backend.restart(repo);

  auto tx = repo->Begin();
  auto u  = repo->GetUnlock(*tx, prefix + "-u");
  assert(u.has_value());
  assert(u->estimated_cost_millis == 250);
  auto e = repo->GetLedgerEntryByKey(*tx, prefix + "-key");
  assert(e.has_value());
  assert(e->delta_millis == -100);
  tx->Commit();
}

BackendFactory MakeMemoryFactory() {
  return BackendFactory{
      .name             = "memory",
      .make_repository  = []() { return std::make_shared<MemoryRepository>(); },
      .supports_restart = []() { return false; },
      .restart          = [](std::shared_ptr<Repository>&) {},
      .cleanup          = []() {},
  };
}

#if CREDITGATE_DB_SQLITE
BackendFactory MakeSqliteFactory() {
  auto db_path = (std::filesystem::temp_directory_path() / ("creditgate_integration_sqlite_" + std::to_string(NowMs()) + ".db")).string();

  auto make_repo = [db_path]() {
    auto db = std::make_shared<creditgate::db::sqlite::SqliteDB>(db_path);
    creditgate::db::sqlite::BootstrapSchema(*db);
    return std::make_shared<creditgate::db::sqlite::SqliteRepository>(std::move(db));
  };

  return BackendFactory{
      .name             = "sqlite",
      .make_repository  = make_repo,
      .supports_restart = []() { return true; },
      .restart          = [make_repo](std::shared_ptr<Repository>& repo) { repo = make_repo(); },
      .cleanup          = [db_path]() { std::filesystem::remove(db_path); },
  };
}
#endif

#if CREDITGATE_DB_SQLITE
// A second connection waits out the busy timeout before giving up on a held write lock.
void VerifySqliteBusyTimeout() {
  const auto db_path = (std::filesystem::temp_directory_path() / ("creditgate_integration_busy_" + std::to_string(NowMs()) + ".db")).string();
  {
    creditgate::db::sqlite::SqliteDB holder(db_path, 100);
    creditgate::db::sqlite::SqliteDB waiter(db_path, 100);
    creditgate::db::sqlite::BootstrapSchema(holder);

    holder.Exec("BEGIN IMMEDIATE;");
    const auto started = std::chrono::steady_clock::now();
    bool       threw   = false;
    try {
      waiter.Exec("BEGIN IMMEDIATE;");
    } catch (const std::runtime_error& ex) {
      threw = std::string(ex.what()).find("locked") != std::string::npos;
    }
    const auto waited = std::chrono::steady_clock::now() - started;
    assert(threw);
    assert(waited >= std::chrono::milliseconds(80));

    holder.Exec("ROLLBACK;");
    waiter.Exec("BEGIN IMMEDIATE;");
    waiter.Exec("ROLLBACK;");
  }
  std::filesystem::remove(db_path);
}
#endif

#if CREDITGATE_DB_POSTGRES
BackendFactory MakePostgresFactory() {
  const char* uri = std::getenv("CREDITGATE_TEST_POSTGRES_URI");
  if (uri == nullptr || std::string(uri).empty()) {
    throw std::runtime_error("CREDITGATE_TEST_POSTGRES_URI is not set");
  }

  auto conninfo  = std::string(uri);
  auto make_repo = [conninfo]() {
    auto pool = std::make_shared<creditgate::db::postgres::PgPool>(conninfo);
    creditgate::db::postgres::BootstrapSchema(pool);
    return std::make_shared<creditgate::db::postgres::PgRepository>(std::move(pool));
  };

  return BackendFactory{
      .name             = "postgres",
      .make_repository  = make_repo,
      .supports_restart = []() { return true; },
      .restart          = [make_repo](std::shared_ptr<Repository>& repo) { repo = make_repo(); },
      .cleanup          = []() {},
  };
}
#endif

void RunBackendSuite(BackendFactory& backend) {
  std::cout << "running backend suite: " << backend.name << "\n";
  auto repo = backend.make_repository();

  // Postgres keeps rows between runs.
  const auto run = backend.name + "-" + std::to_string(NowMs());

  VerifyUnlockCompareAndSwap(*repo, run + "-cas");
  VerifyLedgerUniqueness(*repo, run + "-ledger");
  VerifyJobs(*repo, run + "-jobs");
  VerifyCircuitAndSweepState(*repo, run + "-state");
  VerifyRollbackBehavior(*repo, run + "-rollback");
  VerifyConcurrentCompareAndSwap(*repo, run + "-concurrency");

  VerifyRestartDurability(backend, run + "-durable");

  backend.cleanup();
}

} // namespace

int main() {
  std::vector<BackendFactory> backends;
  backends.push_back(MakeMemoryFactory());

#if CREDITGATE_DB_SQLITE
  backends.push_back(MakeSqliteFactory());
#endif

#if CREDITGATE_DB_POSTGRES
  try {
    backends.push_back(MakePostgresFactory());
  } catch (const std::exception& ex) {
    std::cout << "skipping postgres integration suite: " << ex.what() << "\n";
  }
#endif

  for (auto& backend : backends) {
    RunBackendSuite(backend);
  }

#if CREDITGATE_DB_SQLITE
  VerifySqliteBusyTimeout();
#endif

  std::cout << "creditgate_integration_repository_parity: pass\n";
  return 0;
}
