#include "factory.hpp"

#include <chrono>
#include <stdexcept>

#include "internal/config/runtime_settings.hpp"
#include "internal/db/memory/memory_repository.hpp"
#include "internal/jobs/job_lease_store.hpp"
#include "internal/ledger/credit_ledger.hpp"
#include "internal/observability/logging.hpp"
#include "internal/provider/provider_circuit.hpp"
#include "internal/sweep/reliability_sweep.hpp"
#include "internal/unlock/unlock_store.hpp"
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
#if CREDITGATE_WITH_GRPC
#include "internal/grpc/unlock_server.hpp"
#endif

namespace creditgate::factory {

using creditgate::observability::StringField;

std::shared_ptr<db::Repository> BuildRepository(const creditgate::runtime::config::RuntimeConfig& config) {
  const auto& database = config.database();
  if (database.has_sqlite()) {
#if CREDITGATE_DB_SQLITE
    auto sqlite_db = std::make_shared<db::sqlite::SqliteDB>(database.sqlite().path(), database.sqlite().busy_timeout_ms());
    db::sqlite::BootstrapSchema(*sqlite_db);
    return std::make_shared<db::sqlite::SqliteRepository>(std::move(sqlite_db));
#else
    throw std::runtime_error("sqlite backend requested but not enabled at build time");
#endif
  }

  if (database.has_postgres()) {
#if CREDITGATE_DB_POSTGRES
    const auto max_connections = database.postgres().max_connections() == 0 ? 16u : database.postgres().max_connections();
    auto       pool            = std::make_shared<db::postgres::PgPool>(database.postgres().connection_uri(), max_connections);
    db::postgres::BootstrapSchema(pool);
    return std::make_shared<db::postgres::PgRepository>(std::move(pool));
#else
    throw std::runtime_error("postgres backend requested but not enabled at build time");
#endif
  }

  return std::make_shared<db::memory::MemoryRepository>();
}

/*
    Build full application dependency graph
*/
Application Build(const creditgate::runtime::config::RuntimeConfig& config, std::shared_ptr<service::ArtifactGenerator> generator) {
  Application app;

  const auto settings   = config::ResolveRuntimeSettings(config);
  auto       repository = BuildRepository(config);

  // ------------------------------------------------------------------
  // Core components
  // ------------------------------------------------------------------
  auto unlocks = std::make_shared<unlock::UnlockStore>(repository, settings.unlock);
  auto ledger  = std::make_shared<ledger::CreditLedger>(repository, settings.wallet);
  auto circuit = std::make_shared<provider::ProviderCircuit>(repository, settings.circuit);
  auto jobs    = std::make_shared<jobs::RepositoryJobLeaseStore>(repository);
  auto sweep   = std::make_shared<sweep::ReliabilitySweep>(repository, unlocks, ledger, jobs, settings.sweep);

  app.context.repository = repository;
  app.context.unlocks    = unlocks;
  app.context.ledger     = ledger;
  app.context.circuit    = circuit;
  app.context.jobs       = jobs;
  app.context.sweep      = sweep;
  app.context.settings   = settings;

  // ------------------------------------------------------------------
  // Services and background loops
  // ------------------------------------------------------------------
  app.unlock_service = std::make_shared<service::UnlockService>(app.context);

  if (settings.sweep.enabled && settings.sweep.schedule_interval_ms > 0) {
    app.sweep_scheduler = std::make_shared<sweep::SweepScheduler>(sweep, std::chrono::milliseconds(settings.sweep.schedule_interval_ms));
  }

  if (settings.worker.enabled) {
    if (generator) {
      app.worker = std::make_shared<service::UnlockWorker>(app.context, std::move(generator));
    } else {
      CREDITGATE_LOG_WARN("unlock worker enabled but no artifact generator is linked; jobs stay queued",
                          {StringField("worker_id", settings.worker.worker_id)});
    }
  }

#if CREDITGATE_WITH_GRPC
  // ------------------------------------------------------------------
  // gRPC servers
  // ------------------------------------------------------------------
  app.grpc_services.push_back(std::make_unique<grpc::UnlockServer>(app.unlock_service));
#endif

  return app;
}

void Application::StartBackground() {
  if (sweep_scheduler) sweep_scheduler->Start();
  if (worker) worker->Start();
}

void Application::StopBackground() {
  if (worker) worker->Stop();
  if (sweep_scheduler) sweep_scheduler->Stop();
}

} // namespace creditgate::factory
