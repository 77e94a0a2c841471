#include "internal/service/unlock_service.hpp"

#include <atomic>
#include <cassert>
#include <cmath>
#include <functional>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <string>

#include "internal/db/memory/memory_repository.hpp"
#include "internal/jobs/job_lease_store.hpp"
#include "internal/ledger/credit_ledger.hpp"
#include "internal/provider/provider_circuit.hpp"
#include "internal/service/unlock_worker.hpp"
#include "internal/sweep/reliability_sweep.hpp"
#include "internal/unlock/unlock_store.hpp"
#include "internal/util/errors.hpp"

namespace {

using creditgate::db::memory::MemoryRepository;
using creditgate::service::GenerationRequest;
using creditgate::service::GenerationResult;
using creditgate::service::UnlockService;
using creditgate::service::UnlockWorker;
using namespace creditgate::v1;

bool Near(double a, double b) {
  return std::fabs(a - b) < 1e-9;
}

class FakeGenerator final : public creditgate::service::ArtifactGenerator {
 public:
  GenerationResult Generate(const GenerationRequest& request, uint32_t) override {
    assert(request.cancelled != nullptr && !request.cancelled->load());
    ++calls;
    if (during) {
      during();
    }
    if (fail) {
      throw std::runtime_error("renderer crashed");
    }
    return GenerationResult{"bp_" + request.unlock_id};
  }

  std::atomic<int>  calls{0};
  std::atomic<bool> fail{false};

  // Runs inside the first Generate call; set before the worker runs.
  std::function<void()> during;
};

struct Harness {
  int64_t                                     now_ms = 1'700'000'000'000;
  std::shared_ptr<MemoryRepository>           repo   = std::make_shared<MemoryRepository>();
  std::shared_ptr<FakeGenerator>              generator = std::make_shared<FakeGenerator>();
  creditgate::service::ServiceContext         ctx;
  std::unique_ptr<UnlockService>              service;
  std::unique_ptr<UnlockWorker>               worker;

  explicit Harness(double initial_balance = 10.0, bool with_sweep = true) {
    auto now = [this] { return creditgate::util::FromUnixMillis(now_ms); };

    auto& settings                  = ctx.settings;
    settings.wallet.initial_balance = initial_balance;
    settings.circuit                = creditgate::config::CircuitSettings{true, 5, 60};
    settings.retry.max_attempts     = 1;
    settings.worker.enabled         = true;

    ctx.repository = repo;
    ctx.unlocks    = std::make_shared<creditgate::unlock::UnlockStore>(repo, settings.unlock, now);
    ctx.ledger     = std::make_shared<creditgate::ledger::CreditLedger>(repo, settings.wallet, now);
    ctx.circuit    = std::make_shared<creditgate::provider::ProviderCircuit>(repo, settings.circuit, now);
    ctx.jobs       = std::make_shared<creditgate::jobs::RepositoryJobLeaseStore>(repo, now);
    if (with_sweep) {
      ctx.sweep = std::make_shared<creditgate::sweep::ReliabilitySweep>(repo, ctx.unlocks, ctx.ledger, ctx.jobs, settings.sweep, now);
    }

    service = std::make_unique<UnlockService>(ctx);
    worker  = std::make_unique<UnlockWorker>(ctx, generator);
  }

  RequestUnlockResponse Request(const std::string& user, const std::string& item, int64_t subscribers = 4) {
    RequestUnlockRequest req;
    req.set_user_id(user);
    req.set_source_item_id(item);
    req.set_source_page_id("page-1");
    req.set_active_subscriber_count(subscribers);
    return service->RequestUnlock(req);
  }

  double Balance(const std::string& user) {
    GetWalletRequest req;
    req.set_user_id(user);
    return service->GetWallet(req).wallet().balance();
  }

  Unlock Get(const std::string& item) {
    GetUnlockRequest req;
    req.set_source_item_id(item);
    return service->GetUnlock(req).unlock();
  }

  std::vector<LedgerEntry> Ledger(const std::string& user) {
    ExportLedgerRequest req;
    req.set_user_id(user);
    auto                     resp = service->ExportLedger(req);
    return {resp.entries().begin(), resp.entries().end()};
  }
};

void TestReserveChargesOnceAndQueuesJob() {
  Harness h;
  auto    first = h.Request("alice", "item-1");
  assert(first.outcome() == UNLOCK_OUTCOME_RESERVED);
  assert(first.reserved_now());
  assert(!first.ledger_id().empty());
  assert(first.job_id().rfind("job_", 0) == 0);
  assert(first.trace_id().rfind("ut_", 0) == 0);
  assert(first.unlock().status() == UNLOCK_STATUS_RESERVED);
  assert(first.unlock().reserved_by_user_id() == "alice");
  assert(first.unlock().reserved_ledger_id() == first.ledger_id());
  assert(Near(first.unlock().reserved_amount(), 0.25));
  assert(Near(first.wallet().balance(), 9.75));

  auto job = h.ctx.jobs->GetJob(first.job_id());
  assert(job->status == JOB_STATUS_QUEUED);
  assert(job->scope == creditgate::sweep::kUnlockGenerationScope);
  assert(job->payload_json.find(first.unlock().reservation_id()) != std::string::npos);

  // Same user again: the hold and the job are replayed, not duplicated.
  auto again = h.Request("alice", "item-1");
  assert(again.outcome() == UNLOCK_OUTCOME_RESERVED);
  assert(!again.reserved_now());
  assert(again.ledger_id() == first.ledger_id());
  assert(again.job_id() == first.job_id());
  assert(Near(h.Balance("alice"), 9.75));
  assert(h.Ledger("alice").size() == 1);
}

void TestOtherUserSeesInProgress() {
  Harness h;
  h.Request("alice", "item-1");

  auto bob = h.Request("bob", "item-1");
  assert(bob.outcome() == UNLOCK_OUTCOME_IN_PROGRESS);
  assert(bob.ledger_id().empty());
  assert(bob.job_id().empty());
  assert(Near(h.Balance("bob"), 10.0));
  assert(h.Ledger("bob").empty());
}

void TestInsufficientCreditsReleasesRow() {
  Harness h(0.5);
  auto    resp = h.Request("alice", "item-1", 1);
  assert(resp.outcome() == UNLOCK_OUTCOME_INSUFFICIENT_CREDITS);
  assert(Near(resp.required(), 1.0));
  assert(Near(resp.wallet().balance(), 0.5));
  assert(resp.ledger_id().empty());
  assert(resp.unlock().status() == UNLOCK_STATUS_AVAILABLE);
  assert(resp.unlock().last_error_code() == "INSUFFICIENT_CREDITS");
  assert(resp.unlock().reserved_by_user_id().empty());

  assert(h.ctx.jobs->Claim({creditgate::sweep::kUnlockGenerationScope}, 10, "w", 60).empty());

  // 180s of refill covers the missing half credit.
  h.now_ms += 180'000;
  assert(h.Request("alice", "item-1", 1).outcome() == UNLOCK_OUTCOME_RESERVED);
  assert(Near(h.Balance("alice"), 0.0));
}

void TestEmptyUserIsRejected() {
  Harness h;
  try {
    h.Request("  ", "item-1");
    assert(false);
  } catch (const creditgate::util::InvalidArgument& e) {
    assert(std::string(e.what()) == "AUTH_REQUIRED");
  }
}

void TestWorkerSuccessSettlesAndMarksReady() {
  Harness h;
  auto    reserved = h.Request("alice", "item-1");

  assert(h.worker->RunOnce() == 1);
  assert(h.generator->calls == 1);

  auto unlock = h.Get("item-1");
  assert(unlock.status() == UNLOCK_STATUS_READY);
  assert(unlock.blueprint_id() == "bp_" + unlock.id());
  assert(unlock.reserved_by_user_id().empty());
  assert(h.ctx.jobs->GetJob(reserved.job_id())->status == JOB_STATUS_SUCCEEDED);

  auto entries = h.Ledger("alice");
  assert(entries.size() == 2);
  assert(entries[1].entry_type() == LEDGER_ENTRY_TYPE_SETTLE);
  assert(entries[1].resolves_ledger_id() == reserved.ledger_id());
  assert(entries[1].reason_code() == "UNLOCK_SETTLE");
  assert(Near(h.Balance("alice"), 9.75));

  // Anyone asking afterwards gets the artifact for free.
  auto bob = h.Request("bob", "item-1");
  assert(bob.outcome() == UNLOCK_OUTCOME_READY);
  assert(Near(h.Balance("bob"), 10.0));

  assert(h.worker->RunOnce() == 0);
}

void TestWorkerFailureRefundsAndFreesRow() {
  Harness h;
  h.generator->fail = true;
  auto reserved     = h.Request("alice", "item-1");

  assert(h.worker->RunOnce() == 1);

  auto unlock = h.Get("item-1");
  assert(unlock.status() == UNLOCK_STATUS_AVAILABLE);
  assert(unlock.last_error_code() == "GENERATION_FAILED");
  assert(unlock.last_error_message() == "renderer crashed");

  auto job = h.ctx.jobs->GetJob(reserved.job_id());
  assert(job->status == JOB_STATUS_FAILED);
  assert(job->error_code == "GENERATION_FAILED");

  auto entries = h.Ledger("alice");
  assert(entries.size() == 2);
  assert(entries[1].entry_type() == LEDGER_ENTRY_TYPE_REFUND);
  assert(entries[1].reason_code() == "UNLOCK_GENERATION_FAILED_REFUND");
  assert(Near(h.Balance("alice"), 10.0));
}

void TestLeaseCoversSlowGeneration() {
  Harness h;
  h.ctx.settings.worker.lease_seconds = 5;

  auto second_ctx                     = h.ctx;
  second_ctx.settings.worker.worker_id = "worker-2";
  UnlockWorker first(h.ctx, h.generator);
  UnlockWorker second(second_ctx, h.generator);

  // A 5s lease cannot cover a 25s attempt, so the worker stretches it.
  assert(first.lease_seconds() >= 25);

  auto reserved = h.Request("alice", "item-1");

  auto once    = std::make_shared<std::atomic<bool>>(false);
  auto claimed = std::make_shared<std::atomic<uint32_t>>(0);
  h.generator->during = [&h, &second, once, claimed] {
    if (once->exchange(true)) return;
    h.now_ms += 10'000;
    claimed->store(second.RunOnce());
  };

  assert(first.RunOnce() == 1);
  assert(claimed->load() == 0);
  assert(h.generator->calls == 1);
  assert(h.Get("item-1").status() == UNLOCK_STATUS_READY);

  auto job = h.ctx.jobs->GetJob(reserved.job_id());
  assert(job->status == JOB_STATUS_SUCCEEDED);
  assert(job->attempts == 1);
}

void TestWorkerThatLostItsLeaseStandsDown() {
  Harness h;
  auto    second_ctx                     = h.ctx;
  second_ctx.settings.worker.worker_id = "worker-2";
  UnlockWorker second(second_ctx, h.generator);

  auto reserved = h.Request("alice", "item-1");

  // The first worker stalls past its lease; the second takes the job over.
  auto once    = std::make_shared<std::atomic<bool>>(false);
  auto claimed = std::make_shared<std::atomic<uint32_t>>(0);
  const auto stall_ms = static_cast<int64_t>(h.worker->lease_seconds() + 1) * 1000;
  h.generator->during = [&h, &second, once, claimed, stall_ms] {
    if (once->exchange(true)) return;
    h.now_ms += stall_ms;
    claimed->store(second.RunOnce());
  };

  assert(h.worker->RunOnce() == 1);
  assert(claimed->load() == 1);
  assert(h.generator->calls == 2);

  auto job = h.ctx.jobs->GetJob(reserved.job_id());
  assert(job->status == JOB_STATUS_SUCCEEDED);
  assert(job->worker_id == "worker-2");
  assert(h.Get("item-1").status() == UNLOCK_STATUS_READY);

  // Only the lease holder settled.
  auto entries = h.Ledger("alice");
  assert(entries.size() == 2);
  assert(entries[1].entry_type() == LEDGER_ENTRY_TYPE_SETTLE);
  assert(Near(h.Balance("alice"), 9.75));
}

void TestOpenCircuitDefersJob() {
  Harness h;
  auto    reserved = h.Request("alice", "item-1");

  for (int i = 0; i < 5; ++i) {
    h.ctx.circuit->RecordProviderFailure("artifact_generator", "upstream 503");
  }

  assert(h.worker->RunOnce() == 1);
  assert(h.generator->calls == 0);

  auto job = h.ctx.jobs->GetJob(reserved.job_id());
  assert(job->status == JOB_STATUS_QUEUED);
  assert(job->error_code == "PROVIDER_DEGRADED");
  assert(job->next_run_at_ms == h.now_ms + 60'000);

  // The reservation and its hold survive the deferral.
  assert(h.Get("item-1").status() == UNLOCK_STATUS_PROCESSING);
  assert(Near(h.Balance("alice"), 9.75));
  assert(h.worker->RunOnce() == 0);

  GetProviderCircuitRequest circuit_req;
  assert(h.service->GetProviderCircuit(circuit_req).circuit().state() == CIRCUIT_STATE_OPEN);

  // Cooldown over: the trial call goes through and closes the circuit.
  h.now_ms += 61'000;
  assert(h.worker->RunOnce() == 1);
  assert(h.Get("item-1").status() == UNLOCK_STATUS_READY);
  assert(h.ctx.jobs->GetJob(reserved.job_id())->status == JOB_STATUS_SUCCEEDED);

  auto circuit = h.service->GetProviderCircuit(circuit_req).circuit();
  assert(circuit.state() == CIRCUIT_STATE_CLOSED);
  assert(circuit.failure_count() == 0);
}

void TestExpiredReservationIsRefundedOnTakeover() {
  Harness h;
  h.Request("alice", "item-1");
  assert(Near(h.Balance("alice"), 9.75));

  h.now_ms += 121'000;
  auto bob = h.Request("bob", "item-1");
  assert(bob.outcome() == UNLOCK_OUTCOME_RESERVED);
  assert(bob.unlock().reserved_by_user_id() == "bob");

  auto entries = h.Ledger("alice");
  assert(entries.size() == 2);
  assert(entries[1].entry_type() == LEDGER_ENTRY_TYPE_REFUND);
  assert(entries[1].reason_code() == "UNLOCK_RESERVATION_EXPIRED_REFUND");
  assert(Near(h.Balance("alice"), 10.0));
}

void TestReadViews() {
  Harness h;
  auto    reserved = h.Request("alice", "item-1");

  GetUnlockRequest by_id;
  by_id.set_unlock_id(reserved.unlock().id());
  assert(h.service->GetUnlock(by_id).unlock().source_item_id() == "item-1");

  GetUnlockRequest missing;
  missing.set_source_item_id("nope");
  try {
    h.service->GetUnlock(missing);
    assert(false);
  } catch (const creditgate::util::NotFound&) {
  }

  try {
    h.service->GetUnlock(GetUnlockRequest{});
    assert(false);
  } catch (const creditgate::util::InvalidArgument&) {
  }

  ExportLedgerRequest everyone;
  everyone.set_limit(10);
  assert(h.service->ExportLedger(everyone).entries_size() == 1);

  GetProviderCircuitRequest circuit_req;
  circuit_req.set_provider_key("other_provider");
  auto circuit = h.service->GetProviderCircuit(circuit_req).circuit();
  assert(circuit.provider_key() == "other_provider");
  assert(circuit.state() == CIRCUIT_STATE_CLOSED);
}

void TestRunSweep() {
  Harness h;
  RunSweepRequest req;
  req.set_force(true);
  req.set_trace_id("ut_admin");
  auto summary = h.service->RunSweep(req).summary();
  assert(!summary.skipped());
  assert(summary.mode() == "admin");
  assert(summary.trace_id() == "ut_admin");

  Harness no_sweep(10.0, false);
  try {
    no_sweep.service->RunSweep(req);
    assert(false);
  } catch (const creditgate::util::InvalidState&) {
  }
}

} // namespace

int main() {
  TestReserveChargesOnceAndQueuesJob();
  TestOtherUserSeesInProgress();
  TestInsufficientCreditsReleasesRow();
  TestEmptyUserIsRejected();
  TestWorkerSuccessSettlesAndMarksReady();
  TestWorkerFailureRefundsAndFreesRow();
  TestLeaseCoversSlowGeneration();
  TestWorkerThatLostItsLeaseStandsDown();
  TestOpenCircuitDefersJob();
  TestExpiredReservationIsRefundedOnTakeover();
  TestReadViews();
  TestRunSweep();

  std::cout << "creditgate_unit_unlock_service: pass\n";
  return 0;
}
