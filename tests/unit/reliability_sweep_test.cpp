#include "internal/sweep/reliability_sweep.hpp"

#include <atomic>
#include <cassert>
#include <chrono>
#include <cmath>
#include <iostream>
#include <memory>
#include <string>
#include <thread>
#include <vector>

#include "internal/db/memory/memory_repository.hpp"
#include "internal/unlock/unlock_keys.hpp"

namespace {

using creditgate::db::memory::MemoryRepository;
using creditgate::db::model::UnlockRecord;
using creditgate::ledger::CreditLedger;
using creditgate::ledger::LedgerRequest;
using creditgate::sweep::ReliabilitySweep;
using creditgate::sweep::SweepOptions;
using namespace creditgate::v1;

bool Near(double a, double b) {
  return std::fabs(a - b) < 1e-9;
}

struct Harness {
  int64_t                                                now_ms = 1'700'000'000'000;
  std::shared_ptr<MemoryRepository>                      repo   = std::make_shared<MemoryRepository>();
  std::shared_ptr<creditgate::unlock::UnlockStore>       unlocks;
  std::shared_ptr<CreditLedger>                          ledger;
  std::shared_ptr<creditgate::jobs::RepositoryJobLeaseStore> jobs;
  std::shared_ptr<ReliabilitySweep>                      sweep;
  std::atomic<bool>                                      stall_next_clock{false};

  explicit Harness(creditgate::config::SweepSettings settings = {}) {
    auto now = [this] {
      if (stall_next_clock.exchange(false)) {
        std::this_thread::sleep_for(std::chrono::milliseconds(500));
      }
      return creditgate::util::FromUnixMillis(now_ms);
    };

    creditgate::config::UnlockSettings unlock_settings;
    unlock_settings.processing_window_seconds = 3600;

    unlocks = std::make_shared<creditgate::unlock::UnlockStore>(repo, unlock_settings, now);
    ledger  = std::make_shared<CreditLedger>(repo, creditgate::config::WalletSettings{}, now);
    jobs    = std::make_shared<creditgate::jobs::RepositoryJobLeaseStore>(repo, now);
    sweep   = std::make_shared<ReliabilitySweep>(repo, unlocks, ledger, jobs, settings, now);
  }

  // Reserved row with a 1.0 credit hold attached.
  UnlockRecord ReserveWithHold(const std::string& item, const std::string& user, uint32_t seconds = 60) {
    auto row      = unlocks->EnsureUnlock(item, "page", 1.0);
    auto reserved = unlocks->Reserve(row, user, 1.0, seconds).unlock;

    LedgerRequest hold;
    hold.user_id         = user;
    hold.amount          = 1.0;
    hold.idempotency_key = creditgate::unlock::ReservationHoldKey(reserved.id, reserved.reservation_id);
    hold.reason_code     = "UNLOCK_RESERVE";
    auto held            = ledger->ReserveCredits(hold);
    assert(held.outcome == creditgate::ledger::LedgerOutcome::kApplied);

    return *unlocks->AttachReservationLedger(reserved.id, reserved.reservation_id, held.ledger_id, 1.0);
  }

  SweepSummary Run(bool force, const std::string& mode = "cron") {
    SweepOptions options;
    options.force = force;
    options.mode  = mode;
    return sweep->Run(options);
  }
};

void TestExpiredReservationIsRefundedAndReleased() {
  Harness h;
  auto    row = h.ReserveWithHold("item-1", "alice", 30);
  assert(Near(h.ledger->GetWallet("alice").balance(), 9.0));

  h.now_ms += 31'000;
  auto summary = h.Run(false);
  assert(!summary.skipped());
  assert(summary.mode() == "cron");
  assert(summary.trace_id().rfind("ut_", 0) == 0);
  assert(summary.inspected().expired_candidates() == 1);
  assert(summary.expired_recovered() == 1);
  assert(summary.failed_items() == 0);

  auto after = h.unlocks->GetUnlock(row.id);
  assert(after->status == UNLOCK_STATUS_AVAILABLE);
  assert(after->last_error_code == "UNLOCK_RESERVATION_EXPIRED_RECOVERED");
  assert(after->reserved_ledger_id.empty());
  assert(Near(h.ledger->GetWallet("alice").balance(), 10.0));

  auto entries = h.ledger->ExportLedger({"alice", 0, 0, 100});
  assert(entries.size() == 2);
  assert(entries[1].entry_type() == LEDGER_ENTRY_TYPE_REFUND);
  assert(entries[1].reason_code() == "UNLOCK_RESERVATION_EXPIRED_REFUND");
  assert(entries[1].idempotency_key() ==
         creditgate::unlock::HoldResolutionKey(row.id, row.reserved_ledger_id, "sweep_reserved_expired_refund"));
  assert(entries[1].context().metadata().at("reason") == "reserved_expired");
}

void TestUnattachedHoldIsRefunded() {
  Harness h;
  auto    row      = h.unlocks->EnsureUnlock("item-crash", "page", 1.0);
  auto    reserved = h.unlocks->Reserve(row, "alice", 1.0, 30).unlock;

  // Charged, then the request died before linking the hold to the row.
  LedgerRequest hold;
  hold.user_id         = "alice";
  hold.amount          = 1.0;
  hold.idempotency_key = creditgate::unlock::ReservationHoldKey(reserved.id, reserved.reservation_id);
  hold.reason_code     = "UNLOCK_RESERVE";
  auto held            = h.ledger->ReserveCredits(hold);
  assert(h.unlocks->GetUnlock(reserved.id)->reserved_ledger_id.empty());
  assert(Near(h.ledger->GetWallet("alice").balance(), 9.0));

  h.now_ms += 31'000;
  auto summary = h.Run(false);
  assert(summary.expired_recovered() == 1);
  assert(summary.failed_items() == 0);
  assert(h.unlocks->GetUnlock(reserved.id)->status == UNLOCK_STATUS_AVAILABLE);
  assert(Near(h.ledger->GetWallet("alice").balance(), 10.0));

  auto entries = h.ledger->ExportLedger({"alice", 0, 0, 100});
  assert(entries.size() == 2);
  assert(entries[1].entry_type() == LEDGER_ENTRY_TYPE_REFUND);
  assert(entries[1].resolves_ledger_id() == held.ledger_id);
  assert(entries[1].idempotency_key() ==
         creditgate::unlock::HoldResolutionKey(reserved.id, held.ledger_id, "sweep_reserved_expired_refund"));
}

void TestConcurrentTriggersShareOneRun() {
  Harness h;
  h.ReserveWithHold("item-1", "alice", 30);
  h.now_ms += 31'000;

  // The first clock read inside the run stalls so the other triggers pile up behind it.
  h.stall_next_clock = true;

  constexpr int             kThreads = 8;
  std::vector<SweepSummary> summaries(kThreads);
  std::vector<std::thread>  threads;
  for (int i = 0; i < kThreads; ++i) {
    threads.emplace_back([&, i] { summaries[i] = h.sweep->RunIfDue(); });
  }
  for (auto& t : threads) t.join();

  for (const auto& summary : summaries) {
    assert(!summary.skipped());
    assert(summary.trace_id() == summaries[0].trace_id());
    assert(summary.expired_recovered() == 1);
  }

  // One refund, not one per trigger.
  assert(h.ledger->ExportLedger({"alice", 0, 0, 100}).size() == 2);
  assert(Near(h.ledger->GetWallet("alice").balance(), 10.0));
}

void TestCooldownIsDurable() {
  Harness h;
  auto    first = h.Run(false);
  assert(!first.skipped());

  auto second = h.sweep->RunIfDue("ut_caller");
  assert(second.skipped());
  assert(second.skip_reason() == "cooldown");
  assert(second.trace_id() == "ut_caller");
  assert(second.mode() == "opportunistic");

  assert(!h.Run(true, "admin").skipped());

  h.now_ms += 31'000;
  assert(!h.sweep->RunIfDue().skipped());
}

void TestDisabledSweepNeverRuns() {
  creditgate::config::SweepSettings settings;
  settings.enabled = false;
  Harness h(settings);

  auto summary = h.Run(true);
  assert(summary.skipped());
  assert(summary.skip_reason() == "disabled");
}

void TestStaleProcessingIsRecovered() {
  Harness h;

  // Processing row pointing at a job that does not exist.
  auto lost = h.ReserveWithHold("item-lost", "bob");
  h.unlocks->MarkProcessing(lost.id, "bob", "job_gone", lost.reservation_id);

  // Processing row with a live running job.
  auto live = h.ReserveWithHold("item-live", "carol");
  creditgate::jobs::EnqueueRequest enqueue;
  enqueue.scope = creditgate::sweep::kUnlockGenerationScope;
  h.jobs->Enqueue(enqueue);
  auto claimed = h.jobs->Claim({creditgate::sweep::kUnlockGenerationScope}, 1, "w", 600);
  h.unlocks->MarkProcessing(live.id, "carol", claimed[0].id, live.reservation_id);

  auto summary = h.Run(true);
  assert(summary.inspected().processing_candidates() == 2);
  assert(summary.processing_recovered() == 1);

  auto recovered = h.unlocks->GetUnlock(lost.id);
  assert(recovered->status == UNLOCK_STATUS_AVAILABLE);
  assert(recovered->last_error_code == "UNLOCK_PROCESSING_STALE_RECOVERED");
  assert(recovered->last_error_message.find("job_missing") != std::string::npos);
  assert(Near(h.ledger->GetWallet("bob").balance(), 10.0));

  assert(h.unlocks->GetUnlock(live.id)->status == UNLOCK_STATUS_PROCESSING);
  assert(Near(h.ledger->GetWallet("carol").balance(), 9.0));
}

void TestSettledHoldIsNotRefundedTwice() {
  Harness h;
  auto    row = h.ReserveWithHold("item-settled", "dan");
  h.unlocks->MarkProcessing(row.id, "dan", "job_gone", row.reservation_id);

  LedgerRequest settle;
  settle.user_id            = "dan";
  settle.amount             = 1.0;
  settle.idempotency_key    = creditgate::unlock::HoldResolutionKey(row.id, row.reserved_ledger_id, "settle");
  settle.reason_code        = "UNLOCK_SETTLE";
  settle.resolves_ledger_id = row.reserved_ledger_id;
  h.ledger->SettleReservation(settle);

  auto summary = h.Run(true);
  assert(summary.processing_recovered() == 1);
  assert(Near(h.ledger->GetWallet("dan").balance(), 9.0));
  assert(h.ledger->ExportLedger({"dan", 0, 0, 100}).size() == 2);
}

void TestOrphanJobsAreFailed() {
  Harness h;
  creditgate::jobs::EnqueueRequest enqueue;
  enqueue.scope = creditgate::sweep::kUnlockGenerationScope;

  enqueue.dedupe_key = "orphan";
  auto orphan        = h.jobs->Enqueue(enqueue);
  enqueue.dedupe_key = "owned";
  auto owned         = h.jobs->Enqueue(enqueue);
  h.jobs->Claim({creditgate::sweep::kUnlockGenerationScope}, 10, "w", 3600);

  auto row = h.ReserveWithHold("item-owned", "erin");
  h.unlocks->MarkProcessing(row.id, "erin", owned.id, row.reservation_id);

  h.now_ms += 11 * 60 * 1000;
  auto summary = h.Run(true);
  assert(summary.inspected().running_jobs() == 2);
  assert(summary.orphan_jobs_recovered() == 1);
  assert(summary.processing_recovered() == 0);

  auto failed = h.jobs->GetJob(orphan.id);
  assert(failed->status == JOB_STATUS_FAILED);
  assert(failed->error_code == "ORPHAN_UNLOCK_JOB_RECOVERED");
  assert(h.jobs->GetJob(owned.id)->status == JOB_STATUS_RUNNING);
}

} // namespace

int main() {
  TestExpiredReservationIsRefundedAndReleased();
  TestUnattachedHoldIsRefunded();
  TestConcurrentTriggersShareOneRun();
  TestCooldownIsDurable();
  TestDisabledSweepNeverRuns();
  TestStaleProcessingIsRecovered();
  TestSettledHoldIsNotRefundedTwice();
  TestOrphanJobsAreFailed();

  std::cout << "creditgate_unit_reliability_sweep: pass\n";
  return 0;
}
