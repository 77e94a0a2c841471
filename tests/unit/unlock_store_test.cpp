#include "internal/unlock/unlock_store.hpp"

#include <atomic>
#include <cassert>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

#include "internal/db/memory/memory_repository.hpp"
#include "internal/util/errors.hpp"

namespace {

using creditgate::db::memory::MemoryRepository;
using creditgate::unlock::ReserveKind;
using creditgate::unlock::UnlockStore;
using namespace creditgate::v1;

struct Harness {
  int64_t                           now_ms = 1'700'000'000'000;
  std::shared_ptr<MemoryRepository> repo  = std::make_shared<MemoryRepository>();
  UnlockStore                       store;

  Harness() : store(repo, creditgate::config::UnlockSettings{}, [this] { return creditgate::util::FromUnixMillis(now_ms); }) {
  }
};

void TestEnsureUnlockIsIdempotentPerItem() {
  Harness h;
  auto    first  = h.store.EnsureUnlock("  item-1 ", "page-1", 0.5);
  auto    second = h.store.EnsureUnlock("item-1", "page-1", 0.5);

  assert(first.id == second.id);
  assert(first.source_item_id == "item-1");
  assert(first.status == UNLOCK_STATUS_AVAILABLE);
  assert(first.estimated_cost_millis == 500);
  assert(second.version == first.version);

  // A new price (or page) is written through.
  auto repriced = h.store.EnsureUnlock("item-1", "", 0.25);
  assert(repriced.id == first.id);
  assert(repriced.estimated_cost_millis == 250);
  assert(repriced.source_page_id == "page-1");
  assert(repriced.version == first.version + 1);

  bool threw = false;
  try {
    h.store.EnsureUnlock("   ", "page", 1.0);
  } catch (const creditgate::util::InvalidArgument&) {
    threw = true;
  }
  assert(threw);
}

void TestReserveGrantsOneHolder() {
  Harness h;
  auto    row = h.store.EnsureUnlock("item-2", "page", 1.0);

  auto mine = h.store.Reserve(row, "alice", 1.0, 120);
  assert(mine.kind == ReserveKind::kReserved);
  assert(mine.reserved_now);
  assert(mine.unlock.reserved_by_user_id == "alice");
  assert(mine.unlock.reservation_id.rfind("r_", 0) == 0);
  assert(mine.unlock.reservation_expires_at_ms == h.now_ms + 120'000);

  // Same user again: same reservation, not newly reserved.
  auto again = h.store.Reserve(row, "alice", 1.0, 120);
  assert(again.kind == ReserveKind::kReserved);
  assert(!again.reserved_now);
  assert(again.unlock.reservation_id == mine.unlock.reservation_id);

  auto other = h.store.Reserve(row, "bob", 1.0, 120);
  assert(other.kind == ReserveKind::kInProgress);
  assert(other.unlock.reserved_by_user_id == "alice");
}

void TestConcurrentReserveHasOneWinner() {
  Harness    h;
  const auto row = h.store.EnsureUnlock("item-race", "page", 1.0);

  constexpr int     kThreads = 16;
  std::atomic<bool> go{false};
  std::atomic<int>  reserved{0};
  std::atomic<int>  reserved_now{0};
  std::atomic<int>  in_progress{0};

  std::vector<std::thread> threads;
  for (int i = 0; i < kThreads; ++i) {
    threads.emplace_back([&, i] {
      while (!go.load()) std::this_thread::yield();
      auto outcome = h.store.Reserve(row, "user-" + std::to_string(i), 1.0, 120);
      if (outcome.kind == ReserveKind::kReserved) ++reserved;
      if (outcome.kind == ReserveKind::kInProgress) ++in_progress;
      if (outcome.reserved_now) ++reserved_now;
    });
  }
  go = true;
  for (auto& t : threads) t.join();

  assert(reserved.load() == 1);
  assert(reserved_now.load() == 1);
  assert(in_progress.load() == kThreads - 1);

  auto after = h.store.GetUnlock(row.id);
  assert(after->status == UNLOCK_STATUS_RESERVED);
  assert(after->reserved_by_user_id.rfind("user-", 0) == 0);
  assert(after->version == row.version + 1);
}

void TestReserveReclaimsExpiredReservation() {
  Harness h;
  auto    row   = h.store.EnsureUnlock("item-3", "page", 1.0);
  auto    first = h.store.Reserve(row, "alice", 1.0, 30);
  auto    held  = h.store.AttachReservationLedger(row.id, first.unlock.reservation_id, "ledger-a", 1.0);
  assert(held && held->reserved_ledger_id == "ledger-a");

  h.now_ms += 31'000;

  auto taken = h.store.Reserve(*h.store.GetUnlock(row.id), "bob", 1.0, 30);
  assert(taken.kind == ReserveKind::kReserved);
  assert(taken.reserved_now);
  assert(taken.unlock.reserved_by_user_id == "bob");
  assert(taken.unlock.reserved_ledger_id.empty());
  assert(taken.reclaimed.has_value());
  assert(taken.reclaimed->reserved_by_user_id == "alice");
  assert(taken.reclaimed->reserved_ledger_id == "ledger-a");
}

void TestGuardedWritesFollowReservationId() {
  Harness h;
  auto    row   = h.store.EnsureUnlock("item-4", "page", 1.0);
  auto    first = h.store.Reserve(row, "alice", 1.0, 60);
  const auto rid = first.unlock.reservation_id;

  assert(!h.store.AttachReservationLedger(row.id, "r_other", "ledger", 1.0));
  assert(!h.store.MarkProcessing(row.id, "bob", "job-1"));
  assert(!h.store.MarkProcessing(row.id, "alice", "job-1", "r_other"));

  auto processing = h.store.MarkProcessing(row.id, "alice", "job-1", rid);
  assert(processing && processing->status == UNLOCK_STATUS_PROCESSING);
  assert(processing->job_id == "job-1");

  // Attaching is only legal while still reserved.
  assert(!h.store.AttachReservationLedger(row.id, rid, "ledger", 1.0));

  assert(!h.store.CompleteUnlock(row.id, "bp-1", "job-1", "r_other"));
  auto ready = h.store.CompleteUnlock(row.id, "bp-1", "job-1", rid);
  assert(ready && ready->status == UNLOCK_STATUS_READY);
  assert(ready->blueprint_id == "bp-1");
  assert(ready->reservation_id.empty());
  assert(ready->reserved_by_user_id.empty());

  auto after = h.store.Reserve(*ready, "bob", 1.0, 60);
  assert(after.kind == ReserveKind::kReady);
}

void TestReleaseAndFailFreeTheRow() {
  Harness h;
  auto    row   = h.store.EnsureUnlock("item-5", "page", 1.0);
  auto    first = h.store.Reserve(row, "alice", 1.0, 60);

  assert(!h.store.ReleaseReservation(row.id, "r_other", "X", "y"));

  auto released = h.store.ReleaseReservation(row.id, first.unlock.reservation_id, "INSUFFICIENT_CREDITS", "no money");
  assert(released && released->status == UNLOCK_STATUS_AVAILABLE);
  assert(released->last_error_code == "INSUFFICIENT_CREDITS");
  assert(released->reservation_id.empty());

  h.store.Reserve(*released, "bob", 1.0, 60);
  auto failed = h.store.FailUnlock(row.id, "", std::string(900, 'm'));
  assert(failed.status == UNLOCK_STATUS_AVAILABLE);
  assert(failed.last_error_code == "UNLOCK_GENERATION_FAILED");
  assert(failed.last_error_message.size() == 500);

  bool threw = false;
  try {
    h.store.FailUnlock("missing", "X", "y");
  } catch (const creditgate::util::NotFound&) {
    threw = true;
  }
  assert(threw);
}

void TestFindExpiredAndListProcessing() {
  Harness h;
  auto a = h.store.EnsureUnlock("item-a", "page", 1.0);
  auto b = h.store.EnsureUnlock("item-b", "page", 1.0);
  auto c = h.store.EnsureUnlock("item-c", "page", 1.0);

  h.store.Reserve(a, "u1", 1.0, 30);
  auto rb = h.store.Reserve(b, "u2", 1.0, 600);
  auto rc = h.store.Reserve(c, "u3", 1.0, 600);
  h.store.MarkProcessing(c.id, "u3", "job-c", rc.unlock.reservation_id);

  assert(h.store.FindExpiredReserved(10).empty());

  h.now_ms += 60'000;
  auto expired = h.store.FindExpiredReserved(10);
  assert(expired.size() == 1);
  assert(expired[0].id == a.id);

  auto processing = h.store.ListProcessing(10);
  assert(processing.size() == 1);
  assert(processing[0].id == c.id);
  (void)rb;
}

void TestToProtoConvertsMillicredits() {
  Harness h;
  auto    row   = h.store.EnsureUnlock("item-p", "page", 0.333);
  auto    proto = creditgate::unlock::ToProto(row);
  assert(proto.id() == row.id);
  assert(proto.estimated_cost() == 0.333);
  assert(proto.status() == UNLOCK_STATUS_AVAILABLE);
}

} // namespace

int main() {
  TestEnsureUnlockIsIdempotentPerItem();
  TestReserveGrantsOneHolder();
  TestConcurrentReserveHasOneWinner();
  TestReserveReclaimsExpiredReservation();
  TestGuardedWritesFollowReservationId();
  TestReleaseAndFailFreeTheRow();
  TestFindExpiredAndListProcessing();
  TestToProtoConvertsMillicredits();

  std::cout << "creditgate_unit_unlock_store: pass\n";
  return 0;
}
