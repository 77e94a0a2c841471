#include "internal/jobs/job_lease_store.hpp"

#include <cassert>
#include <iostream>
#include <memory>
#include <string>

#include "internal/db/memory/memory_repository.hpp"
#include "internal/util/errors.hpp"

namespace {

using creditgate::db::memory::MemoryRepository;
using creditgate::jobs::EnqueueRequest;
using creditgate::jobs::RepositoryJobLeaseStore;
using namespace creditgate::v1;

constexpr char kScope[] = "source_item_unlock_generation";

struct Harness {
  int64_t                           now_ms = 1'700'000'000'000;
  std::shared_ptr<MemoryRepository> repo  = std::make_shared<MemoryRepository>();
  RepositoryJobLeaseStore           jobs;

  Harness() : jobs(repo, [this] { return creditgate::util::FromUnixMillis(now_ms); }) {
  }

  creditgate::db::model::JobRecord Enqueue(const std::string& dedupe, uint32_t max_attempts = 3) {
    EnqueueRequest request;
    request.scope        = kScope;
    request.dedupe_key   = dedupe;
    request.trace_id     = "ut_test";
    request.payload_json = R"({"unlockId":"u-1"})";
    request.max_attempts = max_attempts;
    return jobs.Enqueue(request);
  }
};

void TestEnqueueDedupes() {
  Harness h;
  auto    first  = h.Enqueue("unlock:u-1:reservation:r-1:generate");
  auto    second = h.Enqueue("unlock:u-1:reservation:r-1:generate");
  assert(first.id == second.id);
  assert(first.id.rfind("job_", 0) == 0);
  assert(first.status == JOB_STATUS_QUEUED);

  // No dedupe key: always a new job.
  assert(h.Enqueue("").id != h.Enqueue("").id);

  bool threw = false;
  try {
    h.jobs.Enqueue(EnqueueRequest{});
  } catch (const creditgate::util::InvalidArgument&) {
    threw = true;
  }
  assert(threw);
}

void TestClaimLeasesEachJobOnce() {
  Harness h;
  h.Enqueue("a");
  h.Enqueue("b");

  auto first = h.jobs.Claim({kScope}, 10, "worker-1", 60);
  assert(first.size() == 2);
  for (const auto& job : first) {
    assert(job.status == JOB_STATUS_RUNNING);
    assert(job.attempts == 1);
    assert(job.worker_id == "worker-1");
    assert(job.lease_expires_at_ms == h.now_ms + 60'000);
    assert(job.started_at_ms == h.now_ms);
  }

  assert(h.jobs.Claim({kScope}, 10, "worker-2", 60).empty());
  assert(h.jobs.Claim({"other_scope"}, 10, "worker-2", 60).empty());

  // Lapsed lease: claimable by anyone, attempts go up, started_at stays.
  const auto started = h.now_ms;
  h.now_ms += 61'000;
  auto stolen = h.jobs.Claim({kScope}, 1, "worker-2", 1);
  assert(stolen.size() == 1);
  assert(stolen[0].attempts == 2);
  assert(stolen[0].worker_id == "worker-2");
  assert(stolen[0].started_at_ms == started);
  // Lease floor is five seconds.
  assert(stolen[0].lease_expires_at_ms == h.now_ms + 5'000);
}

void TestTouchAndComplete() {
  Harness h;
  auto    job = h.Enqueue("t");
  h.jobs.Claim({kScope}, 1, "worker-1", 30);

  assert(!h.jobs.TouchLease(job.id, "worker-2", 30));
  h.now_ms += 10'000;
  assert(h.jobs.TouchLease(job.id, "worker-1", 30));
  assert(h.jobs.GetJob(job.id)->lease_expires_at_ms == h.now_ms + 30'000);

  assert(!h.jobs.CompleteJob(job.id, "worker-2"));
  assert(h.jobs.CompleteJob(job.id, "worker-1"));
  auto done = h.jobs.GetJob(job.id);
  assert(done->status == JOB_STATUS_SUCCEEDED);
  assert(done->finished_at_ms == h.now_ms);
  assert(!h.jobs.TouchLease(job.id, "worker-1", 30));
  assert(!h.jobs.CompleteJob("job_missing", "worker-1"));
}

void TestFailJobRequeuesUntilAttemptsRunOut() {
  Harness h;
  auto    job = h.Enqueue("f", 2);

  h.jobs.Claim({kScope}, 1, "w", 30);
  auto requeued = h.jobs.FailJob(job.id, "PROVIDER_DEGRADED", "down", 30);
  assert(requeued && requeued->status == JOB_STATUS_QUEUED);
  assert(requeued->next_run_at_ms == h.now_ms + 30'000);
  assert(requeued->worker_id.empty());
  assert(h.jobs.Claim({kScope}, 1, "w", 30).empty());

  h.now_ms += 30'000;
  assert(h.jobs.Claim({kScope}, 1, "w", 30).size() == 1);
  auto failed = h.jobs.FailJob(job.id, "PROVIDER_DEGRADED", "down", 30);
  assert(failed && failed->status == JOB_STATUS_FAILED);
  assert(failed->attempts == 2);
  assert(failed->error_code == "PROVIDER_DEGRADED");

  // Terminal jobs are left alone.
  assert(!h.jobs.FailJob(job.id, "X", "y", 0));

  // No retry delay fails at once.
  auto other = h.Enqueue("g", 5);
  h.jobs.Claim({kScope}, 1, "w", 30);
  assert(h.jobs.FailJob(other.id, "GENERATION_FAILED", "bad", 0)->status == JOB_STATUS_FAILED);
}

void TestOrphanHelpers() {
  Harness h;
  auto    old_job = h.Enqueue("old");
  h.jobs.Claim({kScope}, 1, "w", 3600);
  h.now_ms += 120'000;
  auto young = h.Enqueue("young");
  h.jobs.Claim({kScope}, 1, "w", 3600);
  auto queued = h.Enqueue("queued");

  auto stale = h.jobs.ListRunningStartedBefore(kScope, h.now_ms - 60'000, 10);
  assert(stale.size() == 1);
  assert(stale[0].id == old_job.id);

  const auto changed = h.jobs.MarkJobsFailed({old_job.id, young.id, queued.id, "job_missing"}, "ORPHANED", "sweep");
  assert(changed == 2);
  assert(h.jobs.GetJob(old_job.id)->status == JOB_STATUS_FAILED);
  assert(h.jobs.GetJob(young.id)->status == JOB_STATUS_FAILED);
  assert(h.jobs.GetJob(queued.id)->status == JOB_STATUS_QUEUED);
}

} // namespace

int main() {
  TestEnqueueDedupes();
  TestClaimLeasesEachJobOnce();
  TestTouchAndComplete();
  TestFailJobRequeuesUntilAttemptsRunOut();
  TestOrphanHelpers();

  std::cout << "creditgate_unit_job_lease_store: pass\n";
  return 0;
}
