#include "unlock_worker.hpp"

#include <google/protobuf/util/json_util.h>

#include <algorithm>
#include <chrono>
#include <stdexcept>

#include "creditgate/v1.hpp"
#include "internal/jobs/job_lease_store.hpp"
#include "internal/ledger/credit_ledger.hpp"
#include "internal/observability/unlock_trace.hpp"
#include "internal/provider/provider_circuit.hpp"
#include "internal/provider/provider_retry.hpp"
#include "internal/sweep/reliability_sweep.hpp"
#include "internal/unlock/unlock_keys.hpp"
#include "internal/unlock/unlock_store.hpp"
#include "internal/util/credits.hpp"
#include "internal/util/errors.hpp"

namespace creditgate::service {

using creditgate::db::model::JobRecord;
using creditgate::db::model::UnlockRecord;
using creditgate::observability::StringField;

namespace {

constexpr char kSettleReasonCode[]       = "UNLOCK_SETTLE";
constexpr char kFailedRefundReasonCode[] = "UNLOCK_GENERATION_FAILED_REFUND";
constexpr char kGenerationFailedCode[]   = "GENERATION_FAILED";
constexpr char kSupersededCode[]         = "RESERVATION_SUPERSEDED";
constexpr char kBadPayloadCode[]         = "INVALID_JOB_PAYLOAD";

constexpr uint32_t kLeaseSlackSeconds   = 10;
constexpr uint32_t kMinHeartbeatSeconds = 1;

class JobLeaseLost : public std::runtime_error {
 public:
  explicit JobLeaseLost(const std::string& job_id) : std::runtime_error("JOB_LEASE_LOST: " + job_id) {
  }
};

/*
  Renews a claimed job's lease every third of its length until destroyed.
  lost() turns true once a renewal is refused.
*/
class LeaseHeartbeat {
 public:
  LeaseHeartbeat(jobs::JobLeaseStore& jobs, std::string job_id, std::string worker_id, uint32_t lease_seconds)
      : jobs_(jobs), job_id_(std::move(job_id)), worker_id_(std::move(worker_id)), lease_seconds_(lease_seconds) {
    thread_ = std::thread(&LeaseHeartbeat::Run, this);
  }

  ~LeaseHeartbeat() {
    {
      std::lock_guard<std::mutex> lock(mutex_);
      stopped_ = true;
    }
    cv_.notify_all();
    thread_.join();
  }

  LeaseHeartbeat(const LeaseHeartbeat&)            = delete;
  LeaseHeartbeat& operator=(const LeaseHeartbeat&) = delete;

  bool lost() const {
    return lost_.load();
  }

  // Renews now. False when the lease belongs to someone else.
  bool Touch() {
    if (lost_.load()) return false;
    if (!jobs_.TouchLease(job_id_, worker_id_, lease_seconds_)) {
      lost_ = true;
    }
    return !lost_.load();
  }

 private:
  void Run() {
    const auto interval = std::chrono::seconds(std::max(kMinHeartbeatSeconds, lease_seconds_ / 3));
    std::unique_lock<std::mutex> lock(mutex_);
    while (!stopped_) {
      if (cv_.wait_for(lock, interval, [this] { return stopped_; })) break;
      lock.unlock();
      try {
        if (!Touch()) {
          CREDITGATE_LOG_WARN("unlock job lease renewal refused", {StringField("job_id", job_id_), StringField("worker_id", worker_id_)});
          return;
        }
      } catch (const std::exception& e) {
        // The next beat or the pre-attempt check retries the renewal.
        CREDITGATE_LOG_WARN("unlock job lease renewal failed", {StringField("job_id", job_id_), StringField("error", e.what())});
      }
      lock.lock();
    }
  }

  jobs::JobLeaseStore&    jobs_;
  std::string             job_id_;
  std::string             worker_id_;
  uint32_t                lease_seconds_;
  std::atomic<bool>       lost_{false};
  bool                    stopped_ = false;
  std::mutex              mutex_;
  std::condition_variable cv_;
  std::thread             thread_;
};

creditgate::v1::LedgerContext JobContext(const UnlockRecord& unlock, const JobRecord& job, const std::string& trace_id) {
  creditgate::v1::LedgerContext context;
  context.set_unlock_id(unlock.id);
  context.set_source_item_id(unlock.source_item_id);
  context.set_source_page_id(unlock.source_page_id);
  context.set_trace_id(trace_id);
  (*context.mutable_metadata())["job_id"] = job.id;
  (*context.mutable_metadata())["source"] = "unlock_worker";
  return context;
}

} // namespace

UnlockWorker::UnlockWorker(ServiceContext ctx, std::shared_ptr<ArtifactGenerator> generator)
    : ctx_(std::move(ctx)), generator_(std::move(generator)) {
  const auto& worker     = ctx_.settings.worker;
  const auto  call_ms    = provider::MaxCallDurationMs(provider::MakeRetryOptions(worker.provider_key, ctx_.settings.retry));
  const auto  call_secs  = static_cast<uint32_t>((call_ms + 999) / 1000);
  lease_seconds_         = std::max(worker.lease_seconds, call_secs + kLeaseSlackSeconds);
  if (lease_seconds_ != worker.lease_seconds) {
    CREDITGATE_LOG_WARN("worker lease shorter than a provider call; raised",
                        {observability::IntField("configured_seconds", worker.lease_seconds),
                         observability::IntField("lease_seconds", lease_seconds_)});
  }
}

UnlockWorker::~UnlockWorker() {
  Stop();
}

void UnlockWorker::Start() {
  if (running_.exchange(true)) {
    return;
  }
  thread_ = std::thread(&UnlockWorker::Run, this);
}

void UnlockWorker::Stop() {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    running_ = false;
  }
  cv_.notify_all();
  if (thread_.joinable()) {
    thread_.join();
  }
}

void UnlockWorker::Run() {
  const auto poll = std::chrono::milliseconds(ctx_.settings.worker.poll_interval_ms);
  while (running_) {
    uint32_t claimed = 0;
    try {
      claimed = RunOnce();
    } catch (const std::exception& e) {
      CREDITGATE_LOG_ERROR("unlock worker batch failed", {StringField("error", e.what())});
    }
    if (claimed > 0) continue;

    std::unique_lock<std::mutex> lock(mutex_);
    cv_.wait_for(lock, poll, [this] { return !running_; });
  }
}

uint32_t UnlockWorker::RunOnce() {
  const auto& worker = ctx_.settings.worker;
  const auto  jobs   = ctx_.jobs->Claim({sweep::kUnlockGenerationScope}, worker.max_jobs, worker.worker_id, lease_seconds_);

  for (const auto& job : jobs) {
    try {
      Process(job);
    } catch (const std::exception& e) {
      CREDITGATE_LOG_ERROR("unlock job failed", {StringField("job_id", job.id), StringField("trace_id", job.trace_id),
                                                 StringField("error", e.what())});
    }
  }
  return static_cast<uint32_t>(jobs.size());
}

void UnlockWorker::Abandon(const UnlockRecord& unlock, const std::string& reservation_id, const std::string& error_code,
                           const std::string& error_message, const std::string& trace_id) {
  if (!unlock.reserved_ledger_id.empty() && !unlock.reserved_by_user_id.empty()) {
    ledger::LedgerRequest refund;
    refund.user_id            = unlock.reserved_by_user_id;
    refund.amount             = util::FromMillicredits(unlock.reserved_amount_millis > 0 ? unlock.reserved_amount_millis
                                                                                        : unlock.estimated_cost_millis);
    refund.idempotency_key    = unlock::HoldResolutionKey(unlock.id, unlock.reserved_ledger_id, "generation_failed_refund");
    refund.reason_code        = kFailedRefundReasonCode;
    refund.resolves_ledger_id = unlock.reserved_ledger_id;
    refund.context.set_unlock_id(unlock.id);
    refund.context.set_source_item_id(unlock.source_item_id);
    refund.context.set_source_page_id(unlock.source_page_id);
    refund.context.set_trace_id(trace_id);
    (*refund.context.mutable_metadata())["error_code"] = error_code;

    const auto result = ctx_.ledger->RefundReservation(refund);
    observability::LogUnlockEvent("unlock_generation_refund",
                                  {StringField("trace_id", trace_id), StringField("unlock_id", unlock.id),
                                   StringField("hold_ledger_id", unlock.reserved_ledger_id),
                                   StringField("outcome", ledger::ToString(result.outcome))});
  }
  ctx_.unlocks->ReleaseReservation(unlock.id, reservation_id, error_code, error_message);
}

void UnlockWorker::Process(const JobRecord& job) {
  const auto& worker = ctx_.settings.worker;

  creditgate::v1::UnlockGenerationJob payload;
  const auto parsed = google::protobuf::util::JsonStringToMessage(job.payload_json, &payload);
  if (!parsed.ok() || payload.unlock_id().empty()) {
    ctx_.jobs->FailJob(job.id, kBadPayloadCode, parsed.ok() ? "unlock_id missing" : parsed.ToString(), 0);
    return;
  }

  const auto trace_id = payload.trace_id().empty() ? job.trace_id : payload.trace_id();

  auto unlock = ctx_.unlocks->MarkProcessing(payload.unlock_id(), payload.user_id(), job.id, payload.reservation_id());
  if (!unlock) {
    // The reservation expired or was replaced; whoever owns the row now owns its hold.
    ctx_.jobs->FailJob(job.id, kSupersededCode, "Reservation no longer held by this job.", 0);
    observability::LogUnlockEvent("unlock_job_superseded", {StringField("trace_id", trace_id), StringField("job_id", job.id),
                                                            StringField("unlock_id", payload.unlock_id())});
    return;
  }

  observability::LogUnlockEvent("unlock_generation_started",
                                {StringField("trace_id", trace_id), StringField("job_id", job.id), StringField("unlock_id", unlock->id),
                                 observability::IntField("attempt", job.attempts)});

  GenerationRequest request;
  request.unlock_id      = unlock->id;
  request.source_item_id = unlock->source_item_id;
  request.source_page_id = unlock->source_page_id;
  request.user_id        = payload.user_id();
  request.trace_id       = trace_id;

  const auto lease_lost = [&] {
    observability::LogUnlockEvent("unlock_job_lease_lost", {StringField("trace_id", trace_id), StringField("job_id", job.id),
                                                            StringField("unlock_id", unlock->id), StringField("worker_id", worker.worker_id)});
  };

  LeaseHeartbeat heartbeat(*ctx_.jobs, job.id, worker.worker_id, lease_seconds_);

  auto options           = provider::MakeRetryOptions(worker.provider_key, ctx_.settings.retry);
  options.before_attempt = [&heartbeat, &job](uint32_t) {
    if (!heartbeat.Touch()) {
      throw JobLeaseLost(job.id);
    }
  };

  GenerationResult generated;
  try {
    auto generator = generator_;
    generated      = provider::RunWithProviderRetry<GenerationResult>(
        *ctx_.circuit, std::move(options), [generator, request](uint32_t attempt, const std::atomic<bool>& cancelled) {
          auto attempt_request      = request;
          attempt_request.cancelled = &cancelled;
          return generator->Generate(attempt_request, attempt);
        });
  } catch (const JobLeaseLost&) {
    lease_lost();
    return;
  } catch (const util::ProviderDegraded& e) {
    const auto retry_in = static_cast<uint32_t>(std::max<int64_t>(worker.retry_delay_seconds, e.retry_after_seconds()));
    auto       failed   = ctx_.jobs->FailJob(job.id, e.code(), e.what(), retry_in);
    if (failed && failed->status == creditgate::v1::JOB_STATUS_FAILED) {
      Abandon(*unlock, payload.reservation_id(), e.code(), e.what(), trace_id);
    }
    observability::LogUnlockEvent("unlock_generation_deferred",
                                  {StringField("trace_id", trace_id), StringField("job_id", job.id), StringField("unlock_id", unlock->id),
                                   StringField("error", e.what())});
    return;
  } catch (const std::exception& e) {
    Abandon(*unlock, payload.reservation_id(), kGenerationFailedCode, e.what(), trace_id);
    ctx_.jobs->FailJob(job.id, kGenerationFailedCode, e.what(), 0);
    observability::LogUnlockEvent("unlock_generation_failed",
                                  {StringField("trace_id", trace_id), StringField("job_id", job.id), StringField("unlock_id", unlock->id),
                                   StringField("error", e.what())});
    return;
  }

  // Another worker holds the job now and will finish it.
  if (!heartbeat.Touch()) {
    lease_lost();
    return;
  }

  auto ready = ctx_.unlocks->CompleteUnlock(unlock->id, generated.blueprint_id, job.id, payload.reservation_id());
  if (!ready) {
    ctx_.jobs->FailJob(job.id, kSupersededCode, "Reservation lost during generation.", 0);
    observability::LogUnlockEvent("unlock_job_superseded", {StringField("trace_id", trace_id), StringField("job_id", job.id),
                                                            StringField("unlock_id", unlock->id)});
    return;
  }

  if (!unlock->reserved_ledger_id.empty()) {
    const auto held = unlock->reserved_amount_millis > 0 ? unlock->reserved_amount_millis : unlock->estimated_cost_millis;

    ledger::LedgerRequest settle;
    settle.user_id            = unlock->reserved_by_user_id;
    settle.amount             = util::FromMillicredits(held);
    settle.held_amount        = util::FromMillicredits(held);
    settle.idempotency_key    = unlock::HoldResolutionKey(unlock->id, unlock->reserved_ledger_id, "settle");
    settle.reason_code        = kSettleReasonCode;
    settle.resolves_ledger_id = unlock->reserved_ledger_id;
    settle.context            = JobContext(*unlock, job, trace_id);
    (*settle.context.mutable_metadata())["blueprint_id"] = generated.blueprint_id;

    const auto result = ctx_.ledger->SettleReservation(settle);
    if (!result.ok()) {
      CREDITGATE_LOG_WARN("unlock settle not applied", {StringField("trace_id", trace_id), StringField("unlock_id", unlock->id),
                                                        StringField("outcome", ledger::ToString(result.outcome))});
    }
  }

  ctx_.jobs->CompleteJob(job.id, worker.worker_id);
  observability::LogUnlockEvent("unlock_generation_ready",
                                {StringField("trace_id", trace_id), StringField("job_id", job.id), StringField("unlock_id", unlock->id),
                                 StringField("blueprint_id", generated.blueprint_id)});
}

} // namespace creditgate::service
