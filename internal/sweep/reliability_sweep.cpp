#include "internal/sweep/reliability_sweep.hpp"

#include <algorithm>
#include <chrono>

#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"
#include "internal/observability/unlock_trace.hpp"
#include "internal/unlock/unlock_keys.hpp"
#include "internal/util/credits.hpp"
#include "internal/util/errors.hpp"

namespace creditgate::sweep {

using creditgate::db::ThrowIfDbError;
using creditgate::db::model::UnlockRecord;
using creditgate::observability::IntField;
using creditgate::observability::LogUnlockEvent;
using creditgate::observability::StringField;
using namespace creditgate::v1;

namespace {

constexpr char     kSweepStateName[]     = "unlock_reliability";
constexpr uint32_t kMaxProcessingScan    = 1000;
constexpr uint32_t kProcessingScanFactor = 3;

constexpr char kExpiredRecoveredCode[]    = "UNLOCK_RESERVATION_EXPIRED_RECOVERED";
constexpr char kExpiredRecoveredMessage[] = "Recovered expired unlock reservation.";
constexpr char kExpiredRefundReason[]     = "UNLOCK_RESERVATION_EXPIRED_REFUND";
constexpr char kStaleRecoveredCode[]      = "UNLOCK_PROCESSING_STALE_RECOVERED";
constexpr char kStaleRefundReason[]       = "UNLOCK_PROCESSING_STALE_REFUND";
constexpr char kOrphanJobCode[]           = "ORPHAN_UNLOCK_JOB_RECOVERED";
constexpr char kOrphanJobMessage[]        = "Recovered running unlock job with no active unlock rows.";

std::string JobStatusName(JobStatus status) {
  switch (status) {
    case JOB_STATUS_QUEUED:
      return "queued";
    case JOB_STATUS_RUNNING:
      return "running";
    case JOB_STATUS_SUCCEEDED:
      return "succeeded";
    case JOB_STATUS_FAILED:
      return "failed";
    default:
      return "unknown";
  }
}

SweepSummary Skipped(const char* reason, const SweepOptions& options, const std::string& trace_id) {
  SweepSummary summary;
  summary.set_skipped(true);
  summary.set_skip_reason(reason);
  summary.set_mode(options.mode);
  summary.set_trace_id(trace_id);
  summary.mutable_inspected();
  return summary;
}

} // namespace

ReliabilitySweep::ReliabilitySweep(std::shared_ptr<db::Repository> repository, std::shared_ptr<unlock::UnlockStore> unlocks,
                                   std::shared_ptr<ledger::CreditLedger> ledger, std::shared_ptr<jobs::JobLeaseStore> jobs,
                                   config::SweepSettings settings, util::NowFn now)
    : repository_(std::move(repository)),
      unlocks_(std::move(unlocks)),
      ledger_(std::move(ledger)),
      jobs_(std::move(jobs)),
      settings_(settings),
      now_(std::move(now)) {
  if (!repository_ || !unlocks_ || !ledger_ || !jobs_) {
    throw std::invalid_argument("ReliabilitySweep requires repository, unlock store, ledger and job store");
  }
}

int64_t ReliabilitySweep::NowMs() const {
  return util::ToUnixMillis(now_());
}

SweepSummary ReliabilitySweep::RunIfDue(const std::string& trace_id) {
  SweepOptions options;
  options.mode     = "opportunistic";
  options.trace_id = trace_id;
  return Run(options);
}

SweepSummary ReliabilitySweep::Run(const SweepOptions& options) {
  if (!settings_.enabled) {
    return Skipped("disabled", options, options.trace_id);
  }

  std::promise<SweepSummary>       promise;
  std::shared_future<SweepSummary> shared;
  bool                             leader = false;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!in_flight_.valid()) {
      in_flight_ = promise.get_future().share();
      leader     = true;
    }
    shared = in_flight_;
  }
  if (!leader) {
    return shared.get();
  }

  try {
    auto summary = Execute(options);
    {
      std::lock_guard<std::mutex> lock(mutex_);
      in_flight_ = {};
    }
    promise.set_value(summary);
    return summary;
  } catch (const std::exception& e) {
    {
      std::lock_guard<std::mutex> lock(mutex_);
      in_flight_ = {};
    }
    promise.set_exception(std::current_exception());
    CREDITGATE_LOG_ERROR("unlock sweep failed", {StringField("mode", options.mode), StringField("error", e.what())});
    throw;
  }
}

bool ReliabilitySweep::TryStartRun(bool force, int64_t now_ms, const std::string& trace_id) {
  auto tx    = repository_->Begin();
  auto state = repository_->GetSweepState(*tx, kSweepStateName);

  if (!force && state) {
    const auto min_interval = static_cast<int64_t>(settings_.min_interval_ms);
    const bool recently_finished = state->last_finished_at_ms != 0 && now_ms - state->last_finished_at_ms < min_interval;
    // Another process started a run that has not finished yet.
    const bool running_elsewhere = state->last_started_at_ms > state->last_finished_at_ms && now_ms - state->last_started_at_ms < min_interval;
    if (recently_finished || running_elsewhere) {
      tx->Rollback();
      return false;
    }
  }

  db::model::SweepStateRecord next = state.value_or(db::model::SweepStateRecord{});
  next.name               = kSweepStateName;
  next.last_started_at_ms = now_ms;
  next.last_trace_id      = trace_id;

  ThrowIfDbError(repository_->UpsertSweepState(*tx, next), "sweep start");
  tx->Commit();
  return true;
}

void ReliabilitySweep::FinishRun(int64_t finished_ms) {
  auto tx    = repository_->Begin();
  auto state = repository_->GetSweepState(*tx, kSweepStateName).value_or(db::model::SweepStateRecord{});
  state.name                = kSweepStateName;
  state.last_finished_at_ms = finished_ms;

  ThrowIfDbError(repository_->UpsertSweepState(*tx, state), "sweep finish");
  tx->Commit();
}

SweepSummary ReliabilitySweep::Execute(const SweepOptions& options) {
  const auto trace_id = options.trace_id.empty() ? observability::CreateUnlockTraceId() : options.trace_id;
  const auto started  = NowMs();

  if (!TryStartRun(options.force, started, trace_id)) {
    return Skipped("cooldown", options, trace_id);
  }

  observability::SpanScope span("unlock.sweep");
  span.SetAttribute("mode", options.mode);
  span.SetAttribute("trace_id", trace_id);

  const auto wall_start = std::chrono::steady_clock::now();

  SweepSummary summary;
  summary.set_skipped(false);
  summary.set_mode(options.mode);
  summary.set_trace_id(trace_id);
  summary.set_run_started_at_ms(started);

  RecoverExpiredReservations(options.mode, trace_id, summary);
  RecoverStaleProcessing(options.mode, trace_id, summary);
  RecoverOrphanJobs(options.mode, trace_id, summary);

  const auto finished = NowMs();
  summary.set_run_finished_at_ms(finished);
  FinishRun(finished);

  auto& metrics = observability::Metrics::Instance();
  metrics.RecordSweepRecovered("expired_reservation", summary.expired_recovered());
  metrics.RecordSweepRecovered("stale_processing", summary.processing_recovered());
  metrics.RecordSweepRecovered("orphan_job", summary.orphan_jobs_recovered());
  metrics.ObserveSweepDurationMs(
      std::chrono::duration<double, std::milli>(std::chrono::steady_clock::now() - wall_start).count());

  LogUnlockEvent("unlock_sweep_summary", {StringField("trace_id", trace_id), StringField("mode", options.mode),
                                          IntField("expired_recovered", summary.expired_recovered()),
                                          IntField("processing_recovered", summary.processing_recovered()),
                                          IntField("orphan_jobs_recovered", summary.orphan_jobs_recovered()),
                                          IntField("failed_items", summary.failed_items()),
                                          IntField("expired_candidates", summary.inspected().expired_candidates()),
                                          IntField("processing_candidates", summary.inspected().processing_candidates()),
                                          IntField("running_jobs", summary.inspected().running_jobs()),
                                          IntField("duration_ms", finished - started)});
  return summary;
}

std::optional<ReliabilitySweep::Hold> ReliabilitySweep::FindHold(const UnlockRecord& unlock) {
  if (unlock.reserved_by_user_id.empty()) {
    return std::nullopt;
  }
  if (!unlock.reserved_ledger_id.empty()) {
    const auto amount = unlock.reserved_amount_millis > 0 ? unlock.reserved_amount_millis : unlock.estimated_cost_millis;
    if (amount <= 0) return std::nullopt;
    return Hold{unlock.reserved_ledger_id, amount};
  }
  if (unlock.reservation_id.empty()) {
    return std::nullopt;
  }

  // Charged but never attached to the row: the hold key is derived from the reservation.
  auto tx    = repository_->Begin();
  auto entry = repository_->GetLedgerEntryByKey(*tx, unlock::ReservationHoldKey(unlock.id, unlock.reservation_id));
  tx->Commit();
  if (!entry || entry->entry_type != LEDGER_ENTRY_TYPE_HOLD || entry->user_id != unlock.reserved_by_user_id) {
    return std::nullopt;
  }
  CREDITGATE_LOG_INFO("sweep found unattached reservation hold",
                      {StringField("unlock_id", unlock.id), StringField("reservation_id", unlock.reservation_id),
                       StringField("hold_ledger_id", entry->id)});
  return Hold{entry->id, entry->amount_millis};
}

void ReliabilitySweep::RefundHold(const UnlockRecord& unlock, const char* key_suffix, const char* reason_code, const std::string& reason,
                                  const std::string& trace_id) {
  const auto hold = FindHold(unlock);
  if (!hold) {
    return;
  }

  ledger::LedgerRequest request;
  request.user_id            = unlock.reserved_by_user_id;
  request.amount             = util::FromMillicredits(hold->amount_millis);
  request.idempotency_key    = unlock::HoldResolutionKey(unlock.id, hold->ledger_id, key_suffix);
  request.reason_code        = reason_code;
  request.resolves_ledger_id = hold->ledger_id;
  request.context.set_unlock_id(unlock.id);
  request.context.set_source_item_id(unlock.source_item_id);
  request.context.set_source_page_id(unlock.source_page_id);
  request.context.set_trace_id(trace_id);
  (*request.context.mutable_metadata())["source"] = "unlock_reliability_sweep";
  (*request.context.mutable_metadata())["reason"] = reason;

  const auto result = ledger_->RefundReservation(request);
  if (result.outcome == ledger::LedgerOutcome::kAlreadyResolved) {
    CREDITGATE_LOG_INFO("sweep refund skipped; hold already resolved",
                        {StringField("unlock_id", unlock.id), StringField("hold_ledger_id", hold->ledger_id),
                         StringField("resolution_id", result.ledger_id)});
  }
}

void ReliabilitySweep::Release(const UnlockRecord& unlock, const std::string& error_code, const std::string& error_message) {
  if (unlock.reservation_id.empty()) {
    unlocks_->FailUnlock(unlock.id, error_code, error_message);
    return;
  }
  if (!unlocks_->ReleaseReservation(unlock.id, unlock.reservation_id, error_code, error_message)) {
    CREDITGATE_LOG_INFO("sweep release skipped; reservation moved on",
                        {StringField("unlock_id", unlock.id), StringField("reservation_id", unlock.reservation_id)});
  }
}

void ReliabilitySweep::RecoverExpiredReservations(const std::string& mode, const std::string& trace_id, SweepSummary& summary) {
  const auto expired = unlocks_->FindExpiredReserved(settings_.batch_size);
  summary.mutable_inspected()->set_expired_candidates(static_cast<uint32_t>(expired.size()));

  for (const auto& unlock : expired) {
    try {
      RefundHold(unlock, "sweep_reserved_expired_refund", kExpiredRefundReason, "reserved_expired", trace_id);
      Release(unlock, kExpiredRecoveredCode, kExpiredRecoveredMessage);
      summary.set_expired_recovered(summary.expired_recovered() + 1);

      if (settings_.item_logs) {
        LogUnlockEvent("unlock_sweep_recovered_item",
                       {StringField("trace_id", trace_id), StringField("unlock_id", unlock.id), StringField("mode", mode),
                        StringField("reason", "reserved_expired"), StringField("source_item_id", unlock.source_item_id),
                        StringField("source_page_id", unlock.source_page_id)});
      }
    } catch (const std::exception& e) {
      summary.set_failed_items(summary.failed_items() + 1);
      LogUnlockEvent("unlock_sweep_item_failed", {StringField("trace_id", trace_id), StringField("unlock_id", unlock.id),
                                                  StringField("pass", "reserved_expired"), StringField("error", e.what())});
    }
  }
}

void ReliabilitySweep::RecoverStaleProcessing(const std::string& mode, const std::string& trace_id, SweepSummary& summary) {
  const auto limit = std::min(kMaxProcessingScan, settings_.batch_size * kProcessingScanFactor);
  const auto rows  = unlocks_->ListProcessing(limit);
  summary.mutable_inspected()->set_processing_candidates(static_cast<uint32_t>(rows.size()));

  const auto now_ms = NowMs();

  for (const auto& unlock : rows) {
    try {
      std::string reason;
      if (unlock.reservation_expires_at_ms != 0 && unlock.reservation_expires_at_ms <= now_ms) {
        reason = "reservation_expired";
      } else if (unlock.job_id.empty()) {
        reason = "missing_job_id";
      } else if (auto job = jobs_->GetJob(unlock.job_id); !job) {
        reason = "job_missing";
      } else if (job->status != JOB_STATUS_RUNNING) {
        reason = "job_" + JobStatusName(job->status);
      }
      if (reason.empty()) continue;

      RefundHold(unlock, "sweep_processing_stale_refund", kStaleRefundReason, reason, trace_id);
      Release(unlock, kStaleRecoveredCode, "Recovered stale processing unlock (" + reason + ").");
      summary.set_processing_recovered(summary.processing_recovered() + 1);

      if (settings_.item_logs) {
        LogUnlockEvent("unlock_sweep_recovered_item",
                       {StringField("trace_id", trace_id), StringField("unlock_id", unlock.id), StringField("job_id", unlock.job_id),
                        StringField("mode", mode), StringField("reason", reason), StringField("source_item_id", unlock.source_item_id),
                        StringField("source_page_id", unlock.source_page_id)});
      }
    } catch (const std::exception& e) {
      summary.set_failed_items(summary.failed_items() + 1);
      LogUnlockEvent("unlock_sweep_item_failed", {StringField("trace_id", trace_id), StringField("unlock_id", unlock.id),
                                                  StringField("pass", "processing_stale"), StringField("error", e.what())});
    }
  }
}

void ReliabilitySweep::RecoverOrphanJobs(const std::string& mode, const std::string& trace_id, SweepSummary& summary) {
  const auto stale_before = NowMs() - static_cast<int64_t>(settings_.processing_stale_ms);
  const auto running      = jobs_->ListRunningStartedBefore(kUnlockGenerationScope, stale_before, settings_.batch_size);
  summary.mutable_inspected()->set_running_jobs(static_cast<uint32_t>(running.size()));

  std::vector<std::string> orphans;
  for (const auto& job : running) {
    try {
      auto       tx     = repository_->Begin();
      const auto active = repository_->CountActiveUnlocksForJob(*tx, job.id);
      tx->Commit();
      if (active == 0) orphans.push_back(job.id);
    } catch (const std::exception& e) {
      summary.set_failed_items(summary.failed_items() + 1);
      LogUnlockEvent("unlock_sweep_item_failed", {StringField("trace_id", trace_id), StringField("job_id", job.id),
                                                  StringField("pass", "orphan_jobs"), StringField("error", e.what())});
    }
  }
  if (orphans.empty()) {
    return;
  }

  uint32_t recovered = 0;
  try {
    recovered = jobs_->MarkJobsFailed(orphans, kOrphanJobCode, kOrphanJobMessage);
  } catch (const std::exception& e) {
    summary.set_failed_items(summary.failed_items() + static_cast<uint32_t>(orphans.size()));
    LogUnlockEvent("unlock_sweep_item_failed",
                   {StringField("trace_id", trace_id), StringField("pass", "orphan_jobs"), StringField("error", e.what())});
    return;
  }
  summary.set_orphan_jobs_recovered(recovered);

  if (settings_.item_logs && recovered > 0) {
    std::string ids;
    for (const auto& id : orphans) {
      if (!ids.empty()) ids += ",";
      ids += id;
    }
    LogUnlockEvent("unlock_sweep_recovered_orphan_jobs", {StringField("trace_id", trace_id), StringField("mode", mode),
                                                          StringField("orphan_job_ids", ids), IntField("recovered", recovered)});
  }
}

} // namespace creditgate::sweep
