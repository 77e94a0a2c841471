#include "internal/jobs/job_lease_store.hpp"

#include <algorithm>

#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/uuid.hpp"

namespace creditgate::jobs {

using creditgate::db::ErrorCode;
using creditgate::db::ThrowIfDbError;
using creditgate::db::model::JobRecord;
using namespace creditgate::v1;

namespace {

constexpr int      kMaxCasAttempts  = 5;
constexpr uint32_t kMinClaimJobs    = 1;
constexpr uint32_t kMaxClaimJobs    = 200;
constexpr uint32_t kMinLeaseSeconds = 5;
constexpr uint32_t kMaxLeaseSeconds = 3600;
constexpr size_t   kMaxErrorMessage = 500;

bool IsRetryable(const db::Result& r) {
  return r.code == ErrorCode::Conflict || r.code == ErrorCode::Busy || r.code == ErrorCode::SerializationFailure;
}

int64_t LeaseMillis(uint32_t lease_seconds) {
  return static_cast<int64_t>(std::clamp(lease_seconds, kMinLeaseSeconds, kMaxLeaseSeconds)) * 1000;
}

} // namespace

RepositoryJobLeaseStore::RepositoryJobLeaseStore(std::shared_ptr<db::Repository> repository, util::NowFn now)
    : repository_(std::move(repository)), now_(std::move(now)) {
  if (!repository_) {
    throw std::invalid_argument("RepositoryJobLeaseStore requires a repository");
  }
}

int64_t RepositoryJobLeaseStore::NowMs() const {
  return util::ToUnixMillis(now_());
}

JobRecord RepositoryJobLeaseStore::Enqueue(const EnqueueRequest& request) {
  if (request.scope.empty()) {
    throw util::InvalidArgument("JOB_SCOPE_REQUIRED");
  }

  for (int attempt = 0; attempt < kMaxCasAttempts; ++attempt) {
    const auto now_ms = NowMs();
    auto       tx     = repository_->Begin();

    if (!request.dedupe_key.empty()) {
      if (auto existing = repository_->GetJobByDedupeKey(*tx, request.dedupe_key)) {
        tx->Commit();
        return *existing;
      }
    }

    JobRecord job;
    job.id             = util::NewId("job_");
    job.scope          = request.scope;
    job.dedupe_key     = request.dedupe_key;
    job.status         = JOB_STATUS_QUEUED;
    job.max_attempts   = std::max<uint32_t>(1, request.max_attempts);
    job.next_run_at_ms = request.run_at_ms > 0 ? request.run_at_ms : now_ms;
    job.trace_id       = request.trace_id;
    job.payload_json   = request.payload_json;
    job.created_at_ms  = now_ms;
    job.updated_at_ms  = now_ms;
    job.version        = 1;

    const auto result = repository_->InsertJob(*tx, job);
    if (result) {
      tx->Commit();
      CREDITGATE_LOG_DEBUG("job enqueued", {observability::StringField("job_id", job.id), observability::StringField("scope", job.scope),
                                            observability::StringField("trace_id", job.trace_id)});
      return job;
    }
    tx->Rollback();
    if (result.IsDuplicate() || IsRetryable(result)) continue;
    ThrowIfDbError(result, "Enqueue");
  }

  throw util::Conflict("JOB_ENQUEUE_CONFLICT: " + request.dedupe_key);
}

std::vector<JobRecord> RepositoryJobLeaseStore::Claim(const std::vector<std::string>& scopes, uint32_t max_jobs,
                                                      const std::string& worker_id, uint32_t lease_seconds) {
  if (scopes.empty()) {
    return {};
  }
  if (worker_id.empty()) {
    throw util::InvalidArgument("WORKER_ID_REQUIRED");
  }

  const auto limit    = std::clamp(max_jobs, kMinClaimJobs, kMaxClaimJobs);
  const auto lease_ms = LeaseMillis(lease_seconds);

  std::vector<JobRecord> candidates;
  {
    auto tx    = repository_->Begin();
    candidates = repository_->ListClaimableJobs(*tx, scopes, NowMs(), limit);
    tx->Commit();
  }

  std::vector<JobRecord> claimed;
  claimed.reserve(candidates.size());

  for (const auto& candidate : candidates) {
    // One shot per candidate: losing the CAS means another worker has it.
    const auto now_ms = NowMs();
    auto       next   = candidate;
    next.status              = JOB_STATUS_RUNNING;
    next.attempts            = candidate.attempts + 1;
    next.worker_id           = worker_id;
    next.lease_expires_at_ms = now_ms + lease_ms;
    next.updated_at_ms       = now_ms;
    if (next.started_at_ms == 0) next.started_at_ms = now_ms;

    auto       tx     = repository_->Begin();
    const auto result = repository_->CompareAndSwapJob(*tx, next, candidate.version);
    if (result) {
      tx->Commit();
      claimed.push_back(std::move(next));
      continue;
    }
    tx->Rollback();
    if (IsRetryable(result) || result.code == ErrorCode::NotFound) continue;
    ThrowIfDbError(result, "Claim");
  }

  if (!claimed.empty()) {
    CREDITGATE_LOG_DEBUG("jobs claimed", {observability::StringField("worker_id", worker_id),
                                          observability::IntField("count", static_cast<int64_t>(claimed.size()))});
  }
  return claimed;
}

std::optional<JobRecord> RepositoryJobLeaseStore::Update(const std::string& job_id, const Mutation& mutate, const char* context) {
  for (int attempt = 0; attempt < kMaxCasAttempts; ++attempt) {
    auto tx      = repository_->Begin();
    auto current = repository_->GetJob(*tx, job_id);
    if (!current) {
      tx->Rollback();
      return std::nullopt;
    }

    auto next = *current;
    if (!mutate(next)) {
      tx->Rollback();
      return std::nullopt;
    }
    next.updated_at_ms = NowMs();

    const auto result = repository_->CompareAndSwapJob(*tx, next, current->version);
    if (result) {
      tx->Commit();
      return next;
    }
    tx->Rollback();
    if (IsRetryable(result)) continue;
    ThrowIfDbError(result, context);
  }

  throw util::Conflict(std::string(context) + ": job " + job_id + " kept changing");
}

bool RepositoryJobLeaseStore::TouchLease(const std::string& job_id, const std::string& worker_id, uint32_t lease_seconds) {
  const auto lease_ms = LeaseMillis(lease_seconds);
  auto       updated  = Update(
      job_id,
      [&](JobRecord& job) {
        if (job.status != JOB_STATUS_RUNNING || job.worker_id != worker_id) return false;
        job.lease_expires_at_ms = NowMs() + lease_ms;
        return true;
      },
      "TouchLease");
  return updated.has_value();
}

std::optional<JobRecord> RepositoryJobLeaseStore::GetJob(const std::string& job_id) {
  auto tx  = repository_->Begin();
  auto job = repository_->GetJob(*tx, job_id);
  tx->Commit();
  return job;
}

bool RepositoryJobLeaseStore::CompleteJob(const std::string& job_id, const std::string& worker_id) {
  auto updated = Update(
      job_id,
      [&](JobRecord& job) {
        if (job.status != JOB_STATUS_RUNNING) return false;
        if (!worker_id.empty() && job.worker_id != worker_id) return false;
        job.status              = JOB_STATUS_SUCCEEDED;
        job.finished_at_ms      = NowMs();
        job.lease_expires_at_ms = 0;
        job.error_code          = {};
        job.error_message       = {};
        return true;
      },
      "CompleteJob");
  return updated.has_value();
}

std::optional<JobRecord> RepositoryJobLeaseStore::FailJob(const std::string& job_id, const std::string& error_code,
                                                          const std::string& error_message, uint32_t retry_in_seconds) {
  return Update(
      job_id,
      [&](JobRecord& job) {
        if (job.status == JOB_STATUS_SUCCEEDED || job.status == JOB_STATUS_FAILED) return false;
        const auto now_ms        = NowMs();
        job.error_code           = error_code;
        job.error_message        = error_message.substr(0, kMaxErrorMessage);
        job.worker_id            = {};
        job.lease_expires_at_ms  = 0;
        if (retry_in_seconds > 0 && job.attempts < job.max_attempts) {
          job.status         = JOB_STATUS_QUEUED;
          job.next_run_at_ms = now_ms + static_cast<int64_t>(retry_in_seconds) * 1000;
        } else {
          job.status         = JOB_STATUS_FAILED;
          job.finished_at_ms = now_ms;
        }
        return true;
      },
      "FailJob");
}

std::vector<JobRecord> RepositoryJobLeaseStore::ListRunningStartedBefore(const std::string& scope, int64_t before_ms, uint32_t limit) {
  auto tx   = repository_->Begin();
  auto rows = repository_->ListRunningJobsStartedBefore(*tx, scope, before_ms, std::max<uint32_t>(1, limit));
  tx->Commit();
  return rows;
}

uint32_t RepositoryJobLeaseStore::MarkJobsFailed(const std::vector<std::string>& job_ids, const std::string& error_code,
                                                 const std::string& error_message) {
  uint32_t changed = 0;
  for (const auto& id : job_ids) {
    auto updated = Update(
        id,
        [&](JobRecord& job) {
          if (job.status != JOB_STATUS_RUNNING) return false;
          job.status              = JOB_STATUS_FAILED;
          job.error_code          = error_code;
          job.error_message       = error_message.substr(0, kMaxErrorMessage);
          job.finished_at_ms      = NowMs();
          job.lease_expires_at_ms = 0;
          return true;
        },
        "MarkJobsFailed");
    if (updated) ++changed;
  }
  return changed;
}

} // namespace creditgate::jobs
