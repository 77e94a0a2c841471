#pragma once

#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "internal/db/api/repository.hpp"
#include "internal/db/model/job_record.hpp"
#include "internal/util/time.hpp"

namespace creditgate::jobs {

struct EnqueueRequest {
  std::string scope;
  std::string dedupe_key; // optional; unique when set
  std::string trace_id;
  std::string payload_json;
  uint32_t    max_attempts = 3;
  int64_t     run_at_ms    = 0; // 0 = now
};

/*
  JobLeaseStore

  Leased background jobs. A worker claims jobs for a bounded lease and
  must touch the lease to keep them. A running job whose lease lapsed is
  claimable again by anyone.
*/
class JobLeaseStore {
 public:
  virtual ~JobLeaseStore() = default;

  // Returns the existing job when dedupe_key was already used.
  virtual db::model::JobRecord Enqueue(const EnqueueRequest& request) = 0;

  virtual std::vector<db::model::JobRecord> Claim(const std::vector<std::string>& scopes, uint32_t max_jobs, const std::string& worker_id,
                                                  uint32_t lease_seconds) = 0;

  virtual bool TouchLease(const std::string& job_id, const std::string& worker_id, uint32_t lease_seconds) = 0;

  virtual std::optional<db::model::JobRecord> GetJob(const std::string& job_id) = 0;

  virtual bool CompleteJob(const std::string& job_id, const std::string& worker_id) = 0;

  // Requeues while attempts remain and retry_in_seconds > 0, otherwise fails for good.
  virtual std::optional<db::model::JobRecord> FailJob(const std::string& job_id, const std::string& error_code,
                                                      const std::string& error_message, uint32_t retry_in_seconds) = 0;

  virtual std::vector<db::model::JobRecord> ListRunningStartedBefore(const std::string& scope, int64_t before_ms, uint32_t limit) = 0;

  // Fails each listed job that is still running. Returns how many changed.
  virtual uint32_t MarkJobsFailed(const std::vector<std::string>& job_ids, const std::string& error_code,
                                  const std::string& error_message) = 0;
};

class RepositoryJobLeaseStore final : public JobLeaseStore {
 public:
  explicit RepositoryJobLeaseStore(std::shared_ptr<db::Repository> repository, util::NowFn now = util::Now);

  db::model::JobRecord Enqueue(const EnqueueRequest& request) override;

  std::vector<db::model::JobRecord> Claim(const std::vector<std::string>& scopes, uint32_t max_jobs, const std::string& worker_id,
                                          uint32_t lease_seconds) override;

  bool TouchLease(const std::string& job_id, const std::string& worker_id, uint32_t lease_seconds) override;

  std::optional<db::model::JobRecord> GetJob(const std::string& job_id) override;

  bool CompleteJob(const std::string& job_id, const std::string& worker_id) override;

  std::optional<db::model::JobRecord> FailJob(const std::string& job_id, const std::string& error_code, const std::string& error_message,
                                              uint32_t retry_in_seconds) override;

  std::vector<db::model::JobRecord> ListRunningStartedBefore(const std::string& scope, int64_t before_ms, uint32_t limit) override;

  uint32_t MarkJobsFailed(const std::vector<std::string>& job_ids, const std::string& error_code,
                          const std::string& error_message) override;

 private:
  using Mutation = std::function<bool(db::model::JobRecord&)>;

  // Single CAS attempt chain on one job. nullopt when mutate declined.
  std::optional<db::model::JobRecord> Update(const std::string& job_id, const Mutation& mutate, const char* context);

  int64_t NowMs() const;

  std::shared_ptr<db::Repository> repository_;
  util::NowFn                     now_;
};

} // namespace creditgate::jobs
