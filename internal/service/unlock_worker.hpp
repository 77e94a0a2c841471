#pragma once

#include <atomic>
#include <condition_variable>
#include <cstdint>
#include <memory>
#include <mutex>
#include <string>
#include <thread>

#include "artifact_generator.hpp"
#include "service_context.hpp"

namespace creditgate::db::model {
struct JobRecord;
struct UnlockRecord;
}

namespace creditgate::service {

/*
  Background worker for unlock generation jobs.

  For each claimed job:
      reserved -> processing -> generate -> ready + settle hold

  A failed generation refunds the hold and frees the row. While the
  provider circuit is open the job is requeued instead, keeping the
  reservation.

  The job lease is renewed before every attempt and on a heartbeat while
  an attempt runs, and it is never shorter than the longest possible
  provider call. A worker that loses its lease drops the job without
  touching the row or the ledger; the new holder finishes it.
*/
class UnlockWorker {
 public:
  UnlockWorker(ServiceContext ctx, std::shared_ptr<ArtifactGenerator> generator);
  ~UnlockWorker();

  void Start();
  void Stop();

  // Claims and processes one batch. Returns the number of jobs claimed.
  uint32_t RunOnce();

  uint32_t lease_seconds() const {
    return lease_seconds_;
  }

 private:
  void Run();

  void Process(const creditgate::db::model::JobRecord& job);

  void Abandon(const creditgate::db::model::UnlockRecord& unlock, const std::string& reservation_id, const std::string& error_code,
               const std::string& error_message, const std::string& trace_id);

  ServiceContext                     ctx_;
  std::shared_ptr<ArtifactGenerator> generator_;
  uint32_t                           lease_seconds_ = 0;

  std::thread             thread_;
  std::atomic<bool>       running_{false};
  std::mutex              mutex_;
  std::condition_variable cv_;
};

} // namespace creditgate::service
