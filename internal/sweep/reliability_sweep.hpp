#pragma once

#include <cstdint>
#include <future>
#include <memory>
#include <mutex>
#include <optional>
#include <string>

#include "creditgate/v1/types.pb.h"
#include "internal/config/runtime_settings.hpp"
#include "internal/db/api/repository.hpp"
#include "internal/jobs/job_lease_store.hpp"
#include "internal/ledger/credit_ledger.hpp"
#include "internal/unlock/unlock_store.hpp"
#include "internal/util/time.hpp"

namespace creditgate::sweep {

inline constexpr char kUnlockGenerationScope[] = "source_item_unlock_generation";

struct SweepOptions {
  bool        force = false;
  std::string mode  = "opportunistic"; // or "cron", "admin", "cli"
  std::string trace_id;                // generated when empty
};

/*
  ReliabilitySweep

  Repairs unlock rows and jobs left behind by crashed or abandoned flows:

    1. expired reservations   -> refund hold, release row
    2. stale processing rows  -> refund hold, release row
    3. orphan running jobs    -> mark failed

  Concurrent Run() calls in one process share the in-flight run. Across
  processes the last run time lives in sweep_state, so min_interval_ms
  is honoured globally unless force is set. A failing item is logged
  and counted; it never stops the batch.
*/
class ReliabilitySweep {
 public:
  ReliabilitySweep(std::shared_ptr<db::Repository> repository, std::shared_ptr<unlock::UnlockStore> unlocks,
                   std::shared_ptr<ledger::CreditLedger> ledger, std::shared_ptr<jobs::JobLeaseStore> jobs, config::SweepSettings settings,
                   util::NowFn now = util::Now);

  creditgate::v1::SweepSummary Run(const SweepOptions& options);

  // Opportunistic trigger from request paths. Never forces.
  creditgate::v1::SweepSummary RunIfDue(const std::string& trace_id = {});

  const config::SweepSettings& settings() const {
    return settings_;
  }

 private:
  creditgate::v1::SweepSummary Execute(const SweepOptions& options);

  // Records the run start in sweep_state. False when still cooling down.
  bool TryStartRun(bool force, int64_t now_ms, const std::string& trace_id);
  void FinishRun(int64_t finished_ms);

  void RecoverExpiredReservations(const std::string& mode, const std::string& trace_id, creditgate::v1::SweepSummary& summary);
  void RecoverStaleProcessing(const std::string& mode, const std::string& trace_id, creditgate::v1::SweepSummary& summary);
  void RecoverOrphanJobs(const std::string& mode, const std::string& trace_id, creditgate::v1::SweepSummary& summary);

  struct Hold {
    std::string ledger_id;
    int64_t     amount_millis = 0;
  };

  // The reservation's outstanding hold, if it was ever charged.
  std::optional<Hold> FindHold(const db::model::UnlockRecord& unlock);

  void RefundHold(const db::model::UnlockRecord& unlock, const char* key_suffix, const char* reason_code, const std::string& reason,
                  const std::string& trace_id);
  void Release(const db::model::UnlockRecord& unlock, const std::string& error_code, const std::string& error_message);

  int64_t NowMs() const;

  std::shared_ptr<db::Repository>       repository_;
  std::shared_ptr<unlock::UnlockStore>  unlocks_;
  std::shared_ptr<ledger::CreditLedger> ledger_;
  std::shared_ptr<jobs::JobLeaseStore>  jobs_;
  config::SweepSettings                 settings_;
  util::NowFn                           now_;

  std::mutex                                       mutex_;
  std::shared_future<creditgate::v1::SweepSummary> in_flight_;
};

} // namespace creditgate::sweep
