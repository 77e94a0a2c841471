#pragma once

#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "internal/config/runtime_settings.hpp"
#include "internal/db/api/repository.hpp"
#include "internal/db/model/unlock_record.hpp"
#include "internal/util/time.hpp"

namespace creditgate::unlock {

enum class ReserveKind {
  kReady,
  kInProgress,
  kReserved,
};

const char* ToString(ReserveKind kind);

struct ReserveOutcome {
  ReserveKind             kind = ReserveKind::kInProgress;
  db::model::UnlockRecord unlock;

  // True only for the caller whose CAS created this reservation.
  bool reserved_now = false;

  // Snapshot of an expired reservation this call reclaimed before reserving.
  // Its hold (if any) is still outstanding.
  std::optional<db::model::UnlockRecord> reclaimed;
};

/*
  UnlockStore

  Owns the per-item unlock row and its reservation state machine:

    available -> reserved -> processing -> ready
        ^           |            |
        +-----------+------------+   (fail / expiry)

  Every transition that depends on a prior read is a compare-and-swap on
  the row version. Money never moves here; callers pair transitions with
  CreditLedger calls.
*/
class UnlockStore {
 public:
  UnlockStore(std::shared_ptr<db::Repository> repository, config::UnlockSettings settings, util::NowFn now = util::Now);

  db::model::UnlockRecord EnsureUnlock(const std::string& source_item_id, const std::string& source_page_id, double estimated_cost);

  ReserveOutcome Reserve(const db::model::UnlockRecord& unlock, const std::string& user_id, double estimated_cost,
                         uint32_t reservation_seconds);

  // nullopt when the row no longer carries reservation_id.
  std::optional<db::model::UnlockRecord> AttachReservationLedger(const std::string& unlock_id, const std::string& reservation_id,
                                                                 const std::string& ledger_id, double amount);

  // nullopt when the row is not held by user_id (or by reservation_id, when given).
  std::optional<db::model::UnlockRecord> MarkProcessing(const std::string& unlock_id, const std::string& user_id, const std::string& job_id,
                                                        const std::string& reservation_id = {});

  // With a reservation_id guard, nullopt when the row moved on to another reservation.
  std::optional<db::model::UnlockRecord> CompleteUnlock(const std::string& unlock_id, const std::string& blueprint_id, const std::string& job_id,
                                                        const std::string& reservation_id = {});

  db::model::UnlockRecord FailUnlock(const std::string& unlock_id, const std::string& error_code, const std::string& error_message);

  // Like FailUnlock, but only while the row still carries reservation_id.
  std::optional<db::model::UnlockRecord> ReleaseReservation(const std::string& unlock_id, const std::string& reservation_id,
                                                            const std::string& error_code, const std::string& error_message);

  std::vector<db::model::UnlockRecord> FindExpiredReserved(uint32_t limit);
  std::vector<db::model::UnlockRecord> ListProcessing(uint32_t limit);

  std::optional<db::model::UnlockRecord> GetUnlock(const std::string& unlock_id);
  std::optional<db::model::UnlockRecord> GetUnlockBySourceItem(const std::string& source_item_id);

  const config::UnlockSettings& settings() const {
    return settings_;
  }

 private:
  using Mutation = std::function<bool(db::model::UnlockRecord&)>;

  // Read-modify-CAS loop. The mutation returns false to abandon the write.
  std::optional<db::model::UnlockRecord> Update(const std::string& unlock_id, const Mutation& mutate, const char* context);

  std::optional<db::model::UnlockRecord> TryCas(db::model::UnlockRecord next, uint64_t expected_version, const char* context);

  int64_t NowMs() const;

  std::shared_ptr<db::Repository> repository_;
  config::UnlockSettings          settings_;
  util::NowFn                     now_;
};

creditgate::v1::Unlock ToProto(const db::model::UnlockRecord& record);

} // namespace creditgate::unlock
