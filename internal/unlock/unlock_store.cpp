#include "internal/unlock/unlock_store.hpp"

#include <algorithm>

#include "internal/observability/logging.hpp"
#include "internal/util/credits.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/uuid.hpp"

namespace creditgate::unlock {

using creditgate::db::ErrorCode;
using creditgate::db::ThrowIfDbError;
using creditgate::db::model::UnlockRecord;
using namespace creditgate::v1;

namespace {

constexpr int      kMaxCasAttempts            = 5;
constexpr uint32_t kMinReservationSeconds     = 30;
constexpr uint32_t kMaxFindExpiredLimit       = 500;
constexpr size_t   kMaxErrorCodeLength        = 120;
constexpr size_t   kMaxErrorMessageLength     = 500;
constexpr char     kDefaultFailureErrorCode[] = "UNLOCK_GENERATION_FAILED";

std::string Trim(const std::string& s) {
  const auto begin = s.find_first_not_of(" \t\r\n");
  if (begin == std::string::npos) return {};
  const auto end = s.find_last_not_of(" \t\r\n");
  return s.substr(begin, end - begin + 1);
}

bool IsExpired(const UnlockRecord& r, int64_t now_ms) {
  return r.reservation_expires_at_ms != 0 && r.reservation_expires_at_ms <= now_ms;
}

void ClearReservation(UnlockRecord& r) {
  r.reserved_by_user_id       = {};
  r.reservation_expires_at_ms = 0;
  r.reservation_id            = {};
  r.reserved_ledger_id        = {};
  r.reserved_amount_millis    = 0;
}

bool IsRetryable(const db::Result& r) {
  return r.code == ErrorCode::Conflict || r.code == ErrorCode::NotFound || r.code == ErrorCode::Busy ||
         r.code == ErrorCode::SerializationFailure;
}

} // namespace

const char* ToString(ReserveKind kind) {
  switch (kind) {
    case ReserveKind::kReady:
      return "ready";
    case ReserveKind::kInProgress:
      return "in_progress";
    case ReserveKind::kReserved:
      return "reserved";
  }
  return "unknown";
}

UnlockStore::UnlockStore(std::shared_ptr<db::Repository> repository, config::UnlockSettings settings, util::NowFn now)
    : repository_(std::move(repository)), settings_(settings), now_(std::move(now)) {
  if (!repository_) {
    throw std::invalid_argument("UnlockStore requires a repository");
  }
}

int64_t UnlockStore::NowMs() const {
  return util::ToUnixMillis(now_());
}

UnlockRecord UnlockStore::EnsureUnlock(const std::string& source_item_id, const std::string& source_page_id, double estimated_cost) {
  const auto item_id = Trim(source_item_id);
  if (item_id.empty()) {
    throw util::InvalidArgument("SOURCE_ITEM_REQUIRED");
  }

  const auto page_id    = Trim(source_page_id);
  const auto cost_milli = util::ToMillicredits(util::Round3(estimated_cost));

  for (int attempt = 0; attempt < kMaxCasAttempts; ++attempt) {
    const auto now_ms = NowMs();
    auto       tx     = repository_->Begin();

    if (auto existing = repository_->GetUnlockBySourceItem(*tx, item_id)) {
      const bool page_changed = !page_id.empty() && existing->source_page_id != page_id;
      if (existing->estimated_cost_millis == cost_milli && !page_changed) {
        tx->Commit();
        return *existing;
      }

      auto next                  = *existing;
      next.estimated_cost_millis = cost_milli;
      if (page_changed) next.source_page_id = page_id;
      next.updated_at_ms = now_ms;

      const auto result = repository_->CompareAndSwapUnlock(*tx, next, existing->version);
      if (result) {
        tx->Commit();
        return next;
      }
      tx->Rollback();
      if (IsRetryable(result)) continue;
      ThrowIfDbError(result, "EnsureUnlock update");
    }

    UnlockRecord record;
    record.id                    = util::NewId();
    record.source_item_id        = item_id;
    record.source_page_id        = page_id;
    record.status                = UNLOCK_STATUS_AVAILABLE;
    record.estimated_cost_millis = cost_milli;
    record.created_at_ms         = now_ms;
    record.updated_at_ms         = now_ms;
    record.version               = 1;

    const auto result = repository_->InsertUnlock(*tx, record);
    if (result) {
      tx->Commit();
      return record;
    }
    tx->Rollback();

    // Lost the insert race; the winner's row is read on the next pass.
    if (result.IsDuplicate()) continue;
    ThrowIfDbError(result, "EnsureUnlock insert");
  }

  throw util::Conflict("UNLOCK_ENSURE_CONFLICT: " + item_id);
}

std::optional<UnlockRecord> UnlockStore::TryCas(UnlockRecord next, uint64_t expected_version, const char* context) {
  auto       tx     = repository_->Begin();
  const auto result = repository_->CompareAndSwapUnlock(*tx, next, expected_version);
  if (result) {
    tx->Commit();
    return next;
  }
  tx->Rollback();
  if (IsRetryable(result)) return std::nullopt;
  ThrowIfDbError(result, context);
  return std::nullopt;
}

ReserveOutcome UnlockStore::Reserve(const UnlockRecord& unlock, const std::string& user_id, double estimated_cost,
                                    uint32_t reservation_seconds) {
  const auto user = Trim(user_id);
  if (user.empty()) {
    throw util::InvalidArgument("AUTH_REQUIRED");
  }

  ReserveOutcome outcome;
  UnlockRecord   current = unlock;

  for (int attempt = 0; attempt < kMaxCasAttempts; ++attempt) {
    const auto now_ms = NowMs();

    if (current.status == UNLOCK_STATUS_READY && !current.blueprint_id.empty()) {
      outcome.kind   = ReserveKind::kReady;
      outcome.unlock = current;
      return outcome;
    }

    if (current.status == UNLOCK_STATUS_RESERVED && !IsExpired(current, now_ms)) {
      outcome.kind   = current.reserved_by_user_id == user ? ReserveKind::kReserved : ReserveKind::kInProgress;
      outcome.unlock = current;
      return outcome;
    }

    if (current.status == UNLOCK_STATUS_PROCESSING && !IsExpired(current, now_ms)) {
      outcome.kind   = ReserveKind::kInProgress;
      outcome.unlock = current;
      return outcome;
    }

    if (current.status == UNLOCK_STATUS_RESERVED || current.status == UNLOCK_STATUS_PROCESSING) {
      // Expired: hand the slot back before competing for it.
      auto reset = current;
      reset.status = UNLOCK_STATUS_AVAILABLE;
      ClearReservation(reset);
      reset.updated_at_ms = now_ms;

      if (auto reclaimed = TryCas(reset, current.version, "Reserve reclaim")) {
        CREDITGATE_LOG_INFO("unlock reservation reclaimed", {observability::StringField("unlock_id", current.id),
                                                             observability::StringField("previous_user_id", current.reserved_by_user_id)});
        outcome.reclaimed = current;
        current           = *reclaimed;
      } else {
        auto reloaded = GetUnlock(current.id);
        if (!reloaded) throw util::NotFound("UNLOCK_NOT_FOUND: " + current.id);
        current = *reloaded;
        continue;
      }
    }

    auto next                      = current;
    next.status                    = UNLOCK_STATUS_RESERVED;
    next.estimated_cost_millis     = util::ToMillicredits(util::Round3(estimated_cost));
    next.reserved_by_user_id       = user;
    next.reservation_expires_at_ms = now_ms + static_cast<int64_t>(std::max(kMinReservationSeconds, reservation_seconds)) * 1000;
    next.reservation_id            = util::NewId("r_");
    next.reserved_ledger_id        = {};
    next.reserved_amount_millis    = 0;
    next.last_error_code           = {};
    next.last_error_message        = {};
    next.updated_at_ms             = now_ms;

    if (auto reserved = TryCas(next, current.version, "Reserve")) {
      outcome.kind         = ReserveKind::kReserved;
      outcome.unlock       = *reserved;
      outcome.reserved_now = true;
      return outcome;
    }

    auto reloaded = GetUnlock(current.id);
    if (!reloaded) throw util::NotFound("UNLOCK_NOT_FOUND: " + current.id);
    current = *reloaded;
  }

  // Still contended after every attempt: somebody else is moving this row.
  outcome.kind   = current.status == UNLOCK_STATUS_READY && !current.blueprint_id.empty() ? ReserveKind::kReady : ReserveKind::kInProgress;
  outcome.unlock = current;
  return outcome;
}

std::optional<UnlockRecord> UnlockStore::Update(const std::string& unlock_id, const Mutation& mutate, const char* context) {
  for (int attempt = 0; attempt < kMaxCasAttempts; ++attempt) {
    auto tx      = repository_->Begin();
    auto current = repository_->GetUnlock(*tx, unlock_id);
    if (!current) {
      tx->Rollback();
      throw util::NotFound(std::string(context) + ": unlock " + unlock_id + " not found");
    }

    auto next = *current;
    if (!mutate(next)) {
      tx->Rollback();
      return std::nullopt;
    }
    next.updated_at_ms = NowMs();

    const auto result = repository_->CompareAndSwapUnlock(*tx, next, current->version);
    if (result) {
      tx->Commit();
      return next;
    }
    tx->Rollback();
    if (result.code == ErrorCode::Conflict || result.code == ErrorCode::Busy || result.code == ErrorCode::SerializationFailure) continue;
    ThrowIfDbError(result, context);
  }

  throw util::Conflict(std::string(context) + ": unlock " + unlock_id + " kept changing");
}

std::optional<UnlockRecord> UnlockStore::AttachReservationLedger(const std::string& unlock_id, const std::string& reservation_id,
                                                                 const std::string& ledger_id, double amount) {
  const auto amount_milli = util::ToMillicredits(util::Round3(amount));
  return Update(
      unlock_id,
      [&](UnlockRecord& r) {
        if (r.status != UNLOCK_STATUS_RESERVED || r.reservation_id != reservation_id) return false;
        r.reserved_ledger_id     = ledger_id;
        r.reserved_amount_millis = amount_milli;
        r.estimated_cost_millis  = amount_milli;
        return true;
      },
      "AttachReservationLedger");
}

std::optional<UnlockRecord> UnlockStore::MarkProcessing(const std::string& unlock_id, const std::string& user_id, const std::string& job_id,
                                                        const std::string& reservation_id) {
  const auto window_ms = static_cast<int64_t>(settings_.processing_window_seconds) * 1000;
  return Update(
      unlock_id,
      [&](UnlockRecord& r) {
        if (r.reserved_by_user_id != user_id) return false;
        if (!reservation_id.empty() && r.reservation_id != reservation_id) return false;
        r.status                    = UNLOCK_STATUS_PROCESSING;
        r.job_id                    = job_id;
        r.reservation_expires_at_ms = NowMs() + window_ms;
        return true;
      },
      "MarkProcessing");
}

std::optional<UnlockRecord> UnlockStore::CompleteUnlock(const std::string& unlock_id, const std::string& blueprint_id,
                                                        const std::string& job_id, const std::string& reservation_id) {
  return Update(
      unlock_id,
      [&](UnlockRecord& r) {
        if (!reservation_id.empty() && r.reservation_id != reservation_id) return false;
        r.status       = UNLOCK_STATUS_READY;
        r.blueprint_id = blueprint_id;
        r.job_id       = job_id;
        ClearReservation(r);
        r.last_error_code    = {};
        r.last_error_message = {};
        return true;
      },
      "CompleteUnlock");
}

UnlockRecord UnlockStore::FailUnlock(const std::string& unlock_id, const std::string& error_code, const std::string& error_message) {
  auto updated = Update(
      unlock_id,
      [&](UnlockRecord& r) {
        r.status = UNLOCK_STATUS_AVAILABLE;
        ClearReservation(r);
        r.job_id             = {};
        r.last_error_code    = error_code.empty() ? kDefaultFailureErrorCode : error_code.substr(0, kMaxErrorCodeLength);
        r.last_error_message = error_message.substr(0, kMaxErrorMessageLength);
        return true;
      },
      "FailUnlock");
  return *updated;
}

std::optional<UnlockRecord> UnlockStore::ReleaseReservation(const std::string& unlock_id, const std::string& reservation_id,
                                                            const std::string& error_code, const std::string& error_message) {
  return Update(
      unlock_id,
      [&](UnlockRecord& r) {
        if (r.reservation_id != reservation_id) return false;
        if (r.status != UNLOCK_STATUS_RESERVED && r.status != UNLOCK_STATUS_PROCESSING) return false;
        r.status = UNLOCK_STATUS_AVAILABLE;
        ClearReservation(r);
        r.job_id             = {};
        r.last_error_code    = error_code.empty() ? kDefaultFailureErrorCode : error_code.substr(0, kMaxErrorCodeLength);
        r.last_error_message = error_message.substr(0, kMaxErrorMessageLength);
        return true;
      },
      "ReleaseReservation");
}

std::vector<UnlockRecord> UnlockStore::FindExpiredReserved(uint32_t limit) {
  limit = std::clamp<uint32_t>(limit, 1, kMaxFindExpiredLimit);

  auto tx   = repository_->Begin();
  auto rows = repository_->ListExpiredUnlocks(*tx, UNLOCK_STATUS_RESERVED, NowMs(), limit);
  tx->Commit();
  return rows;
}

std::vector<UnlockRecord> UnlockStore::ListProcessing(uint32_t limit) {
  auto tx   = repository_->Begin();
  auto rows = repository_->ListUnlocksByStatus(*tx, UNLOCK_STATUS_PROCESSING, std::max<uint32_t>(limit, 1));
  tx->Commit();
  return rows;
}

std::optional<UnlockRecord> UnlockStore::GetUnlock(const std::string& unlock_id) {
  auto tx  = repository_->Begin();
  auto row = repository_->GetUnlock(*tx, unlock_id);
  tx->Commit();
  return row;
}

std::optional<UnlockRecord> UnlockStore::GetUnlockBySourceItem(const std::string& source_item_id) {
  auto tx  = repository_->Begin();
  auto row = repository_->GetUnlockBySourceItem(*tx, Trim(source_item_id));
  tx->Commit();
  return row;
}

Unlock ToProto(const UnlockRecord& record) {
  Unlock out;
  out.set_id(record.id);
  out.set_source_item_id(record.source_item_id);
  out.set_source_page_id(record.source_page_id);
  out.set_status(record.status);
  out.set_estimated_cost(util::FromMillicredits(record.estimated_cost_millis));
  out.set_reserved_by_user_id(record.reserved_by_user_id);
  out.set_reservation_expires_at_ms(record.reservation_expires_at_ms);
  out.set_reservation_id(record.reservation_id);
  out.set_reserved_ledger_id(record.reserved_ledger_id);
  out.set_reserved_amount(util::FromMillicredits(record.reserved_amount_millis));
  out.set_blueprint_id(record.blueprint_id);
  out.set_job_id(record.job_id);
  out.set_last_error_code(record.last_error_code);
  out.set_last_error_message(record.last_error_message);
  out.set_created_at_ms(record.created_at_ms);
  out.set_updated_at_ms(record.updated_at_ms);
  out.set_version(record.version);
  return out;
}

} // namespace creditgate::unlock
