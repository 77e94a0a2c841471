#include "internal/ledger/credit_ledger.hpp"

#include <google/protobuf/util/json_util.h>

#include <algorithm>
#include <cmath>
#include <limits>

#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"
#include "internal/util/credits.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/uuid.hpp"

namespace creditgate::ledger {

using creditgate::db::ErrorCode;
using creditgate::db::ThrowIfDbError;
using creditgate::db::model::LedgerEntryRecord;
using creditgate::db::model::WalletRecord;
using namespace creditgate::v1;

namespace {

constexpr int      kMaxCasAttempts      = 5;
constexpr uint32_t kMaxExportLimit      = 5000;
constexpr double   kMinFlatCreditAmount = 0.001;

bool IsRetryable(const db::Result& r) {
  return r.code == ErrorCode::Conflict || r.code == ErrorCode::Busy || r.code == ErrorCode::SerializationFailure;
}

std::string ContextToJson(const LedgerContext& context) {
  std::string json;
  const auto  status = google::protobuf::util::MessageToJsonString(context, &json);
  if (!status.ok()) {
    throw util::InvalidArgument("LEDGER_CONTEXT_INVALID: " + status.ToString());
  }
  return json;
}

void RequireUser(const std::string& user_id) {
  if (user_id.empty()) {
    throw util::InvalidArgument("AUTH_REQUIRED");
  }
}

} // namespace

const char* ToString(LedgerOutcome outcome) {
  switch (outcome) {
    case LedgerOutcome::kApplied:
      return "applied";
    case LedgerOutcome::kReplayed:
      return "replayed";
    case LedgerOutcome::kInsufficient:
      return "insufficient";
    case LedgerOutcome::kAlreadyResolved:
      return "already_resolved";
  }
  return "unknown";
}

LedgerEntry ToLedgerEntry(const LedgerEntryRecord& record) {
  LedgerEntry out;
  out.set_id(record.id);
  out.set_idempotency_key(record.idempotency_key);
  out.set_entry_type(record.entry_type);
  out.set_user_id(record.user_id);
  out.set_amount(util::FromMillicredits(record.amount_millis));
  out.set_delta(util::FromMillicredits(record.delta_millis));
  out.set_balance_after(util::FromMillicredits(record.balance_after_millis));
  out.set_reason_code(record.reason_code);
  out.set_resolves_ledger_id(record.resolves_ledger_id);
  out.set_created_at_ms(record.created_at_ms);

  if (!record.context_json.empty()) {
    google::protobuf::util::JsonParseOptions options;
    options.ignore_unknown_fields = true;
    const auto status = google::protobuf::util::JsonStringToMessage(record.context_json, out.mutable_context(), options);
    if (!status.ok()) {
      CREDITGATE_LOG_WARN("ledger entry context is not valid JSON",
                          {observability::StringField("ledger_id", record.id), observability::StringField("error", status.ToString())});
      out.clear_context();
    }
  }
  return out;
}

CreditLedger::CreditLedger(std::shared_ptr<db::Repository> repository, config::WalletSettings settings, util::NowFn now)
    : repository_(std::move(repository)), settings_(settings), now_(std::move(now)) {
  if (!repository_) {
    throw std::invalid_argument("CreditLedger requires a repository");
  }
}

int64_t CreditLedger::NowMs() const {
  return util::ToUnixMillis(now_());
}

WalletRecord CreditLedger::NewWallet(const std::string& user_id, int64_t now_ms) const {
  WalletRecord w;
  w.user_id             = user_id;
  w.capacity_millis     = util::ToMillicredits(settings_.capacity);
  w.balance_millis      = std::clamp<int64_t>(util::ToMillicredits(settings_.initial_balance), 0, w.capacity_millis);
  w.refill_rate_per_sec = settings_.RefillRatePerSecond();
  w.last_refill_at_ms   = now_ms;
  w.created_at_ms       = now_ms;
  w.updated_at_ms       = now_ms;
  w.version             = 1;
  return w;
}

WalletRecord CreditLedger::Refill(const WalletRecord& wallet, int64_t now_ms) const {
  WalletRecord out = wallet;
  if (now_ms <= wallet.last_refill_at_ms) {
    out.balance_millis = std::clamp<int64_t>(wallet.balance_millis, 0, wallet.capacity_millis);
    return out;
  }

  // elapsed_ms * credits/sec == millicredits gained
  const double gained        = static_cast<double>(now_ms - wallet.last_refill_at_ms) * wallet.refill_rate_per_sec;
  const auto   gained_millis = static_cast<int64_t>(std::llround(gained));
  out.balance_millis = std::clamp<int64_t>(wallet.balance_millis + gained_millis, 0, wallet.capacity_millis);
  return out;
}

WalletSnapshot CreditLedger::ToSnapshot(const WalletRecord& wallet) const {
  WalletSnapshot s;
  s.set_user_id(wallet.user_id);
  s.set_balance(util::FromMillicredits(wallet.balance_millis));
  s.set_capacity(util::FromMillicredits(wallet.capacity_millis));
  s.set_refill_rate_per_sec(wallet.refill_rate_per_sec);
  s.set_last_refill_at_ms(wallet.last_refill_at_ms);

  const double remaining = util::FromMillicredits(std::max<int64_t>(0, wallet.capacity_millis - wallet.balance_millis));
  if (remaining <= 0.0) {
    s.set_seconds_to_full(0);
  } else if (wallet.refill_rate_per_sec > 0.0) {
    s.set_seconds_to_full(static_cast<int64_t>(std::ceil(remaining / wallet.refill_rate_per_sec)));
  } else {
    s.set_seconds_to_full(std::numeric_limits<int64_t>::max());
  }
  return s;
}

WalletSnapshot CreditLedger::BypassSnapshot(const std::string& user_id) const {
  WalletSnapshot s;
  s.set_user_id(user_id);
  s.set_balance(settings_.capacity);
  s.set_capacity(settings_.capacity);
  s.set_refill_rate_per_sec(settings_.RefillRatePerSecond());
  s.set_last_refill_at_ms(NowMs());
  s.set_seconds_to_full(0);
  s.set_bypass(true);
  return s;
}

WalletSnapshot CreditLedger::GetWallet(const std::string& user_id) {
  RequireUser(user_id);
  if (settings_.bypass) {
    return BypassSnapshot(user_id);
  }

  for (int attempt = 0; attempt < kMaxCasAttempts; ++attempt) {
    const auto now_ms = NowMs();
    auto       tx     = repository_->Begin();

    if (auto wallet = repository_->GetWallet(*tx, user_id)) {
      tx->Commit();
      return ToSnapshot(Refill(*wallet, now_ms));
    }

    const auto fresh  = NewWallet(user_id, now_ms);
    const auto result = repository_->InsertWallet(*tx, fresh);
    if (result) {
      tx->Commit();
      return ToSnapshot(fresh);
    }
    tx->Rollback();
    if (result.IsDuplicate() || IsRetryable(result)) continue;
    ThrowIfDbError(result, "GetWallet insert");
  }

  throw util::Conflict("WALLET_READ_CONFLICT: " + user_id);
}

LedgerResult CreditLedger::Apply(const LedgerRequest& request, LedgerEntryType type, int64_t amount_millis, const char* op,
                                 const char* conflict_code, const Planner& plan) {
  if (request.idempotency_key.empty()) {
    throw util::InvalidArgument("IDEMPOTENCY_KEY_REQUIRED");
  }

  observability::SpanScope span(std::string("ledger.") + op);
  span.SetAttribute("user_id", request.user_id);
  span.SetAttribute("idempotency_key", request.idempotency_key);

  auto& metrics = observability::Metrics::Instance();
  auto  finish  = [&](LedgerResult result) {
    metrics.RecordLedgerOperation(op, ToString(result.outcome));
    return result;
  };

  for (int attempt = 0; attempt < kMaxCasAttempts; ++attempt) {
    const auto now_ms = NowMs();
    auto       tx     = repository_->Begin();

    if (auto prior = repository_->GetLedgerEntryByKey(*tx, request.idempotency_key)) {
      if (prior->entry_type != type || prior->user_id != request.user_id) {
        tx->Rollback();
        throw util::InvalidState(std::string("IDEMPOTENCY_KEY_REUSED: ") + request.idempotency_key);
      }

      LedgerResult result;
      result.outcome   = LedgerOutcome::kReplayed;
      result.ledger_id = prior->id;
      result.amount    = util::FromMillicredits(prior->amount_millis);
      if (auto wallet = repository_->GetWallet(*tx, request.user_id)) {
        result.wallet = ToSnapshot(Refill(*wallet, now_ms));
      }
      tx->Commit();
      return finish(std::move(result));
    }

    if (!request.resolves_ledger_id.empty()) {
      if (auto resolution = repository_->GetLedgerResolution(*tx, request.resolves_ledger_id)) {
        LedgerResult result;
        result.outcome   = LedgerOutcome::kAlreadyResolved;
        result.ledger_id = resolution->id;
        result.amount    = util::FromMillicredits(resolution->amount_millis);
        if (auto wallet = repository_->GetWallet(*tx, request.user_id)) {
          result.wallet = ToSnapshot(Refill(*wallet, now_ms));
        }
        tx->Commit();
        CREDITGATE_LOG_INFO("ledger hold already resolved", {observability::StringField("hold_ledger_id", request.resolves_ledger_id),
                                                             observability::StringField("resolution_id", resolution->id),
                                                             observability::StringField("op", op)});
        return finish(std::move(result));
      }
    }

    auto wallet  = repository_->GetWallet(*tx, request.user_id);
    bool created = false;
    if (!wallet) {
      const auto fresh  = NewWallet(request.user_id, now_ms);
      const auto result = repository_->InsertWallet(*tx, fresh);
      if (!result) {
        tx->Rollback();
        if (result.IsDuplicate() || IsRetryable(result)) continue;
        ThrowIfDbError(result, std::string(op) + " wallet insert");
      }
      wallet  = fresh;
      created = true;
    }

    const auto refilled = Refill(*wallet, now_ms);
    const auto movement = plan(refilled, *tx);

    if (movement.insufficient) {
      // A wallet created by this call keeps its refill clock even though nothing is debited.
      if (created) {
        tx->Commit();
      } else {
        tx->Rollback();
      }
      LedgerResult result;
      result.outcome  = LedgerOutcome::kInsufficient;
      result.amount   = util::FromMillicredits(amount_millis);
      result.required = util::FromMillicredits(movement.required_millis);
      result.wallet   = ToSnapshot(refilled);
      return finish(std::move(result));
    }

    auto next              = refilled;
    next.balance_millis    = std::clamp<int64_t>(refilled.balance_millis + movement.delta_millis, 0, refilled.capacity_millis);
    next.last_refill_at_ms = now_ms;
    next.updated_at_ms     = now_ms;

    const auto cas = repository_->CompareAndSwapWallet(*tx, next, wallet->version);
    if (!cas) {
      tx->Rollback();
      if (IsRetryable(cas) || cas.code == ErrorCode::NotFound) continue;
      ThrowIfDbError(cas, std::string(op) + " wallet update");
    }

    LedgerEntryRecord entry;
    entry.id                   = util::NewId();
    entry.idempotency_key      = request.idempotency_key;
    entry.entry_type           = type;
    entry.user_id              = request.user_id;
    entry.amount_millis        = amount_millis;
    entry.delta_millis         = next.balance_millis - refilled.balance_millis;
    entry.balance_after_millis = next.balance_millis;
    entry.reason_code          = request.reason_code;
    entry.context_json         = ContextToJson(request.context);
    entry.resolves_ledger_id   = request.resolves_ledger_id;
    entry.created_at_ms        = now_ms;

    const auto inserted = repository_->InsertLedgerEntry(*tx, entry);
    if (!inserted) {
      tx->Rollback();
      // Key or resolution taken concurrently; the next pass reports it.
      if (inserted.IsDuplicate() || IsRetryable(inserted)) continue;
      ThrowIfDbError(inserted, std::string(op) + " ledger insert");
    }

    tx->Commit();

    CREDITGATE_LOG_DEBUG("ledger entry applied", {observability::StringField("op", op), observability::StringField("ledger_id", entry.id),
                                                  observability::StringField("user_id", entry.user_id),
                                                  observability::IntField("delta_millis", entry.delta_millis),
                                                  observability::IntField("balance_after_millis", entry.balance_after_millis)});

    LedgerResult result;
    result.outcome   = LedgerOutcome::kApplied;
    result.ledger_id = entry.id;
    result.amount    = util::FromMillicredits(amount_millis);
    result.wallet    = ToSnapshot(next);
    return finish(std::move(result));
  }

  metrics.RecordLedgerOperation(op, "conflict");
  CREDITGATE_LOG_WARN("ledger CAS retries exhausted", {observability::StringField("op", op), observability::StringField("user_id", request.user_id),
                                                       observability::StringField("idempotency_key", request.idempotency_key)});
  throw util::Conflict(std::string(conflict_code) + ": " + request.user_id);
}

LedgerResult CreditLedger::ReserveCredits(const LedgerRequest& request) {
  RequireUser(request.user_id);
  const auto amount_millis = util::ToMillicredits(util::Round3(request.amount));
  if (amount_millis <= 0) {
    throw util::InvalidArgument("INVALID_RESERVE_AMOUNT");
  }

  if (settings_.bypass) {
    LedgerResult result;
    result.amount = util::FromMillicredits(amount_millis);
    result.wallet = BypassSnapshot(request.user_id);
    result.bypass = true;
    return result;
  }

  return Apply(request, LEDGER_ENTRY_TYPE_HOLD, amount_millis, "hold", "WALLET_RESERVE_CONFLICT",
               [amount_millis](const WalletRecord& refilled, db::Transaction&) {
                 Movement m;
                 if (refilled.balance_millis < amount_millis) {
                   m.insufficient    = true;
                   m.required_millis = amount_millis;
                   return m;
                 }
                 m.delta_millis = -amount_millis;
                 return m;
               });
}

LedgerResult CreditLedger::SettleReservation(const LedgerRequest& request) {
  RequireUser(request.user_id);
  const auto amount_millis = util::ToMillicredits(util::Round3(request.amount));
  if (amount_millis < 0) {
    throw util::InvalidArgument("INVALID_SETTLE_AMOUNT");
  }

  if (settings_.bypass) {
    LedgerResult result;
    result.amount = util::FromMillicredits(amount_millis);
    result.wallet = BypassSnapshot(request.user_id);
    result.bypass = true;
    return result;
  }

  return Apply(request, LEDGER_ENTRY_TYPE_SETTLE, amount_millis, "settle", "WALLET_SETTLE_CONFLICT",
               [&, amount_millis](const WalletRecord& refilled, db::Transaction& tx) {
                 int64_t held_millis = amount_millis;
                 if (request.held_amount) {
                   held_millis = util::ToMillicredits(util::Round3(*request.held_amount));
                 } else if (!request.resolves_ledger_id.empty()) {
                   auto hold = repository_->GetLedgerEntry(tx, request.resolves_ledger_id);
                   if (!hold) {
                     throw util::NotFound("HOLD_NOT_FOUND: " + request.resolves_ledger_id);
                   }
                   held_millis = hold->amount_millis;
                 }

                 // Positive delta releases an over-estimate, negative charges the shortfall.
                 Movement m;
                 m.delta_millis = held_millis - amount_millis;
                 if (m.delta_millis < 0 && refilled.balance_millis < -m.delta_millis) {
                   m.insufficient    = true;
                   m.required_millis = -m.delta_millis;
                 }
                 return m;
               });
}

LedgerResult CreditLedger::RefundReservation(const LedgerRequest& request) {
  RequireUser(request.user_id);
  const auto amount_millis = util::ToMillicredits(util::Round3(request.amount));
  if (amount_millis <= 0) {
    throw util::InvalidArgument("INVALID_REFUND_AMOUNT");
  }

  if (settings_.bypass) {
    LedgerResult result;
    result.amount = util::FromMillicredits(amount_millis);
    result.wallet = BypassSnapshot(request.user_id);
    result.bypass = true;
    return result;
  }

  return Apply(request, LEDGER_ENTRY_TYPE_REFUND, amount_millis, "refund", "WALLET_REFUND_CONFLICT",
               [amount_millis](const WalletRecord&, db::Transaction&) {
                 Movement m;
                 m.delta_millis = amount_millis;
                 return m;
               });
}

LedgerResult CreditLedger::GrantCredits(const LedgerRequest& request) {
  RequireUser(request.user_id);
  const auto amount_millis = util::ToMillicredits(util::Round3(request.amount));
  if (amount_millis <= 0) {
    throw util::InvalidArgument("INVALID_GRANT_AMOUNT");
  }

  if (settings_.bypass) {
    LedgerResult result;
    result.amount = util::FromMillicredits(amount_millis);
    result.wallet = BypassSnapshot(request.user_id);
    result.bypass = true;
    return result;
  }

  return Apply(request, LEDGER_ENTRY_TYPE_GRANT, amount_millis, "grant", "WALLET_GRANT_CONFLICT",
               [amount_millis](const WalletRecord&, db::Transaction&) {
                 Movement m;
                 m.delta_millis = amount_millis;
                 return m;
               });
}

LedgerResult CreditLedger::ConsumeFlatCredit(const std::string& user_id, double amount, const std::string& idempotency_key,
                                             const std::string& reason_code, const LedgerContext& context) {
  const double charge = std::max(kMinFlatCreditAmount, util::Round3(amount));

  LedgerRequest hold;
  hold.user_id         = user_id;
  hold.amount          = charge;
  hold.idempotency_key = idempotency_key + ":hold";
  hold.reason_code     = reason_code + "_HOLD";
  hold.context         = context;

  auto held = ReserveCredits(hold);
  if (!held.ok() || held.bypass) {
    return held;
  }

  LedgerRequest settle;
  settle.user_id            = user_id;
  settle.amount             = charge;
  settle.idempotency_key    = idempotency_key + ":settle";
  settle.reason_code        = reason_code + "_SETTLE";
  settle.context            = context;
  settle.resolves_ledger_id = held.ledger_id;
  settle.held_amount        = charge;

  auto settled = SettleReservation(settle);
  if (settled.outcome == LedgerOutcome::kAlreadyResolved) {
    settled.outcome = LedgerOutcome::kReplayed;
  }
  return settled;
}

std::vector<LedgerEntry> CreditLedger::ExportLedger(const db::LedgerQuery& query) {
  auto bounded  = query;
  bounded.limit = std::clamp<uint32_t>(query.limit, 1, kMaxExportLimit);

  auto tx   = repository_->Begin();
  auto rows = repository_->ListLedgerEntries(*tx, bounded);
  tx->Commit();

  std::vector<LedgerEntry> out;
  out.reserve(rows.size());
  for (const auto& row : rows) {
    out.push_back(ToLedgerEntry(row));
  }
  return out;
}

} // namespace creditgate::ledger
