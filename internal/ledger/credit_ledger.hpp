#pragma once

#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "creditgate/v1/types.pb.h"
#include "internal/config/runtime_settings.hpp"
#include "internal/db/api/repository.hpp"
#include "internal/util/time.hpp"

namespace creditgate::ledger {

enum class LedgerOutcome {
  kApplied,         // entry written by this call
  kReplayed,        // idempotency key already used; prior entry returned
  kInsufficient,    // refilled balance does not cover the debit; nothing written
  kAlreadyResolved, // another entry already resolves this hold; nothing written
};

const char* ToString(LedgerOutcome outcome);

struct LedgerRequest {
  std::string                   user_id;
  double                        amount = 0.0;
  std::string                   idempotency_key;
  std::string                   reason_code;
  creditgate::v1::LedgerContext context;

  // Settle / refund: the hold being resolved. At most one entry may name it.
  std::string resolves_ledger_id;

  // Settle only: what the hold took. Defaults to the hold entry's amount.
  std::optional<double> held_amount;
};

struct LedgerResult {
  LedgerOutcome                  outcome = LedgerOutcome::kApplied;
  std::string                    ledger_id;
  double                         amount   = 0.0;
  double                         required = 0.0;
  creditgate::v1::WalletSnapshot wallet;
  bool                           bypass = false;

  bool ok() const {
    return outcome == LedgerOutcome::kApplied || outcome == LedgerOutcome::kReplayed;
  }
};

/*
  CreditLedger

  Refilling credit wallet plus an append-only ledger.

  - Balances are refilled lazily: min(capacity, balance + elapsed * rate).
  - Every balance change and its ledger entry commit in one transaction,
    guarded by a wallet version CAS (retried up to 5 times).
  - Every entry carries a unique idempotency key; replays return the
    original entry and move no money.
  - A hold is resolved (settled or refunded) at most once.

  Bypass mode skips all accounting; holds succeed with an empty ledger id.
*/
class CreditLedger {
 public:
  CreditLedger(std::shared_ptr<db::Repository> repository, config::WalletSettings settings, util::NowFn now = util::Now);

  creditgate::v1::WalletSnapshot GetWallet(const std::string& user_id);

  LedgerResult ReserveCredits(const LedgerRequest& request);
  LedgerResult SettleReservation(const LedgerRequest& request);
  LedgerResult RefundReservation(const LedgerRequest& request);

  // Administrative top-up, capped at capacity.
  LedgerResult GrantCredits(const LedgerRequest& request);

  // Hold "<key>:hold" then settle "<key>:settle" for a one-shot charge.
  LedgerResult ConsumeFlatCredit(const std::string& user_id, double amount, const std::string& idempotency_key,
                                 const std::string& reason_code, const creditgate::v1::LedgerContext& context = {});

  std::vector<creditgate::v1::LedgerEntry> ExportLedger(const db::LedgerQuery& query);

  bool bypass() const {
    return settings_.bypass;
  }

 private:
  struct Movement {
    int64_t delta_millis    = 0;
    int64_t required_millis = 0;
    bool    insufficient    = false;
  };

  using Planner = std::function<Movement(const db::model::WalletRecord& refilled, db::Transaction& tx)>;

  LedgerResult Apply(const LedgerRequest& request, creditgate::v1::LedgerEntryType type, int64_t amount_millis, const char* op,
                     const char* conflict_code, const Planner& plan);

  db::model::WalletRecord NewWallet(const std::string& user_id, int64_t now_ms) const;
  db::model::WalletRecord Refill(const db::model::WalletRecord& wallet, int64_t now_ms) const;
  creditgate::v1::WalletSnapshot ToSnapshot(const db::model::WalletRecord& wallet) const;
  creditgate::v1::WalletSnapshot BypassSnapshot(const std::string& user_id) const;

  int64_t NowMs() const;

  std::shared_ptr<db::Repository> repository_;
  config::WalletSettings          settings_;
  util::NowFn                     now_;
};

// Row -> wire form, with the stored context JSON parsed back.
creditgate::v1::LedgerEntry ToLedgerEntry(const db::model::LedgerEntryRecord& record);

} // namespace creditgate::ledger
