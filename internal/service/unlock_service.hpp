#pragma once

#include "creditgate/v1.hpp"
#include "service_context.hpp"

namespace creditgate::unlock {
struct ReserveOutcome;
}

namespace creditgate::service {

inline constexpr char kHoldReasonCode[]          = "UNLOCK_RESERVE";
inline constexpr char kInsufficientCreditsCode[] = "INSUFFICIENT_CREDITS";

/*
  UnlockService

  Request path for content unlocks: price the item, reserve the slot,
  charge the reserving user once, and queue artifact generation.
  Plus read-only views of unlocks, wallets, the ledger and the circuit.
*/
class UnlockService {
 public:
  explicit UnlockService(ServiceContext ctx);

  creditgate::v1::RequestUnlockResponse RequestUnlock(const creditgate::v1::RequestUnlockRequest& req);

  creditgate::v1::GetUnlockResponse GetUnlock(const creditgate::v1::GetUnlockRequest& req);

  creditgate::v1::GetWalletResponse GetWallet(const creditgate::v1::GetWalletRequest& req);

  creditgate::v1::ExportLedgerResponse ExportLedger(const creditgate::v1::ExportLedgerRequest& req);

  creditgate::v1::RunSweepResponse RunSweep(const creditgate::v1::RunSweepRequest& req);

  creditgate::v1::GetProviderCircuitResponse GetProviderCircuit(const creditgate::v1::GetProviderCircuitRequest& req);

 private:
  void RefundReclaimed(const creditgate::unlock::ReserveOutcome& outcome, const std::string& trace_id);

  ServiceContext ctx_;
};

} // namespace creditgate::service
