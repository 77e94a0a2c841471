#pragma once

#include <string>

namespace creditgate::unlock {

/*
  Deterministic idempotency and dedupe keys for the unlock flow.

  A reservation is charged under a key derived from its reservation id;
  every settle or refund of that charge is keyed by the hold's ledger id.
*/

inline std::string ReservationHoldKey(const std::string& unlock_id, const std::string& reservation_id) {
  return "unlock:" + unlock_id + ":reservation:" + reservation_id + ":hold";
}

inline std::string GenerationDedupeKey(const std::string& unlock_id, const std::string& reservation_id) {
  return "unlock:" + unlock_id + ":reservation:" + reservation_id + ":generate";
}

// suffix: settle, generation_failed_refund, reclaim_refund, sweep_*_refund, ...
inline std::string HoldResolutionKey(const std::string& unlock_id, const std::string& hold_ledger_id, const std::string& suffix) {
  return "unlock:" + unlock_id + ":hold:" + hold_ledger_id + ":" + suffix;
}

} // namespace creditgate::unlock
