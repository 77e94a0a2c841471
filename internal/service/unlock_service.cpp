#include "unlock_service.hpp"

#include <google/protobuf/util/json_util.h>

#include <algorithm>
#include <chrono>
#include <stdexcept>

#include "internal/db/api/repository.hpp"
#include "internal/jobs/job_lease_store.hpp"
#include "internal/ledger/credit_ledger.hpp"
#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"
#include "internal/observability/unlock_trace.hpp"
#include "internal/provider/provider_circuit.hpp"
#include "internal/sweep/reliability_sweep.hpp"
#include "internal/unlock/unlock_cost.hpp"
#include "internal/unlock/unlock_keys.hpp"
#include "internal/unlock/unlock_store.hpp"
#include "internal/util/credits.hpp"
#include "internal/util/errors.hpp"

namespace creditgate::service {

using namespace creditgate::v1;
using creditgate::observability::StringField;

namespace {

template <typename Fn>
auto ObserveRpc(std::string_view route, const std::string& trace_id, Fn&& fn) {
  creditgate::observability::SpanScope span(route);
  if (!trace_id.empty()) {
    span.SetAttribute("trace_id", trace_id);
  }

  auto&      metrics    = creditgate::observability::Metrics::Instance();
  const auto started_at = std::chrono::steady_clock::now();
  const auto elapsed_ms = [&] { return std::chrono::duration<double, std::milli>(std::chrono::steady_clock::now() - started_at).count(); };

  try {
    auto result = fn();
    metrics.RecordRequest(route, true);
    metrics.ObserveRequestLatencyMs(route, elapsed_ms());
    return result;
  } catch (const std::exception& ex) {
    span.RecordException(ex.what());
    CREDITGATE_LOG_ERROR("RPC failed", {StringField("route", route), StringField("error", ex.what()), StringField("trace_id", trace_id)});
    metrics.RecordRequest(route, false);
    metrics.ObserveRequestLatencyMs(route, elapsed_ms());
    throw;
  }
}

std::string Trim(const std::string& s) {
  const auto begin = s.find_first_not_of(" \t\r\n");
  if (begin == std::string::npos) return {};
  const auto end = s.find_last_not_of(" \t\r\n");
  return s.substr(begin, end - begin + 1);
}

std::string ToJson(const google::protobuf::Message& message) {
  std::string json;
  const auto  status = google::protobuf::util::MessageToJsonString(message, &json);
  if (!status.ok()) {
    throw std::runtime_error("job payload encode: " + status.ToString());
  }
  return json;
}

LedgerContext UnlockContext(const creditgate::db::model::UnlockRecord& unlock, const std::string& trace_id, const char* source) {
  LedgerContext context;
  context.set_unlock_id(unlock.id);
  context.set_source_item_id(unlock.source_item_id);
  context.set_source_page_id(unlock.source_page_id);
  context.set_trace_id(trace_id);
  (*context.mutable_metadata())["source"] = source;
  return context;
}

} // namespace

UnlockService::UnlockService(ServiceContext ctx) : ctx_(std::move(ctx)) {
}

void UnlockService::RefundReclaimed(const unlock::ReserveOutcome& outcome, const std::string& trace_id) {
  const auto& previous = *outcome.reclaimed;
  if (previous.reserved_by_user_id.empty() || previous.reserved_ledger_id.empty() || previous.reserved_amount_millis <= 0) {
    return;
  }

  ledger::LedgerRequest refund;
  refund.user_id            = previous.reserved_by_user_id;
  refund.amount             = util::FromMillicredits(previous.reserved_amount_millis);
  refund.idempotency_key    = unlock::HoldResolutionKey(previous.id, previous.reserved_ledger_id, "reclaim_refund");
  refund.reason_code        = "UNLOCK_RESERVATION_EXPIRED_REFUND";
  refund.resolves_ledger_id = previous.reserved_ledger_id;
  refund.context            = UnlockContext(previous, trace_id, "unlock_reserve_reclaim");

  const auto result = ctx_.ledger->RefundReservation(refund);
  observability::LogUnlockEvent("unlock_reclaim_refund", {StringField("trace_id", trace_id), StringField("unlock_id", previous.id),
                                                          StringField("user_id", previous.reserved_by_user_id),
                                                          StringField("hold_ledger_id", previous.reserved_ledger_id),
                                                          StringField("outcome", ledger::ToString(result.outcome))});
}

RequestUnlockResponse UnlockService::RequestUnlock(const RequestUnlockRequest& req) {
  const auto trace_id = Trim(req.trace_id()).empty() ? observability::CreateUnlockTraceId() : Trim(req.trace_id());

  return ObserveRpc("UnlockService.RequestUnlock", trace_id, [&] {
    const auto user_id = Trim(req.user_id());
    if (user_id.empty()) {
      throw util::InvalidArgument("AUTH_REQUIRED");
    }

    const auto& unlock_settings = ctx_.settings.unlock;
    const auto  cost = unlock::ComputeUnlockCost(static_cast<double>(std::max<int64_t>(0, req.active_subscriber_count())),
                                                 unlock_settings.min_cost, unlock_settings.max_cost);

    auto row = ctx_.unlocks->EnsureUnlock(req.source_item_id(), req.source_page_id(), cost);

    if (ctx_.sweep) {
      try {
        ctx_.sweep->RunIfDue(trace_id);
      } catch (const std::exception& e) {
        CREDITGATE_LOG_WARN("opportunistic unlock sweep failed", {StringField("trace_id", trace_id), StringField("error", e.what())});
      }
    }

    auto outcome = ctx_.unlocks->Reserve(row, user_id, cost, unlock_settings.reservation_seconds);
    if (outcome.reclaimed) {
      RefundReclaimed(outcome, trace_id);
    }

    RequestUnlockResponse resp;
    resp.set_trace_id(trace_id);
    resp.set_reserved_now(outcome.reserved_now);

    const auto finish = [&](UnlockOutcome result, const creditgate::db::model::UnlockRecord& unlock) {
      resp.set_outcome(result);
      *resp.mutable_unlock() = unlock::ToProto(unlock);
      observability::Metrics::Instance().RecordUnlockOutcome(UnlockOutcome_Name(result));
      observability::LogUnlockEvent("unlock_request_result",
                                    {StringField("trace_id", trace_id), StringField("unlock_id", unlock.id), StringField("user_id", user_id),
                                     StringField("outcome", UnlockOutcome_Name(result)), StringField("ledger_id", resp.ledger_id()),
                                     StringField("job_id", resp.job_id())});
      return resp;
    };

    if (outcome.kind == unlock::ReserveKind::kReady) {
      return finish(UNLOCK_OUTCOME_READY, outcome.unlock);
    }
    if (outcome.kind == unlock::ReserveKind::kInProgress) {
      return finish(UNLOCK_OUTCOME_IN_PROGRESS, outcome.unlock);
    }

    auto        current        = outcome.unlock;
    const auto  reservation_id = current.reservation_id;
    const auto  amount         = util::FromMillicredits(current.estimated_cost_millis);

    // Charge the reservation once. A repeat of this request for the same
    // reservation collides on the hold key and replays the first charge.
    ledger::LedgerRequest hold;
    hold.user_id         = user_id;
    hold.amount          = amount;
    hold.idempotency_key = unlock::ReservationHoldKey(current.id, reservation_id);
    hold.reason_code     = kHoldReasonCode;
    hold.context         = UnlockContext(current, trace_id, "unlock_request");
    (*hold.context.mutable_metadata())["reservation_id"] = reservation_id;

    const auto held = ctx_.ledger->ReserveCredits(hold);
    *resp.mutable_wallet() = held.wallet;

    if (held.outcome == ledger::LedgerOutcome::kInsufficient) {
      resp.set_required(held.required);
      auto released = ctx_.unlocks->ReleaseReservation(current.id, reservation_id, kInsufficientCreditsCode,
                                                       "Insufficient credits to unlock this item.");
      return finish(UNLOCK_OUTCOME_INSUFFICIENT_CREDITS, released ? *released : current);
    }

    resp.set_ledger_id(held.ledger_id);
    if (current.reserved_ledger_id != held.ledger_id || current.reserved_amount_millis == 0) {
      auto attached = ctx_.unlocks->AttachReservationLedger(current.id, reservation_id, held.ledger_id, amount);
      if (!attached) {
        // The reservation expired and was taken over between reserve and charge.
        if (!held.bypass && !held.ledger_id.empty()) {
          ledger::LedgerRequest refund;
          refund.user_id            = user_id;
          refund.amount             = amount;
          refund.idempotency_key    = unlock::HoldResolutionKey(current.id, held.ledger_id, "reservation_lost_refund");
          refund.reason_code        = "UNLOCK_RESERVATION_EXPIRED_REFUND";
          refund.resolves_ledger_id = held.ledger_id;
          refund.context            = hold.context;
          ctx_.ledger->RefundReservation(refund);
        }
        auto latest = ctx_.unlocks->GetUnlock(current.id);
        resp.clear_ledger_id();
        return finish(UNLOCK_OUTCOME_IN_PROGRESS, latest ? *latest : current);
      }
      current = *attached;
    }

    UnlockGenerationJob payload;
    payload.set_unlock_id(current.id);
    payload.set_user_id(user_id);
    payload.set_reservation_id(reservation_id);
    payload.set_source_item_id(current.source_item_id);
    payload.set_source_page_id(current.source_page_id);
    payload.set_trace_id(trace_id);

    jobs::EnqueueRequest enqueue;
    enqueue.scope        = sweep::kUnlockGenerationScope;
    enqueue.dedupe_key   = unlock::GenerationDedupeKey(current.id, reservation_id);
    enqueue.trace_id     = trace_id;
    enqueue.payload_json = ToJson(payload);
    enqueue.max_attempts = ctx_.settings.worker.max_attempts;

    const auto job = ctx_.jobs->Enqueue(enqueue);
    resp.set_job_id(job.id);

    return finish(UNLOCK_OUTCOME_RESERVED, current);
  });
}

GetUnlockResponse UnlockService::GetUnlock(const GetUnlockRequest& req) {
  return ObserveRpc("UnlockService.GetUnlock", std::string{}, [&] {
    std::optional<creditgate::db::model::UnlockRecord> row;
    switch (req.key_case()) {
      case GetUnlockRequest::kUnlockId:
        row = ctx_.unlocks->GetUnlock(req.unlock_id());
        break;
      case GetUnlockRequest::kSourceItemId:
        row = ctx_.unlocks->GetUnlockBySourceItem(req.source_item_id());
        break;
      default:
        throw util::InvalidArgument("unlock_id or source_item_id is required");
    }
    if (!row) {
      throw util::NotFound("UNLOCK_NOT_FOUND");
    }

    GetUnlockResponse resp;
    *resp.mutable_unlock() = unlock::ToProto(*row);
    return resp;
  });
}

GetWalletResponse UnlockService::GetWallet(const GetWalletRequest& req) {
  return ObserveRpc("UnlockService.GetWallet", std::string{}, [&] {
    GetWalletResponse resp;
    *resp.mutable_wallet() = ctx_.ledger->GetWallet(Trim(req.user_id()));
    return resp;
  });
}

ExportLedgerResponse UnlockService::ExportLedger(const ExportLedgerRequest& req) {
  return ObserveRpc("UnlockService.ExportLedger", std::string{}, [&] {
    db::LedgerQuery query;
    query.user_id = Trim(req.user_id());
    query.from_ms = req.from_ms();
    query.to_ms   = req.to_ms();
    if (req.limit() > 0) query.limit = req.limit();

    ExportLedgerResponse resp;
    for (auto& entry : ctx_.ledger->ExportLedger(query)) {
      *resp.add_entries() = std::move(entry);
    }
    return resp;
  });
}

RunSweepResponse UnlockService::RunSweep(const RunSweepRequest& req) {
  return ObserveRpc("UnlockService.RunSweep", req.trace_id(), [&] {
    if (!ctx_.sweep) {
      throw util::InvalidState("reliability sweep is not configured");
    }

    sweep::SweepOptions options;
    options.force    = req.force();
    options.mode     = "admin";
    options.trace_id = Trim(req.trace_id());

    RunSweepResponse resp;
    *resp.mutable_summary() = ctx_.sweep->Run(options);
    return resp;
  });
}

GetProviderCircuitResponse UnlockService::GetProviderCircuit(const GetProviderCircuitRequest& req) {
  return ObserveRpc("UnlockService.GetProviderCircuit", std::string{}, [&] {
    const auto key = Trim(req.provider_key()).empty() ? ctx_.settings.worker.provider_key : Trim(req.provider_key());

    GetProviderCircuitResponse resp;
    if (auto circuit = ctx_.circuit->GetCircuit(key)) {
      *resp.mutable_circuit() = *circuit;
    } else {
      resp.mutable_circuit()->set_provider_key(key);
      resp.mutable_circuit()->set_state(CIRCUIT_STATE_CLOSED);
    }
    return resp;
  });
}

} // namespace creditgate::service
