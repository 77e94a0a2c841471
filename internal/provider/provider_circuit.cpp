#include "internal/provider/provider_circuit.hpp"

#include <algorithm>

#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

namespace creditgate::provider {

using creditgate::db::ErrorCode;
using creditgate::db::ThrowIfDbError;
using creditgate::db::model::CircuitStateRecord;
using namespace creditgate::v1;

namespace {

constexpr int    kMaxCasAttempts    = 5;
constexpr size_t kMaxLastErrorChars = 500;

bool IsRetryable(const db::Result& r) {
  return r.code == ErrorCode::Conflict || r.code == ErrorCode::NotFound || r.code == ErrorCode::Busy ||
         r.code == ErrorCode::SerializationFailure || r.IsDuplicate();
}

int64_t RetryAfterSeconds(int64_t until_ms, int64_t now_ms) {
  return std::max<int64_t>(1, (until_ms - now_ms + 999) / 1000);
}

const char* StateName(CircuitState state) {
  switch (state) {
    case CIRCUIT_STATE_OPEN:
      return "open";
    case CIRCUIT_STATE_HALF_OPEN:
      return "half_open";
    default:
      return "closed";
  }
}

} // namespace

ProviderCircuit::ProviderCircuit(std::shared_ptr<db::Repository> repository, config::CircuitSettings settings, util::NowFn now)
    : repository_(std::move(repository)), settings_(settings), now_(std::move(now)) {
  if (!repository_) {
    throw std::invalid_argument("ProviderCircuit requires a repository");
  }
}

int64_t ProviderCircuit::NowMs() const {
  return util::ToUnixMillis(now_());
}

void ProviderCircuit::AssertProviderAvailable(const std::string& provider_key) {
  if (!settings_.fail_fast_enabled) {
    return;
  }

  const auto cooldown_ms = static_cast<int64_t>(settings_.cooldown_seconds) * 1000;

  for (int attempt = 0; attempt < kMaxCasAttempts; ++attempt) {
    const auto now_ms = NowMs();
    auto       tx     = repository_->Begin();
    auto       row    = repository_->GetCircuitState(*tx, provider_key);

    if (!row || row->state == CIRCUIT_STATE_CLOSED) {
      tx->Commit();
      return;
    }

    // Open and cooling down, or half_open with a trial call already in flight.
    if (row->cooldown_until_ms > now_ms) {
      tx->Rollback();
      throw util::ProviderDegraded(provider_key, RetryAfterSeconds(row->cooldown_until_ms, now_ms));
    }

    auto next              = *row;
    next.state             = CIRCUIT_STATE_HALF_OPEN;
    next.cooldown_until_ms = now_ms + cooldown_ms;
    next.updated_at_ms     = now_ms;

    const auto result = repository_->CompareAndSwapCircuitState(*tx, next, row->version);
    if (result) {
      tx->Commit();
      CREDITGATE_LOG_INFO("provider circuit admitting trial call", {observability::StringField("provider_key", provider_key),
                                                               observability::StringField("previous_state", StateName(row->state))});
      return;
    }
    tx->Rollback();
    if (IsRetryable(result)) continue;
    ThrowIfDbError(result, "AssertProviderAvailable");
  }

  // Lost every race for the trial slot; another caller holds it.
  throw util::ProviderDegraded(provider_key, 1);
}

void ProviderCircuit::RecordProviderSuccess(const std::string& provider_key) {
  for (int attempt = 0; attempt < kMaxCasAttempts; ++attempt) {
    const auto now_ms = NowMs();
    auto       tx     = repository_->Begin();
    auto       row    = repository_->GetCircuitState(*tx, provider_key);

    if (!row) {
      tx->Commit();
      return;
    }
    if (row->state == CIRCUIT_STATE_CLOSED && row->failure_count == 0 && row->last_error.empty()) {
      tx->Commit();
      return;
    }

    auto next              = *row;
    next.state             = CIRCUIT_STATE_CLOSED;
    next.opened_at_ms      = 0;
    next.cooldown_until_ms = 0;
    next.failure_count     = 0;
    next.last_error        = {};
    next.updated_at_ms     = now_ms;

    const auto result = repository_->CompareAndSwapCircuitState(*tx, next, row->version);
    if (result) {
      tx->Commit();
      if (row->state != CIRCUIT_STATE_CLOSED) {
        CREDITGATE_LOG_INFO("provider circuit closed", {observability::StringField("provider_key", provider_key)});
      }
      return;
    }
    tx->Rollback();
    if (IsRetryable(result)) continue;
    ThrowIfDbError(result, "RecordProviderSuccess");
  }

  throw util::Conflict("PROVIDER_CIRCUIT_CONFLICT: " + provider_key);
}

void ProviderCircuit::RecordProviderFailure(const std::string& provider_key, const std::string& error_message) {
  const auto cooldown_ms = static_cast<int64_t>(settings_.cooldown_seconds) * 1000;

  for (int attempt = 0; attempt < kMaxCasAttempts; ++attempt) {
    const auto now_ms = NowMs();
    auto       tx     = repository_->Begin();
    auto       row    = repository_->GetCircuitState(*tx, provider_key);

    CircuitStateRecord next;
    if (row) {
      next = *row;
    } else {
      next.provider_key = provider_key;
      next.state        = CIRCUIT_STATE_CLOSED;
    }

    next.failure_count += 1;
    next.last_error    = error_message.substr(0, kMaxLastErrorChars);
    next.updated_at_ms = now_ms;

    const bool trip = (next.state == CIRCUIT_STATE_CLOSED && next.failure_count >= settings_.failure_threshold) ||
                      next.state == CIRCUIT_STATE_HALF_OPEN;
    if (trip) {
      next.state             = CIRCUIT_STATE_OPEN;
      next.opened_at_ms      = now_ms;
      next.cooldown_until_ms = now_ms + cooldown_ms;
    }

    db::Result result;
    if (row) {
      result = repository_->CompareAndSwapCircuitState(*tx, next, row->version);
    } else {
      next.version = 1;
      result       = repository_->InsertCircuitState(*tx, next);
    }

    if (result) {
      tx->Commit();
      if (trip) {
        CREDITGATE_LOG_WARN("provider circuit opened", {observability::StringField("provider_key", provider_key),
                                                        observability::IntField("failure_count", next.failure_count),
                                                        observability::IntField("cooldown_until_ms", next.cooldown_until_ms),
                                                        observability::StringField("last_error", next.last_error)});
      }
      return;
    }
    tx->Rollback();
    if (IsRetryable(result)) continue;
    ThrowIfDbError(result, "RecordProviderFailure");
  }

  throw util::Conflict("PROVIDER_CIRCUIT_CONFLICT: " + provider_key);
}

std::optional<creditgate::v1::ProviderCircuit> ProviderCircuit::GetCircuit(const std::string& provider_key) {
  auto tx  = repository_->Begin();
  auto row = repository_->GetCircuitState(*tx, provider_key);
  tx->Commit();
  if (!row) {
    return std::nullopt;
  }

  creditgate::v1::ProviderCircuit out;
  out.set_provider_key(row->provider_key);
  out.set_state(row->state);
  out.set_opened_at_ms(row->opened_at_ms);
  out.set_cooldown_until_ms(row->cooldown_until_ms);
  out.set_failure_count(row->failure_count);
  out.set_last_error(row->last_error);
  out.set_updated_at_ms(row->updated_at_ms);
  return out;
}

} // namespace creditgate::provider
