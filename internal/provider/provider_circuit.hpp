#pragma once

#include <cstdint>
#include <memory>
#include <optional>
#include <string>

#include "creditgate/v1/types.pb.h"
#include "internal/config/runtime_settings.hpp"
#include "internal/db/api/repository.hpp"
#include "internal/util/time.hpp"

namespace creditgate::provider {

/*
  ProviderCircuit

  Durable per-provider circuit breaker shared by every process that talks
  to the same database.

    closed --(threshold failures)--> open --(cooldown)--> half_open
      ^                                ^                      |
      +-------- success ---------------+------ failure -------+

  While half_open exactly one caller (the trial call) is let through per
  trial window. Gating only applies when fail-fast mode is on; outcomes
  are recorded either way.
*/
class ProviderCircuit {
 public:
  ProviderCircuit(std::shared_ptr<db::Repository> repository, config::CircuitSettings settings, util::NowFn now = util::Now);

  // Throws util::ProviderDegraded when the caller must not reach the provider.
  void AssertProviderAvailable(const std::string& provider_key);

  void RecordProviderSuccess(const std::string& provider_key);
  void RecordProviderFailure(const std::string& provider_key, const std::string& error_message);

  std::optional<creditgate::v1::ProviderCircuit> GetCircuit(const std::string& provider_key);

  const config::CircuitSettings& settings() const {
    return settings_;
  }

 private:
  int64_t NowMs() const;

  std::shared_ptr<db::Repository> repository_;
  config::CircuitSettings         settings_;
  util::NowFn                     now_;
};

} // namespace creditgate::provider
