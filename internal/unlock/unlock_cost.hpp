#pragma once

#include <cstdint>

namespace creditgate::unlock {

constexpr double kDefaultMinUnlockCost = 0.05;
constexpr double kDefaultMaxUnlockCost = 1.0;

/*
  Cost of unlocking one item, shared across its active subscribers:

    round3(clamp(1 / max(1, floor(n)), min_cost, max_cost))

  Non-finite or negative counts are treated as a single subscriber.
*/
double ComputeUnlockCost(double active_subscriber_count, double min_cost = kDefaultMinUnlockCost,
                         double max_cost = kDefaultMaxUnlockCost);

} // namespace creditgate::unlock
