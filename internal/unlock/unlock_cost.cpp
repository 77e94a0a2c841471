#include "internal/unlock/unlock_cost.hpp"

#include <algorithm>
#include <cmath>

#include "internal/util/credits.hpp"

namespace creditgate::unlock {

double ComputeUnlockCost(double active_subscriber_count, double min_cost, double max_cost) {
  double count = std::isfinite(active_subscriber_count) ? std::floor(active_subscriber_count) : 1.0;
  count        = std::max(1.0, count);

  const double raw = 1.0 / count;
  return util::Round3(std::max(min_cost, std::min(max_cost, raw)));
}

} // namespace creditgate::unlock
