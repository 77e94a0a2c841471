#include "internal/unlock/unlock_cost.hpp"

#include <cassert>
#include <cmath>
#include <iostream>
#include <limits>

namespace {

using creditgate::unlock::ComputeUnlockCost;

bool Near(double a, double b) {
  return std::fabs(a - b) < 1e-9;
}

void TestSingleSubscriberPaysFullPrice() {
  assert(Near(ComputeUnlockCost(1), 1.0));
  assert(Near(ComputeUnlockCost(0), 1.0));
}

void TestCostIsSharedAndRounded() {
  assert(Near(ComputeUnlockCost(2), 0.5));
  assert(Near(ComputeUnlockCost(3), 0.333));
  assert(Near(ComputeUnlockCost(7), 0.143));
  // Fractional counts round down to whole subscribers.
  assert(Near(ComputeUnlockCost(2.9), 0.5));
}

void TestCostIsClamped() {
  assert(Near(ComputeUnlockCost(100), 0.05));
  assert(Near(ComputeUnlockCost(10, 0.2, 0.5), 0.2));
  assert(Near(ComputeUnlockCost(1, 0.2, 0.5), 0.5));
}

void TestBadCountsActAsOneSubscriber() {
  assert(Near(ComputeUnlockCost(-4), 1.0));
  assert(Near(ComputeUnlockCost(std::numeric_limits<double>::quiet_NaN()), 1.0));
  assert(Near(ComputeUnlockCost(std::numeric_limits<double>::infinity()), 1.0));
}

} // namespace

int main() {
  TestSingleSubscriberPaysFullPrice();
  TestCostIsSharedAndRounded();
  TestCostIsClamped();
  TestBadCountsActAsOneSubscriber();

  std::cout << "creditgate_unit_unlock_cost: pass\n";
  return 0;
}
