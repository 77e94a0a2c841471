#pragma once

#include <cmath>
#include <cstdint>

namespace creditgate::util {

/*
  Credits are exposed as doubles with three decimals and stored as
  integer millicredits so balances never drift.
*/

constexpr int64_t kMillisPerCredit = 1000;

inline double Round3(double value) {
  return std::round(value * kMillisPerCredit) / kMillisPerCredit;
}

inline int64_t ToMillicredits(double credits) {
  return static_cast<int64_t>(std::llround(credits * kMillisPerCredit));
}

inline double FromMillicredits(int64_t millis) {
  return static_cast<double>(millis) / kMillisPerCredit;
}

} // namespace creditgate::util
