#pragma once

#include <chrono>
#include <cstdint>
#include <functional>

#include "google/protobuf/timestamp.pb.h"

namespace creditgate::util {

/*
  Time utilities. Components take a NowFn so tests can drive the clock.
*/

using Clock     = std::chrono::system_clock;
using TimePoint = Clock::time_point;
using NowFn     = std::function<TimePoint()>;

TimePoint Now();

google::protobuf::Timestamp ToProto(TimePoint tp);
TimePoint                   FromProto(const google::protobuf::Timestamp& ts);

int64_t   ToUnixMillis(TimePoint tp);
TimePoint FromUnixMillis(int64_t ms);

} // namespace creditgate::util
