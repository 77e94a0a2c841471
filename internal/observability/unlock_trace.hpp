#pragma once

#include <initializer_list>
#include <string>
#include <string_view>

#include "internal/observability/logging.hpp"

namespace creditgate::observability {

// "ut_" + uuid. Threads one unlock flow through request, worker and sweep logs.
std::string CreateUnlockTraceId();

/*
  Structured unlock lifecycle event.

  Fields with an empty (or all-whitespace) value are dropped so callers
  can pass optional context without branching.
*/
void LogUnlockEvent(std::string_view event, std::initializer_list<LogField> fields);

} // namespace creditgate::observability
