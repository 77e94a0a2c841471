#include "internal/observability/unlock_trace.hpp"

#include <algorithm>
#include <cctype>
#include <vector>

#include "internal/util/uuid.hpp"

namespace creditgate::observability {

std::string CreateUnlockTraceId() {
  return util::NewId("ut_");
}

void LogUnlockEvent(std::string_view event, std::initializer_list<LogField> fields) {
  std::vector<LogField> kept;
  kept.reserve(fields.size());
  for (const auto& field : fields) {
    const bool blank = std::all_of(field.value.begin(), field.value.end(), [](unsigned char c) { return std::isspace(c) != 0; });
    if (blank) continue;
    kept.push_back(field);
  }

  Log(spdlog::level::info, "[" + std::string(event) + "]", kept);
}

} // namespace creditgate::observability
