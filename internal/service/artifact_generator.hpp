#pragma once

#include <atomic>
#include <cstdint>
#include <string>

namespace creditgate::service {

struct GenerationRequest {
  std::string unlock_id;
  std::string source_item_id;
  std::string source_page_id;
  std::string user_id;
  std::string trace_id;

  // Raised once the worker stops waiting for this attempt. Never null
  // inside Generate.
  const std::atomic<bool>* cancelled = nullptr;
};

struct GenerationResult {
  std::string blueprint_id;
};

/*
  External collaborator that turns an unlocked content item into its
  artifact. Called from worker threads, so implementations must be
  thread-safe.

  An attempt that outlives the retry timeout cannot be killed: it keeps
  running with request.cancelled raised. Check the flag before each
  outbound provider request and give up once it is set.

  Throw on failure; the message decides whether the call is retried.
*/
class ArtifactGenerator {
 public:
  virtual ~ArtifactGenerator() = default;

  virtual GenerationResult Generate(const GenerationRequest& request, uint32_t attempt) = 0;
};

} // namespace creditgate::service
