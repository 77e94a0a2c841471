#pragma once

#include <cstdint>
#include <stdexcept>
#include <string>

namespace creditgate::util {

/*
  Central error types.

  Expected outcomes (busy, insufficient funds, already resolved) are
  result variants and never use these. Everything here is translated
  to gRPC status codes at the transport edge.
*/

class NotFound : public std::runtime_error {
 public:
  explicit NotFound(const std::string& msg) : std::runtime_error(msg) {
  }
};

class AlreadyExists : public std::runtime_error {
 public:
  explicit AlreadyExists(const std::string& msg) : std::runtime_error(msg) {
  }
};

class InvalidArgument : public std::runtime_error {
 public:
  explicit InvalidArgument(const std::string& msg) : std::runtime_error(msg) {
  }
};

class InvalidState : public std::runtime_error {
 public:
  explicit InvalidState(const std::string& msg) : std::runtime_error(msg) {
  }
};

// Optimistic concurrency retries were exhausted.
class Conflict : public std::runtime_error {
 public:
  explicit Conflict(const std::string& msg) : std::runtime_error(msg) {
  }
};

class ResourceExhausted : public std::runtime_error {
 public:
  explicit ResourceExhausted(const std::string& msg) : std::runtime_error(msg) {
  }
};

class StorageError : public std::runtime_error {
 public:
  explicit StorageError(const std::string& msg) : std::runtime_error(msg) {
  }
};

/*
  Raised while a provider circuit is open. Carries a retry-after hint.
*/
class ProviderDegraded : public std::runtime_error {
 public:
  ProviderDegraded(const std::string& provider_key, std::int64_t retry_after_seconds)
      : std::runtime_error("Provider temporarily degraded. Retry in ~" + std::to_string(retry_after_seconds) + "s."),
        provider_key_(provider_key),
        retry_after_seconds_(retry_after_seconds) {
  }

  const std::string& provider_key() const {
    return provider_key_;
  }
  std::int64_t retry_after_seconds() const {
    return retry_after_seconds_;
  }
  const char* code() const {
    return "PROVIDER_DEGRADED";
  }

 private:
  std::string  provider_key_;
  std::int64_t retry_after_seconds_;
};

class ProviderTimeout : public std::runtime_error {
 public:
  explicit ProviderTimeout(const std::string& msg) : std::runtime_error(msg) {
  }
};

} // namespace creditgate::util
