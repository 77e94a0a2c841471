#pragma once

#include <chrono>
#include <atomic>
#include <cstdint>
#include <exception>
#include <functional>
#include <future>
#include <memory>
#include <string>
#include <thread>
#include <type_traits>

#include "internal/config/runtime_settings.hpp"
#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"
#include "internal/provider/provider_circuit.hpp"
#include "internal/util/errors.hpp"

namespace creditgate::provider {

struct RetryOptions {
  std::string provider_key;
  uint32_t    max_attempts  = 2;
  uint32_t    timeout_ms    = 25000;
  uint32_t    base_delay_ms = 250;
  uint32_t    jitter_ms     = 200;

  // Defaults to DefaultIsRetryable.
  std::function<bool(const std::exception&)> is_retryable;

  // Defaults to std::this_thread::sleep_for.
  std::function<void(std::chrono::milliseconds)> sleep;

  // Runs before every attempt, ahead of the circuit check. An exception
  // thrown here ends the call without counting against the circuit.
  std::function<void(uint32_t attempt)> before_attempt;
};

// Attempt body. cancelled turns true once the wrapper stops waiting for it.
template <typename T>
using AttemptFn = std::function<T(uint32_t attempt, const std::atomic<bool>& cancelled)>;

RetryOptions MakeRetryOptions(const std::string& provider_key, const config::RetrySettings& settings);

// Timeouts, plus messages that look like throttling or a dropped connection.
bool DefaultIsRetryable(const std::exception& error);

// Clamps every numeric option into its supported range.
RetryOptions NormalizeRetryOptions(RetryOptions options);

// base * attempt + uniform[0, jitter)
std::chrono::milliseconds BackoffDelay(const RetryOptions& options, uint32_t attempt);

// Worst-case wall time of one RunWithProviderRetry call, in milliseconds.
uint64_t MaxCallDurationMs(const RetryOptions& options);

namespace detail {

/*
  Runs one attempt on its own thread and waits at most timeout for it.
  A thread cannot be killed, so a timed-out attempt only has its cancelled
  flag raised and keeps running detached until the task notices. Its
  result is discarded; the task must own everything it touches.
*/
template <typename T>
T RunWithTimeout(const AttemptFn<T>& task, uint32_t attempt, std::chrono::milliseconds timeout) {
  auto promise   = std::make_shared<std::promise<T>>();
  auto cancelled = std::make_shared<std::atomic<bool>>(false);
  auto future    = promise->get_future();

  std::thread([promise, cancelled, task, attempt]() {
    try {
      promise->set_value(task(attempt, *cancelled));
    } catch (...) {
      promise->set_exception(std::current_exception());
    }
  }).detach();

  if (future.wait_for(timeout) == std::future_status::timeout) {
    cancelled->store(true);
    throw util::ProviderTimeout("Provider operation timeout (" + std::to_string(timeout.count()) + "ms)");
  }
  return future.get();
}

} // namespace detail

/*
  RunWithProviderRetry

  One logical provider call:
  - the circuit is consulted before every attempt (may throw ProviderDegraded)
  - each attempt has a hard timeout (the task is told through its cancelled
    flag) and its outcome is recorded on the circuit
  - retryable failures back off and retry; anything else propagates at once
  - after the last attempt the last error is rethrown
*/
template <typename T>
T RunWithProviderRetry(ProviderCircuit& circuit, RetryOptions options, AttemptFn<T> task) {
  static_assert(!std::is_void_v<T>, "RunWithProviderRetry needs a result type");

  options = NormalizeRetryOptions(std::move(options));

  observability::SpanScope span("provider.call");
  span.SetAttribute("provider_key", options.provider_key);

  auto&              metrics = observability::Metrics::Instance();
  std::exception_ptr last_error;

  for (uint32_t attempt = 1; attempt <= options.max_attempts; ++attempt) {
    if (options.before_attempt) {
      options.before_attempt(attempt);
    }
    circuit.AssertProviderAvailable(options.provider_key);

    try {
      T result = detail::RunWithTimeout<T>(task, attempt, std::chrono::milliseconds(options.timeout_ms));
      circuit.RecordProviderSuccess(options.provider_key);
      metrics.RecordProviderAttempt(options.provider_key, true);
      return result;
    } catch (const std::exception& e) {
      last_error = std::current_exception();
      metrics.RecordProviderAttempt(options.provider_key, false);
      circuit.RecordProviderFailure(options.provider_key, e.what());

      const bool retry = attempt < options.max_attempts && options.is_retryable(e);
      CREDITGATE_LOG_WARN("provider attempt failed", {observability::StringField("provider_key", options.provider_key),
                                                      observability::IntField("attempt", attempt),
                                                      observability::BoolField("will_retry", retry),
                                                      observability::StringField("error", e.what())});
      if (!retry) {
        span.RecordException(e.what());
        break;
      }
    }

    options.sleep(BackoffDelay(options, attempt));
  }

  std::rethrow_exception(last_error);
}

} // namespace creditgate::provider
