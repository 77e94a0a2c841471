#include "internal/provider/provider_retry.hpp"

#include <algorithm>
#include <array>
#include <cctype>
#include <random>
#include <string_view>

namespace creditgate::provider {

namespace {

constexpr std::array<std::string_view, 5> kRetryableFragments = {"rate limit", "timeout", "temporarily", "econnreset", "etimedout"};

uint32_t Clamp(uint32_t value, uint32_t fallback, uint32_t lo, uint32_t hi) {
  if (value == 0) value = fallback;
  return std::clamp(value, lo, hi);
}

std::mt19937& Rng() {
  thread_local std::mt19937 rng{std::random_device{}()};
  return rng;
}

} // namespace

RetryOptions MakeRetryOptions(const std::string& provider_key, const config::RetrySettings& settings) {
  RetryOptions options;
  options.provider_key  = provider_key;
  options.max_attempts  = settings.max_attempts;
  options.timeout_ms    = settings.timeout_ms;
  options.base_delay_ms = settings.base_delay_ms;
  options.jitter_ms     = settings.jitter_ms;
  return NormalizeRetryOptions(std::move(options));
}

bool DefaultIsRetryable(const std::exception& error) {
  if (dynamic_cast<const util::ProviderTimeout*>(&error) != nullptr) {
    return true;
  }

  std::string message = error.what();
  std::transform(message.begin(), message.end(), message.begin(), [](unsigned char c) { return std::tolower(c); });
  return std::any_of(kRetryableFragments.begin(), kRetryableFragments.end(),
                     [&](std::string_view fragment) { return message.find(fragment) != std::string::npos; });
}

RetryOptions NormalizeRetryOptions(RetryOptions options) {
  options.max_attempts  = Clamp(options.max_attempts, 2, 1, 6);
  options.timeout_ms    = Clamp(options.timeout_ms, 25000, 1000, 180000);
  options.base_delay_ms = Clamp(options.base_delay_ms, 250, 50, 10000);
  options.jitter_ms     = std::min<uint32_t>(options.jitter_ms, 5000);

  if (!options.is_retryable) {
    options.is_retryable = DefaultIsRetryable;
  }
  if (!options.sleep) {
    options.sleep = [](std::chrono::milliseconds delay) { std::this_thread::sleep_for(delay); };
  }
  return options;
}

std::chrono::milliseconds BackoffDelay(const RetryOptions& options, uint32_t attempt) {
  uint64_t jitter = 0;
  if (options.jitter_ms > 0) {
    std::uniform_int_distribution<uint32_t> dist(0, options.jitter_ms - 1);
    jitter = dist(Rng());
  }
  return std::chrono::milliseconds(static_cast<uint64_t>(options.base_delay_ms) * attempt + jitter);
}

uint64_t MaxCallDurationMs(const RetryOptions& options) {
  const auto normalized = NormalizeRetryOptions(options);
  uint64_t   total      = static_cast<uint64_t>(normalized.timeout_ms) * normalized.max_attempts;
  for (uint32_t attempt = 1; attempt < normalized.max_attempts; ++attempt) {
    total += static_cast<uint64_t>(normalized.base_delay_ms) * attempt + normalized.jitter_ms;
  }
  return total;
}

} // namespace creditgate::provider
