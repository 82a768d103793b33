#include "genflow/resilience/retry_policy.hpp"

#include <algorithm>

namespace genflow {

namespace {

// 2^30 * base already overflows any sensible max_delay.
constexpr int kMaxShift = 30;

}  // namespace

RetryPolicy::RetryPolicy(RetryConfig config)
    : RetryPolicy(config, std::random_device{}()) {
}

RetryPolicy::RetryPolicy(RetryConfig config, std::uint64_t seed)
    : config_(config), rng_(seed) {
}

auto RetryPolicy::backoff(int attempt) const noexcept
    -> std::chrono::milliseconds {
  auto shift = std::clamp(attempt - 1, 0, kMaxShift);
  auto base = config_.base_delay.count();
  auto cap = config_.max_delay.count();
  if (base <= 0)
    return std::chrono::milliseconds(0);
  if (base > (cap >> shift))
    return config_.max_delay;
  return std::chrono::milliseconds(std::min(base << shift, cap));
}

auto RetryPolicy::jittered(int attempt) -> std::chrono::milliseconds {
  auto delay = backoff(attempt);
  if (config_.jitter && config_.base_delay.count() > 0) {
    std::uniform_int_distribution<std::int64_t> dist(
        0, config_.base_delay.count());
    std::lock_guard lock(rng_mu_);
    delay += std::chrono::milliseconds(dist(rng_));
  }
  return std::min(delay, config_.max_delay);
}

auto RetryPolicy::attempt_budget(ErrorKind kind) const noexcept -> int {
  if (kind == ErrorKind::Unknown)
    return std::min(config_.max_attempts, config_.unknown_max_attempts);
  return config_.max_attempts;
}

auto RetryPolicy::decide(int attempt, const TaskError& error)
    -> RetryDecision {
  auto rules = disposition(error.kind);
  if (!rules.retryable)
    return {};

  if (rules.consumes_attempt_budget && attempt >= attempt_budget(error.kind))
    return {};

  auto delay = jittered(std::max(attempt, 1));
  if (error.kind == ErrorKind::RateLimited && error.retry_after) {
    delay = std::max(delay, *error.retry_after);
  }
  return {.should_retry = true, .delay = delay};
}

}  // namespace genflow
