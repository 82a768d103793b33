#pragma once

#include "genflow/resilience/error_classifier.hpp"

#include <chrono>
#include <cstdint>
#include <mutex>
#include <random>

namespace genflow {

struct RetryConfig {
  int max_attempts{3};
  std::chrono::milliseconds base_delay{1000};
  std::chrono::milliseconds max_delay{30000};
  // Total attempts allowed when the failure is unclassified.
  int unknown_max_attempts{2};
  bool jitter{true};
};

struct RetryDecision {
  bool should_retry{false};
  std::chrono::milliseconds delay{0};
};

// Decides whether a failed attempt gets another try and how long to wait.
//
// attempt is the number of adapter calls made so far (>= 1 after a real
// failure, possibly 0 for a breaker rejection). The delay is
// base * 2^(attempt-1) capped at max_delay, plus uniform jitter in
// [0, base], clamped to max_delay again. A RateLimited hint raises the
// delay to at least the hint, even past max_delay.
class RetryPolicy {
public:
  explicit RetryPolicy(RetryConfig config = {});
  RetryPolicy(RetryConfig config, std::uint64_t seed);

  RetryPolicy(const RetryPolicy&) = delete;
  RetryPolicy& operator=(const RetryPolicy&) = delete;

  [[nodiscard]] auto decide(int attempt, const TaskError& error)
      -> RetryDecision;

  // Deterministic part of the delay, without jitter.
  [[nodiscard]] auto backoff(int attempt) const noexcept
      -> std::chrono::milliseconds;

  [[nodiscard]] auto config() const noexcept -> const RetryConfig& {
    return config_;
  }

private:
  [[nodiscard]] auto jittered(int attempt) -> std::chrono::milliseconds;
  [[nodiscard]] auto attempt_budget(ErrorKind kind) const noexcept -> int;

  RetryConfig config_;
  std::mutex rng_mu_;
  std::mt19937_64 rng_;
};

}  // namespace genflow
