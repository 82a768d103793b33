#include "genflow/resilience/rate_limiter.hpp"

#include <algorithm>
#include <cmath>

namespace genflow {

RateLimiter::RateLimiter(RateLimitConfig config)
    : config_(config), last_refill_(Clock::now()) {
  if (!enabled())
    return;
  auto burst = config_.burst > 0 ? config_.burst : config_.max_requests;
  capacity_ = static_cast<double>(burst);
  auto window_ms = std::max<std::int64_t>(config_.window.count(), 1);
  tokens_per_ms_ =
      static_cast<double>(config_.max_requests) / static_cast<double>(window_ms);
  tokens_ = capacity_;
}

auto RateLimiter::refill_locked(Clock::time_point now) const -> void {
  auto elapsed =
      std::chrono::duration<double, std::milli>(now - last_refill_).count();
  if (elapsed > 0) {
    tokens_ = std::min(capacity_, tokens_ + elapsed * tokens_per_ms_);
    last_refill_ = now;
  }
}

auto RateLimiter::try_acquire() -> std::optional<std::chrono::milliseconds> {
  if (!enabled())
    return std::nullopt;

  std::lock_guard lock(mu_);
  refill_locked(Clock::now());
  if (tokens_ >= 1.0) {
    tokens_ -= 1.0;
    return std::nullopt;
  }
  auto wait_ms = std::ceil((1.0 - tokens_) / tokens_per_ms_);
  return std::chrono::milliseconds(
      std::max<std::int64_t>(static_cast<std::int64_t>(wait_ms), 1));
}

auto RateLimiter::available() const -> double {
  if (!enabled())
    return 0.0;
  std::lock_guard lock(mu_);
  refill_locked(Clock::now());
  return tokens_;
}

}  // namespace genflow
