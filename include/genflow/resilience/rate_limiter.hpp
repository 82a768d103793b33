#pragma once

#include <chrono>
#include <mutex>
#include <optional>

namespace genflow {

struct RateLimitConfig {
  // 0 disables limiting.
  int max_requests{0};
  std::chrono::milliseconds window{60000};
  // Bucket capacity; 0 means max_requests.
  int burst{0};
};

// Token bucket refilled continuously at max_requests per window.
class RateLimiter {
public:
  using Clock = std::chrono::steady_clock;

  explicit RateLimiter(RateLimitConfig config);

  RateLimiter(const RateLimiter&) = delete;
  RateLimiter& operator=(const RateLimiter&) = delete;

  // Takes a token, or returns how long until one becomes available.
  [[nodiscard]] auto try_acquire() -> std::optional<std::chrono::milliseconds>;

  [[nodiscard]] auto available() const -> double;
  [[nodiscard]] auto enabled() const noexcept -> bool {
    return config_.max_requests > 0;
  }

private:
  auto refill_locked(Clock::time_point now) const -> void;

  RateLimitConfig config_;
  double capacity_{0.0};
  double tokens_per_ms_{0.0};

  mutable std::mutex mu_;
  mutable double tokens_{0.0};
  mutable Clock::time_point last_refill_;
};

}  // namespace genflow
