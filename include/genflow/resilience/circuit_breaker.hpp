#pragma once

#include <chrono>
#include <cstdint>
#include <format>
#include <mutex>
#include <optional>
#include <random>
#include <string>
#include <string_view>

namespace genflow {

enum class BreakerState : std::uint8_t {
  Closed,
  Open,
  HalfOpen,
};

[[nodiscard]] constexpr auto to_string_view(BreakerState state) noexcept
    -> std::string_view {
  switch (state) {
    case BreakerState::Closed: return "Closed";
    case BreakerState::Open: return "Open";
    case BreakerState::HalfOpen: return "HalfOpen";
  }
  return "Closed";
}

struct BreakerConfig {
  int failure_threshold{5};
  std::chrono::milliseconds cooldown{30000};
  // Upper bound of the random extra added to each cooldown.
  std::chrono::milliseconds cooldown_jitter{1000};
};

// Outcome of asking the breaker for permission to call the provider. The
// caller hands it back when reporting the result so probe bookkeeping stays
// with the call that owns the probe.
enum class Admission : std::uint8_t {
  Allowed,
  Probe,
  RejectedOpen,
  RejectedProbeBusy,
};

[[nodiscard]] constexpr auto admitted(Admission a) noexcept -> bool {
  return a == Admission::Allowed || a == Admission::Probe;
}

struct BreakerHealth {
  BreakerState state{BreakerState::Closed};
  int consecutive_failures{0};
  std::optional<std::chrono::steady_clock::time_point> opened_at;
};

// Per-provider three-state breaker. All transitions happen under one mutex;
// Open -> HalfOpen is evaluated lazily whenever state is read.
class CircuitBreaker {
public:
  using Clock = std::chrono::steady_clock;

  CircuitBreaker(std::string name, BreakerConfig config);

  CircuitBreaker(const CircuitBreaker&) = delete;
  CircuitBreaker& operator=(const CircuitBreaker&) = delete;

  [[nodiscard]] auto try_acquire() -> Admission;

  auto record_success(Admission admission) -> void;
  auto record_failure(Admission admission) -> void;
  // The provider answered but the outcome says nothing about its health
  // (a rejected request, bad credentials).
  auto record_neutral(Admission admission) -> void;
  // The call was abandoned before any outcome was observed.
  auto abandon(Admission admission) -> void;

  [[nodiscard]] auto state() const -> BreakerState;
  [[nodiscard]] auto health() const -> BreakerHealth;
  [[nodiscard]] auto name() const noexcept -> std::string_view {
    return name_;
  }

  auto reset() -> void;
  auto trip() -> void;

private:
  auto refresh_locked() const -> BreakerState;
  auto open_locked() -> void;
  auto close_locked() -> void;

  std::string name_;
  BreakerConfig config_;

  mutable std::mutex mu_;
  mutable BreakerState state_{BreakerState::Closed};
  int consecutive_failures_{0};
  std::optional<Clock::time_point> opened_at_;
  Clock::time_point reopen_at_{};
  bool probe_in_flight_{false};
  std::mt19937_64 rng_{std::random_device{}()};
};

}  // namespace genflow

template <>
struct std::formatter<genflow::BreakerState> : std::formatter<std::string_view> {
  auto format(genflow::BreakerState state, auto& ctx) const {
    return std::formatter<std::string_view>::format(
        genflow::to_string_view(state), ctx);
  }
};
