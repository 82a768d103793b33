#include "genflow/resilience/circuit_breaker.hpp"

#include "genflow/util/log.hpp"

namespace genflow {

CircuitBreaker::CircuitBreaker(std::string name, BreakerConfig config)
    : name_(std::move(name)), config_(config) {
  if (config_.failure_threshold < 1) {
    config_.failure_threshold = 1;
  }
}

auto CircuitBreaker::refresh_locked() const -> BreakerState {
  if (state_ == BreakerState::Open && Clock::now() >= reopen_at_) {
    state_ = BreakerState::HalfOpen;
    log::info("Circuit for provider {} half-open, allowing a probe", name_);
  }
  return state_;
}

auto CircuitBreaker::open_locked() -> void {
  auto jitter = std::chrono::milliseconds(0);
  if (config_.cooldown_jitter.count() > 0) {
    std::uniform_int_distribution<std::int64_t> dist(
        0, config_.cooldown_jitter.count());
    jitter = std::chrono::milliseconds(dist(rng_));
  }
  auto now = Clock::now();
  state_ = BreakerState::Open;
  opened_at_ = now;
  reopen_at_ = now + config_.cooldown + jitter;
  probe_in_flight_ = false;
  log::warn("Circuit for provider {} opened after {} consecutive failures",
            name_, consecutive_failures_);
}

auto CircuitBreaker::close_locked() -> void {
  bool was_closed = state_ == BreakerState::Closed;
  state_ = BreakerState::Closed;
  consecutive_failures_ = 0;
  opened_at_.reset();
  probe_in_flight_ = false;
  if (!was_closed) {
    log::info("Circuit for provider {} closed", name_);
  }
}

auto CircuitBreaker::try_acquire() -> Admission {
  std::lock_guard lock(mu_);
  switch (refresh_locked()) {
    case BreakerState::Closed:
      return Admission::Allowed;
    case BreakerState::Open:
      return Admission::RejectedOpen;
    case BreakerState::HalfOpen:
      if (probe_in_flight_)
        return Admission::RejectedProbeBusy;
      probe_in_flight_ = true;
      return Admission::Probe;
  }
  return Admission::RejectedOpen;
}

auto CircuitBreaker::record_success(Admission admission) -> void {
  std::lock_guard lock(mu_);
  if (admission == Admission::Probe) {
    close_locked();
    return;
  }
  if (refresh_locked() == BreakerState::Closed) {
    consecutive_failures_ = 0;
  }
}

auto CircuitBreaker::record_failure(Admission admission) -> void {
  std::lock_guard lock(mu_);
  ++consecutive_failures_;
  if (admission == Admission::Probe) {
    open_locked();
    return;
  }
  if (refresh_locked() == BreakerState::Closed &&
      consecutive_failures_ >= config_.failure_threshold) {
    open_locked();
  }
}

auto CircuitBreaker::record_neutral(Admission admission) -> void {
  if (admission == Admission::Probe) {
    std::lock_guard lock(mu_);
    close_locked();
  }
}

auto CircuitBreaker::abandon(Admission admission) -> void {
  if (admission == Admission::Probe) {
    std::lock_guard lock(mu_);
    probe_in_flight_ = false;
  }
}

auto CircuitBreaker::state() const -> BreakerState {
  std::lock_guard lock(mu_);
  return refresh_locked();
}

auto CircuitBreaker::health() const -> BreakerHealth {
  std::lock_guard lock(mu_);
  return {.state = refresh_locked(),
          .consecutive_failures = consecutive_failures_,
          .opened_at = opened_at_};
}

auto CircuitBreaker::reset() -> void {
  std::lock_guard lock(mu_);
  close_locked();
}

auto CircuitBreaker::trip() -> void {
  std::lock_guard lock(mu_);
  open_locked();
}

}  // namespace genflow
