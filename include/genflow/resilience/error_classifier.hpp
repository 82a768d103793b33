#pragma once

#include <chrono>
#include <cstdint>
#include <format>
#include <optional>
#include <string>
#include <string_view>

namespace genflow {

enum class ErrorKind : std::uint8_t {
  Transient,
  RateLimited,
  InvalidRequest,
  AuthFailure,
  ProviderUnavailable,
  Unknown,
};

[[nodiscard]] constexpr auto to_string_view(ErrorKind kind) noexcept
    -> std::string_view {
  switch (kind) {
    case ErrorKind::Transient: return "Transient";
    case ErrorKind::RateLimited: return "RateLimited";
    case ErrorKind::InvalidRequest: return "InvalidRequest";
    case ErrorKind::AuthFailure: return "AuthFailure";
    case ErrorKind::ProviderUnavailable: return "ProviderUnavailable";
    case ErrorKind::Unknown: return "Unknown";
  }
  return "Unknown";
}

// Fixed per-kind handling rules.
struct Disposition {
  bool retryable{false};
  bool counts_toward_breaker{false};
  bool consumes_attempt_budget{false};
};

[[nodiscard]] constexpr auto disposition(ErrorKind kind) noexcept
    -> Disposition {
  switch (kind) {
    case ErrorKind::Transient:
    case ErrorKind::RateLimited:
    case ErrorKind::Unknown:
      return {.retryable = true,
              .counts_toward_breaker = true,
              .consumes_attempt_budget = true};
    case ErrorKind::ProviderUnavailable:
      return {.retryable = true,
              .counts_toward_breaker = true,
              .consumes_attempt_budget = false};
    case ErrorKind::InvalidRequest:
    case ErrorKind::AuthFailure:
      return {};
  }
  return {};
}

// Failure shape as observed at the adapter boundary, before classification.
struct RawFailure {
  std::optional<int> status_code;
  bool timed_out{false};
  bool connection_error{false};
  std::string message;
  std::optional<std::chrono::milliseconds> retry_after;
};

// Classified error as stored on a task (lastError).
struct TaskError {
  ErrorKind kind{ErrorKind::Unknown};
  std::string message;
  std::optional<std::chrono::milliseconds> retry_after;

  friend auto operator==(const TaskError&, const TaskError&) -> bool = default;
};

// Pure: the same RawFailure always yields the same TaskError.
[[nodiscard]] auto classify(const RawFailure& failure) -> TaskError;

}  // namespace genflow

template <>
struct std::formatter<genflow::ErrorKind> : std::formatter<std::string_view> {
  auto format(genflow::ErrorKind kind, auto& ctx) const {
    return std::formatter<std::string_view>::format(genflow::to_string_view(kind),
                                                    ctx);
  }
};
