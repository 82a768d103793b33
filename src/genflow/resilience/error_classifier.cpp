#include "genflow/resilience/error_classifier.hpp"

#include <algorithm>
#include <array>
#include <cctype>

namespace genflow {

namespace {

struct MessagePattern {
  std::string_view needle;
  ErrorKind kind;
};

// Checked in order: credential phrases before the generic "invalid".
constexpr std::array kMessagePatterns{
    MessagePattern{"circuit open", ErrorKind::ProviderUnavailable},
    MessagePattern{"provider unavailable", ErrorKind::ProviderUnavailable},
    MessagePattern{"rate limit", ErrorKind::RateLimited},
    MessagePattern{"too many requests", ErrorKind::RateLimited},
    MessagePattern{"quota", ErrorKind::RateLimited},
    MessagePattern{"api key", ErrorKind::AuthFailure},
    MessagePattern{"unauthorized", ErrorKind::AuthFailure},
    MessagePattern{"forbidden", ErrorKind::AuthFailure},
    MessagePattern{"credential", ErrorKind::AuthFailure},
    MessagePattern{"authentication", ErrorKind::AuthFailure},
    MessagePattern{"timed out", ErrorKind::Transient},
    MessagePattern{"timeout", ErrorKind::Transient},
    MessagePattern{"connection reset", ErrorKind::Transient},
    MessagePattern{"connection refused", ErrorKind::Transient},
    MessagePattern{"temporarily", ErrorKind::Transient},
    MessagePattern{"try again", ErrorKind::Transient},
    MessagePattern{"invalid", ErrorKind::InvalidRequest},
    MessagePattern{"malformed", ErrorKind::InvalidRequest},
    MessagePattern{"unsupported", ErrorKind::InvalidRequest},
    MessagePattern{"not supported", ErrorKind::InvalidRequest},
};

auto lowercase(std::string_view text) -> std::string {
  std::string out(text);
  std::ranges::transform(out, out.begin(), [](unsigned char c) {
    return static_cast<char>(std::tolower(c));
  });
  return out;
}

auto kind_for_status(int status) -> std::optional<ErrorKind> {
  if (status == 429)
    return ErrorKind::RateLimited;
  if (status == 401 || status == 403)
    return ErrorKind::AuthFailure;
  if (status == 408)
    return ErrorKind::Transient;
  if (status >= 500 && status <= 599)
    return ErrorKind::Transient;
  if (status >= 400 && status <= 499)
    return ErrorKind::InvalidRequest;
  return std::nullopt;
}

auto kind_for_message(std::string_view message) -> std::optional<ErrorKind> {
  if (message.empty())
    return std::nullopt;
  auto lowered = lowercase(message);
  for (const auto& pattern : kMessagePatterns) {
    if (lowered.find(pattern.needle) != std::string::npos)
      return pattern.kind;
  }
  return std::nullopt;
}

auto default_message(ErrorKind kind) -> std::string_view {
  switch (kind) {
    case ErrorKind::Transient: return "transient provider failure";
    case ErrorKind::RateLimited: return "rate limited by provider";
    case ErrorKind::InvalidRequest: return "request rejected as invalid";
    case ErrorKind::AuthFailure: return "authentication failed";
    case ErrorKind::ProviderUnavailable: return "provider unavailable";
    case ErrorKind::Unknown: return "unclassified provider failure";
  }
  return "unclassified provider failure";
}

}  // namespace

auto classify(const RawFailure& failure) -> TaskError {
  ErrorKind kind = ErrorKind::Unknown;
  if (failure.timed_out) {
    kind = ErrorKind::Transient;
  } else if (auto by_status = failure.status_code
                                  ? kind_for_status(*failure.status_code)
                                  : std::nullopt) {
    kind = *by_status;
  } else if (failure.connection_error) {
    kind = ErrorKind::Transient;
  } else if (auto by_message = kind_for_message(failure.message)) {
    kind = *by_message;
  }

  std::string message = failure.message.empty()
                            ? std::string(default_message(kind))
                            : failure.message;
  if (failure.status_code) {
    message = std::format("HTTP {}: {}", *failure.status_code, message);
  }

  TaskError error{.kind = kind, .message = std::move(message)};
  if (kind == ErrorKind::RateLimited) {
    error.retry_after = failure.retry_after;
  }
  return error;
}

}  // namespace genflow
