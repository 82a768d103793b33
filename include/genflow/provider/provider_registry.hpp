#pragma once

#include "genflow/config/config.hpp"
#include "genflow/core/error.hpp"
#include "genflow/provider/provider_adapter.hpp"
#include "genflow/resilience/circuit_breaker.hpp"
#include "genflow/resilience/rate_limiter.hpp"
#include "genflow/resilience/retry_policy.hpp"
#include "genflow/util/id.hpp"

#include <atomic>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace genflow {

class Runtime;

using AdapterConstructor =
    std::function<Result<std::shared_ptr<IProviderAdapter>>(
        Runtime&, const ProviderConfig&)>;

// Maps a configured provider kind to the adapter implementation.
class AdapterFactory {
public:
  static auto instance() -> AdapterFactory& {
    static AdapterFactory factory;
    return factory;
  }

  auto register_kind(std::string_view kind, AdapterConstructor ctor) -> void;

  [[nodiscard]] auto contains(std::string_view kind) const -> bool;

  [[nodiscard]] auto create(Runtime& runtime, const ProviderConfig& config) const
      -> Result<std::shared_ptr<IProviderAdapter>>;

private:
  AdapterFactory();

  mutable std::mutex mu_;
  std::unordered_map<std::string, AdapterConstructor, StringHash, StringEqual>
      constructors_;
};

// Request accounting for one provider. A request is one adapter attempt;
// it is counted once it reaches an outcome.
struct ProviderMetrics {
  std::uint64_t total_requests{0};
  std::uint64_t successful_requests{0};
  std::uint64_t failed_requests{0};
  // Weighted 0.8 old / 0.2 new over successful requests.
  std::chrono::milliseconds average_response_time{0};
  std::size_t current_load{0};
  std::optional<std::chrono::system_clock::time_point> last_request_at;

  [[nodiscard]] auto error_rate() const noexcept -> double {
    return total_requests == 0
               ? 0.0
               : static_cast<double>(failed_requests) /
                     static_cast<double>(total_requests);
  }
};

// Runtime state of one provider. The breaker is created on first use and
// then lives as long as the registry.
class Provider {
public:
  Provider(ProviderConfig config, std::shared_ptr<IProviderAdapter> adapter,
           const RetryConfig& retry_defaults,
           const BreakerConfig& breaker_defaults);

  Provider(const Provider&) = delete;
  Provider& operator=(const Provider&) = delete;

  [[nodiscard]] auto id() const noexcept -> const ProviderId& {
    return config_.id;
  }
  [[nodiscard]] auto config() const noexcept -> const ProviderConfig& {
    return config_;
  }
  [[nodiscard]] auto enabled() const noexcept -> bool {
    return config_.enabled;
  }

  [[nodiscard]] auto adapter() const noexcept -> IProviderAdapter& {
    return *adapter_;
  }
  [[nodiscard]] auto breaker() -> CircuitBreaker&;
  [[nodiscard]] auto limiter() noexcept -> RateLimiter& {
    return limiter_;
  }
  [[nodiscard]] auto retry() noexcept -> RetryPolicy& {
    return retry_;
  }

  // Reads without forcing the breaker into existence.
  [[nodiscard]] auto health() const -> BreakerHealth;

  auto begin_request() -> void;
  auto record_success(std::chrono::milliseconds response_time) -> void;
  auto record_failure() -> void;
  // Attempt ended without an outcome (cancelled or discarded).
  auto end_request() -> void;
  [[nodiscard]] auto metrics() const -> ProviderMetrics;

private:
  ProviderConfig config_;
  std::shared_ptr<IProviderAdapter> adapter_;
  BreakerConfig breaker_config_;
  RateLimiter limiter_;
  RetryPolicy retry_;

  std::once_flag breaker_once_;
  std::unique_ptr<CircuitBreaker> breaker_;
  std::atomic<CircuitBreaker*> breaker_ptr_{nullptr};

  mutable std::mutex metrics_mu_;
  ProviderMetrics metrics_;
};

// Providers are registered before the orchestrator starts; lookups after
// that are read-only and need no locking.
class ProviderRegistry {
public:
  explicit ProviderRegistry(RetryConfig retry_defaults = {},
                            BreakerConfig breaker_defaults = {});

  ProviderRegistry(ProviderRegistry&&) noexcept = default;
  ProviderRegistry& operator=(ProviderRegistry&&) noexcept = default;

  // Fails with InvalidArgument on a duplicate id or a missing adapter.
  auto add(ProviderConfig config, std::shared_ptr<IProviderAdapter> adapter)
      -> Result<void>;

  [[nodiscard]] auto find(std::string_view id) const -> Provider*;
  [[nodiscard]] auto find(const ProviderId& id) const -> Provider* {
    return find(id.value());
  }

  // Registration order.
  [[nodiscard]] auto ids() const -> std::vector<ProviderId>;
  [[nodiscard]] auto size() const noexcept -> std::size_t {
    return providers_.size();
  }

private:
  RetryConfig retry_defaults_;
  BreakerConfig breaker_defaults_;
  std::vector<std::unique_ptr<Provider>> providers_;
  std::unordered_map<std::string, std::size_t, StringHash, StringEqual> index_;
};

// Creates an adapter for every configured provider.
[[nodiscard]] auto build_provider_registry(Runtime& runtime,
                                           const Config& config)
    -> Result<ProviderRegistry>;

}  // namespace genflow
