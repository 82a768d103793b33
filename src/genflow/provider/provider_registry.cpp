#include "genflow/provider/provider_registry.hpp"

#include "genflow/provider/http_provider_adapter.hpp"
#include "genflow/util/log.hpp"

namespace genflow {

namespace {

auto effective_retry(const ProviderConfig& config, RetryConfig retry)
    -> RetryConfig {
  if (config.max_attempts) {
    retry.max_attempts = *config.max_attempts;
  }
  return retry;
}

}  // namespace

AdapterFactory::AdapterFactory() {
  register_kind("http", [](Runtime& runtime, const ProviderConfig& config)
                            -> Result<std::shared_ptr<IProviderAdapter>> {
    auto adapter = HttpProviderAdapter::create(runtime, config);
    if (!adapter) {
      return std::unexpected(adapter.error());
    }
    return std::shared_ptr<IProviderAdapter>(std::move(*adapter));
  });
}

auto AdapterFactory::register_kind(std::string_view kind,
                                   AdapterConstructor ctor) -> void {
  std::scoped_lock lock(mu_);
  constructors_.insert_or_assign(std::string(kind), std::move(ctor));
}

auto AdapterFactory::contains(std::string_view kind) const -> bool {
  std::scoped_lock lock(mu_);
  return constructors_.contains(kind);
}

auto AdapterFactory::create(Runtime& runtime, const ProviderConfig& config) const
    -> Result<std::shared_ptr<IProviderAdapter>> {
  AdapterConstructor ctor;
  {
    std::scoped_lock lock(mu_);
    auto it = constructors_.find(config.kind);
    if (it == constructors_.end()) {
      log::error("Provider {}: no adapter registered for kind '{}'", config.id,
                 config.kind);
      return fail(Error::InvalidArgument);
    }
    ctor = it->second;
  }
  return ctor(runtime, config);
}

Provider::Provider(ProviderConfig config,
                   std::shared_ptr<IProviderAdapter> adapter,
                   const RetryConfig& retry_defaults,
                   const BreakerConfig& breaker_defaults)
    : config_(std::move(config)),
      adapter_(std::move(adapter)),
      breaker_config_(config_.breaker.value_or(breaker_defaults)),
      limiter_(config_.rate_limit),
      retry_(effective_retry(config_, retry_defaults)) {}

auto Provider::breaker() -> CircuitBreaker& {
  std::call_once(breaker_once_, [this] {
    breaker_ = std::make_unique<CircuitBreaker>(config_.id.str(),
                                                breaker_config_);
    breaker_ptr_.store(breaker_.get(), std::memory_order_release);
  });
  return *breaker_;
}

auto Provider::health() const -> BreakerHealth {
  if (auto* breaker = breaker_ptr_.load(std::memory_order_acquire)) {
    return breaker->health();
  }
  return BreakerHealth{};
}

auto Provider::begin_request() -> void {
  std::scoped_lock lock(metrics_mu_);
  ++metrics_.current_load;
}

auto Provider::record_success(std::chrono::milliseconds response_time) -> void {
  std::scoped_lock lock(metrics_mu_);
  ++metrics_.total_requests;
  ++metrics_.successful_requests;
  metrics_.last_request_at = std::chrono::system_clock::now();
  if (metrics_.successful_requests == 1) {
    metrics_.average_response_time = response_time;
  } else {
    metrics_.average_response_time = std::chrono::milliseconds(
        (metrics_.average_response_time.count() * 4 + response_time.count()) /
        5);
  }
  if (metrics_.current_load > 0)
    --metrics_.current_load;
}

auto Provider::record_failure() -> void {
  std::scoped_lock lock(metrics_mu_);
  ++metrics_.total_requests;
  ++metrics_.failed_requests;
  metrics_.last_request_at = std::chrono::system_clock::now();
  if (metrics_.current_load > 0)
    --metrics_.current_load;
}

auto Provider::end_request() -> void {
  std::scoped_lock lock(metrics_mu_);
  if (metrics_.current_load > 0)
    --metrics_.current_load;
}

auto Provider::metrics() const -> ProviderMetrics {
  std::scoped_lock lock(metrics_mu_);
  return metrics_;
}

ProviderRegistry::ProviderRegistry(RetryConfig retry_defaults,
                                   BreakerConfig breaker_defaults)
    : retry_defaults_(retry_defaults), breaker_defaults_(breaker_defaults) {}

auto ProviderRegistry::add(ProviderConfig config,
                           std::shared_ptr<IProviderAdapter> adapter)
    -> Result<void> {
  if (!adapter || config.id.empty()) {
    return fail(Error::InvalidArgument);
  }
  if (index_.contains(config.id.value())) {
    log::error("Provider {} registered twice", config.id);
    return fail(Error::InvalidArgument);
  }
  index_.emplace(config.id.str(), providers_.size());
  providers_.push_back(std::make_unique<Provider>(
      std::move(config), std::move(adapter), retry_defaults_,
      breaker_defaults_));
  return ok();
}

auto ProviderRegistry::find(std::string_view id) const -> Provider* {
  auto it = index_.find(id);
  return it != index_.end() ? providers_[it->second].get() : nullptr;
}

auto ProviderRegistry::ids() const -> std::vector<ProviderId> {
  std::vector<ProviderId> out;
  out.reserve(providers_.size());
  for (const auto& provider : providers_) {
    out.push_back(provider->id());
  }
  return out;
}

auto build_provider_registry(Runtime& runtime, const Config& config)
    -> Result<ProviderRegistry> {
  ProviderRegistry registry(config.orchestrator.retry,
                            config.orchestrator.breaker);
  for (const auto& provider : config.providers) {
    auto adapter = AdapterFactory::instance().create(runtime, provider);
    if (!adapter) {
      return std::unexpected(adapter.error());
    }
    if (auto added = registry.add(provider, std::move(*adapter)); !added) {
      return std::unexpected(added.error());
    }
    log::debug("Provider {} ready ({} / {})", provider.id, provider.kind,
               provider.profile);
  }
  return ok(std::move(registry));
}

}  // namespace genflow
