#include "genflow/app/application.hpp"

#include "genflow/core/runtime.hpp"
#include "genflow/provider/provider_registry.hpp"
#include "genflow/util/log.hpp"

#include <print>

namespace genflow {

namespace {

using namespace std::chrono_literals;

constexpr auto kStopSlack = 1000ms;

}  // namespace

Application::Application() = default;

Application::~Application() {
  stop();
}

auto Application::load_config(std::string_view path) -> Result<void> {
  auto cfg = ConfigLoader::load_from_file(path);
  if (!cfg)
    return fail(cfg.error());
  config_ = std::move(*cfg);
  return ok();
}

auto Application::load_config_string(std::string_view yaml) -> Result<void> {
  auto cfg = ConfigLoader::load_from_string(yaml);
  if (!cfg)
    return fail(cfg.error());
  config_ = std::move(*cfg);
  return ok();
}

auto Application::config() const noexcept -> const Config& {
  return config_;
}

auto Application::config() noexcept -> Config& {
  return config_;
}

auto Application::start(OrchestratorCallbacks callbacks) -> Result<void> {
  if (running_.exchange(true))
    return ok();

  if (auto valid = validate_config(config_); !valid) {
    running_.store(false);
    return fail(valid.error());
  }

  runtime_ = std::make_unique<Runtime>(config_.shards);
  runtime_->start();

  auto providers = build_provider_registry(*runtime_, config_);
  if (!providers) {
    log::error("Failed to create providers: {}", providers.error().message());
    runtime_->stop();
    runtime_.reset();
    running_.store(false);
    return fail(providers.error());
  }

  orchestrator_ = std::make_unique<Orchestrator>(
      *runtime_, config_.orchestrator, std::move(*providers),
      std::move(callbacks));

  log::info("genflow started with {} provider(s) on {} shard(s)",
            config_.providers.size(), runtime_->shard_count());
  return ok();
}

auto Application::stop() -> void {
  if (!running_.exchange(false))
    return;

  log::info("Stopping genflow...");
  if (orchestrator_) {
    for (const auto& id : orchestrator_->provider_ids()) {
      if (auto m = orchestrator_->provider_metrics(id)) {
        log::info("Provider {}: {} request(s), {} failed ({:.0f}%), avg {} ms",
                  id, m->total_requests, m->failed_requests,
                  m->error_rate() * 100.0, m->average_response_time.count());
      }
    }
    orchestrator_->shutdown();
    if (!orchestrator_->wait_for_idle(config_.orchestrator.cancel_grace +
                                      kStopSlack)) {
      log::warn("Tasks still active after the cancellation grace period");
    }
  }
  if (runtime_) {
    runtime_->stop();
  }
  orchestrator_.reset();
  runtime_.reset();
  log::info("genflow stopped");
}

auto Application::is_running() const noexcept -> bool {
  return running_.load(std::memory_order_acquire);
}

auto Application::orchestrator() -> Orchestrator& {
  return *orchestrator_;
}

auto Application::print_providers() const -> void {
  std::println("Providers ({}):", config_.providers.size());
  for (const auto& p : config_.providers) {
    std::println("  {:<16} kind={} profile={} enabled={} max_concurrency={}{}",
                 p.id, p.kind, p.profile, p.enabled, p.max_concurrency,
                 p.fallback ? std::format(" fallback={}", *p.fallback)
                            : std::string{});
  }
}

}  // namespace genflow
