#pragma once

#include "genflow/config/config.hpp"
#include "genflow/core/error.hpp"
#include "genflow/orchestrator/orchestrator.hpp"

#include <atomic>
#include <memory>
#include <string_view>

namespace genflow {

class Runtime;

// Owns the runtime and the orchestrator built from one configuration.
class Application {
public:
  Application();
  ~Application();

  Application(const Application&) = delete;
  auto operator=(const Application&) -> Application& = delete;

  [[nodiscard]] auto load_config(std::string_view path) -> Result<void>;
  [[nodiscard]] auto load_config_string(std::string_view yaml) -> Result<void>;
  [[nodiscard]] auto config() const noexcept -> const Config&;
  [[nodiscard]] auto config() noexcept -> Config&;

  // Starts the shards, creates every configured adapter and the
  // orchestrator on top of them.
  [[nodiscard]] auto start(OrchestratorCallbacks callbacks = {})
      -> Result<void>;
  // Stops accepting work, gives running tasks the cancellation grace period
  // and then stops the shards.
  auto stop() -> void;
  [[nodiscard]] auto is_running() const noexcept -> bool;

  // Valid between start() and stop().
  [[nodiscard]] auto orchestrator() -> Orchestrator&;

  auto print_providers() const -> void;

private:
  std::atomic<bool> running_{false};
  Config config_;

  std::unique_ptr<Runtime> runtime_;
  std::unique_ptr<Orchestrator> orchestrator_;
};

}  // namespace genflow
