#pragma once

#include "genflow/config/config.hpp"
#include "genflow/core/error.hpp"
#include "genflow/orchestrator/subscription.hpp"
#include "genflow/orchestrator/task.hpp"
#include "genflow/provider/generation.hpp"
#include "genflow/provider/provider_registry.hpp"
#include "genflow/resilience/circuit_breaker.hpp"
#include "genflow/util/id.hpp"

#include <chrono>
#include <cstddef>
#include <functional>
#include <memory>
#include <vector>

namespace genflow {

class Runtime;

struct SubmitOptions {
  // When false, submit fails with CapacityExceeded instead of queuing behind
  // a saturated budget.
  bool queue_if_saturated{true};
};

struct OrchestratorStats {
  std::size_t queued{0};
  std::size_t running{0};
  std::size_t in_flight{0};
  std::size_t waiting{0};
  std::size_t backing_off{0};
  std::size_t succeeded{0};
  std::size_t failed{0};
  std::size_t cancelled{0};
  std::size_t capacity{0};
};

struct OrchestratorCallbacks {
  // Every published snapshot, in transition order per task. Runs while the
  // transition is being applied; must not call back into the orchestrator.
  std::function<void(const TaskSnapshot&)> on_update;
};

// Admits generation tasks against a global concurrency budget and drives
// each one through its provider with breaker, retry and cancellation
// handling. Construct it after the runtime has started.
class Orchestrator {
public:
  Orchestrator(Runtime& runtime, OrchestratorConfig config,
               ProviderRegistry providers, OrchestratorCallbacks callbacks = {});
  ~Orchestrator();

  Orchestrator(const Orchestrator&) = delete;
  Orchestrator& operator=(const Orchestrator&) = delete;

  // Never blocks. UnknownProvider, ProviderDisabled, CapacityExceeded or
  // ShuttingDown.
  [[nodiscard]] auto submit(const ProviderId& provider,
                            GenerationRequest request,
                            SubmitOptions options = {}) -> Result<TaskId>;

  [[nodiscard]] auto get_status(const TaskId& id) const -> Result<TaskSnapshot>;

  // Queued tasks are cancelled at once; a running attempt is asked to stop
  // and the task is cancelled on acknowledgement or after the grace period.
  auto cancel(const TaskId& id) -> Result<void>;

  [[nodiscard]] auto subscribe(const TaskId& id) const -> Result<Subscription>;

  [[nodiscard]] auto provider_health(const ProviderId& provider) const
      -> Result<BreakerHealth>;
  // Request counts, error rate, response time and current load.
  [[nodiscard]] auto provider_metrics(const ProviderId& provider) const
      -> Result<ProviderMetrics>;
  [[nodiscard]] auto provider_ids() const -> std::vector<ProviderId>;

  [[nodiscard]] auto list_tasks() const -> std::vector<TaskSnapshot>;
  [[nodiscard]] auto stats() const -> OrchestratorStats;

  // True once no task is left in a non-terminal state.
  auto wait_for_idle(std::chrono::milliseconds timeout) const -> bool;

  // Removes terminal tasks older than the retention window.
  auto prune_expired() -> std::size_t;

  // Rejects new work and cancels everything still pending. Non-blocking.
  auto shutdown() -> void;

private:
  struct Impl;
  std::shared_ptr<Impl> impl_;
};

}  // namespace genflow
