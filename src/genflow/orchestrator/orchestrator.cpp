#include "genflow/orchestrator/orchestrator.hpp"

#include "genflow/core/cancellation.hpp"
#include "genflow/core/coroutine.hpp"
#include "genflow/core/runtime.hpp"
#include "genflow/orchestrator/task_registry.hpp"
#include "genflow/provider/provider_adapter.hpp"
#include "genflow/resilience/error_classifier.hpp"
#include "genflow/util/log.hpp"

#include <algorithm>
#include <condition_variable>
#include <deque>
#include <format>
#include <mutex>
#include <optional>
#include <unordered_map>
#include <utility>
#include <variant>

namespace genflow {

namespace {

using namespace std::chrono_literals;

constexpr auto kCancelCheckInterval = 50ms;

auto describe(const TaskError& error) -> std::string {
  return std::format("{}: {}", error.kind, error.message);
}

// One breaker outcome per attempt. An attempt that ends without one (frame
// destroyed at shutdown) gives its probe back.
class BreakerTicket {
public:
  BreakerTicket(CircuitBreaker& breaker, Admission admission)
      : breaker_(&breaker), admission_(admission) {}

  BreakerTicket(const BreakerTicket&) = delete;
  BreakerTicket& operator=(const BreakerTicket&) = delete;

  ~BreakerTicket() {
    abandon();
  }

  auto success() -> void {
    if (std::exchange(settled_, true))
      return;
    breaker_->record_success(admission_);
  }

  auto outcome(ErrorKind kind) -> void {
    if (std::exchange(settled_, true))
      return;
    if (disposition(kind).counts_toward_breaker) {
      breaker_->record_failure(admission_);
    } else {
      breaker_->record_neutral(admission_);
    }
  }

  auto abandon() -> void {
    if (std::exchange(settled_, true))
      return;
    breaker_->abandon(admission_);
  }

private:
  CircuitBreaker* breaker_;
  Admission admission_;
  bool settled_{false};
};

// Load and outcome accounting for one attempt on its target provider. An
// attempt that ends without an outcome only gives its load back.
class RequestTracker {
public:
  explicit RequestTracker(Provider& provider)
      : provider_(&provider), started_(std::chrono::steady_clock::now()) {
    provider_->begin_request();
  }

  RequestTracker(const RequestTracker&) = delete;
  RequestTracker& operator=(const RequestTracker&) = delete;

  ~RequestTracker() {
    if (!settled_)
      provider_->end_request();
  }

  auto success() -> void {
    if (std::exchange(settled_, true))
      return;
    provider_->record_success(std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - started_));
  }

  auto failure() -> void {
    if (std::exchange(settled_, true))
      return;
    provider_->record_failure();
  }

private:
  Provider* provider_;
  std::chrono::steady_clock::time_point started_;
  bool settled_{false};
};

}  // namespace

struct Orchestrator::Impl : std::enable_shared_from_this<Orchestrator::Impl> {
  enum class Phase : std::uint8_t {
    Waiting,  // in the admission queue
    Running,  // holds a slot, driver active
    Backoff,  // waiting out a delay without a slot
  };

  struct ActiveTask {
    ProviderId provider;
    std::shared_ptr<const GenerationRequest> request;
    Phase phase{Phase::Waiting};
    CancellationSource cancel;
    bool started{false};
    int attempts{0};
  };

  // Holds one unit of the concurrency budget for the lifetime of a driver.
  class SlotLease {
  public:
    SlotLease(std::shared_ptr<Impl> impl, ProviderId provider)
        : impl_(std::move(impl)), provider_(std::move(provider)) {}

    SlotLease(SlotLease&& other) noexcept
        : impl_(std::move(other.impl_)), provider_(std::move(other.provider_)) {}
    SlotLease& operator=(SlotLease&&) = delete;

    ~SlotLease() {
      if (impl_)
        impl_->release_slot(provider_);
    }

  private:
    std::shared_ptr<Impl> impl_;
    ProviderId provider_;
  };

  Impl(Runtime& rt, OrchestratorConfig cfg, ProviderRegistry registry,
       OrchestratorCallbacks callbacks)
      : runtime(rt),
        config(std::move(cfg)),
        providers(std::move(registry)),
        tasks(std::move(callbacks.on_update)) {}

  Runtime& runtime;
  OrchestratorConfig config;
  ProviderRegistry providers;
  TaskRegistry tasks;

  mutable std::mutex mu;
  mutable std::condition_variable idle_cv;
  std::deque<TaskId> ready;
  std::unordered_map<TaskId, ActiveTask> active;
  std::unordered_map<std::string, std::size_t, StringHash, StringEqual>
      provider_slots;
  std::size_t in_flight{0};
  bool shutting_down{false};

  // --- transitions; mu held -------------------------------------------

  auto publish_locked(const TaskId& id, TaskUpdate update) -> bool {
    auto applied = tasks.apply(id, std::move(update));
    if (!applied) {
      log::debug("Task {}: update dropped: {}", id, applied.error().message());
      return false;
    }
    return true;
  }

  auto finish_locked(const TaskId& id, TaskUpdate update) -> void {
    publish_locked(id, std::move(update));
    active.erase(id);
    std::erase(ready, id);
    idle_cv.notify_all();
  }

  auto defer_locked(const TaskId& id, std::chrono::milliseconds delay,
                    std::string note, std::optional<TaskError> error = {})
      -> void {
    auto it = active.find(id);
    if (it == active.end())
      return;
    it->second.phase = Phase::Backoff;
    log::debug("Task {}: {}", id, note);
    publish_locked(id, TaskUpdate{.note = std::move(note),
                                  .error = std::move(error)});
    runtime.spawn(requeue_after(shared_from_this(), id, delay));
  }

  auto has_room_locked(const ActiveTask& task) const -> bool {
    auto* provider = providers.find(task.provider);
    if (provider == nullptr || provider->config().max_concurrency <= 0)
      return true;
    auto it = provider_slots.find(task.provider.value());
    auto used = it != provider_slots.end() ? it->second : 0;
    return used < static_cast<std::size_t>(provider->config().max_concurrency);
  }

  // Oldest waiting task whose provider still has room; FIFO per provider.
  auto admit_locked() -> std::vector<std::pair<TaskId, ProviderId>> {
    std::vector<std::pair<TaskId, ProviderId>> admitted;
    if (!runtime.is_running())
      return admitted;

    while (in_flight < config.max_concurrency) {
      auto it = std::ranges::find_if(ready, [&](const TaskId& id) {
        auto task = active.find(id);
        return task != active.end() && has_room_locked(task->second);
      });
      if (it == ready.end())
        break;

      auto& task = active.at(*it);
      task.phase = Phase::Running;
      ++in_flight;
      ++provider_slots[task.provider.str()];
      admitted.emplace_back(*it, task.provider);
      ready.erase(it);
    }
    return admitted;
  }

  auto launch(std::vector<std::pair<TaskId, ProviderId>> admitted) -> void {
    for (auto& [id, provider] : admitted) {
      auto self = shared_from_this();
      SlotLease lease{self, std::move(provider)};
      runtime.spawn(drive(std::move(self), std::move(id), std::move(lease)));
    }
  }

  auto release_slot(const ProviderId& provider) -> void {
    std::vector<std::pair<TaskId, ProviderId>> admitted;
    {
      std::scoped_lock lock(mu);
      --in_flight;
      if (auto it = provider_slots.find(provider.value());
          it != provider_slots.end() && it->second > 0) {
        --it->second;
      }
      if (!shutting_down)
        admitted = admit_locked();
    }
    launch(std::move(admitted));
  }

  auto still_active(const TaskId& id) const -> bool {
    std::scoped_lock lock(mu);
    return active.contains(id);
  }

  auto fallback_for(const Provider& primary) const -> Provider* {
    const auto& fallback = primary.config().fallback;
    if (!fallback)
      return nullptr;
    auto* provider = providers.find(*fallback);
    if (provider == nullptr) {
      log::warn("Provider {}: fallback {} is not registered", primary.id(),
                *fallback);
      return nullptr;
    }
    return provider->enabled() ? provider : nullptr;
  }

  // --- coroutines ------------------------------------------------------

  // The lease holds the concurrency slot until the frame is destroyed.
  static auto drive(std::shared_ptr<Impl> self, TaskId id, SlotLease lease)
      -> spawn_task;

  // Periodic retention sweep; holds no reference across the sleep.
  static auto janitor(std::weak_ptr<Impl> weak) -> spawn_task;

  static auto requeue_after(std::shared_ptr<Impl> self, TaskId id,
                            std::chrono::milliseconds delay) -> spawn_task {
    co_await async_sleep(delay);
    std::vector<std::pair<TaskId, ProviderId>> admitted;
    {
      std::scoped_lock lock(self->mu);
      auto it = self->active.find(id);
      if (it == self->active.end() || self->shutting_down)
        co_return;
      it->second.phase = Phase::Waiting;
      self->ready.push_back(id);
      admitted = self->admit_locked();
    }
    self->launch(std::move(admitted));
  }

  static auto cancel_watchdog(std::shared_ptr<Impl> self, TaskId id)
      -> spawn_task {
    co_await async_sleep(self->config.cancel_grace);
    std::scoped_lock lock(self->mu);
    if (!self->active.contains(id))
      co_return;
    log::info("Task {}: cancellation not acknowledged within {} ms", id,
              self->config.cancel_grace.count());
    self->finish_locked(
        id, TaskUpdate{.status = TaskStatus::Cancelled,
                       .note = "cancelled after grace period without "
                               "provider acknowledgement"});
  }

  static auto discard_job(std::shared_ptr<Impl> self, Provider* provider,
                          JobRef job) -> spawn_task {
    auto ack = co_await cancel_job(self->runtime, provider->adapter(), job,
                                   self->config.cancel_grace);
    if (!ack) {
      log::debug("Provider {}: abandoned job {} not cancelled: {}",
                 provider->id(), job, ack.error().message);
    }
  }

  // True when cancellation was requested before the delay ran out.
  auto sleep_unless_cancelled(CancellationToken token,
                              std::chrono::milliseconds delay) -> task<bool> {
    auto end = std::chrono::steady_clock::now() + delay;
    for (;;) {
      if (token.is_cancelled())
        co_return true;
      auto now = std::chrono::steady_clock::now();
      if (now >= end)
        co_return false;
      auto left =
          std::chrono::ceil<std::chrono::milliseconds>(end - now);
      co_await async_sleep(std::min<std::chrono::milliseconds>(
          left, kCancelCheckInterval));
    }
  }

  auto acknowledge_cancel(TaskId id, Provider* target,
                          std::optional<JobRef> job) -> task<void> {
    std::string note = "cancelled before the provider accepted the job";
    if (job) {
      auto ack = co_await cancel_job(runtime, target->adapter(), *job,
                                     config.cancel_grace);
      note = ack ? std::string("cancellation acknowledged by provider")
                 : std::format("provider did not acknowledge cancellation: {}",
                               ack.error().message);
    }
    std::scoped_lock lock(mu);
    if (!active.contains(id))
      co_return;
    finish_locked(id, TaskUpdate{.status = TaskStatus::Cancelled,
                                 .note = std::move(note)});
  }

  auto fail_attempt(const TaskId& id, Provider& primary, BreakerTicket& ticket,
                    RequestTracker& tracker, int attempt,
                    const RawFailure& failure) -> void {
    auto error = classify(failure);
    ticket.outcome(error.kind);
    tracker.failure();
    auto decision = primary.retry().decide(attempt, error);

    std::scoped_lock lock(mu);
    if (!active.contains(id)) {
      log::info("Task {}: discarding late failure ({})", id, describe(error));
      return;
    }
    if (decision.should_retry && !shutting_down) {
      defer_locked(id, decision.delay,
                   std::format("retry scheduled in {} ms after {}",
                               decision.delay.count(), describe(error)),
                   error);
      return;
    }
    auto note = std::format("failed after {} attempt{}: {}", attempt,
                            attempt == 1 ? "" : "s", describe(error));
    finish_locked(id, TaskUpdate{.status = TaskStatus::Failed,
                                 .note = std::move(note),
                                 .error = std::move(error)});
  }
};

auto Orchestrator::Impl::drive(std::shared_ptr<Impl> self, TaskId id,
                               [[maybe_unused]] SlotLease lease)
    -> spawn_task {
  Provider* primary = nullptr;
  std::shared_ptr<const GenerationRequest> request;
  CancellationToken token;
  int attempt = 0;

  {
    std::scoped_lock lock(self->mu);
    auto it = self->active.find(id);
    if (it == self->active.end())
      co_return;
    auto& task = it->second;
    primary = self->providers.find(task.provider);
    request = task.request;
    token = task.cancel.token();

    if (primary == nullptr) {
      self->finish_locked(
          id, TaskUpdate{.status = TaskStatus::Failed,
                         .note = "provider is no longer registered",
                         .error = TaskError{ErrorKind::ProviderUnavailable,
                                            "provider is not registered"}});
      co_return;
    }
    if (token.is_cancelled()) {
      self->finish_locked(id, TaskUpdate{.status = TaskStatus::Cancelled,
                                         .note = "cancelled before dispatch"});
      co_return;
    }
    if (!task.started) {
      task.started = true;
      self->publish_locked(id, TaskUpdate{.status = TaskStatus::Running,
                                          .note = "admitted"});
    }
    attempt = task.attempts;
  }

  Provider* target = primary;
  auto admission = primary->breaker().try_acquire();
  std::string routing;
  if (admission == Admission::RejectedOpen) {
    if (auto* fallback = self->fallback_for(*primary)) {
      auto fallback_admission = fallback->breaker().try_acquire();
      if (admitted(fallback_admission)) {
        target = fallback;
        admission = fallback_admission;
        routing = std::format("circuit open for {}, routed to {}",
                              primary->id(), fallback->id());
      }
    }
  }

  if (admission == Admission::RejectedOpen) {
    TaskError error{ErrorKind::ProviderUnavailable,
                    std::format("circuit open for provider {}", primary->id())};
    std::scoped_lock lock(self->mu);
    self->finish_locked(
        id, TaskUpdate{.status = TaskStatus::Failed,
                       .note = std::format("failed fast: {}", describe(error)),
                       .error = std::move(error)});
    co_return;
  }

  if (admission == Admission::RejectedProbeBusy) {
    TaskError probe_busy{ErrorKind::ProviderUnavailable,
                         std::format("provider {} is probing recovery",
                                     primary->id())};
    auto delay =
        primary->retry().decide(std::max(attempt, 1), probe_busy).delay;
    std::scoped_lock lock(self->mu);
    self->defer_locked(id, delay,
                       std::format("{}, waiting {} ms", probe_busy.message,
                                   delay.count()));
    co_return;
  }

  BreakerTicket ticket{target->breaker(), admission};
  const auto& target_config = target->config();

  // Local rate limit: wait without a slot, no attempt consumed. Checked only
  // once the breaker admits the call so rejected tasks never take a token.
  if (auto wait = target->limiter().try_acquire()) {
    ticket.abandon();
    std::scoped_lock lock(self->mu);
    self->defer_locked(id, *wait,
                       std::format("rate limit for {} reached, waiting {} ms",
                                   target->id(), wait->count()));
    co_return;
  }

  {
    std::scoped_lock lock(self->mu);
    auto it = self->active.find(id);
    if (it == self->active.end())
      co_return;
    if (token.is_cancelled()) {
      self->finish_locked(id, TaskUpdate{.status = TaskStatus::Cancelled,
                                         .note = "cancelled before dispatch"});
      co_return;
    }
    if (!routing.empty()) {
      log::info("Task {}: {}", id, routing);
      self->publish_locked(id, TaskUpdate{.note = std::move(routing)});
    }
    attempt = ++it->second.attempts;
    self->publish_locked(
        id, TaskUpdate{.note = std::format("attempt {} submitted to {}",
                                           attempt, target->id()),
                       .begin_attempt = true});
  }

  RequestTracker tracker{*target};
  auto submitted = co_await submit_job(self->runtime, target->adapter(),
                                       request, target_config.request_timeout);

  if (!self->still_active(id)) {
    log::info("Task {}: discarding late submit result from {}", id,
              target->id());
    ticket.abandon();
    if (submitted) {
      self->runtime.spawn(discard_job(self, target, *submitted));
    }
    co_return;
  }
  if (!submitted) {
    self->fail_attempt(id, *primary, ticket, tracker, attempt,
                       submitted.error());
    co_return;
  }
  auto job = std::move(*submitted);
  if (token.is_cancelled()) {
    ticket.abandon();
    co_await self->acknowledge_cancel(id, target, job);
    co_return;
  }

  auto deadline = std::chrono::steady_clock::now() + target_config.job_timeout;
  std::optional<int> last_progress;

  for (;;) {
    auto polled = co_await poll_job(self->runtime, target->adapter(), job,
                                    target_config.request_timeout);

    if (!self->still_active(id)) {
      log::info("Task {}: discarding late poll result for job {}", id, job);
      ticket.abandon();
      self->runtime.spawn(discard_job(self, target, job));
      co_return;
    }
    if (token.is_cancelled()) {
      ticket.abandon();
      co_await self->acknowledge_cancel(id, target, job);
      co_return;
    }
    if (!polled) {
      self->runtime.spawn(discard_job(self, target, job));
      self->fail_attempt(id, *primary, ticket, tracker, attempt,
                         polled.error());
      co_return;
    }

    if (auto* done = std::get_if<JobSucceeded>(&*polled)) {
      ticket.success();
      tracker.success();
      std::scoped_lock lock(self->mu);
      if (!self->active.contains(id)) {
        log::info("Task {}: discarding late result for job {}", id, job);
        co_return;
      }
      self->finish_locked(
          id, TaskUpdate{.status = TaskStatus::Succeeded,
                         .note = std::format("succeeded on attempt {}", attempt),
                         .result = std::move(done->result)});
      co_return;
    }
    if (auto* failed = std::get_if<JobFailed>(&*polled)) {
      self->fail_attempt(id, *primary, ticket, tracker, attempt,
                         failed->failure);
      co_return;
    }

    const auto& pending = std::get<JobPending>(*polled);
    if (pending.progress_percent && pending.progress_percent != last_progress) {
      last_progress = pending.progress_percent;
      std::scoped_lock lock(self->mu);
      if (self->active.contains(id)) {
        self->publish_locked(
            id, TaskUpdate{.note = std::format("progress {}%", *last_progress)});
      }
    }

    auto now = std::chrono::steady_clock::now();
    if (now >= deadline) {
      self->runtime.spawn(discard_job(self, target, job));
      self->fail_attempt(
          id, *primary, ticket, tracker, attempt,
          RawFailure{.timed_out = true,
                     .message = std::format(
                         "job {} did not finish within {} ms", job,
                         target_config.job_timeout.count())});
      co_return;
    }

    auto wait = std::min(
        target_config.poll_interval,
        std::chrono::ceil<std::chrono::milliseconds>(deadline - now));
    if (co_await self->sleep_unless_cancelled(token, wait)) {
      ticket.abandon();
      co_await self->acknowledge_cancel(id, target, job);
      co_return;
    }
  }
}

auto Orchestrator::Impl::janitor(std::weak_ptr<Impl> weak) -> spawn_task {
  for (;;) {
    std::chrono::milliseconds interval;
    {
      auto self = weak.lock();
      if (!self)
        co_return;
      {
        std::scoped_lock lock(self->mu);
        if (self->shutting_down)
          co_return;
      }
      auto cutoff = TaskClock::now() - self->config.retention;
      if (auto removed = self->tasks.prune(cutoff); removed > 0) {
        log::debug("Retention sweep removed {} task(s)", removed);
      }
      interval = self->config.sweep_interval;
    }
    co_await async_sleep(interval);
  }
}

Orchestrator::Orchestrator(Runtime& runtime, OrchestratorConfig config,
                           ProviderRegistry providers,
                           OrchestratorCallbacks callbacks)
    : impl_(std::make_shared<Impl>(runtime, std::move(config),
                                   std::move(providers), std::move(callbacks))) {
  log::info("Orchestrator ready: {} provider(s), concurrency {}",
            impl_->providers.size(), impl_->config.max_concurrency);
  runtime.spawn(Impl::janitor(impl_));
}

Orchestrator::~Orchestrator() {
  shutdown();
}

auto Orchestrator::submit(const ProviderId& provider, GenerationRequest request,
                          SubmitOptions options) -> Result<TaskId> {
  auto& impl = *impl_;
  std::vector<std::pair<TaskId, ProviderId>> admitted;
  TaskId id;
  {
    std::scoped_lock lock(impl.mu);
    if (impl.shutting_down)
      return fail(Error::ShuttingDown);

    auto* target = provider.empty() ? nullptr : impl.providers.find(provider);
    if (target == nullptr)
      return fail(Error::UnknownProvider);
    if (!target->enabled())
      return fail(Error::ProviderDisabled);

    if (!options.queue_if_saturated &&
        impl.in_flight + impl.ready.size() >= impl.config.max_concurrency) {
      return fail(Error::CapacityExceeded);
    }
    if (impl.config.max_queue_depth > 0 &&
        impl.ready.size() >= impl.config.max_queue_depth) {
      return fail(Error::CapacityExceeded);
    }

    id = generate_task_id();
    auto shared_request =
        std::make_shared<const GenerationRequest>(std::move(request));
    impl.tasks.create(id, provider, shared_request,
                      std::format("submitted to {}", provider));
    impl.active.emplace(id, Impl::ActiveTask{.provider = provider,
                                       .request = std::move(shared_request)});
    impl.ready.push_back(id);
    admitted = impl.admit_locked();
  }
  impl.launch(std::move(admitted));
  return id;
}

auto Orchestrator::get_status(const TaskId& id) const -> Result<TaskSnapshot> {
  return impl_->tasks.get(id);
}

auto Orchestrator::cancel(const TaskId& id) -> Result<void> {
  auto& impl = *impl_;
  std::scoped_lock lock(impl.mu);

  auto snapshot = impl.tasks.get(id);
  if (!snapshot)
    return fail(snapshot.error());
  auto it = impl.active.find(id);
  if (snapshot->terminal() || it == impl.active.end())
    return fail(Error::InvalidStateTransition);

  switch (it->second.phase) {
    case Impl::Phase::Waiting:
      impl.finish_locked(id, TaskUpdate{.status = TaskStatus::Cancelled,
                                        .note = "cancelled while queued"});
      break;
    case Impl::Phase::Backoff:
      impl.finish_locked(
          id, TaskUpdate{.status = TaskStatus::Cancelled,
                         .note = "cancelled while waiting to retry"});
      break;
    case Impl::Phase::Running:
      if (it->second.cancel.cancel()) {
        impl.publish_locked(id, TaskUpdate{.note = "cancellation requested"});
        impl.runtime.spawn(Impl::cancel_watchdog(impl_, id));
      }
      break;
  }
  return ok();
}

auto Orchestrator::subscribe(const TaskId& id) const -> Result<Subscription> {
  return impl_->tasks.subscribe(id);
}

auto Orchestrator::provider_health(const ProviderId& provider) const
    -> Result<BreakerHealth> {
  auto* target = impl_->providers.find(provider);
  if (target == nullptr)
    return fail(Error::UnknownProvider);
  return target->health();
}

auto Orchestrator::provider_metrics(const ProviderId& provider) const
    -> Result<ProviderMetrics> {
  auto* target = impl_->providers.find(provider);
  if (target == nullptr)
    return fail(Error::UnknownProvider);
  return target->metrics();
}

auto Orchestrator::provider_ids() const -> std::vector<ProviderId> {
  return impl_->providers.ids();
}

auto Orchestrator::list_tasks() const -> std::vector<TaskSnapshot> {
  return impl_->tasks.list();
}

auto Orchestrator::stats() const -> OrchestratorStats {
  auto counts = impl_->tasks.counts();
  OrchestratorStats stats{
      .queued = counts.queued,
      .running = counts.running,
      .succeeded = counts.succeeded,
      .failed = counts.failed,
      .cancelled = counts.cancelled,
      .capacity = impl_->config.max_concurrency,
  };
  std::scoped_lock lock(impl_->mu);
  stats.in_flight = impl_->in_flight;
  stats.waiting = impl_->ready.size();
  stats.backing_off = static_cast<std::size_t>(
      std::ranges::count_if(impl_->active, [](const auto& item) {
        return item.second.phase == Impl::Phase::Backoff;
      }));
  return stats;
}

auto Orchestrator::wait_for_idle(std::chrono::milliseconds timeout) const
    -> bool {
  std::unique_lock lock(impl_->mu);
  return impl_->idle_cv.wait_for(lock, timeout,
                                 [this] { return impl_->active.empty(); });
}

auto Orchestrator::prune_expired() -> std::size_t {
  auto cutoff = TaskClock::now() - impl_->config.retention;
  auto removed = impl_->tasks.prune(cutoff);
  if (removed > 0) {
    log::debug("Pruned {} finished task(s)", removed);
  }
  return removed;
}

auto Orchestrator::shutdown() -> void {
  auto& impl = *impl_;
  std::scoped_lock lock(impl.mu);
  if (std::exchange(impl.shutting_down, true))
    return;

  std::vector<TaskId> ids;
  ids.reserve(impl.active.size());
  for (const auto& [id, _] : impl.active) {
    ids.push_back(id);
  }

  log::info("Orchestrator shutting down, {} task(s) pending", ids.size());
  for (const auto& id : ids) {
    auto& task = impl.active.at(id);
    if (task.phase != Impl::Phase::Running) {
      impl.finish_locked(id, TaskUpdate{.status = TaskStatus::Cancelled,
                                        .note = "cancelled at shutdown"});
      continue;
    }
    if (task.cancel.cancel()) {
      impl.publish_locked(
          id, TaskUpdate{.note = "cancellation requested at shutdown"});
      impl.runtime.spawn(Impl::cancel_watchdog(impl_, id));
    }
  }
  impl.ready.clear();
}

}  // namespace genflow
