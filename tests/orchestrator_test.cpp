#include "genflow/core/runtime.hpp"
#include "genflow/orchestrator/orchestrator.hpp"
#include "genflow/provider/provider_registry.hpp"
#include "test_utils.hpp"

#include <gtest/gtest.h>

#include <chrono>
#include <memory>
#include <mutex>
#include <utility>
#include <vector>

namespace genflow::test {

using namespace std::chrono_literals;

namespace {

constexpr auto kFinishTimeout = 5000ms;

auto provider_config(std::string_view id) -> ProviderConfig {
  ProviderConfig config;
  config.id = provider_id(id);
  config.request_timeout = 2000ms;
  config.poll_interval = 10ms;
  config.job_timeout = 10000ms;
  return config;
}

auto quick_retry() -> RetryConfig {
  return RetryConfig{.max_attempts = 3,
                     .base_delay = 10ms,
                     .max_delay = 50ms,
                     .jitter = false};
}

auto steady_breaker() -> BreakerConfig {
  return BreakerConfig{.failure_threshold = 5,
                       .cooldown = 60000ms,
                       .cooldown_jitter = 0ms};
}

auto await_terminal(Orchestrator& orchestrator, const TaskId& id)
    -> std::optional<TaskSnapshot> {
  auto updates = orchestrator.subscribe(id);
  if (!updates)
    return std::nullopt;
  std::optional<TaskSnapshot> last;
  while (auto snapshot = updates->next_for(kFinishTimeout)) {
    last = std::move(snapshot);
    if (last->terminal())
      return last;
  }
  return std::nullopt;
}

}  // namespace

class OrchestratorTest : public ::testing::Test {
protected:
  void SetUp() override {
    runtime_ = std::make_unique<Runtime>(2);
    runtime_->start();
  }

  void TearDown() override {
    for (auto& adapter : adapters_) {
      adapter->release_submits();
    }
    orchestrator_.reset();
    runtime_->stop();
  }

  auto add_provider(ProviderConfig config) -> std::shared_ptr<ScriptedAdapter> {
    auto adapter = std::make_shared<ScriptedAdapter>();
    adapters_.push_back(adapter);
    providers_.emplace_back(std::move(config), adapter);
    return adapter;
  }

  auto start(OrchestratorConfig config = {}, OrchestratorCallbacks callbacks = {})
      -> Orchestrator& {
    config.retry = quick_retry();
    config.breaker = steady_breaker();
    ProviderRegistry registry(config.retry, config.breaker);
    for (auto& [provider, adapter] : providers_) {
      EXPECT_TRUE(registry.add(provider, adapter).has_value());
    }
    orchestrator_ = std::make_unique<Orchestrator>(
        *runtime_, std::move(config), std::move(registry), std::move(callbacks));
    return *orchestrator_;
  }

  auto run(const TaskId& id) -> TaskSnapshot {
    auto final = await_terminal(*orchestrator_, id);
    EXPECT_TRUE(final.has_value()) << "task " << id << " did not finish";
    return final.value_or(TaskSnapshot{});
  }

  std::unique_ptr<Runtime> runtime_;
  std::vector<std::shared_ptr<ScriptedAdapter>> adapters_;
  std::vector<std::pair<ProviderConfig, std::shared_ptr<ScriptedAdapter>>>
      providers_;
  std::unique_ptr<Orchestrator> orchestrator_;
};

TEST_F(OrchestratorTest, SucceedsOnFirstAttempt) {
  auto adapter = add_provider(provider_config("luma"));
  auto& orch = start();

  auto id = orch.submit(provider_id("luma"), text_request("a red fox"));
  ASSERT_TRUE(id.has_value());

  auto final = run(*id);
  EXPECT_EQ(final.status, TaskStatus::Succeeded);
  EXPECT_EQ(final.attempt, 1);
  ASSERT_TRUE(final.result.has_value());
  EXPECT_EQ(final.result->uri, "mem://job-1");
  EXPECT_FALSE(final.last_error.has_value());

  ASSERT_GE(final.history.size(), 4u);
  EXPECT_EQ(final.history.front().status, TaskStatus::Queued);
  EXPECT_EQ(final.history.front().note, "submitted to luma");
  EXPECT_TRUE(has_note(final, "attempt 1 submitted to luma"));
  EXPECT_EQ(final.history.back().status, TaskStatus::Succeeded);
  EXPECT_EQ(adapter->submit_calls(), 1);
}

TEST_F(OrchestratorTest, RetriesTransientFailures) {
  auto adapter = add_provider(provider_config("luma"));
  adapter->script_submit(std::unexpected(http_failure(503)))
      .script_submit(std::unexpected(http_failure(503)));
  auto& orch = start();

  auto id = orch.submit(provider_id("luma"), text_request("retry me"));
  ASSERT_TRUE(id.has_value());

  auto final = run(*id);
  EXPECT_EQ(final.status, TaskStatus::Succeeded);
  EXPECT_EQ(final.attempt, 3);
  EXPECT_EQ(count_notes(final, "retry scheduled in"), 2);
  ASSERT_TRUE(final.last_error.has_value());
  EXPECT_EQ(final.last_error->kind, ErrorKind::Transient);
  EXPECT_EQ(adapter->submit_calls(), 3);
}

TEST_F(OrchestratorTest, InvalidRequestFailsWithoutRetry) {
  auto adapter = add_provider(provider_config("luma"));
  adapter->script_submit(std::unexpected(http_failure(400, "bad prompt")));
  auto& orch = start();

  auto id = orch.submit(provider_id("luma"), text_request(""));
  ASSERT_TRUE(id.has_value());

  auto final = run(*id);
  EXPECT_EQ(final.status, TaskStatus::Failed);
  EXPECT_EQ(final.attempt, 1);
  ASSERT_TRUE(final.last_error.has_value());
  EXPECT_EQ(final.last_error->kind, ErrorKind::InvalidRequest);
  EXPECT_EQ(count_notes(final, "retry"), 0);
  EXPECT_EQ(adapter->submit_calls(), 1);

  auto health = orch.provider_health(provider_id("luma"));
  ASSERT_TRUE(health.has_value());
  EXPECT_EQ(health->state, BreakerState::Closed);
  EXPECT_EQ(health->consecutive_failures, 0);
}

TEST_F(OrchestratorTest, ExhaustsAttemptBudget) {
  auto adapter = add_provider(provider_config("luma"));
  for (int i = 0; i < 3; ++i) {
    adapter->script_submit(std::unexpected(http_failure(502)));
  }
  auto& orch = start();

  auto id = orch.submit(provider_id("luma"), text_request("never"));
  ASSERT_TRUE(id.has_value());

  auto final = run(*id);
  EXPECT_EQ(final.status, TaskStatus::Failed);
  EXPECT_EQ(final.attempt, 3);
  EXPECT_TRUE(has_note(final, "failed after 3 attempts"));
  EXPECT_EQ(count_notes(final, "retry scheduled in"), 2);
  EXPECT_EQ(adapter->submit_calls(), 3);
}

TEST_F(OrchestratorTest, PollFailureStartsNewAttempt) {
  auto adapter = add_provider(provider_config("luma"));
  adapter->script_poll(JobFailed{http_failure(500, "worker crashed")});
  auto& orch = start();

  auto id = orch.submit(provider_id("luma"), text_request("again"));
  ASSERT_TRUE(id.has_value());

  auto final = run(*id);
  EXPECT_EQ(final.status, TaskStatus::Succeeded);
  EXPECT_EQ(final.attempt, 2);
  EXPECT_EQ(adapter->submit_calls(), 2);
  EXPECT_EQ(final.result->uri, "mem://job-2");
}

TEST_F(OrchestratorTest, RateLimitHintStretchesRetryDelay) {
  auto adapter = add_provider(provider_config("luma"));
  auto limited = http_failure(429);
  limited.retry_after = 30ms;
  adapter->script_submit(std::unexpected(limited));
  auto& orch = start();

  auto id = orch.submit(provider_id("luma"), text_request("slow down"));
  ASSERT_TRUE(id.has_value());

  auto final = run(*id);
  EXPECT_EQ(final.status, TaskStatus::Succeeded);
  EXPECT_EQ(final.attempt, 2);
  EXPECT_TRUE(has_note(final, "retry scheduled in 30 ms after RateLimited"));
  ASSERT_TRUE(final.last_error.has_value());
  EXPECT_EQ(final.last_error->kind, ErrorKind::RateLimited);
}

TEST_F(OrchestratorTest, LocalRateLimitDefersWithoutConsumingAttempts) {
  auto config = provider_config("luma");
  config.rate_limit = RateLimitConfig{.max_requests = 1, .window = 200ms};
  auto adapter = add_provider(std::move(config));
  auto& orch = start();

  auto first = orch.submit(provider_id("luma"), text_request("one"));
  auto second = orch.submit(provider_id("luma"), text_request("two"));
  ASSERT_TRUE(first.has_value());
  ASSERT_TRUE(second.has_value());

  EXPECT_EQ(run(*first).status, TaskStatus::Succeeded);
  auto final = run(*second);
  EXPECT_EQ(final.status, TaskStatus::Succeeded);
  EXPECT_EQ(final.attempt, 1);
  EXPECT_TRUE(has_note(final, "rate limit for luma reached"));
  EXPECT_EQ(adapter->submit_calls(), 2);
}

TEST_F(OrchestratorTest, OpenCircuitFailsFast) {
  auto config = provider_config("luma");
  config.max_attempts = 1;
  config.breaker = BreakerConfig{.failure_threshold = 2,
                                 .cooldown = 60000ms,
                                 .cooldown_jitter = 0ms};
  auto adapter = add_provider(std::move(config));
  adapter->script_submit(std::unexpected(http_failure(503)))
      .script_submit(std::unexpected(http_failure(503)));
  auto& orch = start();

  for (int i = 0; i < 2; ++i) {
    auto id = orch.submit(provider_id("luma"), text_request("down"));
    ASSERT_TRUE(id.has_value());
    EXPECT_EQ(run(*id).status, TaskStatus::Failed);
  }

  auto health = orch.provider_health(provider_id("luma"));
  ASSERT_TRUE(health.has_value());
  EXPECT_EQ(health->state, BreakerState::Open);
  EXPECT_TRUE(health->opened_at.has_value());

  auto id = orch.submit(provider_id("luma"), text_request("rejected"));
  ASSERT_TRUE(id.has_value());
  auto final = run(*id);
  EXPECT_EQ(final.status, TaskStatus::Failed);
  EXPECT_EQ(final.attempt, 0);
  ASSERT_TRUE(final.last_error.has_value());
  EXPECT_EQ(final.last_error->kind, ErrorKind::ProviderUnavailable);
  EXPECT_NE(final.last_error->message.find("circuit open"), std::string::npos);
  EXPECT_EQ(adapter->submit_calls(), 2);
}

TEST_F(OrchestratorTest, OpenCircuitAfterThresholdMakesNoFurtherCalls) {
  auto config = provider_config("luma");
  config.max_attempts = 1;
  auto adapter = add_provider(std::move(config));
  for (int i = 0; i < 5; ++i) {
    adapter->script_submit(std::unexpected(http_failure(503)));
  }
  auto& orch = start();

  for (int i = 0; i < 5; ++i) {
    auto id = orch.submit(provider_id("luma"), text_request("failing"));
    ASSERT_TRUE(id.has_value());
    auto final = run(*id);
    EXPECT_EQ(final.status, TaskStatus::Failed);
    EXPECT_EQ(final.attempt, 1);
  }
  EXPECT_EQ(orch.provider_health(provider_id("luma"))->state,
            BreakerState::Open);

  auto id = orch.submit(provider_id("luma"), text_request("sixth"));
  ASSERT_TRUE(id.has_value());
  auto final = run(*id);
  EXPECT_EQ(final.status, TaskStatus::Failed);
  EXPECT_EQ(final.attempt, 0);
  ASSERT_TRUE(final.last_error.has_value());
  EXPECT_EQ(final.last_error->kind, ErrorKind::ProviderUnavailable);
  EXPECT_TRUE(has_note(final, "failed fast"));
  EXPECT_EQ(adapter->submit_calls(), 5);
}

TEST_F(OrchestratorTest, HalfOpenProbeClosesCircuit) {
  auto config = provider_config("luma");
  config.max_attempts = 1;
  config.breaker = BreakerConfig{.failure_threshold = 1,
                                 .cooldown = 50ms,
                                 .cooldown_jitter = 0ms};
  auto adapter = add_provider(std::move(config));
  adapter->script_submit(std::unexpected(http_failure(500)));
  auto& orch = start();

  auto failing = orch.submit(provider_id("luma"), text_request("trip"));
  ASSERT_TRUE(failing.has_value());
  EXPECT_EQ(run(*failing).status, TaskStatus::Failed);
  EXPECT_EQ(orch.provider_health(provider_id("luma"))->state,
            BreakerState::Open);

  sleep_ms(80ms);

  auto probe = orch.submit(provider_id("luma"), text_request("probe"));
  ASSERT_TRUE(probe.has_value());
  EXPECT_EQ(run(*probe).status, TaskStatus::Succeeded);

  auto health = orch.provider_health(provider_id("luma"));
  EXPECT_EQ(health->state, BreakerState::Closed);
  EXPECT_EQ(health->consecutive_failures, 0);
}

TEST_F(OrchestratorTest, SecondTaskWaitsWhileRecoveryCallInFlight) {
  auto config = provider_config("luma");
  config.max_attempts = 1;
  config.breaker = BreakerConfig{.failure_threshold = 1,
                                 .cooldown = 50ms,
                                 .cooldown_jitter = 0ms};
  auto adapter = add_provider(std::move(config));
  adapter->script_submit(std::unexpected(http_failure(500)))
      .script_submit(std::nullopt);
  auto& orch = start();

  auto failing = orch.submit(provider_id("luma"), text_request("trip"));
  ASSERT_TRUE(failing.has_value());
  EXPECT_EQ(run(*failing).status, TaskStatus::Failed);

  sleep_ms(80ms);

  auto first = orch.submit(provider_id("luma"), text_request("recovery"));
  ASSERT_TRUE(first.has_value());
  ASSERT_TRUE(wait_until([&] { return adapter->held_submits() == 1; }));
  EXPECT_EQ(orch.provider_health(provider_id("luma"))->state,
            BreakerState::HalfOpen);

  auto second = orch.submit(provider_id("luma"), text_request("behind"));
  ASSERT_TRUE(second.has_value());
  ASSERT_TRUE(wait_until([&] {
    auto status = orch.get_status(*second);
    return status && has_note(*status, "luma is probing recovery");
  }));
  EXPECT_EQ(adapter->submit_calls(), 2);
  auto waiting = orch.get_status(*second);
  ASSERT_TRUE(waiting.has_value());
  EXPECT_FALSE(waiting->terminal());
  EXPECT_EQ(waiting->attempt, 0);

  adapter->release_submits();
  EXPECT_EQ(run(*first).status, TaskStatus::Succeeded);
  auto final = run(*second);
  EXPECT_EQ(final.status, TaskStatus::Succeeded);
  EXPECT_EQ(final.attempt, 1);
  EXPECT_EQ(adapter->submit_calls(), 3);
  EXPECT_EQ(orch.provider_health(provider_id("luma"))->state,
            BreakerState::Closed);
}

TEST_F(OrchestratorTest, CancelledRecoveryCallLeavesCircuitHalfOpen) {
  auto config = provider_config("luma");
  config.max_attempts = 1;
  config.breaker = BreakerConfig{.failure_threshold = 1,
                                 .cooldown = 50ms,
                                 .cooldown_jitter = 0ms};
  auto adapter = add_provider(std::move(config));
  adapter->script_submit(std::unexpected(http_failure(500)));
  adapter->set_pending_by_default(true);
  auto& orch = start();

  auto failing = orch.submit(provider_id("luma"), text_request("trip"));
  ASSERT_TRUE(failing.has_value());
  EXPECT_EQ(run(*failing).status, TaskStatus::Failed);

  sleep_ms(80ms);

  auto id = orch.submit(provider_id("luma"), text_request("recovery"));
  ASSERT_TRUE(id.has_value());
  ASSERT_TRUE(wait_until([&] { return adapter->poll_calls() >= 1; }));
  ASSERT_TRUE(orch.cancel(*id).has_value());
  EXPECT_EQ(run(*id).status, TaskStatus::Cancelled);

  auto health = orch.provider_health(provider_id("luma"));
  ASSERT_TRUE(health.has_value());
  EXPECT_EQ(health->state, BreakerState::HalfOpen);
  EXPECT_EQ(health->consecutive_failures, 1);
}

TEST_F(OrchestratorTest, RejectedTasksDoNotSpendRateLimitTokens) {
  auto config = provider_config("luma");
  config.max_attempts = 1;
  config.rate_limit = RateLimitConfig{.max_requests = 2, .window = 60000ms};
  config.breaker = BreakerConfig{.failure_threshold = 1,
                                 .cooldown = 300ms,
                                 .cooldown_jitter = 0ms};
  auto adapter = add_provider(std::move(config));
  adapter->script_submit(std::unexpected(http_failure(503)));
  auto& orch = start();

  auto failing = orch.submit(provider_id("luma"), text_request("trip"));
  ASSERT_TRUE(failing.has_value());
  EXPECT_EQ(run(*failing).status, TaskStatus::Failed);

  for (int i = 0; i < 3; ++i) {
    auto id = orch.submit(provider_id("luma"), text_request("rejected"));
    ASSERT_TRUE(id.has_value());
    auto final = run(*id);
    EXPECT_EQ(final.status, TaskStatus::Failed);
    EXPECT_FALSE(has_note(final, "rate limit"));
  }

  sleep_ms(350ms);

  // The second token is still there for the recovery call.
  auto id = orch.submit(provider_id("luma"), text_request("recovery"));
  ASSERT_TRUE(id.has_value());
  auto final = run(*id);
  EXPECT_EQ(final.status, TaskStatus::Succeeded);
  EXPECT_FALSE(has_note(final, "rate limit"));
  EXPECT_EQ(adapter->submit_calls(), 2);
}

TEST_F(OrchestratorTest, RoutesToFallbackWhenCircuitOpen) {
  auto primary_config = provider_config("luma");
  primary_config.max_attempts = 1;
  primary_config.fallback = provider_id("runway");
  primary_config.breaker = BreakerConfig{.failure_threshold = 1,
                                         .cooldown = 60000ms,
                                         .cooldown_jitter = 0ms};
  auto primary = add_provider(std::move(primary_config));
  auto backup = add_provider(provider_config("runway"));
  primary->script_submit(std::unexpected(http_failure(503)));
  auto& orch = start();

  auto failing = orch.submit(provider_id("luma"), text_request("trip"));
  ASSERT_TRUE(failing.has_value());
  EXPECT_EQ(run(*failing).status, TaskStatus::Failed);

  auto id = orch.submit(provider_id("luma"), text_request("rerouted"));
  ASSERT_TRUE(id.has_value());
  auto final = run(*id);

  EXPECT_EQ(final.status, TaskStatus::Succeeded);
  EXPECT_EQ(final.provider_id, provider_id("luma"));
  EXPECT_TRUE(has_note(final, "routed to runway"));
  EXPECT_TRUE(has_note(final, "attempt 1 submitted to runway"));
  EXPECT_EQ(primary->submit_calls(), 1);
  EXPECT_EQ(backup->submit_calls(), 1);
}

TEST_F(OrchestratorTest, CancelRunningTaskAsksProvider) {
  auto adapter = add_provider(provider_config("luma"));
  adapter->set_pending_by_default(true);
  auto& orch = start();

  auto id = orch.submit(provider_id("luma"), text_request("long render"));
  ASSERT_TRUE(id.has_value());
  ASSERT_TRUE(wait_until([&] { return adapter->poll_calls() >= 1; }));

  ASSERT_TRUE(orch.cancel(*id).has_value());
  auto final = run(*id);
  EXPECT_EQ(final.status, TaskStatus::Cancelled);
  EXPECT_TRUE(has_note(final, "cancellation requested"));
  EXPECT_TRUE(has_note(final, "cancellation acknowledged by provider"));

  auto cancelled = adapter->cancelled_jobs();
  ASSERT_EQ(cancelled.size(), 1u);
  EXPECT_EQ(cancelled.front(), job_ref("job-1"));

  auto again = orch.cancel(*id);
  ASSERT_FALSE(again.has_value());
  EXPECT_EQ(again.error(), make_error_code(Error::InvalidStateTransition));
}

TEST_F(OrchestratorTest, CancelQueuedTaskNeverReachesProvider) {
  auto adapter = add_provider(provider_config("luma"));
  adapter->script_submit(std::nullopt);
  auto& orch = start(OrchestratorConfig{.max_concurrency = 1,
                                        .cancel_grace = 100ms});

  auto running = orch.submit(provider_id("luma"), text_request("blocking"));
  auto queued = orch.submit(provider_id("luma"), text_request("waiting"));
  ASSERT_TRUE(running.has_value());
  ASSERT_TRUE(queued.has_value());
  ASSERT_TRUE(wait_until([&] { return adapter->held_submits() == 1; }));

  EXPECT_EQ(orch.get_status(*queued)->status, TaskStatus::Queued);
  ASSERT_TRUE(orch.cancel(*queued).has_value());
  auto cancelled = orch.get_status(*queued);
  ASSERT_TRUE(cancelled.has_value());
  EXPECT_EQ(cancelled->status, TaskStatus::Cancelled);
  EXPECT_EQ(cancelled->history.back().note, "cancelled while queued");

  // The provider never answers; the grace period settles the task.
  ASSERT_TRUE(orch.cancel(*running).has_value());
  auto final = run(*running);
  EXPECT_EQ(final.status, TaskStatus::Cancelled);
  EXPECT_TRUE(has_note(final, "grace period"));

  // A late job id is cancelled at the provider instead of being adopted.
  adapter->release_submits();
  ASSERT_TRUE(wait_until([&] { return adapter->cancelled_jobs().size() == 1; }));
  EXPECT_EQ(orch.get_status(*running)->status, TaskStatus::Cancelled);
  EXPECT_EQ(adapter->submit_calls(), 1);
}

TEST_F(OrchestratorTest, CancelFinishedTaskIsRejected) {
  auto config = provider_config("luma");
  config.max_attempts = 1;
  auto adapter = add_provider(std::move(config));
  adapter->script_submit(AdapterResult<JobRef>(job_ref("job-ok")))
      .script_submit(std::unexpected(http_failure(400, "bad prompt")));
  auto& orch = start();

  auto succeeded = orch.submit(provider_id("luma"), text_request("fine"));
  ASSERT_TRUE(succeeded.has_value());
  ASSERT_EQ(run(*succeeded).status, TaskStatus::Succeeded);
  auto failed = orch.submit(provider_id("luma"), text_request("broken"));
  ASSERT_TRUE(failed.has_value());
  ASSERT_EQ(run(*failed).status, TaskStatus::Failed);

  for (const auto& id : {*succeeded, *failed}) {
    auto before = orch.get_status(id);
    ASSERT_TRUE(before.has_value());

    auto result = orch.cancel(id);
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error(), make_error_code(Error::InvalidStateTransition));

    auto after = orch.get_status(id);
    ASSERT_TRUE(after.has_value());
    EXPECT_EQ(after->status, before->status);
    EXPECT_EQ(after->history.size(), before->history.size());
    EXPECT_EQ(after->result.has_value(), before->result.has_value());
  }
  EXPECT_TRUE(adapter->cancelled_jobs().empty());
}

TEST_F(OrchestratorTest, CancelUnknownTask) {
  add_provider(provider_config("luma"));
  auto& orch = start();

  auto result = orch.cancel(TaskId{"task-missing"});
  ASSERT_FALSE(result.has_value());
  EXPECT_EQ(result.error(), make_error_code(Error::NotFound));

  auto status = orch.get_status(TaskId{"task-missing"});
  ASSERT_FALSE(status.has_value());
  EXPECT_EQ(status.error(), make_error_code(Error::NotFound));
}

TEST_F(OrchestratorTest, JobTimeoutFailsAttemptAndCancelsJob) {
  auto config = provider_config("luma");
  config.job_timeout = 60ms;
  config.max_attempts = 1;
  auto adapter = add_provider(std::move(config));
  adapter->set_pending_by_default(true);
  auto& orch = start();

  auto id = orch.submit(provider_id("luma"), text_request("stuck"));
  ASSERT_TRUE(id.has_value());

  auto final = run(*id);
  EXPECT_EQ(final.status, TaskStatus::Failed);
  ASSERT_TRUE(final.last_error.has_value());
  EXPECT_EQ(final.last_error->kind, ErrorKind::Transient);
  EXPECT_NE(final.last_error->message.find("did not finish"), std::string::npos);
  ASSERT_TRUE(wait_until([&] { return !adapter->cancelled_jobs().empty(); }));
  EXPECT_EQ(adapter->cancelled_jobs().front(), job_ref("job-1"));
}

TEST_F(OrchestratorTest, ProgressIsRecordedOncePerChange) {
  auto adapter = add_provider(provider_config("luma"));
  adapter->script_poll(JobPending{.progress_percent = 10})
      .script_poll(JobPending{.progress_percent = 10})
      .script_poll(JobPending{.progress_percent = 60});
  auto& orch = start();

  auto id = orch.submit(provider_id("luma"), text_request("progress"));
  ASSERT_TRUE(id.has_value());

  auto final = run(*id);
  EXPECT_EQ(final.status, TaskStatus::Succeeded);
  EXPECT_EQ(count_notes(final, "progress 10%"), 1);
  EXPECT_EQ(count_notes(final, "progress 60%"), 1);
}

TEST_F(OrchestratorTest, FifoWithinConcurrencyBudget) {
  auto adapter = add_provider(provider_config("luma"));
  adapter->script_submit(std::nullopt);
  auto& orch = start(OrchestratorConfig{.max_concurrency = 1});

  std::vector<TaskId> ids;
  for (int i = 0; i < 4; ++i) {
    auto id = orch.submit(provider_id("luma"),
                          text_request(std::format("p{}", i)));
    ASSERT_TRUE(id.has_value());
    ids.push_back(*id);
  }
  ASSERT_TRUE(wait_until([&] { return adapter->held_submits() == 1; }));
  adapter->release_submits();

  for (const auto& id : ids) {
    EXPECT_EQ(run(id).status, TaskStatus::Succeeded);
  }
  EXPECT_EQ(adapter->prompts(),
            (std::vector<std::string>{"p0", "p1", "p2", "p3"}));
}

TEST_F(OrchestratorTest, ConcurrencyBudgetIsRespected) {
  auto adapter = add_provider(provider_config("luma"));
  for (int i = 0; i < 5; ++i) {
    adapter->script_submit(std::nullopt);
  }
  auto& orch = start(OrchestratorConfig{.max_concurrency = 2});

  for (int i = 0; i < 5; ++i) {
    ASSERT_TRUE(orch.submit(provider_id("luma"), text_request("load")));
  }
  ASSERT_TRUE(wait_until([&] { return adapter->held_submits() == 2; }));
  sleep_ms(50ms);
  EXPECT_EQ(adapter->held_submits(), 2u);

  auto stats = orch.stats();
  EXPECT_EQ(stats.in_flight, 2u);
  EXPECT_EQ(stats.waiting, 3u);
  EXPECT_EQ(stats.capacity, 2u);

  ASSERT_TRUE(wait_until([&] {
    adapter->release_submits();
    return orch.stats().succeeded == 5;
  }));
  EXPECT_TRUE(orch.wait_for_idle(1000ms));
}

TEST_F(OrchestratorTest, PerProviderLimitHoldsBackOnlyThatProvider) {
  auto limited_config = provider_config("luma");
  limited_config.max_concurrency = 1;
  auto limited = add_provider(std::move(limited_config));
  auto other = add_provider(provider_config("runway"));
  limited->script_submit(std::nullopt).script_submit(std::nullopt);
  auto& orch = start(OrchestratorConfig{.max_concurrency = 4});

  ASSERT_TRUE(orch.submit(provider_id("luma"), text_request("a")));
  ASSERT_TRUE(orch.submit(provider_id("luma"), text_request("b")));
  auto free_id = orch.submit(provider_id("runway"), text_request("c"));
  ASSERT_TRUE(free_id.has_value());

  EXPECT_EQ(run(*free_id).status, TaskStatus::Succeeded);
  EXPECT_EQ(limited->held_submits(), 1u);
  EXPECT_EQ(other->submit_calls(), 1);

  ASSERT_TRUE(wait_until([&] {
    limited->release_submits();
    return orch.stats().succeeded == 3;
  }));
}

TEST_F(OrchestratorTest, RejectsUnknownAndDisabledProviders) {
  auto disabled = provider_config("off");
  disabled.enabled = false;
  add_provider(std::move(disabled));
  add_provider(provider_config("luma"));
  auto& orch = start();

  auto unknown = orch.submit(provider_id("nope"), text_request("x"));
  ASSERT_FALSE(unknown.has_value());
  EXPECT_EQ(unknown.error(), make_error_code(Error::UnknownProvider));

  auto empty = orch.submit(ProviderId{}, text_request("x"));
  ASSERT_FALSE(empty.has_value());
  EXPECT_EQ(empty.error(), make_error_code(Error::UnknownProvider));

  auto off = orch.submit(provider_id("off"), text_request("x"));
  ASSERT_FALSE(off.has_value());
  EXPECT_EQ(off.error(), make_error_code(Error::ProviderDisabled));

  EXPECT_TRUE(orch.list_tasks().empty());

  auto health = orch.provider_health(provider_id("nope"));
  ASSERT_FALSE(health.has_value());
  EXPECT_EQ(health.error(), make_error_code(Error::UnknownProvider));
}

TEST_F(OrchestratorTest, CapacityExceededWhenNotQueuing) {
  auto adapter = add_provider(provider_config("luma"));
  adapter->script_submit(std::nullopt);
  auto& orch = start(OrchestratorConfig{.max_concurrency = 1,
                                        .max_queue_depth = 1});

  ASSERT_TRUE(orch.submit(provider_id("luma"), text_request("busy")));
  ASSERT_TRUE(wait_until([&] { return adapter->held_submits() == 1; }));

  auto refused = orch.submit(provider_id("luma"), text_request("now"),
                             SubmitOptions{.queue_if_saturated = false});
  ASSERT_FALSE(refused.has_value());
  EXPECT_EQ(refused.error(), make_error_code(Error::CapacityExceeded));

  ASSERT_TRUE(orch.submit(provider_id("luma"), text_request("queued")));
  auto overflow = orch.submit(provider_id("luma"), text_request("overflow"));
  ASSERT_FALSE(overflow.has_value());
  EXPECT_EQ(overflow.error(), make_error_code(Error::CapacityExceeded));
}

TEST_F(OrchestratorTest, ShutdownCancelsPendingAndRejectsNewWork) {
  auto adapter = add_provider(provider_config("luma"));
  adapter->script_submit(std::nullopt);
  auto& orch = start(OrchestratorConfig{.max_concurrency = 1,
                                        .cancel_grace = 100ms});

  auto running = orch.submit(provider_id("luma"), text_request("running"));
  auto queued = orch.submit(provider_id("luma"), text_request("queued"));
  ASSERT_TRUE(running.has_value());
  ASSERT_TRUE(queued.has_value());
  ASSERT_TRUE(wait_until([&] { return adapter->held_submits() == 1; }));

  orch.shutdown();

  auto rejected = orch.submit(provider_id("luma"), text_request("late"));
  ASSERT_FALSE(rejected.has_value());
  EXPECT_EQ(rejected.error(), make_error_code(Error::ShuttingDown));

  EXPECT_EQ(orch.get_status(*queued)->status, TaskStatus::Cancelled);
  EXPECT_TRUE(orch.wait_for_idle(2000ms));
  EXPECT_EQ(orch.get_status(*running)->status, TaskStatus::Cancelled);
  EXPECT_EQ(adapter->submit_calls(), 1);
}

TEST_F(OrchestratorTest, LateSubscriberReplaysWholeHistory) {
  add_provider(provider_config("luma"));
  auto& orch = start();

  auto id = orch.submit(provider_id("luma"), text_request("replay"));
  ASSERT_TRUE(id.has_value());
  auto final = run(*id);

  auto updates = orch.subscribe(*id);
  ASSERT_TRUE(updates.has_value());
  std::vector<TaskSnapshot> seen;
  for (const auto& snapshot : *updates) {
    seen.push_back(snapshot);
  }
  ASSERT_EQ(seen.size(), final.history.size());
  EXPECT_EQ(seen.front().status, TaskStatus::Queued);
  EXPECT_EQ(seen.back().status, TaskStatus::Succeeded);
  EXPECT_TRUE(updates->done());
}

TEST_F(OrchestratorTest, ObserverSeesTransitionsInOrder) {
  std::mutex mu;
  std::vector<TaskStatus> statuses;
  std::vector<int> attempts;

  add_provider(provider_config("luma"))
      ->script_submit(std::unexpected(http_failure(503)));
  auto& orch = start({}, OrchestratorCallbacks{
                             .on_update = [&](const TaskSnapshot& snapshot) {
                               std::lock_guard lock(mu);
                               statuses.push_back(snapshot.status);
                               attempts.push_back(snapshot.attempt);
                             }});

  auto id = orch.submit(provider_id("luma"), text_request("observe"));
  ASSERT_TRUE(id.has_value());
  auto final = run(*id);

  std::lock_guard lock(mu);
  ASSERT_EQ(statuses.size(), final.history.size());
  EXPECT_EQ(statuses.front(), TaskStatus::Queued);
  EXPECT_EQ(statuses.back(), TaskStatus::Succeeded);
  EXPECT_TRUE(std::ranges::is_sorted(attempts));
  EXPECT_EQ(attempts.back(), 2);
}

TEST_F(OrchestratorTest, PruneKeepsActiveTasks) {
  auto adapter = add_provider(provider_config("luma"));
  adapter->set_pending_by_default(true);
  auto& orch = start(OrchestratorConfig{.retention = std::chrono::minutes(0)});

  auto finished = orch.submit(provider_id("luma"), text_request("x"));
  ASSERT_TRUE(finished.has_value());
  ASSERT_TRUE(wait_until([&] { return adapter->poll_calls() >= 1; }));
  ASSERT_TRUE(orch.cancel(*finished).has_value());
  ASSERT_EQ(run(*finished).status, TaskStatus::Cancelled);

  auto active = orch.submit(provider_id("luma"), text_request("y"));
  ASSERT_TRUE(active.has_value());

  sleep_ms(5ms);
  EXPECT_EQ(orch.prune_expired(), 1u);
  EXPECT_FALSE(orch.get_status(*finished).has_value());
  EXPECT_TRUE(orch.get_status(*active).has_value());
}

TEST_F(OrchestratorTest, ResultAndErrorFollowStatusInEveryUpdate) {
  auto config = provider_config("luma");
  config.max_attempts = 2;
  auto adapter = add_provider(std::move(config));
  adapter->script_submit(std::unexpected(http_failure(503)))
      .script_submit(AdapterResult<JobRef>(job_ref("job-ok")))
      .script_submit(std::unexpected(http_failure(503)))
      .script_submit(std::unexpected(http_failure(503)));
  auto& orch = start();

  auto recovered = orch.submit(provider_id("luma"), text_request("recovers"));
  ASSERT_TRUE(recovered.has_value());
  ASSERT_EQ(run(*recovered).status, TaskStatus::Succeeded);
  auto exhausted = orch.submit(provider_id("luma"), text_request("gives up"));
  ASSERT_TRUE(exhausted.has_value());
  ASSERT_EQ(run(*exhausted).status, TaskStatus::Failed);

  for (const auto& id : {*recovered, *exhausted}) {
    auto updates = orch.subscribe(id);
    ASSERT_TRUE(updates.has_value());
    bool failed_before = false;
    std::size_t seen = 0;
    for (const auto& snapshot : *updates) {
      ++seen;
      EXPECT_EQ(snapshot.result.has_value(),
                snapshot.status == TaskStatus::Succeeded)
          << "update " << seen << " of " << id;
      failed_before = failed_before || has_note(snapshot, "after ");
      if (snapshot.status == TaskStatus::Failed) {
        EXPECT_TRUE(snapshot.last_error.has_value());
      }
      EXPECT_EQ(snapshot.last_error.has_value(),
                failed_before || snapshot.status == TaskStatus::Failed)
          << "update " << seen << " of " << id;
    }
    EXPECT_GT(seen, 3u);
    EXPECT_TRUE(failed_before);
  }
}

TEST_F(OrchestratorTest, ProviderMetricsCountAttemptOutcomes) {
  auto adapter = add_provider(provider_config("luma"));
  adapter->script_submit(std::unexpected(http_failure(503)));
  auto& orch = start();

  auto fresh = orch.provider_metrics(provider_id("luma"));
  ASSERT_TRUE(fresh.has_value());
  EXPECT_EQ(fresh->total_requests, 0u);
  EXPECT_DOUBLE_EQ(fresh->error_rate(), 0.0);
  EXPECT_FALSE(fresh->last_request_at.has_value());

  auto id = orch.submit(provider_id("luma"), text_request("count me"));
  ASSERT_TRUE(id.has_value());
  ASSERT_EQ(run(*id).status, TaskStatus::Succeeded);

  auto metrics = orch.provider_metrics(provider_id("luma"));
  ASSERT_TRUE(metrics.has_value());
  EXPECT_EQ(metrics->total_requests, 2u);
  EXPECT_EQ(metrics->successful_requests, 1u);
  EXPECT_EQ(metrics->failed_requests, 1u);
  EXPECT_DOUBLE_EQ(metrics->error_rate(), 0.5);
  EXPECT_EQ(metrics->current_load, 0u);
  EXPECT_TRUE(metrics->last_request_at.has_value());

  auto missing = orch.provider_metrics(provider_id("nobody"));
  ASSERT_FALSE(missing.has_value());
  EXPECT_EQ(missing.error(), make_error_code(Error::UnknownProvider));
}

TEST_F(OrchestratorTest, CancelledAttemptReleasesProviderLoad) {
  auto adapter = add_provider(provider_config("luma"));
  adapter->set_pending_by_default(true);
  auto& orch = start();

  auto id = orch.submit(provider_id("luma"), text_request("long render"));
  ASSERT_TRUE(id.has_value());
  ASSERT_TRUE(wait_until([&] { return adapter->poll_calls() >= 1; }));
  EXPECT_EQ(orch.provider_metrics(provider_id("luma"))->current_load, 1u);

  ASSERT_TRUE(orch.cancel(*id).has_value());
  ASSERT_EQ(run(*id).status, TaskStatus::Cancelled);
  ASSERT_TRUE(wait_until([&] {
    return orch.provider_metrics(provider_id("luma"))->current_load == 0;
  }));
  auto metrics = orch.provider_metrics(provider_id("luma"));
  EXPECT_EQ(metrics->total_requests, 0u);
}

}  // namespace genflow::test
