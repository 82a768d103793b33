#include "genflow/orchestrator/task_registry.hpp"
#include "test_utils.hpp"

#include <gtest/gtest.h>

#include <thread>

using namespace genflow;
using namespace genflow::test;
using namespace std::chrono_literals;

namespace {

auto task_id(std::string_view s) -> TaskId {
  return TaskId{std::string{s}};
}

auto request() -> std::shared_ptr<const GenerationRequest> {
  return std::make_shared<const GenerationRequest>(text_request("clouds"));
}

auto succeed(std::string uri) -> TaskUpdate {
  return TaskUpdate{.status = TaskStatus::Succeeded,
                    .note = "succeeded on attempt 1",
                    .result = GenerationResult{.uri = std::move(uri)}};
}

}  // namespace

class TaskRegistryTest : public ::testing::Test {
protected:
  TaskRegistry registry_;
};

TEST_F(TaskRegistryTest, CreateStartsQueuedWithOneHistoryEntry) {
  auto req = request();
  auto snapshot =
      registry_.create(task_id("t1"), provider_id("luma"), req, "submitted to luma");

  EXPECT_EQ(snapshot.status, TaskStatus::Queued);
  EXPECT_EQ(snapshot.attempt, 0);
  EXPECT_EQ(snapshot.request, req);
  ASSERT_EQ(snapshot.history.size(), 1u);
  EXPECT_EQ(snapshot.history[0].note, "submitted to luma");
  EXPECT_EQ(snapshot.created_at, snapshot.updated_at);
}

TEST_F(TaskRegistryTest, ApplyAppendsHistoryAndCountsAttempts) {
  registry_.create(task_id("t1"), provider_id("luma"), request(), "submitted");

  auto running = registry_.apply(
      task_id("t1"), TaskUpdate{.status = TaskStatus::Running,
                                .note = "attempt 1 submitted to luma",
                                .begin_attempt = true});
  ASSERT_TRUE(running.has_value());
  EXPECT_EQ(running->attempt, 1);

  auto noted = registry_.apply(task_id("t1"), TaskUpdate{.note = "progress 40%"});
  ASSERT_TRUE(noted.has_value());
  EXPECT_EQ(noted->status, TaskStatus::Running);
  EXPECT_EQ(noted->history.back().status, TaskStatus::Running);

  auto done = registry_.apply(task_id("t1"), succeed("mem://out"));
  ASSERT_TRUE(done.has_value());
  EXPECT_EQ(done->status, TaskStatus::Succeeded);
  EXPECT_EQ(done->result->uri, "mem://out");
  EXPECT_EQ(done->history.size(), 4u);
  EXPECT_GE(done->updated_at, done->created_at);
}

TEST_F(TaskRegistryTest, ApplyErrors) {
  EXPECT_EQ(registry_.apply(task_id("nope"), TaskUpdate{.note = "x"}).error(),
            make_error_code(Error::NotFound));

  registry_.create(task_id("t1"), provider_id("luma"), request(), "submitted");

  auto result_without_success = TaskUpdate{
      .status = TaskStatus::Running,
      .note = "bogus",
      .result = GenerationResult{.uri = "mem://x"}};
  EXPECT_EQ(registry_.apply(task_id("t1"), result_without_success).error(),
            make_error_code(Error::InvalidArgument));

  EXPECT_EQ(registry_.apply(task_id("t1"),
                            TaskUpdate{.status = TaskStatus::Succeeded,
                                       .note = "no result"})
                .error(),
            make_error_code(Error::InvalidArgument));

  ASSERT_TRUE(registry_.apply(task_id("t1"),
                              TaskUpdate{.status = TaskStatus::Cancelled,
                                         .note = "cancelled while queued"}));
  EXPECT_EQ(registry_.apply(task_id("t1"), succeed("mem://late")).error(),
            make_error_code(Error::InvalidStateTransition));

  auto final_state = registry_.get(task_id("t1"));
  ASSERT_TRUE(final_state.has_value());
  EXPECT_EQ(final_state->status, TaskStatus::Cancelled);
  EXPECT_FALSE(final_state->result.has_value());
  EXPECT_EQ(final_state->history.size(), 2u);
}

TEST_F(TaskRegistryTest, FailureKeepsLastError) {
  registry_.create(task_id("t1"), provider_id("luma"), request(), "submitted");
  auto failed = registry_.apply(
      task_id("t1"),
      TaskUpdate{.status = TaskStatus::Failed,
                 .note = "failed after 1 attempt(s): AuthFailure: HTTP 401",
                 .error = TaskError{.kind = ErrorKind::AuthFailure,
                                    .message = "HTTP 401: bad key"}});
  ASSERT_TRUE(failed.has_value());
  ASSERT_TRUE(failed->last_error.has_value());
  EXPECT_EQ(failed->last_error->kind, ErrorKind::AuthFailure);
}

TEST_F(TaskRegistryTest, ListKeepsSubmissionOrderAndCounts) {
  for (auto name : {"c", "a", "b"}) {
    registry_.create(task_id(name), provider_id("luma"), request(), "submitted");
  }
  ASSERT_TRUE(registry_.apply(task_id("a"), TaskUpdate{.status = TaskStatus::Running,
                                                       .note = "admitted"}));
  ASSERT_TRUE(registry_.apply(task_id("b"), succeed("mem://b")));

  auto all = registry_.list();
  ASSERT_EQ(all.size(), 3u);
  EXPECT_EQ(all[0].id.value(), "c");
  EXPECT_EQ(all[1].id.value(), "a");
  EXPECT_EQ(all[2].id.value(), "b");

  auto counts = registry_.counts();
  EXPECT_EQ(counts.queued, 1u);
  EXPECT_EQ(counts.running, 1u);
  EXPECT_EQ(counts.succeeded, 1u);
  EXPECT_EQ(counts.failed, 0u);
  EXPECT_EQ(registry_.size(), 3u);
}

TEST_F(TaskRegistryTest, PruneDropsOnlyOldTerminalTasks) {
  registry_.create(task_id("done"), provider_id("luma"), request(), "submitted");
  registry_.create(task_id("live"), provider_id("luma"), request(), "submitted");
  ASSERT_TRUE(registry_.apply(task_id("done"), succeed("mem://d")));

  EXPECT_EQ(registry_.prune(TaskClock::now() - 1h), 0u);
  EXPECT_EQ(registry_.prune(TaskClock::now() + 1h), 1u);
  EXPECT_FALSE(registry_.get(task_id("done")).has_value());
  EXPECT_TRUE(registry_.get(task_id("live")).has_value());
}

TEST_F(TaskRegistryTest, PruneEndsOpenSubscriptions) {
  registry_.create(task_id("t1"), provider_id("luma"), request(), "submitted");
  auto updates = registry_.subscribe(task_id("t1"));
  ASSERT_TRUE(updates.has_value());
  ASSERT_TRUE(registry_.apply(task_id("t1"), succeed("mem://x")));
  registry_.prune(TaskClock::now() + 1h);

  int seen = 0;
  for (const auto& snapshot : *updates) {
    (void)snapshot;
    ++seen;
  }
  EXPECT_EQ(seen, 2);
  EXPECT_TRUE(updates->done());
  EXPECT_EQ(registry_.subscribe(task_id("t1")).error(),
            make_error_code(Error::NotFound));
}

TEST_F(TaskRegistryTest, SubscriptionReplaysAndFollows) {
  registry_.create(task_id("t1"), provider_id("luma"), request(), "submitted");
  ASSERT_TRUE(registry_.apply(task_id("t1"), TaskUpdate{.status = TaskStatus::Running,
                                                        .note = "admitted"}));

  auto updates = registry_.subscribe(task_id("t1"));
  ASSERT_TRUE(updates.has_value());
  EXPECT_EQ(updates->try_next()->status, TaskStatus::Queued);
  EXPECT_EQ(updates->try_next()->status, TaskStatus::Running);
  EXPECT_FALSE(updates->try_next().has_value());
  EXPECT_FALSE(updates->done());
  EXPECT_FALSE(updates->next_for(10ms).has_value());

  std::thread finisher([this] {
    std::this_thread::sleep_for(20ms);
    ASSERT_TRUE(registry_.apply(task_id("t1"), succeed("mem://y")));
  });
  auto last = updates->next();
  finisher.join();

  ASSERT_TRUE(last.has_value());
  EXPECT_EQ(last->status, TaskStatus::Succeeded);
  EXPECT_FALSE(updates->next().has_value());
  EXPECT_TRUE(updates->done());
}

TEST(TaskRegistryObserverTest, ObserverSeesEveryChange) {
  std::vector<std::string> notes;
  TaskRegistry registry([&](const TaskSnapshot& snapshot) {
    notes.push_back(snapshot.history.back().note);
  });
  registry.create(task_id("t1"), provider_id("luma"), request(), "submitted");
  ASSERT_TRUE(registry.apply(task_id("t1"), TaskUpdate{.note = "admitted"}));
  ASSERT_FALSE(registry.apply(task_id("zzz"), TaskUpdate{.note = "lost"}));

  ASSERT_EQ(notes.size(), 2u);
  EXPECT_EQ(notes[0], "submitted");
  EXPECT_EQ(notes[1], "admitted");
}

TEST(UpdateLogTest, KeepsEachHistoryEntryOnceAndReplaysEveryUpdate) {
  constexpr int kNotes = 2000;
  auto log = std::make_shared<detail::UpdateLog>();
  TaskRegistry registry([&](const TaskSnapshot& snapshot) { log->append(snapshot); });

  registry.create(task_id("t1"), provider_id("luma"), request(), "submitted");
  ASSERT_TRUE(registry.apply(task_id("t1"), TaskUpdate{.status = TaskStatus::Running,
                                                       .note = "attempt 1",
                                                       .begin_attempt = true}));
  for (int i = 0; i < kNotes; ++i) {
    ASSERT_TRUE(registry.apply(task_id("t1"),
                               TaskUpdate{.note = std::format("progress {}", i)}));
  }
  ASSERT_TRUE(registry.apply(task_id("t1"), succeed("mem://long")));

  EXPECT_EQ(log->size(), static_cast<std::size_t>(kNotes + 3));
  EXPECT_EQ(log->retained_history(), static_cast<std::size_t>(kNotes + 3));

  Subscription updates{log};
  std::size_t seen = 0;
  for (const auto& snapshot : updates) {
    ++seen;
    ASSERT_EQ(snapshot.history.size(), seen);
    EXPECT_EQ(snapshot.id, task_id("t1"));
    EXPECT_EQ(snapshot.history.back().status, snapshot.status);
    EXPECT_EQ(snapshot.attempt, seen == 1 ? 0 : 1);
    EXPECT_EQ(snapshot.result.has_value(),
              snapshot.status == TaskStatus::Succeeded);
  }
  EXPECT_EQ(seen, static_cast<std::size_t>(kNotes + 3));
  EXPECT_TRUE(updates.done());

  auto middle = log->try_at(500);
  ASSERT_TRUE(middle.has_value());
  EXPECT_EQ(middle->history.back().note, "progress 498");
  EXPECT_EQ(middle->status, TaskStatus::Running);
}
