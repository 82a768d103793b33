#pragma once

#include "genflow/core/error.hpp"
#include "genflow/orchestrator/subscription.hpp"
#include "genflow/orchestrator/task.hpp"

#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace genflow {

// One change to a task record. Every change appends exactly one history
// entry and publishes one snapshot.
struct TaskUpdate {
  std::optional<TaskStatus> status;
  std::string note;
  bool begin_attempt{false};
  std::optional<TaskError> error;
  std::optional<GenerationResult> result;
};

struct TaskCounts {
  std::size_t queued{0};
  std::size_t running{0};
  std::size_t succeeded{0};
  std::size_t failed{0};
  std::size_t cancelled{0};
};

// Authoritative store of task records. Callers get copies only.
//
// Transitions of one task must be serialized by the caller; the observer
// then sees them in order. It runs on the mutating thread after the change
// is visible and must not mutate tasks itself.
class TaskRegistry {
public:
  using Observer = std::function<void(const TaskSnapshot&)>;

  explicit TaskRegistry(Observer observer = {});

  TaskRegistry(const TaskRegistry&) = delete;
  TaskRegistry& operator=(const TaskRegistry&) = delete;

  auto create(TaskId id, ProviderId provider,
              std::shared_ptr<const GenerationRequest> request,
              std::string note) -> TaskSnapshot;

  // NotFound for an unknown id, InvalidStateTransition once terminal,
  // InvalidArgument for a result without Succeeded.
  [[nodiscard]] auto apply(const TaskId& id, TaskUpdate update)
      -> Result<TaskSnapshot>;

  [[nodiscard]] auto get(const TaskId& id) const -> Result<TaskSnapshot>;
  [[nodiscard]] auto subscribe(const TaskId& id) const -> Result<Subscription>;

  // Submission order.
  [[nodiscard]] auto list() const -> std::vector<TaskSnapshot>;
  [[nodiscard]] auto counts() const -> TaskCounts;
  [[nodiscard]] auto size() const -> std::size_t;

  // Drops terminal tasks last updated before cutoff.
  auto prune(TaskClock::time_point cutoff) -> std::size_t;

private:
  struct Entry {
    std::uint64_t seq{0};
    TaskSnapshot state;
    std::shared_ptr<detail::UpdateLog> updates;
  };

  Observer observer_;
  mutable std::mutex mu_;
  std::unordered_map<TaskId, std::shared_ptr<Entry>> tasks_;
  std::uint64_t next_seq_{0};
};

}  // namespace genflow
