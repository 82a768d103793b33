#include "genflow/orchestrator/task_registry.hpp"

#include "genflow/util/log.hpp"

#include <algorithm>

namespace genflow {

TaskRegistry::TaskRegistry(Observer observer)
    : observer_(std::move(observer)) {}

auto TaskRegistry::create(TaskId id, ProviderId provider,
                          std::shared_ptr<const GenerationRequest> request,
                          std::string note) -> TaskSnapshot {
  auto now = TaskClock::now();
  auto entry = std::make_shared<Entry>();
  entry->updates = std::make_shared<detail::UpdateLog>();
  entry->state = TaskSnapshot{
      .id = id,
      .provider_id = std::move(provider),
      .request = std::move(request),
      .status = TaskStatus::Queued,
      .created_at = now,
      .updated_at = now,
      .history = {HistoryEntry{now, TaskStatus::Queued, std::move(note)}},
  };

  TaskSnapshot snapshot;
  {
    std::scoped_lock lock(mu_);
    entry->seq = next_seq_++;
    snapshot = entry->state;
    entry->updates->append(snapshot);
    tasks_.insert_or_assign(std::move(id), entry);
  }
  if (observer_)
    observer_(snapshot);
  return snapshot;
}

auto TaskRegistry::apply(const TaskId& id, TaskUpdate update)
    -> Result<TaskSnapshot> {
  TaskSnapshot snapshot;
  {
    std::scoped_lock lock(mu_);
    auto it = tasks_.find(id);
    if (it == tasks_.end())
      return fail(Error::NotFound);

    auto& state = it->second->state;
    if (state.terminal())
      return fail(Error::InvalidStateTransition);

    auto next_status = update.status.value_or(state.status);
    if (update.result.has_value() != (next_status == TaskStatus::Succeeded))
      return fail(Error::InvalidArgument);

    auto now = TaskClock::now();
    if (next_status != state.status) {
      log::debug("Task {}: {} -> {}", id, state.status, next_status);
    }
    state.status = next_status;
    if (update.begin_attempt)
      ++state.attempt;
    if (update.error)
      state.last_error = std::move(update.error);
    if (update.result)
      state.result = std::move(update.result);
    state.updated_at = now;
    state.history.push_back(
        HistoryEntry{now, next_status, std::move(update.note)});

    snapshot = state;
    it->second->updates->append(snapshot);
  }
  if (observer_)
    observer_(snapshot);
  return snapshot;
}

auto TaskRegistry::get(const TaskId& id) const -> Result<TaskSnapshot> {
  std::scoped_lock lock(mu_);
  auto it = tasks_.find(id);
  if (it == tasks_.end())
    return fail(Error::NotFound);
  return it->second->state;
}

auto TaskRegistry::subscribe(const TaskId& id) const -> Result<Subscription> {
  std::scoped_lock lock(mu_);
  auto it = tasks_.find(id);
  if (it == tasks_.end())
    return fail(Error::NotFound);
  return Subscription{it->second->updates};
}

auto TaskRegistry::list() const -> std::vector<TaskSnapshot> {
  std::vector<std::shared_ptr<Entry>> entries;
  std::vector<TaskSnapshot> out;
  std::scoped_lock lock(mu_);
  entries.reserve(tasks_.size());
  for (const auto& [_, entry] : tasks_) {
    entries.push_back(entry);
  }
  std::ranges::sort(entries, {}, &Entry::seq);
  out.reserve(entries.size());
  for (const auto& entry : entries) {
    out.push_back(entry->state);
  }
  return out;
}

auto TaskRegistry::counts() const -> TaskCounts {
  TaskCounts counts;
  std::scoped_lock lock(mu_);
  for (const auto& [_, entry] : tasks_) {
    switch (entry->state.status) {
      case TaskStatus::Queued: ++counts.queued; break;
      case TaskStatus::Running: ++counts.running; break;
      case TaskStatus::Succeeded: ++counts.succeeded; break;
      case TaskStatus::Failed: ++counts.failed; break;
      case TaskStatus::Cancelled: ++counts.cancelled; break;
    }
  }
  return counts;
}

auto TaskRegistry::size() const -> std::size_t {
  std::scoped_lock lock(mu_);
  return tasks_.size();
}

auto TaskRegistry::prune(TaskClock::time_point cutoff) -> std::size_t {
  std::scoped_lock lock(mu_);
  return std::erase_if(tasks_, [&](const auto& item) {
    const auto& entry = *item.second;
    if (!entry.state.terminal() || entry.state.updated_at >= cutoff)
      return false;
    entry.updates->close();
    return true;
  });
}

}  // namespace genflow
