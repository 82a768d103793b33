#include "genflow/orchestrator/subscription.hpp"

namespace genflow {

namespace detail {

auto UpdateLog::append(const TaskSnapshot& snapshot) -> void {
  {
    std::scoped_lock lock(mu_);
    if (closed_)
      return;
    if (revisions_.empty()) {
      base_.id = snapshot.id;
      base_.provider_id = snapshot.provider_id;
      base_.request = snapshot.request;
      base_.created_at = snapshot.created_at;
    }
    for (auto i = history_.size(); i < snapshot.history.size(); ++i) {
      history_.push_back(snapshot.history[i]);
    }
    revisions_.push_back(Revision{.status = snapshot.status,
                                  .attempt = snapshot.attempt,
                                  .last_error = snapshot.last_error,
                                  .result = snapshot.result,
                                  .updated_at = snapshot.updated_at,
                                  .history_size = snapshot.history.size()});
    closed_ = snapshot.terminal();
  }
  cv_.notify_all();
}

auto UpdateLog::close() -> void {
  {
    std::scoped_lock lock(mu_);
    closed_ = true;
  }
  cv_.notify_all();
}

auto UpdateLog::materialize_locked(std::size_t index) const -> TaskSnapshot {
  const auto& revision = revisions_[index];
  auto snapshot = base_;
  snapshot.status = revision.status;
  snapshot.attempt = revision.attempt;
  snapshot.last_error = revision.last_error;
  snapshot.result = revision.result;
  snapshot.updated_at = revision.updated_at;
  snapshot.history.assign(
      history_.begin(),
      history_.begin() + static_cast<std::ptrdiff_t>(revision.history_size));
  return snapshot;
}

auto UpdateLog::wait_at(std::size_t index) -> std::optional<TaskSnapshot> {
  std::unique_lock lock(mu_);
  cv_.wait(lock, [&] { return index < revisions_.size() || closed_; });
  if (index < revisions_.size())
    return materialize_locked(index);
  return std::nullopt;
}

auto UpdateLog::wait_at_until(std::size_t index,
                              std::chrono::steady_clock::time_point deadline)
    -> std::optional<TaskSnapshot> {
  std::unique_lock lock(mu_);
  cv_.wait_until(lock, deadline,
                 [&] { return index < revisions_.size() || closed_; });
  if (index < revisions_.size())
    return materialize_locked(index);
  return std::nullopt;
}

auto UpdateLog::try_at(std::size_t index) const -> std::optional<TaskSnapshot> {
  std::scoped_lock lock(mu_);
  if (index < revisions_.size())
    return materialize_locked(index);
  return std::nullopt;
}

auto UpdateLog::exhausted_at(std::size_t index) const -> bool {
  std::scoped_lock lock(mu_);
  return closed_ && index >= revisions_.size();
}

auto UpdateLog::size() const -> std::size_t {
  std::scoped_lock lock(mu_);
  return revisions_.size();
}

auto UpdateLog::retained_history() const -> std::size_t {
  std::scoped_lock lock(mu_);
  return history_.size();
}

}  // namespace detail

auto Subscription::next() -> std::optional<TaskSnapshot> {
  auto snapshot = log_->wait_at(cursor_);
  if (snapshot)
    ++cursor_;
  return snapshot;
}

auto Subscription::next_for(std::chrono::milliseconds timeout)
    -> std::optional<TaskSnapshot> {
  auto snapshot =
      log_->wait_at_until(cursor_, std::chrono::steady_clock::now() + timeout);
  if (snapshot)
    ++cursor_;
  return snapshot;
}

auto Subscription::try_next() -> std::optional<TaskSnapshot> {
  auto snapshot = log_->try_at(cursor_);
  if (snapshot)
    ++cursor_;
  return snapshot;
}

auto Subscription::done() const -> bool {
  return log_->exhausted_at(cursor_);
}

}  // namespace genflow
