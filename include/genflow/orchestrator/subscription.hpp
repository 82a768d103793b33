#pragma once

#include "genflow/orchestrator/task.hpp"

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <iterator>
#include <memory>
#include <mutex>
#include <optional>
#include <vector>

namespace genflow {

namespace detail {

// Every snapshot ever published for one task, in publication order. Closed
// after the terminal snapshot or when the task is pruned. History entries are
// kept once; each update stores only its own fields and how much history it
// saw, and snapshots are rebuilt on read.
class UpdateLog {
public:
  auto append(const TaskSnapshot& snapshot) -> void;
  auto close() -> void;

  // Blocks until entry `index` exists or the log is closed past it.
  [[nodiscard]] auto wait_at(std::size_t index) -> std::optional<TaskSnapshot>;
  [[nodiscard]] auto wait_at_until(std::size_t index,
                                   std::chrono::steady_clock::time_point deadline)
      -> std::optional<TaskSnapshot>;
  [[nodiscard]] auto try_at(std::size_t index) const
      -> std::optional<TaskSnapshot>;
  [[nodiscard]] auto exhausted_at(std::size_t index) const -> bool;

  [[nodiscard]] auto size() const -> std::size_t;
  // History entries held across all updates.
  [[nodiscard]] auto retained_history() const -> std::size_t;

private:
  struct Revision {
    TaskStatus status;
    int attempt;
    std::optional<TaskError> last_error;
    std::optional<GenerationResult> result;
    TaskClock::time_point updated_at;
    std::size_t history_size;
  };

  auto materialize_locked(std::size_t index) const -> TaskSnapshot;

  mutable std::mutex mu_;
  std::condition_variable cv_;
  TaskSnapshot base_;
  std::vector<HistoryEntry> history_;
  std::vector<Revision> revisions_;
  bool closed_{false};
};

}  // namespace detail

// Finite stream of every status update of one task, from creation to the
// terminal snapshot. Each subscription replays from the beginning, so none
// of them can miss an update. Blocking reads must not be issued from a
// runtime shard thread.
class Subscription {
public:
  explicit Subscription(std::shared_ptr<detail::UpdateLog> log)
      : log_(std::move(log)) {}

  // nullopt once the stream has ended.
  [[nodiscard]] auto next() -> std::optional<TaskSnapshot>;
  // nullopt on timeout as well; done() tells the two apart.
  [[nodiscard]] auto next_for(std::chrono::milliseconds timeout)
      -> std::optional<TaskSnapshot>;
  [[nodiscard]] auto try_next() -> std::optional<TaskSnapshot>;
  [[nodiscard]] auto done() const -> bool;

  class iterator {
  public:
    using iterator_category = std::input_iterator_tag;
    using value_type = TaskSnapshot;
    using difference_type = std::ptrdiff_t;
    using pointer = const TaskSnapshot*;
    using reference = const TaskSnapshot&;

    iterator() = default;
    explicit iterator(Subscription* owner) : owner_(owner) {
      advance();
    }

    auto operator*() const -> reference {
      return *current_;
    }
    auto operator->() const -> pointer {
      return &*current_;
    }
    auto operator++() -> iterator& {
      advance();
      return *this;
    }
    auto operator++(int) -> void {
      advance();
    }

    friend auto operator==(const iterator& it, std::default_sentinel_t)
        -> bool {
      return !it.current_.has_value();
    }

  private:
    auto advance() -> void {
      current_ = owner_ ? owner_->next() : std::nullopt;
    }

    Subscription* owner_{nullptr};
    std::optional<TaskSnapshot> current_;
  };

  [[nodiscard]] auto begin() -> iterator {
    return iterator{this};
  }
  [[nodiscard]] auto end() const noexcept -> std::default_sentinel_t {
    return std::default_sentinel;
  }

private:
  std::shared_ptr<detail::UpdateLog> log_;
  std::size_t cursor_{0};
};

}  // namespace genflow
