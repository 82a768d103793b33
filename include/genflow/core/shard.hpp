#pragma once

#include "genflow/core/io_ring.hpp"
#include "genflow/core/lockfree_queue.hpp"

#include <atomic>
#include <chrono>
#include <coroutine>
#include <deque>
#include <map>
#include <optional>
#include <unordered_set>

namespace genflow {

// One event loop: a thread-affine ready queue, a cross-thread inbox, an
// io_uring for socket I/O and a timer queue for sleeps.
class Shard {
public:
  using Clock = std::chrono::steady_clock;

  explicit Shard(shard_id id);
  ~Shard();

  Shard(const Shard&) = delete;
  Shard& operator=(const Shard&) = delete;

  [[nodiscard]] auto id() const noexcept -> shard_id {
    return id_;
  }
  [[nodiscard]] auto wake_fd() const noexcept -> int {
    return wake_fd_;
  }
  [[nodiscard]] auto ring() noexcept -> IoRing& {
    return ring_;
  }

  auto schedule_local(std::coroutine_handle<> h) -> void;
  auto schedule_remote(std::coroutine_handle<> h) -> bool;
  auto schedule_at(Clock::time_point deadline, std::coroutine_handle<> h)
      -> void;

  auto submit_io(IoRequest req) -> void;
  auto complete_io(io_data* data) -> void;

  auto process_ready() -> bool;
  auto process_timers() -> bool;
  auto process_io() -> void;
  auto drain_pending() -> void;

  [[nodiscard]] auto has_work() const noexcept -> bool;
  [[nodiscard]] auto next_deadline() const -> std::optional<Clock::time_point>;
  [[nodiscard]] auto is_sleeping() const noexcept -> bool;
  auto set_sleeping(bool v) noexcept -> void;

private:
  static auto run(std::coroutine_handle<> h) -> bool;

  shard_id id_;
  int wake_fd_ = -1;
  IoRing ring_;

  std::deque<std::coroutine_handle<>> local_queue_;
  BoundedMPSCQueue<std::coroutine_handle<>> remote_queue_{4096};
  std::multimap<Clock::time_point, std::coroutine_handle<>> timers_;
  std::deque<IoRequest> io_queue_;
  std::unordered_set<io_data*> pending_io_;

  std::atomic<bool> sleeping_{false};
};

}  // namespace genflow
