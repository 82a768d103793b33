#include "genflow/core/shard.hpp"

#include "genflow/util/log.hpp"

#include <sys/eventfd.h>

#include <unistd.h>

namespace genflow {

Shard::Shard(shard_id id) : id_(id) {
  wake_fd_ = eventfd(0, EFD_NONBLOCK);
  if (wake_fd_ < 0) {
    log::error("Failed to create eventfd for shard {}", id);
  }
}

Shard::~Shard() {
  if (wake_fd_ >= 0) {
    close(wake_fd_);
  }
}

// Finished frames are freed by their own final awaiter (or by the parent
// awaiting them), so the handle must not be touched after resume().
auto Shard::run(std::coroutine_handle<> h) -> bool {
  if (!h || h.done())
    return false;
  h.resume();
  return true;
}

auto Shard::schedule_local(std::coroutine_handle<> h) -> void {
  if (h && !h.done()) {
    local_queue_.push_back(h);
  }
}

auto Shard::schedule_remote(std::coroutine_handle<> h) -> bool {
  return remote_queue_.push(h);
}

auto Shard::schedule_at(Clock::time_point deadline, std::coroutine_handle<> h)
    -> void {
  timers_.emplace(deadline, h);
}

auto Shard::submit_io(IoRequest req) -> void {
  if (req.data) {
    pending_io_.insert(req.data);
  }
  io_queue_.push_back(req);
}

auto Shard::complete_io(io_data* data) -> void {
  pending_io_.erase(data);
  if (data->coroutine != nullptr) {
    local_queue_.push_back(std::coroutine_handle<>::from_address(
        std::exchange(data->coroutine, nullptr)));
  }
}

auto Shard::process_ready() -> bool {
  bool did_work = false;

  std::deque<std::coroutine_handle<>> batch;
  batch.swap(local_queue_);
  for (auto h : batch) {
    did_work |= run(h);
  }

  while (auto h = remote_queue_.try_pop()) {
    did_work |= run(*h);
  }

  return did_work;
}

auto Shard::process_timers() -> bool {
  auto now = Clock::now();
  bool fired = false;
  while (!timers_.empty() && timers_.begin()->first <= now) {
    auto h = timers_.begin()->second;
    timers_.erase(timers_.begin());
    local_queue_.push_back(h);
    fired = true;
  }
  return fired;
}

auto Shard::process_io() -> void {
  while (!io_queue_.empty()) {
    auto req = io_queue_.front();
    io_queue_.pop_front();

    if (!ring_.prepare(req)) {
      io_queue_.push_front(req);
      return;
    }
  }
}

auto Shard::has_work() const noexcept -> bool {
  return !local_queue_.empty() || !remote_queue_.empty() ||
         !io_queue_.empty();
}

auto Shard::next_deadline() const -> std::optional<Clock::time_point> {
  if (timers_.empty())
    return std::nullopt;
  return timers_.begin()->first;
}

auto Shard::is_sleeping() const noexcept -> bool {
  return sleeping_.load(std::memory_order_acquire);
}

auto Shard::set_sleeping(bool v) noexcept -> void {
  sleeping_.store(v, std::memory_order_release);
}

auto Shard::drain_pending() -> void {
  // Only suspended leaf frames live here; destroying one unwinds the chain of
  // coroutines awaiting it.
  auto destroy = [](std::coroutine_handle<> h) {
    if (h) {
      h.destroy();
    }
  };

  for (auto h : local_queue_) {
    destroy(h);
  }
  local_queue_.clear();

  while (auto h = remote_queue_.try_pop()) {
    destroy(*h);
  }

  for (auto& [_, h] : timers_) {
    destroy(h);
  }
  timers_.clear();

  io_queue_.clear();
  for (auto* data : pending_io_) {
    if (data->coroutine) {
      destroy(std::coroutine_handle<>::from_address(
          std::exchange(data->coroutine, nullptr)));
    }
  }
  pending_io_.clear();
}

}  // namespace genflow
