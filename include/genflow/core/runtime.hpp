#pragma once

#include "genflow/core/coroutine.hpp"
#include "genflow/core/io_ring.hpp"
#include "genflow/core/shard.hpp"

#include <atomic>
#include <chrono>
#include <coroutine>
#include <expected>
#include <memory>
#include <system_error>
#include <thread>
#include <vector>

namespace genflow {

class Runtime {
public:
  explicit Runtime(unsigned num_shards = 0);
  ~Runtime();

  Runtime(const Runtime&) = delete;
  Runtime& operator=(const Runtime&) = delete;

  auto start() -> void;
  auto stop() -> void;
  [[nodiscard]] auto is_running() const noexcept -> bool;

  auto schedule_on(shard_id target, std::coroutine_handle<> handle) -> void;
  // Safe from any thread, including threads the runtime does not own.
  auto schedule_external(std::coroutine_handle<> handle) -> void;
  // Dropped (and destroyed unstarted) once the runtime is stopped.
  auto spawn(spawn_task t) -> void {
    if (!is_running())
      return;
    schedule_external(t.take());
  }

  // Shard-context only.
  auto submit_io(IoRequest req) -> bool;
  auto schedule_after(std::chrono::milliseconds delay,
                      std::coroutine_handle<> handle) -> void;

  [[nodiscard]] auto shard_count() const noexcept -> unsigned {
    return num_shards_;
  }

  [[nodiscard]] auto current_shard() const noexcept -> shard_id;
  [[nodiscard]] auto is_current_shard() const noexcept -> bool;

private:
  auto run_shard(shard_id id) -> void;
  auto process_completions(Shard& shard) -> bool;
  auto wait_for_work(Shard& shard) -> void;
  auto wake_shard(shard_id id) -> void;

  unsigned num_shards_;
  std::vector<std::unique_ptr<Shard>> shards_;
  std::vector<std::thread> threads_;
  std::atomic<std::size_t> next_shard_{0};

  std::atomic<bool> running_{false};
  std::atomic<bool> stop_requested_{false};
};

namespace detail {
inline thread_local shard_id current_shard_id = kInvalidShard;
inline thread_local Runtime* current_runtime = nullptr;
}  // namespace detail

struct PollResult {
  bool ready = false;
  bool timed_out = false;
  std::errc error{};

  [[nodiscard]] explicit operator bool() const noexcept {
    return ready;
  }
};

[[nodiscard]] inline auto decode_result(std::int32_t result) noexcept
    -> std::expected<std::uint32_t, std::errc> {
  if (result < 0)
    return std::unexpected{static_cast<std::errc>(-result)};
  return static_cast<std::uint32_t>(result);
}

// Base for awaiters that park on an io_uring completion. The io_data lives
// inside the awaiter, which lives in the suspended coroutine frame.
class io_awaiter_base {
public:
  io_awaiter_base() noexcept = default;
  io_awaiter_base(const io_awaiter_base&) = delete;
  io_awaiter_base& operator=(const io_awaiter_base&) = delete;

  [[nodiscard]] auto await_ready() const noexcept -> bool {
    return false;
  }

protected:
  auto submit(std::coroutine_handle<> handle, IoRequest req) noexcept -> bool;

  io_data data_{};
};

class read_awaiter : public io_awaiter_base {
public:
  read_awaiter(int fd, void* buf, std::uint32_t len) noexcept
      : fd_{fd}, buf_{buf}, len_{len} {
  }

  auto await_suspend(std::coroutine_handle<> handle) noexcept -> bool;
  [[nodiscard]] auto await_resume() const noexcept
      -> std::expected<std::uint32_t, std::errc> {
    return decode_result(data_.result);
  }

private:
  int fd_;
  void* buf_;
  std::uint32_t len_;
};

class write_awaiter : public io_awaiter_base {
public:
  write_awaiter(int fd, const void* buf, std::uint32_t len) noexcept
      : fd_{fd}, buf_{buf}, len_{len} {
  }

  auto await_suspend(std::coroutine_handle<> handle) noexcept -> bool;
  [[nodiscard]] auto await_resume() const noexcept
      -> std::expected<std::uint32_t, std::errc> {
    return decode_result(data_.result);
  }

private:
  int fd_;
  const void* buf_;
  std::uint32_t len_;
};

class poll_timeout_awaiter : public io_awaiter_base {
public:
  poll_timeout_awaiter(int fd, std::uint32_t mask,
                       std::chrono::milliseconds timeout) noexcept
      : fd_{fd}, mask_{mask}, timeout_{timeout} {
  }

  auto await_suspend(std::coroutine_handle<> handle) noexcept -> bool;
  [[nodiscard]] auto await_resume() const noexcept -> PollResult {
    if (data_.result > 0)
      return {.ready = true};
    if (data_.result == -ECANCELED || data_.result == -ETIME)
      return {.timed_out = true};
    if (data_.result < 0)
      return {.error = static_cast<std::errc>(-data_.result)};
    return {.timed_out = true};
  }

private:
  int fd_;
  std::uint32_t mask_;
  std::chrono::milliseconds timeout_;
};

class sleep_awaiter {
public:
  explicit sleep_awaiter(std::chrono::milliseconds duration) noexcept
      : duration_{duration} {
  }

  [[nodiscard]] auto await_ready() const noexcept -> bool {
    return duration_.count() <= 0;
  }
  auto await_suspend(std::coroutine_handle<> handle) -> void;
  auto await_resume() const noexcept -> void {
  }

private:
  std::chrono::milliseconds duration_;
};

[[nodiscard]] inline auto async_read(int fd, void* buf,
                                     std::uint32_t len) noexcept
    -> read_awaiter {
  return read_awaiter{fd, buf, len};
}

[[nodiscard]] inline auto async_write(int fd, const void* buf,
                                      std::uint32_t len) noexcept
    -> write_awaiter {
  return write_awaiter{fd, buf, len};
}

[[nodiscard]] inline auto
async_poll_timeout(int fd, std::uint32_t mask,
                   std::chrono::milliseconds timeout) noexcept
    -> poll_timeout_awaiter {
  return poll_timeout_awaiter{fd, mask, timeout};
}

[[nodiscard]] inline auto
async_sleep(std::chrono::milliseconds duration) noexcept -> sleep_awaiter {
  return sleep_awaiter{duration};
}

}  // namespace genflow
