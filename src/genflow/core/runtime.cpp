#include "genflow/core/runtime.hpp"

#include "genflow/util/log.hpp"

#include <algorithm>
#include <cerrno>
#include <ranges>

#include <poll.h>
#include <unistd.h>

namespace genflow {

namespace {

constexpr auto kIdleWait = std::chrono::milliseconds(1000);

auto to_timespec(std::chrono::milliseconds d) -> __kernel_timespec {
  auto secs = std::chrono::duration_cast<std::chrono::seconds>(d);
  auto nsecs = std::chrono::duration_cast<std::chrono::nanoseconds>(d - secs);
  return {.tv_sec = secs.count(), .tv_nsec = nsecs.count()};
}

}  // namespace

Runtime::Runtime(unsigned num_shards) {
  if (num_shards == 0) {
    num_shards = std::thread::hardware_concurrency();
    if (num_shards == 0)
      num_shards = 1;
  }
  num_shards_ = num_shards;

  shards_.reserve(num_shards);
  for (auto i : std::views::iota(0u, num_shards)) {
    shards_.emplace_back(std::make_unique<Shard>(i));
  }
}

Runtime::~Runtime() {
  stop();
}

auto Runtime::start() -> void {
  if (running_.exchange(true))
    return;
  stop_requested_.store(false);

  threads_.reserve(num_shards_);
  for (auto i : std::views::iota(0u, num_shards_)) {
    threads_.emplace_back([this, i] { run_shard(i); });
  }
}

auto Runtime::stop() -> void {
  if (!running_.exchange(false))
    return;
  stop_requested_.store(true);

  for (auto i : std::views::iota(0u, num_shards_)) {
    wake_shard(i);
  }

  for (auto& t : threads_) {
    if (t.joinable())
      t.join();
  }
  threads_.clear();

  for (auto& shard : shards_) {
    shard->drain_pending();
  }
}

auto Runtime::is_running() const noexcept -> bool {
  return running_.load(std::memory_order_acquire);
}

auto Runtime::current_shard() const noexcept -> shard_id {
  return detail::current_runtime == this ? detail::current_shard_id
                                         : kInvalidShard;
}

auto Runtime::is_current_shard() const noexcept -> bool {
  return detail::current_shard_id != kInvalidShard &&
         this == detail::current_runtime;
}

auto Runtime::run_shard(shard_id id) -> void {
  detail::current_shard_id = id;
  detail::current_runtime = this;

  auto& shard = *shards_[id];
  shard.ring().setup_wake_poll(shard.wake_fd());

  while (!stop_requested_.load(std::memory_order_acquire)) {
    bool has_work = false;

    has_work |= shard.process_timers();
    has_work |= shard.process_ready();
    shard.process_io();
    has_work |= shard.ring().submit(false) > 0;
    has_work |= process_completions(shard);

    if (!has_work) {
      shard.set_sleeping(true);

      if (shard.has_work()) {
        shard.set_sleeping(false);
        continue;
      }

      wait_for_work(shard);
      shard.set_sleeping(false);
      process_completions(shard);
    }
  }

  detail::current_shard_id = kInvalidShard;
  detail::current_runtime = nullptr;
}

auto Runtime::process_completions(Shard& shard) -> bool {
  unsigned count = shard.ring().process_completions(
      [&](void* raw_data, int res, unsigned flags) {
        if (raw_data == reinterpret_cast<void*>(kWakeEventToken)) {
          std::uint64_t val;
          while (read(shard.wake_fd(), &val, sizeof(val)) > 0) {
          }
          if (!(flags & IORING_CQE_F_MORE)) {
            shard.ring().setup_wake_poll(shard.wake_fd());
          }
          return;
        }

        if (raw_data != nullptr) {
          auto* data = static_cast<io_data*>(raw_data);
          data->result = res;
          data->flags = flags;
          shard.complete_io(data);
        }
      });

  return count > 0;
}

auto Runtime::wait_for_work(Shard& shard) -> void {
  if (shard.has_work())
    return;

  auto wait = kIdleWait;
  if (auto deadline = shard.next_deadline()) {
    auto until = std::chrono::ceil<std::chrono::milliseconds>(
        *deadline - Shard::Clock::now());
    wait = std::clamp(until, std::chrono::milliseconds(0), kIdleWait);
  }
  if (wait.count() == 0)
    return;

  if (shard.ring().valid()) {
    shard.ring().submit(true);
    shard.ring().wait(wait);
    return;
  }

  // Without io_uring the eventfd is polled directly.
  pollfd pfd{.fd = shard.wake_fd(), .events = POLLIN, .revents = 0};
  if (::poll(&pfd, 1, static_cast<int>(wait.count())) > 0) {
    std::uint64_t val;
    while (read(shard.wake_fd(), &val, sizeof(val)) > 0) {
    }
  }
}

auto Runtime::schedule_on(shard_id target, std::coroutine_handle<> handle)
    -> void {
  if (!handle || handle.done())
    return;

  // Shards are gone or going; nothing would ever resume it.
  if (stop_requested_.load(std::memory_order_acquire)) {
    handle.destroy();
    return;
  }

  if (is_current_shard() && target == detail::current_shard_id) {
    shards_[target]->schedule_local(handle);
    return;
  }
  while (!shards_[target]->schedule_remote(handle)) {
    std::this_thread::yield();
  }
  wake_shard(target);
}

auto Runtime::schedule_external(std::coroutine_handle<> handle) -> void {
  auto target = static_cast<shard_id>(
      next_shard_.fetch_add(1, std::memory_order_relaxed) % num_shards_);
  schedule_on(target, handle);
}

auto Runtime::submit_io(IoRequest req) -> bool {
  if (!is_current_shard()) {
    log::error("Cannot submit IO: not in a shard context");
    return false;
  }

  auto& shard = *shards_[detail::current_shard_id];
  if (!shard.ring().valid()) {
    return false;
  }

  shard.submit_io(req);
  return true;
}

auto Runtime::schedule_after(std::chrono::milliseconds delay,
                             std::coroutine_handle<> handle) -> void {
  if (!is_current_shard()) {
    log::error("Cannot arm timer: not in a shard context");
    schedule_external(handle);
    return;
  }
  shards_[detail::current_shard_id]->schedule_at(Shard::Clock::now() + delay,
                                                 handle);
}

auto Runtime::wake_shard(shard_id id) -> void {
  if (id >= num_shards_)
    return;

  int fd = shards_[id]->wake_fd();
  if (fd < 0)
    return;

  std::uint64_t val = 1;
  while (true) {
    auto ret = write(fd, &val, sizeof(val));
    if (ret < 0 && errno == EINTR)
      continue;
    // EAGAIN means the counter is saturated, the shard will wake anyway.
    break;
  }
}

auto io_awaiter_base::submit(std::coroutine_handle<> handle,
                             IoRequest req) noexcept -> bool {
  auto* rt = detail::current_runtime;
  data_.coroutine = handle.address();
  req.data = &data_;
  if (rt == nullptr || !rt->submit_io(req)) {
    data_.coroutine = nullptr;
    data_.result = -EOPNOTSUPP;
    return false;
  }
  return true;
}

auto read_awaiter::await_suspend(std::coroutine_handle<> handle) noexcept
    -> bool {
  return submit(handle,
                {.op = IoOpType::Read, .fd = fd_, .buf = buf_, .len = len_});
}

auto write_awaiter::await_suspend(std::coroutine_handle<> handle) noexcept
    -> bool {
  return submit(handle, {.op = IoOpType::Write,
                         .fd = fd_,
                         .buf = const_cast<void*>(buf_),
                         .len = len_});
}

auto poll_timeout_awaiter::await_suspend(
    std::coroutine_handle<> handle) noexcept -> bool {
  data_.ts = to_timespec(timeout_);
  return submit(handle, {.op = IoOpType::PollTimeout,
                         .fd = fd_,
                         .poll_mask = mask_,
                         .ts_ptr = &data_.ts});
}

auto sleep_awaiter::await_suspend(std::coroutine_handle<> handle) -> void {
  auto* rt = detail::current_runtime;
  if (rt == nullptr) {
    log::error("async_sleep used outside a runtime shard");
    handle.resume();
    return;
  }
  rt->schedule_after(duration_, handle);
}

}  // namespace genflow
