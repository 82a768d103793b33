#pragma once

#include "genflow/core/coroutine.hpp"
#include "genflow/core/runtime.hpp"
#include "genflow/provider/generation.hpp"
#include "genflow/resilience/error_classifier.hpp"
#include "genflow/util/id.hpp"

#include <atomic>
#include <chrono>
#include <coroutine>
#include <expected>
#include <format>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <variant>

namespace genflow {

template <typename T>
using AdapterResult = std::expected<T, RawFailure>;

struct JobPending {
  std::optional<int> progress_percent;
  std::string detail;
};

struct JobSucceeded {
  GenerationResult result;
};

struct JobFailed {
  RawFailure failure;
};

using JobStatus = std::variant<JobPending, JobSucceeded, JobFailed>;

using SubmitCallback = std::move_only_function<void(AdapterResult<JobRef>)>;
using PollCallback = std::move_only_function<void(AdapterResult<JobStatus>)>;
using CancelCallback = std::move_only_function<void(AdapterResult<void>)>;

// Capability interface every generation provider implements.
//
// Each operation reports through its callback exactly once, from any thread,
// possibly before the call returns. Implementations copy whatever they need
// from the arguments; references are not valid after the call returns.
class IProviderAdapter {
public:
  virtual ~IProviderAdapter() = default;

  virtual auto submit(const GenerationRequest& request, SubmitCallback done)
      -> void = 0;
  virtual auto poll(const JobRef& job, PollCallback done) -> void = 0;
  virtual auto cancel(const JobRef& job, CancelCallback done) -> void = 0;
};

template <typename T>
class AdapterCallAwaiter;

namespace detail {

// Shared between the adapter callback and the timeout timer; whichever
// settles first wins. If every holder lets go without settling, the waiting
// coroutine can never resume and is destroyed.
template <typename T>
struct PendingCall {
  std::atomic<bool> settled{false};
  AdapterCallAwaiter<T>* target{nullptr};
  std::coroutine_handle<> waiter;
  Runtime* runtime{nullptr};

  PendingCall() = default;
  PendingCall(const PendingCall&) = delete;
  PendingCall& operator=(const PendingCall&) = delete;

  ~PendingCall() {
    if (!settled.load(std::memory_order_acquire) && waiter) {
      waiter.destroy();
    }
  }

  auto settle(AdapterResult<T> result) -> bool;
};

template <typename T>
auto expire_after(std::shared_ptr<PendingCall<T>> call,
                  std::chrono::milliseconds timeout) -> spawn_task {
  co_await async_sleep(timeout);
  call->settle(std::unexpected(RawFailure{
      .timed_out = true,
      .message = std::format("provider call timed out after {}ms",
                             timeout.count())}));
}

}  // namespace detail

// Bridges a callback-style adapter call into a coroutine, bounded by a
// timeout. Completion always resumes through the runtime, never inline.
template <typename T>
class AdapterCallAwaiter {
public:
  using Starter = std::move_only_function<void(
      std::move_only_function<void(AdapterResult<T>)>)>;

  AdapterCallAwaiter(Runtime& runtime, std::chrono::milliseconds timeout,
                     Starter start)
      : runtime_{runtime}, timeout_{timeout}, start_{std::move(start)} {
  }

  AdapterCallAwaiter(const AdapterCallAwaiter&) = delete;
  AdapterCallAwaiter& operator=(const AdapterCallAwaiter&) = delete;

  [[nodiscard]] auto await_ready() const noexcept -> bool {
    return false;
  }

  auto await_suspend(std::coroutine_handle<> handle) -> void {
    auto call = std::make_shared<detail::PendingCall<T>>();
    call->target = this;
    call->waiter = handle;
    call->runtime = &runtime_;

    if (timeout_.count() > 0) {
      runtime_.spawn(detail::expire_after(call, timeout_));
    }

    // Once the callback fires this frame may resume on another shard, so
    // nothing below may touch members.
    auto start = std::move(start_);
    start([call = std::move(call)](AdapterResult<T> result) mutable {
      call->settle(std::move(result));
    });
  }

  [[nodiscard]] auto await_resume() -> AdapterResult<T> {
    return std::move(*result_);
  }

private:
  friend struct detail::PendingCall<T>;

  Runtime& runtime_;
  std::chrono::milliseconds timeout_;
  Starter start_;
  std::optional<AdapterResult<T>> result_;
};

template <typename T>
auto detail::PendingCall<T>::settle(AdapterResult<T> result) -> bool {
  if (settled.exchange(true, std::memory_order_acq_rel)) {
    return false;
  }
  target->result_.emplace(std::move(result));
  runtime->schedule_external(waiter);
  return true;
}

[[nodiscard]] inline auto
submit_job(Runtime& runtime, IProviderAdapter& adapter,
           std::shared_ptr<const GenerationRequest> request,
           std::chrono::milliseconds timeout)
    -> AdapterCallAwaiter<JobRef> {
  return {runtime, timeout,
          [&adapter, request = std::move(request)](SubmitCallback done) {
            adapter.submit(*request, std::move(done));
          }};
}

[[nodiscard]] inline auto poll_job(Runtime& runtime, IProviderAdapter& adapter,
                                   JobRef job,
                                   std::chrono::milliseconds timeout)
    -> AdapterCallAwaiter<JobStatus> {
  return {runtime, timeout,
          [&adapter, job = std::move(job)](PollCallback done) {
            adapter.poll(job, std::move(done));
          }};
}

[[nodiscard]] inline auto cancel_job(Runtime& runtime,
                                     IProviderAdapter& adapter, JobRef job,
                                     std::chrono::milliseconds timeout)
    -> AdapterCallAwaiter<void> {
  return {runtime, timeout,
          [&adapter, job = std::move(job)](CancelCallback done) {
            adapter.cancel(job, std::move(done));
          }};
}

}  // namespace genflow
