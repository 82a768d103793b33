#pragma once

#include <concepts>
#include <coroutine>
#include <exception>
#include <memory>
#include <new>
#include <type_traits>
#include <utility>

namespace genflow {

template <typename T>
class task;

// Storage for a value produced after the coroutine frame is allocated.
template <typename T>
class deferred_init {
public:
  deferred_init() noexcept = default;
  ~deferred_init() noexcept(std::is_nothrow_destructible_v<T>) {
    if (initialized_) {
      std::destroy_at(std::launder(reinterpret_cast<T*>(&storage_)));
    }
  }

  deferred_init(const deferred_init&) = delete;
  deferred_init& operator=(const deferred_init&) = delete;

  template <typename... Args>
    requires std::is_constructible_v<T, Args...>
  auto emplace(Args&&... args) -> void {
    std::construct_at(reinterpret_cast<T*>(&storage_),
                      std::forward<Args>(args)...);
    initialized_ = true;
  }

  [[nodiscard]] auto get() && noexcept -> T&& {
    return std::move(*std::launder(reinterpret_cast<T*>(&storage_)));
  }

private:
  alignas(T) std::byte storage_[sizeof(T)];
  bool initialized_ = false;
};

class promise_base {
public:
  promise_base() noexcept = default;

  // A child frame destroyed before it finished (runtime shutdown) takes the
  // coroutine waiting on it down too, so no parent frame is left dangling.
  ~promise_base() {
    if (!finished_ && continuation_) {
      std::exchange(continuation_, nullptr).destroy();
    }
  }

  promise_base(const promise_base&) = delete;
  promise_base& operator=(const promise_base&) = delete;

  [[nodiscard]] auto initial_suspend() const noexcept -> std::suspend_always {
    return {};
  }

  [[noreturn]] auto unhandled_exception() const noexcept -> void {
    std::terminate();
  }

  [[nodiscard]] auto continuation() const noexcept -> std::coroutine_handle<> {
    return continuation_;
  }

  auto set_continuation(std::coroutine_handle<> c) noexcept -> void {
    continuation_ = c;
  }

  auto mark_finished() noexcept -> void {
    finished_ = true;
  }

private:
  std::coroutine_handle<> continuation_;
  bool finished_ = false;
};

class final_awaiter {
public:
  [[nodiscard]] auto await_ready() const noexcept -> bool {
    return false;
  }

  template <typename Promise>
  auto await_suspend(std::coroutine_handle<Promise> h) const noexcept
      -> std::coroutine_handle<> {
    auto& promise = h.promise();
    promise.mark_finished();
    if (auto continuation = promise.continuation()) {
      return continuation;
    }
    // Nobody awaits a spawned frame; it frees itself.
    h.destroy();
    return std::noop_coroutine();
  }

  auto await_resume() const noexcept -> void {
  }
};

template <typename T>
class task_promise : public promise_base {
public:
  [[nodiscard]] auto get_return_object() noexcept -> task<T>;
  [[nodiscard]] auto final_suspend() const noexcept -> final_awaiter {
    return {};
  }

  template <typename U>
    requires std::convertible_to<U&&, T>
  auto return_value(U&& value) -> void {
    result_.emplace(std::forward<U>(value));
  }

  [[nodiscard]] auto take_result() noexcept -> T {
    return std::move(result_).get();
  }

private:
  deferred_init<T> result_;
};

template <>
class task_promise<void> : public promise_base {
public:
  [[nodiscard]] auto get_return_object() noexcept -> task<void>;
  [[nodiscard]] auto final_suspend() const noexcept -> final_awaiter {
    return {};
  }

  auto return_void() const noexcept -> void {
  }
};

// Lazily started coroutine. A top-level task is handed to the runtime with
// take(); a nested one is co_awaited and destroyed by its awaiter.
template <typename T = void>
class [[nodiscard]] task {
public:
  using promise_type = task_promise<T>;
  using handle_type = std::coroutine_handle<promise_type>;

  task() noexcept = default;
  explicit task(handle_type h) noexcept : handle_(h) {
  }

  task(task&& other) noexcept : handle_(std::exchange(other.handle_, nullptr)) {
  }

  task& operator=(task&& other) noexcept {
    if (this != &other) {
      destroy();
      handle_ = std::exchange(other.handle_, nullptr);
    }
    return *this;
  }

  task(const task&) = delete;
  task& operator=(const task&) = delete;

  ~task() {
    destroy();
  }

  [[nodiscard]] auto done() const noexcept -> bool {
    return !handle_ || handle_.done();
  }

  [[nodiscard]] auto take() noexcept -> std::coroutine_handle<> {
    return std::exchange(handle_, nullptr);
  }

  class awaiter {
  public:
    explicit awaiter(handle_type h) noexcept : handle_(h) {
    }

    [[nodiscard]] auto await_ready() const noexcept -> bool {
      return !handle_ || handle_.done();
    }

    auto await_suspend(std::coroutine_handle<> continuation) noexcept
        -> std::coroutine_handle<> {
      handle_.promise().set_continuation(continuation);
      return handle_;
    }

    auto await_resume() -> T {
      auto h = std::exchange(handle_, nullptr);
      if constexpr (std::same_as<T, void>) {
        h.destroy();
      } else {
        T value = h.promise().take_result();
        h.destroy();
        return value;
      }
    }

  private:
    handle_type handle_;
  };

  [[nodiscard]] auto operator co_await() noexcept -> awaiter {
    return awaiter{std::exchange(handle_, nullptr)};
  }

private:
  auto destroy() noexcept -> void {
    if (handle_) {
      handle_.destroy();
      handle_ = nullptr;
    }
  }

  handle_type handle_;
};

template <typename T>
auto task_promise<T>::get_return_object() noexcept -> task<T> {
  return task<T>{std::coroutine_handle<task_promise<T>>::from_promise(*this)};
}

inline auto task_promise<void>::get_return_object() noexcept -> task<void> {
  return task<void>{
      std::coroutine_handle<task_promise<void>>::from_promise(*this)};
}

using spawn_task = task<void>;

}  // namespace genflow
