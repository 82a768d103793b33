#pragma once

#include "genflow/core/lockfree_queue.hpp"

#include <atomic>
#include <chrono>
#include <cstdint>
#include <format>
#include <optional>
#include <print>
#include <string>
#include <string_view>
#include <thread>
#include <vector>

namespace genflow::log {

enum class Level : std::uint8_t {
  Trace,
  Debug,
  Info,
  Warn,
  Error
};

[[nodiscard]] constexpr auto level_name(Level level) noexcept
    -> std::string_view {
  constexpr std::string_view names[] = {"trace", "debug", "info", "warn",
                                        "error"};
  return names[static_cast<std::uint8_t>(level)];
}

[[nodiscard]] constexpr auto level_color(Level level) noexcept
    -> std::string_view {
  constexpr std::string_view colors[] = {
      "\033[90m",  // trace: gray
      "\033[36m",  // debug: cyan
      "\033[32m",  // info: green
      "\033[33m",  // warn: yellow
      "\033[31m"   // error: red
  };
  return colors[static_cast<std::uint8_t>(level)];
}

[[nodiscard]] constexpr auto parse_level(std::string_view name) noexcept
    -> std::optional<Level> {
  constexpr Level levels[] = {Level::Trace, Level::Debug, Level::Info,
                              Level::Warn, Level::Error};
  for (auto level : levels) {
    if (level_name(level) == name)
      return level;
  }
  return std::nullopt;
}

// Lines are formatted on the calling thread and printed by a single writer
// thread. Before start() and after stop() lines are printed synchronously.
class Logger {
  static constexpr std::size_t kQueueCapacity = 8192;
  static constexpr std::size_t kBatchSize = 64;

  std::atomic<Level> level_{Level::Info};
  std::atomic<bool> running_{false};
  std::atomic<bool> accepting_{false};
  BoundedMPSCQueue<std::string> queue_{kQueueCapacity};
  std::thread writer_;

  auto writer_loop() -> void {
    std::vector<std::string> batch;
    batch.reserve(kBatchSize);

    while (running_.load(std::memory_order_acquire)) {
      batch.clear();
      while (batch.size() < kBatchSize) {
        auto msg = queue_.try_pop();
        if (!msg)
          break;
        batch.push_back(std::move(*msg));
      }

      for (const auto& msg : batch) {
        std::print("{}", msg);
      }
      if (batch.empty()) {
        std::this_thread::sleep_for(std::chrono::microseconds(200));
      }
    }

    while (auto msg = queue_.try_pop()) {
      std::print("{}", *msg);
    }
  }

  template <typename... Args>
  static auto format_line(Level level, std::format_string<Args...> fmt,
                          Args&&... args) -> std::string {
    auto time = std::chrono::floor<std::chrono::seconds>(
        std::chrono::system_clock::now());
    auto tid =
        std::hash<std::thread::id>{}(std::this_thread::get_id()) % 1000000;
    return std::format("[{:%Y-%m-%d %H:%M:%S}] [{}{}\033[0m] [{}] {}\n", time,
                       level_color(level), level_name(level), tid,
                       std::format(fmt, std::forward<Args>(args)...));
  }

public:
  Logger() = default;
  ~Logger() {
    stop();
  }

  Logger(const Logger&) = delete;
  Logger& operator=(const Logger&) = delete;

  auto start() -> void {
    if (running_.exchange(true))
      return;
    accepting_.store(true, std::memory_order_release);
    writer_ = std::thread([this] { writer_loop(); });
  }

  auto stop() -> void {
    accepting_.store(false, std::memory_order_release);
    std::atomic_thread_fence(std::memory_order_seq_cst);

    if (!running_.exchange(false))
      return;

    if (writer_.joinable()) {
      writer_.join();
    }
  }

  auto set_level(Level level) noexcept -> void {
    level_.store(level, std::memory_order_release);
  }

  [[nodiscard]] auto level() const noexcept -> Level {
    return level_.load(std::memory_order_acquire);
  }

  template <typename... Args>
  auto log(Level level, std::format_string<Args...> fmt, Args&&... args)
      -> void {
    if (level < level_.load(std::memory_order_acquire))
      return;

    auto line = format_line(level, fmt, std::forward<Args>(args)...);
    if (!accepting_.load(std::memory_order_acquire)) {
      std::print("{}", line);
      return;
    }
    if (!queue_.push(std::move(line))) {
      std::print("{}", line);
    }
  }
};

inline Logger& logger() {
  static Logger instance;
  return instance;
}

inline auto set_level(Level level) noexcept -> void {
  logger().set_level(level);
}

// Returns false and leaves the level unchanged for an unknown name.
inline auto set_level(std::string_view name) noexcept -> bool {
  auto level = parse_level(name);
  if (!level)
    return false;
  logger().set_level(*level);
  return true;
}

inline auto start() -> void {
  logger().start();
}
inline auto stop() -> void {
  logger().stop();
}

template <typename... Args>
auto trace(std::format_string<Args...> fmt, Args&&... args) -> void {
  logger().log(Level::Trace, fmt, std::forward<Args>(args)...);
}

template <typename... Args>
auto debug(std::format_string<Args...> fmt, Args&&... args) -> void {
  logger().log(Level::Debug, fmt, std::forward<Args>(args)...);
}

template <typename... Args>
auto info(std::format_string<Args...> fmt, Args&&... args) -> void {
  logger().log(Level::Info, fmt, std::forward<Args>(args)...);
}

template <typename... Args>
auto warn(std::format_string<Args...> fmt, Args&&... args) -> void {
  logger().log(Level::Warn, fmt, std::forward<Args>(args)...);
}

template <typename... Args>
auto error(std::format_string<Args...> fmt, Args&&... args) -> void {
  logger().log(Level::Error, fmt, std::forward<Args>(args)...);
}

}  // namespace genflow::log
