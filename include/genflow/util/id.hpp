#pragma once

#include <atomic>
#include <compare>
#include <cstdint>
#include <format>
#include <functional>
#include <ostream>
#include <random>
#include <string>
#include <string_view>

namespace genflow {

struct TaskTag {};
struct ProviderTag {};
struct JobTag {};

// Phantom-typed string id; a TaskId never converts to a ProviderId.
template <typename Tag>
class TypedId {
public:
  explicit TypedId(std::string value) : value_(std::move(value)) {}

  TypedId() = default;

  [[nodiscard]] auto value() const -> std::string_view { return value_; }
  [[nodiscard]] auto str() const -> const std::string& { return value_; }
  [[nodiscard]] auto empty() const -> bool { return value_.empty(); }

  [[nodiscard]] friend auto operator<=>(const TypedId& lhs, const TypedId& rhs) = default;
  [[nodiscard]] friend auto operator==(const TypedId& lhs, const TypedId& rhs) -> bool = default;

private:
  std::string value_;
};

using TaskId = TypedId<TaskTag>;
using ProviderId = TypedId<ProviderTag>;
// Provider-side reference to a submitted generation job.
using JobRef = TypedId<JobTag>;

namespace detail {
inline auto random_suffix() -> std::uint32_t {
  thread_local std::random_device rd;
  thread_local std::mt19937_64 gen(rd());
  thread_local std::uniform_int_distribution<std::uint32_t> dis;
  return dis(gen);
}
}  // namespace detail

// The sequence number keeps ids unique within the process and sortable by
// creation; the suffix keeps them unique across restarts.
inline auto generate_task_id() -> TaskId {
  static std::atomic<std::uint64_t> sequence{0};
  auto seq = sequence.fetch_add(1, std::memory_order_relaxed) + 1;
  return TaskId{std::format("task-{:06d}-{:08x}", seq, detail::random_suffix())};
}

template <typename Tag>
inline auto operator<<(std::ostream& os, const TypedId<Tag>& id) -> std::ostream& {
  return os << id.value();
}

}  // namespace genflow

template <typename Tag>
struct std::hash<genflow::TypedId<Tag>> {
  auto operator()(const genflow::TypedId<Tag>& id) const noexcept
      -> std::size_t {
    return std::hash<std::string_view>{}(id.value());
  }
};

template <typename Tag>
struct std::formatter<genflow::TypedId<Tag>> : std::formatter<std::string_view> {
  auto format(const genflow::TypedId<Tag>& id, auto& ctx) const {
    return std::formatter<std::string_view>::format(id.value(), ctx);
  }
};
