#pragma once

#include "genflow/provider/generation.hpp"
#include "genflow/resilience/error_classifier.hpp"
#include "genflow/util/id.hpp"

#include <chrono>
#include <cstdint>
#include <format>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace genflow {

enum class TaskStatus : std::uint8_t {
  Queued,
  Running,
  Succeeded,
  Failed,
  Cancelled,
};

[[nodiscard]] constexpr auto to_string_view(TaskStatus status) noexcept
    -> std::string_view {
  switch (status) {
    case TaskStatus::Queued: return "Queued";
    case TaskStatus::Running: return "Running";
    case TaskStatus::Succeeded: return "Succeeded";
    case TaskStatus::Failed: return "Failed";
    case TaskStatus::Cancelled: return "Cancelled";
  }
  return "Queued";
}

[[nodiscard]] constexpr auto is_terminal(TaskStatus status) noexcept -> bool {
  return status == TaskStatus::Succeeded || status == TaskStatus::Failed ||
         status == TaskStatus::Cancelled;
}

using TaskClock = std::chrono::system_clock;

struct HistoryEntry {
  TaskClock::time_point at;
  TaskStatus status{TaskStatus::Queued};
  std::string note;
};

// Immutable copy of a task record. The request is shared, never copied.
struct TaskSnapshot {
  TaskId id;
  ProviderId provider_id;
  std::shared_ptr<const GenerationRequest> request;
  TaskStatus status{TaskStatus::Queued};
  int attempt{0};
  std::optional<TaskError> last_error;
  std::optional<GenerationResult> result;
  TaskClock::time_point created_at;
  TaskClock::time_point updated_at;
  std::vector<HistoryEntry> history;

  [[nodiscard]] auto terminal() const noexcept -> bool {
    return is_terminal(status);
  }
};

}  // namespace genflow

template <>
struct std::formatter<genflow::TaskStatus> : std::formatter<std::string_view> {
  auto format(genflow::TaskStatus status, auto& ctx) const {
    return std::formatter<std::string_view>::format(
        genflow::to_string_view(status), ctx);
  }
};
