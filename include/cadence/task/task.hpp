#pragma once

#include "cadence/core/error.hpp"
#include "cadence/task/action.hpp"
#include "cadence/util/id.hpp"
#include "cadence/util/util.hpp"

#include <nlohmann/json.hpp>

#include <algorithm>
#include <array>
#include <chrono>
#include <cstdint>
#include <optional>
#include <ranges>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace cadence {

enum class TaskType : std::uint8_t {
  OneTime,
  Recurring,
  Trigger,
};

enum class TaskStatus : std::uint8_t {
  Active,
  Paused,
  Completed,
  Failed,
};

enum class ExecutionStatus : std::uint8_t {
  Running,
  Completed,
  Failed,
  Interrupted,
};

namespace detail {

constexpr std::array<std::string_view, 3> kTaskTypeNames = {
    "one-time",
    "recurring",
    "trigger",
};

constexpr std::array<std::string_view, 4> kTaskStatusNames = {
    "active",
    "paused",
    "completed",
    "failed",
};

constexpr std::array<std::string_view, 4> kExecutionStatusNames = {
    "running",
    "completed",
    "failed",
    "interrupted",
};

template <typename E, std::size_t N>
[[nodiscard]] auto parse_name(const std::array<std::string_view, N>& names,
                              std::string_view name) noexcept
    -> std::optional<E> {
  auto it = std::ranges::find(names, name);
  if (it == names.end()) {
    return std::nullopt;
  }
  return static_cast<E>(std::ranges::distance(names.begin(), it));
}

}  // namespace detail

[[nodiscard]] inline auto task_type_name(TaskType type) noexcept
    -> std::string_view {
  return detail::kTaskTypeNames[std::to_underlying(type)];
}

[[nodiscard]] inline auto parse_task_type(std::string_view name) noexcept
    -> std::optional<TaskType> {
  return detail::parse_name<TaskType>(detail::kTaskTypeNames, name);
}

[[nodiscard]] inline auto task_status_name(TaskStatus status) noexcept
    -> std::string_view {
  return detail::kTaskStatusNames[std::to_underlying(status)];
}

[[nodiscard]] inline auto parse_task_status(std::string_view name) noexcept
    -> std::optional<TaskStatus> {
  return detail::parse_name<TaskStatus>(detail::kTaskStatusNames, name);
}

[[nodiscard]] inline auto execution_status_name(ExecutionStatus status) noexcept
    -> std::string_view {
  return detail::kExecutionStatusNames[std::to_underlying(status)];
}

[[nodiscard]] inline auto parse_execution_status(std::string_view name) noexcept
    -> std::optional<ExecutionStatus> {
  return detail::parse_name<ExecutionStatus>(detail::kExecutionStatusNames,
                                             name);
}

struct RetryPolicy {
  int max_retries{0};
  std::int64_t backoff_ms{1000};

  [[nodiscard]] auto operator==(const RetryPolicy&) const -> bool = default;
};

struct ScheduledTask {
  TaskId id;
  std::optional<UserId> user_id;
  std::string name;
  std::string description;
  TaskType type{TaskType::OneTime};

  // Opaque to the engine: {at?, cron?, timezone?}
  nlohmann::json schedule = nlohmann::json::object();
  nlohmann::json trigger;
  TaskAction action;
  nlohmann::json conditions;
  std::optional<RetryPolicy> retry_policy;
  // {onSuccess?, onFailure?, channels[]}
  nlohmann::json notification;

  TaskStatus status{TaskStatus::Active};
  std::optional<TimePoint> last_run;
  std::optional<TimePoint> next_run;
  int run_count{0};
  TimePoint created_at{};
  TimePoint updated_at{};

  [[nodiscard]] auto is_one_time() const noexcept -> bool {
    return type == TaskType::OneTime;
  }
};

struct TaskExecution {
  ExecutionId id;
  TaskId task_id;
  ExecutionStatus status{ExecutionStatus::Running};
  TimePoint started_at{};
  std::optional<TimePoint> completed_at;
  std::optional<std::chrono::milliseconds> duration;
  nlohmann::json result;
  std::string error;
  std::vector<std::string> logs;
};

// Inbound trigger endpoint bound to one trigger task. The secret is shared
// with the caller and checked on every fire.
struct TaskWebhook {
  WebhookId id;
  TaskId task_id;
  std::string secret;
  std::optional<TimePoint> last_triggered;
  std::int64_t trigger_count{0};
  TimePoint created_at{};
};

// Snapshot of task counts by status, plus active tasks due soon.
struct TaskCounts {
  std::int64_t active{0};
  std::int64_t paused{0};
  std::int64_t completed{0};
  std::int64_t failed{0};
  std::int64_t due_soon{0};
};

// JSON views used by the CLI and the task file format.
[[nodiscard]] auto task_to_json(const ScheduledTask& task) -> nlohmann::json;
[[nodiscard]] auto task_from_json(const nlohmann::json& j)
    -> Result<ScheduledTask>;
[[nodiscard]] auto execution_to_json(const TaskExecution& exec)
    -> nlohmann::json;

}  // namespace cadence
