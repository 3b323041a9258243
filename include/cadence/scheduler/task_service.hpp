#pragma once

#include "cadence/core/error.hpp"
#include "cadence/scheduler/schedule_resolver.hpp"
#include "cadence/storage/task_store.hpp"
#include "cadence/task/task.hpp"

#include <nlohmann/json.hpp>

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

namespace cadence {

// Task management on top of the store: validation, next-run bookkeeping and
// status changes. Execution itself belongs to the Worker.
class TaskService {
public:
  TaskService(ITaskStore& store, const IScheduleResolver& resolver);

  // Assigns an id when the draft has none, resets the run state and computes
  // the first due instant.
  [[nodiscard]] auto create(ScheduledTask draft) -> Result<ScheduledTask>;

  // Applies a JSON merge patch over the editable fields (name, description,
  // type, schedule, trigger, action, conditions, retryPolicy, notification).
  // The next run is recomputed when type or schedule change.
  [[nodiscard]] auto update(const TaskId& id, const nlohmann::json& patch)
      -> Result<ScheduledTask>;

  [[nodiscard]] auto pause(const TaskId& id) -> Result<void>;
  [[nodiscard]] auto resume(const TaskId& id) -> Result<ScheduledTask>;
  [[nodiscard]] auto remove(const TaskId& id) -> Result<void>;

  [[nodiscard]] auto get(const TaskId& id) -> Result<ScheduledTask>;
  [[nodiscard]] auto list(const TaskFilter& filter)
      -> Result<std::vector<ScheduledTask>>;
  [[nodiscard]] auto upcoming(const std::optional<UserId>& user,
                              std::size_t limit = 10)
      -> Result<std::vector<ScheduledTask>>;
  [[nodiscard]] auto executions(const TaskId& id, std::size_t limit = 50)
      -> Result<std::vector<TaskExecution>>;

  // Binds a new webhook with a random secret to a trigger task.
  [[nodiscard]] auto create_webhook(const TaskId& id) -> Result<TaskWebhook>;

  // InvalidArgument when the task's type is missing what it needs to run.
  [[nodiscard]] static auto validate(const ScheduledTask& task) -> Result<void>;

private:
  ITaskStore* store_;
  const IScheduleResolver* resolver_;
};

// Request path a caller fires the webhook on, secret included.
[[nodiscard]] auto webhook_path(const TaskWebhook& hook) -> std::string;

}  // namespace cadence
