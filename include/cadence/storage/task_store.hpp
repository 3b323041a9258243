#pragma once

#include "cadence/core/error.hpp"
#include "cadence/task/task.hpp"
#include "cadence/util/id.hpp"
#include "cadence/util/util.hpp"

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <vector>

namespace cadence {

struct TaskFilter {
  std::optional<UserId> user_id;
  std::optional<TaskType> type;
  std::optional<TaskStatus> status;
  std::size_t limit{50};
};

// Durable home of tasks and their execution history. Implementations must
// make select_due_tasks and claim_task exclusive across every store instance
// that shares the same backing database.
class ITaskStore {
public:
  virtual ~ITaskStore() = default;

  // Claims up to `limit` active one-time/recurring tasks whose next run is
  // at or before `now`, oldest first. Rows held by another owner's
  // unexpired claim are skipped, never waited on.
  [[nodiscard]] virtual auto select_due_tasks(std::size_t limit,
                                              const WorkerId& owner,
                                              std::chrono::milliseconds lease,
                                              TimePoint now)
      -> Result<std::vector<ScheduledTask>> = 0;

  // Claims a single task regardless of its schedule. Error::AlreadyClaimed
  // if another owner holds an unexpired claim.
  [[nodiscard]] virtual auto claim_task(const TaskId& id,
                                        const WorkerId& owner,
                                        std::chrono::milliseconds lease,
                                        TimePoint now)
      -> Result<ScheduledTask> = 0;
  [[nodiscard]] virtual auto release_claim(const TaskId& id)
      -> Result<void> = 0;
  // Pushes every claim held by `owner` out to now + lease. Returns the
  // number of claims extended.
  [[nodiscard]] virtual auto renew_claims(const WorkerId& owner,
                                          std::chrono::milliseconds lease,
                                          TimePoint now)
      -> Result<std::int64_t> = 0;

  [[nodiscard]] virtual auto mark_failed(const TaskId& id) -> Result<void> = 0;
  [[nodiscard]] virtual auto reschedule_at(const TaskId& id, TimePoint at)
      -> Result<void> = 0;

  // Success bookkeeping: last run, run count, next run and, for completed
  // tasks, the terminal status. Releases the claim.
  [[nodiscard]] virtual auto record_run(const TaskId& id,
                                        TimePoint finished_at,
                                        std::optional<TimePoint> next_run,
                                        bool complete) -> Result<void> = 0;
  // Failure bookkeeping: last run and run count only.
  [[nodiscard]] virtual auto record_attempt(const TaskId& id,
                                            TimePoint finished_at)
      -> Result<void> = 0;

  [[nodiscard]] virtual auto prune_completed(int older_than_days, TimePoint now)
      -> Result<std::int64_t> = 0;
  [[nodiscard]] virtual auto prune_execution_history(int keep_per_task)
      -> Result<std::int64_t> = 0;
  [[nodiscard]] virtual auto get_counts(std::chrono::milliseconds due_within,
                                        TimePoint now) -> Result<TaskCounts> = 0;

  [[nodiscard]] virtual auto insert_task(const ScheduledTask& task)
      -> Result<void> = 0;
  [[nodiscard]] virtual auto update_task(const ScheduledTask& task)
      -> Result<void> = 0;
  [[nodiscard]] virtual auto delete_task(const TaskId& id) -> Result<void> = 0;
  [[nodiscard]] virtual auto get_task(const TaskId& id)
      -> Result<ScheduledTask> = 0;
  [[nodiscard]] virtual auto list_tasks(const TaskFilter& filter)
      -> Result<std::vector<ScheduledTask>> = 0;
  [[nodiscard]] virtual auto list_upcoming(const std::optional<UserId>& user,
                                           std::size_t limit)
      -> Result<std::vector<ScheduledTask>> = 0;
  [[nodiscard]] virtual auto set_status(const TaskId& id, TaskStatus status,
                                        TimePoint now) -> Result<void> = 0;
  [[nodiscard]] virtual auto set_next_run(const TaskId& id,
                                          std::optional<TimePoint> next_run)
      -> Result<void> = 0;

  [[nodiscard]] virtual auto begin_execution(const TaskId& task_id,
                                             TimePoint started_at,
                                             const std::vector<std::string>& logs)
      -> Result<ExecutionId> = 0;
  [[nodiscard]] virtual auto finish_execution(const TaskExecution& exec)
      -> Result<void> = 0;
  [[nodiscard]] virtual auto get_executions(const TaskId& task_id,
                                            std::size_t limit)
      -> Result<std::vector<TaskExecution>> = 0;

  [[nodiscard]] virtual auto insert_webhook(const TaskWebhook& hook)
      -> Result<void> = 0;
  [[nodiscard]] virtual auto get_webhook(const WebhookId& id)
      -> Result<TaskWebhook> = 0;
  [[nodiscard]] virtual auto record_webhook_trigger(const WebhookId& id,
                                                    TimePoint at)
      -> Result<void> = 0;
};

}  // namespace cadence
