#include "cadence/scheduler/task_runner.hpp"

#include "cadence/util/log.hpp"
#include "cadence/util/util.hpp"

#include <format>

namespace cadence {

namespace {

using json = nlohmann::json;

auto has_conditions(const json& conditions) -> bool {
  if (conditions.is_array() || conditions.is_object()) {
    return !conditions.empty();
  }
  return !conditions.is_null();
}

// onSuccess / onFailure may be a flag or a delivery config.
auto wants(const json& notification, const char* key) -> bool {
  if (!notification.is_object()) {
    return false;
  }
  auto it = notification.find(key);
  if (it == notification.end() || it->is_null()) {
    return false;
  }
  return it->is_boolean() ? it->get<bool>() : true;
}

auto elapsed_since(TimePoint start, TimePoint end) -> std::chrono::milliseconds {
  return std::chrono::duration_cast<std::chrono::milliseconds>(end - start);
}

constexpr std::size_t kPayloadLogLimit = 500;

}  // namespace

auto LogNotificationSink::notify(const ScheduledTask& task,
                                 NotificationKind kind, const json& payload)
    -> void {
  json channels = task.notification.is_object()
                      ? task.notification.value("channels", json::array())
                      : json::array();
  log::info("Sending notification: task={} type={} channels={} payload={}",
            task.id, notification_kind_name(kind), channels.dump(),
            std::string(truncate(payload.dump(), 200)));
}

TaskRunner::TaskRunner(ITaskStore& store, const ActionExecutor& executor,
                       const IScheduleResolver& resolver,
                       std::shared_ptr<IConditionEvaluator> conditions,
                       std::shared_ptr<INotificationSink> notifications)
    : store_(&store), executor_(&executor), resolver_(&resolver),
      conditions_(conditions ? std::move(conditions)
                             : std::make_shared<PassConditionEvaluator>()),
      notifications_(notifications ? std::move(notifications)
                                   : std::make_shared<LogNotificationSink>()) {
}

auto TaskRunner::run(const ScheduledTask& task, const ExecutionContext& ctx,
                     const json& trigger_payload) const
    -> Outcome<TaskExecution> {
  if (ctx.cancelled()) {
    return failure(Error::Cancelled, "Execution cancelled");
  }

  TaskExecution exec;
  exec.task_id = task.id;
  exec.started_at = Clock::now();

  ExecutionLog exec_log;
  exec_log.append(std::format("Starting task execution: {}", task.name));
  if (!trigger_payload.is_null()) {
    exec_log.append(std::format(
        "Trigger payload: {}",
        truncate(trigger_payload.dump(), kPayloadLogLimit)));
  }

  auto exec_id =
      store_->begin_execution(task.id, exec.started_at, exec_log.lines());
  if (!exec_id) {
    ExecutionError error{exec_id.error(),
                         std::format("Failed to record execution start: {}",
                                     exec_id.error().message())};
    if (auto r = store_->record_attempt(task.id, Clock::now()); !r) {
      log::warn("Failed to record attempt for task {}: {}", task.id,
                r.error().message());
    }
    return std::unexpected{std::move(error)};
  }
  exec.id = std::move(*exec_id);

  auto proceed = conditions_hold(task, ctx);
  if (!proceed) {
    record_failure(task, exec, exec_log, proceed.error());
    return std::unexpected{std::move(proceed.error())};
  }

  if (!*proceed) {
    exec_log.append("Conditions not met, skipping execution");
    auto now = Clock::now();
    exec.status = ExecutionStatus::Completed;
    exec.completed_at = now;
    exec.duration = elapsed_since(exec.started_at, now);
    exec.logs = exec_log.lines();
    if (auto r = store_->finish_execution(exec); !r) {
      return store_failure(r.error(), "Failed to record skipped execution");
    }
    if (auto r = store_->record_run(task.id, now, resolver_->next_run(task, now),
                                    task.is_one_time());
        !r) {
      return store_failure(r.error(), "Failed to update task");
    }
    return exec;
  }

  exec_log.append(std::format("Executing action: {}", task.action.type_name()));
  auto result = executor_->execute(task.action, exec_log, ctx);
  if (!result) {
    // A step torn down by shutdown (a killed child, say) is an interruption.
    if (ctx.cancelled() && result.error().code != Error::Cancelled) {
      result = failure(Error::Cancelled,
                       std::format("Execution cancelled: {}",
                                   result.error().message));
    }
    record_failure(task, exec, exec_log, result.error());
    return std::unexpected{std::move(result.error())};
  }

  auto completed_at = Clock::now();
  exec.status = ExecutionStatus::Completed;
  exec.completed_at = completed_at;
  exec.duration = elapsed_since(exec.started_at, completed_at);
  exec.result = std::move(*result);
  exec_log.append(std::format("Task completed successfully in {}ms",
                              exec.duration->count()));
  exec.logs = exec_log.lines();

  if (auto r = store_->finish_execution(exec); !r) {
    auto error = store_failure(r.error(), "Failed to record execution");
    if (auto a = store_->record_attempt(task.id, completed_at); !a) {
      log::warn("Failed to record attempt for task {}: {}", task.id,
                a.error().message());
    }
    return error;
  }
  if (auto r = store_->record_run(task.id, completed_at,
                                  resolver_->next_run(task, completed_at),
                                  task.is_one_time());
      !r) {
    return store_failure(r.error(), "Failed to update task");
  }

  if (wants(task.notification, "onSuccess")) {
    notify(task, NotificationKind::Success, exec.result);
  }
  return exec;
}

auto TaskRunner::conditions_hold(const ScheduledTask& task,
                                 const ExecutionContext& ctx) const
    -> Outcome<bool> {
  if (!has_conditions(task.conditions)) {
    return true;
  }
  try {
    return conditions_->evaluate(task, ctx);
  } catch (const std::exception& e) {
    return failure(Error::ExecutionFailed,
                   std::format("Condition evaluation failed: {}", e.what()));
  }
}

auto TaskRunner::record_failure(const ScheduledTask& task, TaskExecution& exec,
                                ExecutionLog& exec_log,
                                const ExecutionError& error) const -> void {
  auto completed_at = Clock::now();
  bool interrupted = error.code == Error::Cancelled;
  exec_log.append(std::format("Task {}: {}",
                              interrupted ? "interrupted" : "failed",
                              error.message));

  exec.status =
      interrupted ? ExecutionStatus::Interrupted : ExecutionStatus::Failed;
  exec.completed_at = completed_at;
  exec.duration = elapsed_since(exec.started_at, completed_at);
  exec.error = error.message;
  exec.logs = exec_log.lines();

  if (auto r = store_->finish_execution(exec); !r) {
    log::warn("Failed to record execution {} of task {}: {}", exec.id, task.id,
              r.error().message());
  }
  // An interrupted run is not an attempt; it neither spends retry budget nor
  // notifies.
  if (interrupted) {
    return;
  }
  if (auto r = store_->record_attempt(task.id, completed_at); !r) {
    log::warn("Failed to record attempt for task {}: {}", task.id,
              r.error().message());
  }

  if (wants(task.notification, "onFailure")) {
    notify(task, NotificationKind::Failure, json(error.message));
  }
}

auto TaskRunner::notify(const ScheduledTask& task, NotificationKind kind,
                        const json& payload) const -> void {
  try {
    notifications_->notify(task, kind, payload);
  } catch (const std::exception& e) {
    log::warn("Notification for task {} failed: {}", task.id, e.what());
  }
}

}  // namespace cadence
