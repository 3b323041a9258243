#pragma once

#include "cadence/core/cancellation.hpp"
#include "cadence/core/error.hpp"
#include "cadence/executor/action_executor.hpp"
#include "cadence/scheduler/schedule_resolver.hpp"
#include "cadence/storage/task_store.hpp"
#include "cadence/task/task.hpp"

#include <nlohmann/json.hpp>

#include <cstdint>
#include <memory>

namespace cadence {

// Decides whether a task's stored conditions hold right now.
class IConditionEvaluator {
public:
  virtual ~IConditionEvaluator() = default;
  [[nodiscard]] virtual auto evaluate(const ScheduledTask& task,
                                      const ExecutionContext& ctx)
      -> Outcome<bool> = 0;
};

// Every condition passes.
class PassConditionEvaluator final : public IConditionEvaluator {
public:
  [[nodiscard]] auto evaluate(const ScheduledTask&, const ExecutionContext&)
      -> Outcome<bool> override {
    return true;
  }
};

enum class NotificationKind : std::uint8_t {
  Success,
  Failure,
};

[[nodiscard]] constexpr auto notification_kind_name(NotificationKind kind) noexcept
    -> std::string_view {
  return kind == NotificationKind::Success ? "success" : "failure";
}

class INotificationSink {
public:
  virtual ~INotificationSink() = default;
  // `payload` is the action result on success and the error message on
  // failure. Delivery problems are the sink's to report.
  virtual auto notify(const ScheduledTask& task, NotificationKind kind,
                      const nlohmann::json& payload) -> void = 0;
};

// Writes one structured log line per notification.
class LogNotificationSink final : public INotificationSink {
public:
  auto notify(const ScheduledTask& task, NotificationKind kind,
              const nlohmann::json& payload) -> void override;
};

// Runs one claimed task end to end: execution record, conditions, action,
// outcome bookkeeping and notifications. Failure handling (retry or terminal
// failure) is left to the caller. An Error::Cancelled outcome is recorded as
// an interrupted execution and leaves run_count untouched.
class TaskRunner {
public:
  TaskRunner(ITaskStore& store, const ActionExecutor& executor,
             const IScheduleResolver& resolver,
             std::shared_ptr<IConditionEvaluator> conditions = nullptr,
             std::shared_ptr<INotificationSink> notifications = nullptr);

  // A non-null `trigger_payload` is noted in the execution log.
  [[nodiscard]] auto run(const ScheduledTask& task, const ExecutionContext& ctx,
                         const nlohmann::json& trigger_payload = nullptr) const
      -> Outcome<TaskExecution>;

private:
  [[nodiscard]] auto conditions_hold(const ScheduledTask& task,
                                     const ExecutionContext& ctx) const
      -> Outcome<bool>;
  auto record_failure(const ScheduledTask& task, TaskExecution& exec,
                      ExecutionLog& exec_log, const ExecutionError& error) const
      -> void;
  auto notify(const ScheduledTask& task, NotificationKind kind,
              const nlohmann::json& payload) const -> void;

  ITaskStore* store_;
  const ActionExecutor* executor_;
  const IScheduleResolver* resolver_;
  std::shared_ptr<IConditionEvaluator> conditions_;
  std::shared_ptr<INotificationSink> notifications_;
};

}  // namespace cadence
