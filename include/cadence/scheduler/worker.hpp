#pragma once

#include "cadence/config/system_config.hpp"
#include "cadence/core/cancellation.hpp"
#include "cadence/core/error.hpp"
#include "cadence/executor/action_executor.hpp"
#include "cadence/scheduler/backoff.hpp"
#include "cadence/scheduler/schedule_resolver.hpp"
#include "cadence/scheduler/task_runner.hpp"
#include "cadence/storage/task_store.hpp"
#include "cadence/util/id.hpp"

#include <nlohmann/json.hpp>

#include <atomic>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <future>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <thread>
#include <vector>

namespace cadence {

inline constexpr std::chrono::milliseconds kClaimLeaseMargin{
    kClaimLeaseMarginMs};

// claim_lease is raised to at least action_timeout + kClaimLeaseMargin.
struct WorkerOptions {
  std::chrono::milliseconds poll_interval{30000};
  std::size_t batch_size{10};
  std::chrono::milliseconds action_timeout{300000};
  std::chrono::milliseconds claim_lease{600000};
  int retention_days{30};
  int history_per_task{100};

  [[nodiscard]] static auto from_config(const WorkerConfig& config)
      -> WorkerOptions;
};

enum class Disposition : std::uint8_t {
  Succeeded,
  Retrying,
  Failed,
};

[[nodiscard]] constexpr auto disposition_name(Disposition d) noexcept
    -> std::string_view {
  switch (d) {
    case Disposition::Succeeded:
      return "succeeded";
    case Disposition::Retrying:
      return "retrying";
    case Disposition::Failed:
      return "failed";
  }
  return "unknown";
}

struct TaskReport {
  TaskId task_id;
  Disposition disposition{Disposition::Succeeded};
  std::optional<TimePoint> retry_at;
  std::string error;
};

struct BatchReport {
  std::size_t selected{0};
  std::size_t succeeded{0};
  std::size_t retrying{0};
  std::size_t failed{0};
  std::vector<TaskReport> tasks;
};

struct WorkerStatus {
  bool running{false};
  std::chrono::milliseconds poll_interval{0};
  std::size_t batch_size{0};
};

struct CleanupReport {
  std::int64_t tasks_deleted{0};
  std::int64_t executions_deleted{0};
};

// Polls the store on a fixed interval and dispatches every due task
// concurrently. Any number of workers may share one database; the store's
// claims keep each task on at most one of them at a time.
class Worker {
public:
  enum class State : std::uint8_t {
    Stopped,
    Starting,
    Running,
    Stopping,
  };

  Worker(ITaskStore& store, const ActionExecutor& executor,
         IScheduleResolver& resolver, WorkerOptions options = {},
         BackoffPolicy backoff = {},
         std::shared_ptr<IConditionEvaluator> conditions = nullptr,
         std::shared_ptr<INotificationSink> notifications = nullptr);
  ~Worker();

  Worker(const Worker&) = delete;
  auto operator=(const Worker&) -> Worker& = delete;

  // Both are idempotent.
  [[nodiscard]] auto start() -> Result<void>;
  auto stop() -> void;
  // Signals every in-flight task to stop without waiting for it. stop()
  // does the waiting.
  auto cancel_inflight() -> void;

  [[nodiscard]] auto is_running() const noexcept -> bool {
    return state_.load(std::memory_order_acquire) == State::Running;
  }
  [[nodiscard]] auto state() const noexcept -> State {
    return state_.load(std::memory_order_acquire);
  }

  // One poll cycle: claim due tasks, run them all, wait for the batch.
  [[nodiscard]] auto poll_once() -> Result<BatchReport>;

  // Claims and runs a task immediately, whatever its schedule.
  [[nodiscard]] auto run_now(const TaskId& id) -> Outcome<TaskExecution>;

  // Runs the active trigger task behind a webhook. An unknown webhook or an
  // inactive task is Error::NotFound; a wrong secret is
  // Error::InvalidArgument.
  [[nodiscard]] auto fire_trigger(const WebhookId& webhook,
                                  std::string_view secret,
                                  const nlohmann::json& payload)
      -> Outcome<TaskExecution>;

  [[nodiscard]] auto status() const -> WorkerStatus;
  [[nodiscard]] auto stats() const -> Result<TaskCounts>;
  [[nodiscard]] auto cleanup(std::optional<int> older_than_days = std::nullopt)
      -> Result<CleanupReport>;

  [[nodiscard]] auto worker_id() const noexcept -> const WorkerId& {
    return worker_id_;
  }
  [[nodiscard]] auto options() const noexcept -> const WorkerOptions& {
    return options_;
  }
  [[nodiscard]] auto cycles_completed() const noexcept -> std::uint64_t {
    return cycles_completed_.load(std::memory_order_acquire);
  }

private:
  auto timer_loop(std::stop_token stop) -> void;
  auto wake() -> void;
  auto launch_cycle() -> void;
  auto reap_cycles(bool wait_all) -> void;
  // Renews this worker's claims every lease/3 until the returned thread is
  // stopped.
  [[nodiscard]] auto hold_claims() -> std::jthread;
  [[nodiscard]] auto run_claimed(const ScheduledTask& task,
                                 const nlohmann::json& trigger_payload)
      -> Outcome<TaskExecution>;

  [[nodiscard]] auto context() const -> ExecutionContext;
  [[nodiscard]] auto execute_task(const ScheduledTask& task,
                                  const ExecutionContext& ctx,
                                  const nlohmann::json& trigger_payload =
                                      nullptr) const
      -> Outcome<TaskExecution>;
  // Applies the outcome of one attempt to the task's schedule.
  auto settle(const ScheduledTask& task, const Outcome<TaskExecution>& outcome)
      -> TaskReport;
  [[nodiscard]] auto handle_failure(const ScheduledTask& task,
                                    const ExecutionError& error) -> TaskReport;

  ITaskStore* store_;
  IScheduleResolver* resolver_;
  TaskRunner runner_;
  WorkerOptions options_;
  BackoffPolicy backoff_;
  WorkerId worker_id_;

  std::atomic<State> state_{State::Stopped};
  std::mutex lifecycle_mu_;

  mutable std::mutex cancel_mu_;
  CancellationSource cancel_;

  int wake_fd_{-1};
  std::jthread timer_;

  std::mutex cycles_mu_;
  std::vector<std::future<void>> cycles_;
  std::atomic<std::uint64_t> cycles_completed_{0};
};

}  // namespace cadence
