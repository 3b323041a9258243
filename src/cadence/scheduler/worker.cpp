#include "cadence/scheduler/worker.hpp"

#include "cadence/scheduler/task_group.hpp"
#include "cadence/util/log.hpp"
#include "cadence/util/util.hpp"

#include <openssl/crypto.h>
#include <sys/eventfd.h>

#include <algorithm>
#include <cerrno>
#include <condition_variable>
#include <cstring>
#include <format>
#include <system_error>

#include <poll.h>
#include <unistd.h>

namespace cadence {

namespace {

constexpr std::chrono::hours kStatsWindow{1};

auto secret_matches(std::string_view expected, std::string_view given)
    -> bool {
  return expected.size() == given.size() &&
         CRYPTO_memcmp(expected.data(), given.data(), expected.size()) == 0;
}

}  // namespace

auto WorkerOptions::from_config(const WorkerConfig& config) -> WorkerOptions {
  return WorkerOptions{
      .poll_interval = std::chrono::milliseconds(config.poll_interval_ms),
      .batch_size = static_cast<std::size_t>(config.batch_size),
      .action_timeout = std::chrono::milliseconds(config.action_timeout_ms),
      .claim_lease = std::chrono::milliseconds(config.claim_lease_ms),
      .retention_days = config.retention_days,
      .history_per_task = config.history_per_task,
  };
}

Worker::Worker(ITaskStore& store, const ActionExecutor& executor,
               IScheduleResolver& resolver, WorkerOptions options,
               BackoffPolicy backoff,
               std::shared_ptr<IConditionEvaluator> conditions,
               std::shared_ptr<INotificationSink> notifications)
    : store_(&store), resolver_(&resolver),
      runner_(store, executor, resolver, std::move(conditions),
              std::move(notifications)),
      options_(options), backoff_(std::move(backoff)),
      worker_id_(generate_uuid()) {
  options_.poll_interval =
      std::max(options_.poll_interval, std::chrono::milliseconds{1});
  auto min_lease = options_.action_timeout + kClaimLeaseMargin;
  if (options_.claim_lease < min_lease) {
    log::warn("Claim lease {}ms does not outlast the {}ms action timeout; "
              "using {}ms",
              options_.claim_lease.count(), options_.action_timeout.count(),
              min_lease.count());
    options_.claim_lease = min_lease;
  }
  wake_fd_ = eventfd(0, EFD_NONBLOCK | EFD_CLOEXEC);
  if (wake_fd_ < 0) {
    log::error("Failed to create eventfd: {}", std::strerror(errno));
  }
}

Worker::~Worker() {
  stop();
  if (wake_fd_ >= 0) {
    close(wake_fd_);
    wake_fd_ = -1;
  }
}

auto Worker::start() -> Result<void> {
  std::lock_guard lock(lifecycle_mu_);
  if (state_.load(std::memory_order_acquire) != State::Stopped) {
    log::warn("Scheduler worker already running");
    return ok();
  }
  state_.store(State::Starting, std::memory_order_release);
  log::info("Starting scheduler worker {}", worker_id_);

  {
    std::lock_guard cancel_lock(cancel_mu_);
    cancel_ = CancellationSource{};
  }

  if (auto r = resolver_->initialize(*store_, Clock::now()); !r) {
    log::error("Failed to initialize schedules: {}", r.error().message());
    state_.store(State::Stopped, std::memory_order_release);
    return fail(r.error());
  }

  timer_ = std::jthread([this](std::stop_token st) { timer_loop(st); });
  state_.store(State::Running, std::memory_order_release);

  log::info("Scheduler worker started: poll_interval={}ms batch_size={}",
            options_.poll_interval.count(), options_.batch_size);
  return ok();
}

auto Worker::stop() -> void {
  std::lock_guard lock(lifecycle_mu_);
  if (state_.load(std::memory_order_acquire) == State::Stopped) {
    return;
  }
  state_.store(State::Stopping, std::memory_order_release);
  log::info("Stopping scheduler worker {}", worker_id_);

  {
    std::lock_guard cancel_lock(cancel_mu_);
    cancel_.cancel();
  }

  timer_.request_stop();
  wake();
  if (timer_.joinable()) {
    timer_.join();
  }
  reap_cycles(true);

  resolver_->shutdown();
  state_.store(State::Stopped, std::memory_order_release);
  log::info("Scheduler worker stopped");
}

auto Worker::cancel_inflight() -> void {
  std::lock_guard lock(cancel_mu_);
  cancel_.cancel();
}

auto Worker::timer_loop(std::stop_token stop) -> void {
  pollfd pfd{wake_fd_, POLLIN, 0};
  auto next = std::chrono::steady_clock::now();

  while (!stop.stop_requested()) {
    auto now = std::chrono::steady_clock::now();
    if (now >= next) {
      launch_cycle();
      while (next <= now) {
        next += options_.poll_interval;
      }
    }

    auto delay =
        std::chrono::duration_cast<std::chrono::milliseconds>(next - now);
    int timeout_ms = std::max(0, static_cast<int>(delay.count()));

    int ret = ::poll(&pfd, 1, timeout_ms);
    if (ret < 0 && errno != EINTR) {
      log::error("poll failed: {}", std::strerror(errno));
      break;
    }

    std::uint64_t val;
    while (wake_fd_ >= 0 && ::read(wake_fd_, &val, sizeof(val)) > 0) {
    }
  }
}

auto Worker::wake() -> void {
  if (wake_fd_ < 0) {
    return;
  }
  std::uint64_t val = 1;
  if (::write(wake_fd_, &val, sizeof(val)) < 0) {
    log::warn("Failed to write to wake fd: {}", std::strerror(errno));
  }
}

auto Worker::launch_cycle() -> void {
  reap_cycles(false);

  std::lock_guard lock(cycles_mu_);
  try {
    cycles_.push_back(std::async(std::launch::async, [this] {
      if (auto report = poll_once(); !report) {
        log::error("Error in poll cycle: {}", report.error().message());
      }
      cycles_completed_.fetch_add(1, std::memory_order_acq_rel);
    }));
  } catch (const std::system_error& e) {
    log::error("Failed to launch poll cycle: {}", e.what());
  }
}

auto Worker::reap_cycles(bool wait_all) -> void {
  std::lock_guard lock(cycles_mu_);
  auto finished = [wait_all](std::future<void>& f) {
    return wait_all || f.wait_for(std::chrono::seconds(0)) ==
                           std::future_status::ready;
  };

  for (auto& cycle : cycles_) {
    if (!cycle.valid() || !finished(cycle)) {
      continue;
    }
    try {
      cycle.get();
    } catch (const std::exception& e) {
      log::error("Poll cycle terminated: {}", e.what());
    }
  }
  std::erase_if(cycles_, [](const std::future<void>& f) { return !f.valid(); });
}

auto Worker::hold_claims() -> std::jthread {
  return std::jthread([this](std::stop_token st) {
    auto interval =
        std::max(options_.claim_lease / 3, std::chrono::milliseconds{1});
    std::mutex mu;
    std::condition_variable_any cv;
    std::unique_lock lock(mu);
    while (!cv.wait_for(lock, st, interval,
                        [&st] { return st.stop_requested(); })) {
      auto renewed =
          store_->renew_claims(worker_id_, options_.claim_lease, Clock::now());
      if (!renewed) {
        log::warn("Failed to renew claims of worker {}: {}", worker_id_,
                  renewed.error().message());
      } else {
        log::debug("Renewed {} claims", *renewed);
      }
    }
  });
}

auto Worker::context() const -> ExecutionContext {
  std::lock_guard lock(cancel_mu_);
  return ExecutionContext(options_.action_timeout, cancel_.token());
}

auto Worker::poll_once() -> Result<BatchReport> {
  auto due = store_->select_due_tasks(options_.batch_size, worker_id_,
                                      options_.claim_lease, Clock::now());
  if (!due) {
    log::error("Failed to poll due tasks: {}", due.error().message());
    return fail(due.error());
  }

  BatchReport report;
  report.selected = due->size();
  if (due->empty()) {
    log::debug("No due tasks found");
    return report;
  }
  log::info("Found {} due tasks", due->size());

  auto heartbeat = hold_claims();
  TaskGroup<TaskReport> group;
  for (const auto& task : *due) {
    group.spawn([this, task]() -> Outcome<TaskReport> {
      auto outcome = execute_task(task, context());
      return settle(task, outcome);
    });
  }
  auto outcomes = group.wait();
  heartbeat.request_stop();

  for (std::size_t i = 0; i < outcomes.size(); ++i) {
    auto& outcome = outcomes[i];
    if (!outcome) {
      log::error("Dispatch of task {} failed: {}", (*due)[i].id,
                 outcome.error().message);
      report.tasks.push_back(TaskReport{.task_id = (*due)[i].id,
                                        .disposition = Disposition::Failed,
                                        .error = outcome.error().message});
      ++report.failed;
      continue;
    }
    switch (outcome->disposition) {
      case Disposition::Succeeded:
        ++report.succeeded;
        break;
      case Disposition::Retrying:
        ++report.retrying;
        break;
      case Disposition::Failed:
        ++report.failed;
        break;
    }
    report.tasks.push_back(std::move(*outcome));
  }

  log::info("Poll cycle finished: {} succeeded, {} retrying, {} failed",
            report.succeeded, report.retrying, report.failed);
  return report;
}

auto Worker::run_now(const TaskId& id) -> Outcome<TaskExecution> {
  auto task =
      store_->claim_task(id, worker_id_, options_.claim_lease, Clock::now());
  if (!task) {
    return failure(task.error(), std::format("Cannot run task {}: {}", id,
                                             task.error().message()));
  }

  log::info("Running task {} on demand", id);
  return run_claimed(*task, nullptr);
}

auto Worker::fire_trigger(const WebhookId& webhook, std::string_view secret,
                          const nlohmann::json& payload)
    -> Outcome<TaskExecution> {
  constexpr std::string_view kInactive = "Webhook not found or task inactive";

  auto hook = store_->get_webhook(webhook);
  if (!hook) {
    if (hook.error() == Error::NotFound) {
      return failure(Error::NotFound, std::string(kInactive));
    }
    return store_failure(hook.error(), "Failed to load webhook");
  }
  if (!secret_matches(hook->secret, secret)) {
    log::warn("Rejected webhook {}: secret mismatch", webhook);
    return failure(Error::InvalidArgument, "Invalid webhook secret");
  }

  auto task = store_->get_task(hook->task_id);
  if (!task) {
    if (task.error() == Error::NotFound) {
      return failure(Error::NotFound, std::string(kInactive));
    }
    return store_failure(task.error(), "Failed to load task");
  }
  if (task->type != TaskType::Trigger || task->status != TaskStatus::Active) {
    return failure(Error::NotFound, std::string(kInactive));
  }

  auto claimed = store_->claim_task(task->id, worker_id_, options_.claim_lease,
                                    Clock::now());
  if (!claimed) {
    return failure(claimed.error(),
                   std::format("Cannot run task {}: {}", task->id,
                               claimed.error().message()));
  }
  if (auto r = store_->record_webhook_trigger(webhook, Clock::now()); !r) {
    log::warn("Failed to record trigger of webhook {}: {}", webhook,
              r.error().message());
  }

  log::info("Webhook {} triggered task {}", webhook, task->id);
  return run_claimed(*claimed, payload);
}

auto Worker::run_claimed(const ScheduledTask& task,
                         const nlohmann::json& trigger_payload)
    -> Outcome<TaskExecution> {
  auto heartbeat = hold_claims();
  auto outcome = execute_task(task, context(), trigger_payload);
  heartbeat.request_stop();
  settle(task, outcome);
  return outcome;
}

auto Worker::execute_task(const ScheduledTask& task,
                          const ExecutionContext& ctx,
                          const nlohmann::json& trigger_payload) const
    -> Outcome<TaskExecution> {
  log::info("Executing scheduled task: id={} name={}", task.id, task.name);
  try {
    return runner_.run(task, ctx, trigger_payload);
  } catch (const std::exception& e) {
    return failure(Error::ExecutionFailed, e.what());
  }
}

auto Worker::settle(const ScheduledTask& task,
                    const Outcome<TaskExecution>& outcome) -> TaskReport {
  if (outcome) {
    log::info("Task executed successfully: id={}", task.id);
    return TaskReport{.task_id = task.id, .disposition = Disposition::Succeeded};
  }

  const auto& error = outcome.error();
  if (error.code == Error::Cancelled) {
    // Interrupted by shutdown; another poll picks it up again.
    if (auto r = store_->release_claim(task.id); !r) {
      log::warn("Failed to release claim on task {}: {}", task.id,
                r.error().message());
    }
    log::info("Task {} interrupted: {}", task.id, error.message);
    return TaskReport{.task_id = task.id,
                      .disposition = Disposition::Retrying,
                      .retry_at = task.next_run,
                      .error = error.message};
  }

  log::error("Task execution failed: id={} error={}", task.id, error.message);
  return handle_failure(task, error);
}

auto Worker::handle_failure(const ScheduledTask& task,
                            const ExecutionError& error) -> TaskReport {
  TaskReport report{.task_id = task.id,
                    .disposition = Disposition::Failed,
                    .error = error.message};

  auto terminal = [&] {
    if (auto r = store_->mark_failed(task.id); !r) {
      log::error("Failed to mark task {} as failed: {}", task.id,
                 r.error().message());
    }
    return report;
  };

  if (!task.retry_policy) {
    return terminal();
  }

  const auto& policy = *task.retry_policy;
  if (task.run_count >= policy.max_retries) {
    log::warn("Max retries exceeded, marking task as failed: id={} retries={}",
              task.id, task.run_count);
    return terminal();
  }

  auto delay =
      backoff_.delay(task.run_count, std::chrono::milliseconds(policy.backoff_ms));
  auto retry_at = Clock::now() + delay;
  log::info("Scheduling task retry: id={} retry_at={} attempt={}", task.id,
            format_iso8601(retry_at), task.run_count + 1);

  if (auto r = store_->reschedule_at(task.id, retry_at); !r) {
    log::error("Failed to reschedule task {}: {}", task.id, r.error().message());
  }
  report.disposition = Disposition::Retrying;
  report.retry_at = retry_at;
  return report;
}

auto Worker::status() const -> WorkerStatus {
  return WorkerStatus{.running = is_running(),
                      .poll_interval = options_.poll_interval,
                      .batch_size = options_.batch_size};
}

auto Worker::stats() const -> Result<TaskCounts> {
  return store_->get_counts(kStatsWindow, Clock::now());
}

auto Worker::cleanup(std::optional<int> older_than_days)
    -> Result<CleanupReport> {
  int days = older_than_days.value_or(options_.retention_days);
  if (days < 0) {
    log::error("Cleanup age must not be negative: {}", days);
    return fail(Error::InvalidArgument);
  }
  log::info("Running cleanup: older_than_days={} keep_per_task={}", days,
            options_.history_per_task);

  auto tasks = store_->prune_completed(days, Clock::now());
  if (!tasks) {
    log::error("Failed to prune completed tasks: {}", tasks.error().message());
    return fail(tasks.error());
  }
  auto executions = store_->prune_execution_history(options_.history_per_task);
  if (!executions) {
    log::error("Failed to prune execution history: {}",
               executions.error().message());
    return fail(executions.error());
  }

  CleanupReport report{.tasks_deleted = *tasks,
                       .executions_deleted = *executions};
  log::info("Cleanup completed: tasks_deleted={} executions_deleted={}",
            report.tasks_deleted, report.executions_deleted);
  return report;
}

}  // namespace cadence
