#include "cadence/scheduler/worker.hpp"
#include "test_utils.hpp"

#include <gtest/gtest.h>

#include <algorithm>
#include <atomic>
#include <chrono>
#include <memory>
#include <thread>

namespace cadence::test {

using namespace std::chrono_literals;

namespace {

// IEmailSender that takes longer than the claim lease to deliver.
class SlowEmail final : public IEmailSender {
public:
  explicit SlowEmail(std::chrono::milliseconds delay) : delay_(delay) {}

  auto send(const EmailMessage& /*message*/, std::chrono::milliseconds /*timeout*/)
      -> Outcome<void> override {
    std::this_thread::sleep_for(delay_);
    sent.fetch_add(1);
    return {};
  }

  std::atomic<int> sent{0};

private:
  std::chrono::milliseconds delay_;
};

}  // namespace

class WorkerTest : public StoreTest {
protected:
  void SetUp() override {
    StoreTest::SetUp();
    llm_ = std::make_shared<FakeLlm>();
    Collaborators c;
    c.llm = llm_;
    executor_ = std::make_unique<ActionExecutor>(std::move(c));
  }

  void TearDown() override {
    worker_.reset();
    StoreTest::TearDown();
  }

  auto make_worker(WorkerOptions options = {}) -> Worker& {
    worker_ = std::make_unique<Worker>(*store_, *executor_, resolver_, options,
                                       BackoffPolicy([] { return 0.0; }));
    return *worker_;
  }

  auto insert(ScheduledTask task) -> ScheduledTask {
    EXPECT_TRUE(store_->insert_task(task).has_value());
    return task;
  }

  static auto failing_task(std::string_view id) -> ScheduledTask {
    auto task = make_task(id);
    task.action = AiPromptAction{"fail please", std::nullopt};
    return task;
  }

  auto stored(const TaskId& id) -> ScheduledTask {
    auto task = store_->get_task(id);
    EXPECT_TRUE(task.has_value());
    return task.value_or(ScheduledTask{});
  }

  auto trigger_task(std::string_view id) -> ScheduledTask {
    auto task = make_task(id);
    task.type = TaskType::Trigger;
    task.schedule = nlohmann::json::object();
    task.trigger = {{"event", "push"}};
    task.next_run.reset();
    return insert(task);
  }

  auto add_webhook(const TaskId& task, std::string secret) -> TaskWebhook {
    TaskWebhook hook{.id = WebhookId(generate_uuid()),
                     .task_id = task,
                     .secret = std::move(secret),
                     .created_at = Clock::now()};
    EXPECT_TRUE(store_->insert_webhook(hook).has_value());
    return hook;
  }

  std::shared_ptr<FakeLlm> llm_;
  std::unique_ptr<ActionExecutor> executor_;
  DefaultScheduleResolver resolver_{1min};
  std::unique_ptr<Worker> worker_;
};

TEST_F(WorkerTest, PollRunsDueTasksOnly) {
  insert(make_task("due"));
  insert(make_task("later", 1h));

  auto report = make_worker().poll_once();

  ASSERT_TRUE(report.has_value());
  EXPECT_EQ(report->selected, 1u);
  EXPECT_EQ(report->succeeded, 1u);
  ASSERT_EQ(report->tasks.size(), 1u);
  EXPECT_EQ(report->tasks[0].task_id, task_id("due"));
  EXPECT_EQ(stored(task_id("due")).status, TaskStatus::Completed);
  EXPECT_EQ(stored(task_id("later")).status, TaskStatus::Active);
}

TEST_F(WorkerTest, PollRespectsBatchSize) {
  for (int i = 0; i < 5; ++i) {
    insert(make_task("t" + std::to_string(i), -1000ms * (i + 1)));
  }

  auto& worker = make_worker(WorkerOptions{.batch_size = 3});
  auto report = worker.poll_once();
  ASSERT_TRUE(report.has_value());
  EXPECT_EQ(report->selected, 3u);

  report = worker.poll_once();
  ASSERT_TRUE(report.has_value());
  EXPECT_EQ(report->selected, 2u);
}

TEST_F(WorkerTest, RetriesUntilMaxRetriesThenFails) {
  llm_->error = ExecutionError{Error::HttpError, "upstream unavailable"};
  auto task = failing_task("flaky");
  task.retry_policy = RetryPolicy{.max_retries = 2, .backoff_ms = 1};
  insert(task);
  auto& worker = make_worker();

  auto first = worker.poll_once();
  ASSERT_TRUE(first.has_value());
  ASSERT_EQ(first->tasks.size(), 1u);
  EXPECT_EQ(first->tasks[0].disposition, Disposition::Retrying);
  ASSERT_TRUE(first->tasks[0].retry_at.has_value());
  EXPECT_EQ(stored(task.id).status, TaskStatus::Active);
  EXPECT_EQ(stored(task.id).run_count, 1);

  sleep_ms(20ms);
  auto second = worker.poll_once();
  ASSERT_TRUE(second.has_value());
  ASSERT_EQ(second->tasks.size(), 1u);
  EXPECT_EQ(second->tasks[0].disposition, Disposition::Retrying);
  EXPECT_EQ(stored(task.id).run_count, 2);

  sleep_ms(20ms);
  auto third = worker.poll_once();
  ASSERT_TRUE(third.has_value());
  ASSERT_EQ(third->tasks.size(), 1u);
  EXPECT_EQ(third->tasks[0].disposition, Disposition::Failed);
  EXPECT_EQ(third->tasks[0].error, "upstream unavailable");

  auto final_state = stored(task.id);
  EXPECT_EQ(final_state.status, TaskStatus::Failed);
  EXPECT_EQ(final_state.run_count, 3);
  EXPECT_EQ(llm_->requests.size(), 3u);

  sleep_ms(20ms);
  auto after = worker.poll_once();
  ASSERT_TRUE(after.has_value());
  EXPECT_EQ(after->selected, 0u);

  auto history = store_->get_executions(task.id, 10);
  ASSERT_TRUE(history.has_value());
  EXPECT_EQ(history->size(), 3u);
}

TEST_F(WorkerTest, RetryDelayFollowsBackoff) {
  llm_->error = ExecutionError{Error::HttpError, "boom"};
  auto task = failing_task("slow-retry");
  task.retry_policy = RetryPolicy{.max_retries = 5, .backoff_ms = 60000};
  insert(task);

  auto before = Clock::now();
  auto report = make_worker().poll_once();
  ASSERT_TRUE(report.has_value());
  ASSERT_EQ(report->tasks.size(), 1u);
  ASSERT_TRUE(report->tasks[0].retry_at.has_value());

  auto next = stored(task.id).next_run;
  ASSERT_TRUE(next.has_value());
  EXPECT_GE(to_millis(*next), to_millis(before + 60s));
  EXPECT_LE(to_millis(*next), to_millis(Clock::now() + 60s));
}

TEST_F(WorkerTest, NoRetryPolicyFailsAfterOneAttempt) {
  llm_->error = ExecutionError{Error::HttpError, "nope"};
  auto task = insert(failing_task("fragile"));

  auto report = make_worker().poll_once();

  ASSERT_TRUE(report.has_value());
  EXPECT_EQ(report->failed, 1u);
  EXPECT_EQ(stored(task.id).status, TaskStatus::Failed);
  EXPECT_EQ(stored(task.id).run_count, 1);
}

TEST_F(WorkerTest, OneFailureDoesNotAffectSiblings) {
  llm_->error = ExecutionError{Error::HttpError, "bad gateway"};
  insert(failing_task("bad"));
  insert(make_task("good-1"));
  insert(make_task("good-2"));

  auto report = make_worker().poll_once();

  ASSERT_TRUE(report.has_value());
  EXPECT_EQ(report->selected, 3u);
  EXPECT_EQ(report->succeeded, 2u);
  EXPECT_EQ(report->failed, 1u);
  EXPECT_EQ(stored(task_id("bad")).status, TaskStatus::Failed);
  EXPECT_EQ(stored(task_id("good-1")).status, TaskStatus::Completed);
  EXPECT_EQ(stored(task_id("good-2")).status, TaskStatus::Completed);
}

TEST_F(WorkerTest, RecurringTaskIsRescheduled) {
  auto task = make_task("tick");
  task.type = TaskType::Recurring;
  task.schedule = {{"cron", "* * * * *"}};
  insert(task);

  auto before = Clock::now();
  ASSERT_TRUE(make_worker().poll_once().has_value());

  auto after = stored(task.id);
  EXPECT_EQ(after.status, TaskStatus::Active);
  ASSERT_TRUE(after.next_run.has_value());
  EXPECT_GE(to_millis(*after.next_run), to_millis(before + 1min));
}

TEST_F(WorkerTest, StartAndStopAreIdempotent) {
  auto& worker = make_worker(WorkerOptions{.poll_interval = 1h});
  EXPECT_EQ(worker.state(), Worker::State::Stopped);

  ASSERT_TRUE(worker.start().has_value());
  EXPECT_TRUE(worker.is_running());
  ASSERT_TRUE(worker.start().has_value());
  EXPECT_TRUE(worker.is_running());

  worker.stop();
  EXPECT_FALSE(worker.is_running());
  worker.stop();
  EXPECT_EQ(worker.state(), Worker::State::Stopped);

  ASSERT_TRUE(worker.start().has_value());
  EXPECT_TRUE(worker.is_running());
  worker.stop();
}

TEST_F(WorkerTest, TimerLoopRunsCycles) {
  insert(make_task("timed"));
  auto& worker = make_worker(WorkerOptions{.poll_interval = 20ms});

  ASSERT_TRUE(worker.start().has_value());
  EXPECT_TRUE(wait_until([&] { return worker.cycles_completed() >= 2; }));
  EXPECT_TRUE(wait_until([&] {
    auto task = store_->get_task(task_id("timed"));
    return task && task->status == TaskStatus::Completed;
  }));
  worker.stop();

  EXPECT_EQ(stored(task_id("timed")).run_count, 1);
}

TEST_F(WorkerTest, StartSchedulesUnscheduledRecurringTasks) {
  auto task = make_task("bootstrap");
  task.type = TaskType::Recurring;
  task.schedule = {{"cron", "0 * * * *"}};
  task.next_run.reset();
  insert(task);

  auto& worker = make_worker(WorkerOptions{.poll_interval = 1h});
  ASSERT_TRUE(worker.start().has_value());
  worker.stop();

  EXPECT_TRUE(stored(task.id).next_run.has_value());
}

TEST_F(WorkerTest, RunNowIgnoresSchedule) {
  auto task = insert(make_task("future", 24h));

  auto exec = make_worker().run_now(task.id);

  ASSERT_TRUE(exec.has_value());
  EXPECT_EQ(exec->status, ExecutionStatus::Completed);
  EXPECT_EQ(stored(task.id).status, TaskStatus::Completed);
}

TEST_F(WorkerTest, RunNowRefusesTaskClaimedElsewhere) {
  auto task = insert(make_task("busy"));
  ASSERT_TRUE(
      store_->claim_task(task.id, worker_id("other"), 1min, Clock::now())
          .has_value());

  auto exec = make_worker().run_now(task.id);

  ASSERT_FALSE(exec.has_value());
  EXPECT_EQ(exec.error().code, Error::AlreadyClaimed);
  EXPECT_TRUE(exec.error().message.starts_with("Cannot run task busy:"));
  EXPECT_EQ(stored(task.id).run_count, 0);

  auto missing = worker_->run_now(task_id("missing"));
  ASSERT_FALSE(missing.has_value());
  EXPECT_EQ(missing.error().code, Error::NotFound);
}

TEST_F(WorkerTest, CleanupPrunesOldTasksAndHistory) {
  auto old_done = make_task("old-done");
  old_done.status = TaskStatus::Completed;
  old_done.updated_at = Clock::now() - std::chrono::days(40);
  insert(old_done);

  auto fresh_done = make_task("fresh-done");
  fresh_done.status = TaskStatus::Completed;
  insert(fresh_done);

  auto active = insert(make_task("active"));
  for (int i = 0; i < 4; ++i) {
    ASSERT_TRUE(store_
                    ->begin_execution(active.id,
                                      Clock::now() - std::chrono::minutes(10 - i),
                                      {})
                    .has_value());
  }

  auto& worker = make_worker(WorkerOptions{.history_per_task = 2});
  auto report = worker.cleanup();

  ASSERT_TRUE(report.has_value());
  EXPECT_EQ(report->tasks_deleted, 1);
  EXPECT_EQ(report->executions_deleted, 2);
  EXPECT_EQ(store_->get_task(old_done.id).error(), Error::NotFound);
  EXPECT_TRUE(store_->get_task(fresh_done.id).has_value());
  EXPECT_EQ(store_->get_executions(active.id, 10)->size(), 2u);

  auto widened = worker.cleanup(0);
  ASSERT_TRUE(widened.has_value());
  EXPECT_EQ(widened->executions_deleted, 0);
}

TEST_F(WorkerTest, CleanupRejectsNegativeAge) {
  auto old_done = make_task("old-done");
  old_done.status = TaskStatus::Completed;
  old_done.updated_at = Clock::now() - std::chrono::days(40);
  insert(old_done);

  auto report = make_worker().cleanup(-1);

  ASSERT_FALSE(report.has_value());
  EXPECT_EQ(report.error(), Error::InvalidArgument);
  EXPECT_TRUE(store_->get_task(old_done.id).has_value());
}

TEST_F(WorkerTest, StatsReportCounts) {
  insert(make_task("a"));
  auto paused = make_task("b");
  paused.status = TaskStatus::Paused;
  insert(paused);

  auto& worker = make_worker(WorkerOptions{.poll_interval = 250ms,
                                           .batch_size = 4});
  auto counts = worker.stats();
  ASSERT_TRUE(counts.has_value());
  EXPECT_EQ(counts->active, 1);
  EXPECT_EQ(counts->paused, 1);

  auto status = worker.status();
  EXPECT_FALSE(status.running);
  EXPECT_EQ(status.poll_interval, 250ms);
  EXPECT_EQ(status.batch_size, 4u);
}

TEST_F(WorkerTest, WorkersShareTasksWithoutDuplication) {
  for (int i = 0; i < 8; ++i) {
    insert(make_task("shared-" + std::to_string(i)));
  }

  SqliteTaskStore other_store(db_.path());
  ASSERT_TRUE(other_store.open().has_value());
  Worker other(other_store, *executor_, resolver_);

  auto& worker = make_worker();
  Result<BatchReport> mine;
  Result<BatchReport> theirs;
  std::thread t([&] { theirs = other.poll_once(); });
  mine = worker.poll_once();
  t.join();

  ASSERT_TRUE(mine.has_value());
  ASSERT_TRUE(theirs.has_value());
  EXPECT_EQ(mine->selected + theirs->selected, 8u);

  for (int i = 0; i < 8; ++i) {
    EXPECT_EQ(stored(task_id("shared-" + std::to_string(i))).run_count, 1);
  }
}

TEST_F(WorkerTest, LeaseIsRaisedAboveActionTimeout) {
  auto& worker = make_worker(
      WorkerOptions{.action_timeout = 2s, .claim_lease = 500ms});
  EXPECT_EQ(worker.options().claim_lease, 2s + kClaimLeaseMargin);
}

TEST_F(WorkerTest, LongRunningTaskKeepsItsClaim) {
  auto email = std::make_shared<SlowEmail>(1500ms);
  Collaborators c;
  c.email = email;
  ActionExecutor slow_executor(std::move(c));

  auto task = make_task("slow-mail");
  task.action = SendEmailAction{"me@example.com", "Report", "Attached"};
  insert(task);

  const WorkerOptions options{.action_timeout = 50ms, .claim_lease = 10ms};
  Worker first(*store_, slow_executor, resolver_, options);
  ASSERT_EQ(first.options().claim_lease, 50ms + kClaimLeaseMargin);

  SqliteTaskStore other_store(db_.path());
  ASSERT_TRUE(other_store.open().has_value());
  Worker second(other_store, slow_executor, resolver_, options);

  Result<BatchReport> mine;
  std::thread t([&] { mine = first.poll_once(); });
  // Past the original lease, before the send finishes.
  sleep_ms(1200ms);
  auto theirs = second.poll_once();
  t.join();

  ASSERT_TRUE(theirs.has_value());
  EXPECT_EQ(theirs->selected, 0u);
  ASSERT_TRUE(mine.has_value());
  EXPECT_EQ(mine->selected, 1u);
  EXPECT_EQ(mine->succeeded, 1u);
  EXPECT_EQ(email->sent.load(), 1);

  auto after = stored(task.id);
  EXPECT_EQ(after.status, TaskStatus::Completed);
  EXPECT_EQ(after.run_count, 1);
}

TEST_F(WorkerTest, CancelledRunDoesNotSpendAnAttempt) {
  auto task = insert(failing_task("halted"));
  auto& worker = make_worker();
  worker.cancel_inflight();

  auto exec = worker.run_now(task.id);

  ASSERT_FALSE(exec.has_value());
  EXPECT_EQ(exec.error().code, Error::Cancelled);
  EXPECT_TRUE(llm_->requests.empty());

  auto after = stored(task.id);
  EXPECT_EQ(after.status, TaskStatus::Active);
  EXPECT_EQ(after.run_count, 0);
  EXPECT_TRUE(
      store_->claim_task(task.id, worker_id("other"), 1min, Clock::now())
          .has_value());
}

TEST_F(WorkerTest, FireTriggerRunsTaskWithPayload) {
  auto task = trigger_task("on-push");
  auto hook = add_webhook(task.id, "s3cret");
  auto& worker = make_worker();

  EXPECT_EQ(worker.poll_once()->selected, 0u);

  auto exec = worker.fire_trigger(hook.id, "s3cret",
                                  nlohmann::json{{"ref", "refs/heads/main"}});

  ASSERT_TRUE(exec.has_value());
  EXPECT_EQ(exec->status, ExecutionStatus::Completed);
  EXPECT_TRUE(contains_line(exec->logs, "Trigger payload:"));
  EXPECT_TRUE(contains_line(exec->logs, "refs/heads/main"));
  ASSERT_EQ(llm_->requests.size(), 1u);

  auto after = stored(task.id);
  EXPECT_EQ(after.status, TaskStatus::Active);
  EXPECT_EQ(after.run_count, 1);
  EXPECT_FALSE(after.next_run.has_value());

  auto fired = store_->get_webhook(hook.id);
  ASSERT_TRUE(fired.has_value());
  EXPECT_EQ(fired->trigger_count, 1);
  EXPECT_TRUE(fired->last_triggered.has_value());

  ASSERT_TRUE(worker.fire_trigger(hook.id, "s3cret", nullptr).has_value());
  EXPECT_EQ(store_->get_webhook(hook.id)->trigger_count, 2);
  EXPECT_EQ(stored(task.id).run_count, 2);
}

TEST_F(WorkerTest, FireTriggerRejectsBadSecretAndUnknownWebhook) {
  auto task = trigger_task("guarded");
  auto hook = add_webhook(task.id, "right-secret");
  auto& worker = make_worker();

  auto wrong = worker.fire_trigger(hook.id, "wrong-secret", nullptr);
  ASSERT_FALSE(wrong.has_value());
  EXPECT_EQ(wrong.error().code, Error::InvalidArgument);
  EXPECT_EQ(wrong.error().message, "Invalid webhook secret");

  auto shorter = worker.fire_trigger(hook.id, "right", nullptr);
  ASSERT_FALSE(shorter.has_value());
  EXPECT_EQ(shorter.error().code, Error::InvalidArgument);

  auto unknown =
      worker.fire_trigger(WebhookId("no-such-hook"), "right-secret", nullptr);
  ASSERT_FALSE(unknown.has_value());
  EXPECT_EQ(unknown.error().code, Error::NotFound);
  EXPECT_EQ(unknown.error().message, "Webhook not found or task inactive");

  EXPECT_TRUE(llm_->requests.empty());
  EXPECT_EQ(store_->get_webhook(hook.id)->trigger_count, 0);
  EXPECT_EQ(stored(task.id).run_count, 0);
}

TEST_F(WorkerTest, FireTriggerIgnoresInactiveTask) {
  auto task = trigger_task("paused-hook");
  auto hook = add_webhook(task.id, "s3cret");
  ASSERT_TRUE(store_->set_status(task.id, TaskStatus::Paused, Clock::now()).has_value());

  auto exec = make_worker().fire_trigger(hook.id, "s3cret", nullptr);

  ASSERT_FALSE(exec.has_value());
  EXPECT_EQ(exec.error().code, Error::NotFound);
  EXPECT_EQ(exec.error().message, "Webhook not found or task inactive");
  EXPECT_TRUE(llm_->requests.empty());
}

TEST_F(WorkerTest, FireTriggerRefusesTaskClaimedElsewhere) {
  auto task = trigger_task("busy-hook");
  auto hook = add_webhook(task.id, "s3cret");
  ASSERT_TRUE(
      store_->claim_task(task.id, worker_id("other"), 1min, Clock::now())
          .has_value());

  auto exec = make_worker().fire_trigger(hook.id, "s3cret", nullptr);

  ASSERT_FALSE(exec.has_value());
  EXPECT_EQ(exec.error().code, Error::AlreadyClaimed);
  EXPECT_EQ(store_->get_webhook(hook.id)->trigger_count, 0);
  EXPECT_EQ(stored(task.id).run_count, 0);
}

}  // namespace cadence::test
