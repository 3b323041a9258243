#include "cadence/storage/sqlite_task_store.hpp"
#include "test_utils.hpp"

#include <gtest/gtest.h>
#include <sqlite3.h>

#include <algorithm>
#include <chrono>
#include <format>
#include <string_view>
#include <set>

namespace cadence::test {

using std::chrono::milliseconds;
using std::chrono::minutes;

namespace {

constexpr milliseconds kLease{60'000};

// Runs `sql` on a separate connection to the same database file.
auto exec_raw(const std::string& path, const std::string& sql) -> void {
  sqlite3* raw = nullptr;
  ASSERT_EQ(sqlite3_open(path.c_str(), &raw), SQLITE_OK);
  char* err = nullptr;
  int rc = sqlite3_exec(raw, sql.c_str(), nullptr, nullptr, &err);
  EXPECT_EQ(rc, SQLITE_OK) << (err ? err : "");
  sqlite3_free(err);
  sqlite3_close(raw);
}

// Row filter that raises an integer overflow when it reaches the row whose
// `column` equals `value`, so the statement fails partway through.
auto failing_filter(std::string_view column, std::string_view value)
    -> std::string {
  return std::format(
      "abs(CASE WHEN {} = '{}' THEN -9223372036854775807 - 1 ELSE 1 END) > 0",
      column, value);
}

auto ids(const std::vector<ScheduledTask>& tasks) -> std::vector<std::string> {
  std::vector<std::string> out;
  for (const auto& t : tasks) {
    out.push_back(t.id.str());
  }
  return out;
}

}  // namespace

class TaskStoreTest : public StoreTest {
protected:
  auto insert(ScheduledTask task) -> ScheduledTask {
    auto r = store_->insert_task(task);
    EXPECT_TRUE(r.has_value());
    return task;
  }

  auto add_execution(const TaskId& task, TimePoint started) -> ExecutionId {
    auto id = store_->begin_execution(task, started, {"Starting"});
    EXPECT_TRUE(id.has_value());
    TaskExecution exec;
    exec.id = *id;
    exec.task_id = task;
    exec.status = ExecutionStatus::Completed;
    exec.started_at = started;
    exec.completed_at = started + milliseconds(5);
    exec.duration = milliseconds(5);
    exec.result = {{"ok", true}};
    exec.logs = {"Starting", "Done"};
    EXPECT_TRUE(store_->finish_execution(exec).has_value());
    return *id;
  }
};

TEST_F(TaskStoreTest, InsertAndGetPreservesDefinition) {
  auto task = make_task("t1");
  task.user_id = UserId{"u1"};
  task.retry_policy = RetryPolicy{.max_retries = 3, .backoff_ms = 250};
  task.notification = {{"onSuccess", true}, {"channels", {"email"}}};
  task.action = AiPromptAction{"summarize", "model-x"};
  insert(task);

  auto loaded = store_->get_task(task.id);
  ASSERT_TRUE(loaded.has_value());
  EXPECT_EQ(loaded->name, task.name);
  EXPECT_EQ(loaded->user_id, task.user_id);
  EXPECT_EQ(loaded->retry_policy, task.retry_policy);
  EXPECT_EQ(loaded->notification, task.notification);
  EXPECT_EQ(loaded->action.type_name(), "ai-prompt");
  EXPECT_EQ(to_millis(*loaded->next_run), to_millis(*task.next_run));
  EXPECT_EQ(loaded->run_count, 0);
}

TEST_F(TaskStoreTest, DuplicateInsertFails) {
  insert(make_task("dup"));
  auto again = store_->insert_task(make_task("dup"));
  ASSERT_FALSE(again.has_value());
  EXPECT_EQ(again.error(), make_error_code(Error::AlreadyExists));
}

TEST_F(TaskStoreTest, GetMissingTaskIsNotFound) {
  auto missing = store_->get_task(task_id("nope"));
  ASSERT_FALSE(missing.has_value());
  EXPECT_EQ(missing.error(), make_error_code(Error::NotFound));
}

TEST_F(TaskStoreTest, SelectDueReturnsOldestFirstUpToLimit) {
  insert(make_task("late", milliseconds(-1000)));
  insert(make_task("early", milliseconds(-5000)));
  insert(make_task("middle", milliseconds(-3000)));
  insert(make_task("future", minutes(10)));

  auto due = store_->select_due_tasks(2, worker_id("w1"), kLease, Clock::now());

  ASSERT_TRUE(due.has_value());
  EXPECT_EQ(ids(*due), (std::vector<std::string>{"early", "middle"}));
}

TEST_F(TaskStoreTest, SelectDueSkipsPausedTriggerAndUnscheduled) {
  auto paused = make_task("paused");
  paused.status = TaskStatus::Paused;
  insert(paused);

  auto trigger = make_task("trigger");
  trigger.type = TaskType::Trigger;
  trigger.trigger = {{"event", "push"}};
  insert(trigger);

  auto unscheduled = make_task("unscheduled");
  unscheduled.next_run.reset();
  insert(unscheduled);

  auto recurring = make_task("recurring");
  recurring.type = TaskType::Recurring;
  recurring.schedule = {{"cron", "* * * * *"}};
  insert(recurring);

  auto due = store_->select_due_tasks(10, worker_id("w1"), kLease, Clock::now());

  ASSERT_TRUE(due.has_value());
  EXPECT_EQ(ids(*due), (std::vector<std::string>{"recurring"}));
}

TEST_F(TaskStoreTest, ClaimedTasksAreNotSelectedTwice) {
  insert(make_task("a"));
  insert(make_task("b"));

  auto now = Clock::now();
  auto first = store_->select_due_tasks(10, worker_id("w1"), kLease, now);
  auto second = store_->select_due_tasks(10, worker_id("w2"), kLease, now);

  ASSERT_TRUE(first.has_value());
  ASSERT_TRUE(second.has_value());
  EXPECT_EQ(first->size(), 2u);
  EXPECT_TRUE(second->empty());
}

TEST_F(TaskStoreTest, ExpiredLeaseCanBeReclaimed) {
  insert(make_task("a"));
  auto now = Clock::now();
  ASSERT_EQ(store_->select_due_tasks(10, worker_id("w1"), kLease, now)->size(),
            1u);

  auto later = now + kLease + milliseconds(1);
  auto again = store_->select_due_tasks(10, worker_id("w2"), kLease, later);

  ASSERT_TRUE(again.has_value());
  EXPECT_EQ(ids(*again), (std::vector<std::string>{"a"}));
}

TEST_F(TaskStoreTest, ClaimsAreExclusiveAcrossConnections) {
  for (int i = 0; i < 20; ++i) {
    insert(make_task("t" + std::to_string(i)));
  }
  SqliteTaskStore other(db_.path());
  ASSERT_TRUE(other.open().has_value());

  std::vector<ScheduledTask> got_a;
  std::vector<ScheduledTask> got_b;
  std::thread ta([&] {
    for (int i = 0; i < 10; ++i) {
      auto batch = store_->select_due_tasks(3, worker_id("a"), kLease, Clock::now());
      ASSERT_TRUE(batch.has_value());
      got_a.insert(got_a.end(), batch->begin(), batch->end());
    }
  });
  std::thread tb([&] {
    for (int i = 0; i < 10; ++i) {
      auto batch = other.select_due_tasks(3, worker_id("b"), kLease, Clock::now());
      ASSERT_TRUE(batch.has_value());
      got_b.insert(got_b.end(), batch->begin(), batch->end());
    }
  });
  ta.join();
  tb.join();

  std::set<std::string> seen;
  for (const auto& t : got_a) {
    EXPECT_TRUE(seen.insert(t.id.str()).second) << "duplicate " << t.id;
  }
  for (const auto& t : got_b) {
    EXPECT_TRUE(seen.insert(t.id.str()).second) << "duplicate " << t.id;
  }
  EXPECT_EQ(seen.size(), 20u);
  other.close();
}

TEST_F(TaskStoreTest, ClaimTaskRejectsForeignClaim) {
  insert(make_task("a"));
  auto now = Clock::now();
  ASSERT_TRUE(store_->claim_task(task_id("a"), worker_id("w1"), kLease, now));

  auto foreign = store_->claim_task(task_id("a"), worker_id("w2"), kLease, now);
  ASSERT_FALSE(foreign.has_value());
  EXPECT_EQ(foreign.error(), make_error_code(Error::AlreadyClaimed));

  auto own = store_->claim_task(task_id("a"), worker_id("w1"), kLease, now);
  EXPECT_TRUE(own.has_value());

  ASSERT_TRUE(store_->release_claim(task_id("a")).has_value());
  EXPECT_TRUE(
      store_->claim_task(task_id("a"), worker_id("w2"), kLease, now).has_value());
}

TEST_F(TaskStoreTest, ClaimTaskMissingIsNotFound) {
  auto r = store_->claim_task(task_id("ghost"), worker_id("w"), kLease,
                              Clock::now());
  ASSERT_FALSE(r.has_value());
  EXPECT_EQ(r.error(), make_error_code(Error::NotFound));
}

TEST_F(TaskStoreTest, RecordRunCompletesOneTimeAndReleasesClaim) {
  insert(make_task("a"));
  auto now = Clock::now();
  ASSERT_EQ(store_->select_due_tasks(1, worker_id("w"), kLease, now)->size(), 1u);

  ASSERT_TRUE(store_->record_run(task_id("a"), now, std::nullopt, true));

  auto task = store_->get_task(task_id("a"));
  ASSERT_TRUE(task.has_value());
  EXPECT_EQ(task->status, TaskStatus::Completed);
  EXPECT_EQ(task->run_count, 1);
  EXPECT_FALSE(task->next_run.has_value());
  ASSERT_TRUE(task->last_run.has_value());
  EXPECT_EQ(to_millis(*task->last_run), to_millis(now));
  EXPECT_TRUE(
      store_->claim_task(task_id("a"), worker_id("other"), kLease, now).has_value());
}

TEST_F(TaskStoreTest, RecordRunKeepsRecurringActive) {
  auto task = make_task("r");
  task.type = TaskType::Recurring;
  insert(task);
  auto now = Clock::now();

  ASSERT_TRUE(store_->record_run(task.id, now, now + minutes(1), false));

  auto loaded = store_->get_task(task.id);
  ASSERT_TRUE(loaded.has_value());
  EXPECT_EQ(loaded->status, TaskStatus::Active);
  EXPECT_EQ(to_millis(*loaded->next_run), to_millis(now + minutes(1)));
}

TEST_F(TaskStoreTest, FailureBookkeeping) {
  insert(make_task("a"));
  auto now = Clock::now();

  ASSERT_TRUE(store_->record_attempt(task_id("a"), now));
  ASSERT_TRUE(store_->reschedule_at(task_id("a"), now + minutes(5)));
  auto task = store_->get_task(task_id("a"));
  ASSERT_TRUE(task.has_value());
  EXPECT_EQ(task->run_count, 1);
  EXPECT_EQ(task->status, TaskStatus::Active);
  EXPECT_EQ(to_millis(*task->next_run), to_millis(now + minutes(5)));

  ASSERT_TRUE(store_->mark_failed(task_id("a")));
  EXPECT_EQ(store_->get_task(task_id("a"))->status, TaskStatus::Failed);

  auto missing = store_->mark_failed(task_id("ghost"));
  ASSERT_FALSE(missing.has_value());
  EXPECT_EQ(missing.error(), make_error_code(Error::NotFound));
}

TEST_F(TaskStoreTest, UnreadableRowIsQuarantined) {
  insert(make_task("bad"));
  insert(make_task("good"));
  {
    sqlite3* raw = nullptr;
    ASSERT_EQ(sqlite3_open(db_.path().c_str(), &raw), SQLITE_OK);
    ASSERT_EQ(sqlite3_exec(raw,
                           "UPDATE scheduled_tasks SET action = "
                           "'{\"type\":\"teleport\"}' WHERE id = 'bad';",
                           nullptr, nullptr, nullptr),
              SQLITE_OK);
    sqlite3_close(raw);
  }

  auto due = store_->select_due_tasks(10, worker_id("w"), kLease, Clock::now());

  ASSERT_TRUE(due.has_value());
  EXPECT_EQ(ids(*due), (std::vector<std::string>{"good"}));
  auto counts = store_->get_counts(minutes(60), Clock::now());
  ASSERT_TRUE(counts.has_value());
  EXPECT_EQ(counts->failed, 1);
}

TEST_F(TaskStoreTest, ExecutionsNewestFirst) {
  insert(make_task("a"));
  auto base = Clock::now();
  add_execution(task_id("a"), base);
  auto newest = add_execution(task_id("a"), base + milliseconds(100));

  auto execs = store_->get_executions(task_id("a"), 10);
  ASSERT_TRUE(execs.has_value());
  ASSERT_EQ(execs->size(), 2u);
  EXPECT_EQ((*execs)[0].id, newest);
  EXPECT_EQ((*execs)[0].status, ExecutionStatus::Completed);
  EXPECT_EQ((*execs)[0].logs, (std::vector<std::string>{"Starting", "Done"}));
  EXPECT_EQ((*execs)[0].result["ok"], true);
  EXPECT_EQ((*execs)[0].duration, milliseconds(5));
}

TEST_F(TaskStoreTest, PruneExecutionHistoryKeepsNewestPerTask) {
  insert(make_task("a"));
  insert(make_task("b"));
  auto base = Clock::now();
  for (int i = 0; i < 5; ++i) {
    add_execution(task_id("a"), base + milliseconds(i));
  }
  add_execution(task_id("b"), base);

  auto deleted = store_->prune_execution_history(2);

  ASSERT_TRUE(deleted.has_value());
  EXPECT_EQ(*deleted, 3);
  auto a = store_->get_executions(task_id("a"), 10);
  ASSERT_TRUE(a.has_value());
  ASSERT_EQ(a->size(), 2u);
  EXPECT_EQ(to_millis((*a)[0].started_at), to_millis(base + milliseconds(4)));
  EXPECT_EQ(store_->get_executions(task_id("b"), 10)->size(), 1u);
}

TEST_F(TaskStoreTest, PruneCompletedOnlyRemovesOldOneTimeTasks) {
  auto now = Clock::now();
  auto old = now - std::chrono::days(40);

  insert(make_task("old-done"));
  ASSERT_TRUE(store_->record_run(task_id("old-done"), old, std::nullopt, true));
  insert(make_task("fresh-done"));
  ASSERT_TRUE(store_->record_run(task_id("fresh-done"), now, std::nullopt, true));
  auto recurring = make_task("old-recurring");
  recurring.type = TaskType::Recurring;
  insert(recurring);
  ASSERT_TRUE(store_->record_run(recurring.id, old, std::nullopt, true));
  insert(make_task("active"));
  add_execution(task_id("old-done"), old);

  auto deleted = store_->prune_completed(30, now);

  ASSERT_TRUE(deleted.has_value());
  EXPECT_EQ(*deleted, 1);
  EXPECT_FALSE(store_->get_task(task_id("old-done")).has_value());
  EXPECT_TRUE(store_->get_task(task_id("fresh-done")).has_value());
  EXPECT_TRUE(store_->get_task(task_id("old-recurring")).has_value());
  EXPECT_TRUE(store_->get_executions(task_id("old-done"), 10)->empty());
}

TEST_F(TaskStoreTest, CountsByStatusAndDueSoon) {
  insert(make_task("due-now"));
  insert(make_task("due-later", std::chrono::hours(3)));
  auto paused = make_task("paused");
  paused.status = TaskStatus::Paused;
  insert(paused);
  insert(make_task("failed"));
  ASSERT_TRUE(store_->mark_failed(task_id("failed")));

  auto counts = store_->get_counts(std::chrono::hours(1), Clock::now());

  ASSERT_TRUE(counts.has_value());
  EXPECT_EQ(counts->active, 2);
  EXPECT_EQ(counts->paused, 1);
  EXPECT_EQ(counts->failed, 1);
  EXPECT_EQ(counts->completed, 0);
  EXPECT_EQ(counts->due_soon, 1);
}

TEST_F(TaskStoreTest, ListFiltersAndUpcoming) {
  auto mine = make_task("mine", minutes(5));
  mine.user_id = UserId{"alice"};
  insert(mine);
  auto sooner = make_task("sooner", minutes(1));
  sooner.user_id = UserId{"alice"};
  insert(sooner);
  auto theirs = make_task("theirs", minutes(2));
  theirs.user_id = UserId{"bob"};
  insert(theirs);

  auto listed = store_->list_tasks(TaskFilter{.user_id = UserId{"alice"}});
  ASSERT_TRUE(listed.has_value());
  EXPECT_EQ(listed->size(), 2u);

  auto upcoming = store_->list_upcoming(UserId{"alice"}, 10);
  ASSERT_TRUE(upcoming.has_value());
  EXPECT_EQ(ids(*upcoming), (std::vector<std::string>{"sooner", "mine"}));

  auto all = store_->list_upcoming(std::nullopt, 2);
  ASSERT_TRUE(all.has_value());
  EXPECT_EQ(ids(*all), (std::vector<std::string>{"sooner", "theirs"}));
}

TEST_F(TaskStoreTest, RenewClaimsExtendsOnlyOwnersLeases) {
  insert(make_task("mine"));
  insert(make_task("theirs"));
  auto now = Clock::now();
  ASSERT_TRUE(store_->claim_task(task_id("mine"), worker_id("w1"), kLease, now));
  ASSERT_TRUE(
      store_->claim_task(task_id("theirs"), worker_id("w2"), kLease, now));

  auto renewed = store_->renew_claims(worker_id("w1"), kLease * 2, now);
  ASSERT_TRUE(renewed.has_value());
  EXPECT_EQ(*renewed, 1);

  // Past the original lease only w2's claim has lapsed.
  auto later = now + kLease + milliseconds(1);
  auto due = store_->select_due_tasks(10, worker_id("w3"), kLease, later);
  ASSERT_TRUE(due.has_value());
  EXPECT_EQ(ids(*due), (std::vector<std::string>{"theirs"}));

  auto none = store_->renew_claims(worker_id("idle"), kLease, now);
  ASSERT_TRUE(none.has_value());
  EXPECT_EQ(*none, 0);
}

TEST_F(TaskStoreTest, ListTasksFailsOnStepError) {
  insert(make_task("bad", minutes(1)));
  insert(make_task("good", minutes(2)));
  exec_raw(db_.path(),
           "ALTER TABLE scheduled_tasks RENAME TO tasks_base;"
           "CREATE VIEW scheduled_tasks AS SELECT * FROM tasks_base WHERE " +
               failing_filter("id", "bad") + ";");

  auto listed = store_->list_tasks(TaskFilter{});
  ASSERT_FALSE(listed.has_value());
  EXPECT_EQ(listed.error(), make_error_code(Error::DatabaseQueryFailed));

  auto upcoming = store_->list_upcoming(std::nullopt, 10);
  ASSERT_FALSE(upcoming.has_value());
  EXPECT_EQ(upcoming.error(), make_error_code(Error::DatabaseQueryFailed));
}

TEST_F(TaskStoreTest, ListTasksKeepsReadableRows) {
  insert(make_task("bad"));
  insert(make_task("good"));
  exec_raw(db_.path(),
           "UPDATE scheduled_tasks SET action = '{\"type\":\"teleport\"}' "
           "WHERE id = 'bad';");

  auto listed = store_->list_tasks(TaskFilter{});
  ASSERT_TRUE(listed.has_value());
  EXPECT_EQ(ids(*listed), (std::vector<std::string>{"good"}));
}

TEST_F(TaskStoreTest, GetExecutionsFailsOnStepError) {
  insert(make_task("a"));
  auto base = Clock::now();
  add_execution(task_id("a"), base);
  auto bad = add_execution(task_id("a"), base - milliseconds(10));
  exec_raw(db_.path(),
           "ALTER TABLE task_executions RENAME TO executions_base;"
           "CREATE VIEW task_executions AS SELECT rowid AS rowid, * "
           "FROM executions_base WHERE " +
               failing_filter("id", bad.value()) + ";");

  auto history = store_->get_executions(task_id("a"), 10);
  ASSERT_FALSE(history.has_value());
  EXPECT_EQ(history.error(), make_error_code(Error::DatabaseQueryFailed));
}

TEST_F(TaskStoreTest, WebhookRegistrationAndTriggerCount) {
  auto task = make_task("hooked");
  task.type = TaskType::Trigger;
  task.next_run.reset();
  insert(task);
  auto now = Clock::now();
  TaskWebhook hook{.id = WebhookId{"wh1"},
                   .task_id = task.id,
                   .secret = "s3cret",
                   .last_triggered = std::nullopt,
                   .trigger_count = 0,
                   .created_at = now};
  ASSERT_TRUE(store_->insert_webhook(hook).has_value());

  ASSERT_TRUE(store_->record_webhook_trigger(hook.id, now + minutes(1)));
  auto loaded = store_->get_webhook(hook.id);
  ASSERT_TRUE(loaded.has_value());
  EXPECT_EQ(loaded->task_id, task.id);
  EXPECT_EQ(loaded->secret, "s3cret");
  EXPECT_EQ(loaded->trigger_count, 1);
  ASSERT_TRUE(loaded->last_triggered.has_value());
  EXPECT_EQ(to_millis(*loaded->last_triggered), to_millis(now + minutes(1)));

  auto missing = store_->get_webhook(WebhookId{"nope"});
  ASSERT_FALSE(missing.has_value());
  EXPECT_EQ(missing.error(), make_error_code(Error::NotFound));

  // Webhooks go away with their task.
  ASSERT_TRUE(store_->delete_task(task.id).has_value());
  auto gone = store_->get_webhook(hook.id);
  ASSERT_FALSE(gone.has_value());
  EXPECT_EQ(gone.error(), make_error_code(Error::NotFound));
}

TEST_F(TaskStoreTest, InterruptedExecutionRoundTrips) {
  insert(make_task("a"));
  auto started = Clock::now();
  auto id = store_->begin_execution(task_id("a"), started, {"Starting"});
  ASSERT_TRUE(id.has_value());
  TaskExecution exec;
  exec.id = *id;
  exec.task_id = task_id("a");
  exec.status = ExecutionStatus::Interrupted;
  exec.started_at = started;
  exec.completed_at = started;
  exec.error = "Execution cancelled";
  ASSERT_TRUE(store_->finish_execution(exec).has_value());

  auto history = store_->get_executions(task_id("a"), 10);
  ASSERT_TRUE(history.has_value());
  ASSERT_EQ(history->size(), 1u);
  EXPECT_EQ(history->front().status, ExecutionStatus::Interrupted);
}

TEST_F(TaskStoreTest, ClosedStoreReportsError) {
  store_->close();
  auto r = store_->get_task(task_id("a"));
  ASSERT_FALSE(r.has_value());
  EXPECT_EQ(r.error(), make_error_code(Error::DatabaseError));
  ASSERT_TRUE(store_->open().has_value());
}

}  // namespace cadence::test
