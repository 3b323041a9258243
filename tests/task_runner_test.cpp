#include "cadence/scheduler/task_runner.hpp"
#include "test_utils.hpp"

#include <gtest/gtest.h>

#include <chrono>
#include <memory>
#include <stdexcept>
#include <vector>

namespace cadence::test {

using json = nlohmann::json;
using namespace std::chrono_literals;

namespace {

class FixedConditions final : public IConditionEvaluator {
public:
  explicit FixedConditions(bool hold) : hold_(hold) {
  }
  auto evaluate(const ScheduledTask&, const ExecutionContext&)
      -> Outcome<bool> override {
    ++calls;
    return hold_;
  }
  int calls{0};

private:
  bool hold_;
};

class ThrowingConditions final : public IConditionEvaluator {
public:
  auto evaluate(const ScheduledTask&, const ExecutionContext&)
      -> Outcome<bool> override {
    throw std::runtime_error("bad expression");
  }
};

struct Notice {
  TaskId task;
  NotificationKind kind;
  json payload;
};

class RecordingSink final : public INotificationSink {
public:
  auto notify(const ScheduledTask& task, NotificationKind kind,
              const json& payload) -> void override {
    notices.push_back(Notice{task.id, kind, payload});
  }
  std::vector<Notice> notices;
};

// Cancels `source` from inside the first completion, as a shutdown arriving
// mid-step would, then answers with `error` or a normal completion.
class CancellingLlm final : public ILlmClient {
public:
  explicit CancellingLlm(CancellationSource source) : source_(std::move(source)) {
  }
  auto complete(const CompletionRequest& request, std::chrono::milliseconds)
      -> Outcome<Completion> override {
    ++calls;
    source_.cancel();
    if (error) {
      return std::unexpected{*error};
    }
    return Completion{.text = "partial", .model = request.model, .usage = {}};
  }
  int calls{0};
  std::optional<ExecutionError> error;

private:
  CancellationSource source_;
};

}  // namespace

class TaskRunnerTest : public StoreTest {
protected:
  void SetUp() override {
    StoreTest::SetUp();
    llm_ = std::make_shared<FakeLlm>();
    Collaborators c;
    c.llm = llm_;
    executor_ = std::make_unique<ActionExecutor>(std::move(c));
  }

  auto runner(std::shared_ptr<IConditionEvaluator> conditions = nullptr,
              std::shared_ptr<INotificationSink> sink = nullptr) -> TaskRunner {
    return TaskRunner(*store_, *executor_, resolver_, std::move(conditions),
                      std::move(sink));
  }

  auto insert(ScheduledTask task) -> ScheduledTask {
    EXPECT_TRUE(store_->insert_task(task).has_value());
    return task;
  }

  std::shared_ptr<FakeLlm> llm_;
  std::unique_ptr<ActionExecutor> executor_;
  DefaultScheduleResolver resolver_{10min};
};

TEST_F(TaskRunnerTest, OneTimeSuccessCompletesTask) {
  auto task = insert(make_task("once"));

  auto exec = runner().run(task, ExecutionContext::unbounded());

  ASSERT_TRUE(exec.has_value());
  EXPECT_EQ(exec->status, ExecutionStatus::Completed);
  EXPECT_EQ(exec->result["operation"], "read");
  EXPECT_TRUE(contains_line(exec->logs, "Starting task execution: task once"));
  EXPECT_TRUE(contains_line(exec->logs, "Executing action: file-operation"));
  EXPECT_TRUE(contains_line(exec->logs, "Task completed successfully in"));

  auto stored = store_->get_task(task.id);
  ASSERT_TRUE(stored.has_value());
  EXPECT_EQ(stored->status, TaskStatus::Completed);
  EXPECT_EQ(stored->run_count, 1);
  EXPECT_FALSE(stored->next_run.has_value());
  EXPECT_TRUE(stored->last_run.has_value());

  auto history = store_->get_executions(task.id, 10);
  ASSERT_TRUE(history.has_value());
  ASSERT_EQ(history->size(), 1u);
  EXPECT_EQ(history->front().status, ExecutionStatus::Completed);
  EXPECT_TRUE(history->front().duration.has_value());
}

TEST_F(TaskRunnerTest, RecurringSuccessStaysActive) {
  auto task = make_task("every");
  task.type = TaskType::Recurring;
  task.schedule = {{"cron", "*/10 * * * *"}};
  insert(task);

  auto before = Clock::now();
  ASSERT_TRUE(runner().run(task, ExecutionContext::unbounded()).has_value());

  auto stored = store_->get_task(task.id);
  ASSERT_TRUE(stored.has_value());
  EXPECT_EQ(stored->status, TaskStatus::Active);
  EXPECT_EQ(stored->run_count, 1);
  ASSERT_TRUE(stored->next_run.has_value());
  EXPECT_GE(to_millis(*stored->next_run), to_millis(before + 10min));
  EXPECT_LE(to_millis(*stored->next_run), to_millis(Clock::now() + 10min));
}

TEST_F(TaskRunnerTest, FailureRecordsFailedExecution) {
  llm_->error = ExecutionError{Error::HttpError, "upstream returned 500"};
  auto task = make_task("ai");
  task.action = AiPromptAction{"summarize", std::nullopt};
  insert(task);

  auto exec = runner().run(task, ExecutionContext::unbounded());

  ASSERT_FALSE(exec.has_value());
  EXPECT_EQ(exec.error().code, Error::HttpError);
  EXPECT_EQ(exec.error().message, "upstream returned 500");

  auto history = store_->get_executions(task.id, 10);
  ASSERT_TRUE(history.has_value());
  ASSERT_EQ(history->size(), 1u);
  const auto& recorded = history->front();
  EXPECT_EQ(recorded.status, ExecutionStatus::Failed);
  EXPECT_EQ(recorded.error, "upstream returned 500");
  EXPECT_TRUE(contains_line(recorded.logs, "Task failed: upstream returned 500"));

  // Retry or terminal failure is the caller's decision.
  auto stored = store_->get_task(task.id);
  ASSERT_TRUE(stored.has_value());
  EXPECT_EQ(stored->status, TaskStatus::Active);
  EXPECT_EQ(stored->run_count, 1);
}

TEST_F(TaskRunnerTest, UnmetConditionsSkipTheAction) {
  auto conditions = std::make_shared<FixedConditions>(false);
  auto task = make_task("guarded");
  task.action = AiPromptAction{"never sent", std::nullopt};
  task.conditions = json::array({{{"field", "weather"}, {"equals", "rain"}}});
  insert(task);

  auto exec = runner(conditions).run(task, ExecutionContext::unbounded());

  ASSERT_TRUE(exec.has_value());
  EXPECT_EQ(conditions->calls, 1);
  EXPECT_TRUE(llm_->requests.empty());
  EXPECT_EQ(exec->status, ExecutionStatus::Completed);
  EXPECT_TRUE(
      contains_line(exec->logs, "Conditions not met, skipping execution"));
  EXPECT_EQ(store_->get_task(task.id)->status, TaskStatus::Completed);
}

TEST_F(TaskRunnerTest, EmptyConditionsAreNotEvaluated) {
  auto conditions = std::make_shared<FixedConditions>(false);
  auto task = insert(make_task("plain"));

  ASSERT_TRUE(runner(conditions).run(task, ExecutionContext::unbounded())
                  .has_value());
  EXPECT_EQ(conditions->calls, 0);
}

TEST_F(TaskRunnerTest, ThrowingConditionsFailTheRun) {
  auto task = make_task("broken");
  task.conditions = json{{"expr", "1 +"}};
  insert(task);

  auto exec = runner(std::make_shared<ThrowingConditions>())
                  .run(task, ExecutionContext::unbounded());

  ASSERT_FALSE(exec.has_value());
  EXPECT_EQ(exec.error().code, Error::ExecutionFailed);
  EXPECT_EQ(exec.error().message, "Condition evaluation failed: bad expression");
}

TEST_F(TaskRunnerTest, NotifiesAccordingToPreferences) {
  auto sink = std::make_shared<RecordingSink>();

  auto ok_task = make_task("notify-ok");
  ok_task.notification = {{"onSuccess", true}, {"onFailure", false}};
  insert(ok_task);
  ASSERT_TRUE(runner(nullptr, sink)
                  .run(ok_task, ExecutionContext::unbounded())
                  .has_value());

  llm_->error = ExecutionError{Error::Timeout, "model timed out"};
  auto bad_task = make_task("notify-bad");
  bad_task.action = AiPromptAction{"hi", std::nullopt};
  bad_task.notification = {{"onSuccess", false},
                           {"onFailure", {{"channels", {"email"}}}}};
  insert(bad_task);
  ASSERT_FALSE(runner(nullptr, sink)
                   .run(bad_task, ExecutionContext::unbounded())
                   .has_value());

  auto quiet = make_task("quiet");
  insert(quiet);
  ASSERT_TRUE(runner(nullptr, sink)
                  .run(quiet, ExecutionContext::unbounded())
                  .has_value());

  ASSERT_EQ(sink->notices.size(), 2u);
  EXPECT_EQ(sink->notices[0].task, ok_task.id);
  EXPECT_EQ(sink->notices[0].kind, NotificationKind::Success);
  EXPECT_EQ(sink->notices[0].payload["operation"], "read");
  EXPECT_EQ(sink->notices[1].task, bad_task.id);
  EXPECT_EQ(sink->notices[1].kind, NotificationKind::Failure);
  EXPECT_EQ(sink->notices[1].payload, "model timed out");
}

TEST_F(TaskRunnerTest, CancelledContextLeavesStoreUntouched) {
  auto task = insert(make_task("cancelled"));
  CancellationSource source;
  source.cancel();

  auto exec = runner().run(task, ExecutionContext(1min, source.token()));

  ASSERT_FALSE(exec.has_value());
  EXPECT_EQ(exec.error().code, Error::Cancelled);
  EXPECT_TRUE(store_->get_executions(task.id, 10)->empty());
  EXPECT_EQ(store_->get_task(task.id)->run_count, 0);
}

TEST_F(TaskRunnerTest, CancellationMidChainIsAnInterruption) {
  CancellationSource source;
  auto llm = std::make_shared<CancellingLlm>(source);
  Collaborators c;
  c.llm = llm;
  ActionExecutor executor(std::move(c));
  auto sink = std::make_shared<RecordingSink>();
  TaskRunner cancelling(*store_, executor, resolver_, nullptr, sink);

  auto task = make_task("chain");
  task.action = ChainAction{{TaskAction{AiPromptAction{"first", std::nullopt}},
                             TaskAction{AiPromptAction{"second", std::nullopt}}}};
  task.notification = {{"onFailure", true}};
  insert(task);

  auto exec = cancelling.run(task, ExecutionContext(1min, source.token()));

  ASSERT_FALSE(exec.has_value());
  EXPECT_EQ(exec.error().code, Error::Cancelled);
  EXPECT_EQ(llm->calls, 1);
  EXPECT_TRUE(sink->notices.empty());

  auto stored = store_->get_task(task.id);
  ASSERT_TRUE(stored.has_value());
  EXPECT_EQ(stored->run_count, 0);
  EXPECT_FALSE(stored->last_run.has_value());
  EXPECT_EQ(stored->status, TaskStatus::Active);

  auto history = store_->get_executions(task.id, 10);
  ASSERT_TRUE(history.has_value());
  ASSERT_EQ(history->size(), 1u);
  EXPECT_EQ(history->front().status, ExecutionStatus::Interrupted);
  EXPECT_TRUE(contains_line(history->front().logs, "Task interrupted:"));
}

TEST_F(TaskRunnerTest, StepFailingAfterCancellationIsAnInterruption) {
  CancellationSource source;
  auto llm = std::make_shared<CancellingLlm>(source);
  llm->error = ExecutionError{Error::NetworkError, "connection reset"};
  Collaborators c;
  c.llm = llm;
  ActionExecutor executor(std::move(c));
  TaskRunner cancelling(*store_, executor, resolver_);

  auto task = make_task("torn-down");
  task.action = AiPromptAction{"first", std::nullopt};
  insert(task);

  auto exec = cancelling.run(task, ExecutionContext(1min, source.token()));

  ASSERT_FALSE(exec.has_value());
  EXPECT_EQ(exec.error().code, Error::Cancelled);
  EXPECT_EQ(exec.error().message, "Execution cancelled: connection reset");
  EXPECT_EQ(store_->get_task(task.id)->run_count, 0);
  EXPECT_EQ(store_->get_executions(task.id, 10)->front().status,
            ExecutionStatus::Interrupted);
}

TEST_F(TaskRunnerTest, TriggerPayloadIsLogged) {
  auto task = insert(make_task("triggered"));

  auto exec = runner().run(task, ExecutionContext::unbounded(),
                           json{{"event", "push"}});

  ASSERT_TRUE(exec.has_value());
  EXPECT_TRUE(contains_line(exec->logs, R"(Trigger payload: {"event":"push"})"));
}

}  // namespace cadence::test
