#pragma once

#include "cadence/storage/task_store.hpp"

#include <memory>
#include <mutex>
#include <string>
#include <string_view>
#include <utility>

struct sqlite3;
struct sqlite3_stmt;

namespace cadence {

// SQLite-backed task store. One instance owns one connection; operations on
// an instance are serialized by a mutex. Exclusive claims across instances
// (and processes) rely on BEGIN IMMEDIATE plus claimed_by/claimed_until
// columns.
class SqliteTaskStore final : public ITaskStore {
public:
  explicit SqliteTaskStore(std::string_view db_path, int busy_timeout_ms = 5000);
  ~SqliteTaskStore() override;

  SqliteTaskStore(const SqliteTaskStore&) = delete;
  SqliteTaskStore& operator=(const SqliteTaskStore&) = delete;

  [[nodiscard]] auto open() -> Result<void>;
  auto close() -> void;
  [[nodiscard]] auto is_open() const noexcept -> bool {
    return db_ != nullptr;
  }

  [[nodiscard]] auto select_due_tasks(std::size_t limit, const WorkerId& owner,
                                      std::chrono::milliseconds lease,
                                      TimePoint now)
      -> Result<std::vector<ScheduledTask>> override;
  [[nodiscard]] auto claim_task(const TaskId& id, const WorkerId& owner,
                                std::chrono::milliseconds lease, TimePoint now)
      -> Result<ScheduledTask> override;
  [[nodiscard]] auto release_claim(const TaskId& id) -> Result<void> override;
  [[nodiscard]] auto renew_claims(const WorkerId& owner,
                                  std::chrono::milliseconds lease,
                                  TimePoint now)
      -> Result<std::int64_t> override;

  [[nodiscard]] auto mark_failed(const TaskId& id) -> Result<void> override;
  [[nodiscard]] auto reschedule_at(const TaskId& id, TimePoint at)
      -> Result<void> override;
  [[nodiscard]] auto record_run(const TaskId& id, TimePoint finished_at,
                                std::optional<TimePoint> next_run,
                                bool complete) -> Result<void> override;
  [[nodiscard]] auto record_attempt(const TaskId& id, TimePoint finished_at)
      -> Result<void> override;

  [[nodiscard]] auto prune_completed(int older_than_days, TimePoint now)
      -> Result<std::int64_t> override;
  [[nodiscard]] auto prune_execution_history(int keep_per_task)
      -> Result<std::int64_t> override;
  [[nodiscard]] auto get_counts(std::chrono::milliseconds due_within,
                                TimePoint now) -> Result<TaskCounts> override;

  [[nodiscard]] auto insert_task(const ScheduledTask& task)
      -> Result<void> override;
  [[nodiscard]] auto update_task(const ScheduledTask& task)
      -> Result<void> override;
  [[nodiscard]] auto delete_task(const TaskId& id) -> Result<void> override;
  [[nodiscard]] auto get_task(const TaskId& id)
      -> Result<ScheduledTask> override;
  [[nodiscard]] auto list_tasks(const TaskFilter& filter)
      -> Result<std::vector<ScheduledTask>> override;
  [[nodiscard]] auto list_upcoming(const std::optional<UserId>& user,
                                   std::size_t limit)
      -> Result<std::vector<ScheduledTask>> override;
  [[nodiscard]] auto set_status(const TaskId& id, TaskStatus status,
                                TimePoint now) -> Result<void> override;
  [[nodiscard]] auto set_next_run(const TaskId& id,
                                  std::optional<TimePoint> next_run)
      -> Result<void> override;

  [[nodiscard]] auto begin_execution(const TaskId& task_id,
                                     TimePoint started_at,
                                     const std::vector<std::string>& logs)
      -> Result<ExecutionId> override;
  [[nodiscard]] auto finish_execution(const TaskExecution& exec)
      -> Result<void> override;
  [[nodiscard]] auto get_executions(const TaskId& task_id, std::size_t limit)
      -> Result<std::vector<TaskExecution>> override;

  [[nodiscard]] auto insert_webhook(const TaskWebhook& hook)
      -> Result<void> override;
  [[nodiscard]] auto get_webhook(const WebhookId& id)
      -> Result<TaskWebhook> override;
  [[nodiscard]] auto record_webhook_trigger(const WebhookId& id, TimePoint at)
      -> Result<void> override;

private:
  class Statement {
  public:
    explicit Statement(sqlite3_stmt* stmt = nullptr) noexcept : stmt_(stmt) {
    }
    ~Statement();
    Statement(Statement&& other) noexcept
        : stmt_(std::exchange(other.stmt_, nullptr)) {
    }
    Statement& operator=(Statement&& other) noexcept {
      if (this != &other) {
        reset();
        stmt_ = std::exchange(other.stmt_, nullptr);
      }
      return *this;
    }
    Statement(const Statement&) = delete;
    Statement& operator=(const Statement&) = delete;

    [[nodiscard]] auto get() const noexcept -> sqlite3_stmt* {
      return stmt_;
    }
    auto reset() -> void;

  private:
    sqlite3_stmt* stmt_ = nullptr;
  };

  struct DbDeleter {
    void operator()(sqlite3* db) const;
  };

  // Callers hold mu_.
  [[nodiscard]] auto create_tables() -> Result<void>;
  [[nodiscard]] auto execute(std::string_view sql) -> Result<void>;
  [[nodiscard]] auto prepare(const char* sql) -> Result<Statement>;
  [[nodiscard]] auto step_done(Statement& stmt) -> Result<void>;
  [[nodiscard]] auto step_changed(Statement& stmt) -> Result<void>;
  [[nodiscard]] auto read_task(sqlite3_stmt* stmt) -> Result<ScheduledTask>;
  [[nodiscard]] auto read_tasks(Statement& stmt, std::string_view what)
      -> Result<std::vector<ScheduledTask>>;
  [[nodiscard]] auto load_task(const TaskId& id) -> Result<ScheduledTask>;
  [[nodiscard]] auto stamp_claim(const TaskId& id, const WorkerId& owner,
                                 TimePoint until) -> Result<void>;
  [[nodiscard]] auto quarantine(const TaskId& id, TimePoint now)
      -> Result<void>;
  auto rollback() -> void;

  std::string db_path_;
  int busy_timeout_ms_;
  std::unique_ptr<sqlite3, DbDeleter> db_{nullptr};
  mutable std::mutex mu_;
};

}  // namespace cadence
