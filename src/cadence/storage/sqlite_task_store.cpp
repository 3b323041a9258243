#include "cadence/storage/sqlite_task_store.hpp"

#include "cadence/util/log.hpp"

#include <nlohmann/json.hpp>
#include <sqlite3.h>

#include <string>

namespace cadence {

namespace {

using json = nlohmann::json;

constexpr const char* kTaskColumns = R"(
  id, user_id, name, description, type, schedule, trigger_config, action,
  conditions, retry_max, retry_backoff_ms, notification, status,
  last_run_at, next_run_at, run_count, created_at, updated_at
)";

constexpr const char* kExecutionColumns = R"(
  id, task_id, status, started_at, completed_at, duration_ms, result, error,
  logs
)";

constexpr const char* kWebhookColumns = R"(
  id, task_id, secret, last_triggered_at, trigger_count, created_at
)";

auto bind_text(sqlite3_stmt* stmt, int idx, std::string_view text) -> void {
  sqlite3_bind_text(stmt, idx, text.data(), static_cast<int>(text.size()),
                    SQLITE_TRANSIENT);
}

auto bind_json(sqlite3_stmt* stmt, int idx, const json& value) -> void {
  if (value.is_null()) {
    sqlite3_bind_null(stmt, idx);
  } else {
    bind_text(stmt, idx, value.dump());
  }
}

auto bind_time(sqlite3_stmt* stmt, int idx, std::optional<TimePoint> tp)
    -> void {
  if (tp) {
    sqlite3_bind_int64(stmt, idx, to_millis(*tp));
  } else {
    sqlite3_bind_null(stmt, idx);
  }
}

auto col_text(sqlite3_stmt* stmt, int col) -> std::string {
  auto* p = reinterpret_cast<const char*>(sqlite3_column_text(stmt, col));
  return p ? p : "";
}

auto col_is_null(sqlite3_stmt* stmt, int col) -> bool {
  return sqlite3_column_type(stmt, col) == SQLITE_NULL;
}

auto col_time(sqlite3_stmt* stmt, int col) -> std::optional<TimePoint> {
  if (col_is_null(stmt, col)) {
    return std::nullopt;
  }
  return from_millis(sqlite3_column_int64(stmt, col));
}

auto col_json(sqlite3_stmt* stmt, int col) -> json {
  if (col_is_null(stmt, col)) {
    return json();
  }
  auto parsed = json::parse(col_text(stmt, col), nullptr, false);
  return parsed.is_discarded() ? json() : parsed;
}

}  // namespace

auto SqliteTaskStore::DbDeleter::operator()(sqlite3* db) const -> void {
  if (db)
    sqlite3_close(db);
}

SqliteTaskStore::Statement::~Statement() {
  reset();
}

auto SqliteTaskStore::Statement::reset() -> void {
  if (stmt_) {
    sqlite3_finalize(stmt_);
    stmt_ = nullptr;
  }
}

SqliteTaskStore::SqliteTaskStore(std::string_view db_path, int busy_timeout_ms)
    : db_path_(db_path), busy_timeout_ms_(busy_timeout_ms) {
}

SqliteTaskStore::~SqliteTaskStore() {
  close();
}

auto SqliteTaskStore::open() -> Result<void> {
  std::lock_guard lock(mu_);
  if (db_) {
    return ok();
  }

  sqlite3* raw_db = nullptr;
  int rc = sqlite3_open(db_path_.c_str(), &raw_db);
  if (rc != SQLITE_OK) {
    log::error("Failed to open database: {}",
               raw_db ? sqlite3_errmsg(raw_db) : "out of memory");
    if (raw_db) {
      sqlite3_close(raw_db);
    }
    return fail(Error::DatabaseOpenFailed);
  }
  db_.reset(raw_db);
  sqlite3_busy_timeout(db_.get(), busy_timeout_ms_);

  // PRAGMA failures are not fatal; the store still works without them.
  if (auto r = execute("PRAGMA journal_mode=WAL;"); !r) {
    log::warn("Failed to set WAL mode: {}", r.error().message());
  }
  if (auto r = execute("PRAGMA synchronous=NORMAL;"); !r) {
    log::warn("Failed to set synchronous mode: {}", r.error().message());
  }
  if (auto r = execute("PRAGMA foreign_keys=ON;"); !r) {
    log::warn("Failed to enable foreign keys: {}", r.error().message());
  }

  if (auto r = create_tables(); !r) {
    db_.reset();
    return r;
  }

  log::info("Database opened: {}", db_path_);
  return ok();
}

auto SqliteTaskStore::close() -> void {
  std::lock_guard lock(mu_);
  db_.reset();
}

auto SqliteTaskStore::create_tables() -> Result<void> {
  const char* sql = R"(
    CREATE TABLE IF NOT EXISTS scheduled_tasks (
      id TEXT PRIMARY KEY,
      user_id TEXT,
      name TEXT NOT NULL,
      description TEXT NOT NULL DEFAULT '',
      type TEXT NOT NULL CHECK (type IN ('one-time', 'recurring', 'trigger')),
      schedule TEXT NOT NULL DEFAULT '{}',
      trigger_config TEXT,
      action TEXT NOT NULL,
      conditions TEXT,
      retry_max INTEGER CHECK (retry_max IS NULL OR retry_max >= 0),
      retry_backoff_ms INTEGER CHECK (retry_backoff_ms IS NULL OR retry_backoff_ms > 0),
      notification TEXT,
      status TEXT NOT NULL DEFAULT 'active'
        CHECK (status IN ('active', 'paused', 'completed', 'failed')),
      last_run_at INTEGER,
      next_run_at INTEGER,
      run_count INTEGER NOT NULL DEFAULT 0 CHECK (run_count >= 0),
      created_at INTEGER NOT NULL,
      updated_at INTEGER NOT NULL,
      claimed_by TEXT,
      claimed_until INTEGER
    );

    CREATE INDEX IF NOT EXISTS idx_scheduled_tasks_due
      ON scheduled_tasks(status, next_run_at);
    CREATE INDEX IF NOT EXISTS idx_scheduled_tasks_user
      ON scheduled_tasks(user_id);

    CREATE TABLE IF NOT EXISTS task_executions (
      id TEXT PRIMARY KEY,
      task_id TEXT NOT NULL,
      status TEXT NOT NULL
        CHECK (status IN ('running', 'completed', 'failed', 'interrupted')),
      started_at INTEGER NOT NULL,
      completed_at INTEGER,
      duration_ms INTEGER,
      result TEXT,
      error TEXT,
      logs TEXT NOT NULL DEFAULT '[]',
      FOREIGN KEY (task_id) REFERENCES scheduled_tasks(id) ON DELETE CASCADE
    );

    CREATE INDEX IF NOT EXISTS idx_task_executions_task
      ON task_executions(task_id, started_at DESC);

    CREATE TABLE IF NOT EXISTS task_webhooks (
      id TEXT PRIMARY KEY,
      task_id TEXT NOT NULL,
      secret TEXT NOT NULL,
      last_triggered_at INTEGER,
      trigger_count INTEGER NOT NULL DEFAULT 0,
      created_at INTEGER NOT NULL,
      FOREIGN KEY (task_id) REFERENCES scheduled_tasks(id) ON DELETE CASCADE
    );

    CREATE INDEX IF NOT EXISTS idx_task_webhooks_task
      ON task_webhooks(task_id);
  )";

  return execute(sql);
}

auto SqliteTaskStore::execute(std::string_view sql) -> Result<void> {
  if (!db_) {
    return fail(Error::DatabaseError);
  }
  char* err_msg = nullptr;
  std::string sql_str{sql};
  int rc = sqlite3_exec(db_.get(), sql_str.c_str(), nullptr, nullptr, &err_msg);
  if (rc != SQLITE_OK) {
    log::error("SQL error: {}", err_msg ? err_msg : sqlite3_errstr(rc));
    sqlite3_free(err_msg);
    return fail(Error::DatabaseQueryFailed);
  }
  return ok();
}

auto SqliteTaskStore::prepare(const char* sql) -> Result<Statement> {
  if (!db_) {
    log::error("Task store used before open()");
    return fail(Error::DatabaseError);
  }
  sqlite3_stmt* stmt = nullptr;
  if (sqlite3_prepare_v2(db_.get(), sql, -1, &stmt, nullptr) != SQLITE_OK) {
    log::error("Failed to prepare statement: {}", sqlite3_errmsg(db_.get()));
    return fail(Error::DatabaseQueryFailed);
  }
  return Statement(stmt);
}

auto SqliteTaskStore::step_done(Statement& stmt) -> Result<void> {
  int rc = sqlite3_step(stmt.get());
  if (rc == SQLITE_DONE) {
    return ok();
  }
  log::error("SQL step failed: {}", sqlite3_errmsg(db_.get()));
  if ((rc & 0xff) == SQLITE_CONSTRAINT) {
    return fail(Error::AlreadyExists);
  }
  return fail(Error::DatabaseQueryFailed);
}

auto SqliteTaskStore::step_changed(Statement& stmt) -> Result<void> {
  if (auto r = step_done(stmt); !r) {
    return r;
  }
  if (sqlite3_changes(db_.get()) == 0) {
    return fail(Error::NotFound);
  }
  return ok();
}

auto SqliteTaskStore::rollback() -> void {
  if (auto r = execute("ROLLBACK;"); !r) {
    log::warn("Rollback failed: {}", r.error().message());
  }
}

auto SqliteTaskStore::read_task(sqlite3_stmt* stmt) -> Result<ScheduledTask> {
  ScheduledTask task;
  task.id = TaskId{col_text(stmt, 0)};
  if (!col_is_null(stmt, 1)) {
    task.user_id = UserId{col_text(stmt, 1)};
  }
  task.name = col_text(stmt, 2);
  task.description = col_text(stmt, 3);

  auto type = parse_task_type(col_text(stmt, 4));
  auto status = parse_task_status(col_text(stmt, 12));
  if (!type || !status) {
    log::error("Task {} has an unknown type or status", task.id);
    return fail(Error::ParseError);
  }
  task.type = *type;
  task.status = *status;

  task.schedule = col_json(stmt, 5);
  if (task.schedule.is_null()) {
    task.schedule = json::object();
  }
  task.trigger = col_json(stmt, 6);

  auto action = action_from_json(col_json(stmt, 7));
  if (!action) {
    log::error("Task {} has an unreadable action", task.id);
    return fail(action.error());
  }
  task.action = std::move(*action);

  task.conditions = col_json(stmt, 8);
  if (!col_is_null(stmt, 9) && !col_is_null(stmt, 10)) {
    task.retry_policy = RetryPolicy{sqlite3_column_int(stmt, 9),
                                    sqlite3_column_int64(stmt, 10)};
  }
  task.notification = col_json(stmt, 11);
  task.last_run = col_time(stmt, 13);
  task.next_run = col_time(stmt, 14);
  task.run_count = sqlite3_column_int(stmt, 15);
  task.created_at = from_millis(sqlite3_column_int64(stmt, 16));
  task.updated_at = from_millis(sqlite3_column_int64(stmt, 17));
  return ok(std::move(task));
}

// Drains a task query. A step error fails the whole read rather than
// returning the rows seen so far; undecodable rows are logged and skipped.
auto SqliteTaskStore::read_tasks(Statement& stmt, std::string_view what)
    -> Result<std::vector<ScheduledTask>> {
  std::vector<ScheduledTask> tasks;
  int rc = SQLITE_ROW;
  while ((rc = sqlite3_step(stmt.get())) == SQLITE_ROW) {
    if (auto task = read_task(stmt.get())) {
      tasks.push_back(std::move(*task));
    } else {
      log::warn("Skipping unreadable task {} while listing {}",
                col_text(stmt.get(), 0), what);
    }
  }
  if (rc != SQLITE_DONE) {
    log::error("Failed to list {}: {}", what, sqlite3_errmsg(db_.get()));
    return fail(Error::DatabaseQueryFailed);
  }
  return tasks;
}

auto SqliteTaskStore::load_task(const TaskId& id) -> Result<ScheduledTask> {
  auto sql = std::string("SELECT ") + kTaskColumns +
             " FROM scheduled_tasks WHERE id = ?;";
  auto stmt = prepare(sql.c_str());
  if (!stmt)
    return std::unexpected(stmt.error());

  bind_text(stmt->get(), 1, id.value());
  int rc = sqlite3_step(stmt->get());
  if (rc == SQLITE_DONE) {
    return fail(Error::NotFound);
  }
  if (rc != SQLITE_ROW) {
    log::error("Failed to load task {}: {}", id, sqlite3_errmsg(db_.get()));
    return fail(Error::DatabaseQueryFailed);
  }
  return read_task(stmt->get());
}

auto SqliteTaskStore::stamp_claim(const TaskId& id, const WorkerId& owner,
                                  TimePoint until) -> Result<void> {
  auto stmt = prepare(
      "UPDATE scheduled_tasks SET claimed_by = ?, claimed_until = ? "
      "WHERE id = ?;");
  if (!stmt)
    return std::unexpected(stmt.error());

  bind_text(stmt->get(), 1, owner.value());
  sqlite3_bind_int64(stmt->get(), 2, to_millis(until));
  bind_text(stmt->get(), 3, id.value());
  return step_changed(*stmt);
}

// A row whose definition no longer decodes can never run; park it as failed
// so that it stops being selected.
auto SqliteTaskStore::quarantine(const TaskId& id, TimePoint now)
    -> Result<void> {
  auto stmt = prepare(
      "UPDATE scheduled_tasks SET status = 'failed', updated_at = ?, "
      "claimed_by = NULL, claimed_until = NULL WHERE id = ?;");
  if (!stmt)
    return std::unexpected(stmt.error());

  sqlite3_bind_int64(stmt->get(), 1, to_millis(now));
  bind_text(stmt->get(), 2, id.value());
  return step_done(*stmt);
}

auto SqliteTaskStore::select_due_tasks(std::size_t limit, const WorkerId& owner,
                                       std::chrono::milliseconds lease,
                                       TimePoint now)
    -> Result<std::vector<ScheduledTask>> {
  std::lock_guard lock(mu_);
  if (limit == 0) {
    return std::vector<ScheduledTask>{};
  }

  if (auto r = execute("BEGIN IMMEDIATE;"); !r) {
    return std::unexpected(r.error());
  }

  std::vector<ScheduledTask> tasks;
  std::vector<TaskId> unreadable;
  {
    auto sql = std::string("SELECT ") + kTaskColumns + R"(
      FROM scheduled_tasks
      WHERE status = 'active'
        AND type IN ('one-time', 'recurring')
        AND next_run_at IS NOT NULL
        AND next_run_at <= ?1
        AND (claimed_by IS NULL OR claimed_until IS NULL OR claimed_until <= ?1)
      ORDER BY next_run_at ASC
      LIMIT ?2;
    )";
    auto stmt = prepare(sql.c_str());
    if (!stmt) {
      rollback();
      return std::unexpected(stmt.error());
    }

    sqlite3_bind_int64(stmt->get(), 1, to_millis(now));
    sqlite3_bind_int64(stmt->get(), 2, static_cast<sqlite3_int64>(limit));

    int rc = SQLITE_ROW;
    while ((rc = sqlite3_step(stmt->get())) == SQLITE_ROW) {
      if (auto task = read_task(stmt->get())) {
        tasks.push_back(std::move(*task));
      } else {
        unreadable.emplace_back(col_text(stmt->get(), 0));
      }
    }
    if (rc != SQLITE_DONE) {
      log::error("Failed to select due tasks: {}", sqlite3_errmsg(db_.get()));
      stmt->reset();
      rollback();
      return fail(Error::DatabaseQueryFailed);
    }
  }

  for (const auto& id : unreadable) {
    if (auto r = quarantine(id, now); !r) {
      rollback();
      return std::unexpected(r.error());
    }
  }

  auto until = now + lease;
  for (const auto& task : tasks) {
    if (auto r = stamp_claim(task.id, owner, until); !r) {
      rollback();
      return std::unexpected(r.error());
    }
  }

  if (auto r = execute("COMMIT;"); !r) {
    rollback();
    return std::unexpected(r.error());
  }
  return tasks;
}

auto SqliteTaskStore::claim_task(const TaskId& id, const WorkerId& owner,
                                 std::chrono::milliseconds lease, TimePoint now)
    -> Result<ScheduledTask> {
  std::lock_guard lock(mu_);
  if (auto r = execute("BEGIN IMMEDIATE;"); !r) {
    return std::unexpected(r.error());
  }

  bool held_elsewhere = false;
  {
    auto stmt = prepare(
        "SELECT claimed_by, claimed_until FROM scheduled_tasks WHERE id = ?;");
    if (!stmt) {
      rollback();
      return std::unexpected(stmt.error());
    }
    bind_text(stmt->get(), 1, id.value());
    int rc = sqlite3_step(stmt->get());
    if (rc != SQLITE_ROW) {
      stmt->reset();
      rollback();
      return fail(rc == SQLITE_DONE ? Error::NotFound
                                    : Error::DatabaseQueryFailed);
    }
    if (!col_is_null(stmt->get(), 0) && !col_is_null(stmt->get(), 1)) {
      auto holder = col_text(stmt->get(), 0);
      auto until = sqlite3_column_int64(stmt->get(), 1);
      held_elsewhere = holder != owner.value() && until > to_millis(now);
    }
  }

  if (held_elsewhere) {
    rollback();
    return fail(Error::AlreadyClaimed);
  }

  auto task = load_task(id);
  if (!task) {
    rollback();
    return std::unexpected(task.error());
  }
  if (auto r = stamp_claim(id, owner, now + lease); !r) {
    rollback();
    return std::unexpected(r.error());
  }
  if (auto r = execute("COMMIT;"); !r) {
    rollback();
    return std::unexpected(r.error());
  }
  return task;
}

auto SqliteTaskStore::release_claim(const TaskId& id) -> Result<void> {
  std::lock_guard lock(mu_);
  auto stmt = prepare(
      "UPDATE scheduled_tasks SET claimed_by = NULL, claimed_until = NULL "
      "WHERE id = ?;");
  if (!stmt)
    return std::unexpected(stmt.error());

  bind_text(stmt->get(), 1, id.value());
  return step_changed(*stmt);
}

auto SqliteTaskStore::renew_claims(const WorkerId& owner,
                                   std::chrono::milliseconds lease,
                                   TimePoint now) -> Result<std::int64_t> {
  std::lock_guard lock(mu_);
  auto stmt = prepare(
      "UPDATE scheduled_tasks SET claimed_until = ? WHERE claimed_by = ?;");
  if (!stmt)
    return std::unexpected(stmt.error());

  sqlite3_bind_int64(stmt->get(), 1, to_millis(now + lease));
  bind_text(stmt->get(), 2, owner.value());
  if (auto r = step_done(*stmt); !r) {
    return std::unexpected(r.error());
  }
  return static_cast<std::int64_t>(sqlite3_changes(db_.get()));
}

auto SqliteTaskStore::mark_failed(const TaskId& id) -> Result<void> {
  std::lock_guard lock(mu_);
  auto stmt = prepare(R"(
    UPDATE scheduled_tasks
    SET status = 'failed', updated_at = ?, claimed_by = NULL,
        claimed_until = NULL
    WHERE id = ?;
  )");
  if (!stmt)
    return std::unexpected(stmt.error());

  sqlite3_bind_int64(stmt->get(), 1, to_millis(Clock::now()));
  bind_text(stmt->get(), 2, id.value());
  return step_changed(*stmt);
}

auto SqliteTaskStore::reschedule_at(const TaskId& id, TimePoint at)
    -> Result<void> {
  std::lock_guard lock(mu_);
  auto stmt = prepare(R"(
    UPDATE scheduled_tasks
    SET next_run_at = ?, updated_at = ?, claimed_by = NULL,
        claimed_until = NULL
    WHERE id = ?;
  )");
  if (!stmt)
    return std::unexpected(stmt.error());

  sqlite3_bind_int64(stmt->get(), 1, to_millis(at));
  sqlite3_bind_int64(stmt->get(), 2, to_millis(Clock::now()));
  bind_text(stmt->get(), 3, id.value());
  return step_changed(*stmt);
}

auto SqliteTaskStore::record_run(const TaskId& id, TimePoint finished_at,
                                 std::optional<TimePoint> next_run,
                                 bool complete) -> Result<void> {
  std::lock_guard lock(mu_);
  auto stmt = prepare(R"(
    UPDATE scheduled_tasks
    SET last_run_at = ?1,
        run_count = run_count + 1,
        next_run_at = ?2,
        status = CASE WHEN ?3 THEN 'completed' ELSE status END,
        updated_at = ?1,
        claimed_by = NULL,
        claimed_until = NULL
    WHERE id = ?4;
  )");
  if (!stmt)
    return std::unexpected(stmt.error());

  sqlite3_bind_int64(stmt->get(), 1, to_millis(finished_at));
  bind_time(stmt->get(), 2, next_run);
  sqlite3_bind_int(stmt->get(), 3, complete ? 1 : 0);
  bind_text(stmt->get(), 4, id.value());
  return step_changed(*stmt);
}

auto SqliteTaskStore::record_attempt(const TaskId& id, TimePoint finished_at)
    -> Result<void> {
  std::lock_guard lock(mu_);
  auto stmt = prepare(R"(
    UPDATE scheduled_tasks
    SET last_run_at = ?1, run_count = run_count + 1, updated_at = ?1
    WHERE id = ?2;
  )");
  if (!stmt)
    return std::unexpected(stmt.error());

  sqlite3_bind_int64(stmt->get(), 1, to_millis(finished_at));
  bind_text(stmt->get(), 2, id.value());
  return step_changed(*stmt);
}

auto SqliteTaskStore::prune_completed(int older_than_days, TimePoint now)
    -> Result<std::int64_t> {
  std::lock_guard lock(mu_);
  auto stmt = prepare(R"(
    DELETE FROM scheduled_tasks
    WHERE type = 'one-time' AND status = 'completed' AND updated_at < ?;
  )");
  if (!stmt)
    return std::unexpected(stmt.error());

  auto cutoff = now - std::chrono::days(older_than_days);
  sqlite3_bind_int64(stmt->get(), 1, to_millis(cutoff));
  if (auto r = step_done(*stmt); !r) {
    return std::unexpected(r.error());
  }
  return static_cast<std::int64_t>(sqlite3_changes(db_.get()));
}

auto SqliteTaskStore::prune_execution_history(int keep_per_task)
    -> Result<std::int64_t> {
  std::lock_guard lock(mu_);
  auto stmt = prepare(R"(
    DELETE FROM task_executions
    WHERE id IN (
      SELECT id FROM (
        SELECT id, ROW_NUMBER() OVER (
          PARTITION BY task_id ORDER BY started_at DESC, rowid DESC
        ) AS rn
        FROM task_executions
      ) WHERE rn > ?
    );
  )");
  if (!stmt)
    return std::unexpected(stmt.error());

  sqlite3_bind_int(stmt->get(), 1, keep_per_task);
  if (auto r = step_done(*stmt); !r) {
    return std::unexpected(r.error());
  }
  return static_cast<std::int64_t>(sqlite3_changes(db_.get()));
}

auto SqliteTaskStore::get_counts(std::chrono::milliseconds due_within,
                                 TimePoint now) -> Result<TaskCounts> {
  std::lock_guard lock(mu_);
  auto stmt = prepare(R"(
    SELECT
      COALESCE(SUM(CASE WHEN status = 'active' THEN 1 ELSE 0 END), 0),
      COALESCE(SUM(CASE WHEN status = 'paused' THEN 1 ELSE 0 END), 0),
      COALESCE(SUM(CASE WHEN status = 'completed' THEN 1 ELSE 0 END), 0),
      COALESCE(SUM(CASE WHEN status = 'failed' THEN 1 ELSE 0 END), 0),
      COALESCE(SUM(CASE WHEN status = 'active' AND next_run_at IS NOT NULL
                         AND next_run_at <= ? THEN 1 ELSE 0 END), 0)
    FROM scheduled_tasks;
  )");
  if (!stmt)
    return std::unexpected(stmt.error());

  sqlite3_bind_int64(stmt->get(), 1, to_millis(now + due_within));
  if (sqlite3_step(stmt->get()) != SQLITE_ROW) {
    log::error("Failed to count tasks: {}", sqlite3_errmsg(db_.get()));
    return fail(Error::DatabaseQueryFailed);
  }
  return TaskCounts{
      .active = sqlite3_column_int64(stmt->get(), 0),
      .paused = sqlite3_column_int64(stmt->get(), 1),
      .completed = sqlite3_column_int64(stmt->get(), 2),
      .failed = sqlite3_column_int64(stmt->get(), 3),
      .due_soon = sqlite3_column_int64(stmt->get(), 4),
  };
}

auto SqliteTaskStore::insert_task(const ScheduledTask& task) -> Result<void> {
  std::lock_guard lock(mu_);
  auto stmt = prepare(R"(
    INSERT INTO scheduled_tasks
      (id, user_id, name, description, type, schedule, trigger_config, action,
       conditions, retry_max, retry_backoff_ms, notification, status,
       last_run_at, next_run_at, run_count, created_at, updated_at)
    VALUES (?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?);
  )");
  if (!stmt)
    return std::unexpected(stmt.error());

  auto* s = stmt->get();
  bind_text(s, 1, task.id.value());
  if (task.user_id) {
    bind_text(s, 2, task.user_id->value());
  } else {
    sqlite3_bind_null(s, 2);
  }
  bind_text(s, 3, task.name);
  bind_text(s, 4, task.description);
  bind_text(s, 5, task_type_name(task.type));
  bind_json(s, 6, task.schedule.is_null() ? json::object() : task.schedule);
  bind_json(s, 7, task.trigger);
  bind_json(s, 8, action_to_json(task.action));
  bind_json(s, 9, task.conditions);
  if (task.retry_policy) {
    sqlite3_bind_int(s, 10, task.retry_policy->max_retries);
    sqlite3_bind_int64(s, 11, task.retry_policy->backoff_ms);
  } else {
    sqlite3_bind_null(s, 10);
    sqlite3_bind_null(s, 11);
  }
  bind_json(s, 12, task.notification);
  bind_text(s, 13, task_status_name(task.status));
  bind_time(s, 14, task.last_run);
  bind_time(s, 15, task.next_run);
  sqlite3_bind_int(s, 16, task.run_count);
  sqlite3_bind_int64(s, 17, to_millis(task.created_at));
  sqlite3_bind_int64(s, 18, to_millis(task.updated_at));
  return step_done(*stmt);
}

auto SqliteTaskStore::update_task(const ScheduledTask& task) -> Result<void> {
  std::lock_guard lock(mu_);
  auto stmt = prepare(R"(
    UPDATE scheduled_tasks SET
      name = ?, description = ?, type = ?, schedule = ?, trigger_config = ?,
      action = ?, conditions = ?, retry_max = ?, retry_backoff_ms = ?,
      notification = ?, status = ?, next_run_at = ?, updated_at = ?
    WHERE id = ?;
  )");
  if (!stmt)
    return std::unexpected(stmt.error());

  auto* s = stmt->get();
  bind_text(s, 1, task.name);
  bind_text(s, 2, task.description);
  bind_text(s, 3, task_type_name(task.type));
  bind_json(s, 4, task.schedule.is_null() ? json::object() : task.schedule);
  bind_json(s, 5, task.trigger);
  bind_json(s, 6, action_to_json(task.action));
  bind_json(s, 7, task.conditions);
  if (task.retry_policy) {
    sqlite3_bind_int(s, 8, task.retry_policy->max_retries);
    sqlite3_bind_int64(s, 9, task.retry_policy->backoff_ms);
  } else {
    sqlite3_bind_null(s, 8);
    sqlite3_bind_null(s, 9);
  }
  bind_json(s, 10, task.notification);
  bind_text(s, 11, task_status_name(task.status));
  bind_time(s, 12, task.next_run);
  sqlite3_bind_int64(s, 13, to_millis(task.updated_at));
  bind_text(s, 14, task.id.value());
  return step_changed(*stmt);
}

auto SqliteTaskStore::delete_task(const TaskId& id) -> Result<void> {
  std::lock_guard lock(mu_);
  auto stmt = prepare("DELETE FROM scheduled_tasks WHERE id = ?;");
  if (!stmt)
    return std::unexpected(stmt.error());

  bind_text(stmt->get(), 1, id.value());
  return step_changed(*stmt);
}

auto SqliteTaskStore::get_task(const TaskId& id) -> Result<ScheduledTask> {
  std::lock_guard lock(mu_);
  return load_task(id);
}

auto SqliteTaskStore::list_tasks(const TaskFilter& filter)
    -> Result<std::vector<ScheduledTask>> {
  std::lock_guard lock(mu_);
  auto sql = std::string("SELECT ") + kTaskColumns +
             " FROM scheduled_tasks WHERE 1 = 1";
  if (filter.user_id) sql += " AND user_id = ?";
  if (filter.type) sql += " AND type = ?";
  if (filter.status) sql += " AND status = ?";
  sql += " ORDER BY created_at DESC LIMIT ?;";

  auto stmt = prepare(sql.c_str());
  if (!stmt)
    return std::unexpected(stmt.error());

  int idx = 1;
  if (filter.user_id) bind_text(stmt->get(), idx++, filter.user_id->value());
  if (filter.type) bind_text(stmt->get(), idx++, task_type_name(*filter.type));
  if (filter.status)
    bind_text(stmt->get(), idx++, task_status_name(*filter.status));
  sqlite3_bind_int64(stmt->get(), idx, static_cast<sqlite3_int64>(filter.limit));
  return read_tasks(*stmt, "tasks");
}

auto SqliteTaskStore::list_upcoming(const std::optional<UserId>& user,
                                    std::size_t limit)
    -> Result<std::vector<ScheduledTask>> {
  std::lock_guard lock(mu_);
  auto sql = std::string("SELECT ") + kTaskColumns + R"(
    FROM scheduled_tasks
    WHERE status = 'active' AND next_run_at IS NOT NULL)";
  if (user) sql += " AND user_id = ?";
  sql += " ORDER BY next_run_at ASC LIMIT ?;";

  auto stmt = prepare(sql.c_str());
  if (!stmt)
    return std::unexpected(stmt.error());

  int idx = 1;
  if (user) bind_text(stmt->get(), idx++, user->value());
  sqlite3_bind_int64(stmt->get(), idx, static_cast<sqlite3_int64>(limit));
  return read_tasks(*stmt, "upcoming tasks");
}

auto SqliteTaskStore::set_status(const TaskId& id, TaskStatus status,
                                 TimePoint now) -> Result<void> {
  std::lock_guard lock(mu_);
  auto stmt = prepare(
      "UPDATE scheduled_tasks SET status = ?, updated_at = ? WHERE id = ?;");
  if (!stmt)
    return std::unexpected(stmt.error());

  bind_text(stmt->get(), 1, task_status_name(status));
  sqlite3_bind_int64(stmt->get(), 2, to_millis(now));
  bind_text(stmt->get(), 3, id.value());
  return step_changed(*stmt);
}

auto SqliteTaskStore::set_next_run(const TaskId& id,
                                   std::optional<TimePoint> next_run)
    -> Result<void> {
  std::lock_guard lock(mu_);
  auto stmt =
      prepare("UPDATE scheduled_tasks SET next_run_at = ? WHERE id = ?;");
  if (!stmt)
    return std::unexpected(stmt.error());

  bind_time(stmt->get(), 1, next_run);
  bind_text(stmt->get(), 2, id.value());
  return step_changed(*stmt);
}

auto SqliteTaskStore::begin_execution(const TaskId& task_id,
                                      TimePoint started_at,
                                      const std::vector<std::string>& logs)
    -> Result<ExecutionId> {
  std::lock_guard lock(mu_);
  auto stmt = prepare(R"(
    INSERT INTO task_executions (id, task_id, status, started_at, logs)
    VALUES (?, ?, 'running', ?, ?);
  )");
  if (!stmt)
    return std::unexpected(stmt.error());

  ExecutionId id{generate_uuid()};
  bind_text(stmt->get(), 1, id.value());
  bind_text(stmt->get(), 2, task_id.value());
  sqlite3_bind_int64(stmt->get(), 3, to_millis(started_at));
  bind_json(stmt->get(), 4, json(logs));
  if (auto r = step_done(*stmt); !r) {
    return std::unexpected(r.error());
  }
  return id;
}

auto SqliteTaskStore::finish_execution(const TaskExecution& exec)
    -> Result<void> {
  std::lock_guard lock(mu_);
  auto stmt = prepare(R"(
    UPDATE task_executions SET
      status = ?, completed_at = ?, duration_ms = ?, result = ?, error = ?,
      logs = ?
    WHERE id = ?;
  )");
  if (!stmt)
    return std::unexpected(stmt.error());

  auto* s = stmt->get();
  bind_text(s, 1, execution_status_name(exec.status));
  bind_time(s, 2, exec.completed_at);
  if (exec.duration) {
    sqlite3_bind_int64(s, 3, exec.duration->count());
  } else {
    sqlite3_bind_null(s, 3);
  }
  bind_json(s, 4, exec.result);
  if (exec.error.empty()) {
    sqlite3_bind_null(s, 5);
  } else {
    bind_text(s, 5, exec.error);
  }
  bind_json(s, 6, json(exec.logs));
  bind_text(s, 7, exec.id.value());
  return step_changed(*stmt);
}

auto SqliteTaskStore::get_executions(const TaskId& task_id, std::size_t limit)
    -> Result<std::vector<TaskExecution>> {
  std::lock_guard lock(mu_);
  auto sql = std::string("SELECT ") + kExecutionColumns + R"(
    FROM task_executions WHERE task_id = ?
    ORDER BY started_at DESC, rowid DESC LIMIT ?;
  )";
  auto stmt = prepare(sql.c_str());
  if (!stmt)
    return std::unexpected(stmt.error());

  bind_text(stmt->get(), 1, task_id.value());
  sqlite3_bind_int64(stmt->get(), 2, static_cast<sqlite3_int64>(limit));

  std::vector<TaskExecution> executions;
  int rc = SQLITE_ROW;
  while ((rc = sqlite3_step(stmt->get())) == SQLITE_ROW) {
    auto* s = stmt->get();
    TaskExecution exec;
    exec.id = ExecutionId{col_text(s, 0)};
    exec.task_id = TaskId{col_text(s, 1)};
    exec.status = parse_execution_status(col_text(s, 2))
                      .value_or(ExecutionStatus::Failed);
    exec.started_at = from_millis(sqlite3_column_int64(s, 3));
    exec.completed_at = col_time(s, 4);
    if (!col_is_null(s, 5)) {
      exec.duration = std::chrono::milliseconds(sqlite3_column_int64(s, 5));
    }
    exec.result = col_json(s, 6);
    exec.error = col_text(s, 7);
    auto logs = col_json(s, 8);
    if (logs.is_array()) {
      for (const auto& line : logs) {
        if (line.is_string()) {
          exec.logs.push_back(line.get<std::string>());
        }
      }
    }
    executions.push_back(std::move(exec));
  }
  if (rc != SQLITE_DONE) {
    log::error("Failed to list executions of {}: {}", task_id,
               sqlite3_errmsg(db_.get()));
    return fail(Error::DatabaseQueryFailed);
  }
  return executions;
}

auto SqliteTaskStore::insert_webhook(const TaskWebhook& hook) -> Result<void> {
  std::lock_guard lock(mu_);
  auto stmt = prepare(R"(
    INSERT INTO task_webhooks
      (id, task_id, secret, last_triggered_at, trigger_count, created_at)
    VALUES (?, ?, ?, ?, ?, ?);
  )");
  if (!stmt)
    return std::unexpected(stmt.error());

  auto* s = stmt->get();
  bind_text(s, 1, hook.id.value());
  bind_text(s, 2, hook.task_id.value());
  bind_text(s, 3, hook.secret);
  bind_time(s, 4, hook.last_triggered);
  sqlite3_bind_int64(s, 5, hook.trigger_count);
  sqlite3_bind_int64(s, 6, to_millis(hook.created_at));
  return step_done(*stmt);
}

auto SqliteTaskStore::get_webhook(const WebhookId& id) -> Result<TaskWebhook> {
  std::lock_guard lock(mu_);
  auto sql = std::string("SELECT ") + kWebhookColumns +
             " FROM task_webhooks WHERE id = ?;";
  auto stmt = prepare(sql.c_str());
  if (!stmt)
    return std::unexpected(stmt.error());

  bind_text(stmt->get(), 1, id.value());
  int rc = sqlite3_step(stmt->get());
  if (rc == SQLITE_DONE) {
    return fail(Error::NotFound);
  }
  if (rc != SQLITE_ROW) {
    log::error("Failed to load webhook {}: {}", id, sqlite3_errmsg(db_.get()));
    return fail(Error::DatabaseQueryFailed);
  }

  auto* s = stmt->get();
  TaskWebhook hook;
  hook.id = WebhookId{col_text(s, 0)};
  hook.task_id = TaskId{col_text(s, 1)};
  hook.secret = col_text(s, 2);
  hook.last_triggered = col_time(s, 3);
  hook.trigger_count = sqlite3_column_int64(s, 4);
  hook.created_at = from_millis(sqlite3_column_int64(s, 5));
  return hook;
}

auto SqliteTaskStore::record_webhook_trigger(const WebhookId& id, TimePoint at)
    -> Result<void> {
  std::lock_guard lock(mu_);
  auto stmt = prepare(R"(
    UPDATE task_webhooks
    SET last_triggered_at = ?, trigger_count = trigger_count + 1
    WHERE id = ?;
  )");
  if (!stmt)
    return std::unexpected(stmt.error());

  sqlite3_bind_int64(stmt->get(), 1, to_millis(at));
  bind_text(stmt->get(), 2, id.value());
  return step_changed(*stmt);
}

}  // namespace cadence
