#include "cadence/scheduler/task_service.hpp"

#include "cadence/scheduler/cron.hpp"
#include "cadence/util/log.hpp"
#include "cadence/util/util.hpp"

#include <openssl/rand.h>

#include <array>
#include <format>
#include <string_view>

namespace cadence {

namespace {

using json = nlohmann::json;

constexpr std::array<const char*, 9> kEditableFields = {
    "name",   "description", "type",        "schedule",     "trigger",
    "action", "conditions",  "retryPolicy", "notification",
};

constexpr std::size_t kSecretBytes = 32;

auto invalid(std::string_view reason) -> std::unexpected<std::error_code> {
  log::warn("Invalid task: {}", reason);
  return fail(Error::InvalidArgument);
}

auto random_secret() -> Result<std::string> {
  std::array<unsigned char, kSecretBytes> bytes{};
  if (RAND_bytes(bytes.data(), static_cast<int>(bytes.size())) != 1) {
    log::error("Failed to generate webhook secret");
    return fail(Error::Unknown);
  }
  std::string hex;
  hex.reserve(bytes.size() * 2);
  for (auto b : bytes) {
    hex += std::format("{:02x}", b);
  }
  return hex;
}

}  // namespace

TaskService::TaskService(ITaskStore& store, const IScheduleResolver& resolver)
    : store_(&store), resolver_(&resolver) {
}

auto TaskService::validate(const ScheduledTask& task) -> Result<void> {
  if (task.name.empty()) {
    return invalid("name is required");
  }

  switch (task.type) {
    case TaskType::OneTime:
      if (!task.schedule.is_object() || !task.schedule.contains("at")) {
        return invalid("one-time tasks require schedule.at");
      }
      if (!schedule_at(task.schedule)) {
        return invalid("schedule.at is not a valid timestamp");
      }
      break;
    case TaskType::Recurring: {
      if (!task.schedule.is_object()) {
        return invalid("recurring tasks require schedule.cron");
      }
      auto cron = task.schedule.find("cron");
      if (cron == task.schedule.end() || !cron->is_string() ||
          cron->get_ref<const std::string&>().empty()) {
        return invalid("recurring tasks require schedule.cron");
      }
      if (!CronExpr::parse(cron->get_ref<const std::string&>())) {
        return invalid("schedule.cron is not a valid cron expression");
      }
      break;
    }
    case TaskType::Trigger:
      if (task.trigger.is_null() ||
          (task.trigger.is_object() && task.trigger.empty())) {
        return invalid("trigger tasks require trigger configuration");
      }
      break;
  }

  if (task.retry_policy &&
      (task.retry_policy->max_retries < 0 || task.retry_policy->backoff_ms <= 0)) {
    return invalid("retryPolicy needs maxRetries >= 0 and backoffMs > 0");
  }
  return ok();
}

auto TaskService::create(ScheduledTask draft) -> Result<ScheduledTask> {
  if (auto r = validate(draft); !r) {
    return fail(r.error());
  }

  auto now = Clock::now();
  if (draft.id.empty()) {
    draft.id = TaskId{generate_uuid()};
  }
  draft.status = TaskStatus::Active;
  draft.run_count = 0;
  draft.last_run.reset();
  draft.created_at = now;
  draft.updated_at = now;
  draft.next_run = resolver_->initial_run(draft, now);

  if (auto r = store_->insert_task(draft); !r) {
    log::error("Failed to create task {}: {}", draft.id, r.error().message());
    return fail(r.error());
  }

  log::info("Task created: id={} type={}", draft.id, task_type_name(draft.type));
  return draft;
}

auto TaskService::update(const TaskId& id, const json& patch)
    -> Result<ScheduledTask> {
  if (!patch.is_object()) {
    return invalid("update must be a JSON object");
  }
  bool touches_fields = false;
  for (auto field : kEditableFields) {
    touches_fields = touches_fields || patch.contains(field);
  }
  if (!touches_fields) {
    return invalid("No fields to update");
  }

  auto current = store_->get_task(id);
  if (!current) {
    return fail(current.error());
  }

  json merged = task_to_json(*current);
  json edits = json::object();
  for (auto field : kEditableFields) {
    if (auto it = patch.find(field); it != patch.end()) {
      edits[field] = *it;
    }
  }
  merged.merge_patch(edits);

  auto parsed = task_from_json(merged);
  if (!parsed) {
    return fail(parsed.error());
  }

  auto updated = std::move(*parsed);
  updated.id = current->id;
  updated.user_id = current->user_id;
  updated.status = current->status;
  updated.last_run = current->last_run;
  updated.run_count = current->run_count;
  updated.created_at = current->created_at;
  updated.next_run = current->next_run;

  if (auto r = validate(updated); !r) {
    return fail(r.error());
  }

  auto now = Clock::now();
  if (patch.contains("schedule") || patch.contains("type")) {
    updated.next_run = resolver_->initial_run(updated, now);
  }
  updated.updated_at = now;

  if (auto r = store_->update_task(updated); !r) {
    return fail(r.error());
  }

  log::info("Task updated: id={}", id);
  return updated;
}

auto TaskService::pause(const TaskId& id) -> Result<void> {
  if (auto r = store_->set_status(id, TaskStatus::Paused, Clock::now()); !r) {
    return fail(r.error());
  }
  log::info("Task paused: id={}", id);
  return ok();
}

auto TaskService::resume(const TaskId& id) -> Result<ScheduledTask> {
  auto task = store_->get_task(id);
  if (!task) {
    return fail(task.error());
  }

  auto now = Clock::now();
  task->status = TaskStatus::Active;
  if (!task->next_run) {
    task->next_run = resolver_->initial_run(*task, now);
  }
  task->updated_at = now;

  if (auto r = store_->update_task(*task); !r) {
    return fail(r.error());
  }
  log::info("Task resumed: id={}", id);
  return task;
}

auto TaskService::remove(const TaskId& id) -> Result<void> {
  if (auto r = store_->delete_task(id); !r) {
    return fail(r.error());
  }
  log::info("Task deleted: id={}", id);
  return ok();
}

auto TaskService::get(const TaskId& id) -> Result<ScheduledTask> {
  return store_->get_task(id);
}

auto TaskService::list(const TaskFilter& filter)
    -> Result<std::vector<ScheduledTask>> {
  return store_->list_tasks(filter);
}

auto TaskService::upcoming(const std::optional<UserId>& user, std::size_t limit)
    -> Result<std::vector<ScheduledTask>> {
  return store_->list_upcoming(user, limit);
}

auto TaskService::executions(const TaskId& id, std::size_t limit)
    -> Result<std::vector<TaskExecution>> {
  return store_->get_executions(id, limit);
}

auto TaskService::create_webhook(const TaskId& id) -> Result<TaskWebhook> {
  auto task = store_->get_task(id);
  if (!task) {
    return fail(task.error());
  }
  if (task->type != TaskType::Trigger) {
    return invalid("webhooks can only be attached to trigger tasks");
  }

  auto secret = random_secret();
  if (!secret) {
    return fail(secret.error());
  }
  TaskWebhook hook{.id = WebhookId{generate_uuid()},
                   .task_id = id,
                   .secret = std::move(*secret),
                   .last_triggered = std::nullopt,
                   .trigger_count = 0,
                   .created_at = Clock::now()};
  if (auto r = store_->insert_webhook(hook); !r) {
    log::error("Failed to create webhook for task {}: {}", id,
               r.error().message());
    return fail(r.error());
  }

  log::info("Webhook created: id={} task={}", hook.id, id);
  return hook;
}

auto webhook_path(const TaskWebhook& hook) -> std::string {
  return std::format("/api/webhooks/{}?secret={}", hook.id, hook.secret);
}

}  // namespace cadence
