#include "cadence/task/task.hpp"

#include "cadence/util/log.hpp"

namespace cadence {

namespace {

using json = nlohmann::json;

auto time_or_null(const std::optional<TimePoint>& tp) -> json {
  return tp ? json(format_iso8601(*tp)) : json();
}

auto opaque_or_default(const json& j, const char* key, json fallback) -> json {
  auto it = j.find(key);
  return it == j.end() || it->is_null() ? std::move(fallback) : *it;
}

}  // namespace

auto task_to_json(const ScheduledTask& task) -> json {
  json j;
  j["id"] = task.id.str();
  j["userId"] = task.user_id ? json(task.user_id->str()) : json();
  j["name"] = task.name;
  if (!task.description.empty()) {
    j["description"] = task.description;
  }
  j["type"] = std::string(task_type_name(task.type));
  j["schedule"] = task.schedule;
  if (!task.trigger.is_null()) j["trigger"] = task.trigger;
  j["action"] = action_to_json(task.action);
  if (!task.conditions.is_null()) j["conditions"] = task.conditions;
  if (task.retry_policy) {
    j["retryPolicy"] = {{"maxRetries", task.retry_policy->max_retries},
                        {"backoffMs", task.retry_policy->backoff_ms}};
  }
  if (!task.notification.is_null()) j["notification"] = task.notification;
  j["status"] = std::string(task_status_name(task.status));
  j["lastRun"] = time_or_null(task.last_run);
  j["nextRun"] = time_or_null(task.next_run);
  j["runCount"] = task.run_count;
  j["createdAt"] = format_iso8601(task.created_at);
  j["updatedAt"] = format_iso8601(task.updated_at);
  return j;
}

auto task_from_json(const json& j) -> Result<ScheduledTask> {
  if (!j.is_object()) {
    log::warn("Task definition must be a JSON object");
    return fail(Error::ParseError);
  }

  ScheduledTask task;

  try {
    if (auto it = j.find("id"); it != j.end() && it->is_string()) {
      task.id = TaskId{it->get<std::string>()};
    }
    if (auto it = j.find("userId"); it != j.end() && it->is_string()) {
      task.user_id = UserId{it->get<std::string>()};
    }
    task.name = j.value("name", std::string{});
    task.description = j.value("description", std::string{});

    auto type_name = j.value("type", std::string{"one-time"});
    auto type = parse_task_type(type_name);
    if (!type) {
      log::warn("Unknown task type: {}", type_name);
      return fail(Error::ParseError);
    }
    task.type = *type;

    if (auto it = j.find("status"); it != j.end() && it->is_string()) {
      auto status = parse_task_status(it->get<std::string>());
      if (!status) {
        log::warn("Unknown task status: {}", it->get<std::string>());
        return fail(Error::ParseError);
      }
      task.status = *status;
    }

    task.schedule = opaque_or_default(j, "schedule", json::object());
    task.trigger = opaque_or_default(j, "trigger", json());
    task.conditions = opaque_or_default(j, "conditions", json());
    task.notification = opaque_or_default(j, "notification", json());

    if (auto it = j.find("retryPolicy"); it != j.end() && it->is_object()) {
      RetryPolicy policy;
      policy.max_retries = it->value("maxRetries", 0);
      policy.backoff_ms = it->value("backoffMs", std::int64_t{1000});
      if (policy.max_retries < 0 || policy.backoff_ms <= 0) {
        log::warn("Invalid retry policy: maxRetries={} backoffMs={}",
                  policy.max_retries, policy.backoff_ms);
        return fail(Error::InvalidArgument);
      }
      task.retry_policy = policy;
    }

    auto action_it = j.find("action");
    if (action_it == j.end()) {
      log::warn("Task definition has no action");
      return fail(Error::ParseError);
    }
    auto action = action_from_json(*action_it);
    if (!action) {
      return fail(action.error());
    }
    task.action = std::move(*action);
  } catch (const json::exception& e) {
    log::warn("Malformed task definition: {}", e.what());
    return fail(Error::ParseError);
  }

  return ok(std::move(task));
}

auto execution_to_json(const TaskExecution& exec) -> json {
  json j;
  j["id"] = exec.id.str();
  j["taskId"] = exec.task_id.str();
  j["status"] = std::string(execution_status_name(exec.status));
  j["startedAt"] = format_iso8601(exec.started_at);
  j["completedAt"] = time_or_null(exec.completed_at);
  j["durationMs"] = exec.duration ? json(exec.duration->count()) : json();
  j["result"] = exec.result;
  if (!exec.error.empty()) {
    j["error"] = exec.error;
  }
  j["logs"] = exec.logs;
  return j;
}

}  // namespace cadence
