#include "cadence/scheduler/schedule_resolver.hpp"

#include "cadence/storage/task_store.hpp"
#include "cadence/util/log.hpp"

namespace cadence {

auto schedule_at(const nlohmann::json& schedule) -> std::optional<TimePoint> {
  if (!schedule.is_object()) {
    return std::nullopt;
  }
  auto it = schedule.find("at");
  if (it == schedule.end()) {
    return std::nullopt;
  }
  if (it->is_string()) {
    return parse_iso8601(it->get_ref<const std::string&>());
  }
  if (it->is_number_integer()) {
    return from_millis(it->get<std::int64_t>());
  }
  return std::nullopt;
}

DefaultScheduleResolver::DefaultScheduleResolver(
    std::chrono::milliseconds recurring_interval)
    : interval_(recurring_interval) {
}

auto DefaultScheduleResolver::next_run(const ScheduledTask& task,
                                       TimePoint after) const
    -> std::optional<TimePoint> {
  switch (task.type) {
    case TaskType::Recurring:
      return after + interval_;
    case TaskType::OneTime:
    case TaskType::Trigger:
      return std::nullopt;
  }
  return std::nullopt;
}

auto DefaultScheduleResolver::initial_run(const ScheduledTask& task,
                                          TimePoint now) const
    -> std::optional<TimePoint> {
  switch (task.type) {
    case TaskType::OneTime:
      return schedule_at(task.schedule);
    case TaskType::Recurring:
      return now + interval_;
    case TaskType::Trigger:
      return std::nullopt;
  }
  return std::nullopt;
}

auto DefaultScheduleResolver::initialize(ITaskStore& store, TimePoint now)
    -> Result<void> {
  auto tasks = store.list_tasks(TaskFilter{.type = TaskType::Recurring,
                                           .status = TaskStatus::Active,
                                           .limit = 100000});
  if (!tasks) {
    return fail(tasks.error());
  }

  int scheduled = 0;
  for (const auto& task : *tasks) {
    if (task.next_run) {
      continue;
    }
    if (auto r = store.set_next_run(task.id, now + interval_); !r) {
      log::warn("Failed to schedule recurring task {}: {}", task.id,
                r.error().message());
      continue;
    }
    ++scheduled;
  }

  log::info("Initialized recurring tasks: {} active, {} newly scheduled",
            tasks->size(), scheduled);
  return ok();
}

auto DefaultScheduleResolver::shutdown() -> void {
  log::info("Schedule resolver shut down");
}

}  // namespace cadence
