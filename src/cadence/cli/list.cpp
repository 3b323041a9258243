#include "cadence/app/application.hpp"
#include "cadence/cli/commands.hpp"
#include "cadence/scheduler/task_service.hpp"

#include <print>

namespace cadence::cli {

auto cmd_list(const ListOptions& opts) -> int {
  auto config = load_config(opts.common);
  if (!config) {
    return 1;
  }

  TaskFilter filter{.limit = opts.limit};
  if (!opts.status.empty()) {
    filter.status = parse_task_status(opts.status);
    if (!filter.status) {
      std::println(stderr, "Error: Unknown status: {}", opts.status);
      return 1;
    }
  }
  if (!opts.type.empty()) {
    filter.type = parse_task_type(opts.type);
    if (!filter.type) {
      std::println(stderr, "Error: Unknown task type: {}", opts.type);
      return 1;
    }
  }
  if (!opts.user.empty()) {
    filter.user_id = UserId{opts.user};
  }

  Application app(std::move(*config));
  if (auto r = app.init(); !r) {
    std::println(stderr, "Error: Failed to open database: {}",
                 r.error().message());
    return 1;
  }

  auto result = app.tasks().list(filter);
  if (!result) {
    std::println(stderr, "Error: {}", result.error().message());
    return 1;
  }

  const auto& tasks = *result;
  if (tasks.empty()) {
    std::println("No tasks found.");
    return 0;
  }

  std::println("{:<36} {:<24} {:<10} {:<10} {:<16} {:<5} {}", "ID", "NAME",
               "TYPE", "STATUS", "ACTION", "RUNS", "NEXT_RUN");
  for (const auto& task : tasks) {
    std::println("{:<36} {:<24} {:<10} {:<10} {:<16} {:<5} {}", task.id,
                 truncate(task.name, 23), task_type_name(task.type),
                 task_status_name(task.status),
                 task.action.type_name(), task.run_count,
                 task.next_run ? format_iso8601(*task.next_run) : "-");
  }
  return 0;
}

}  // namespace cadence::cli
