#include "cadence/app/application.hpp"
#include "cadence/cli/commands.hpp"
#include "cadence/scheduler/task_service.hpp"

#include <print>

namespace cadence::cli {

auto cmd_history(const HistoryOptions& opts) -> int {
  auto config = load_config(opts.common);
  if (!config) {
    return 1;
  }

  Application app(std::move(*config));
  if (auto r = app.init(); !r) {
    std::println(stderr, "Error: Failed to open database: {}",
                 r.error().message());
    return 1;
  }

  auto result = app.tasks().executions(TaskId{opts.task_id}, opts.limit);
  if (!result) {
    std::println(stderr, "Error: {}", result.error().message());
    return 1;
  }
  if (result->empty()) {
    std::println("No executions for task {}.", opts.task_id);
    return 0;
  }

  std::println("{:<36} {:<10} {:<25} {:>9}  {}", "EXECUTION_ID", "STATUS",
               "STARTED", "DURATION", "ERROR");
  for (const auto& exec : *result) {
    std::println("{:<36} {:<10} {:<25} {:>7}ms  {}", exec.id,
                 execution_status_name(exec.status),
                 format_iso8601(exec.started_at),
                 exec.duration ? exec.duration->count() : 0,
                 exec.error.empty() ? "-" : exec.error);
  }
  return 0;
}

}  // namespace cadence::cli
