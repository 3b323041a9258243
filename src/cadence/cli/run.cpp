#include "cadence/app/application.hpp"
#include "cadence/cli/commands.hpp"
#include "cadence/scheduler/worker.hpp"
#include "cadence/util/log.hpp"

#include <print>

namespace cadence::cli {

auto cmd_run(const RunOptions& opts) -> int {
  auto config = load_config(opts.common);
  if (!config) {
    return 1;
  }
  log::set_level(config->log.level);

  Application app(std::move(*config));
  if (auto r = app.init(); !r) {
    std::println(stderr, "Error: Failed to open database: {}",
                 r.error().message());
    return 1;
  }

  auto result = app.worker().run_now(TaskId{opts.task_id});
  if (!result) {
    std::println(stderr, "Task {} failed: {}", opts.task_id,
                 result.error().message);
    return 1;
  }

  std::println("Task {} completed in {}ms", opts.task_id,
               result->duration ? result->duration->count() : 0);
  std::println("{}", result->result.dump(2));
  return 0;
}

}  // namespace cadence::cli
