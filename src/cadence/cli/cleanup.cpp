#include "cadence/app/application.hpp"
#include "cadence/cli/commands.hpp"
#include "cadence/scheduler/worker.hpp"
#include "cadence/util/log.hpp"

#include <print>

namespace cadence::cli {

auto cmd_cleanup(const CleanupOptions& opts) -> int {
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

  auto report = app.worker().cleanup(opts.days);
  if (!report) {
    std::println(stderr, "Error: {}", report.error().message());
    return 1;
  }
  std::println("Deleted {} completed tasks and {} old executions",
               report->tasks_deleted, report->executions_deleted);
  return 0;
}

}  // namespace cadence::cli
