#include "cadence/app/application.hpp"
#include "cadence/cli/commands.hpp"
#include "cadence/scheduler/task_service.hpp"
#include "cadence/scheduler/worker.hpp"

#include <print>

namespace cadence::cli {

auto cmd_status(const StatusOptions& opts) -> int {
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

  auto counts = app.worker().stats();
  if (!counts) {
    std::println(stderr, "Error: {}", counts.error().message());
    return 1;
  }

  auto status = app.worker().status();
  std::println("Worker:    poll every {}ms, batch of {}",
               status.poll_interval.count(), status.batch_size);
  std::println("Active:    {}", counts->active);
  std::println("Paused:    {}", counts->paused);
  std::println("Completed: {}", counts->completed);
  std::println("Failed:    {}", counts->failed);
  std::println("Due <1h:   {}", counts->due_soon);

  auto upcoming = app.tasks().upcoming(std::nullopt, 5);
  if (upcoming && !upcoming->empty()) {
    std::println("");
    std::println("Upcoming:");
    for (const auto& task : *upcoming) {
      std::println("  {}  {} ({})", format_iso8601(*task.next_run), task.name,
                   task.id);
    }
  }
  return 0;
}

}  // namespace cadence::cli
