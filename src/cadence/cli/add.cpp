#include "cadence/app/application.hpp"
#include "cadence/cli/commands.hpp"
#include "cadence/scheduler/task_service.hpp"
#include "cadence/util/log.hpp"

#include <nlohmann/json.hpp>

#include <fstream>
#include <print>

namespace cadence::cli {

auto cmd_add(const AddOptions& opts) -> int {
  auto config = load_config(opts.common);
  if (!config) {
    return 1;
  }
  log::set_level(config->log.level);

  std::ifstream in(opts.task_file);
  if (!in) {
    std::println(stderr, "Error: Cannot open {}", opts.task_file);
    return 1;
  }
  nlohmann::json doc;
  try {
    doc = nlohmann::json::parse(in);
  } catch (const nlohmann::json::parse_error& e) {
    std::println(stderr, "Error: {}: {}", opts.task_file, e.what());
    return 1;
  }

  // A file may hold one task or an array of them.
  auto drafts = doc.is_array() ? doc : nlohmann::json::array({doc});

  Application app(std::move(*config));
  if (auto r = app.init(); !r) {
    std::println(stderr, "Error: {}", r.error().message());
    return 1;
  }

  int failures = 0;
  for (const auto& entry : drafts) {
    auto draft = task_from_json(entry);
    if (!draft) {
      std::println(stderr, "Error: Malformed task: {}", draft.error().message());
      ++failures;
      continue;
    }
    auto created = app.tasks().create(std::move(*draft));
    if (!created) {
      std::println(stderr, "Error: {}", created.error().message());
      ++failures;
      continue;
    }
    std::println("Created task {} ({}), next run: {}", created->id,
                 created->name,
                 created->next_run ? format_iso8601(*created->next_run) : "-");
  }
  return failures == 0 ? 0 : 1;
}

}  // namespace cadence::cli
