#include "cadence/cli/commands.hpp"

#include <print>

namespace cadence::cli {

auto load_config(const CommonOptions& opts) -> std::optional<Config> {
  Config config;
  if (!opts.config_file.empty()) {
    auto result = ConfigLoader::load_from_file(opts.config_file);
    if (!result) {
      std::println(stderr, "Error: Failed to load {}: {}", opts.config_file,
                   result.error().message());
      return std::nullopt;
    }
    config = std::move(*result);
  }
  if (!opts.db_file.empty()) {
    config.storage.db_file = opts.db_file;
  }
  if (auto r = validate(config); !r) {
    std::println(stderr, "Error: Invalid configuration: {}",
                 r.error().message());
    return std::nullopt;
  }
  return config;
}

auto cmd_validate(const ValidateOptions& opts) -> int {
  auto config = load_config(CommonOptions{.config_file = opts.config_file});
  if (!config) {
    return 1;
  }

  std::println("Configuration OK: {}", opts.config_file);
  std::println("  database:       {}", config->storage.db_file);
  std::println("  poll interval:  {}ms", config->worker.poll_interval_ms);
  std::println("  batch size:     {}", config->worker.batch_size);
  std::println("  action timeout: {}ms", config->worker.action_timeout_ms);
  std::println("  sandbox:        {}",
               config->sandbox.enabled ? "enabled" : "disabled");
  std::println("  scraper:        {}",
               config->scraper.enabled ? "enabled" : "disabled");
  return 0;
}

}  // namespace cadence::cli
