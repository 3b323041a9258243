#include "cadence/app/application.hpp"
#include "cadence/cli/commands.hpp"
#include "cadence/util/daemon.hpp"
#include "cadence/util/log.hpp"

#include <print>

namespace cadence::cli {

auto cmd_serve(const ServeOptions& opts) -> int {
  auto loaded = load_config(opts.common);
  if (!loaded) {
    return 1;
  }
  auto config = std::move(*loaded);

  if (opts.daemon && config.log.file.empty()) {
    std::println(stderr, "Error: --daemon requires log.file in the config");
    return 1;
  }
  if (!config.log.file.empty() && !log::open_file(config.log.file)) {
    std::println(stderr, "Error: Failed to open log file: {}", config.log.file);
    return 1;
  }
  if (opts.daemon && !daemonize()) {
    std::println(stderr, "Error: Failed to daemonize");
    return 1;
  }

  log::set_level(config.log.level);
  log::start();

  Application app(std::move(config));
  if (auto r = app.init(); !r) {
    log::error("Initialization failed: {}", r.error().message());
    log::stop();
    return 1;
  }

  setup_signal_handlers();

  log::info("Cadence starting...");
  if (auto r = app.start(); !r) {
    log::error("Failed to start: {}", r.error().message());
    log::stop();
    return 1;
  }

  wait_for_shutdown();
  app.stop();

  log::stop();
  return 0;
}

}  // namespace cadence::cli
