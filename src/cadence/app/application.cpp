#include "cadence/app/application.hpp"

#include "cadence/client/anthropic_client.hpp"
#include "cadence/client/http/http_client.hpp"
#include "cadence/client/http_web_scraper.hpp"
#include "cadence/executor/action_executor.hpp"
#include "cadence/executor/process_sandbox.hpp"
#include "cadence/scheduler/schedule_resolver.hpp"
#include "cadence/scheduler/task_service.hpp"
#include "cadence/scheduler/worker.hpp"
#include "cadence/storage/sqlite_task_store.hpp"
#include "cadence/util/log.hpp"

#include <cstdlib>

namespace cadence {

Application::Application(Config config) : config_(std::move(config)) {
}

Application::Application(Config config, Collaborators collaborators)
    : config_(std::move(config)), injected_(std::move(collaborators)) {
}

Application::~Application() {
  stop();
}

auto Application::build_collaborators() -> Collaborators {
  Collaborators c;
  auto http = std::make_shared<http::HttpClient>();
  c.http = http;

  const char* api_key = std::getenv(config_.llm.api_key_env.c_str());
  if (api_key != nullptr && *api_key != '\0') {
    c.llm = std::make_shared<AnthropicClient>(api_key, config_.llm, http);
  } else {
    log::warn("{} not set; ai-prompt and generate-report actions will fail",
              config_.llm.api_key_env);
  }

  if (config_.sandbox.enabled) {
    c.sandbox = std::make_shared<ProcessSandbox>(config_.sandbox);
  }
  if (config_.scraper.enabled) {
    c.scraper = std::make_shared<HttpWebScraper>(config_.scraper, http);
  }
  // Email and Google Workspace have no built-in implementation.
  return c;
}

auto Application::init() -> Result<void> {
  if (store_) {
    return ok();
  }

  auto store = std::make_unique<SqliteTaskStore>(config_.storage.db_file,
                                                 config_.storage.busy_timeout_ms);
  if (auto r = store->open(); !r) {
    log::error("Failed to open database {}: {}", config_.storage.db_file,
               r.error().message());
    return fail(r.error());
  }

  auto collaborators = injected_ ? *injected_ : build_collaborators();
  ActionDefaults defaults{.model = config_.llm.default_model,
                          .max_tokens = config_.llm.max_tokens,
                          .report_max_tokens = config_.llm.report_max_tokens};

  store_ = std::move(store);
  resolver_ = std::make_unique<DefaultScheduleResolver>(
      std::chrono::milliseconds(config_.worker.recurring_interval_ms));
  executor_ = std::make_unique<ActionExecutor>(std::move(collaborators),
                                               std::move(defaults));
  worker_ = std::make_unique<Worker>(*store_, *executor_, *resolver_,
                                     WorkerOptions::from_config(config_.worker));
  tasks_ = std::make_unique<TaskService>(*store_, *resolver_);
  return ok();
}

auto Application::start() -> Result<void> {
  if (auto r = init(); !r) {
    return fail(r.error());
  }
  if (running_.exchange(true)) {
    return ok();
  }
  if (auto* sandbox = process_sandbox()) {
    sandbox->reopen();
  }
  if (auto r = worker_->start(); !r) {
    running_.store(false);
    return fail(r.error());
  }
  log::info("Cadence started (db: {})", config_.storage.db_file);
  return ok();
}

auto Application::stop() -> void {
  if (!running_.exchange(false)) {
    return;
  }
  log::info("Stopping Cadence...");
  // Children are killed before the worker joins its cycles, which would
  // otherwise wait out each child's timeout.
  worker_->cancel_inflight();
  if (auto* sandbox = process_sandbox()) {
    sandbox->kill_all();
  }
  worker_->stop();
  log::info("Cadence stopped");
}

auto Application::process_sandbox() const -> ProcessSandbox* {
  return dynamic_cast<ProcessSandbox*>(
      executor_->collaborators().sandbox.get());
}

auto Application::store() -> SqliteTaskStore& {
  return *store_;
}

auto Application::worker() -> Worker& {
  return *worker_;
}

auto Application::tasks() -> TaskService& {
  return *tasks_;
}

auto Application::executor() const -> const ActionExecutor& {
  return *executor_;
}

}  // namespace cadence
