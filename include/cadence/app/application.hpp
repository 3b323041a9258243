#pragma once

#include "cadence/config/config.hpp"
#include "cadence/core/error.hpp"
#include "cadence/executor/collaborators.hpp"

#include <atomic>
#include <memory>
#include <optional>

namespace cadence {

class ActionExecutor;
class DefaultScheduleResolver;
class ProcessSandbox;
class SqliteTaskStore;
class TaskService;
class Worker;

// Application facade: owns the store, the collaborators, the executor, the
// worker and the task service, and wires them from one Config.
class Application {
public:
  explicit Application(Config config);
  // Uses `collaborators` as given instead of building them from config.
  Application(Config config, Collaborators collaborators);
  ~Application();

  Application(const Application&) = delete;
  auto operator=(const Application&) -> Application& = delete;

  // Opens the database and builds every component. Must succeed before any
  // accessor below is used.
  [[nodiscard]] auto init() -> Result<void>;

  [[nodiscard]] auto start() -> Result<void>;
  auto stop() -> void;
  [[nodiscard]] auto is_running() const noexcept -> bool {
    return running_.load(std::memory_order_acquire);
  }

  [[nodiscard]] auto config() const noexcept -> const Config& {
    return config_;
  }
  [[nodiscard]] auto store() -> SqliteTaskStore&;
  [[nodiscard]] auto worker() -> Worker&;
  [[nodiscard]] auto tasks() -> TaskService&;
  [[nodiscard]] auto executor() const -> const ActionExecutor&;

private:
  auto build_collaborators() -> Collaborators;
  [[nodiscard]] auto process_sandbox() const -> ProcessSandbox*;

  Config config_;
  std::optional<Collaborators> injected_;
  std::atomic<bool> running_{false};

  std::unique_ptr<SqliteTaskStore> store_;
  std::unique_ptr<DefaultScheduleResolver> resolver_;
  std::unique_ptr<ActionExecutor> executor_;
  std::unique_ptr<Worker> worker_;
  std::unique_ptr<TaskService> tasks_;
};

}  // namespace cadence
