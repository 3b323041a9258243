#pragma once

#include "cadence/core/cancellation.hpp"
#include "cadence/core/error.hpp"
#include "cadence/executor/collaborators.hpp"
#include "cadence/task/action.hpp"

#include <nlohmann/json.hpp>

#include <cstddef>
#include <string>
#include <vector>

namespace cadence {

// Append-only, human-readable trace of one task execution.
class ExecutionLog {
public:
  ExecutionLog() = default;
  explicit ExecutionLog(std::vector<std::string> lines)
      : lines_(std::move(lines)) {
  }

  auto append(std::string line) -> void;

  [[nodiscard]] auto lines() const noexcept -> const std::vector<std::string>& {
    return lines_;
  }
  [[nodiscard]] auto size() const noexcept -> std::size_t {
    return lines_.size();
  }
  [[nodiscard]] auto take() -> std::vector<std::string> {
    return std::move(lines_);
  }

private:
  std::vector<std::string> lines_;
};

struct ActionDefaults {
  std::string model{"claude-3-5-sonnet-20241022"};
  int max_tokens{4096};
  int report_max_tokens{8192};
  std::size_t output_excerpt{500};
};

// Dispatches a TaskAction to its handler. Handlers log a start line and a
// completion or failure line; chains run their steps strictly in order and
// stop at the first failure.
class ActionExecutor {
public:
  explicit ActionExecutor(Collaborators collaborators,
                          ActionDefaults defaults = {});

  [[nodiscard]] auto execute(const TaskAction& action, ExecutionLog& log,
                             const ExecutionContext& ctx) const
      -> Outcome<nlohmann::json>;

  [[nodiscard]] auto collaborators() const noexcept -> const Collaborators& {
    return collaborators_;
  }

private:
  [[nodiscard]] auto run(const AiPromptAction& action, ExecutionLog& log,
                         const ExecutionContext& ctx) const
      -> Outcome<nlohmann::json>;
  [[nodiscard]] auto run(const SendEmailAction& action, ExecutionLog& log,
                         const ExecutionContext& ctx) const
      -> Outcome<nlohmann::json>;
  [[nodiscard]] auto run(const WebhookAction& action, ExecutionLog& log,
                         const ExecutionContext& ctx) const
      -> Outcome<nlohmann::json>;
  [[nodiscard]] auto run(const RunCodeAction& action, ExecutionLog& log,
                         const ExecutionContext& ctx) const
      -> Outcome<nlohmann::json>;
  [[nodiscard]] auto run(const GenerateReportAction& action, ExecutionLog& log,
                         const ExecutionContext& ctx) const
      -> Outcome<nlohmann::json>;
  [[nodiscard]] auto run(const ChainAction& action, ExecutionLog& log,
                         const ExecutionContext& ctx) const
      -> Outcome<nlohmann::json>;
  [[nodiscard]] auto run(const WebScrapeAction& action, ExecutionLog& log,
                         const ExecutionContext& ctx) const
      -> Outcome<nlohmann::json>;
  [[nodiscard]] auto run(const FileOperationAction& action, ExecutionLog& log,
                         const ExecutionContext& ctx) const
      -> Outcome<nlohmann::json>;
  [[nodiscard]] auto run(const GoogleWorkspaceAction& action, ExecutionLog& log,
                         const ExecutionContext& ctx) const
      -> Outcome<nlohmann::json>;

  Collaborators collaborators_;
  ActionDefaults defaults_;
};

[[nodiscard]] auto report_prompt(const nlohmann::json& config) -> std::string;

}  // namespace cadence
